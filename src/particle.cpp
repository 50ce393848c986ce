#include "particle.hpp"
#include <algorithm>
#include <cmath>

void Particles::clear() {
    position.clear();
    velocity.clear();
    base_velocity.clear();
    size.clear();
    density.clear();
    color.clear();
}
void Particles::reserve(size_t n) {
    position.reserve(n);
    velocity.reserve(n);
    base_velocity.reserve(n);
    size.reserve(n);
    density.reserve(n);
    color.reserve(n);
}

uint32_t particle_count_for_width(float width, const SimParams& params) {
    if(!(width > 0.f) || !(params.pixels_per_particle > 0.f))
        return 0;
    auto count = std::round(width / params.pixels_per_particle);
    if(count >= static_cast<float>(params.max_particles))
        return params.max_particles;
    return static_cast<uint32_t>(count);
}

Color particle_color(bool is_dark, float alpha) {
    auto a = static_cast<uint8_t>(std::lround(std::clamp(alpha, 0.f, 1.f) * 255.f));
    if(is_dark)
        return Color(255, 255, 255, a);
    return Color(0, 0, 0, a);
}

void init_random(Particles& particles, AABB area, bool is_dark, const SimParams& params, std::mt19937& rng) {
    particles.clear();
    auto count = particle_count_for_width(area.width(), params);
    particles.reserve(count);

    auto w = std::max(area.width(), 0.f);
    auto h = std::max(area.height(), 0.f);
    std::uniform_real_distribution<float> unit(0.f, 1.f);
    std::uniform_real_distribution<float> speed(-params.base_speed, params.base_speed);
    std::uniform_real_distribution<float> radius(1.f, 3.f);
    std::uniform_real_distribution<float> density(1.f, 31.f);
    // lighter overlay on dark backgrounds, fainter dark overlay on light ones
    std::uniform_real_distribution<float> alpha = is_dark
        ? std::uniform_real_distribution<float>(0.10f, 0.30f)
        : std::uniform_real_distribution<float>(0.05f, 0.20f);

    for(uint32_t i = 0; i < count; i++) {
        vec2f pos(area.min.x + unit(rng) * w, area.min.y + unit(rng) * h);
        // unit() may return values that round up to 1 in float
        if(pos.x >= area.max.x) pos.x = area.min.x;
        if(pos.y >= area.max.y) pos.y = area.min.y;
        vec2f vel(speed(rng), speed(rng));

        particles.position.push_back(pos);
        particles.velocity.push_back(vel);
        particles.base_velocity.push_back(vel);
        particles.size.push_back(radius(rng));
        particles.density.push_back(density(rng));
        particles.color.push_back(particle_color(is_dark, alpha(rng)));
    }
}
