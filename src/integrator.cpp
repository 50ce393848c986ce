#include "integrator.hpp"
#include "geometry_func.hpp"

vec2f burst_kick(vec2f p, vec2f center, float radius, float force) {
    auto diff = p - center;
    auto strength = linearFalloff(length(diff), radius);
    if(strength == 0.f)
        return {0.f, 0.f};
    return normalOrZero(diff) * (strength * force);
}
vec2f repulsion_offset(vec2f p, vec2f pointer, float density, float radius, float strength) {
    auto diff = p - pointer;
    auto falloff = linearFalloff(length(diff), radius);
    if(falloff == 0.f)
        return {0.f, 0.f};
    return normalOrZero(diff) * (falloff * density * strength);
}

void apply_burst(Particles& particles, vec2f center, const SimParams& params) {
    for(size_t i = 0; i < particles.count(); i++) {
        particles.velocity[i] += burst_kick(particles.position[i], center, params.burst_radius, params.burst_force);
    }
}
void apply_bursts(Particles& particles, const std::vector<vec2f>& centers, const SimParams& params) {
    for(auto center : centers) {
        apply_burst(particles, center, params);
    }
}

void integrate(Particles& particles, const PointerState& pointer, AABB area,
               bool alarming, const SimParams& params, std::mt19937& rng) {
    const float keep = 1.f - params.drift_recovery;
    std::uniform_real_distribution<float> jitter(-params.jitter, params.jitter);

    for(size_t i = 0; i < particles.count(); i++) {
        auto& vel = particles.velocity[i];
        auto& pos = particles.position[i];

        vel = vel * keep + particles.base_velocity[i] * params.drift_recovery;

        vec2f shake = {0.f, 0.f};
        if(alarming && params.jitter > 0.f)
            shake = {jitter(rng), jitter(rng)};

        pos = wrapPoint(pos + vel + shake, area);

        if(pointer.is_active) {
            pos += repulsion_offset(pos, pointer.position, particles.density[i],
                                    params.repulsion_radius, params.repulsion_strength);
            pos = wrapPoint(pos, area);
        }
    }
}
