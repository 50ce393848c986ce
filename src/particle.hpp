#ifndef PNET_PARTICLE_HPP
#define PNET_PARTICLE_HPP
#include "AABB.hpp"
#include "params.hpp"
#include <SFML/Graphics/Color.hpp>
#include <cstdint>
#include <random>
#include <vector>
typedef sf::Color Color;

/**
 * structure of arrays holding every particle of the field
 *
 * position, velocity - mutated once per tick by the integrator
 * base_velocity - drift the velocity relaxes back to
 * size - disc radius in pixels
 * density - scales the pointer repulsion of the particle
 * color - resolved at creation from the theme
 *
 * everything except position and velocity is fixed for the lifetime of a particle
 */
struct Particles {
    std::vector<vec2f> position;
    std::vector<vec2f> velocity;
    std::vector<vec2f> base_velocity;
    std::vector<float> size;
    std::vector<float> density;
    std::vector<Color> color;

    size_t count() const {
        return position.size();
    }
    bool empty() const {
        return position.empty();
    }
    void clear();
    void reserve(size_t n);
};

// min(round(width / pixels_per_particle), max_particles); 0 for non positive widths
uint32_t particle_count_for_width(float width, const SimParams& params);
// overlay color of a particle with the given alpha in [0, 1]
Color particle_color(bool is_dark, float alpha);
// replaces the whole store with a freshly sampled field covering area
void init_random(Particles& particles, AABB area, bool is_dark, const SimParams& params, std::mt19937& rng);
#endif
