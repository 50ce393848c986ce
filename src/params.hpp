#ifndef PNET_PARAMS_HPP
#define PNET_PARAMS_HPP
#include <cstdint>

// physics and rendering constants of one engine
struct SimParams {
    float pixels_per_particle = 15.f;
    uint32_t max_particles = 100U;
    float base_speed = 0.15f;

    float drift_recovery = 0.04f;
    float jitter = 2.f;
    float repulsion_radius = 250.f;
    float repulsion_strength = 1.5f;
    float burst_radius = 300.f;
    float burst_force = 15.f;

    float connect_distance = 120.f;
    float line_alpha = 0.08f;
    float line_fade = 1500.f;
    float line_width = 0.5f;

    double double_interaction_interval = 0.5;
    float double_interaction_slop = 16.f;
};
#endif
