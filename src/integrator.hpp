#ifndef PNET_INTEGRATOR_HPP
#define PNET_INTEGRATOR_HPP
#include "input.hpp"
#include "particle.hpp"
#include <random>
#include <vector>

// velocity added to a particle at p by a burst centered at center; zero at the center and from radius on
vec2f burst_kick(vec2f p, vec2f center, float radius, float force);
// position offset pushing a particle at p away from pointer
vec2f repulsion_offset(vec2f p, vec2f pointer, float density, float radius, float strength);

void apply_burst(Particles& particles, vec2f center, const SimParams& params);
void apply_bursts(Particles& particles, const std::vector<vec2f>& centers, const SimParams& params);

/**
 * advances every particle by one tick
 *
 * per particle, in order: velocity relaxes toward base_velocity, alarm jitter
 * (not stored) and velocity move the position, the position wraps around area,
 * an active pointer pushes the particle away in position space, and the
 * result is wrapped again so it always ends inside area
 */
void integrate(Particles& particles, const PointerState& pointer, AABB area,
               bool alarming, const SimParams& params, std::mt19937& rng);
#endif
