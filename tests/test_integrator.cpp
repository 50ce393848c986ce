#include "geometry_func.hpp"
#include "integrator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace {
const AABB area = AABB::CreateMinSize({0.f, 0.f}, {800.f, 600.f});
}

TEST(Integrator, PointerPushesParticleAway) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {150.f, 100.f}, {0.f, 0.f}, 10.f);
    PointerState pointer{{100.f, 100.f}, true};

    integrate(particles, pointer, area, false, params, rng);

    EXPECT_GT(particles.position[0].x, 150.f);
    EXPECT_NEAR(particles.position[0].x, 150.f + (200.f / 250.f) * 10.f * 1.5f, 1e-4f);
    EXPECT_FLOAT_EQ(particles.position[0].y, 100.f);
    // repulsion moves the position only
    EXPECT_FLOAT_EQ(particles.velocity[0].x, 0.f);
    EXPECT_FLOAT_EQ(particles.velocity[0].y, 0.f);
}

TEST(Integrator, RepulsionNeedsActivePointerInsideRadius) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {150.f, 100.f}, {0.f, 0.f}, 10.f);
    add_particle(particles, {500.f, 100.f}, {0.f, 0.f}, 10.f);

    PointerState idle{{100.f, 100.f}, false};
    integrate(particles, idle, area, false, params, rng);
    EXPECT_FLOAT_EQ(particles.position[0].x, 150.f);

    PointerState active{{100.f, 100.f}, true};
    integrate(particles, active, area, false, params, rng);
    EXPECT_FLOAT_EQ(particles.position[1].x, 500.f);
}

TEST(Integrator, RepulsionDoesNotPersist) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {150.f, 100.f}, {0.f, 0.f}, 10.f);
    PointerState pointer{{100.f, 100.f}, true};
    integrate(particles, pointer, area, false, params, rng);
    auto pushed = particles.position[0];

    pointer.is_active = false;
    integrate(particles, pointer, area, false, params, rng);
    EXPECT_FLOAT_EQ(particles.position[0].x, pushed.x);
    EXPECT_FLOAT_EQ(particles.position[0].y, pushed.y);
}

TEST(Integrator, PointerOnTopOfParticleLeavesItFinite) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {200.f, 200.f}, {0.f, 0.f}, 30.f);
    PointerState pointer{{200.f, 200.f}, true};
    integrate(particles, pointer, area, false, params, rng);
    EXPECT_TRUE(std::isfinite(particles.position[0].x));
    EXPECT_TRUE(std::isfinite(particles.position[0].y));
    EXPECT_FLOAT_EQ(particles.position[0].x, 200.f);
    EXPECT_FLOAT_EQ(particles.position[0].y, 200.f);
}

TEST(Integrator, VelocityConvergesToBaseGeometrically) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    const vec2f base(0.1f, -0.05f);
    const vec2f v0(6.f, -4.f);
    add_particle(particles, {400.f, 300.f}, v0, 1.f, base);
    PointerState pointer;

    const float initial = length(v0 - base);
    float bound = initial;
    for(int n = 1; n <= 200; n++) {
        integrate(particles, pointer, area, false, params, rng);
        bound *= 0.96f;
        EXPECT_LE(length(particles.velocity[0] - base), bound + 1e-5f) << "tick " << n;
    }
    EXPECT_NEAR(particles.velocity[0].x, base.x, 1e-3f);
    EXPECT_NEAR(particles.velocity[0].y, base.y, 1e-3f);
}

TEST(Integrator, BaseVelocityIsUntouched) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {400.f, 300.f}, {3.f, 3.f}, 5.f, {0.1f, 0.1f});
    PointerState pointer{{390.f, 300.f}, true};
    for(int n = 0; n < 20; n++)
        integrate(particles, pointer, area, true, params, rng);
    EXPECT_FLOAT_EQ(particles.base_velocity[0].x, 0.1f);
    EXPECT_FLOAT_EQ(particles.base_velocity[0].y, 0.1f);
    EXPECT_FLOAT_EQ(particles.density[0], 5.f);
}

TEST(Integrator, AlarmJitterIsBoundedAndNotStored) {
    SimParams params;
    std::mt19937 rng(42);
    Particles particles;
    for(int i = 0; i < 50; i++)
        add_particle(particles, {400.f, 300.f});
    PointerState pointer;

    integrate(particles, pointer, area, true, params, rng);
    bool moved = false;
    for(size_t i = 0; i < particles.count(); i++) {
        EXPECT_LE(std::fabs(particles.position[i].x - 400.f), 2.f + 1e-4f);
        EXPECT_LE(std::fabs(particles.position[i].y - 300.f), 2.f + 1e-4f);
        EXPECT_FLOAT_EQ(particles.velocity[i].x, 0.f);
        EXPECT_FLOAT_EQ(particles.velocity[i].y, 0.f);
        moved = moved || particles.position[i] != vec2f(400.f, 300.f);
    }
    EXPECT_TRUE(moved);
}

TEST(Integrator, NoJitterWhenCalm) {
    SimParams params;
    std::mt19937 rng(42);
    Particles particles;
    add_particle(particles, {400.f, 300.f}, {1.f, 0.5f}, 1.f, {1.f, 0.5f});
    PointerState pointer;
    integrate(particles, pointer, area, false, params, rng);
    EXPECT_FLOAT_EQ(particles.position[0].x, 401.f);
    EXPECT_FLOAT_EQ(particles.position[0].y, 300.5f);
}

TEST(Integrator, WrapsToOppositeEdge) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {799.5f, 0.2f}, {1.f, -0.5f}, 1.f, {1.f, -0.5f});
    PointerState pointer;
    integrate(particles, pointer, area, false, params, rng);
    EXPECT_NEAR(particles.position[0].x, 0.5f, 1e-3f);
    EXPECT_NEAR(particles.position[0].y, 599.7f, 1e-3f);
}

TEST(Integrator, PositionsStayInsideSurfaceEveryTick) {
    SimParams params;
    std::mt19937 rng(9);
    Particles particles;
    init_random(particles, area, true, params, rng);
    PointerState pointer{{5.f, 5.f}, true};

    for(int tick = 0; tick < 300; tick++) {
        if(tick % 25 == 0)
            apply_burst(particles, {pointer.position.x + 30.f, pointer.position.y}, params);
        pointer.position = {std::fmod(tick * 37.f, 800.f), std::fmod(tick * 13.f, 600.f)};
        integrate(particles, pointer, area, tick % 2 == 0, params, rng);
        for(size_t i = 0; i < particles.count(); i++) {
            ASSERT_GE(particles.position[i].x, 0.f);
            ASSERT_LT(particles.position[i].x, 800.f);
            ASSERT_GE(particles.position[i].y, 0.f);
            ASSERT_LT(particles.position[i].y, 600.f);
        }
    }
}

TEST(Burst, KicksAwayAndWeakensWithDistance) {
    SimParams params;
    Particles particles;
    const vec2f center(400.f, 300.f);
    const float distances[] = {20.f, 60.f, 120.f, 200.f, 299.f};
    for(auto d : distances)
        add_particle(particles, center + vec2f(d * 0.6f, d * -0.8f));
    add_particle(particles, center + vec2f(300.f, 0.f));
    add_particle(particles, center + vec2f(0.f, 450.f));

    apply_burst(particles, center, params);

    float previous = std::numeric_limits<float>::infinity();
    for(size_t i = 0; i < 5; i++) {
        auto kick = particles.velocity[i];
        auto away = normalOrZero(particles.position[i] - center);
        auto magnitude = length(kick);
        EXPECT_GT(magnitude, 0.f);
        EXPECT_NEAR(dot(kick, away), magnitude, 1e-4f);
        EXPECT_LT(magnitude, previous);
        previous = magnitude;
    }
    EXPECT_FLOAT_EQ(length(particles.velocity[5]), 0.f);
    EXPECT_FLOAT_EQ(length(particles.velocity[6]), 0.f);
}

TEST(Burst, KickStrengthIsLinear) {
    auto kick = burst_kick({550.f, 300.f}, {400.f, 300.f}, 300.f, 15.f);
    EXPECT_NEAR(kick.x, 7.5f, 1e-4f);
    EXPECT_NEAR(kick.y, 0.f, 1e-6f);
    auto center = burst_kick({400.f, 300.f}, {400.f, 300.f}, 300.f, 15.f);
    EXPECT_EQ(center.x, 0.f);
    EXPECT_EQ(center.y, 0.f);
}

TEST(Burst, AddsToExistingVelocityAndDecays) {
    SimParams params;
    std::mt19937 rng(1);
    Particles particles;
    add_particle(particles, {460.f, 300.f}, {0.1f, 0.f}, 1.f, {0.1f, 0.f});
    apply_bursts(particles, {{400.f, 300.f}, {400.f, 300.f}}, params);
    EXPECT_NEAR(particles.velocity[0].x, 0.1f + 2.f * 12.f, 1e-3f);

    PointerState pointer;
    for(int n = 0; n < 150; n++)
        integrate(particles, pointer, area, false, params, rng);
    EXPECT_NEAR(particles.velocity[0].x, 0.1f, 0.1f);
}

TEST(Repulsion, OffsetScalesWithDensity) {
    auto weak = repulsion_offset({150.f, 100.f}, {100.f, 100.f}, 1.f, 250.f, 1.5f);
    auto strong = repulsion_offset({150.f, 100.f}, {100.f, 100.f}, 20.f, 250.f, 1.5f);
    EXPECT_NEAR(weak.x, 0.8f * 1.5f, 1e-5f);
    EXPECT_NEAR(strong.x, 20.f * weak.x, 1e-4f);
    auto outside = repulsion_offset({400.f, 100.f}, {100.f, 100.f}, 20.f, 250.f, 1.5f);
    EXPECT_EQ(outside.x, 0.f);
}
