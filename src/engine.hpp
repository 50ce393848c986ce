#ifndef PNET_ENGINE_HPP
#define PNET_ENGINE_HPP
#include "input.hpp"
#include "integrator.hpp"
#include "particle.hpp"
#include "renderer.hpp"
#include "scheduler.hpp"
#include "surface.hpp"
#include "time.hpp"
#include <functional>
#include <map>
#include <random>
#include <string>

/**
 * Particle network drawn behind the host ui.
 *
 * Owns the particle field, the pointer state and the input tracker of one
 * instance. start() attaches to the host event hub and frame scheduler, every
 * frame then integrates and renders once and asks for the next frame. stop()
 * and the destructor release both, after which the surface is never touched.
 */
class ParticleEngine {
    Surface* m_surface;
    SimParams m_params;
    Particles m_particles;
    PointerState m_pointer;
    InputTracker m_input;
    Renderer m_renderer;
    std::mt19937 m_rng;
    Stopwatch m_clock;
    AABB m_area = AABB::CreateMinSize({0.f, 0.f}, {0.f, 0.f});
    bool m_dark = true;
    bool m_alarming = false;
    std::map<std::string, float> m_last_timings;

    FrameScheduler* m_scheduler = nullptr;
    ScopedListener m_listener;
    ScopedFrame m_frame;
    bool m_running = false;

    void reinitialize();
    void onFrame();
public:
    // surface may be null, the engine then stays idle
    explicit ParticleEngine(Surface* surface, SimParams params = SimParams());
    ~ParticleEngine();
    ParticleEngine(const ParticleEngine&) = delete;
    ParticleEngine& operator=(const ParticleEngine&) = delete;

    // returns false and does nothing without a surface
    bool start(FrameScheduler& scheduler, EventHub& events);
    void stop();
    bool isRunning() const {
        return m_running;
    }

    // recreates the field when the theme changes
    void setDark(bool dark);
    bool isDark() const {
        return m_dark;
    }
    void setAlarming(bool alarming) {
        m_alarming = alarming;
    }
    bool isAlarming() const {
        return m_alarming;
    }
    void setOnDoubleInteraction(std::function<void()> callback);

    // recreates the field for a surface of the given size
    void resize(vec2u size);
    void handleEvent(const sf::Event& event);
    // integrates and renders one frame, returns seconds spent per phase
    std::map<std::string, float> tick();

    const Particles& particles() const {
        return m_particles;
    }
    const PointerState& pointer() const {
        return m_pointer;
    }
    const Renderer& renderer() const {
        return m_renderer;
    }
    const SimParams& params() const {
        return m_params;
    }
    AABB area() const {
        return m_area;
    }
    const std::map<std::string, float>& lastTimings() const {
        return m_last_timings;
    }
};
#endif
