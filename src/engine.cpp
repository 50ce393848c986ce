#include "engine.hpp"
#include "log.hpp"
#include <utility>

ParticleEngine::ParticleEngine(Surface* surface, SimParams params)
    : m_surface(surface),
      m_params(params),
      m_input(m_pointer, params.double_interaction_interval, params.double_interaction_slop),
      m_rng(std::random_device{}()) {}

ParticleEngine::~ParticleEngine() {
    stop();
}

bool ParticleEngine::start(FrameScheduler& scheduler, EventHub& events) {
    if(m_running)
        return true;
    if(!m_surface) {
        Logger::warn("particle engine started without a surface, staying idle");
        return false;
    }
    // nothing is kept unless every step below succeeds
    ScopedListener listener(events, [this](const sf::Event& event) { handleEvent(event); });
    resize(m_surface->getSize());
    ScopedFrame frame(scheduler, [this] { onFrame(); });

    m_scheduler = &scheduler;
    m_listener = std::move(listener);
    m_frame = std::move(frame);
    m_running = true;
    Logger::info("particle engine started with " + std::to_string(m_particles.count()) + " particles");
    return true;
}

void ParticleEngine::stop() {
    if(!m_running && !m_listener.active() && !m_frame.pending())
        return;
    m_running = false;
    m_frame.cancel();
    m_listener.reset();
    m_scheduler = nullptr;
    m_input.reset();
    m_pointer.is_active = false;
    Logger::info("particle engine stopped");
}

void ParticleEngine::setDark(bool dark) {
    if(dark == m_dark)
        return;
    m_dark = dark;
    reinitialize();
}

void ParticleEngine::setOnDoubleInteraction(std::function<void()> callback) {
    m_input.setOnDoubleInteraction(std::move(callback));
}

void ParticleEngine::resize(vec2u size) {
    m_area = AABB::CreateMinSize({0.f, 0.f}, {(float)size.x, (float)size.y});
    reinitialize();
}

void ParticleEngine::reinitialize() {
    init_random(m_particles, m_area, m_dark, m_params, m_rng);
    m_input.discardBursts();
    Logger::debug("particle field " + std::to_string((int)m_area.width()) + "x" + std::to_string((int)m_area.height()) +
                  " with " + std::to_string(m_particles.count()) + " particles");
}

void ParticleEngine::handleEvent(const sf::Event& event) {
    if(event.type == sf::Event::Resized) {
        vec2u size(event.size.width, event.size.height);
        if(m_surface)
            m_surface->resize(size);
        resize(size);
        return;
    }
    m_input.handleEvent(event, m_clock.getElapsedTime());
}

std::map<std::string, float> ParticleEngine::tick() {
    std::map<std::string, float> result;
    if(!m_surface)
        return result;
    Stopwatch watch;
    apply_bursts(m_particles, m_input.takeBursts(), m_params);
    integrate(m_particles, m_pointer, m_area, m_alarming, m_params, m_rng);
    result["engine::integrate"] += watch.restart();
    m_renderer.render(m_particles, m_dark, m_params, *m_surface);
    result["engine::render"] += watch.restart();
    m_last_timings = result;
    return result;
}

void ParticleEngine::onFrame() {
    // the scheduler already dropped this request
    m_frame.release();
    if(!m_running || !m_scheduler)
        return;
    tick();
    if(m_running && m_scheduler)
        m_frame = ScopedFrame(*m_scheduler, [this] { onFrame(); });
}
