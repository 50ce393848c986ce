#ifndef PNET_INPUT_HPP
#define PNET_INPUT_HPP
#include "vec2.hpp"
#include <SFML/Window/Event.hpp>
#include <functional>
#include <optional>
#include <vector>

// last known pointer of one engine; written by the tracker, read by the integrator
struct PointerState {
    vec2f position = {0.f, 0.f};
    bool is_active = false;
};

/**
 * Translates mouse and touch input into pointer state, queued bursts and
 * double interaction notifications.
 *
 * Only touch finger 0 is followed. Timestamps are seconds on any monotonic
 * clock the caller chooses.
 */
class InputTracker {
    struct Press {
        vec2f position;
        double time;
    };
    PointerState& m_pointer;
    double m_double_interval;
    float m_double_slop;
    std::vector<vec2f> m_pending_bursts;
    std::optional<Press> m_first_press;
    std::function<void()> m_on_double_interaction;

    void interactionStarted(vec2f pos, double now);
public:
    InputTracker(PointerState& pointer, double double_interval, float double_slop);

    void setOnDoubleInteraction(std::function<void()> callback);

    void pointerMoved(vec2f pos);
    void pointerPressed(vec2f pos, double now);
    void pointerReleased();
    void touchBegan(unsigned finger, vec2f pos, double now);
    void touchMoved(unsigned finger, vec2f pos);
    void touchEnded(unsigned finger);

    // routes pointer and touch events; returns false for events it does not consume
    bool handleEvent(const sf::Event& event, double now);

    // burst centers queued since the last call, oldest first
    std::vector<vec2f> takeBursts();
    size_t pendingBursts() const {
        return m_pending_bursts.size();
    }
    void discardBursts();
    // forgets queued bursts and any half finished double interaction
    void reset();

    const PointerState& pointer() const {
        return m_pointer;
    }
};
#endif
