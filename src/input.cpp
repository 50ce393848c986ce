#include "input.hpp"
#include "log.hpp"
#include <utility>

InputTracker::InputTracker(PointerState& pointer, double double_interval, float double_slop)
    : m_pointer(pointer), m_double_interval(double_interval), m_double_slop(double_slop) {}

void InputTracker::setOnDoubleInteraction(std::function<void()> callback) {
    m_on_double_interaction = std::move(callback);
}

void InputTracker::interactionStarted(vec2f pos, double now) {
    m_pending_bursts.push_back(pos);

    if(m_first_press) {
        auto gap = now - m_first_press->time;
        bool close = qlen(pos - m_first_press->position) <= m_double_slop * m_double_slop;
        if(gap >= 0.0 && gap <= m_double_interval && close) {
            m_first_press.reset();
            Logger::debug("double interaction");
            if(m_on_double_interaction)
                m_on_double_interaction();
            return;
        }
    }
    m_first_press = Press{pos, now};
}

void InputTracker::pointerMoved(vec2f pos) {
    m_pointer.position = pos;
    m_pointer.is_active = true;
}
void InputTracker::pointerPressed(vec2f pos, double now) {
    interactionStarted(pos, now);
}
void InputTracker::pointerReleased() {
    m_pointer.is_active = false;
}
void InputTracker::touchBegan(unsigned finger, vec2f pos, double now) {
    if(finger != 0)
        return;
    interactionStarted(pos, now);
    pointerMoved(pos);
}
void InputTracker::touchMoved(unsigned finger, vec2f pos) {
    if(finger != 0)
        return;
    pointerMoved(pos);
}
void InputTracker::touchEnded(unsigned finger) {
    if(finger != 0)
        return;
    m_pointer.is_active = false;
}

bool InputTracker::handleEvent(const sf::Event& event, double now) {
    switch(event.type) {
        case sf::Event::MouseMoved:
            pointerMoved(vec2f((float)event.mouseMove.x, (float)event.mouseMove.y));
            return true;
        case sf::Event::MouseButtonPressed:
            pointerPressed(vec2f((float)event.mouseButton.x, (float)event.mouseButton.y), now);
            return true;
        case sf::Event::MouseButtonReleased:
            pointerReleased();
            return true;
        case sf::Event::TouchBegan:
            touchBegan(event.touch.finger, vec2f((float)event.touch.x, (float)event.touch.y), now);
            return true;
        case sf::Event::TouchMoved:
            touchMoved(event.touch.finger, vec2f((float)event.touch.x, (float)event.touch.y));
            return true;
        case sf::Event::TouchEnded:
            touchEnded(event.touch.finger);
            return true;
        default:
            return false;
    }
}

std::vector<vec2f> InputTracker::takeBursts() {
    std::vector<vec2f> result;
    result.swap(m_pending_bursts);
    return result;
}
void InputTracker::discardBursts() {
    m_pending_bursts.clear();
}
void InputTracker::reset() {
    m_pending_bursts.clear();
    m_first_press.reset();
}
