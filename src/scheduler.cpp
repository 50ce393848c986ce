#include "scheduler.hpp"
#include <utility>

FrameHandle RefreshScheduler::requestFrame(std::function<void()> callback) {
    auto handle = m_next++;
    m_pending.emplace(handle, std::move(callback));
    return handle;
}
void RefreshScheduler::cancelFrame(FrameHandle handle) {
    m_pending.erase(handle);
}
size_t RefreshScheduler::pump() {
    const auto last = m_next;
    size_t ran = 0;
    while(!m_pending.empty()) {
        auto it = m_pending.begin();
        if(it->first >= last)
            break;
        auto callback = std::move(it->second);
        m_pending.erase(it);
        callback();
        ran++;
    }
    return ran;
}

ListenerId EventHub::subscribe(std::function<void(const sf::Event&)> listener) {
    auto id = m_next++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}
void EventHub::unsubscribe(ListenerId id) {
    m_listeners.erase(id);
}
void EventHub::dispatch(const sf::Event& event) {
    // listeners may unsubscribe themselves or others while being called
    const auto last = m_next;
    ListenerId cursor = 0;
    while(true) {
        auto it = m_listeners.upper_bound(cursor);
        if(it == m_listeners.end() || it->first >= last)
            break;
        cursor = it->first;
        auto listener = it->second;
        listener(event);
    }
}

ScopedListener::ScopedListener(EventHub& hub, std::function<void(const sf::Event&)> listener)
    : m_hub(&hub), m_id(hub.subscribe(std::move(listener))) {}
ScopedListener::ScopedListener(ScopedListener&& other) noexcept
    : m_hub(std::exchange(other.m_hub, nullptr)), m_id(std::exchange(other.m_id, 0)) {}
ScopedListener& ScopedListener::operator=(ScopedListener&& other) noexcept {
    if(this != &other) {
        reset();
        m_hub = std::exchange(other.m_hub, nullptr);
        m_id = std::exchange(other.m_id, 0);
    }
    return *this;
}
ScopedListener::~ScopedListener() {
    reset();
}
void ScopedListener::reset() {
    if(m_hub)
        m_hub->unsubscribe(m_id);
    m_hub = nullptr;
    m_id = 0;
}

ScopedFrame::ScopedFrame(FrameScheduler& scheduler, std::function<void()> callback)
    : m_scheduler(&scheduler), m_handle(scheduler.requestFrame(std::move(callback))) {}
ScopedFrame::ScopedFrame(ScopedFrame&& other) noexcept
    : m_scheduler(std::exchange(other.m_scheduler, nullptr)), m_handle(std::exchange(other.m_handle, 0)) {}
ScopedFrame& ScopedFrame::operator=(ScopedFrame&& other) noexcept {
    if(this != &other) {
        cancel();
        m_scheduler = std::exchange(other.m_scheduler, nullptr);
        m_handle = std::exchange(other.m_handle, 0);
    }
    return *this;
}
ScopedFrame::~ScopedFrame() {
    cancel();
}
void ScopedFrame::cancel() {
    if(m_scheduler)
        m_scheduler->cancelFrame(m_handle);
    release();
}
