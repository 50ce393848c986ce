#ifndef PNET_SCHEDULER_HPP
#define PNET_SCHEDULER_HPP
#include <SFML/Window/Event.hpp>
#include <cstdint>
#include <functional>
#include <map>

typedef uint64_t FrameHandle;
typedef uint64_t ListenerId;

// one shot callbacks run at the next display refresh; handle 0 is never issued
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;
    virtual FrameHandle requestFrame(std::function<void()> callback) = 0;
    // cancelling a handle that already ran or was cancelled does nothing
    virtual void cancelFrame(FrameHandle handle) = 0;
};

// FrameScheduler driven by the host loop, which calls pump() once per refresh
class RefreshScheduler : public FrameScheduler {
    std::map<FrameHandle, std::function<void()>> m_pending;
    FrameHandle m_next = 1;
public:
    FrameHandle requestFrame(std::function<void()> callback) override;
    void cancelFrame(FrameHandle handle) override;
    // runs the callbacks requested before this call; ones requested meanwhile wait for the next pump
    size_t pump();
    size_t pending() const {
        return m_pending.size();
    }
};

// fan out of host window events to the listeners of the current frame
class EventHub {
    std::map<ListenerId, std::function<void(const sf::Event&)>> m_listeners;
    ListenerId m_next = 1;
public:
    ListenerId subscribe(std::function<void(const sf::Event&)> listener);
    void unsubscribe(ListenerId id);
    void dispatch(const sf::Event& event);
    size_t listenerCount() const {
        return m_listeners.size();
    }
};

// listener registration released on destruction
class ScopedListener {
    EventHub* m_hub = nullptr;
    ListenerId m_id = 0;
public:
    ScopedListener() = default;
    ScopedListener(EventHub& hub, std::function<void(const sf::Event&)> listener);
    ScopedListener(ScopedListener&& other) noexcept;
    ScopedListener& operator=(ScopedListener&& other) noexcept;
    ScopedListener(const ScopedListener&) = delete;
    ScopedListener& operator=(const ScopedListener&) = delete;
    ~ScopedListener();

    void reset();
    bool active() const {
        return m_hub != nullptr;
    }
};

// pending frame request cancelled on destruction
class ScopedFrame {
    FrameScheduler* m_scheduler = nullptr;
    FrameHandle m_handle = 0;
public:
    ScopedFrame() = default;
    ScopedFrame(FrameScheduler& scheduler, std::function<void()> callback);
    ScopedFrame(ScopedFrame&& other) noexcept;
    ScopedFrame& operator=(ScopedFrame&& other) noexcept;
    ScopedFrame(const ScopedFrame&) = delete;
    ScopedFrame& operator=(const ScopedFrame&) = delete;
    ~ScopedFrame();

    void cancel();
    // forget the handle without cancelling, used once the frame has run
    void release() {
        m_scheduler = nullptr;
        m_handle = 0;
    }
    bool pending() const {
        return m_scheduler != nullptr;
    }
};
#endif
