#pragma once
#include <any>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

enum class Interest : uint32_t {
    None = 0,
    Read = 1 << 0,
    Write = 1 << 1,
    Connect = 1 << 2,
};

inline Interest operator|(Interest a, Interest b) {
    return static_cast<Interest>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline Interest operator&(Interest a, Interest b) {
    return static_cast<Interest>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline Interest withoutInterest(Interest set, Interest flag) {
    return static_cast<Interest>(static_cast<uint32_t>(set) & ~static_cast<uint32_t>(flag));
}

inline bool hasInterest(Interest set, Interest flag) {
    return (set & flag) != Interest::None;
}

struct SelectorEvent {
    std::any attachment;
    bool readable = false;
    bool writable = false;

    bool isReadable() const { return readable; }
    bool isWritable() const { return writable; }
};

struct SelectorConfig {
    std::size_t maxEventsPerWait = 64;
};

// epoll readiness multiplexer. Every registered fd carries an opaque attachment
// that is handed back with each of its readiness events.
class Selector {
    struct Registration {
        Interest interest;
        std::any attachment;
    };

    int m_epollFd;
    int m_wakeupFd;
    SelectorConfig m_config;
    std::unordered_map<int, Registration> m_registrations;

public:
    explicit Selector(SelectorConfig config = {});
    ~Selector();

    Selector(const Selector&) = delete;
    Selector& operator=(const Selector&) = delete;

    void registerFd(int fd, Interest interest, std::any attachment);
    void deregisterFd(int fd);
    void reregisterFd(int fd, Interest interest);

    // Waits until at least one registered fd is ready, wakeup() is called, or
    // timeoutMs elapses (-1 waits indefinitely, 0 polls). A wakeup or timeout
    // alone yields an empty batch.
    std::vector<SelectorEvent> awaitReady(int timeoutMs = -1);

    // Safe to call from any thread and from a signal handler.
    void wakeup() const;

    // Drops every registration and closes the epoll instance. The wakeup fd
    // stays open until destruction, so wakeup() remains safe to call.
    void close();

    bool isOpen() const { return m_epollFd != -1; }
    bool isRegistered(int fd) const;
    const std::any* attachmentFor(int fd) const;
    std::size_t registeredCount() const { return m_registrations.size(); }
};
