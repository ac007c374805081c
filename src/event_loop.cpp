#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include "event_loop.hpp"

namespace {

void warnDeregisterFailure(Channel& channel, const std::exception& e) {
    std::cerr << "Warning: Failed to deregister closed channel fd " << channel.selectableFd()
              << ": " << e.what() << std::endl;
}

class RunningScope {
    bool& m_running;
public:
    explicit RunningScope(bool& running) : m_running(running) { m_running = true; }
    ~RunningScope() { m_running = false; }
};

}

EventLoop::EventLoop(EventLoopConfig config)
    : m_selector(std::make_unique<Selector>(config.selector)),
      m_thread(std::this_thread::get_id()),
      m_stopRequested(false),
      m_running(false),
      m_config(std::move(config)) {
    if (!m_config.onDeregisterFailure) {
        m_config.onDeregisterFailure = warnDeregisterFailure;
    }
}

EventLoop::~EventLoop() = default;

void EventLoop::registerChannel(const std::shared_ptr<Channel>& channel) {
    NIO_PRECONDITION(inEventLoop(), "registerChannel called outside of the event loop thread");
    if (!channel) {
        throw std::invalid_argument("Cannot register a null channel");
    }
    if (isClosed()) {
        throw std::logic_error("Cannot register a channel with a closed event loop");
    }
    m_selector->registerFd(channel->selectableFd(), channel->interestedEvent(), channel);
}

void EventLoop::deregisterChannel(Channel& channel) {
    NIO_PRECONDITION(inEventLoop(), "deregisterChannel called outside of the event loop thread");
    if (!isRegistered(channel)) {
        throw std::runtime_error("Channel with fd " + std::to_string(channel.selectableFd()) +
                                 " is not registered with this event loop");
    }
    m_selector->deregisterFd(channel.selectableFd());
}

void EventLoop::reregisterChannel(Channel& channel) {
    NIO_PRECONDITION(inEventLoop(), "reregisterChannel called outside of the event loop thread");
    if (!isRegistered(channel)) {
        throw std::runtime_error("Channel with fd " + std::to_string(channel.selectableFd()) +
                                 " is not registered with this event loop");
    }
    m_selector->reregisterFd(channel.selectableFd(), channel.interestedEvent());
}

bool EventLoop::isRegistered(const Channel& channel) const {
    if (isClosed()) {
        return false;
    }
    const std::any* attachment = m_selector->attachmentFor(channel.selectableFd());
    if (attachment == nullptr) {
        return false;
    }
    // The fd may have been reused by another channel.
    const auto* registered = std::any_cast<std::shared_ptr<Channel>>(attachment);
    return registered != nullptr && registered->get() == &channel;
}

void EventLoop::execute(Task task) {
    NIO_PRECONDITION(inEventLoop(), "execute called outside of the event loop thread");
    m_tasks.push_back(std::move(task));
}

void EventLoop::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_submittedMutex);
        m_submitted.push_back(std::move(task));
    }
    m_selector->wakeup();
}

void EventLoop::run() {
    NIO_PRECONDITION(inEventLoop(), "run called outside of the event loop thread");
    NIO_PRECONDITION(!isClosed(), "run called on a closed event loop");
    NIO_PRECONDITION(!m_running, "run called re-entrantly");

    RunningScope runningScope(m_running);
    while (!m_stopRequested.exchange(false)) {
        // Work queued before run() started must not wait for I/O readiness.
        int timeoutMs = m_tasks.empty() ? -1 : 0;
        std::vector<SelectorEvent> events = m_selector->awaitReady(timeoutMs);

        for (SelectorEvent& ev : events) {
            const auto* attached = std::any_cast<std::shared_ptr<Channel>>(&ev.attachment);
            NIO_PRECONDITION(attached != nullptr && *attached != nullptr,
                             "selector event attachment is not a Channel");
            // Holding a reference keeps the channel alive even if it is closed
            // and dropped by its owner while its events are handled.
            std::shared_ptr<Channel> channel = *attached;

            if (!handleEvents(*channel)) {
                continue;
            }

            if (ev.isWritable()) {
                channel->flushFromEventLoop();

                if (!handleEvents(*channel)) {
                    continue;
                }
            }

            if (ev.isReadable()) {
                channel->readFromEventLoop();

                if (!handleEvents(*channel)) {
                    continue;
                }
            }

            NIO_PRECONDITION(isRegistered(*channel), "open channel is not registered with its event loop");
        }

        runTasks();
    }
}

bool EventLoop::handleEvents(Channel& channel) {
    if (channel.isOpen()) {
        return true;
    }
    if (isRegistered(channel)) {
        try {
            deregisterChannel(channel);
        } catch (const std::exception& e) {
            m_config.onDeregisterFailure(channel, e);
        }
    }
    NIO_PRECONDITION(!isRegistered(channel), "closed channel is still registered with its event loop");
    return false;
}

void EventLoop::runTasks() {
    {
        std::lock_guard<std::mutex> lock(m_submittedMutex);
        while (!m_submitted.empty()) {
            m_tasks.push_back(std::move(m_submitted.front()));
            m_submitted.pop_front();
        }
    }

    // Tasks queued by a running task are picked up by the same drain.
    while (!m_tasks.empty()) {
        Task task = std::move(m_tasks.front());
        m_tasks.pop_front();
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "Error: Task threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Error: Task threw an unknown exception" << std::endl;
        }
    }
}

void EventLoop::shutdown() {
    m_stopRequested.store(true);
    m_selector->wakeup();
}

void EventLoop::close() {
    NIO_PRECONDITION(!m_running, "close called while the event loop is running");
    m_selector->close();
}
