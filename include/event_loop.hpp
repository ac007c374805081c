#pragma once
#include <atomic>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include "channel.hpp"
#include "future.hpp"
#include "precondition.hpp"
#include "selector.hpp"

struct EventLoopConfig {
    SelectorConfig selector;

    // Called when deregistering an already closed channel fails during cleanup
    // in run(). The failure never propagates out of run(). Defaults to a warning
    // on stderr.
    std::function<void(Channel&, const std::exception&)> onDeregisterFailure;
};

// Single-threaded reactor. The thread that constructs the loop owns it: every
// mutating call must come from that thread, except submit() and shutdown().
class EventLoop {
public:
    using Task = std::function<void()>;

    explicit EventLoop(EventLoopConfig config = {});
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void registerChannel(const std::shared_ptr<Channel>& channel);
    void deregisterChannel(Channel& channel);
    void reregisterChannel(Channel& channel);
    bool isRegistered(const Channel& channel) const;

    bool inEventLoop() const { return std::this_thread::get_id() == m_thread; }

    void execute(Task task);

    // Thread-safe counterpart of execute(): queues the task and wakes the loop.
    void submit(Task task);

    template <typename F>
    Future<std::invoke_result_t<F>> schedule(F task) {
        using T = std::invoke_result_t<F>;
        Promise<T> promise;
        execute([promise, task = std::move(task)]() mutable { fulfill(promise, task); });
        return promise.futureResult();
    }

    // Runs until shutdown() is requested.
    void run();

    // Async-signal-safe. The current iteration completes before run() returns.
    void shutdown();

    // Releases the selector's registrations and epoll instance. The loop cannot
    // be run afterwards, and it must not be closed from inside run(). The wakeup
    // fd lives until destruction, so submit() and shutdown() may still race
    // with close().
    void close();

    bool isClosed() const { return !m_selector->isOpen(); }

    template <typename T>
    Promise<T> newPromise() const {
        return Promise<T>();
    }

    template <typename T>
    Future<T> newSucceededFuture(T value) const {
        Promise<T> promise = newPromise<T>();
        promise.succeed(std::move(value));
        return promise.futureResult();
    }

    template <typename T>
    Future<T> newFailedFuture(std::exception_ptr error) const {
        Promise<T> promise = newPromise<T>();
        promise.fail(std::move(error));
        return promise.futureResult();
    }

private:
    // Returns true if the channel is still open. A closed channel is removed
    // from the selector.
    bool handleEvents(Channel& channel);
    void runTasks();

    // Never null. Other threads reach it through submit() and shutdown().
    const std::unique_ptr<Selector> m_selector;
    std::thread::id m_thread;
    std::deque<Task> m_tasks;
    std::mutex m_submittedMutex;
    std::deque<Task> m_submitted;
    std::atomic<bool> m_stopRequested;
    bool m_running;
    EventLoopConfig m_config;
};
