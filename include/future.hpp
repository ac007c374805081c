#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "precondition.hpp"

template <typename T> class Future;
template <typename T> class Promise;

// Value carried by a succeeded Future<void>.
struct Void {};

template <typename T>
struct FutureValue {
    using type = T;
};

template <>
struct FutureValue<void> {
    using type = Void;
};

template <typename T>
struct FutureState {
    std::mutex mutex;
    std::variant<std::monostate, typename FutureValue<T>::type, std::exception_ptr> result;
    std::vector<std::function<void(const Future<T>&)>> callbacks;
};

// Write side of a single-assignment result cell. Copies share the same cell.
template <typename T>
class Promise {
    std::shared_ptr<FutureState<T>> m_state;

public:
    using Value = typename FutureValue<T>::type;

    Promise() : m_state(std::make_shared<FutureState<T>>()) {}

    void succeed(Value value) {
        resolve([&](FutureState<T>& state) { state.result.template emplace<1>(std::move(value)); });
    }

    template <typename U = T, std::enable_if_t<std::is_void_v<U>, int> = 0>
    void succeed() {
        succeed(Void{});
    }

    void fail(std::exception_ptr error) {
        NIO_PRECONDITION(error != nullptr, "Promise failed with an empty exception_ptr");
        resolve([&](FutureState<T>& state) { state.result.template emplace<2>(std::move(error)); });
    }

    Future<T> futureResult() const { return Future<T>(m_state); }

private:
    template <typename Assign>
    void resolve(Assign assign) {
        std::vector<std::function<void(const Future<T>&)>> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            NIO_PRECONDITION(m_state->result.index() == 0, "Promise resolved more than once");
            assign(*m_state);
            callbacks.swap(m_state->callbacks);
        }
        Future<T> future(m_state);
        for (auto& callback : callbacks) {
            callback(future);
        }
    }
};

// Resolves the promise with fn()'s result, or fails it with what fn() throws.
// Callbacks run by the resolution are outside the try block: an exception
// they throw reaches the caller and the promise is not resolved twice.
template <typename T, typename F>
void fulfill(Promise<T>& promise, F&& fn) {
    std::optional<typename Promise<T>::Value> result;
    try {
        if constexpr (std::is_void_v<T>) {
            fn();
            result.emplace();
        } else {
            result.emplace(fn());
        }
    } catch (...) {
        promise.fail(std::current_exception());
        return;
    }
    promise.succeed(std::move(*result));
}

// Read side of a Promise. Callbacks registered after resolution run immediately
// on the registering thread; earlier ones run on the thread that resolves.
template <typename T>
class Future {
    friend class Promise<T>;

    std::shared_ptr<FutureState<T>> m_state;

    explicit Future(std::shared_ptr<FutureState<T>> state) : m_state(std::move(state)) {}

public:
    using Value = typename FutureValue<T>::type;

    bool isFulfilled() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->result.index() != 0;
    }

    bool isSucceeded() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->result.index() == 1;
    }

    bool isFailed() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->result.index() == 2;
    }

    // Throws std::logic_error while unresolved and rethrows the failure otherwise.
    const Value& value() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        switch (m_state->result.index()) {
        case 1:
            return std::get<1>(m_state->result);
        case 2:
            std::rethrow_exception(std::get<2>(m_state->result));
        default:
            throw std::logic_error("Future has not been fulfilled yet");
        }
    }

    std::exception_ptr error() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->result.index() == 2) {
            return std::get<2>(m_state->result);
        }
        return nullptr;
    }

    void whenComplete(std::function<void(const Future<T>&)> callback) const {
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->result.index() == 0) {
                m_state->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback(*this);
    }

    void whenSuccess(std::function<void(const Value&)> callback) const {
        whenComplete([callback = std::move(callback)](const Future<T>& future) {
            if (future.isSucceeded()) {
                callback(future.value());
            }
        });
    }

    void whenFailure(std::function<void(std::exception_ptr)> callback) const {
        whenComplete([callback = std::move(callback)](const Future<T>& future) {
            if (future.isFailed()) {
                callback(future.error());
            }
        });
    }

    template <typename F>
    Future<std::invoke_result_t<F, const Value&>> map(F fn) const {
        using U = std::invoke_result_t<F, const Value&>;
        Promise<U> next;
        whenComplete([next, fn = std::move(fn)](const Future<T>& future) mutable {
            if (future.isFailed()) {
                next.fail(future.error());
                return;
            }
            fulfill(next, [&] { return fn(future.value()); });
        });
        return next.futureResult();
    }

    // Forwards this future's eventual result into another promise.
    void cascade(Promise<T> promise) const {
        whenComplete([promise](const Future<T>& future) mutable {
            if (future.isFailed()) {
                promise.fail(future.error());
            } else {
                promise.succeed(future.value());
            }
        });
    }
};
