#pragma once

/**
 * @file timeout.h
 * @brief Bounded calls into slow collaborators
 */

#include "errors.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace voxgate {

/// Upper bound on bounded-call workers alive at once, abandoned ones included
constexpr int MAX_BOUNDED_CALLS_IN_FLIGHT = 8;

/// Workers started by call_with_timeout that have not returned yet
inline std::atomic<int>& bounded_calls_in_flight() {
    static std::atomic<int> count{0};
    return count;
}

/**
 * @brief Run fn on a worker thread and wait at most timeout_ms for it
 *
 * On timeout the worker is detached and left to finish in the background, so
 * fn must own (or share) everything it touches. A collaborator that never
 * returns keeps its worker forever; once MAX_BOUNDED_CALLS_IN_FLIGHT workers
 * are alive, new calls fail with Timeout without starting a thread.
 * Exceptions thrown by fn are converted to an Error of type on_exception.
 */
template<typename T>
Result<T> call_with_timeout(std::function<Result<T>()> fn,
                            int timeout_ms,
                            const std::string& what,
                            ErrorType on_exception = ErrorType::Unknown) {
    if (bounded_calls_in_flight().fetch_add(1) >= MAX_BOUNDED_CALLS_IN_FLIGHT) {
        bounded_calls_in_flight().fetch_sub(1);
        return make_timeout_error(what + " not started: " + std::to_string(MAX_BOUNDED_CALLS_IN_FLIGHT) +
                                  " earlier calls have not returned");
    }

    auto promise = std::make_shared<std::promise<Result<T>>>();
    std::future<Result<T>> future = promise->get_future();

    std::thread worker([promise, fn = std::move(fn), what, on_exception]() {
        try {
            promise->set_value(fn());
        } catch (const std::exception& e) {
            promise->set_value(make_error(on_exception, what + " threw: " + e.what()));
        }
        bounded_calls_in_flight().fetch_sub(1);
    });

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready) {
        worker.join();
        return future.get();
    }

    worker.detach();
    return make_timeout_error(what + " timed out after " + std::to_string(timeout_ms) + " ms");
}

} // namespace voxgate
