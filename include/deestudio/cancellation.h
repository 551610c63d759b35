/**
 * @file cancellation.h
 * @brief Cooperative cancellation signal shared between a request and its worker
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace deestudio {

/**
 * @class CancellationToken
 * @brief Copyable handle to a shared cancel flag
 *
 * A token is cancelled either explicitly via cancel() or when the optional
 * probe (e.g. "client connection closed") reports true. Copies share state.
 */
class CancellationToken {
public:
    using Probe = std::function<bool()>;

    CancellationToken() : state_(std::make_shared<State>()) {}

    explicit CancellationToken(Probe probe) : state_(std::make_shared<State>()) {
        state_->probe = std::move(probe);
    }

    void cancel() { state_->cancelled.store(true); }

    bool is_cancelled() const {
        if (state_->cancelled.load()) {
            return true;
        }
        std::lock_guard<std::mutex> lock(state_->probe_mutex);
        if (state_->probe && state_->probe()) {
            state_->cancelled.store(true);
            return true;
        }
        return false;
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex probe_mutex;
        Probe probe;
    };

    std::shared_ptr<State> state_;
};

} // namespace deestudio
