/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation token handed to blocking server loops
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace harbor {

/**
 * @brief CancellationToken - shared cancellation flag with callbacks
 *
 * Copies share state. Thread-safe.
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * @brief Request cancellation and run registered callbacks (once)
     */
    void cancel();

    bool is_cancelled() const;

    /**
     * @brief Register a callback to run on cancellation
     *
     * Runs immediately on the calling thread if already cancelled.
     * Callbacks must not call back into the same token.
     */
    void on_cancel(std::function<void()> callback);

private:
    struct State {
        std::mutex mutex;
        bool cancelled = false;
        std::vector<std::function<void()>> callbacks;
    };

    std::shared_ptr<State> state_;
};

} // namespace harbor
