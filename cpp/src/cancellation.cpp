/**
 * @file cancellation.cpp
 * @brief Implementation of the cancellation token
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/cancellation.hpp"

namespace harbor {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>())
{
}

void CancellationToken::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        callbacks.swap(state_->callbacks);
    }

    // Run outside the lock
    for (auto& callback : callbacks) {
        callback();
    }
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

void CancellationToken::on_cancel(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            state_->callbacks.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

} // namespace harbor
