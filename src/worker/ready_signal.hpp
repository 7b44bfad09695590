/*
 * ready_signal.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: One-shot latch published when worker startup completes

**************************************************/

#ifndef HUBBRIDGE_WORKER_READY_SIGNAL_HPP
#define HUBBRIDGE_WORKER_READY_SIGNAL_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hubbridge::worker {

/**
 * @brief One-shot latch
 *
 * set() is idempotent; once set, every wait returns true immediately.
 */
class ReadySignal {
public:
    void set() {
        {
            std::lock_guard lock(mutex_);
            set_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto isSet() const -> bool {
        std::lock_guard lock(mutex_);
        return set_;
    }

    /**
     * @brief Block until set or until the timeout elapses
     * @return true if the latch is set
     */
    auto waitFor(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return set_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool set_{false};
};

}  // namespace hubbridge::worker

#endif  // HUBBRIDGE_WORKER_READY_SIGNAL_HPP
