/*
 * sync_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Blocking hand-off from caller threads to the background worker

**************************************************/

#ifndef HUBBRIDGE_WORKER_SYNC_BRIDGE_HPP
#define HUBBRIDGE_WORKER_SYNC_BRIDGE_HPP

#include <chrono>
#include <future>
#include <string>
#include <type_traits>

#include "background_worker.hpp"
#include "device/common/device_result.hpp"
#include "logging/logging.hpp"

namespace hubbridge::worker {

/**
 * @brief Lets synchronous callers run work on the worker and wait for it
 *
 * Every call gets its own future, so any number of caller threads may block
 * concurrently. No exception crosses runBlocking(): throws inside the work
 * and an exhausted timeout both come back as DeviceError.
 */
class SyncBridge {
public:
    explicit SyncBridge(BackgroundWorker& worker,
                        std::chrono::milliseconds defaultTimeout =
                            std::chrono::milliseconds(10000))
        : worker_(worker),
          defaultTimeout_(defaultTimeout),
          logger_(logging::get("worker")) {}

    [[nodiscard]] auto defaultTimeout() const -> std::chrono::milliseconds {
        return defaultTimeout_;
    }

    /**
     * @brief Whether runBlocking() would reach a session
     */
    [[nodiscard]] auto connected() const -> bool {
        return worker_.hasSession();
    }

    /**
     * @brief Run `work(session)` on the worker and block for its result
     *
     * @param operation Name used in the timeout error
     * @param work Callable `(afero::SessionProvider&) -> DeviceResult<R>`
     * @param timeout Maximum time to block
     * @return The work's result, NotConnected when there is no session
     *         (without blocking), or Timeout
     */
    template <typename Function>
    auto runBlocking(const std::string& operation, Function&& work,
                     std::chrono::milliseconds timeout)
        -> std::invoke_result_t<Function, afero::SessionProvider&>;

    template <typename Function>
    auto runBlocking(const std::string& operation, Function&& work)
        -> std::invoke_result_t<Function, afero::SessionProvider&> {
        return runBlocking(operation, std::forward<Function>(work),
                           defaultTimeout_);
    }

private:
    BackgroundWorker& worker_;
    std::chrono::milliseconds defaultTimeout_;
    std::shared_ptr<spdlog::logger> logger_;
};

template <typename Function>
auto SyncBridge::runBlocking(const std::string& operation, Function&& work,
                             std::chrono::milliseconds timeout)
    -> std::invoke_result_t<Function, afero::SessionProvider&> {
    using Result = std::invoke_result_t<Function, afero::SessionProvider&>;

    if (!worker_.hasSession()) {
        return Result(std::unexpected(device::error::notConnected()));
    }

    auto future = worker_.post(std::forward<Function>(work));
    if (future.wait_for(timeout) != std::future_status::ready) {
        logger_->warn("{} did not complete within {}ms", operation,
                      timeout.count());
        return Result(std::unexpected(device::error::timeout(operation)));
    }

    try {
        return future.get();
    } catch (...) {
        return Result(std::unexpected(device::currentExceptionToError()));
    }
}

}  // namespace hubbridge::worker

#endif  // HUBBRIDGE_WORKER_SYNC_BRIDGE_HPP
