/*
 * background_worker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Dedicated execution context owning the platform session

**************************************************/

#ifndef HUBBRIDGE_WORKER_BACKGROUND_WORKER_HPP
#define HUBBRIDGE_WORKER_BACKGROUND_WORKER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include "client/afero/session.hpp"
#include "device/device_catalog.hpp"
#include "ready_signal.hpp"

namespace hubbridge::worker {

/**
 * @brief Startup parameters of the worker
 */
struct WorkerConfig {
    afero::Credentials credentials;
    std::string dataHost{"https://semantics2.afero.net"};
    std::chrono::milliseconds authTimeout{20000};
    std::chrono::milliseconds closeTimeout{5000};
};

/**
 * @brief Creates the session once credentials are known to be present
 */
using SessionFactory =
    std::function<std::unique_ptr<afero::SessionProvider>()>;

/**
 * @brief Single-threaded execution context for all platform traffic
 *
 * start() spawns one thread running a boost::asio::io_context and posts the
 * startup sequence onto it:
 *
 * 1. Without credentials, publish readiness with an empty catalog
 *    (degraded mode).
 * 2. Create the session and initialize it within the auth budget; a failure
 *    is logged and startup proceeds with whatever state exists.
 * 3. Discover devices through the class controllers, falling back to the
 *    direct metadevice listing when none are found.
 * 4. Publish readiness.
 *
 * Afterwards the context is kept alive by a work guard and runs posted
 * commands one at a time in submission order until stop().
 */
class BackgroundWorker {
public:
    BackgroundWorker(WorkerConfig config, SessionFactory factory,
                     device::DeviceCatalog& catalog);
    ~BackgroundWorker();

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    /**
     * @brief Spawn the worker thread and post startup; no-op when running
     */
    void start();

    /**
     * @brief Close the session within the close budget and join the thread
     *
     * Commands already queued still run before the session is closed.
     */
    void stop();

    /**
     * @brief Wait for startup to complete
     * @return true if startup completed within the timeout
     */
    auto waitReady(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto isReady() const -> bool { return ready_.isSet(); }
    [[nodiscard]] auto isRunning() const -> bool { return running_.load(); }

    /**
     * @brief Whether a session exists and accepts commands
     */
    [[nodiscard]] auto hasSession() const -> bool {
        return hasSession_.load();
    }

    /**
     * @brief Post a callable onto the worker thread
     *
     * The callable receives the session. Throws from the callable surface
     * through the returned future.
     */
    template <typename Function>
    auto post(Function&& function)
        -> std::future<std::invoke_result_t<Function, afero::SessionProvider&>>;

private:
    void runStartup();
    void closeSession();

    WorkerConfig config_;
    SessionFactory factory_;
    device::DeviceCatalog& catalog_;
    std::shared_ptr<spdlog::logger> logger_;

    boost::asio::io_context ioContext_;
    std::optional<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::thread thread_;
    std::mutex lifecycleMutex_;

    std::unique_ptr<afero::SessionProvider> session_;
    std::atomic<bool> running_{false};
    std::atomic<bool> hasSession_{false};
    ReadySignal ready_;
};

template <typename Function>
auto BackgroundWorker::post(Function&& function)
    -> std::future<std::invoke_result_t<Function, afero::SessionProvider&>> {
    using return_type = std::invoke_result_t<Function, afero::SessionProvider&>;
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [this, fn = std::forward<Function>(function)]() mutable {
            if (!session_) {
                throw device::DeviceException(device::error::notConnected());
            }
            return fn(*session_);
        });
    std::future<return_type> result = task->get_future();

    boost::asio::post(ioContext_, [task]() { (*task)(); });
    return result;
}

}  // namespace hubbridge::worker

#endif  // HUBBRIDGE_WORKER_BACKGROUND_WORKER_HPP
