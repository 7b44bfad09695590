/*
 * background_worker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Background worker implementation

**************************************************/

#include "background_worker.hpp"

#include "device/device_discovery.hpp"
#include "logging/logging.hpp"

namespace hubbridge::worker {

BackgroundWorker::BackgroundWorker(WorkerConfig config, SessionFactory factory,
                                   device::DeviceCatalog& catalog)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      catalog_(catalog),
      logger_(logging::get("worker")) {}

BackgroundWorker::~BackgroundWorker() { stop(); }

void BackgroundWorker::start() {
    std::lock_guard lock(lifecycleMutex_);
    if (running_.load()) {
        return;
    }
    if (thread_.joinable()) {
        logger_->warn("Background worker was stopped and cannot restart");
        return;
    }

    workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
    running_.store(true);

    boost::asio::post(ioContext_, [this] { runStartup(); });
    thread_ = std::thread([this] {
        logger_->debug("Worker thread started");
        ioContext_.run();
        logger_->debug("Worker thread finished");
    });
}

void BackgroundWorker::stop() {
    std::lock_guard lock(lifecycleMutex_);
    if (!running_.exchange(false)) {
        return;
    }

    logger_->info("Stopping background worker");
    hasSession_.store(false);

    boost::asio::post(ioContext_, [this] { closeSession(); });
    workGuard_.reset();

    if (thread_.joinable()) {
        thread_.join();
    }
    session_.reset();

    // Release anyone still waiting on a startup that never finished
    ready_.set();
}

auto BackgroundWorker::waitReady(std::chrono::milliseconds timeout) -> bool {
    return ready_.waitFor(timeout);
}

void BackgroundWorker::runStartup() {
    if (!config_.credentials.present()) {
        logger_->warn(
            "No platform credentials configured; running without a "
            "connection");
        ready_.set();
        return;
    }

    try {
        session_ = factory_();
    } catch (const std::exception& e) {
        logger_->error("Creating the platform session failed: {}", e.what());
        ready_.set();
        return;
    }
    if (!session_) {
        logger_->error("No platform session available");
        ready_.set();
        return;
    }
    hasSession_.store(running_.load());

    logger_->info("Connecting as {}", config_.credentials.email.empty()
                                          ? std::string("<token>")
                                          : config_.credentials.email);
    device::DeviceVoidResult initialized;
    try {
        initialized =
            session_->initialize(config_.credentials, config_.authTimeout);
    } catch (const std::exception&) {
        initialized = std::unexpected(device::currentExceptionToError());
    }
    if (initialized) {
        logger_->info("Connected");
    } else if (initialized.error().code == device::DeviceErrorCode::Timeout) {
        logger_->warn("Session initialization timed out; using partial data");
    } else {
        logger_->error("Session initialization failed: {}",
                       initialized.error().message);
    }

    device::discoverFromControllers(*session_, catalog_);

    if (catalog_.empty()) {
        logger_->info(
            "Controllers returned no devices; trying the direct listing");
        auto listed =
            device::discoverFromListing(*session_, catalog_, config_.dataHost);
        if (!listed) {
            logger_->warn("Direct listing fallback failed: {}",
                          listed.error().message);
        }
    }

    logger_->info("{} device(s) ready", catalog_.size());
    ready_.set();
}

void BackgroundWorker::closeSession() {
    if (!session_) {
        return;
    }
    try {
        auto closed = session_->close(config_.closeTimeout);
        if (!closed) {
            logger_->debug("Session close reported: {}",
                           closed.error().message);
        }
    } catch (const std::exception& e) {
        logger_->debug("Session close failed: {}", e.what());
    }
}

}  // namespace hubbridge::worker
