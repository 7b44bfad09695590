/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace hubbridge::logging {

auto toSpdlogLevel(config::LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case config::LogLevel::Trace: return spdlog::level::trace;
        case config::LogLevel::Debug: return spdlog::level::debug;
        case config::LogLevel::Info: return spdlog::level::info;
        case config::LogLevel::Warn: return spdlog::level::warn;
        case config::LogLevel::Error: return spdlog::level::err;
        case config::LogLevel::Critical: return spdlog::level::critical;
        case config::LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::LoggingManager() { buildSinks(config_); }

LoggingManager::~LoggingManager() { flush(); }

void LoggingManager::initialize(const config::LoggingConfig& config) {
    size_t sinkCount = 0;
    {
        std::unique_lock lock(mutex_);

        config_ = config;
        buildSinks(config_);

        // Re-point existing loggers at the new sinks
        for (auto& [name, logger] : loggers_) {
            logger->sinks() = sinks_;
            logger->set_level(toSpdlogLevel(config_.level));
            logger->set_pattern(config_.pattern);
        }

        setupDefaultLogger();
        initialized_ = true;
        sinkCount = sinks_.size();
    }

    spdlog::debug("LoggingManager initialized with {} sinks, level {}",
                  sinkCount, config::logLevelToString(config.level));
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
    loggers_.clear();
    spdlog::drop_all();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    {
        std::shared_lock lock(mutex_);
        if (auto it = loggers_.find(name); it != loggers_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }
    auto logger = createLogger(name);
    loggers_.emplace(name, logger);
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
}

void LoggingManager::buildSinks(const config::LoggingConfig& config) {
    sinks_.clear();

    if (config.consoleColor) {
        sinks_.push_back(
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks_.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    }

    if (!config.logFile.empty()) {
        sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logFile, config.maxFileSize, config.maxFiles));
    }
}

auto LoggingManager::createLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    auto logger =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(toSpdlogLevel(config_.level));
    logger->set_pattern(config_.pattern);
    return logger;
}

void LoggingManager::setupDefaultLogger() {
    auto default_logger =
        std::make_shared<spdlog::logger>("hubbridge", sinks_.begin(),
                                         sinks_.end());

    default_logger->set_level(toSpdlogLevel(config_.level));
    default_logger->set_pattern(config_.pattern);

    spdlog::set_default_logger(default_logger);
}

}  // namespace hubbridge::logging
