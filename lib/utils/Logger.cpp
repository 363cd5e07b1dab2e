/**
 * @file Logger.cpp
 * @brief spdlog-backed implementation of the PiPal Logger.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "Logger.h"

#include <cstdio>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace pipal {

namespace {

spdlog::level::level_enum ToSpdlogLevel(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

std::shared_ptr<spdlog::logger> MakeConsoleLogger(const LogConfig& config) {
    // Another component may already have registered the same name.
    spdlog::drop(config.logger_name);
    if (config.enable_colors) {
        return spdlog::stderr_color_mt(config.logger_name);
    }
    return spdlog::stderr_logger_mt(config.logger_name);
}

} // namespace

//==============================================================================
// SINGLETON
//==============================================================================

Logger& Logger::GetInstance() noexcept {
    static Logger instance;
    return instance;
}

//==============================================================================
// CONFIGURATION
//==============================================================================

bool Logger::Initialize(const LogConfig& config) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::shared_ptr<spdlog::logger> logger = MakeConsoleLogger(config);
        logger->set_pattern(config.pattern);
        logger->set_level(ToSpdlogLevel(config.level));
        logger_ = std::move(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "pipal: logger initialization failed: %s\n", ex.what());
        return false;
    }
    level_ = config.level;
    initialized_ = true;
    return true;
}

void Logger::SetLevel(LogLevel level) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    if (logger_) {
        logger_->set_level(ToSpdlogLevel(level));
    }
}

std::shared_ptr<spdlog::logger> Logger::Sink() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        try {
            LogConfig defaults;
            defaults.level = level_;
            logger_ = MakeConsoleLogger(defaults);
            logger_->set_pattern(defaults.pattern);
            logger_->set_level(ToSpdlogLevel(level_));
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "pipal: logger creation failed: %s\n", ex.what());
            return nullptr;
        }
    }
    return logger_;
}

} // namespace pipal
