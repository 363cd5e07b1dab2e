/**
 * @file Logger.h
 * @brief Tagged logging front-end for PiPal, backed by spdlog.
 *
 * @details Every translation unit declares a `static constexpr const char* TAG`
 *          and logs through the singleton:
 *
 * @code
 * Logger::GetInstance().Info(TAG, "Mapped {} registers", count);
 * @endcode
 *
 *          Messages use fmt-style format strings. The underlying spdlog logger
 *          is created lazily on first use so logging works before
 *          Initialize() has been called.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_LOGGER_H_
#define PIPAL_LOGGER_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace pipal {

//==============================================================================
// CONFIGURATION
//==============================================================================

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    OFF
};

constexpr const char* LogLevelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Logger configuration.
 */
struct LogConfig {
    LogLevel level = LogLevel::INFO;              ///< Minimum level emitted
    bool enable_colors = true;                    ///< Colored console sink
    std::string logger_name = "pipal";            ///< spdlog registry name
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] %v";  ///< spdlog pattern
};

//==============================================================================
// LOGGER
//==============================================================================

class Logger {
public:
    static Logger& GetInstance() noexcept;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief (Re)configure the backing spdlog logger.
     * @return true if the sink was created, false if spdlog rejected it.
     */
    bool Initialize(const LogConfig& config = LogConfig{}) noexcept;

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

    void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel GetLevel() const noexcept { return level_; }

    template <typename... Args>
    void Debug(const char* tag, spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
        Log(spdlog::level::debug, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Info(const char* tag, spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
        Log(spdlog::level::info, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Warn(const char* tag, spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
        Log(spdlog::level::warn, tag, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void Error(const char* tag, spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
        Log(spdlog::level::err, tag, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() noexcept = default;
    ~Logger() = default;

    template <typename... Args>
    void Log(spdlog::level::level_enum lvl, const char* tag,
             spdlog::format_string_t<Args...> fmt, Args&&... args) noexcept {
        std::shared_ptr<spdlog::logger> sink = Sink();
        if (!sink || !sink->should_log(lvl)) {
            return;
        }
        sink->log(lvl, "[{}] {}", tag ? tag : "-",
                  fmt::format(fmt, std::forward<Args>(args)...));
    }

    std::shared_ptr<spdlog::logger> Sink() noexcept;

    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel level_{LogLevel::INFO};
    bool initialized_{false};
};

} // namespace pipal

#endif // PIPAL_LOGGER_H_
