/**
 * @file GpioTypes.h
 * @brief Core value types shared by every PiPal GPIO component.
 *
 * @details Defines the tagged values used throughout the library:
 *          - Mode (3-bit function select field)
 *          - Level (one bit per line)
 *          - PullUpDown (pull resistor state)
 *          - Trigger (edge condition a line is armed for)
 *          - SocModel (supported Broadcom register layouts)
 *          - GpioError (error taxonomy returned by every operation)
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_GPIO_TYPES_H_
#define PIPAL_GPIO_TYPES_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace pipal {

//==============================================================================
// LIMITS
//==============================================================================

/// Number of addressable BCM GPIO lines (GPIO0 - GPIO53).
inline constexpr size_t kMaxLines = 54;

/// Timeout type used by every blocking interrupt wait.
using Millis = std::chrono::milliseconds;

/**
 * @brief Steady-clock deadline @p timeout from now.
 * @return false if the deadline lies past the end of the clock's range; the
 *         caller then waits without a bound and @p deadline is untouched.
 */
inline bool DeadlineAfter(Millis timeout,
                          std::chrono::steady_clock::time_point& deadline) noexcept {
    const auto now = std::chrono::steady_clock::now();
    const auto headroom =
        std::chrono::duration_cast<Millis>(std::chrono::steady_clock::time_point::max() - now);
    if (timeout >= headroom) {
        return false;
    }
    deadline = now + timeout;
    return true;
}

//==============================================================================
// PIN MODE
//==============================================================================

/**
 * @brief Function select value of a line.
 * @note The enumerator values are the raw 3-bit GPFSEL encodings.
 */
enum class Mode : uint8_t {
    INPUT  = 0b000,
    OUTPUT = 0b001,
    ALT5   = 0b010,
    ALT4   = 0b011,
    ALT0   = 0b100,
    ALT1   = 0b101,
    ALT2   = 0b110,
    ALT3   = 0b111
};

constexpr const char* ModeToString(Mode mode) noexcept {
    switch (mode) {
        case Mode::INPUT: return "In";
        case Mode::OUTPUT: return "Out";
        case Mode::ALT0: return "Alt0";
        case Mode::ALT1: return "Alt1";
        case Mode::ALT2: return "Alt2";
        case Mode::ALT3: return "Alt3";
        case Mode::ALT4: return "Alt4";
        case Mode::ALT5: return "Alt5";
        default: return "Unknown";
    }
}

/// True for Alt0..Alt5.
constexpr bool IsAltMode(Mode mode) noexcept {
    return mode != Mode::INPUT && mode != Mode::OUTPUT;
}

//==============================================================================
// LOGIC LEVEL
//==============================================================================

enum class Level : uint8_t {
    LOW = 0,
    HIGH = 1
};

constexpr const char* LevelToString(Level level) noexcept {
    return level == Level::HIGH ? "High" : "Low";
}

constexpr Level InvertLevel(Level level) noexcept {
    return level == Level::HIGH ? Level::LOW : Level::HIGH;
}

//==============================================================================
// PULL RESISTOR
//==============================================================================

enum class PullUpDown : uint8_t {
    OFF = 0,
    PULL_DOWN,
    PULL_UP
};

constexpr const char* PullUpDownToString(PullUpDown pull) noexcept {
    switch (pull) {
        case PullUpDown::OFF: return "Off";
        case PullUpDown::PULL_DOWN: return "PullDown";
        case PullUpDown::PULL_UP: return "PullUp";
        default: return "Unknown";
    }
}

//==============================================================================
// INTERRUPT TRIGGER
//==============================================================================

enum class Trigger : uint8_t {
    DISABLED = 0,
    RISING_EDGE,
    FALLING_EDGE,
    BOTH
};

constexpr const char* TriggerToString(Trigger trigger) noexcept {
    switch (trigger) {
        case Trigger::DISABLED: return "Disabled";
        case Trigger::RISING_EDGE: return "RisingEdge";
        case Trigger::FALLING_EDGE: return "FallingEdge";
        case Trigger::BOTH: return "Both";
        default: return "Unknown";
    }
}

/// Callback invoked on the asynchronous interrupt worker for every edge.
using AsyncCallback = std::function<void(Level)>;

//==============================================================================
// SOC MODEL
//==============================================================================

/**
 * @brief Register layouts the library knows how to drive.
 *
 * BCM2835/6/7 share the GPPUD clocked pull sequence. BCM2711 replaced it with
 * the readable GPIO_PUP_PDN_CNTRL registers.
 */
enum class SocModel : uint8_t {
    UNKNOWN = 0,
    BCM2835,
    BCM2836,
    BCM2837,
    BCM2711
};

constexpr const char* SocModelToString(SocModel model) noexcept {
    switch (model) {
        case SocModel::BCM2835: return "BCM2835";
        case SocModel::BCM2836: return "BCM2836";
        case SocModel::BCM2837: return "BCM2837";
        case SocModel::BCM2711: return "BCM2711";
        default: return "Unknown";
    }
}

//==============================================================================
// ERROR CODES
//==============================================================================

/**
 * @brief Error codes returned by PiPal operations.
 *
 * UNKNOWN_PERIPHERAL, PERMISSION_DENIED and INSTANCE_EXISTS abort facade
 * construction. IO_ERROR carries the errno of the failing call through the
 * owning component's GetLastOsError(). THREAD_PANIC reports an asynchronous
 * interrupt worker that terminated abnormally.
 */
enum class GpioError : uint8_t {
    SUCCESS = 0,
    UNKNOWN_PERIPHERAL,
    PERMISSION_DENIED,
    INSTANCE_EXISTS,
    IO_ERROR,
    THREAD_PANIC,
    INVALID_PARAMETER,
    INVALID_LINE,
    NOT_ARMED,
    ALREADY_RELEASED
};

constexpr const char* GpioErrorToString(GpioError error) noexcept {
    switch (error) {
        case GpioError::SUCCESS: return "Success";
        case GpioError::UNKNOWN_PERIPHERAL: return "Unknown SoC";
        case GpioError::PERMISSION_DENIED: return "/dev/gpiomem and/or /dev/mem insufficient permissions";
        case GpioError::INSTANCE_EXISTS: return "An instance of Gpio already exists";
        case GpioError::IO_ERROR: return "I/O error";
        case GpioError::THREAD_PANIC: return "Interrupt polling thread panicked";
        case GpioError::INVALID_PARAMETER: return "Invalid parameter";
        case GpioError::INVALID_LINE: return "Invalid line";
        case GpioError::NOT_ARMED: return "Interrupt not armed";
        case GpioError::ALREADY_RELEASED: return "Pin already released";
        default: return "Unknown error";
    }
}

//==============================================================================
// INTERRUPT EVENT
//==============================================================================

/// A single edge delivered by the interrupt event loop.
struct LineEvent {
    uint8_t line{0};
    Level level{Level::LOW};
};

} // namespace pipal

#endif // PIPAL_GPIO_TYPES_H_
