/**
 * @file Pin.h
 * @brief Capability-typed handles for checked-out GPIO lines.
 *
 * @details A line is checked out from Gpio::Get() as an unconfigured Pin and
 *          converted into the handle that matches its use:
 *
 *          | Handle      | Capabilities                                       |
 *          |-------------|----------------------------------------------------|
 *          | Pin         | read the level and mode, convert                   |
 *          | InputPin    | read, pull resistors, interrupts (poll or callback)|
 *          | OutputPin   | drive, toggle, timed pulse                         |
 *          | AltPin      | select an alternate function                       |
 *
 *          Every handle owns the line's LineToken. A conversion moves the
 *          token into the new handle and leaves the source handle released.
 *          Releasing a handle (explicitly or by destruction) disarms any
 *          interrupt and, unless restore-on-release was turned off, puts the
 *          line back into INPUT mode with the pull resistors off. The token
 *          is returned to the registry in every case.
 *
 * @code
 * auto pin = gpio->Get(17);
 * if (pin) {
 *     pipal::OutputPin led = pin->IntoOutput();
 *     led.SetHigh();
 * }
 * @endcode
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_PIN_H_
#define PIPAL_PIN_H_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "core/GpioTypes.h"
#include "handlers/RegisterMap.h"
#include "managers/InterruptEventLoop.h"
#include "managers/LineRegistry.h"

namespace pipal {

class Gpio;
class Pin;

//==============================================================================
// PIN BASE
//==============================================================================

/**
 * @brief State and release logic shared by every handle type.
 */
class PinBase {
public:
    PinBase(const PinBase&) = delete;
    PinBase& operator=(const PinBase&) = delete;

    [[nodiscard]] uint8_t GetLine() const noexcept { return line_; }

    /// Mode the line had when it was checked out.
    [[nodiscard]] Mode GetOriginalMode() const noexcept { return original_mode_; }

    void SetRestoreOnRelease(bool restore) noexcept { restore_on_release_ = restore; }
    [[nodiscard]] bool GetRestoreOnRelease() const noexcept { return restore_on_release_; }

    [[nodiscard]] bool IsReleased() const noexcept { return !token_.IsValid(); }

    /**
     * @brief Disarm, optionally restore INPUT / pull OFF, return the line.
     * @return SUCCESS, ALREADY_RELEASED, or THREAD_PANIC if the line's async
     *         worker had failed (the line is released regardless).
     */
    [[nodiscard]] GpioError Release() noexcept;

protected:
    PinBase(LineToken token, std::shared_ptr<RegisterMap> registers,
            std::shared_ptr<InterruptEventLoop> events) noexcept;

    PinBase(PinBase&& other) noexcept = default;
    PinBase& operator=(PinBase&& other) noexcept;

    ~PinBase();

    LineToken token_;
    std::shared_ptr<RegisterMap> registers_;
    std::shared_ptr<InterruptEventLoop> events_;
    uint8_t line_;
    Mode original_mode_;
    bool restore_on_release_{true};
};

//==============================================================================
// INPUT PIN
//==============================================================================

class InputPin : public PinBase {
public:
    InputPin(InputPin&&) noexcept = default;
    InputPin& operator=(InputPin&&) noexcept = default;
    ~InputPin() = default;

    [[nodiscard]] Level Read() const noexcept;
    [[nodiscard]] bool IsHigh() const noexcept { return Read() == Level::HIGH; }
    [[nodiscard]] bool IsLow() const noexcept { return Read() == Level::LOW; }

    void SetPull(PullUpDown pull) noexcept;
    [[nodiscard]] PullUpDown GetPull() const noexcept;

    /**
     * @brief Configure edge detection.
     *
     * Without a callback the line is armed for PollInterrupt() /
     * Gpio::PollInterrupts(). With a callback every edge is delivered on a
     * dedicated worker thread. Trigger::DISABLED disarms.
     *
     * @return SUCCESS, ALREADY_RELEASED, IO_ERROR or THREAD_PANIC.
     */
    [[nodiscard]] GpioError SetInterrupt(Trigger trigger, AsyncCallback callback = {}) noexcept;

    /// Disarm edge detection; SUCCESS when nothing was armed.
    [[nodiscard]] GpioError ClearInterrupt() noexcept;

    /**
     * @brief Wait for the next edge on this line.
     * @param reset   Drop events that arrived before this call.
     * @param timeout std::nullopt blocks until an edge arrives.
     * @param[out] out Level after the edge, std::nullopt on timeout.
     * @return SUCCESS, ALREADY_RELEASED, NOT_ARMED, THREAD_PANIC or IO_ERROR.
     */
    [[nodiscard]] GpioError PollInterrupt(bool reset, std::optional<Millis> timeout,
                                          std::optional<Level>& out) noexcept;

private:
    friend class Pin;
    explicit InputPin(PinBase&& base) noexcept : PinBase(std::move(base)) {}
};

//==============================================================================
// OUTPUT PIN
//==============================================================================

class OutputPin : public PinBase {
public:
    OutputPin(OutputPin&& other) noexcept;
    OutputPin& operator=(OutputPin&& other) noexcept;
    ~OutputPin();

    void Write(Level level) noexcept;
    void SetHigh() noexcept { Write(Level::HIGH); }
    void SetLow() noexcept { Write(Level::LOW); }
    void Toggle() noexcept;

    /// Output state as seen by the level register.
    [[nodiscard]] bool IsSetHigh() const noexcept;
    [[nodiscard]] bool IsSetLow() const noexcept { return !IsSetHigh(); }

    /**
     * @brief Drive HIGH now and LOW after @p duration.
     *
     * A new pulse or release cancels a pending one before it drives LOW.
     *
     * @return SUCCESS, ALREADY_RELEASED, INVALID_PARAMETER (negative
     *         duration) or IO_ERROR (timer thread could not start).
     */
    [[nodiscard]] GpioError Pulse(Millis duration) noexcept;

    /// Cancel any pending pulse, then release the line.
    [[nodiscard]] GpioError Release() noexcept;

private:
    friend class Pin;
    explicit OutputPin(PinBase&& base) noexcept : PinBase(std::move(base)) {}

    struct PulseTimer {
        std::thread thread;
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled{false};
    };

    void CancelPulse() noexcept;

    std::unique_ptr<PulseTimer> pulse_;
};

//==============================================================================
// ALT PIN
//==============================================================================

class AltPin : public PinBase {
public:
    AltPin(AltPin&&) noexcept = default;
    AltPin& operator=(AltPin&&) noexcept = default;
    ~AltPin() = default;

    /// @return SUCCESS, ALREADY_RELEASED or INVALID_PARAMETER (not ALT0-ALT5).
    [[nodiscard]] GpioError SetMode(Mode mode) noexcept;
    [[nodiscard]] Mode GetMode() const noexcept;

private:
    friend class Pin;
    explicit AltPin(PinBase&& base) noexcept : PinBase(std::move(base)) {}
};

//==============================================================================
// UNCONFIGURED PIN
//==============================================================================

class Pin : public PinBase {
public:
    Pin(Pin&&) noexcept = default;
    Pin& operator=(Pin&&) noexcept = default;
    ~Pin() = default;

    [[nodiscard]] Mode GetMode() const noexcept;
    [[nodiscard]] Level Read() const noexcept;

    /// INPUT mode, pull resistors off.
    [[nodiscard]] InputPin IntoInput() noexcept;
    [[nodiscard]] InputPin IntoInputPullUp() noexcept;
    [[nodiscard]] InputPin IntoInputPullDown() noexcept;

    /// OUTPUT mode; the output latch keeps its current value.
    [[nodiscard]] OutputPin IntoOutput() noexcept;

    /**
     * @brief Switch to an alternate function.
     * @return The new handle, or std::nullopt (this pin untouched) if @p mode
     *         is not ALT0-ALT5.
     */
    [[nodiscard]] std::optional<AltPin> IntoAlt(Mode mode) noexcept;

private:
    friend class Gpio;
    Pin(LineToken token, std::shared_ptr<RegisterMap> registers,
        std::shared_ptr<InterruptEventLoop> events) noexcept
        : PinBase(std::move(token), std::move(registers), std::move(events)) {}

    [[nodiscard]] InputPin IntoInputWithPull(PullUpDown pull) noexcept;
};

} // namespace pipal

#endif // PIPAL_PIN_H_
