/**
 * @file Gpio.h
 * @brief PiPal facade: access to the GPIO lines of a Raspberry Pi.
 *
 * @details Gpio is the single entry point of the library. Creating it
 *          identifies the SoC, maps the GPIO register block and opens the
 *          Broadcom GPIO character device. Lines are then checked out with
 *          Get() and configured through the returned Pin.
 *
 *          At most one Gpio exists per process. A second Create() fails with
 *          INSTANCE_EXISTS until the first facade is destroyed. Pins keep the
 *          register mapping and the event loop alive on their own, so they
 *          stay usable after the facade is gone.
 *
 * @code
 * std::unique_ptr<pipal::Gpio> gpio;
 * if (pipal::Gpio::Create(gpio) != pipal::GpioError::SUCCESS) {
 *     return 1;
 * }
 * std::optional<pipal::Pin> pin = gpio->Get(23);
 * if (!pin) {
 *     return 1;  // checked out elsewhere
 * }
 * pipal::InputPin button = pin->IntoInputPullUp();
 * if (button.SetInterrupt(pipal::Trigger::FALLING_EDGE) != pipal::GpioError::SUCCESS) {
 *     return 1;
 * }
 * std::optional<pipal::Level> level;
 * if (button.PollInterrupt(true, pipal::Millis(1000), level) == pipal::GpioError::SUCCESS &&
 *     level) {
 *     // edge seen; *level is the line state after it
 * }
 * @endcode
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_GPIO_H_
#define PIPAL_GPIO_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "core/GpioConfig.h"
#include "core/GpioTypes.h"
#include "handlers/BaseLineEventSource.h"
#include "handlers/RegisterMap.h"
#include "handlers/SocInfo.h"
#include "managers/InterruptEventLoop.h"
#include "pins/Pin.h"

namespace pipal {

//==============================================================================
// BACKEND AND RESULT TYPES
//==============================================================================

/**
 * @brief Hardware access used by a facade.
 *
 * Create(out, config) builds this from the running system; the backend
 * overload of Create() accepts one built by the caller (simulated registers,
 * a different event source).
 */
struct GpioBackend {
    std::unique_ptr<RegisterMap> registers;
    std::unique_ptr<BaseLineEventSource> events;
    SocInfo soc;
};

/// Result of Gpio::PollInterrupts().
struct InterruptEvent {
    const InputPin* pin;
    Level level;
};

//==============================================================================
// DIAGNOSTICS STRUCTURE
//==============================================================================

struct GpioSystemDiagnostics {
    bool system_healthy;
    SocModel soc_model;
    uint32_t checked_out_lines;
    uint32_t checkouts_succeeded;
    uint32_t checkouts_failed;
    uint32_t armed_lines;
    uint32_t async_workers;
    uint32_t failed_workers;
    uint64_t polls;
    uint64_t events_delivered;
    uint64_t events_cached;
    uint64_t system_uptime_ms;
    GpioError last_error;
};

//==============================================================================
// GPIO FACADE
//==============================================================================

class Gpio {
public:
    //==========================================================================
    // CREATION
    //==========================================================================

    /**
     * @brief Open the GPIO peripheral of the running Raspberry Pi.
     * @param[out] out Facade on success, untouched otherwise.
     * @param config   Paths, labels, logging.
     * @return SUCCESS, INSTANCE_EXISTS, UNKNOWN_PERIPHERAL, PERMISSION_DENIED
     *         or IO_ERROR.
     */
    [[nodiscard]] static GpioError Create(std::unique_ptr<Gpio>& out,
                                          const GpioConfig& config = GpioConfig{}) noexcept;

    /**
     * @brief Build a facade over caller-supplied hardware access.
     * @return SUCCESS, INSTANCE_EXISTS, INVALID_PARAMETER (missing registers
     *         or event source) or IO_ERROR.
     */
    [[nodiscard]] static GpioError Create(std::unique_ptr<Gpio>& out, GpioBackend backend,
                                          const GpioConfig& config = GpioConfig{}) noexcept;

    ~Gpio();

    Gpio(const Gpio&) = delete;
    Gpio& operator=(const Gpio&) = delete;
    Gpio(Gpio&&) = delete;
    Gpio& operator=(Gpio&&) = delete;

    //==========================================================================
    // LINE ACCESS
    //==========================================================================

    /**
     * @brief Check out a line.
     * @return Unconfigured pin, or std::nullopt if @p line is out of range or
     *         already checked out anywhere in the process.
     */
    [[nodiscard]] std::optional<Pin> Get(uint8_t line) noexcept;

    /**
     * @brief Wait for the earliest edge on any of @p pins.
     *
     * Every pin must be armed with SetInterrupt() without a callback.
     *
     * @param pins    Pins to watch.
     * @param reset   Drop events that arrived before this call.
     * @param timeout std::nullopt blocks until an edge arrives.
     * @param[out] out Pin and level of the earliest edge, std::nullopt on timeout.
     * @return SUCCESS, INVALID_PARAMETER, ALREADY_RELEASED, NOT_ARMED,
     *         THREAD_PANIC or IO_ERROR.
     */
    [[nodiscard]] GpioError PollInterrupts(const std::vector<const InputPin*>& pins, bool reset,
                                           std::optional<Millis> timeout,
                                           std::optional<InterruptEvent>& out) noexcept;

    //==========================================================================
    // INFORMATION AND DIAGNOSTICS
    //==========================================================================

    [[nodiscard]] const SocInfo& GetSocInfo() const noexcept { return soc_; }
    [[nodiscard]] const GpioConfig& GetConfig() const noexcept { return config_; }

    [[nodiscard]] GpioError GetSystemDiagnostics(GpioSystemDiagnostics& diagnostics) const noexcept;
    void DumpStatistics() const noexcept;

private:
    Gpio(std::shared_ptr<RegisterMap> registers, std::shared_ptr<InterruptEventLoop> events,
         const SocInfo& soc, const GpioConfig& config) noexcept;

    /// Build the event loop and claim the process-wide instance flag.
    [[nodiscard]] static GpioError Assemble(std::unique_ptr<Gpio>& out, GpioBackend backend,
                                            const GpioConfig& config) noexcept;

    void RecordError(GpioError error) const noexcept;

    std::shared_ptr<RegisterMap> registers_;
    std::shared_ptr<InterruptEventLoop> events_;
    SocInfo soc_;
    GpioConfig config_;
    std::chrono::steady_clock::time_point created_at_;

    std::atomic<uint32_t> checkouts_succeeded_{0};
    std::atomic<uint32_t> checkouts_failed_{0};
    mutable std::atomic<GpioError> last_error_{GpioError::SUCCESS};
};

} // namespace pipal

#endif // PIPAL_GPIO_H_
