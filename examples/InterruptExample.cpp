/**
 * @file InterruptExample.cpp
 * @brief Example waiting for button presses with both delivery modes.
 *
 * Key Features Demonstrated:
 * - Synchronous interrupts on a single pin (PollInterrupt)
 * - Waiting on several pins at once (Gpio::PollInterrupts)
 * - Asynchronous callbacks on a worker thread
 *
 * Wire two buttons between GPIO23 / GPIO24 and ground; the internal pull-ups
 * keep the lines HIGH until a button is pressed.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include "api/Gpio.h"
#include "utils/Logger.h"

using namespace pipal;

//==============================================================================
// EXAMPLE CONFIGURATION
//==============================================================================

static constexpr const char* TAG = "InterruptExample";

static constexpr uint8_t kButtonA = 23;
static constexpr uint8_t kButtonB = 24;

//==============================================================================
// EXAMPLE FUNCTIONS
//==============================================================================

/**
 * @brief Wait up to five seconds for a press on one button.
 */
void DemonstrateSinglePin(InputPin& button) noexcept {
    Logger::GetInstance().Info(TAG, "\n=== Single pin ===");

    GpioError result = button.SetInterrupt(Trigger::FALLING_EDGE);
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: SetInterrupt ({})", GpioErrorToString(result));
        return;
    }

    Logger::GetInstance().Info(TAG, "Press the button on GPIO{} ...", button.GetLine());
    std::optional<Level> level;
    result = button.PollInterrupt(true, Millis(5000), level);
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: PollInterrupt ({})", GpioErrorToString(result));
    } else if (level) {
        Logger::GetInstance().Info(TAG, "SUCCESS: Edge on GPIO{}, level {}", button.GetLine(),
                                   LevelToString(*level));
    } else {
        Logger::GetInstance().Warn(TAG, "Timed out");
    }
}

/**
 * @brief Report the first five edges on either button.
 */
void DemonstrateMultiplePins(Gpio& gpio, InputPin& a, InputPin& b) noexcept {
    Logger::GetInstance().Info(TAG, "\n=== Multiple pins ===");

    if (a.SetInterrupt(Trigger::BOTH) != GpioError::SUCCESS ||
        b.SetInterrupt(Trigger::BOTH) != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: Unable to arm both buttons");
        return;
    }

    const std::vector<const InputPin*> pins = {&a, &b};
    bool reset = true;
    for (int received = 0; received < 5;) {
        std::optional<InterruptEvent> event;
        GpioError result = gpio.PollInterrupts(pins, reset, Millis(10000), event);
        reset = false;
        if (result != GpioError::SUCCESS) {
            Logger::GetInstance().Error(TAG, "FAILED: PollInterrupts ({})",
                                        GpioErrorToString(result));
            return;
        }
        if (!event) {
            Logger::GetInstance().Warn(TAG, "No edge within 10 s");
            return;
        }
        ++received;
        Logger::GetInstance().Info(TAG, "Edge {}: GPIO{} -> {}", received,
                                   event->pin->GetLine(), LevelToString(event->level));
    }
}

void DemonstrateAsync(InputPin& button) noexcept {
    Logger::GetInstance().Info(TAG, "\n=== Asynchronous callback ===");

    std::atomic<int> presses{0};
    GpioError result = button.SetInterrupt(Trigger::FALLING_EDGE, [&presses](Level) {
        const int n = presses.fetch_add(1) + 1;
        Logger::GetInstance().Info(TAG, "INTERRUPT: press #{}", n);
    });
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: SetInterrupt ({})", GpioErrorToString(result));
        return;
    }

    std::this_thread::sleep_for(std::chrono::seconds(10));

    // Returns once the worker has stopped; presses is not touched afterwards.
    result = button.ClearInterrupt();
    Logger::GetInstance().Info(TAG, "{} presses in 10 s ({})", presses.load(),
                               GpioErrorToString(result));
}

//==============================================================================
// MAIN
//==============================================================================

int main() {
    std::unique_ptr<Gpio> gpio;
    GpioError result = Gpio::Create(gpio);
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: Unable to open the GPIO peripheral ({})",
                                    GpioErrorToString(result));
        return EXIT_FAILURE;
    }

    std::optional<Pin> pin_a = gpio->Get(kButtonA);
    std::optional<Pin> pin_b = gpio->Get(kButtonB);
    if (!pin_a || !pin_b) {
        Logger::GetInstance().Error(TAG, "FAILED: Buttons are already in use");
        return EXIT_FAILURE;
    }
    InputPin a = pin_a->IntoInputPullUp();
    InputPin b = pin_b->IntoInputPullUp();

    DemonstrateSinglePin(a);
    DemonstrateMultiplePins(*gpio, a, b);
    DemonstrateAsync(a);

    gpio->DumpStatistics();
    return EXIT_SUCCESS;
}
