/**
 * @file GpioBlinkExample.cpp
 * @brief Example driving an LED from an output pin.
 *
 * Key Features Demonstrated:
 * - Facade creation and error reporting
 * - Checking out a line and converting it into an OutputPin
 * - SetHigh / SetLow / Toggle and a timed Pulse
 * - Automatic restoration of the line when the handle goes out of scope
 *
 * Usage: GpioBlinkExample [line] [count]   (defaults: GPIO17, 10 blinks)
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <thread>

#include "api/Gpio.h"
#include "utils/Logger.h"

using namespace pipal;

//==============================================================================
// EXAMPLE CONFIGURATION
//==============================================================================

static constexpr const char* TAG = "GpioBlinkExample";

static constexpr uint8_t kDefaultLine = 17;
static constexpr int kDefaultBlinks = 10;
static constexpr Millis kHalfPeriod{250};

//==============================================================================
// EXAMPLE FUNCTIONS
//==============================================================================

/**
 * @brief Blink @p led @p count times.
 */
void DemonstrateBlink(OutputPin& led, int count) noexcept {
    Logger::GetInstance().Info(TAG, "\n=== Blink ===");
    for (int i = 0; i < count; ++i) {
        led.SetHigh();
        std::this_thread::sleep_for(kHalfPeriod);
        led.SetLow();
        std::this_thread::sleep_for(kHalfPeriod);
    }
    Logger::GetInstance().Info(TAG, "SUCCESS: Blinked GPIO{} {} times", led.GetLine(), count);
}

/**
 * @brief Toggle a few times and report the level register after each step.
 */
void DemonstrateToggle(OutputPin& led) noexcept {
    Logger::GetInstance().Info(TAG, "\n=== Toggle ===");
    for (int i = 0; i < 4; ++i) {
        led.Toggle();
        std::this_thread::sleep_for(kHalfPeriod);
        Logger::GetInstance().Info(TAG, "GPIO{} is now {}", led.GetLine(),
                                   led.IsSetHigh() ? "HIGH" : "LOW");
    }
}

void DemonstratePulse(OutputPin& led) noexcept {
    Logger::GetInstance().Info(TAG, "\n=== Pulse ===");
    GpioError result = led.Pulse(Millis(500));
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: Pulse ({})", GpioErrorToString(result));
        return;
    }
    Logger::GetInstance().Info(TAG, "SUCCESS: 500 ms pulse started");
    std::this_thread::sleep_for(Millis(700));
}

//==============================================================================
// MAIN
//==============================================================================

int main(int argc, char** argv) {
    const uint8_t line = (argc > 1) ? static_cast<uint8_t>(std::atoi(argv[1])) : kDefaultLine;
    const int blinks = (argc > 2) ? std::atoi(argv[2]) : kDefaultBlinks;

    std::unique_ptr<Gpio> gpio;
    GpioError result = Gpio::Create(gpio);
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: Unable to open the GPIO peripheral ({})",
                                    GpioErrorToString(result));
        return EXIT_FAILURE;
    }

    std::optional<Pin> pin = gpio->Get(line);
    if (!pin) {
        Logger::GetInstance().Error(TAG, "FAILED: GPIO{} is unavailable", line);
        return EXIT_FAILURE;
    }
    Logger::GetInstance().Info(TAG, "GPIO{} was in mode {}", line,
                               ModeToString(pin->GetOriginalMode()));

    OutputPin led = pin->IntoOutput();
    DemonstrateBlink(led, blinks);
    DemonstrateToggle(led);
    DemonstratePulse(led);

    gpio->DumpStatistics();
    // led goes out of scope here: the line returns to INPUT.
    return EXIT_SUCCESS;
}
