/**
 * @file GpioStatusExample.cpp
 * @brief Example listing the mode and level of every GPIO line.
 *
 * Each line is checked out, inspected and handed back without touching its
 * configuration (restore-on-release is turned off), so the listing is safe to
 * run next to other software that owns the pins.
 *
 * Pass `-v` for debug logging from the library.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>

#include "api/Gpio.h"
#include "utils/Logger.h"

using namespace pipal;

static constexpr const char* TAG = "GpioStatusExample";

//==============================================================================
// STATUS LISTING
//==============================================================================

void DumpLineStatus(Gpio& gpio) noexcept {
    Logger::GetInstance().Info(TAG, "=== GPIO line status ({}) ===",
                               SocModelToString(gpio.GetSocInfo().model));

    for (uint8_t line = 0; line < kMaxLines; ++line) {
        std::optional<Pin> pin = gpio.Get(line);
        if (!pin) {
            Logger::GetInstance().Info(TAG, "  GPIO{:<2}  (in use)", line);
            continue;
        }
        pin->SetRestoreOnRelease(false);
        Logger::GetInstance().Info(TAG, "  GPIO{:<2}  {:<4}  {}", line, ModeToString(pin->GetMode()),
                                   LevelToString(pin->Read()));
    }
}

//==============================================================================
// MAIN
//==============================================================================

int main(int argc, char** argv) {
    GpioConfig config;
    if (argc > 1 && std::strcmp(argv[1], "-v") == 0) {
        config.log.level = LogLevel::DEBUG;
    }

    std::unique_ptr<Gpio> gpio;
    GpioError result = Gpio::Create(gpio, config);
    if (result != GpioError::SUCCESS) {
        Logger::GetInstance().Error(TAG, "FAILED: Unable to open the GPIO peripheral ({})",
                                    GpioErrorToString(result));
        return EXIT_FAILURE;
    }

    const SocInfo& soc = gpio->GetSocInfo();
    Logger::GetInstance().Info(TAG, "Peripheral base 0x{:08X}, GPIO block 0x{:08X}",
                               soc.peripheral_base, soc.GpioBaseAddress());

    DumpLineStatus(*gpio);
    gpio->DumpStatistics();
    return EXIT_SUCCESS;
}
