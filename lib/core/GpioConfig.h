/**
 * @file GpioConfig.h
 * @brief Runtime configuration for the PiPal GPIO facade.
 *
 * @details All fields carry working defaults for Raspberry Pi OS; callers only
 *          override what differs on their system:
 *
 * @code
 * pipal::GpioConfig config;
 * config.consumer_label = "door-sensor";
 * config.log.level = pipal::LogLevel::DEBUG;
 * std::unique_ptr<pipal::Gpio> gpio;
 * auto err = pipal::Gpio::Create(gpio, config);
 * @endcode
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_GPIO_CONFIG_H_
#define PIPAL_GPIO_CONFIG_H_

#include <cstdint>
#include <string>

#include "core/GpioTypes.h"
#include "utils/Logger.h"

namespace pipal {

struct GpioConfig {
    std::string gpiomem_path = "/dev/gpiomem";          ///< GPIO-only register window
    std::string mem_path = "/dev/mem";                  ///< Full physical memory fallback
    std::string gpiochip_path_prefix = "/dev/gpiochip"; ///< Character device prefix
    uint8_t max_gpiochips = 8;                          ///< gpiochip0..N-1 are probed
    std::string consumer_label = "pipal";               ///< Label shown by the kernel for requested lines
    uint32_t pull_settle_us = 5;                        ///< Settle delay between GPPUD clocking steps
    SocModel soc_override = SocModel::UNKNOWN;          ///< UNKNOWN = auto-detect
    LogConfig log{};                                    ///< Logger settings applied by Gpio::Create
};

} // namespace pipal

#endif // PIPAL_GPIO_CONFIG_H_
