/**
 * @file SocInfo.h
 * @brief Identification of the Broadcom SoC and its peripheral base address.
 *
 * @details The GPIO register block sits at `peripheral_base + 0x200000` on
 *          every supported SoC. Detection order:
 *          1. `/proc/device-tree/compatible` (`brcm,bcm2711`, `brcm,bcm2837`, ...)
 *          2. `Hardware` line of `/proc/cpuinfo` (legacy kernels)
 *
 *          The peripheral base is read from `/proc/device-tree/soc/ranges`
 *          and falls back to the documented address of the detected model.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_SOC_INFO_H_
#define PIPAL_SOC_INFO_H_

#include <cstdint>
#include <string_view>

#include "core/GpioTypes.h"

namespace pipal {

struct SocInfo {
    static constexpr uint64_t kGpioOffset = 0x200000;

    SocModel model{SocModel::UNKNOWN};
    uint64_t peripheral_base{0};

    /**
     * @brief Identify the running SoC.
     * @param[out] out Filled on success.
     * @return SUCCESS, or UNKNOWN_PERIPHERAL if no supported model was found.
     */
    [[nodiscard]] static GpioError Detect(SocInfo& out) noexcept;

    /** @brief SocInfo for a known model with its documented peripheral base. */
    [[nodiscard]] static SocInfo FromModel(SocModel model) noexcept;

    [[nodiscard]] static uint64_t DefaultPeripheralBase(SocModel model) noexcept;

    /** @brief Parse the NUL-separated contents of a device-tree compatible node. */
    [[nodiscard]] static SocModel ParseCompatible(std::string_view contents) noexcept;

    /** @brief Parse the `Hardware` line of /proc/cpuinfo. */
    [[nodiscard]] static SocModel ParseCpuinfo(std::string_view contents) noexcept;

    [[nodiscard]] bool IsKnown() const noexcept { return model != SocModel::UNKNOWN; }

    /// BCM2711 exposes readable pull registers; older chips use the GPPUD clock.
    [[nodiscard]] bool HasPullControlRegisters() const noexcept {
        return model == SocModel::BCM2711;
    }

    [[nodiscard]] uint64_t GpioBaseAddress() const noexcept {
        return peripheral_base + kGpioOffset;
    }
};

} // namespace pipal

#endif // PIPAL_SOC_INFO_H_
