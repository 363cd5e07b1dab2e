/**
 * @file GpioChipDevice.h
 * @brief `/dev/gpiochipN` line event source (GPIO character device, v1 ABI).
 *
 * @details Open() probes gpiochip0..N-1 and keeps the chip whose label names
 *          the Broadcom pin controller (`pinctrl-bcm2835` or
 *          `pinctrl-bcm2711`). Each RequestLineEvent() issues
 *          GPIO_GET_LINEEVENT_IOCTL and hands the returned line descriptor
 *          over to the caller; the chip descriptor stays open for the
 *          lifetime of the device.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_GPIO_CHIP_DEVICE_H_
#define PIPAL_GPIO_CHIP_DEVICE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "core/GpioConfig.h"
#include "handlers/BaseLineEventSource.h"
#include "utils/FileDescriptor.h"

namespace pipal {

class GpioChipDevice : public BaseLineEventSource {
public:
    /**
     * @brief Locate and open the Broadcom GPIO chip.
     * @param config   Chip path prefix, probe count and consumer label.
     * @param[out] out Opened device on success.
     * @return SUCCESS, PERMISSION_DENIED if a chip could not be opened for
     *         lack of rights, or IO_ERROR if no matching chip exists.
     */
    [[nodiscard]] static GpioError Open(const GpioConfig& config,
                                        std::unique_ptr<GpioChipDevice>& out) noexcept;

    /// True for the labels used by the Broadcom pin controller driver.
    [[nodiscard]] static bool IsBroadcomLabel(std::string_view label) noexcept;

    ~GpioChipDevice() override = default;

    [[nodiscard]] GpioError RequestLineEvent(uint8_t line, Trigger trigger,
                                             FileDescriptor& out_fd) noexcept override;

    [[nodiscard]] int GetLastOsError() const noexcept override { return last_os_error_.load(); }
    [[nodiscard]] const char* GetName() const noexcept override { return path_.c_str(); }

    [[nodiscard]] const std::string& GetLabel() const noexcept { return label_; }
    [[nodiscard]] uint32_t GetLineCount() const noexcept { return line_count_; }

private:
    GpioChipDevice(FileDescriptor fd, std::string path, std::string label, uint32_t line_count,
                   std::string consumer_label) noexcept;

    FileDescriptor fd_;
    std::string path_;
    std::string label_;
    uint32_t line_count_;
    std::string consumer_label_;
    std::atomic<int> last_os_error_{0};
};

} // namespace pipal

#endif // PIPAL_GPIO_CHIP_DEVICE_H_
