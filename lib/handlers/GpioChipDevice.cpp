/**
 * @file GpioChipDevice.cpp
 * @brief GPIO character device probing and line event requests.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "GpioChipDevice.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>

#include <utility>

#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "GpioChipDevice";

GpioChipDevice::GpioChipDevice(FileDescriptor fd, std::string path, std::string label,
                               uint32_t line_count, std::string consumer_label) noexcept
    : fd_(std::move(fd)),
      path_(std::move(path)),
      label_(std::move(label)),
      line_count_(line_count),
      consumer_label_(std::move(consumer_label)) {}

bool GpioChipDevice::IsBroadcomLabel(std::string_view label) noexcept {
    return label == "pinctrl-bcm2835" || label == "pinctrl-bcm2711";
}

//==============================================================================
// DISCOVERY
//==============================================================================

GpioError GpioChipDevice::Open(const GpioConfig& config,
                               std::unique_ptr<GpioChipDevice>& out) noexcept {
    bool permission_denied = false;

    for (uint8_t index = 0; index < config.max_gpiochips; ++index) {
        std::string path = config.gpiochip_path_prefix + std::to_string(index);
        FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CLOEXEC));
        if (!fd) {
            const int err = errno;
            if (err == EACCES || err == EPERM) {
                Logger::GetInstance().Warn(TAG, "No permission to open {}", path);
                permission_denied = true;
            }
            continue;
        }

        struct gpiochip_info info {};
        if (::ioctl(fd.Get(), GPIO_GET_CHIPINFO_IOCTL, &info) < 0) {
            Logger::GetInstance().Warn(TAG, "GPIO_GET_CHIPINFO_IOCTL on {} failed: {}", path,
                                       std::strerror(errno));
            continue;
        }

        std::string label(info.label, strnlen(info.label, sizeof(info.label)));
        Logger::GetInstance().Debug(TAG, "{}: label '{}', {} lines", path, label, info.lines);
        if (!IsBroadcomLabel(label)) {
            continue;
        }

        out.reset(new GpioChipDevice(std::move(fd), std::move(path), std::move(label), info.lines,
                                     config.consumer_label));
        return GpioError::SUCCESS;
    }

    if (permission_denied) {
        Logger::GetInstance().Error(TAG, "Permission denied on {}N; add the user to the gpio group",
                                    config.gpiochip_path_prefix);
        return GpioError::PERMISSION_DENIED;
    }
    Logger::GetInstance().Error(TAG, "No Broadcom GPIO chip found under {}N",
                                config.gpiochip_path_prefix);
    return GpioError::IO_ERROR;
}

//==============================================================================
// LINE EVENTS
//==============================================================================

GpioError GpioChipDevice::RequestLineEvent(uint8_t line, Trigger trigger,
                                           FileDescriptor& out_fd) noexcept {
    uint32_t event_flags = 0;
    switch (trigger) {
        case Trigger::RISING_EDGE: event_flags = GPIOEVENT_REQUEST_RISING_EDGE; break;
        case Trigger::FALLING_EDGE: event_flags = GPIOEVENT_REQUEST_FALLING_EDGE; break;
        case Trigger::BOTH: event_flags = GPIOEVENT_REQUEST_BOTH_EDGES; break;
        default: return GpioError::INVALID_PARAMETER;
    }
    if (line >= line_count_) {
        return GpioError::INVALID_LINE;
    }

    struct gpioevent_request request {};
    request.lineoffset = line;
    request.handleflags = GPIOHANDLE_REQUEST_INPUT;
    request.eventflags = event_flags;
    std::strncpy(request.consumer_label, consumer_label_.c_str(),
                 sizeof(request.consumer_label) - 1);

    if (::ioctl(fd_.Get(), GPIO_GET_LINEEVENT_IOCTL, &request) < 0) {
        const int err = errno;
        last_os_error_.store(err);
        Logger::GetInstance().Error(TAG, "GPIO_GET_LINEEVENT_IOCTL for line {} failed: {}", line,
                                    std::strerror(err));
        return GpioError::IO_ERROR;
    }

    last_os_error_.store(0);
    out_fd.Reset(request.fd);
    return GpioError::SUCCESS;
}

} // namespace pipal
