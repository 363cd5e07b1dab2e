/**
 * @file BaseLineEventSource.h
 * @brief Abstract source of per-line edge-notification descriptors.
 *
 * @details InterruptEventLoop never talks to the kernel driver directly. It
 *          asks a BaseLineEventSource for a readable descriptor per armed
 *          line and expects a stream of `struct gpioevent_data` records on it
 *          (GPIO character device v1 ABI). GpioChipDevice is the production
 *          implementation; tests substitute pipes.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_BASE_LINE_EVENT_SOURCE_H_
#define PIPAL_BASE_LINE_EVENT_SOURCE_H_

#include <cstdint>

#include "core/GpioTypes.h"
#include "utils/FileDescriptor.h"

namespace pipal {

class BaseLineEventSource {
public:
    virtual ~BaseLineEventSource() = default;

    /**
     * @brief Request edge notifications for one line.
     * @param line    BCM line number.
     * @param trigger RISING_EDGE, FALLING_EDGE or BOTH.
     * @param[out] out_fd Descriptor yielding `gpioevent_data` records.
     * @return SUCCESS, INVALID_PARAMETER, INVALID_LINE or IO_ERROR.
     */
    [[nodiscard]] virtual GpioError RequestLineEvent(uint8_t line, Trigger trigger,
                                                     FileDescriptor& out_fd) noexcept = 0;

    /// errno of the last failed request, 0 if none.
    [[nodiscard]] virtual int GetLastOsError() const noexcept = 0;

    /// Human readable identification used in log output.
    [[nodiscard]] virtual const char* GetName() const noexcept = 0;

protected:
    BaseLineEventSource() noexcept = default;
    BaseLineEventSource(const BaseLineEventSource&) = delete;
    BaseLineEventSource& operator=(const BaseLineEventSource&) = delete;
};

} // namespace pipal

#endif // PIPAL_BASE_LINE_EVENT_SOURCE_H_
