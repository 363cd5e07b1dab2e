/**
 * @file MemoryRegion.h
 * @brief RAII owner of an mmap'ed register window.
 *
 * @details A region is either a shared mapping of a device file
 *          (`/dev/gpiomem`, `/dev/mem`) or an anonymous private mapping used
 *          to simulate the register block. The mapping is released when the
 *          region is destroyed.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_MEMORY_REGION_H_
#define PIPAL_MEMORY_REGION_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "core/GpioTypes.h"

namespace pipal {

class MemoryRegion {
public:
    /**
     * @brief Map @p size bytes of @p path starting at @p offset (O_RDWR | O_SYNC).
     * @param[out] out      Mapped region on success.
     * @param[out] os_error errno of the failing call, 0 on success.
     * @return SUCCESS, PERMISSION_DENIED (EACCES/EPERM) or IO_ERROR.
     */
    [[nodiscard]] static GpioError MapDevice(const std::string& path, uint64_t offset, size_t size,
                                             std::unique_ptr<MemoryRegion>& out,
                                             int& os_error) noexcept;

    /** @brief Zero-filled anonymous mapping of @p size bytes. */
    [[nodiscard]] static GpioError MapAnonymous(size_t size, std::unique_ptr<MemoryRegion>& out,
                                                int& os_error) noexcept;

    MemoryRegion(const MemoryRegion&) = delete;
    MemoryRegion& operator=(const MemoryRegion&) = delete;
    MemoryRegion(MemoryRegion&&) = delete;
    MemoryRegion& operator=(MemoryRegion&&) = delete;

    ~MemoryRegion();

    [[nodiscard]] volatile uint32_t* Words() const noexcept { return words_; }
    [[nodiscard]] size_t SizeBytes() const noexcept { return size_; }
    [[nodiscard]] size_t WordCount() const noexcept { return size_ / sizeof(uint32_t); }
    [[nodiscard]] const std::string& Source() const noexcept { return source_; }

private:
    MemoryRegion(void* base, size_t size, std::string source) noexcept;

    void* base_;
    volatile uint32_t* words_;
    size_t size_;
    std::string source_;
};

} // namespace pipal

#endif // PIPAL_MEMORY_REGION_H_
