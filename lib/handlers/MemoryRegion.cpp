/**
 * @file MemoryRegion.cpp
 * @brief mmap / munmap of register windows.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "MemoryRegion.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>

#include <utility>

#include "utils/FileDescriptor.h"
#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "MemoryRegion";

MemoryRegion::MemoryRegion(void* base, size_t size, std::string source) noexcept
    : base_(base),
      words_(static_cast<volatile uint32_t*>(base)),
      size_(size),
      source_(std::move(source)) {}

MemoryRegion::~MemoryRegion() {
    if (base_ != nullptr && ::munmap(base_, size_) != 0) {
        Logger::GetInstance().Warn(TAG, "munmap of {} failed: {}", source_, std::strerror(errno));
    }
}

GpioError MemoryRegion::MapDevice(const std::string& path, uint64_t offset, size_t size,
                                  std::unique_ptr<MemoryRegion>& out, int& os_error) noexcept {
    os_error = 0;
    FileDescriptor fd(::open(path.c_str(), O_RDWR | O_SYNC | O_CLOEXEC));
    if (!fd) {
        os_error = errno;
        Logger::GetInstance().Debug(TAG, "Unable to open {}: {}", path, std::strerror(os_error));
        return (os_error == EACCES || os_error == EPERM) ? GpioError::PERMISSION_DENIED
                                                         : GpioError::IO_ERROR;
    }

    void* base = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED, fd.Get(),
                        static_cast<off_t>(offset));
    if (base == MAP_FAILED) {
        os_error = errno;
        Logger::GetInstance().Error(TAG, "Unable to map {} at 0x{:X}: {}", path, offset,
                                    std::strerror(os_error));
        return (os_error == EACCES || os_error == EPERM) ? GpioError::PERMISSION_DENIED
                                                         : GpioError::IO_ERROR;
    }

    // The mapping stays valid after the descriptor is closed.
    out.reset(new MemoryRegion(base, size, path));
    return GpioError::SUCCESS;
}

GpioError MemoryRegion::MapAnonymous(size_t size, std::unique_ptr<MemoryRegion>& out,
                                     int& os_error) noexcept {
    os_error = 0;
    void* base = ::mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (base == MAP_FAILED) {
        os_error = errno;
        Logger::GetInstance().Error(TAG, "Anonymous mapping of {} bytes failed: {}", size,
                                    std::strerror(os_error));
        return GpioError::IO_ERROR;
    }
    out.reset(new MemoryRegion(base, size, "anonymous"));
    return GpioError::SUCCESS;
}

} // namespace pipal
