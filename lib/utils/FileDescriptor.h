/**
 * @file FileDescriptor.h
 * @brief Move-only owner of a POSIX file descriptor.
 *
 * @author PiPal Team
 * @date 2026
 */

#ifndef PIPAL_FILE_DESCRIPTOR_H_
#define PIPAL_FILE_DESCRIPTOR_H_

#include <unistd.h>

namespace pipal {

class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.Release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            Reset(other.Release());
        }
        return *this;
    }

    ~FileDescriptor() { Reset(); }

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool IsValid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return IsValid(); }

    /// Give up ownership without closing.
    int Release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    /// Close the owned descriptor (if any) and take ownership of @p fd.
    void Reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

} // namespace pipal

#endif // PIPAL_FILE_DESCRIPTOR_H_
