/**
 * @file SimulatedPeripheral.h
 * @brief In-process stand-in for the GPIO register block and the GPIO chip.
 *
 * @details The register block is an anonymous mapping, so RegisterMap runs
 *          its real encoding against plain memory and tests inspect the raw
 *          words. Edge descriptors are pipes: every RequestLineEvent() opens a
 *          new pipe, hands out the read end and keeps the write end, into
 *          which Emit() writes `struct gpioevent_data` records exactly as the
 *          kernel would.
 *
 * @author PiPal Team
 * @date 2026
 */

#pragma once

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <fcntl.h>
#include <linux/gpio.h>
#include <memory>
#include <mutex>
#include <unistd.h>

#include "api/Gpio.h"
#include "handlers/BaseLineEventSource.h"
#include "handlers/MemoryRegion.h"
#include "handlers/RegisterMap.h"

namespace pipal {
namespace test {

/// Write ends of the pipes handed out for each line.
struct EventChannels {
  std::mutex mutex;
  std::array<int, kMaxLines> write_fds;
  std::array<Trigger, kMaxLines> triggers;
  std::atomic<int> requests{0};
  std::atomic<bool> fail_requests{false};
  uint64_t timestamp_ns{0};

  EventChannels() noexcept {
    write_fds.fill(-1);
    triggers.fill(Trigger::DISABLED);
  }

  ~EventChannels() {
    for (int fd : write_fds) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }
};

class PipeEventSource : public BaseLineEventSource {
public:
  explicit PipeEventSource(std::shared_ptr<EventChannels> channels) noexcept
      : channels_(std::move(channels)) {}

  GpioError RequestLineEvent(uint8_t line, Trigger trigger,
                             FileDescriptor& out_fd) noexcept override {
    if (trigger == Trigger::DISABLED) {
      return GpioError::INVALID_PARAMETER;
    }
    if (line >= kMaxLines) {
      return GpioError::INVALID_LINE;
    }
    if (channels_->fail_requests.load()) {
      last_os_error_ = EBUSY;
      return GpioError::IO_ERROR;
    }
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      last_os_error_ = errno;
      return GpioError::IO_ERROR;
    }
    std::lock_guard<std::mutex> lock(channels_->mutex);
    if (channels_->write_fds[line] >= 0) {
      ::close(channels_->write_fds[line]);
    }
    channels_->write_fds[line] = fds[1];
    channels_->triggers[line] = trigger;
    channels_->requests.fetch_add(1);
    last_os_error_ = 0;
    out_fd.Reset(fds[0]);
    return GpioError::SUCCESS;
  }

  int GetLastOsError() const noexcept override { return last_os_error_; }
  const char* GetName() const noexcept override { return "simulated-gpiochip"; }

private:
  std::shared_ptr<EventChannels> channels_;
  int last_os_error_{0};
};

class SimulatedPeripheral {
public:
  explicit SimulatedPeripheral(SocModel model = SocModel::BCM2837) noexcept
      : model_(model), channels_(std::make_shared<EventChannels>()) {
    // Emit() into a pipe whose reader was closed must fail, not kill the test.
    std::signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<MemoryRegion> region;
    int os_error = 0;
    if (MemoryRegion::MapAnonymous(RegisterMap::kBlockSize, region, os_error) ==
        GpioError::SUCCESS) {
      words_ = region->Words();
      registers_ = std::make_unique<RegisterMap>(std::move(region), model, 0);
    }
  }

  [[nodiscard]] bool IsValid() const noexcept { return words_ != nullptr; }
  [[nodiscard]] SocModel GetModel() const noexcept { return model_; }

  //--------------------------------------------------------------------------
  // Ownership hand-off
  //--------------------------------------------------------------------------

  [[nodiscard]] std::unique_ptr<RegisterMap> TakeRegisterMap() noexcept {
    return std::move(registers_);
  }

  [[nodiscard]] std::unique_ptr<BaseLineEventSource> MakeEventSource() const noexcept {
    return std::make_unique<PipeEventSource>(channels_);
  }

  [[nodiscard]] GpioBackend TakeBackend() noexcept {
    GpioBackend backend;
    backend.registers = TakeRegisterMap();
    backend.events = MakeEventSource();
    backend.soc = SocInfo::FromModel(model_);
    return backend;
  }

  //--------------------------------------------------------------------------
  // Register access
  //--------------------------------------------------------------------------

  [[nodiscard]] uint32_t Word(size_t index) const noexcept { return words_[index]; }
  void SetWord(size_t index, uint32_t value) noexcept { words_[index] = value; }

  /// Drive the simulated input level of @p line.
  void SetInputLevel(uint8_t line, Level level) noexcept {
    const size_t index = RegisterMap::kGplev0 + line / 32;
    const uint32_t mask = 1u << (line % 32);
    words_[index] = (level == Level::HIGH) ? (words_[index] | mask) : (words_[index] & ~mask);
  }

  //--------------------------------------------------------------------------
  // Edge injection
  //--------------------------------------------------------------------------

  /// Queue one edge on @p line; false if the line has no open event pipe.
  bool Emit(uint8_t line, Level level) noexcept {
    std::lock_guard<std::mutex> lock(channels_->mutex);
    const int fd = channels_->write_fds[line];
    if (fd < 0) {
      return false;
    }
    struct gpioevent_data data {};
    data.timestamp = ++channels_->timestamp_ns;
    data.id = (level == Level::HIGH) ? GPIOEVENT_EVENT_RISING_EDGE : GPIOEVENT_EVENT_FALLING_EDGE;
    return ::write(fd, &data, sizeof(data)) == static_cast<ssize_t>(sizeof(data));
  }

  /// Close the writer of @p line so its reader sees end of stream.
  void CloseEventStream(uint8_t line) noexcept {
    std::lock_guard<std::mutex> lock(channels_->mutex);
    if (channels_->write_fds[line] >= 0) {
      ::close(channels_->write_fds[line]);
      channels_->write_fds[line] = -1;
    }
  }

  void FailRequests(bool fail) noexcept { channels_->fail_requests.store(fail); }

  [[nodiscard]] int RequestCount() const noexcept { return channels_->requests.load(); }

  [[nodiscard]] Trigger RequestedTrigger(uint8_t line) noexcept {
    std::lock_guard<std::mutex> lock(channels_->mutex);
    return channels_->triggers[line];
  }

private:
  SocModel model_;
  std::shared_ptr<EventChannels> channels_;
  std::unique_ptr<RegisterMap> registers_;
  volatile uint32_t* words_{nullptr};
};

} // namespace test
} // namespace pipal
