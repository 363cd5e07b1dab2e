/**
 * @file RegisterMap.cpp
 * @brief Bit-field encoding of the Broadcom GPIO registers.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "RegisterMap.h"

#include <chrono>
#include <cstring>
#include <thread>
#include <utility>

#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "RegisterMap";

namespace {

// GPPUD values (BCM2835 - BCM2837)
constexpr uint32_t kGppudOff = 0b00;
constexpr uint32_t kGppudDown = 0b01;
constexpr uint32_t kGppudUp = 0b10;

// GPIO_PUP_PDN_CNTRL values (BCM2711)
constexpr uint32_t kCntrlNone = 0b00;
constexpr uint32_t kCntrlUp = 0b01;
constexpr uint32_t kCntrlDown = 0b10;

uint32_t ToGppud(PullUpDown pull) noexcept {
    switch (pull) {
        case PullUpDown::PULL_DOWN: return kGppudDown;
        case PullUpDown::PULL_UP: return kGppudUp;
        default: return kGppudOff;
    }
}

uint32_t ToCntrl(PullUpDown pull) noexcept {
    switch (pull) {
        case PullUpDown::PULL_DOWN: return kCntrlDown;
        case PullUpDown::PULL_UP: return kCntrlUp;
        default: return kCntrlNone;
    }
}

PullUpDown FromCntrl(uint32_t value) noexcept {
    switch (value) {
        case kCntrlUp: return PullUpDown::PULL_UP;
        case kCntrlDown: return PullUpDown::PULL_DOWN;
        default: return PullUpDown::OFF;
    }
}

} // namespace

//==============================================================================
// CONSTRUCTION
//==============================================================================

std::mutex RegisterMap::register_mutex_;

GpioError RegisterMap::Open(const SocInfo& soc, const GpioConfig& config,
                            std::unique_ptr<RegisterMap>& out, int& os_error) noexcept {
    os_error = 0;
    if (!soc.IsKnown()) {
        Logger::GetInstance().Error(TAG, "Cannot map registers of an unknown SoC");
        return GpioError::UNKNOWN_PERIPHERAL;
    }

    std::unique_ptr<MemoryRegion> region;
    GpioError gpiomem_result =
        MemoryRegion::MapDevice(config.gpiomem_path, 0, kBlockSize, region, os_error);

    if (gpiomem_result != GpioError::SUCCESS) {
        Logger::GetInstance().Warn(TAG, "{} unavailable ({}), falling back to {}",
                                   config.gpiomem_path, std::strerror(os_error), config.mem_path);
        GpioError mem_result = MemoryRegion::MapDevice(config.mem_path, soc.GpioBaseAddress(),
                                                       kBlockSize, region, os_error);
        if (mem_result != GpioError::SUCCESS) {
            Logger::GetInstance().Error(TAG, "Unable to map GPIO registers: {}",
                                        std::strerror(os_error));
            if (gpiomem_result == GpioError::PERMISSION_DENIED ||
                mem_result == GpioError::PERMISSION_DENIED) {
                return GpioError::PERMISSION_DENIED;
            }
            return GpioError::IO_ERROR;
        }
    }

    Logger::GetInstance().Info(TAG, "Mapped {} register block from {}", SocModelToString(soc.model),
                               region->Source());
    out = std::make_unique<RegisterMap>(std::move(region), soc.model, config.pull_settle_us);
    return GpioError::SUCCESS;
}

RegisterMap::RegisterMap(std::unique_ptr<MemoryRegion> region, SocModel model,
                         uint32_t pull_settle_us) noexcept
    : region_(std::move(region)),
      regs_(region_->Words()),
      model_(model),
      pull_settle_us_(pull_settle_us) {
    pull_shadow_.fill(PullUpDown::OFF);
}

//==============================================================================
// MODE
//==============================================================================

Mode RegisterMap::ReadMode(uint8_t line) const noexcept {
    if (line >= kMaxLines) {
        return Mode::INPUT;
    }
    const size_t word = kGpfsel0 + line / 10;
    const uint32_t shift = (line % 10) * 3;
    return static_cast<Mode>((regs_[word] >> shift) & 0b111);
}

void RegisterMap::WriteMode(uint8_t line, Mode mode) noexcept {
    if (line >= kMaxLines) {
        return;
    }
    const size_t word = kGpfsel0 + line / 10;
    const uint32_t shift = (line % 10) * 3;

    std::lock_guard<std::mutex> lock(register_mutex_);
    uint32_t value = regs_[word];
    value &= ~(0b111u << shift);
    value |= static_cast<uint32_t>(mode) << shift;
    regs_[word] = value;
}

//==============================================================================
// LEVEL
//==============================================================================

Level RegisterMap::ReadLevel(uint8_t line) const noexcept {
    if (line >= kMaxLines) {
        return Level::LOW;
    }
    const uint32_t value = regs_[kGplev0 + line / 32];
    return ((value >> (line % 32)) & 1u) != 0 ? Level::HIGH : Level::LOW;
}

void RegisterMap::SetOutput(uint8_t line, Level level) noexcept {
    if (line >= kMaxLines) {
        return;
    }
    const size_t base = (level == Level::HIGH) ? kGpset0 : kGpclr0;
    WriteRegister(base + line / 32, 1u << (line % 32));
}

//==============================================================================
// PULL-UP / PULL-DOWN
//==============================================================================

void RegisterMap::SetPull(uint8_t line, PullUpDown pull) noexcept {
    if (line >= kMaxLines) {
        return;
    }
    std::lock_guard<std::mutex> lock(register_mutex_);
    if (model_ == SocModel::BCM2711) {
        SetPullControlRegister(line, pull);
    } else {
        SetPullClocked(line, pull);
    }
    pull_shadow_[line] = pull;
}

PullUpDown RegisterMap::ReadPull(uint8_t line) const noexcept {
    if (line >= kMaxLines) {
        return PullUpDown::OFF;
    }
    if (model_ == SocModel::BCM2711) {
        const uint32_t value = regs_[kGpioPupPdnCntrl0 + line / 16];
        return FromCntrl((value >> ((line % 16) * 2)) & 0b11);
    }
    std::lock_guard<std::mutex> lock(register_mutex_);
    return pull_shadow_[line];
}

// BCM283x: write the control value, clock it into the line, then remove both.
void RegisterMap::SetPullClocked(uint8_t line, PullUpDown pull) noexcept {
    const auto settle = std::chrono::microseconds(pull_settle_us_);
    const size_t clk_word = kGppudclk0 + line / 32;

    WriteRegister(kGppud, ToGppud(pull));
    std::this_thread::sleep_for(settle);
    WriteRegister(clk_word, 1u << (line % 32));
    std::this_thread::sleep_for(settle);
    WriteRegister(kGppud, kGppudOff);
    WriteRegister(clk_word, 0);
}

void RegisterMap::SetPullControlRegister(uint8_t line, PullUpDown pull) noexcept {
    const size_t word = kGpioPupPdnCntrl0 + line / 16;
    const uint32_t shift = (line % 16) * 2;
    uint32_t value = regs_[word];
    value &= ~(0b11u << shift);
    value |= ToCntrl(pull) << shift;
    regs_[word] = value;
}

//==============================================================================
// RAW ACCESS
//==============================================================================

uint32_t RegisterMap::ReadRegister(size_t word_index) const noexcept {
    if (word_index >= region_->WordCount()) {
        return 0;
    }
    return regs_[word_index];
}

void RegisterMap::WriteRegister(size_t word_index, uint32_t value) noexcept {
    regs_[word_index] = value;
}

} // namespace pipal
