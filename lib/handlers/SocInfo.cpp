/**
 * @file SocInfo.cpp
 * @brief SoC detection from the device tree and /proc/cpuinfo.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "SocInfo.h"

#include <array>
#include <cstdio>
#include <string>

#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "SocInfo";

namespace {

constexpr const char* kCompatiblePath = "/proc/device-tree/compatible";
constexpr const char* kRangesPath = "/proc/device-tree/soc/ranges";
constexpr const char* kCpuinfoPath = "/proc/cpuinfo";

bool ReadWholeFile(const char* path, std::string& out) noexcept {
    FILE* fp = std::fopen(path, "rb");
    if (fp == nullptr) {
        return false;
    }
    out.clear();
    std::array<char, 512> buf{};
    size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), fp)) > 0) {
        out.append(buf.data(), n);
    }
    std::fclose(fp);
    return true;
}

/// Big-endian 32-bit cell at @p offset of a device-tree `ranges` property.
uint32_t ReadRangesCell(const char* path, long offset) noexcept {
    uint32_t address = 0;
    FILE* fp = std::fopen(path, "rb");
    if (fp == nullptr) {
        return 0;
    }
    std::array<uint8_t, 4> buf{};
    if (std::fseek(fp, offset, SEEK_SET) == 0 &&
        std::fread(buf.data(), 1, buf.size(), fp) == buf.size()) {
        address = static_cast<uint32_t>(buf[0]) << 24 | static_cast<uint32_t>(buf[1]) << 16 |
                  static_cast<uint32_t>(buf[2]) << 8 | static_cast<uint32_t>(buf[3]);
    }
    std::fclose(fp);
    return address;
}

SocModel ModelFromChipName(std::string_view name) noexcept {
    if (name == "bcm2711" || name == "BCM2711") return SocModel::BCM2711;
    if (name == "bcm2837" || name == "BCM2837" || name == "BCM2710") return SocModel::BCM2837;
    if (name == "bcm2836" || name == "BCM2836" || name == "BCM2709") return SocModel::BCM2836;
    if (name == "bcm2835" || name == "BCM2835" || name == "BCM2708") return SocModel::BCM2835;
    return SocModel::UNKNOWN;
}

std::string_view Trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

} // namespace

//==============================================================================
// PARSING
//==============================================================================

SocModel SocInfo::ParseCompatible(std::string_view contents) noexcept {
    constexpr std::string_view kVendor = "brcm,";
    while (!contents.empty()) {
        size_t end = contents.find('\0');
        std::string_view entry = contents.substr(0, end);
        if (entry.substr(0, kVendor.size()) == kVendor) {
            SocModel model = ModelFromChipName(entry.substr(kVendor.size()));
            if (model != SocModel::UNKNOWN) {
                return model;
            }
        }
        if (end == std::string_view::npos) break;
        contents.remove_prefix(end + 1);
    }
    return SocModel::UNKNOWN;
}

SocModel SocInfo::ParseCpuinfo(std::string_view contents) noexcept {
    constexpr std::string_view kKey = "Hardware";
    while (!contents.empty()) {
        size_t end = contents.find('\n');
        std::string_view line = contents.substr(0, end);
        if (line.substr(0, kKey.size()) == kKey) {
            size_t colon = line.find(':');
            if (colon != std::string_view::npos) {
                return ModelFromChipName(Trim(line.substr(colon + 1)));
            }
        }
        if (end == std::string_view::npos) break;
        contents.remove_prefix(end + 1);
    }
    return SocModel::UNKNOWN;
}

//==============================================================================
// DETECTION
//==============================================================================

uint64_t SocInfo::DefaultPeripheralBase(SocModel model) noexcept {
    switch (model) {
        case SocModel::BCM2835: return 0x20000000;
        case SocModel::BCM2836:
        case SocModel::BCM2837: return 0x3F000000;
        case SocModel::BCM2711: return 0xFE000000;
        default: return 0;
    }
}

SocInfo SocInfo::FromModel(SocModel model) noexcept {
    SocInfo info;
    info.model = model;
    info.peripheral_base = DefaultPeripheralBase(model);
    return info;
}

GpioError SocInfo::Detect(SocInfo& out) noexcept {
    SocModel model = SocModel::UNKNOWN;
    std::string contents;

    if (ReadWholeFile(kCompatiblePath, contents)) {
        model = ParseCompatible(contents);
    }
    if (model == SocModel::UNKNOWN && ReadWholeFile(kCpuinfoPath, contents)) {
        model = ParseCpuinfo(contents);
    }
    if (model == SocModel::UNKNOWN) {
        Logger::GetInstance().Error(TAG, "Unable to identify the SoC");
        return GpioError::UNKNOWN_PERIPHERAL;
    }

    out = FromModel(model);

    // 32-bit parent address at cell 1; 64-bit parents (BCM2711) use cell 2.
    uint64_t base = ReadRangesCell(kRangesPath, 4);
    if (base == 0) {
        base = ReadRangesCell(kRangesPath, 8);
    }
    if (base != 0 && base != 0xFFFFFFFF) {
        out.peripheral_base = base;
    }

    Logger::GetInstance().Info(TAG, "Detected {} (peripheral base 0x{:08X})",
                               SocModelToString(out.model), out.peripheral_base);
    return GpioError::SUCCESS;
}

} // namespace pipal
