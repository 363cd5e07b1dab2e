/**
 * @file SocInfoTest.cpp
 * @brief SoC identification and type helper tests
 *
 * Covers:
 *   - device-tree compatible parsing
 *   - /proc/cpuinfo Hardware line parsing (legacy chip names)
 *   - peripheral base and GPIO base addresses per model
 *   - enum to string helpers
 *
 * @author PiPal Team
 * @date 2026
 */

#include <cstring>
#include <string_view>

#include "TestFramework.h"
#include "core/GpioTypes.h"
#include "handlers/SocInfo.h"

using namespace pipal;
using namespace std::literals;

static const char* TAG = "SocInfoTest";
static TestResults g_test_results;

// ── Tests ─────────────────────────────────────────────────────────────────

static bool test_compatible_picks_broadcom_entry() noexcept {
  TEST_CHECK(SocInfo::ParseCompatible("raspberrypi,4-model-b\0brcm,bcm2711\0"sv) ==
             SocModel::BCM2711);
  TEST_CHECK(SocInfo::ParseCompatible("raspberrypi,3-model-b\0brcm,bcm2837\0"sv) ==
             SocModel::BCM2837);
  TEST_CHECK(SocInfo::ParseCompatible("raspberrypi,2-model-b\0brcm,bcm2836\0"sv) ==
             SocModel::BCM2836);
  return true;
}

static bool test_compatible_without_trailing_nul() noexcept {
  return SocInfo::ParseCompatible("brcm,bcm2835"sv) == SocModel::BCM2835;
}

static bool test_compatible_unknown_vendor() noexcept {
  TEST_CHECK(SocInfo::ParseCompatible("ti,am335x-bone\0ti,am33xx\0"sv) == SocModel::UNKNOWN);
  TEST_CHECK(SocInfo::ParseCompatible("brcm,bcm2712\0"sv) == SocModel::UNKNOWN);
  TEST_CHECK(SocInfo::ParseCompatible(""sv) == SocModel::UNKNOWN);
  return true;
}

static bool test_cpuinfo_hardware_line() noexcept {
  constexpr std::string_view kCpuinfo =
      "processor\t: 0\n"
      "model name\t: ARMv7 Processor rev 4 (v7l)\n"
      "\n"
      "Hardware\t: BCM2709\n"
      "Revision\t: a02082\n";
  TEST_CHECK(SocInfo::ParseCpuinfo(kCpuinfo) == SocModel::BCM2836);
  TEST_CHECK(SocInfo::ParseCpuinfo("Hardware : BCM2708\n"sv) == SocModel::BCM2835);
  TEST_CHECK(SocInfo::ParseCpuinfo("Hardware\t: BCM2710\r\n"sv) == SocModel::BCM2837);
  TEST_CHECK(SocInfo::ParseCpuinfo("Hardware\t: BCM2711"sv) == SocModel::BCM2711);
  return true;
}

static bool test_cpuinfo_without_hardware_line() noexcept {
  TEST_CHECK(SocInfo::ParseCpuinfo("processor\t: 0\nBogoMIPS\t: 108.00\n"sv) ==
             SocModel::UNKNOWN);
  TEST_CHECK(SocInfo::ParseCpuinfo("Hardware\t: sun50iw1p1\n"sv) == SocModel::UNKNOWN);
  return true;
}

static bool test_peripheral_base_per_model() noexcept {
  TEST_CHECK(SocInfo::DefaultPeripheralBase(SocModel::BCM2835) == 0x20000000);
  TEST_CHECK(SocInfo::DefaultPeripheralBase(SocModel::BCM2836) == 0x3F000000);
  TEST_CHECK(SocInfo::DefaultPeripheralBase(SocModel::BCM2837) == 0x3F000000);
  TEST_CHECK(SocInfo::DefaultPeripheralBase(SocModel::BCM2711) == 0xFE000000);
  TEST_CHECK(SocInfo::DefaultPeripheralBase(SocModel::UNKNOWN) == 0);
  return true;
}

static bool test_gpio_base_and_pull_registers() noexcept {
  SocInfo pi4 = SocInfo::FromModel(SocModel::BCM2711);
  TEST_CHECK(pi4.IsKnown());
  TEST_CHECK(pi4.GpioBaseAddress() == 0xFE200000);
  TEST_CHECK(pi4.HasPullControlRegisters());

  SocInfo pi3 = SocInfo::FromModel(SocModel::BCM2837);
  TEST_CHECK(pi3.GpioBaseAddress() == 0x3F200000);
  TEST_CHECK(!pi3.HasPullControlRegisters());

  TEST_CHECK(!SocInfo{}.IsKnown());
  return true;
}

static bool test_type_helpers() noexcept {
  TEST_CHECK(std::strcmp(ModeToString(Mode::ALT3), "Alt3") == 0);
  TEST_CHECK(IsAltMode(Mode::ALT0) && IsAltMode(Mode::ALT5));
  TEST_CHECK(!IsAltMode(Mode::INPUT) && !IsAltMode(Mode::OUTPUT));
  TEST_CHECK(InvertLevel(Level::LOW) == Level::HIGH);
  TEST_CHECK(static_cast<uint8_t>(Mode::ALT4) == 0b011);
  TEST_CHECK(static_cast<uint8_t>(Mode::ALT5) == 0b010);
  TEST_CHECK(std::strcmp(GpioErrorToString(GpioError::SUCCESS), "Success") == 0);
  return true;
}

// ── Entry Point ───────────────────────────────────────────────────────────

int main() {
  RUN_TEST(test_compatible_picks_broadcom_entry);
  RUN_TEST(test_compatible_without_trailing_nul);
  RUN_TEST(test_compatible_unknown_vendor);
  RUN_TEST(test_cpuinfo_hardware_line);
  RUN_TEST(test_cpuinfo_without_hardware_line);
  RUN_TEST(test_peripheral_base_per_model);
  RUN_TEST(test_gpio_base_and_pull_registers);
  RUN_TEST(test_type_helpers);

  print_test_summary(g_test_results, "SOC INFO", TAG);
  return test_exit_code(g_test_results);
}
