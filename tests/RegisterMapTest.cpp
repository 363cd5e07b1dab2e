/**
 * @file RegisterMapTest.cpp
 * @brief Register encoding tests against a simulated GPIO block
 *
 * Covers:
 *   - GPFSEL mode round-trip on every line without bleeding into neighbours
 *   - concurrent writes to neighbouring lines through two mappings of one block
 *   - GPSET / GPCLR / GPLEV bit placement on both banks
 *   - BCM2711 pull control fields and BCM283x GPPUD clocking
 *   - Open() failure mapping
 *
 * @author PiPal Team
 * @date 2026
 */

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <thread>
#include <unistd.h>

#include "TestFramework.h"
#include "handlers/MemoryRegion.h"
#include "handlers/RegisterMap.h"
#include "support/SimulatedPeripheral.h"

using namespace pipal;
using pipal::test::SimulatedPeripheral;

static const char* TAG = "RegisterMapTest";
static TestResults g_test_results;

static constexpr std::array<Mode, 8> kAllModes = {Mode::INPUT, Mode::OUTPUT, Mode::ALT0,
                                                  Mode::ALT1,  Mode::ALT2,   Mode::ALT3,
                                                  Mode::ALT4,  Mode::ALT5};

// ── Tests ─────────────────────────────────────────────────────────────────

static bool test_mode_field_encoding() noexcept {
  SimulatedPeripheral sim;
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  regs->WriteMode(17, Mode::OUTPUT);
  TEST_CHECK(((sim.Word(RegisterMap::kGpfsel0 + 1) >> 21) & 0b111) == 0b001);

  regs->WriteMode(4, Mode::ALT0);
  TEST_CHECK(((sim.Word(RegisterMap::kGpfsel0) >> 12) & 0b111) == 0b100);

  regs->WriteMode(53, Mode::ALT5);
  TEST_CHECK(((sim.Word(RegisterMap::kGpfsel0 + 5) >> 9) & 0b111) == 0b010);
  return true;
}

static bool test_mode_round_trip_without_bleed() noexcept {
  SimulatedPeripheral sim;
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  // Background pattern: every line gets a distinct mode.
  for (uint8_t line = 0; line < kMaxLines; ++line) {
    regs->WriteMode(line, kAllModes[line % kAllModes.size()]);
  }

  for (uint8_t line = 0; line < kMaxLines; ++line) {
    for (Mode mode : kAllModes) {
      regs->WriteMode(line, mode);
      TEST_CHECK(regs->ReadMode(line) == mode);
      if (line > 0) {
        TEST_CHECK(regs->ReadMode(line - 1) == kAllModes[(line - 1) % kAllModes.size()]);
      }
      if (line + 1 < kMaxLines) {
        TEST_CHECK(regs->ReadMode(line + 1) == kAllModes[(line + 1) % kAllModes.size()]);
      }
    }
    regs->WriteMode(line, kAllModes[line % kAllModes.size()]);
  }
  return true;
}

// Two mappings of one backing file: a later facade maps the block again while
// pins still hold the earlier mapping. Lines 10 and 11 share GPFSEL1.
static bool test_concurrent_neighbour_writes_across_mappings() noexcept {
  char path[] = "/tmp/pipal-gpfsel-XXXXXX";
  const int fd = ::mkstemp(path);
  TEST_CHECK(fd >= 0);
  const bool sized = ::ftruncate(fd, RegisterMap::kBlockSize) == 0;
  ::close(fd);

  std::unique_ptr<MemoryRegion> region_a;
  std::unique_ptr<MemoryRegion> region_b;
  int os_error = 0;
  const GpioError map_a =
      MemoryRegion::MapDevice(path, 0, RegisterMap::kBlockSize, region_a, os_error);
  const GpioError map_b =
      MemoryRegion::MapDevice(path, 0, RegisterMap::kBlockSize, region_b, os_error);
  ::unlink(path);
  TEST_CHECK(sized);
  TEST_CHECK(map_a == GpioError::SUCCESS);
  TEST_CHECK(map_b == GpioError::SUCCESS);
  TEST_CHECK(region_a->SizeBytes() == RegisterMap::kBlockSize);

  RegisterMap earlier(std::move(region_a), SocModel::BCM2837, 0);
  RegisterMap later(std::move(region_b), SocModel::BCM2837, 0);

  constexpr int kIterations = 200000;
  std::atomic<bool> go{false};
  std::atomic<int> line10_mismatches{0};
  std::thread toggler([&]() {
    while (!go.load()) {
      std::this_thread::yield();
    }
    for (int i = 0; i < kIterations; ++i) {
      const Mode mode = (i % 2 == 0) ? Mode::OUTPUT : Mode::ALT0;
      earlier.WriteMode(10, mode);
      if (earlier.ReadMode(10) != mode) {
        line10_mismatches.fetch_add(1);
      }
    }
  });

  int line11_mismatches = 0;
  go.store(true);
  for (int i = 0; i < kIterations; ++i) {
    const Mode mode = kAllModes[i % kAllModes.size()];
    later.WriteMode(11, mode);
    if (later.ReadMode(11) != mode) {
      ++line11_mismatches;
    }
  }
  toggler.join();

  TEST_CHECK(line10_mismatches.load() == 0);
  TEST_CHECK(line11_mismatches == 0);
  TEST_CHECK(later.ReadMode(10) == Mode::ALT0);
  TEST_CHECK(earlier.ReadMode(11) == kAllModes[(kIterations - 1) % kAllModes.size()]);
  TEST_CHECK(later.ReadMode(12) == Mode::INPUT);
  return true;
}

static bool test_output_set_and_clear_registers() noexcept {
  SimulatedPeripheral sim;
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  regs->SetOutput(17, Level::HIGH);
  TEST_CHECK(sim.Word(RegisterMap::kGpset0) == (1u << 17));
  TEST_CHECK(sim.Word(RegisterMap::kGpclr0) == 0);

  regs->SetOutput(40, Level::LOW);
  TEST_CHECK(sim.Word(RegisterMap::kGpclr0 + 1) == (1u << 8));
  TEST_CHECK(sim.Word(RegisterMap::kGpset0 + 1) == 0);
  return true;
}

static bool test_level_register_read() noexcept {
  SimulatedPeripheral sim;
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  sim.SetInputLevel(45, Level::HIGH);
  sim.SetInputLevel(3, Level::HIGH);
  TEST_CHECK(regs->ReadLevel(45) == Level::HIGH);
  TEST_CHECK(regs->ReadLevel(44) == Level::LOW);
  TEST_CHECK(regs->ReadLevel(3) == Level::HIGH);
  TEST_CHECK(regs->ReadLevel(35) == Level::LOW);
  return true;
}

static bool test_bcm2711_pull_fields() noexcept {
  SimulatedPeripheral sim(SocModel::BCM2711);
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  regs->SetPull(18, PullUpDown::PULL_UP);
  regs->SetPull(19, PullUpDown::PULL_DOWN);
  const uint32_t word = sim.Word(RegisterMap::kGpioPupPdnCntrl0 + 1);
  TEST_CHECK(((word >> 4) & 0b11) == 0b01);
  TEST_CHECK(((word >> 6) & 0b11) == 0b10);
  TEST_CHECK(regs->ReadPull(18) == PullUpDown::PULL_UP);
  TEST_CHECK(regs->ReadPull(19) == PullUpDown::PULL_DOWN);
  TEST_CHECK(regs->ReadPull(17) == PullUpDown::OFF);

  regs->SetPull(18, PullUpDown::OFF);
  TEST_CHECK(regs->ReadPull(18) == PullUpDown::OFF);
  TEST_CHECK(regs->ReadPull(19) == PullUpDown::PULL_DOWN);
  return true;
}

static bool test_bcm283x_pull_clocking() noexcept {
  SimulatedPeripheral sim(SocModel::BCM2835);
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  regs->SetPull(5, PullUpDown::PULL_DOWN);
  // The sequence ends with both control registers cleared.
  TEST_CHECK(sim.Word(RegisterMap::kGppud) == 0);
  TEST_CHECK(sim.Word(RegisterMap::kGppudclk0) == 0);
  TEST_CHECK(regs->ReadPull(5) == PullUpDown::PULL_DOWN);

  regs->SetPull(38, PullUpDown::PULL_UP);
  TEST_CHECK(regs->ReadPull(38) == PullUpDown::PULL_UP);
  TEST_CHECK(regs->ReadPull(5) == PullUpDown::PULL_DOWN);
  // No BCM2711 field is touched on older chips.
  TEST_CHECK(sim.Word(RegisterMap::kGpioPupPdnCntrl0 + 2) == 0);
  return true;
}

static bool test_read_register_bounds() noexcept {
  SimulatedPeripheral sim;
  auto regs = sim.TakeRegisterMap();
  TEST_CHECK(regs != nullptr);

  regs->WriteMode(0, Mode::OUTPUT);
  TEST_CHECK(regs->ReadRegister(RegisterMap::kGpfsel0) == 0b001);
  TEST_CHECK(regs->ReadRegister(RegisterMap::kBlockSize) == 0);
  TEST_CHECK(regs->GetModel() == SocModel::BCM2837);
  return true;
}

static bool test_open_unknown_soc() noexcept {
  std::unique_ptr<RegisterMap> regs;
  int os_error = 0;
  TEST_CHECK(RegisterMap::Open(SocInfo{}, GpioConfig{}, regs, os_error) ==
             GpioError::UNKNOWN_PERIPHERAL);
  TEST_CHECK(regs == nullptr);
  return true;
}

static bool test_open_missing_devices() noexcept {
  GpioConfig config;
  config.gpiomem_path = "/nonexistent/pipal/gpiomem";
  config.mem_path = "/nonexistent/pipal/mem";

  std::unique_ptr<RegisterMap> regs;
  int os_error = 0;
  TEST_CHECK(RegisterMap::Open(SocInfo::FromModel(SocModel::BCM2711), config, regs, os_error) ==
             GpioError::IO_ERROR);
  TEST_CHECK(os_error == ENOENT);
  TEST_CHECK(regs == nullptr);
  return true;
}

static bool test_map_device_reports_errno() noexcept {
  std::unique_ptr<MemoryRegion> region;
  int os_error = 0;
  TEST_CHECK(MemoryRegion::MapDevice("/nonexistent/pipal/gpiomem", 0, 4096, region, os_error) ==
             GpioError::IO_ERROR);
  TEST_CHECK(os_error == ENOENT);

  TEST_CHECK(MemoryRegion::MapAnonymous(4096, region, os_error) == GpioError::SUCCESS);
  TEST_CHECK(region->WordCount() == 1024);
  TEST_CHECK(region->Words()[0] == 0);
  return true;
}

// ── Entry Point ───────────────────────────────────────────────────────────

int main() {
  RUN_TEST(test_mode_field_encoding);
  RUN_TEST(test_mode_round_trip_without_bleed);
  RUN_TEST(test_concurrent_neighbour_writes_across_mappings);
  RUN_TEST(test_output_set_and_clear_registers);
  RUN_TEST(test_level_register_read);
  RUN_TEST(test_bcm2711_pull_fields);
  RUN_TEST(test_bcm283x_pull_clocking);
  RUN_TEST(test_read_register_bounds);
  RUN_TEST(test_open_unknown_soc);
  RUN_TEST(test_open_missing_devices);
  RUN_TEST(test_map_device_reports_errno);

  print_test_summary(g_test_results, "REGISTER MAP", TAG);
  return test_exit_code(g_test_results);
}
