/**
 * @file RegisterMap.h
 * @brief Memory-mapped view of the Broadcom GPIO register block.
 *
 * @details
 * RegisterMap encodes and decodes the per-line bit fields of the GPIO
 * peripheral directly against mapped memory. No call issues a syscall, which
 * is what makes toggling a line from user space cheap.
 *
 * ## Register layout (32-bit word index from the GPIO base)
 *
 * | Word  | Register                    | Field per line             |
 * |-------|-----------------------------|----------------------------|
 * | 0-5   | GPFSEL0-5                   | 3 bits, 10 lines per word  |
 * | 7-8   | GPSET0-1 (write 1 to set)   | 1 bit                      |
 * | 10-11 | GPCLR0-1 (write 1 to clear) | 1 bit                      |
 * | 13-14 | GPLEV0-1                    | 1 bit                      |
 * | 37    | GPPUD (BCM283x)             | pull value to clock in     |
 * | 38-39 | GPPUDCLK0-1 (BCM283x)       | 1 bit                      |
 * | 57-60 | GPIO_PUP_PDN_CNTRL (BCM2711)| 2 bits, 16 lines per word  |
 *
 * ## Thread safety
 *
 * GPFSEL and GPIO_PUP_PDN_CNTRL pack several lines into one word, so
 * WriteMode() and SetPull() are read-modify-write sequences serialized by a
 * single register mutex. The mutex is process-wide rather than per map: pins
 * may keep an earlier mapping alive while a later facade maps the same block
 * again, and both views must share one lock. The GPPUD clocking sequence is a
 * multi-step protocol and runs under the same mutex. SetOutput() only writes a single bit mask
 * into a write-1 register and ReadLevel()/ReadMode() are single aligned
 * loads, so they take no lock.
 *
 * The pull state cannot be read back on BCM283x; RegisterMap keeps a shadow
 * copy of the last value written for each line.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_REGISTER_MAP_H_
#define PIPAL_REGISTER_MAP_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "core/GpioConfig.h"
#include "core/GpioTypes.h"
#include "handlers/MemoryRegion.h"
#include "handlers/SocInfo.h"

namespace pipal {

class RegisterMap {
public:
    //==========================================================================
    // REGISTER OFFSETS (32-bit word index)
    //==========================================================================

    static constexpr size_t kGpfsel0 = 0x00 / 4;
    static constexpr size_t kGpset0 = 0x1C / 4;
    static constexpr size_t kGpclr0 = 0x28 / 4;
    static constexpr size_t kGplev0 = 0x34 / 4;
    static constexpr size_t kGppud = 0x94 / 4;
    static constexpr size_t kGppudclk0 = 0x98 / 4;
    static constexpr size_t kGpioPupPdnCntrl0 = 0xE4 / 4;

    /// Mapping length; covers every register above.
    static constexpr size_t kBlockSize = 4096;

    //==========================================================================
    // CONSTRUCTION
    //==========================================================================

    /**
     * @brief Map the GPIO block of the running SoC.
     *
     * Tries `config.gpiomem_path` (offset 0) first, then `config.mem_path` at
     * the SoC's GPIO base address.
     *
     * @param soc      Identified SoC.
     * @param config   Device paths and pull settle delay.
     * @param[out] out Register map on success.
     * @param[out] os_error errno of the last failing open/mmap.
     * @return SUCCESS, UNKNOWN_PERIPHERAL, PERMISSION_DENIED or IO_ERROR.
     */
    [[nodiscard]] static GpioError Open(const SocInfo& soc, const GpioConfig& config,
                                        std::unique_ptr<RegisterMap>& out,
                                        int& os_error) noexcept;

    /**
     * @brief Wrap an already mapped region.
     * @param region         At least kBlockSize bytes.
     * @param model          Register layout to use.
     * @param pull_settle_us Delay between GPPUD clocking steps.
     */
    RegisterMap(std::unique_ptr<MemoryRegion> region, SocModel model,
                uint32_t pull_settle_us = 5) noexcept;

    RegisterMap(const RegisterMap&) = delete;
    RegisterMap& operator=(const RegisterMap&) = delete;

    ~RegisterMap() = default;

    //==========================================================================
    // LINE OPERATIONS
    //==========================================================================

    [[nodiscard]] Mode ReadMode(uint8_t line) const noexcept;
    void WriteMode(uint8_t line, Mode mode) noexcept;

    [[nodiscard]] Level ReadLevel(uint8_t line) const noexcept;
    void SetOutput(uint8_t line, Level level) noexcept;

    void SetPull(uint8_t line, PullUpDown pull) noexcept;
    [[nodiscard]] PullUpDown ReadPull(uint8_t line) const noexcept;

    //==========================================================================
    // INTROSPECTION
    //==========================================================================

    /** @brief Raw register word; 0 for an index outside the mapping. */
    [[nodiscard]] uint32_t ReadRegister(size_t word_index) const noexcept;

    [[nodiscard]] SocModel GetModel() const noexcept { return model_; }
    [[nodiscard]] const std::string& GetSource() const noexcept { return region_->Source(); }

private:
    void WriteRegister(size_t word_index, uint32_t value) noexcept;

    void SetPullClocked(uint8_t line, PullUpDown pull) noexcept;
    void SetPullControlRegister(uint8_t line, PullUpDown pull) noexcept;

    std::unique_ptr<MemoryRegion> region_;
    volatile uint32_t* regs_;
    SocModel model_;
    uint32_t pull_settle_us_;

    /// Shared by every RegisterMap in the process.
    static std::mutex register_mutex_;
    std::array<PullUpDown, kMaxLines> pull_shadow_{};
};

} // namespace pipal

#endif // PIPAL_REGISTER_MAP_H_
