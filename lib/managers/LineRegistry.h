/**
 * @file LineRegistry.h
 * @brief Process-wide exclusivity flags for the facade and every GPIO line.
 *
 * @details Both the facade instance and each line are guarded by a single
 *          atomic flag claimed with compare-and-set. Claims never block: a
 *          losing caller is told immediately. LineToken is the move-only
 *          RAII proof of a line claim and releases it on destruction.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_LINE_REGISTRY_H_
#define PIPAL_LINE_REGISTRY_H_

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "core/GpioTypes.h"

namespace pipal {

class LineRegistry;

//==============================================================================
// LINE TOKEN
//==============================================================================

class LineToken {
public:
    LineToken() noexcept = default;
    ~LineToken() { Reset(); }

    LineToken(const LineToken&) = delete;
    LineToken& operator=(const LineToken&) = delete;

    LineToken(LineToken&& other) noexcept;
    LineToken& operator=(LineToken&& other) noexcept;

    [[nodiscard]] bool IsValid() const noexcept { return registry_ != nullptr; }
    [[nodiscard]] uint8_t GetLine() const noexcept { return line_; }

    /// Return the line to the registry; no-op on an empty token.
    void Reset() noexcept;

private:
    friend class LineRegistry;
    LineToken(LineRegistry* registry, uint8_t line) noexcept : registry_(registry), line_(line) {}

    LineRegistry* registry_{nullptr};
    uint8_t line_{0};
};

//==============================================================================
// LINE REGISTRY
//==============================================================================

class LineRegistry {
public:
    [[nodiscard]] static LineRegistry& GetInstance() noexcept;

    LineRegistry(const LineRegistry&) = delete;
    LineRegistry& operator=(const LineRegistry&) = delete;

    // Facade instance
    [[nodiscard]] bool TryClaimInstance() noexcept;
    void ReleaseInstance() noexcept;
    [[nodiscard]] bool IsInstanceClaimed() const noexcept;

    // Lines
    [[nodiscard]] bool TryClaimLine(uint8_t line) noexcept;
    void ReleaseLine(uint8_t line) noexcept;
    [[nodiscard]] bool IsLineClaimed(uint8_t line) const noexcept;
    [[nodiscard]] size_t ClaimedLineCount() const noexcept;

    /**
     * @brief Claim @p line and wrap the claim in a token.
     * @return Token, or std::nullopt if the line is out of range or taken.
     */
    [[nodiscard]] std::optional<LineToken> ClaimLine(uint8_t line) noexcept;

    /// Clear every flag. Only for test fixtures with no live facade or pin.
    void ResetForTesting() noexcept;

private:
    LineRegistry() noexcept;

    std::atomic<bool> instance_claimed_{false};
    std::array<std::atomic<bool>, kMaxLines> lines_;
};

} // namespace pipal

#endif // PIPAL_LINE_REGISTRY_H_
