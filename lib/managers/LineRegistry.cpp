/**
 * @file LineRegistry.cpp
 * @brief Compare-and-set claims for the facade and GPIO lines.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "LineRegistry.h"

namespace pipal {

//==============================================================================
// LINE TOKEN
//==============================================================================

LineToken::LineToken(LineToken&& other) noexcept
    : registry_(other.registry_), line_(other.line_) {
    other.registry_ = nullptr;
}

LineToken& LineToken::operator=(LineToken&& other) noexcept {
    if (this != &other) {
        Reset();
        registry_ = other.registry_;
        line_ = other.line_;
        other.registry_ = nullptr;
    }
    return *this;
}

void LineToken::Reset() noexcept {
    if (registry_ != nullptr) {
        registry_->ReleaseLine(line_);
        registry_ = nullptr;
    }
}

//==============================================================================
// LINE REGISTRY
//==============================================================================

LineRegistry::LineRegistry() noexcept {
    for (auto& flag : lines_) {
        flag.store(false);
    }
}

LineRegistry& LineRegistry::GetInstance() noexcept {
    static LineRegistry instance;
    return instance;
}

bool LineRegistry::TryClaimInstance() noexcept {
    bool expected = false;
    return instance_claimed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void LineRegistry::ReleaseInstance() noexcept {
    instance_claimed_.store(false, std::memory_order_release);
}

bool LineRegistry::IsInstanceClaimed() const noexcept {
    return instance_claimed_.load(std::memory_order_acquire);
}

bool LineRegistry::TryClaimLine(uint8_t line) noexcept {
    if (line >= kMaxLines) {
        return false;
    }
    bool expected = false;
    return lines_[line].compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void LineRegistry::ReleaseLine(uint8_t line) noexcept {
    if (line < kMaxLines) {
        lines_[line].store(false, std::memory_order_release);
    }
}

bool LineRegistry::IsLineClaimed(uint8_t line) const noexcept {
    return line < kMaxLines && lines_[line].load(std::memory_order_acquire);
}

size_t LineRegistry::ClaimedLineCount() const noexcept {
    size_t count = 0;
    for (const auto& flag : lines_) {
        if (flag.load(std::memory_order_relaxed)) {
            ++count;
        }
    }
    return count;
}

std::optional<LineToken> LineRegistry::ClaimLine(uint8_t line) noexcept {
    if (!TryClaimLine(line)) {
        return std::nullopt;
    }
    return LineToken(this, line);
}

void LineRegistry::ResetForTesting() noexcept {
    instance_claimed_.store(false);
    for (auto& flag : lines_) {
        flag.store(false);
    }
}

} // namespace pipal
