/**
 * @file Gpio.cpp
 * @brief Facade creation, line checkout and batched interrupt polling.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "Gpio.h"

#include <utility>

#include "handlers/GpioChipDevice.h"
#include "managers/LineRegistry.h"
#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "Gpio";

//==============================================================================
// CREATION
//==============================================================================

GpioError Gpio::Create(std::unique_ptr<Gpio>& out, const GpioConfig& config) noexcept {
    if (LineRegistry::GetInstance().IsInstanceClaimed()) {
        Logger::GetInstance().Warn(TAG, "A Gpio instance already exists");
        return GpioError::INSTANCE_EXISTS;
    }

    GpioBackend backend;
    if (config.soc_override != SocModel::UNKNOWN) {
        backend.soc = SocInfo::FromModel(config.soc_override);
        Logger::GetInstance().Info(TAG, "SoC forced to {}", SocModelToString(config.soc_override));
    } else {
        GpioError result = SocInfo::Detect(backend.soc);
        if (result != GpioError::SUCCESS) {
            return result;
        }
    }

    std::unique_ptr<GpioChipDevice> chip;
    GpioError result = GpioChipDevice::Open(config, chip);
    if (result != GpioError::SUCCESS) {
        return result;
    }
    Logger::GetInstance().Info(TAG, "Using {} ('{}', {} lines)", chip->GetName(), chip->GetLabel(),
                               chip->GetLineCount());
    backend.events = std::move(chip);

    int os_error = 0;
    result = RegisterMap::Open(backend.soc, config, backend.registers, os_error);
    if (result != GpioError::SUCCESS) {
        return result;
    }

    return Assemble(out, std::move(backend), config);
}

GpioError Gpio::Create(std::unique_ptr<Gpio>& out, GpioBackend backend,
                       const GpioConfig& config) noexcept {
    if (LineRegistry::GetInstance().IsInstanceClaimed()) {
        Logger::GetInstance().Warn(TAG, "A Gpio instance already exists");
        return GpioError::INSTANCE_EXISTS;
    }
    return Assemble(out, std::move(backend), config);
}

GpioError Gpio::Assemble(std::unique_ptr<Gpio>& out, GpioBackend backend,
                         const GpioConfig& config) noexcept {
    if (!backend.registers || !backend.events) {
        return GpioError::INVALID_PARAMETER;
    }

    std::unique_ptr<InterruptEventLoop> loop;
    GpioError result = InterruptEventLoop::Create(std::move(backend.events), loop);
    if (result != GpioError::SUCCESS) {
        return result;
    }

    // Everything is built; only now compete for the instance flag.
    if (!LineRegistry::GetInstance().TryClaimInstance()) {
        Logger::GetInstance().Warn(TAG, "Lost the race for the Gpio instance");
        return GpioError::INSTANCE_EXISTS;
    }

    // The process-wide logger follows the configuration of the live facade only.
    if (!Logger::GetInstance().Initialize(config.log)) {
        Logger::GetInstance().Warn(TAG, "Logger configuration rejected, keeping defaults");
    }

    out.reset(new Gpio(std::shared_ptr<RegisterMap>(std::move(backend.registers)),
                       std::shared_ptr<InterruptEventLoop>(std::move(loop)), backend.soc, config));
    Logger::GetInstance().Info(TAG, "Gpio ready on {} ({})", SocModelToString(backend.soc.model),
                               out->registers_->GetSource());
    return GpioError::SUCCESS;
}

Gpio::Gpio(std::shared_ptr<RegisterMap> registers, std::shared_ptr<InterruptEventLoop> events,
           const SocInfo& soc, const GpioConfig& config) noexcept
    : registers_(std::move(registers)),
      events_(std::move(events)),
      soc_(soc),
      config_(config),
      created_at_(std::chrono::steady_clock::now()) {}

Gpio::~Gpio() {
    LineRegistry::GetInstance().ReleaseInstance();
    Logger::GetInstance().Info(TAG, "Gpio released");
}

//==============================================================================
// LINE ACCESS
//==============================================================================

std::optional<Pin> Gpio::Get(uint8_t line) noexcept {
    if (line >= events_->GetMaxLines()) {
        checkouts_failed_.fetch_add(1);
        return std::nullopt;
    }
    std::optional<LineToken> token = LineRegistry::GetInstance().ClaimLine(line);
    if (!token) {
        checkouts_failed_.fetch_add(1);
        Logger::GetInstance().Debug(TAG, "Line {} is already checked out", line);
        return std::nullopt;
    }
    checkouts_succeeded_.fetch_add(1);
    return Pin(std::move(*token), registers_, events_);
}

GpioError Gpio::PollInterrupts(const std::vector<const InputPin*>& pins, bool reset,
                               std::optional<Millis> timeout,
                               std::optional<InterruptEvent>& out) noexcept {
    out.reset();
    if (pins.empty()) {
        RecordError(GpioError::INVALID_PARAMETER);
        return GpioError::INVALID_PARAMETER;
    }

    std::vector<uint8_t> lines;
    lines.reserve(pins.size());
    for (const InputPin* pin : pins) {
        if (pin == nullptr) {
            RecordError(GpioError::INVALID_PARAMETER);
            return GpioError::INVALID_PARAMETER;
        }
        if (pin->IsReleased()) {
            RecordError(GpioError::ALREADY_RELEASED);
            return GpioError::ALREADY_RELEASED;
        }
        lines.push_back(pin->GetLine());
    }

    std::optional<LineEvent> event;
    GpioError result = events_->Poll(lines, reset, timeout, event);
    if (result != GpioError::SUCCESS) {
        RecordError(result);
        return result;
    }
    if (event) {
        for (const InputPin* pin : pins) {
            if (pin->GetLine() == event->line) {
                out = InterruptEvent{pin, event->level};
                break;
            }
        }
    }
    return GpioError::SUCCESS;
}

//==============================================================================
// DIAGNOSTICS
//==============================================================================

void Gpio::RecordError(GpioError error) const noexcept {
    last_error_.store(error);
}

GpioError Gpio::GetSystemDiagnostics(GpioSystemDiagnostics& diagnostics) const noexcept {
    InterruptLoopDiagnostics loop{};
    events_->GetDiagnostics(loop);

    diagnostics.soc_model = soc_.model;
    diagnostics.checked_out_lines =
        static_cast<uint32_t>(LineRegistry::GetInstance().ClaimedLineCount());
    diagnostics.checkouts_succeeded = checkouts_succeeded_.load();
    diagnostics.checkouts_failed = checkouts_failed_.load();
    diagnostics.armed_lines = loop.armed_lines;
    diagnostics.async_workers = loop.async_workers;
    diagnostics.failed_workers = loop.failed_workers;
    diagnostics.polls = loop.polls;
    diagnostics.events_delivered = loop.events_delivered;
    diagnostics.events_cached = loop.events_cached;
    diagnostics.system_uptime_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - created_at_).count());
    diagnostics.last_error = last_error_.load();
    diagnostics.system_healthy = loop.failed_workers == 0 &&
                                 diagnostics.last_error != GpioError::IO_ERROR &&
                                 diagnostics.last_error != GpioError::THREAD_PANIC;
    return GpioError::SUCCESS;
}

void Gpio::DumpStatistics() const noexcept {
    GpioSystemDiagnostics d{};
    if (GetSystemDiagnostics(d) != GpioError::SUCCESS) {
        return;
    }
    auto& log = Logger::GetInstance();
    log.Info(TAG, "=== PiPal GPIO Statistics ===");
    log.Info(TAG, "  SoC: {}  registers: {}", SocModelToString(d.soc_model),
             registers_->GetSource());
    log.Info(TAG, "  Checked out lines: {}", d.checked_out_lines);
    log.Info(TAG, "  Checkouts  ok: {}  refused: {}", d.checkouts_succeeded, d.checkouts_failed);
    log.Info(TAG, "  Interrupts  polled lines: {}  async workers: {}  failed workers: {}",
             d.armed_lines, d.async_workers, d.failed_workers);
    log.Info(TAG, "  Events  delivered: {}  cached: {}  polls: {}", d.events_delivered,
             d.events_cached, d.polls);
    log.Info(TAG, "  Uptime: {} ms  last error: {}", d.system_uptime_ms,
             GpioErrorToString(d.last_error));
    log.Info(TAG, "  Health: {}", d.system_healthy ? "OK" : "DEGRADED");
    log.Info(TAG, "=== End PiPal GPIO Statistics ===");
}

} // namespace pipal
