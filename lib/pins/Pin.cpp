/**
 * @file Pin.cpp
 * @brief Pin handle conversions, I/O, interrupts and release.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "Pin.h"

#include <chrono>
#include <system_error>
#include <utility>
#include <vector>

#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "Pin";

//==============================================================================
// PIN BASE
//==============================================================================

PinBase::PinBase(LineToken token, std::shared_ptr<RegisterMap> registers,
                 std::shared_ptr<InterruptEventLoop> events) noexcept
    : token_(std::move(token)),
      registers_(std::move(registers)),
      events_(std::move(events)),
      line_(token_.GetLine()),
      original_mode_(registers_ ? registers_->ReadMode(line_) : Mode::INPUT) {}

PinBase& PinBase::operator=(PinBase&& other) noexcept {
    if (this != &other) {
        if (Release() == GpioError::THREAD_PANIC) {
            Logger::GetInstance().Warn(TAG, "Line {}: async worker had failed", line_);
        }
        token_ = std::move(other.token_);
        registers_ = std::move(other.registers_);
        events_ = std::move(other.events_);
        line_ = other.line_;
        original_mode_ = other.original_mode_;
        restore_on_release_ = other.restore_on_release_;
    }
    return *this;
}

PinBase::~PinBase() {
    if (Release() == GpioError::THREAD_PANIC) {
        Logger::GetInstance().Warn(TAG, "Line {}: async worker had failed", line_);
    }
}

GpioError PinBase::Release() noexcept {
    if (!token_.IsValid()) {
        return GpioError::ALREADY_RELEASED;
    }

    GpioError result = GpioError::SUCCESS;
    if (events_) {
        result = events_->Disarm(line_);
    }
    if (restore_on_release_ && registers_) {
        registers_->WriteMode(line_, Mode::INPUT);
        registers_->SetPull(line_, PullUpDown::OFF);
    }
    token_.Reset();
    Logger::GetInstance().Debug(TAG, "Line {} released{}", line_,
                                restore_on_release_ ? " (restored to INPUT)" : "");
    return result;
}

//==============================================================================
// INPUT PIN
//==============================================================================

Level InputPin::Read() const noexcept {
    if (IsReleased()) {
        return Level::LOW;
    }
    return registers_->ReadLevel(line_);
}

void InputPin::SetPull(PullUpDown pull) noexcept {
    if (!IsReleased()) {
        registers_->SetPull(line_, pull);
    }
}

PullUpDown InputPin::GetPull() const noexcept {
    if (IsReleased()) {
        return PullUpDown::OFF;
    }
    return registers_->ReadPull(line_);
}

GpioError InputPin::SetInterrupt(Trigger trigger, AsyncCallback callback) noexcept {
    if (IsReleased()) {
        return GpioError::ALREADY_RELEASED;
    }
    if (trigger == Trigger::DISABLED) {
        return ClearInterrupt();
    }
    if (callback) {
        return events_->StartAsync(line_, trigger, std::move(callback));
    }
    return events_->Arm(line_, trigger);
}

GpioError InputPin::ClearInterrupt() noexcept {
    if (IsReleased()) {
        return GpioError::ALREADY_RELEASED;
    }
    return events_->Disarm(line_);
}

GpioError InputPin::PollInterrupt(bool reset, std::optional<Millis> timeout,
                                  std::optional<Level>& out) noexcept {
    out.reset();
    if (IsReleased()) {
        return GpioError::ALREADY_RELEASED;
    }
    std::optional<LineEvent> event;
    GpioError result = events_->Poll({line_}, reset, timeout, event);
    if (result == GpioError::SUCCESS && event) {
        out = event->level;
    }
    return result;
}

//==============================================================================
// OUTPUT PIN
//==============================================================================

OutputPin::OutputPin(OutputPin&& other) noexcept
    : PinBase(std::move(other)), pulse_(std::move(other.pulse_)) {}

OutputPin& OutputPin::operator=(OutputPin&& other) noexcept {
    if (this != &other) {
        CancelPulse();
        PinBase::operator=(std::move(other));
        pulse_ = std::move(other.pulse_);
    }
    return *this;
}

OutputPin::~OutputPin() {
    CancelPulse();
}

void OutputPin::Write(Level level) noexcept {
    if (!IsReleased()) {
        registers_->SetOutput(line_, level);
    }
}

void OutputPin::Toggle() noexcept {
    if (!IsReleased()) {
        Write(InvertLevel(registers_->ReadLevel(line_)));
    }
}

bool OutputPin::IsSetHigh() const noexcept {
    return !IsReleased() && registers_->ReadLevel(line_) == Level::HIGH;
}

GpioError OutputPin::Pulse(Millis duration) noexcept {
    if (IsReleased()) {
        return GpioError::ALREADY_RELEASED;
    }
    if (duration.count() < 0) {
        return GpioError::INVALID_PARAMETER;
    }

    CancelPulse();
    SetHigh();

    auto timer = std::make_unique<PulseTimer>();
    PulseTimer* raw = timer.get();
    std::shared_ptr<RegisterMap> registers = registers_;
    const uint8_t line = line_;
    try {
        timer->thread = std::thread([raw, registers, line, duration]() {
            std::unique_lock<std::mutex> lock(raw->mutex);
            std::chrono::steady_clock::time_point deadline;
            if (!DeadlineAfter(duration, deadline)) {
                // Past the clock's range: the line stays HIGH until cancelled.
                raw->cv.wait(lock, [raw] { return raw->cancelled; });
                return;
            }
            if (!raw->cv.wait_until(lock, deadline, [raw] { return raw->cancelled; })) {
                registers->SetOutput(line, Level::LOW);
            }
        });
    } catch (const std::system_error& e) {
        Logger::GetInstance().Error(TAG, "Line {}: unable to start pulse timer: {}", line_,
                                    e.what());
        SetLow();
        return GpioError::IO_ERROR;
    }
    pulse_ = std::move(timer);
    return GpioError::SUCCESS;
}

void OutputPin::CancelPulse() noexcept {
    if (!pulse_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pulse_->mutex);
        pulse_->cancelled = true;
    }
    pulse_->cv.notify_all();
    if (pulse_->thread.joinable()) {
        pulse_->thread.join();
    }
    pulse_.reset();
}

GpioError OutputPin::Release() noexcept {
    CancelPulse();
    return PinBase::Release();
}

//==============================================================================
// ALT PIN
//==============================================================================

GpioError AltPin::SetMode(Mode mode) noexcept {
    if (IsReleased()) {
        return GpioError::ALREADY_RELEASED;
    }
    if (!IsAltMode(mode)) {
        return GpioError::INVALID_PARAMETER;
    }
    registers_->WriteMode(line_, mode);
    return GpioError::SUCCESS;
}

Mode AltPin::GetMode() const noexcept {
    if (IsReleased()) {
        return Mode::INPUT;
    }
    return registers_->ReadMode(line_);
}

//==============================================================================
// UNCONFIGURED PIN
//==============================================================================

Mode Pin::GetMode() const noexcept {
    if (IsReleased()) {
        return Mode::INPUT;
    }
    return registers_->ReadMode(line_);
}

Level Pin::Read() const noexcept {
    if (IsReleased()) {
        return Level::LOW;
    }
    return registers_->ReadLevel(line_);
}

InputPin Pin::IntoInputWithPull(PullUpDown pull) noexcept {
    if (!IsReleased()) {
        registers_->WriteMode(line_, Mode::INPUT);
        registers_->SetPull(line_, pull);
    }
    return InputPin(std::move(*this));
}

InputPin Pin::IntoInput() noexcept {
    return IntoInputWithPull(PullUpDown::OFF);
}

InputPin Pin::IntoInputPullUp() noexcept {
    return IntoInputWithPull(PullUpDown::PULL_UP);
}

InputPin Pin::IntoInputPullDown() noexcept {
    return IntoInputWithPull(PullUpDown::PULL_DOWN);
}

OutputPin Pin::IntoOutput() noexcept {
    if (!IsReleased()) {
        registers_->WriteMode(line_, Mode::OUTPUT);
    }
    return OutputPin(std::move(*this));
}

std::optional<AltPin> Pin::IntoAlt(Mode mode) noexcept {
    if (!IsAltMode(mode)) {
        return std::nullopt;
    }
    if (!IsReleased()) {
        registers_->WriteMode(line_, mode);
    }
    return AltPin(std::move(*this));
}

} // namespace pipal
