/**
 * @file InterruptEventLoop.cpp
 * @brief epoll multiplexing, event cache and async workers.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#include "InterruptEventLoop.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <system_error>
#include <unistd.h>
#include <utility>

#include "utils/Logger.h"

namespace pipal {

static constexpr const char* TAG = "InterruptEventLoop";

namespace {

enum class ReadResult : uint8_t { EVENT, EMPTY, FAILED };

/// Read one `gpioevent_data` record from a non-blocking descriptor.
ReadResult ReadEvent(int fd, Level& level, int& os_error) noexcept {
    struct gpioevent_data data {};
    for (;;) {
        const ssize_t n = ::read(fd, &data, sizeof(data));
        if (n == static_cast<ssize_t>(sizeof(data))) {
            level = (data.id == GPIOEVENT_EVENT_RISING_EDGE) ? Level::HIGH : Level::LOW;
            return ReadResult::EVENT;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return ReadResult::EMPTY;
        }
        // Short read or end of stream: the descriptor no longer carries events.
        os_error = (n < 0) ? errno : EIO;
        return ReadResult::FAILED;
    }
}

int RemainingMillis(std::chrono::steady_clock::time_point deadline) noexcept {
    const auto remaining =
        std::chrono::ceil<Millis>(deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
        return 0;
    }
    return remaining > INT_MAX ? INT_MAX : static_cast<int>(remaining);
}

} // namespace

//==============================================================================
// ASYNC WORKER
//==============================================================================

struct InterruptEventLoop::AsyncWorker {
    uint8_t line{0};
    FileDescriptor event_fd;
    FileDescriptor wake_fd;
    FileDescriptor epoll_fd;
    AsyncCallback callback;
    std::thread thread;
    std::atomic<bool> cancel{false};
    std::atomic<bool> failed{false};
    std::atomic<uint64_t> delivered{0};
};

void InterruptEventLoop::RunWorker(std::shared_ptr<AsyncWorker> worker) noexcept {
    std::array<struct epoll_event, 2> events{};

    while (!worker->cancel.load()) {
        const int ready = ::epoll_wait(worker->epoll_fd.Get(), events.data(),
                                       static_cast<int>(events.size()), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::GetInstance().Error(TAG, "Worker for line {}: epoll_wait failed: {}",
                                        worker->line, std::strerror(errno));
            worker->failed.store(true);
            return;
        }

        for (int i = 0; i < ready; ++i) {
            if (worker->cancel.load()) {
                return;
            }
            if (events[i].data.fd == worker->wake_fd.Get()) {
                continue;
            }

            Level level = Level::LOW;
            int os_error = 0;
            ReadResult result;
            while ((result = ReadEvent(worker->event_fd.Get(), level, os_error)) ==
                   ReadResult::EVENT) {
                if (worker->cancel.load()) {
                    return;
                }
                Logger::GetInstance().Debug(TAG, "Line {} -> {}", worker->line,
                                            LevelToString(level));
                try {
                    worker->callback(level);
                } catch (const std::exception& e) {
                    Logger::GetInstance().Error(TAG, "Callback for line {} threw: {}",
                                                worker->line, e.what());
                    worker->failed.store(true);
                    return;
                } catch (...) {
                    Logger::GetInstance().Error(TAG, "Callback for line {} threw a non-standard exception",
                                                worker->line);
                    worker->failed.store(true);
                    return;
                }
                worker->delivered.fetch_add(1);
            }
            if (result == ReadResult::FAILED) {
                Logger::GetInstance().Error(TAG, "Worker for line {}: event read failed: {}",
                                            worker->line, std::strerror(os_error));
                worker->failed.store(true);
                return;
            }
        }
    }
}

//==============================================================================
// CONSTRUCTION
//==============================================================================

GpioError InterruptEventLoop::Create(std::unique_ptr<BaseLineEventSource> source,
                                     std::unique_ptr<InterruptEventLoop>& out,
                                     size_t max_lines) noexcept {
    if (!source || max_lines == 0 || max_lines > kMaxLines) {
        return GpioError::INVALID_PARAMETER;
    }
    FileDescriptor epoll_fd(::epoll_create1(EPOLL_CLOEXEC));
    if (!epoll_fd) {
        Logger::GetInstance().Error(TAG, "epoll_create1 failed: {}", std::strerror(errno));
        return GpioError::IO_ERROR;
    }
    out.reset(new InterruptEventLoop(std::move(source), std::move(epoll_fd), max_lines));
    Logger::GetInstance().Debug(TAG, "Event loop on {} for {} lines", out->source_->GetName(),
                                max_lines);
    return GpioError::SUCCESS;
}

InterruptEventLoop::InterruptEventLoop(std::unique_ptr<BaseLineEventSource> source,
                                       FileDescriptor epoll_fd, size_t max_lines) noexcept
    : source_(std::move(source)), epoll_fd_(std::move(epoll_fd)), records_(max_lines) {}

InterruptEventLoop::~InterruptEventLoop() {
    std::vector<std::unique_ptr<LineInterrupt>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t line = 0; line < records_.size(); ++line) {
            if (records_[line]) {
                records.push_back(TakeRecordLocked(static_cast<uint8_t>(line)));
            }
        }
    }
    for (auto& record : records) {
        if (RetireRecord(std::move(record)) != GpioError::SUCCESS) {
            Logger::GetInstance().Warn(TAG, "An async worker had failed before shutdown");
        }
    }
}

//==============================================================================
// RECORD MANAGEMENT
//==============================================================================

GpioError InterruptEventLoop::RequestDescriptor(uint8_t line, Trigger trigger,
                                                FileDescriptor& out_fd) noexcept {
    GpioError result = source_->RequestLineEvent(line, trigger, out_fd);
    if (result != GpioError::SUCCESS) {
        last_os_error_.store(source_->GetLastOsError());
        return result;
    }

    const int flags = ::fcntl(out_fd.Get(), F_GETFL);
    if (flags < 0 || ::fcntl(out_fd.Get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        last_os_error_.store(errno);
        Logger::GetInstance().Error(TAG, "Unable to make line {} descriptor non-blocking: {}",
                                    line, std::strerror(errno));
        out_fd.Reset();
        return GpioError::IO_ERROR;
    }
    return GpioError::SUCCESS;
}

std::unique_ptr<InterruptEventLoop::LineInterrupt> InterruptEventLoop::TakeRecordLocked(
    uint8_t line) noexcept {
    std::unique_ptr<LineInterrupt> record = std::move(records_[line]);
    if (record && record->fd) {
        if (::epoll_ctl(epoll_fd_.Get(), EPOLL_CTL_DEL, record->fd.Get(), nullptr) < 0) {
            Logger::GetInstance().Warn(TAG, "EPOLL_CTL_DEL for line {} failed: {}", line,
                                       std::strerror(errno));
        }
        fd_to_line_.erase(record->fd.Get());
    }
    return record;
}

GpioError InterruptEventLoop::RetireRecord(std::unique_ptr<LineInterrupt> record) noexcept {
    if (!record || !record->worker) {
        return GpioError::SUCCESS;
    }
    std::shared_ptr<AsyncWorker> worker = std::move(record->worker);

    worker->cancel.store(true);
    const uint64_t wake = 1;
    if (::write(worker->wake_fd.Get(), &wake, sizeof(wake)) < 0) {
        Logger::GetInstance().Warn(TAG, "Unable to wake worker for line {}: {}", worker->line,
                                   std::strerror(errno));
    }

    if (worker->thread.joinable()) {
        if (worker->thread.get_id() == std::this_thread::get_id()) {
            // Called from the worker's own callback; it exits once the callback returns.
            worker->thread.detach();
        } else {
            worker->thread.join();
        }
    }

    events_delivered_.fetch_add(worker->delivered.load());
    if (worker->failed.load()) {
        failed_workers_.fetch_add(1);
        Logger::GetInstance().Warn(TAG, "Worker for line {} had stopped abnormally", worker->line);
        return GpioError::THREAD_PANIC;
    }
    Logger::GetInstance().Debug(TAG, "Worker for line {} stopped", worker->line);
    return GpioError::SUCCESS;
}

//==============================================================================
// SYNCHRONOUS DELIVERY
//==============================================================================

GpioError InterruptEventLoop::Arm(uint8_t line, Trigger trigger) noexcept {
    if (line >= records_.size()) {
        return GpioError::INVALID_LINE;
    }
    if (trigger == Trigger::DISABLED) {
        return GpioError::INVALID_PARAMETER;
    }

    std::unique_ptr<LineInterrupt> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = TakeRecordLocked(line);
    }
    GpioError retired = RetireRecord(std::move(previous));
    if (retired != GpioError::SUCCESS) {
        return retired;
    }

    GpioError result = GpioError::SUCCESS;
    std::unique_ptr<LineInterrupt> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Armed concurrently by another thread between the two critical sections.
        stale = TakeRecordLocked(line);
        result = ArmLocked(line, trigger);
    }
    if (stale && RetireRecord(std::move(stale)) != GpioError::SUCCESS) {
        Logger::GetInstance().Warn(TAG, "Replaced a failed worker on line {}", line);
    }
    if (result == GpioError::SUCCESS) {
        Logger::GetInstance().Debug(TAG, "Line {} armed ({})", line, TriggerToString(trigger));
    }
    return result;
}

GpioError InterruptEventLoop::ArmLocked(uint8_t line, Trigger trigger) noexcept {
    FileDescriptor fd;
    GpioError result = RequestDescriptor(line, trigger, fd);
    if (result != GpioError::SUCCESS) {
        return result;
    }

    struct epoll_event ev {};
    ev.events = EPOLLIN | EPOLLPRI;
    ev.data.fd = fd.Get();
    if (::epoll_ctl(epoll_fd_.Get(), EPOLL_CTL_ADD, fd.Get(), &ev) < 0) {
        last_os_error_.store(errno);
        Logger::GetInstance().Error(TAG, "EPOLL_CTL_ADD for line {} failed: {}", line,
                                    std::strerror(errno));
        return GpioError::IO_ERROR;
    }

    auto record = std::make_unique<LineInterrupt>();
    record->trigger = trigger;
    fd_to_line_[fd.Get()] = line;
    record->fd = std::move(fd);
    records_[line] = std::move(record);
    return GpioError::SUCCESS;
}

GpioError InterruptEventLoop::Disarm(uint8_t line) noexcept {
    if (line >= records_.size()) {
        return GpioError::INVALID_LINE;
    }
    std::unique_ptr<LineInterrupt> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record = TakeRecordLocked(line);
    }
    if (record) {
        Logger::GetInstance().Debug(TAG, "Line {} disarmed", line);
    }
    return RetireRecord(std::move(record));
}

GpioError InterruptEventLoop::DrainIntoCacheLocked(uint8_t line, LineInterrupt& record,
                                                   uint64_t sequence) noexcept {
    Level level = Level::LOW;
    int os_error = 0;
    ReadResult result;
    while ((result = ReadEvent(record.fd.Get(), level, os_error)) == ReadResult::EVENT) {
        record.cached = CachedEvent{level, sequence};
        ++events_cached_;
        Logger::GetInstance().Debug(TAG, "Line {} -> {}", line, LevelToString(level));
    }
    if (result == ReadResult::FAILED) {
        last_os_error_.store(os_error);
        Logger::GetInstance().Error(TAG, "Reading events of line {} failed: {}", line,
                                    std::strerror(os_error));
        return GpioError::IO_ERROR;
    }
    return GpioError::SUCCESS;
}

std::optional<LineEvent> InterruptEventLoop::TakeEarliestLocked(
    const std::vector<uint8_t>& lines) noexcept {
    LineInterrupt* best = nullptr;
    uint8_t best_line = 0;
    for (uint8_t line : lines) {
        LineInterrupt* record = records_[line].get();
        if (!record || !record->cached) {
            continue;
        }
        if (best == nullptr || record->cached->sequence < best->cached->sequence ||
            (record->cached->sequence == best->cached->sequence && line < best_line)) {
            best = record;
            best_line = line;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    LineEvent event{best_line, best->cached->level};
    best->cached.reset();
    events_delivered_.fetch_add(1);
    return event;
}

GpioError InterruptEventLoop::Poll(const std::vector<uint8_t>& lines, bool reset,
                                   std::optional<Millis> timeout,
                                   std::optional<LineEvent>& out) noexcept {
    out.reset();
    if (lines.empty()) {
        return GpioError::INVALID_PARAMETER;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++polls_;

    for (uint8_t line : lines) {
        if (line >= records_.size()) {
            return GpioError::INVALID_LINE;
        }
        const LineInterrupt* record = records_[line].get();
        if (!record) {
            return GpioError::NOT_ARMED;
        }
        if (record->worker) {
            return record->worker->failed.load() ? GpioError::THREAD_PANIC : GpioError::NOT_ARMED;
        }
    }

    if (reset) {
        for (uint8_t line : lines) {
            LineInterrupt& record = *records_[line];
            GpioError result = DrainIntoCacheLocked(line, record, next_sequence_);
            record.cached.reset();
            if (result != GpioError::SUCCESS) {
                return result;
            }
        }
    }

    out = TakeEarliestLocked(lines);
    if (out) {
        return GpioError::SUCCESS;
    }

    std::chrono::steady_clock::time_point deadline;
    const bool bounded = timeout && DeadlineAfter(*timeout, deadline);
    std::vector<struct epoll_event> events(records_.size());

    for (;;) {
        const int wait_ms = bounded ? RemainingMillis(deadline) : -1;
        const int ready =
            ::epoll_wait(epoll_fd_.Get(), events.data(), static_cast<int>(events.size()), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            last_os_error_.store(errno);
            Logger::GetInstance().Error(TAG, "epoll_wait failed: {}", std::strerror(errno));
            return GpioError::IO_ERROR;
        }
        if (ready == 0) {
            return GpioError::SUCCESS;
        }

        // Everything drained in one wake shares an arrival sequence.
        const uint64_t sequence = ++next_sequence_;
        for (int i = 0; i < ready; ++i) {
            auto it = fd_to_line_.find(events[i].data.fd);
            if (it == fd_to_line_.end()) {
                continue;
            }
            LineInterrupt* record = records_[it->second].get();
            if (!record) {
                continue;
            }
            GpioError result = DrainIntoCacheLocked(it->second, *record, sequence);
            if (result != GpioError::SUCCESS) {
                return result;
            }
        }

        out = TakeEarliestLocked(lines);
        if (out) {
            return GpioError::SUCCESS;
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            return GpioError::SUCCESS;
        }
    }
}

//==============================================================================
// ASYNCHRONOUS DELIVERY
//==============================================================================

GpioError InterruptEventLoop::StartAsync(uint8_t line, Trigger trigger,
                                         AsyncCallback callback) noexcept {
    if (line >= records_.size()) {
        return GpioError::INVALID_LINE;
    }
    if (trigger == Trigger::DISABLED || !callback) {
        return GpioError::INVALID_PARAMETER;
    }

    std::unique_ptr<LineInterrupt> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = TakeRecordLocked(line);
    }
    GpioError retired = RetireRecord(std::move(previous));
    if (retired != GpioError::SUCCESS) {
        return retired;
    }

    auto worker = std::make_shared<AsyncWorker>();
    worker->line = line;
    worker->callback = std::move(callback);

    GpioError result = RequestDescriptor(line, trigger, worker->event_fd);
    if (result != GpioError::SUCCESS) {
        return result;
    }

    worker->wake_fd.Reset(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
    worker->epoll_fd.Reset(::epoll_create1(EPOLL_CLOEXEC));
    if (!worker->wake_fd || !worker->epoll_fd) {
        last_os_error_.store(errno);
        Logger::GetInstance().Error(TAG, "Unable to set up worker for line {}: {}", line,
                                    std::strerror(errno));
        return GpioError::IO_ERROR;
    }

    for (int fd : {worker->event_fd.Get(), worker->wake_fd.Get()}) {
        struct epoll_event ev {};
        ev.events = EPOLLIN | EPOLLPRI;
        ev.data.fd = fd;
        if (::epoll_ctl(worker->epoll_fd.Get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
            last_os_error_.store(errno);
            Logger::GetInstance().Error(TAG, "EPOLL_CTL_ADD for worker of line {} failed: {}",
                                        line, std::strerror(errno));
            return GpioError::IO_ERROR;
        }
    }

    try {
        worker->thread = std::thread(&InterruptEventLoop::RunWorker, worker);
    } catch (const std::system_error& e) {
        Logger::GetInstance().Error(TAG, "Unable to start worker for line {}: {}", line, e.what());
        return GpioError::IO_ERROR;
    }

    auto record = std::make_unique<LineInterrupt>();
    record->trigger = trigger;
    record->worker = std::move(worker);

    std::unique_ptr<LineInterrupt> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = TakeRecordLocked(line);
        records_[line] = std::move(record);
    }
    Logger::GetInstance().Debug(TAG, "Line {} armed for async delivery ({})", line,
                                TriggerToString(trigger));

    if (stale && RetireRecord(std::move(stale)) != GpioError::SUCCESS) {
        Logger::GetInstance().Warn(TAG, "Replaced a failed worker on line {}", line);
    }
    return GpioError::SUCCESS;
}

GpioError InterruptEventLoop::StopAsync(uint8_t line) noexcept {
    if (line >= records_.size()) {
        return GpioError::INVALID_LINE;
    }
    std::unique_ptr<LineInterrupt> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!records_[line] || !records_[line]->worker) {
            return GpioError::NOT_ARMED;
        }
        record = TakeRecordLocked(line);
    }
    return RetireRecord(std::move(record));
}

//==============================================================================
// STATUS
//==============================================================================

bool InterruptEventLoop::IsArmed(uint8_t line) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return line < records_.size() && records_[line] != nullptr;
}

bool InterruptEventLoop::IsAsync(uint8_t line) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return line < records_.size() && records_[line] && records_[line]->worker;
}

Trigger InterruptEventLoop::GetTrigger(uint8_t line) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (line >= records_.size() || !records_[line]) {
        return Trigger::DISABLED;
    }
    return records_[line]->trigger;
}

void InterruptEventLoop::GetDiagnostics(InterruptLoopDiagnostics& diagnostics) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics.armed_lines = 0;
    diagnostics.async_workers = 0;
    uint64_t live_delivered = 0;
    for (const auto& record : records_) {
        if (!record) {
            continue;
        }
        if (record->worker) {
            ++diagnostics.async_workers;
            live_delivered += record->worker->delivered.load();
        } else {
            ++diagnostics.armed_lines;
        }
    }
    diagnostics.polls = polls_;
    diagnostics.events_delivered = events_delivered_.load() + live_delivered;
    diagnostics.events_cached = events_cached_;
    diagnostics.failed_workers = failed_workers_.load();
}

} // namespace pipal
