/**
 * @file InterruptEventLoop.h
 * @brief epoll-based multiplexer for GPIO edge events.
 *
 * @details Every armed line owns one event descriptor obtained from a
 *          BaseLineEventSource. A line is armed for exactly one delivery
 *          mode at a time:
 *
 *          - **Synchronous**: the descriptor is registered with the shared
 *            epoll instance and events are pulled with Poll(). Events that
 *            arrive for lines nobody is currently polling are kept in a
 *            single-slot cache per line (the latest unread edge) tagged with
 *            an arrival sequence number. Poll() returns the event with the
 *            lowest sequence number; events drained in the same epoll wake
 *            share a sequence and are ordered by ascending line id.
 *
 *          - **Asynchronous**: a dedicated worker thread waits on its own
 *            epoll set holding the line descriptor and a wake-up eventfd, and
 *            calls the user callback for every edge until cancelled.
 *            StopAsync() and Disarm() return only after the worker has
 *            exited, so no callback runs afterwards. A callback that disarms
 *            its own line detaches the worker instead of joining itself.
 *
 *          A worker whose callback threw or whose descriptor failed stops and
 *          is reported as THREAD_PANIC by the next call touching its line.
 *
 * @note Record and epoll changes are serialized by one loop mutex. Poll()
 *       holds it while waiting, so Arm()/Disarm() from other threads wait for
 *       a pending Poll() to return.
 *
 * @author PiPal Team
 * @date 2026
 * @version 1.0
 */

#ifndef PIPAL_INTERRUPT_EVENT_LOOP_H_
#define PIPAL_INTERRUPT_EVENT_LOOP_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/GpioTypes.h"
#include "handlers/BaseLineEventSource.h"
#include "utils/FileDescriptor.h"

namespace pipal {

//==============================================================================
// DIAGNOSTICS STRUCTURE
//==============================================================================

struct InterruptLoopDiagnostics {
    uint32_t armed_lines;       ///< Lines armed for synchronous delivery
    uint32_t async_workers;     ///< Lines armed for asynchronous delivery
    uint64_t polls;             ///< Poll() calls
    uint64_t events_delivered;  ///< Events returned by Poll() or passed to callbacks
    uint64_t events_cached;     ///< Events read into the synchronous cache
    uint32_t failed_workers;    ///< Workers that stopped abnormally
};

//==============================================================================
// INTERRUPT EVENT LOOP
//==============================================================================

class InterruptEventLoop {
public:
    /**
     * @brief Build a loop over @p source.
     * @param source    Provider of per-line event descriptors (ownership taken).
     * @param max_lines Exclusive upper bound of accepted line numbers.
     * @param[out] out  Loop on success.
     * @return SUCCESS, INVALID_PARAMETER or IO_ERROR (epoll_create1 failed).
     */
    [[nodiscard]] static GpioError Create(std::unique_ptr<BaseLineEventSource> source,
                                          std::unique_ptr<InterruptEventLoop>& out,
                                          size_t max_lines = kMaxLines) noexcept;

    ~InterruptEventLoop();

    InterruptEventLoop(const InterruptEventLoop&) = delete;
    InterruptEventLoop& operator=(const InterruptEventLoop&) = delete;

    //==========================================================================
    // SYNCHRONOUS DELIVERY
    //==========================================================================

    /**
     * @brief Arm @p line for Poll() delivery, replacing any existing arming.
     * @return SUCCESS, INVALID_LINE, INVALID_PARAMETER (DISABLED trigger),
     *         IO_ERROR, or THREAD_PANIC if a replaced worker had failed.
     */
    [[nodiscard]] GpioError Arm(uint8_t line, Trigger trigger) noexcept;

    /**
     * @brief Remove any arming of @p line. Idempotent.
     * @return SUCCESS, INVALID_LINE, or THREAD_PANIC if the stopped worker had failed.
     */
    [[nodiscard]] GpioError Disarm(uint8_t line) noexcept;

    /**
     * @brief Wait for the earliest edge on any of @p lines.
     *
     * @param lines   Lines armed for synchronous delivery.
     * @param reset   Discard cached and kernel-queued events of @p lines first.
     * @param timeout std::nullopt waits indefinitely.
     * @param[out] out Earliest event, or std::nullopt on timeout.
     * @return SUCCESS, INVALID_PARAMETER (empty set), INVALID_LINE, NOT_ARMED,
     *         THREAD_PANIC or IO_ERROR.
     */
    [[nodiscard]] GpioError Poll(const std::vector<uint8_t>& lines, bool reset,
                                 std::optional<Millis> timeout,
                                 std::optional<LineEvent>& out) noexcept;

    //==========================================================================
    // ASYNCHRONOUS DELIVERY
    //==========================================================================

    /**
     * @brief Arm @p line and deliver every edge to @p callback on a worker thread.
     * @return SUCCESS, INVALID_LINE, INVALID_PARAMETER (DISABLED trigger or
     *         empty callback), IO_ERROR or THREAD_PANIC.
     */
    [[nodiscard]] GpioError StartAsync(uint8_t line, Trigger trigger,
                                       AsyncCallback callback) noexcept;

    /**
     * @brief Stop and join the worker of @p line and disarm it.
     * @return SUCCESS, INVALID_LINE, NOT_ARMED (no worker) or THREAD_PANIC.
     */
    [[nodiscard]] GpioError StopAsync(uint8_t line) noexcept;

    //==========================================================================
    // STATUS
    //==========================================================================

    [[nodiscard]] bool IsArmed(uint8_t line) const noexcept;
    [[nodiscard]] bool IsAsync(uint8_t line) const noexcept;
    [[nodiscard]] Trigger GetTrigger(uint8_t line) const noexcept;

    void GetDiagnostics(InterruptLoopDiagnostics& diagnostics) const noexcept;

    /// errno of the last failed syscall, 0 if none.
    [[nodiscard]] int GetLastOsError() const noexcept { return last_os_error_.load(); }

    [[nodiscard]] size_t GetMaxLines() const noexcept { return records_.size(); }

private:
    struct AsyncWorker;

    struct CachedEvent {
        Level level;
        uint64_t sequence;
    };

    struct LineInterrupt {
        Trigger trigger{Trigger::DISABLED};
        FileDescriptor fd;                      ///< Sync descriptor; async descriptors live in the worker
        std::optional<CachedEvent> cached;
        std::shared_ptr<AsyncWorker> worker;
    };

    InterruptEventLoop(std::unique_ptr<BaseLineEventSource> source, FileDescriptor epoll_fd,
                       size_t max_lines) noexcept;

    [[nodiscard]] GpioError RequestDescriptor(uint8_t line, Trigger trigger,
                                              FileDescriptor& out_fd) noexcept;

    /// Register a fresh synchronous record; caller holds mutex_ and the slot is empty.
    [[nodiscard]] GpioError ArmLocked(uint8_t line, Trigger trigger) noexcept;

    /// Detach the record of @p line from the loop; caller holds mutex_.
    std::unique_ptr<LineInterrupt> TakeRecordLocked(uint8_t line) noexcept;

    /// Stop the worker of a detached record; called without mutex_.
    [[nodiscard]] GpioError RetireRecord(std::unique_ptr<LineInterrupt> record) noexcept;

    /// Read every queued event of @p record into its cache slot.
    [[nodiscard]] GpioError DrainIntoCacheLocked(uint8_t line, LineInterrupt& record,
                                                 uint64_t sequence) noexcept;

    /// Earliest cached event among @p lines, consumed from the cache.
    [[nodiscard]] std::optional<LineEvent> TakeEarliestLocked(
        const std::vector<uint8_t>& lines) noexcept;

    static void RunWorker(std::shared_ptr<AsyncWorker> worker) noexcept;

    std::unique_ptr<BaseLineEventSource> source_;
    FileDescriptor epoll_fd_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<LineInterrupt>> records_;
    std::unordered_map<int, uint8_t> fd_to_line_;
    uint64_t next_sequence_{0};

    uint64_t polls_{0};
    uint64_t events_cached_{0};
    std::atomic<uint64_t> events_delivered_{0};
    std::atomic<uint32_t> failed_workers_{0};
    std::atomic<int> last_os_error_{0};
};

} // namespace pipal

#endif // PIPAL_INTERRUPT_EVENT_LOOP_H_
