#pragma once

#include <qbroker/core/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace qbroker::broker {

/**
 * @brief Fixed-capacity pool of process slots with a FIFO admission queue.
 *
 * The pool only does bookkeeping: who holds a slot, who is waiting, and when a
 * lease runs out. Starting work on an admitted request is the admission
 * handler's job; reacting to an expired lease is the deadline handler's job.
 *
 * ## Invariants
 * - leased count <= capacity at every instant (one mutex guards every admission decision)
 * - a request id is either queued or leased, never both
 * - every release() promotes at most one queued request, strictly FIFO
 *
 * Handlers are always invoked without the pool mutex held.
 */
class ProcessSlotPool {
public:
    using AdmissionHandler = std::function<void(const RequestId&)>;
    using DeadlineHandler = std::function<void(const RequestId&)>;

    enum class Admission : uint8_t {
        Admitted, ///< Slot leased, admission handler already invoked
        Queued,   ///< Waiting for a free slot
        Rejected  ///< Pool closed or duplicate id
    };

    enum class CancelOutcome : uint8_t {
        NotFound,         ///< Neither queued nor leased
        RemovedFromQueue, ///< Was waiting; never admitted
        Leased            ///< Holds a slot; caller must stop the work and release()
    };

    struct SlotLease {
        RequestId requestId;
        SteadyTimePoint leasedAt;
        std::chrono::milliseconds timeout{0};
    };

    struct Snapshot {
        std::size_t capacity = 0;
        std::size_t active = 0;
        std::size_t queued = 0;
        uint64_t admittedTotal = 0;
        uint64_t promotedTotal = 0;
        uint64_t expiredTotal = 0;
        std::size_t peakActive = 0;
    };

    /**
     * @param capacity Maximum concurrently leased slots (must be >= 1)
     * @param timerExecutor Executor that runs lease deadline timers
     * @throws std::invalid_argument if capacity is zero
     */
    ProcessSlotPool(std::size_t capacity, boost::asio::any_io_executor timerExecutor);
    ~ProcessSlotPool();

    ProcessSlotPool(const ProcessSlotPool&) = delete;
    ProcessSlotPool& operator=(const ProcessSlotPool&) = delete;

    void setAdmissionHandler(AdmissionHandler handler);
    void setDeadlineHandler(DeadlineHandler handler);

    /**
     * @brief Lease a slot now, or queue behind earlier submissions.
     * @param timeout Lease deadline, armed when the slot is actually leased
     */
    Admission submit(const RequestId& id, std::chrono::milliseconds timeout);

    /**
     * @brief Remove a queued request or report that it holds a slot.
     */
    CancelOutcome cancel(const RequestId& id);

    /**
     * @brief Return a slot and promote the queue head, if any.
     * @return false if @p id held no slot
     */
    bool release(const RequestId& id);

    /**
     * @brief Stop admitting and drain the queue.
     * @return Ids that were waiting, in queue order
     */
    std::vector<RequestId> close();

    bool isLeased(const RequestId& id) const;
    bool isQueued(const RequestId& id) const;
    std::size_t capacity() const noexcept { return capacity_; }

    Snapshot snapshot() const;
    std::vector<SlotLease> leases() const;

private:
    struct Lease {
        SlotLease info;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    struct Waiting {
        RequestId id;
        std::chrono::milliseconds timeout;
    };

    // Requires mutex_ held
    void leaseLocked(const RequestId& id, std::chrono::milliseconds timeout);
    void onTimerFired(const RequestId& id);

    const std::size_t capacity_;
    boost::asio::any_io_executor timerExecutor_;

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, Lease> leased_;
    std::deque<Waiting> queue_;
    bool closed_ = false;

    AdmissionHandler admissionHandler_;
    DeadlineHandler deadlineHandler_;

    uint64_t admittedTotal_ = 0;
    uint64_t promotedTotal_ = 0;
    uint64_t expiredTotal_ = 0;
    std::size_t peakActive_ = 0;

    // Lets timer callbacks detect that the pool is gone
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace qbroker::broker
