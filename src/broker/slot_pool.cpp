#include <qbroker/broker/slot_pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <stdexcept>

namespace qbroker::broker {

ProcessSlotPool::ProcessSlotPool(std::size_t capacity, boost::asio::any_io_executor timerExecutor)
    : capacity_(capacity), timerExecutor_(std::move(timerExecutor)),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ProcessSlotPool capacity must be at least 1");
    }
    spdlog::debug("[ProcessSlotPool] Created with capacity {}", capacity_);
}

ProcessSlotPool::~ProcessSlotPool() {
    alive_->store(false, std::memory_order_release);
    std::lock_guard lock{mutex_};
    for (auto& [id, lease] : leased_) {
        if (lease.timer) {
            lease.timer->cancel();
        }
    }
}

void ProcessSlotPool::setAdmissionHandler(AdmissionHandler handler) {
    std::lock_guard lock{mutex_};
    admissionHandler_ = std::move(handler);
}

void ProcessSlotPool::setDeadlineHandler(DeadlineHandler handler) {
    std::lock_guard lock{mutex_};
    deadlineHandler_ = std::move(handler);
}

ProcessSlotPool::Admission ProcessSlotPool::submit(const RequestId& id,
                                                   std::chrono::milliseconds timeout) {
    AdmissionHandler handler;
    {
        std::lock_guard lock{mutex_};
        if (closed_) {
            spdlog::debug("[ProcessSlotPool] Rejecting {}: pool closed", id);
            return Admission::Rejected;
        }
        const bool duplicate =
            leased_.contains(id) || std::any_of(queue_.begin(), queue_.end(),
                                                [&id](const Waiting& w) { return w.id == id; });
        if (duplicate) {
            spdlog::warn("[ProcessSlotPool] Rejecting duplicate request id {}", id);
            return Admission::Rejected;
        }

        // Queue non-empty means someone is ahead of us even if a slot looks free
        if (leased_.size() >= capacity_ || !queue_.empty()) {
            queue_.push_back(Waiting{id, timeout});
            spdlog::debug("[ProcessSlotPool] Queued {} (position {}, active {}/{})", id,
                          queue_.size(), leased_.size(), capacity_);
            return Admission::Queued;
        }

        leaseLocked(id, timeout);
        handler = admissionHandler_;
    }

    if (handler) {
        handler(id);
    }
    return Admission::Admitted;
}

ProcessSlotPool::CancelOutcome ProcessSlotPool::cancel(const RequestId& id) {
    std::lock_guard lock{mutex_};
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&id](const Waiting& w) { return w.id == id; });
    if (it != queue_.end()) {
        queue_.erase(it);
        spdlog::debug("[ProcessSlotPool] Removed {} from queue ({} still waiting)", id,
                      queue_.size());
        return CancelOutcome::RemovedFromQueue;
    }
    if (leased_.contains(id)) {
        return CancelOutcome::Leased;
    }
    return CancelOutcome::NotFound;
}

bool ProcessSlotPool::release(const RequestId& id) {
    AdmissionHandler handler;
    std::optional<RequestId> promoted;
    {
        std::lock_guard lock{mutex_};
        auto it = leased_.find(id);
        if (it == leased_.end()) {
            return false;
        }
        if (it->second.timer) {
            it->second.timer->cancel();
        }
        const auto held = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - it->second.info.leasedAt);
        leased_.erase(it);
        spdlog::debug("[ProcessSlotPool] Released slot held by {} after {}ms (active {}/{})", id,
                      held.count(), leased_.size(), capacity_);

        if (!closed_ && !queue_.empty() && leased_.size() < capacity_) {
            Waiting next = std::move(queue_.front());
            queue_.pop_front();
            leaseLocked(next.id, next.timeout);
            ++promotedTotal_;
            promoted = next.id;
            handler = admissionHandler_;
        }
    }

    if (promoted) {
        spdlog::debug("[ProcessSlotPool] Promoted {} from queue", *promoted);
        if (handler) {
            handler(*promoted);
        }
    }
    return true;
}

std::vector<RequestId> ProcessSlotPool::close() {
    std::lock_guard lock{mutex_};
    closed_ = true;
    std::vector<RequestId> drained;
    drained.reserve(queue_.size());
    for (auto& w : queue_) {
        drained.push_back(std::move(w.id));
    }
    queue_.clear();
    if (!drained.empty()) {
        spdlog::info("[ProcessSlotPool] Closed with {} queued request(s) drained", drained.size());
    }
    return drained;
}

bool ProcessSlotPool::isLeased(const RequestId& id) const {
    std::lock_guard lock{mutex_};
    return leased_.contains(id);
}

bool ProcessSlotPool::isQueued(const RequestId& id) const {
    std::lock_guard lock{mutex_};
    return std::any_of(queue_.begin(), queue_.end(),
                       [&id](const Waiting& w) { return w.id == id; });
}

ProcessSlotPool::Snapshot ProcessSlotPool::snapshot() const {
    std::lock_guard lock{mutex_};
    Snapshot s;
    s.capacity = capacity_;
    s.active = leased_.size();
    s.queued = queue_.size();
    s.admittedTotal = admittedTotal_;
    s.promotedTotal = promotedTotal_;
    s.expiredTotal = expiredTotal_;
    s.peakActive = peakActive_;
    return s;
}

std::vector<ProcessSlotPool::SlotLease> ProcessSlotPool::leases() const {
    std::lock_guard lock{mutex_};
    std::vector<SlotLease> out;
    out.reserve(leased_.size());
    for (const auto& [id, lease] : leased_) {
        out.push_back(lease.info);
    }
    std::sort(out.begin(), out.end(),
              [](const SlotLease& a, const SlotLease& b) { return a.leasedAt < b.leasedAt; });
    return out;
}

void ProcessSlotPool::leaseLocked(const RequestId& id, std::chrono::milliseconds timeout) {
    Lease lease;
    lease.info = SlotLease{id, std::chrono::steady_clock::now(), timeout};
    lease.timer = std::make_shared<boost::asio::steady_timer>(timerExecutor_);
    lease.timer->expires_after(timeout);
    lease.timer->async_wait([this, id, alive = alive_, timer = lease.timer](
                                const boost::system::error_code& ec) {
        if (ec || !alive->load(std::memory_order_acquire)) {
            return;
        }
        onTimerFired(id);
    });

    leased_.emplace(id, std::move(lease));
    ++admittedTotal_;
    peakActive_ = std::max(peakActive_, leased_.size());
    spdlog::debug("[ProcessSlotPool] Leased slot to {} (active {}/{}, deadline {}ms)", id,
                  leased_.size(), capacity_, timeout.count());
}

void ProcessSlotPool::onTimerFired(const RequestId& id) {
    DeadlineHandler handler;
    {
        std::lock_guard lock{mutex_};
        if (!leased_.contains(id)) {
            return;
        }
        ++expiredTotal_;
        handler = deadlineHandler_;
    }
    spdlog::info("[ProcessSlotPool] Lease for {} expired", id);
    if (handler) {
        handler(id);
    }
}

} // namespace qbroker::broker
