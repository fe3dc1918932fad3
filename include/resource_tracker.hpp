/**
 * @file resource_tracker.hpp
 * @brief Per-backend usage accounting with reservations
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * The tracker is the only writer of usage state. Storage counters are
 * cumulative; traffic counters live in a fixed window that is reset lazily
 * on the first access after it elapses. Admission is race free through
 * reserve/commit/release: a reservation is validated against live plus
 * pending usage and held as pending until it is committed or released.
 */
#ifndef TIERGUARD_RESOURCE_TRACKER_HPP
#define TIERGUARD_RESOURCE_TRACKER_HPP

#include "tg_types.hpp"
#include "result.hpp"
#include "tg_logger.hpp"
#include <map>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>

namespace tierguard {

/**
 * @struct UsageRecord
 * @brief Point-in-time usage of one backend
 */
struct UsageRecord {
    BackendId backend_id;
    int64_t bytes_used = 0;
    int64_t file_count = 0;
    int64_t bytes_transferred_in_window = 0;
    int64_t request_count_in_window = 0;
    TimePoint last_reset_time;
    Seconds window_duration{3600};

    int64_t pending_bytes = 0;              ///< Reserved, not yet committed
    int64_t pending_files = 0;
    int64_t pending_transfer_bytes = 0;
    int64_t pending_requests = 0;

    uint64_t lifetime_bytes_transferred = 0;
    uint64_t lifetime_requests = 0;
};

/**
 * @struct UsageDelta
 * @brief Change applied by one operation
 */
struct UsageDelta {
    int64_t bytes = 0;              ///< Stored bytes (negative on delete)
    int64_t files = 0;              ///< Stored files (negative on delete)
    bool is_transfer = false;       ///< Counts one request against the window
    int64_t transfer_bytes = 0;     ///< Bytes moved over the wire

    static UsageDelta store(int64_t size) { return {size, 1, true, size}; }
    static UsageDelta read(int64_t size) { return {0, 0, true, size}; }
    static UsageDelta remove(int64_t size) { return {-size, -1, false, 0}; }
    static UsageDelta replica(int64_t size) { return {size, 1, true, size}; }
};

/**
 * @struct UsageLimits
 * @brief Hard limits applied at reservation time; 0 means unlimited
 */
struct UsageLimits {
    int64_t max_bytes = 0;
    int64_t max_files = 0;
    int64_t max_bytes_per_window = 0;
    int64_t max_requests_per_window = 0;
};

/**
 * @struct Reservation
 * @brief Handle to pending usage
 */
struct Reservation {
    uint64_t id = 0;
    BackendId backend_id;
    UsageDelta delta;

    [[nodiscard]] bool valid() const { return id != 0; }
};

/**
 * @class ResourceTracker
 * @brief Usage counters per backend, each behind its own mutex
 */
class ResourceTracker {
public:
    explicit ResourceTracker(ClockFn clock = systemClock(), Seconds default_window = Seconds(3600))
        : clock_(std::move(clock)), default_window_(default_window) {}

    ResourceTracker(const ResourceTracker&) = delete;
    ResourceTracker& operator=(const ResourceTracker&) = delete;

    /**
     * @brief Apply a committed change directly
     *
     * Storage counters never drop below zero.
     */
    void record(const BackendId& backend, const UsageDelta& delta) {
        auto& slot = slotFor(backend);
        std::lock_guard<std::mutex> lock(slot.mtx);
        rollWindow(slot.usage);
        apply(slot.usage, delta);
    }

    void record(const BackendId& backend, int64_t delta_bytes, int64_t delta_files, bool is_transfer) {
        record(backend, UsageDelta{delta_bytes, delta_files, is_transfer, is_transfer && delta_bytes > 0 ? delta_bytes : 0});
    }

    /// Consistent copy of the backend's counters
    [[nodiscard]] UsageRecord snapshot(const BackendId& backend) {
        auto& slot = slotFor(backend);
        std::lock_guard<std::mutex> lock(slot.mtx);
        rollWindow(slot.usage);
        return slot.usage;
    }

    [[nodiscard]] std::vector<UsageRecord> snapshotAll() {
        std::vector<BackendId> ids;
        {
            std::shared_lock lock(map_mtx_);
            for (const auto& [id, s] : slots_) ids.push_back(id);
        }
        std::vector<UsageRecord> out;
        for (const auto& id : ids) out.push_back(snapshot(id));
        return out;
    }

    [[nodiscard]] bool has(const BackendId& backend) const {
        std::shared_lock lock(map_mtx_);
        return slots_.count(backend) > 0;
    }

    void setWindowDuration(const BackendId& backend, Seconds window) {
        auto& slot = slotFor(backend);
        std::lock_guard<std::mutex> lock(slot.mtx);
        slot.usage.window_duration = window;
        rollWindow(slot.usage);
    }

    /**
     * @brief Admit a delta against live plus pending usage
     * @return QUOTA_EXCEEDED naming the limit, or a reservation holding the delta
     */
    Result<Reservation> reserve(const BackendId& backend, const UsageDelta& delta, const UsageLimits& limits) {
        auto& slot = slotFor(backend);
        std::lock_guard<std::mutex> lock(slot.mtx);
        auto& u = slot.usage;
        rollWindow(u);

        if (limits.max_bytes > 0 && delta.bytes > 0 && u.bytes_used + u.pending_bytes + delta.bytes > limits.max_bytes)
            return Err<Reservation>(ErrorCode::QUOTA_EXCEEDED, backend + ": storage " +
                std::to_string(u.bytes_used + u.pending_bytes + delta.bytes) + " > " + std::to_string(limits.max_bytes) + " bytes");
        if (limits.max_files > 0 && delta.files > 0 && u.file_count + u.pending_files + delta.files > limits.max_files)
            return Err<Reservation>(ErrorCode::QUOTA_EXCEEDED, backend + ": file count " +
                std::to_string(u.file_count + u.pending_files + delta.files) + " > " + std::to_string(limits.max_files));
        if (limits.max_bytes_per_window > 0 && delta.transfer_bytes > 0 &&
            u.bytes_transferred_in_window + u.pending_transfer_bytes + delta.transfer_bytes > limits.max_bytes_per_window)
            return Err<Reservation>(ErrorCode::QUOTA_EXCEEDED, backend + ": window transfer exceeds " +
                std::to_string(limits.max_bytes_per_window) + " bytes");
        if (limits.max_requests_per_window > 0 && delta.is_transfer &&
            u.request_count_in_window + u.pending_requests + 1 > limits.max_requests_per_window)
            return Err<Reservation>(ErrorCode::QUOTA_EXCEEDED, backend + ": window request count exceeds " +
                std::to_string(limits.max_requests_per_window));

        Reservation r{next_id_++, backend, delta};
        if (delta.bytes > 0) u.pending_bytes += delta.bytes;
        if (delta.files > 0) u.pending_files += delta.files;
        if (delta.transfer_bytes > 0) u.pending_transfer_bytes += delta.transfer_bytes;
        if (delta.is_transfer) ++u.pending_requests;
        slot.reservations.emplace(r.id, delta);
        return r;
    }

    /// Move a reservation's delta from pending into live usage
    Result<void> commit(const Reservation& r) {
        auto& slot = slotFor(r.backend_id);
        std::lock_guard<std::mutex> lock(slot.mtx);
        auto it = slot.reservations.find(r.id);
        if (it == slot.reservations.end())
            return Err(ErrorCode::NOT_FOUND, "unknown reservation " + std::to_string(r.id) + " on " + r.backend_id);
        rollWindow(slot.usage);
        unpend(slot.usage, it->second);
        apply(slot.usage, it->second);
        slot.reservations.erase(it);
        return Ok();
    }

    /// Drop a reservation without touching live usage
    Result<void> release(const Reservation& r) {
        auto& slot = slotFor(r.backend_id);
        std::lock_guard<std::mutex> lock(slot.mtx);
        auto it = slot.reservations.find(r.id);
        if (it == slot.reservations.end())
            return Err(ErrorCode::NOT_FOUND, "unknown reservation " + std::to_string(r.id) + " on " + r.backend_id);
        unpend(slot.usage, it->second);
        slot.reservations.erase(it);
        return Ok();
    }

    [[nodiscard]] size_t openReservations(const BackendId& backend) {
        auto& slot = slotFor(backend);
        std::lock_guard<std::mutex> lock(slot.mtx);
        return slot.reservations.size();
    }

    /**
     * @brief Replace stored counters after a stat-based scan
     *
     * Window counters restart; pending reservations are kept.
     */
    void rebuild(const BackendId& backend, int64_t bytes, int64_t files) {
        auto& slot = slotFor(backend);
        std::lock_guard<std::mutex> lock(slot.mtx);
        slot.usage.bytes_used = std::max<int64_t>(0, bytes);
        slot.usage.file_count = std::max<int64_t>(0, files);
        slot.usage.bytes_transferred_in_window = 0;
        slot.usage.request_count_in_window = 0;
        slot.usage.last_reset_time = clock_();
        LOG_INFO("ResourceTracker", "Rebuilt usage for " + backend + ": " + formatBytes(bytes) +
                 ", " + std::to_string(files) + " files");
    }

    /// Load a persisted record; pending counters are not persisted
    void restore(const UsageRecord& rec) {
        auto& slot = slotFor(rec.backend_id);
        std::lock_guard<std::mutex> lock(slot.mtx);
        UsageRecord u = rec;
        u.pending_bytes = u.pending_files = u.pending_transfer_bytes = u.pending_requests = 0;
        slot.usage = u;
        rollWindow(slot.usage);
    }

private:
    struct Slot {
        std::mutex mtx;
        UsageRecord usage;
        std::unordered_map<uint64_t, UsageDelta> reservations;
    };

    /// Slots are never erased, so the reference outlives the map lock
    Slot& slotFor(const BackendId& backend) {
        {
            std::shared_lock lock(map_mtx_);
            auto it = slots_.find(backend);
            if (it != slots_.end()) return *it->second;
        }
        std::unique_lock lock(map_mtx_);
        auto& ptr = slots_[backend];
        if (!ptr) {
            ptr = std::make_unique<Slot>();
            ptr->usage.backend_id = backend;
            ptr->usage.window_duration = default_window_;
            ptr->usage.last_reset_time = clock_();
        }
        return *ptr;
    }

    void rollWindow(UsageRecord& u) {
        auto now = clock_();
        if (u.window_duration.count() > 0 && now - u.last_reset_time >= u.window_duration) {
            u.bytes_transferred_in_window = 0;
            u.request_count_in_window = 0;
            u.last_reset_time = now;
        }
    }

    static void apply(UsageRecord& u, const UsageDelta& d) {
        u.bytes_used = std::max<int64_t>(0, u.bytes_used + d.bytes);
        u.file_count = std::max<int64_t>(0, u.file_count + d.files);
        if (d.transfer_bytes > 0) {
            u.bytes_transferred_in_window += d.transfer_bytes;
            u.lifetime_bytes_transferred += static_cast<uint64_t>(d.transfer_bytes);
        }
        if (d.is_transfer) {
            ++u.request_count_in_window;
            ++u.lifetime_requests;
        }
    }

    static void unpend(UsageRecord& u, const UsageDelta& d) {
        if (d.bytes > 0) u.pending_bytes -= d.bytes;
        if (d.files > 0) u.pending_files -= d.files;
        if (d.transfer_bytes > 0) u.pending_transfer_bytes -= d.transfer_bytes;
        if (d.is_transfer) --u.pending_requests;
    }

    ClockFn clock_;
    Seconds default_window_;
    mutable std::shared_mutex map_mtx_;
    std::map<BackendId, std::unique_ptr<Slot>> slots_;
    std::atomic<uint64_t> next_id_{1};
};

} // namespace tierguard
#endif
