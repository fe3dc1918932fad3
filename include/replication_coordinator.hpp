/**
 * @file replication_coordinator.hpp
 * @brief Redundant copies of objects across backends
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Targets come from the replication policy's preferred backends in declared
 * order (geo-aware policies try unseen regions first). A target is taken
 * only when its quota can reserve the copy. Copies run concurrently on the
 * thread pool, each bounded by the caller's token and the retry policy, and
 * are verified by stat size. Operations on one object never overlap:
 * ensure/repair calls arriving while another is in flight share its result.
 */
#ifndef TIERGUARD_REPLICATION_COORDINATOR_HPP
#define TIERGUARD_REPLICATION_COORDINATOR_HPP

#include "backend_adapter.hpp"
#include "quota_enforcer.hpp"
#include "thread_pool.hpp"
#include <future>
#include <set>
#include <map>

namespace tierguard {

/**
 * @struct ReplicaTarget
 * @brief One backend holding, or meant to hold, a copy
 */
struct ReplicaTarget {
    BackendId backend_id;
    ReplicaStatus status = ReplicaStatus::PENDING;
    uint32_t attempts = 0;
    std::string last_error;
    TimePoint updated_at;
};

/**
 * @struct ReplicaSet
 * @brief Replica targets of one object
 */
struct ReplicaSet {
    ObjectId object_id;
    int64_t size_bytes = 0;
    BackendId policy_backend;       ///< Backend whose replication policy applies
    BackendId source_backend;       ///< Backend of record; never a replica target
    ReplicationPolicy policy;
    std::vector<ReplicaTarget> targets;
    TimePoint updated_at;

    [[nodiscard]] size_t countOf(ReplicaStatus s) const {
        return static_cast<size_t>(std::count_if(targets.begin(), targets.end(),
            [s](const ReplicaTarget& t) { return t.status == s; }));
    }
    [[nodiscard]] size_t verifiedCount() const { return countOf(ReplicaStatus::VERIFIED); }

    [[nodiscard]] const ReplicaTarget* target(const BackendId& b) const {
        auto it = std::find_if(targets.begin(), targets.end(), [&b](const ReplicaTarget& t) { return t.backend_id == b; });
        return it == targets.end() ? nullptr : &*it;
    }
    ReplicaTarget* target(const BackendId& b) {
        auto it = std::find_if(targets.begin(), targets.end(), [&b](const ReplicaTarget& t) { return t.backend_id == b; });
        return it == targets.end() ? nullptr : &*it;
    }

    [[nodiscard]] std::vector<BackendId> backendsWith(ReplicaStatus s) const {
        std::vector<BackendId> out;
        for (const auto& t : targets) if (t.status == s) out.push_back(t.backend_id);
        return out;
    }
};

/**
 * @struct ReplicationRequest
 * @brief Object to protect
 */
struct ReplicationRequest {
    ObjectId object_id;
    int64_t size_bytes = 0;
    std::shared_ptr<const Bytes> payload;   ///< Fetched from the source when null
    BackendId policy_backend;
    BackendId source_backend;
};

struct ReplicationStatistics {
    uint64_t copies_attempted = 0;
    uint64_t copies_verified = 0;
    uint64_t copies_failed = 0;
    uint64_t retries = 0;
    uint64_t repairs = 0;
    uint64_t coalesced = 0;
    uint64_t verification_failures = 0;
    uint64_t insufficient = 0;
};

class ReplicationCoordinator {
public:
    /// Called with the new set, or nullptr once an object's replicas are gone
    using ChangeListener = std::function<void(const ObjectId&, const ReplicaSet*)>;

    ReplicationCoordinator(PolicyStore& policies, QuotaEnforcer& quotas, ResourceTracker& tracker,
                           AdapterRegistry& adapters, ViolationReporter& violations, ThreadPool& pool,
                           RetryPolicy retry = {}, EventBus* events = nullptr, ClockFn clock = systemClock())
        : policies_(policies), quotas_(quotas), tracker_(tracker), adapters_(adapters),
          violations_(violations), pool_(pool), retry_(retry), events_(events), clock_(std::move(clock)) {}

    ReplicationCoordinator(const ReplicationCoordinator&) = delete;
    ReplicationCoordinator& operator=(const ReplicationCoordinator&) = delete;

    /**
     * @brief Bring an object to at least min_redundancy verified replicas
     * @return INSUFFICIENT_REDUNDANCY when too few backends can take a copy;
     *         the partial set is kept for repair()
     */
    Result<ReplicaSet> ensure(const ReplicationRequest& req, const ReplicationPolicy& policy,
                              const CancellationToken& token) {
        if (req.object_id.empty() || req.size_bytes < 0)
            return Err<ReplicaSet>(ErrorCode::INVALID_ARGUMENT, "bad replication request for '" + req.object_id + "'");
        if (req.payload && static_cast<int64_t>(req.payload->size()) != req.size_bytes)
            return Err<ReplicaSet>(ErrorCode::INVALID_ARGUMENT, "payload size does not match " + req.object_id);
        auto valid = validatePolicy(Policy{policy});
        if (!valid) return Err<ReplicaSet>(valid.error());
        return exclusive(req.object_id, true, [&] { return doEnsure(req, policy, token); });
    }

    /**
     * @brief Retry failed targets, then top up with new ones
     *
     * Does nothing for a set with no failed or pending targets that already
     * meets min_redundancy.
     */
    Result<ReplicaSet> repair(const ObjectId& id, const CancellationToken& token) {
        return exclusive(id, true, [&] { return doRepair(id, token); });
    }

    /// Re-stat verified replicas; missing or resized copies become failed
    Result<ReplicaSet> verify(const ObjectId& id, const CancellationToken& token) {
        return exclusive(id, false, [&] { return doVerify(id, token); });
    }

    /// Delete every replica and forget the set
    Result<void> remove(const ObjectId& id, const CancellationToken& token) {
        auto r = exclusive(id, false, [&] { return doRemove(id, token); });
        if (!r) return Err(r.error());
        return Ok();
    }

    [[nodiscard]] std::optional<ReplicaSet> get(const ObjectId& id) const {
        std::lock_guard<std::mutex> lock(sets_mtx_);
        auto it = sets_.find(id);
        if (it == sets_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::vector<ReplicaSet> list() const {
        std::lock_guard<std::mutex> lock(sets_mtx_);
        std::vector<ReplicaSet> out;
        for (const auto& [id, s] : sets_) out.push_back(s);
        return out;
    }

    /// Objects whose set is below its policy minimum
    [[nodiscard]] std::vector<ObjectId> degraded() const {
        std::lock_guard<std::mutex> lock(sets_mtx_);
        std::vector<ObjectId> out;
        for (const auto& [id, s] : sets_) {
            if (static_cast<int32_t>(s.verifiedCount()) < s.policy.min_redundancy) out.push_back(id);
        }
        return out;
    }

    /// Load a persisted set without touching adapters or listeners
    void restore(const ReplicaSet& set) {
        std::lock_guard<std::mutex> lock(sets_mtx_);
        sets_[set.object_id] = set;
        if (static_cast<int32_t>(set.verifiedCount()) < set.policy.min_redundancy)
            degraded_[set.policy_backend].insert(set.object_id);
    }

    void setRetryPolicy(const RetryPolicy& p) { std::lock_guard<std::mutex> lock(sets_mtx_); retry_ = p; }
    [[nodiscard]] RetryPolicy retryPolicy() const { std::lock_guard<std::mutex> lock(sets_mtx_); return retry_; }

    void setChangeListener(ChangeListener l) {
        std::lock_guard<std::mutex> lock(listener_mtx_);
        listener_ = std::move(l);
    }

    [[nodiscard]] ReplicationStatistics statistics() const {
        ReplicationStatistics s;
        s.copies_attempted = copies_attempted_;
        s.copies_verified = copies_verified_;
        s.copies_failed = copies_failed_;
        s.retries = retries_;
        s.repairs = repairs_;
        s.coalesced = coalesced_;
        s.verification_failures = verification_failures_;
        s.insufficient = insufficient_;
        return s;
    }

    [[nodiscard]] std::string generateReport() const {
        auto s = statistics();
        auto sets = list();
        size_t healthy = 0;
        for (const auto& rs : sets) if (static_cast<int32_t>(rs.verifiedCount()) >= rs.policy.min_redundancy) ++healthy;
        std::ostringstream oss;
        oss << "=== Replication Report ===\n"
            << "Replica sets: " << sets.size() << " (" << healthy << " healthy, "
            << sets.size() - healthy << " degraded)\n"
            << "Copies: " << s.copies_attempted << " attempted, " << s.copies_verified << " verified, "
            << s.copies_failed << " failed, " << s.retries << " retries\n"
            << "Repairs: " << s.repairs << "  Coalesced: " << s.coalesced
            << "  Verification failures: " << s.verification_failures << "\n";
        return oss.str();
    }

private:
    struct CopyOutcome {
        ReplicaStatus status = ReplicaStatus::FAILED;
        uint32_t attempts = 0;
        std::string error;
    };

    struct Pick {
        BackendId backend;
        Reservation reservation;
    };

    /**
     * @brief Sequence operations per object
     * @param coalesce Return the in-flight result instead of running again
     */
    template<typename F>
    Result<ReplicaSet> exclusive(const ObjectId& id, bool coalesce, F&& body) {
        std::promise<Result<ReplicaSet>> promise;
        while (true) {
            std::unique_lock<std::mutex> lock(inflight_mtx_);
            auto it = inflight_.find(id);
            if (it == inflight_.end()) {
                inflight_.emplace(id, promise.get_future().share());
                break;
            }
            auto pending = it->second;
            lock.unlock();
            if (coalesce) {
                ++coalesced_;
                LOG_DEBUG("ReplicationCoordinator", "Coalesced request for " + id);
                return pending.get();
            }
            pending.wait();
        }

        // Settles the slot on every exit, including exceptions body() lets through
        struct InflightSlot {
            ReplicationCoordinator& self;
            const ObjectId& id;
            std::promise<Result<ReplicaSet>>& promise;
            std::optional<Result<ReplicaSet>> result;

            ~InflightSlot() {
                {
                    std::lock_guard<std::mutex> lock(self.inflight_mtx_);
                    self.inflight_.erase(id);
                }
                promise.set_value(result ? *result
                                         : Err<ReplicaSet>(ErrorCode::INTERNAL_ERROR, "replication of " + id + " aborted"));
            }
        } slot{*this, id, promise, std::nullopt};

        try {
            slot.result = body();
        } catch (const std::exception& e) {
            LOG_ERROR("ReplicationCoordinator", "Replication of " + id + " failed: " + e.what());
            slot.result = Err<ReplicaSet>(ErrorCode::INTERNAL_ERROR, e.what());
        }
        return *slot.result;
    }

    Result<ReplicaSet> doEnsure(const ReplicationRequest& req, const ReplicationPolicy& policy,
                                const CancellationToken& token) {
        ReplicaSet set;
        if (auto existing = get(req.object_id)) set = *existing;
        set.object_id = req.object_id;
        set.size_bytes = req.size_bytes;
        set.policy_backend = req.policy_backend;
        set.source_backend = req.source_backend;
        set.policy = policy;
        auto payload = req.payload;
        return converge(set, payload, token, false);
    }

    Result<ReplicaSet> doRepair(const ObjectId& id, const CancellationToken& token) {
        auto existing = get(id);
        if (!existing) return Err<ReplicaSet>(ErrorCode::NOT_FOUND, "no replica set for " + id);
        ReplicaSet set = *existing;
        if (auto current = policies_.getAs<ReplicationPolicy>(set.policy_backend)) set.policy = *current;
        bool settled = set.countOf(ReplicaStatus::FAILED) == 0 && set.countOf(ReplicaStatus::PENDING) == 0 &&
                       static_cast<int32_t>(set.verifiedCount()) >= set.policy.min_redundancy;
        if (settled) return set;
        ++repairs_;
        LOG_INFO("ReplicationCoordinator", "Repairing " + id + " (" + std::to_string(set.verifiedCount()) + "/" +
                 std::to_string(set.policy.min_redundancy) + " verified)");
        std::shared_ptr<const Bytes> payload;
        return converge(set, payload, token, true);
    }

    Result<ReplicaSet> converge(ReplicaSet& set, std::shared_ptr<const Bytes>& payload,
                                const CancellationToken& token, bool retry_failed) {
        const auto& policy = set.policy;
        std::set<BackendId> tried;

        // A pending target without a running copy was interrupted
        for (auto& t : set.targets) {
            if (t.status == ReplicaStatus::PENDING) {
                t.status = ReplicaStatus::FAILED;
                t.last_error = "interrupted";
            }
        }

        if (retry_failed) {
            std::vector<Pick> picks;
            for (const auto& b : set.backendsWith(ReplicaStatus::FAILED)) {
                tried.insert(b);
                if (auto r = tryReserve(set, b, false)) picks.push_back({b, *r});
            }
            if (!picks.empty()) {
                auto fetched = ensurePayload(set, payload, token);
                if (!fetched) {
                    releaseAll(picks);
                    store(set);
                    return Err<ReplicaSet>(fetched.error());
                }
                runRound(set, picks, payload, token);
            }
        }

        while (static_cast<int32_t>(set.verifiedCount()) < policy.min_redundancy && token.check()) {
            auto picks = select(set, tried, static_cast<size_t>(policy.min_redundancy) - set.verifiedCount(), false);
            if (picks.empty()) break;
            auto fetched = ensurePayload(set, payload, token);
            if (!fetched) {
                releaseAll(picks);
                store(set);
                return Err<ReplicaSet>(fetched.error());
            }
            runRound(set, picks, payload, token);
        }

        if (static_cast<int32_t>(set.verifiedCount()) < policy.min_redundancy) {
            ++insufficient_;
            store(set);
            markDegraded(set, true);
            std::string msg = set.object_id + " has " + std::to_string(set.verifiedCount()) + " of " +
                              std::to_string(policy.min_redundancy) + " required replicas";
            LOG_ERROR("ReplicationCoordinator", msg);
            if (events_) events_->emit(EventType::REPLICATION_DEGRADED, "ReplicationCoordinator", msg, set.policy_backend, set.object_id);
            return Err<ReplicaSet>(ErrorCode::INSUFFICIENT_REDUNDANCY, msg);
        }

        if (static_cast<int32_t>(set.verifiedCount()) < policy.max_redundancy && token.check()) {
            auto extras = select(set, tried, static_cast<size_t>(policy.max_redundancy) - set.verifiedCount(), true);
            if (!extras.empty()) {
                if (ensurePayload(set, payload, token)) runRound(set, extras, payload, token);
                else releaseAll(extras);
            }
        }

        store(set);
        markDegraded(set, false);
        return set;
    }

    /// Preferred backends in trial order
    std::vector<BackendId> orderCandidates(const ReplicaSet& set) const {
        const auto& preferred = set.policy.preferred_backends;
        if (set.policy.strategy != ReplicationStrategy::GEO_AWARE) return preferred;

        std::set<std::string> regions;
        auto regionOf = [this](const BackendId& b) {
            auto info = policies_.getBackend(b);
            return info ? info->region : std::string();
        };
        if (!set.source_backend.empty()) regions.insert(regionOf(set.source_backend));
        for (const auto& b : set.backendsWith(ReplicaStatus::VERIFIED)) regions.insert(regionOf(b));

        std::vector<BackendId> first, rest;
        for (const auto& b : preferred) {
            auto r = regionOf(b);
            if (!r.empty() && regions.insert(r).second) first.push_back(b);
            else rest.push_back(b);
        }
        first.insert(first.end(), rest.begin(), rest.end());
        return first;
    }

    std::vector<Pick> select(const ReplicaSet& set, std::set<BackendId>& tried, size_t need, bool extras) {
        std::vector<Pick> picks;
        for (const auto& b : orderCandidates(set)) {
            if (picks.size() >= need) break;
            if (b == set.source_backend || tried.count(b)) continue;
            const auto* t = set.target(b);
            if (t && t->status != ReplicaStatus::FAILED) continue;
            tried.insert(b);
            if (auto r = tryReserve(set, b, extras)) picks.push_back({b, *r});
        }
        return picks;
    }

    /// Eligibility plus quota reservation for one candidate
    std::optional<Reservation> tryReserve(const ReplicaSet& set, const BackendId& b, bool extras) {
        auto info = policies_.getBackend(b);
        if (!info || !info->enabled || !info->capabilities.supports_replication || !adapters_.has(b)) {
            LOG_DEBUG("ReplicationCoordinator", "Skipping ineligible backend " + b + " for " + set.object_id);
            return std::nullopt;
        }
        UsageDelta delta = UsageDelta::replica(set.size_bytes);
        if (extras ? !quotas_.hasIdleCapacity(b, delta)
                   : quotas_.evaluate(b, delta).verdict == QuotaVerdict::REJECT) {
            LOG_DEBUG("ReplicationCoordinator", "Skipping " + b + " for " + set.object_id + ": no quota headroom");
            return std::nullopt;
        }
        auto r = quotas_.reserve(b, delta);
        if (!r) return std::nullopt;
        return r.value();
    }

    void releaseAll(const std::vector<Pick>& picks) {
        for (const auto& p : picks) {
            auto r = quotas_.release(p.reservation);
            if (!r) LOG_WARNING("ReplicationCoordinator", "Release failed on " + p.backend + ": " + r.error().message);
        }
    }

    /// Bytes to copy, from the backend of record or any verified replica
    Result<void> ensurePayload(const ReplicaSet& set, std::shared_ptr<const Bytes>& payload,
                               const CancellationToken& token) {
        if (payload) return Ok();
        std::vector<BackendId> sources;
        if (!set.source_backend.empty()) sources.push_back(set.source_backend);
        for (const auto& b : set.backendsWith(ReplicaStatus::VERIFIED)) sources.push_back(b);
        RetryPolicy retry = retryPolicy();
        Error last(ErrorCode::NOT_FOUND, "no readable copy of " + set.object_id);
        for (const auto& b : sources) {
            auto adapter = adapters_.get(b);
            if (!adapter) continue;
            auto data = withRetry<Bytes>(retry, token, [&] {
                return guardedCall<Bytes>(b, "get", [&] { return adapter->get(set.object_id, token); });
            });
            if (data && static_cast<int64_t>(data->size()) == set.size_bytes) {
                payload = std::make_shared<const Bytes>(std::move(data.value()));
                return Ok();
            }
            if (!data) last = data.error();
            else last = Error(ErrorCode::ADAPTER_ERROR, b + " returned a copy of the wrong size");
        }
        return Err(last);
    }

    void runRound(ReplicaSet& set, const std::vector<Pick>& picks, const std::shared_ptr<const Bytes>& payload,
                  const CancellationToken& token) {
        auto now = clock_();
        for (const auto& p : picks) {
            auto* t = set.target(p.backend);
            if (!t) {
                set.targets.push_back(ReplicaTarget{p.backend, ReplicaStatus::PENDING, 0, "", now});
            } else {
                t->status = ReplicaStatus::PENDING;
                t->last_error.clear();
                t->updated_at = now;
            }
        }
        store(set);

        RetryPolicy retry = retryPolicy();
        std::vector<std::future<CopyOutcome>> futures;
        std::vector<std::shared_ptr<CopyWatch>> watches;
        std::vector<std::optional<CopyOutcome>> immediate(picks.size());
        futures.reserve(picks.size());
        for (size_t i = 0; i < picks.size(); ++i) {
            auto adapter = adapters_.get(picks[i].backend);
            ObjectId id = set.object_id;
            int64_t size = set.size_bytes;
            auto watch = std::make_shared<CopyWatch>();
            watches.push_back(watch);
            try {
                futures.push_back(pool_.submit([adapter, id, size, payload, token, retry, watch] {
                    CopyOutcome out = copyOne(*adapter, id, size, *payload, token, retry);
                    if (!watch->finish()) discardLateCopy(*adapter, id);
                    return out;
                }));
            } catch (const std::exception& e) {
                futures.emplace_back();
                immediate[i] = CopyOutcome{ReplicaStatus::FAILED, 0, e.what()};
            }
            ++copies_attempted_;
        }

        const auto deadline = token.deadline();
        for (size_t i = 0; i < picks.size(); ++i) {
            CopyOutcome out = immediate[i] ? *immediate[i] : awaitCopy(futures[i], *watches[i], deadline);
            const auto& p = picks[i];
            auto* t = set.target(p.backend);
            t->status = out.status;
            t->attempts += out.attempts;
            t->last_error = out.error;
            t->updated_at = clock_();
            if (out.attempts > 1) retries_ += out.attempts - 1;
            if (out.status == ReplicaStatus::VERIFIED) {
                ++copies_verified_;
                auto c = quotas_.commit(p.reservation);
                if (!c) LOG_WARNING("ReplicationCoordinator", "Commit failed on " + p.backend + ": " + c.error().message);
                LOG_DEBUG("ReplicationCoordinator", "Verified " + set.object_id + " on " + p.backend);
                if (events_) events_->emit(EventType::REPLICA_VERIFIED, "ReplicationCoordinator", set.object_id, p.backend, set.object_id);
            } else {
                ++copies_failed_;
                auto r = quotas_.release(p.reservation);
                if (!r) LOG_WARNING("ReplicationCoordinator", "Release failed on " + p.backend + ": " + r.error().message);
                LOG_WARNING("ReplicationCoordinator", "Copy of " + set.object_id + " to " + p.backend + " failed: " + out.error);
                if (events_) events_->emit(EventType::REPLICA_FAILED, "ReplicationCoordinator", out.error, p.backend, set.object_id);
            }
        }
        store(set);
    }

    /**
     * @brief Hand-off between a copy job and the round waiting on it
     *
     * Whichever side gets there first decides: a copy that finishes first
     * is collected, a round that gives up first owns nothing the copy does
     * afterwards.
     */
    struct CopyWatch {
        std::mutex mtx;
        bool finished = false;
        bool abandoned = false;

        /// Called by the job; false when the round already gave up
        bool finish() {
            std::lock_guard<std::mutex> lock(mtx);
            finished = true;
            return !abandoned;
        }

        /// Called by the round; false when the job already finished
        bool abandon() {
            std::lock_guard<std::mutex> lock(mtx);
            if (finished) return false;
            abandoned = true;
            return true;
        }
    };

    /// Wait for one copy, no longer than the caller's deadline
    static CopyOutcome awaitCopy(std::future<CopyOutcome>& f, CopyWatch& watch,
                                 const std::optional<std::chrono::steady_clock::time_point>& deadline) {
        if (deadline && f.wait_until(*deadline) == std::future_status::timeout && watch.abandon())
            return CopyOutcome{ReplicaStatus::FAILED, 1,
                               errorCodeToString(ErrorCode::ADAPTER_TIMEOUT) + ": copy still running at the deadline"};
        return f.get();
    }

    /// Remove a copy that landed after its round gave up on it
    static void discardLateCopy(BackendAdapter& adapter, const ObjectId& id) {
        auto r = guardedCall<void>(adapter.id(), "remove", [&] { return adapter.remove(id, CancellationToken()); });
        if (r) LOG_INFO("ReplicationCoordinator", "Discarded late copy of " + id + " on " + adapter.id());
        else if (!r.error().is(ErrorCode::NOT_FOUND)) LOG_WARNING("ReplicationCoordinator", "Late copy of " + id + " left on " + adapter.id() + ": " + r.error().toString());
    }

    /// Put then stat; runs on a pool worker
    static CopyOutcome copyOne(BackendAdapter& adapter, const ObjectId& id, int64_t size, const Bytes& data,
                               const CancellationToken& token, const RetryPolicy& retry) {
        CopyOutcome out;
        uint32_t attempts = 0;
        auto put = withRetry<void>(retry, token, [&] {
            return guardedCall<void>(adapter.id(), "put", [&] { return adapter.put(id, data, token); });
        }, &attempts);
        out.attempts = attempts;
        if (!put) {
            out.error = put.error().toString();
            return out;
        }
        auto st = withRetry<ObjectStat>(retry, token, [&] {
            return guardedCall<ObjectStat>(adapter.id(), "stat", [&] { return adapter.stat(id, token); });
        });
        if (!st) {
            out.error = "verification: " + st.error().toString();
            return out;
        }
        if (st->size_bytes != size) {
            out.error = "verification: size " + std::to_string(st->size_bytes) + " != " + std::to_string(size);
            return out;
        }
        out.status = ReplicaStatus::VERIFIED;
        return out;
    }

    Result<ReplicaSet> doVerify(const ObjectId& id, const CancellationToken& token) {
        auto existing = get(id);
        if (!existing) return Err<ReplicaSet>(ErrorCode::NOT_FOUND, "no replica set for " + id);
        ReplicaSet set = *existing;
        bool changed = false;
        for (auto& t : set.targets) {
            if (t.status != ReplicaStatus::VERIFIED) continue;
            auto adapter = adapters_.get(t.backend_id);
            if (!adapter) continue;
            auto st = guardedCall<ObjectStat>(t.backend_id, "stat", [&] { return adapter->stat(id, token); });
            if (st && st->size_bytes == set.size_bytes) continue;
            if (!st && !st.error().is(ErrorCode::NOT_FOUND)) {
                LOG_WARNING("ReplicationCoordinator", "Could not verify " + id + " on " + t.backend_id + ": " + st.error().toString());
                continue;
            }
            t.status = ReplicaStatus::FAILED;
            t.last_error = st ? "size " + std::to_string(st->size_bytes) + " != " + std::to_string(set.size_bytes) : "copy missing";
            t.updated_at = clock_();
            tracker_.record(t.backend_id, UsageDelta::remove(set.size_bytes));
            ++verification_failures_;
            changed = true;
            LOG_WARNING("ReplicationCoordinator", "Replica of " + id + " on " + t.backend_id + " failed verification: " + t.last_error);
            if (events_) events_->emit(EventType::REPLICA_FAILED, "ReplicationCoordinator", t.last_error, t.backend_id, id);
        }
        if (changed) {
            store(set);
            bool short_of_min = static_cast<int32_t>(set.verifiedCount()) < set.policy.min_redundancy;
            markDegraded(set, short_of_min);
            if (short_of_min && events_) {
                events_->emit(EventType::REPLICATION_DEGRADED, "ReplicationCoordinator",
                              id + " below minimum redundancy", set.policy_backend, id);
            }
        }
        return set;
    }

    Result<ReplicaSet> doRemove(const ObjectId& id, const CancellationToken& token) {
        auto existing = get(id);
        if (!existing) return Err<ReplicaSet>(ErrorCode::NOT_FOUND, "no replica set for " + id);
        ReplicaSet set = *existing;
        RetryPolicy retry = retryPolicy();
        std::vector<ReplicaTarget> kept;
        for (const auto& t : set.targets) {
            auto adapter = adapters_.get(t.backend_id);
            if (!adapter) {
                kept.push_back(t);
                continue;
            }
            auto r = withRetry<void>(retry, token, [&] {
                return guardedCall<void>(t.backend_id, "remove", [&] { return adapter->remove(id, token); });
            });
            if (!r && !r.error().is(ErrorCode::NOT_FOUND)) {
                LOG_WARNING("ReplicationCoordinator", "Could not remove " + id + " from " + t.backend_id + ": " + r.error().toString());
                kept.push_back(t);
                continue;
            }
            if (t.status == ReplicaStatus::VERIFIED) tracker_.record(t.backend_id, UsageDelta::remove(set.size_bytes));
        }
        if (!kept.empty()) {
            set.targets = kept;
            store(set);
            return Err<ReplicaSet>(ErrorCode::ADAPTER_ERROR, std::to_string(kept.size()) + " replica(s) of " + id + " could not be removed");
        }
        {
            std::lock_guard<std::mutex> lock(sets_mtx_);
            sets_.erase(id);
        }
        markDegraded(set, false);
        notify(id, nullptr);
        LOG_INFO("ReplicationCoordinator", "Removed all replicas of " + id);
        return set;
    }

    void store(ReplicaSet& set) {
        set.updated_at = clock_();
        {
            std::lock_guard<std::mutex> lock(sets_mtx_);
            sets_[set.object_id] = set;
        }
        notify(set.object_id, &set);
    }

    /// One open REPLICATION violation per policy backend while any of its objects is short
    void markDegraded(const ReplicaSet& set, bool degraded) {
        bool now_clean = false;
        size_t open = 0;
        {
            std::lock_guard<std::mutex> lock(sets_mtx_);
            auto& objs = degraded_[set.policy_backend];
            if (degraded) objs.insert(set.object_id);
            else if (objs.erase(set.object_id) > 0) now_clean = objs.empty();
            open = objs.size();
        }
        if (degraded) {
            violations_.report(set.policy_backend, PolicyKind::REPLICATION, Severity::CRITICAL,
                               static_cast<double>(set.verifiedCount()), static_cast<double>(set.policy.min_redundancy),
                               std::to_string(open) + " object(s) below min_redundancy, latest " + set.object_id);
        } else if (now_clean) {
            violations_.resolve(set.policy_backend, PolicyKind::REPLICATION);
        }
    }

    void notify(const ObjectId& id, const ReplicaSet* set) {
        ChangeListener l;
        { std::lock_guard<std::mutex> lock(listener_mtx_); l = listener_; }
        if (l) l(id, set);
    }

    PolicyStore& policies_;
    QuotaEnforcer& quotas_;
    ResourceTracker& tracker_;
    AdapterRegistry& adapters_;
    ViolationReporter& violations_;
    ThreadPool& pool_;
    RetryPolicy retry_;
    EventBus* events_;
    ClockFn clock_;

    mutable std::mutex sets_mtx_;
    std::map<ObjectId, ReplicaSet> sets_;
    std::map<BackendId, std::set<ObjectId>> degraded_;

    std::mutex inflight_mtx_;
    std::map<ObjectId, std::shared_future<Result<ReplicaSet>>> inflight_;

    std::mutex listener_mtx_;
    ChangeListener listener_;

    std::atomic<uint64_t> copies_attempted_{0}, copies_verified_{0}, copies_failed_{0}, retries_{0},
                          repairs_{0}, coalesced_{0}, verification_failures_{0}, insufficient_{0};
};

} // namespace tierguard
#endif
