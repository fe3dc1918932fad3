/**
 * @file tiered_cache_manager.hpp
 * @brief Object placement across an ordered hierarchy of cache tiers
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Tiers are ordered fastest (index 0) to slowest. New objects land in the
 * slowest tier with headroom and earn promotion one tier at a time through
 * their access count. Over-capacity tiers shed their least recently used
 * unpinned entries: non-last tiers demote them one tier down, the last tier
 * drops them.
 *
 * Locking: every tier has its own mutex; moves lock exactly the two tiers
 * involved with std::scoped_lock. A location index maps object ids to tiers
 * and is only written while the owning tier lock(s) are held, so lock order
 * is always tier(s) before index. The manager only rearranges metadata; data
 * movement is handed to a MoveHandler on the thread pool after all locks are
 * released.
 */
#ifndef TIERGUARD_TIERED_CACHE_MANAGER_HPP
#define TIERGUARD_TIERED_CACHE_MANAGER_HPP

#include "backend_policy.hpp"
#include "event_system.hpp"
#include "thread_pool.hpp"
#include "tg_logger.hpp"
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <memory>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace tierguard {

//=============================================================================
// Types
//=============================================================================

/**
 * @struct TierConfig
 * @brief Static description of one cache tier
 */
struct TierConfig {
    std::string name;
    BackendId backend_id;           ///< Backend holding the tier's copies
    int64_t capacity_bytes = 0;
    int64_t promote_threshold = 3;  ///< Accesses needed to enter this tier from below
    Seconds demote_after{0};        ///< Idle time before leaving this tier; 0 disables

    static TierConfig fromPolicy(const std::string& name, const BackendId& backend, const CachePolicy& p) {
        return TierConfig{name, backend, p.tier_capacity_bytes, p.promote_threshold, p.demote_threshold};
    }
};

/**
 * @struct CacheEntry
 * @brief Placement record of one cached object
 */
struct CacheEntry {
    ObjectId object_id;
    size_t tier = 0;
    int64_t size_bytes = 0;
    TimePoint last_access_time;
    TimePoint inserted_at;
    uint64_t access_count = 0;
    bool pinned = false;            ///< Exempt from eviction and demotion
};

/**
 * @struct TierState
 * @brief Inputs of the placement decision for one tier
 */
struct TierState {
    int64_t capacity_bytes = 0;
    int64_t used_bytes = 0;
    int64_t promote_threshold = 1;
    Seconds demote_after{0};
};

/**
 * @brief Decide what should happen to an entry
 *
 * Pure function of the entry, its tier, the next faster tier (nullptr for
 * the fastest tier) and the time. Promotion wins when the access count
 * reaches the faster tier's threshold and the entry could fit there at all;
 * otherwise unpinned entries of an over-capacity or idle-expired tier are
 * demoted, or evicted when the tier is the last one.
 */
[[nodiscard]] inline CacheAction decideCacheAction(const CacheEntry& entry, const TierState& tier,
                                                   const TierState* faster, bool is_last, TimePoint now) {
    if (faster && static_cast<int64_t>(entry.access_count) >= faster->promote_threshold &&
        entry.size_bytes <= faster->capacity_bytes) {
        return CacheAction::PROMOTE;
    }
    if (entry.pinned) return CacheAction::KEEP;
    bool over = tier.used_bytes > tier.capacity_bytes;
    bool idle = tier.demote_after.count() > 0 && now - entry.last_access_time >= tier.demote_after;
    if (over || idle) return is_last ? CacheAction::EVICT : CacheAction::DEMOTE;
    return CacheAction::KEEP;
}

enum class TierMoveKind { PLACE, PROMOTE, DEMOTE, EVICT, DROP };

/**
 * @struct TierMove
 * @brief Data movement requested by a placement change
 *
 * from_tier is empty for a first placement; to_tier is empty when the copy
 * leaves the cache.
 */
struct TierMove {
    TierMoveKind kind = TierMoveKind::PLACE;
    ObjectId object_id;
    int64_t size_bytes = 0;
    std::optional<size_t> from_tier;
    std::optional<size_t> to_tier;
    BackendId from_backend;
    BackendId to_backend;
};

/**
 * @struct AccessResult
 * @brief Outcome of one access()
 */
struct AccessResult {
    size_t tier = 0;
    bool hit = false;
    bool promoted = false;
    std::vector<ObjectId> evicted;  ///< Dropped from the cache; read them from the backend of record
    std::vector<TierMove> moves;
};

/**
 * @struct EvictionOutcome
 * @brief Entries moved or dropped by evict()
 */
struct EvictionOutcome {
    std::vector<ObjectId> demoted;
    std::vector<ObjectId> removed;
    std::vector<TierMove> moves;

    [[nodiscard]] bool empty() const { return demoted.empty() && removed.empty(); }
};

struct TierStatistics {
    std::string name;
    BackendId backend_id;
    int64_t capacity_bytes = 0;
    int64_t used_bytes = 0;
    size_t entries = 0;
    size_t pinned = 0;
    uint64_t hits = 0;
    uint64_t promotions = 0;    ///< Entries that moved into this tier from below
    uint64_t demotions = 0;     ///< Entries that left this tier downwards
    uint64_t evictions = 0;     ///< Entries dropped from the cache
};

struct CacheStatistics {
    std::vector<TierStatistics> tiers;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t bypasses = 0;      ///< Accesses refused with TIER_FULL

    [[nodiscard]] double hitRatio() const {
        auto total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

//=============================================================================
// TieredCacheManager
//=============================================================================

class TieredCacheManager {
public:
    using MoveHandler = std::function<void(const TierMove&)>;

    /**
     * @brief Build a manager after validating the tier list
     * @param pool Runs the move handler; when null the handler runs inline
     */
    static Result<std::unique_ptr<TieredCacheManager>> create(std::vector<TierConfig> tiers,
                                                              ClockFn clock = systemClock(),
                                                              EventBus* events = nullptr,
                                                              ThreadPool* pool = nullptr) {
        if (tiers.empty()) return Err<std::unique_ptr<TieredCacheManager>>(ErrorCode::INVALID_POLICY, "no cache tiers");
        for (const auto& t : tiers) {
            if (t.capacity_bytes <= 0)
                return Err<std::unique_ptr<TieredCacheManager>>(ErrorCode::INVALID_POLICY, "tier " + t.name + ": capacity must be positive");
            if (t.promote_threshold < 1)
                return Err<std::unique_ptr<TieredCacheManager>>(ErrorCode::INVALID_POLICY, "tier " + t.name + ": promote_threshold must be at least 1");
            if (t.demote_after.count() < 0)
                return Err<std::unique_ptr<TieredCacheManager>>(ErrorCode::INVALID_POLICY, "tier " + t.name + ": negative demote threshold");
        }
        return std::unique_ptr<TieredCacheManager>(
            new TieredCacheManager(std::move(tiers), std::move(clock), events, pool));
    }

    TieredCacheManager(const TieredCacheManager&) = delete;
    TieredCacheManager& operator=(const TieredCacheManager&) = delete;

    void setMoveHandler(MoveHandler h) {
        std::lock_guard<std::mutex> lock(handler_mtx_);
        handler_ = std::move(h);
    }

    [[nodiscard]] size_t tierCount() const { return tiers_.size(); }
    [[nodiscard]] const std::string& tierName(size_t i) const { return tiers_.at(i)->name; }
    [[nodiscard]] const BackendId& tierBackend(size_t i) const { return tiers_.at(i)->backend_id; }

    /**
     * @brief Record an access, placing the object on first sight
     * @return TIER_FULL when no tier can make room; the caller reads the
     *         backend of record directly
     */
    Result<AccessResult> access(const ObjectId& id, int64_t size) {
        if (id.empty() || size < 0) return Err<AccessResult>(ErrorCode::INVALID_ARGUMENT, "bad cache access for '" + id + "'");
        for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
            if (auto loc = locate(id)) {
                auto touched = touch(id, *loc, size);
                if (!touched) continue;
                dispatch(touched->moves);
                return std::move(*touched);
            }
            auto placed = place(id, size);
            if (!placed) return Err<AccessResult>(placed.error());
            if (!placed.value()) continue;
            dispatch(placed.value()->moves);
            return std::move(*placed.value());
        }
        return Err<AccessResult>(ErrorCode::RESOURCE_BUSY, "object " + id + " kept moving between tiers");
    }

    /**
     * @brief Bring a tier back within capacity
     *
     * No-op for a tier within capacity. Demotions cascade into slower tiers.
     * @return TIER_FULL if only pinned entries are left and the tier is still over
     */
    Result<EvictionOutcome> evict(size_t tier) {
        if (tier >= tiers_.size()) return Err<EvictionOutcome>(ErrorCode::INVALID_ARGUMENT, "no tier " + std::to_string(tier));
        EvictionOutcome out;
        auto r = cascade(tier, out);
        dispatch(out.moves);
        if (!r) return Err<EvictionOutcome>(r.error());
        return out;
    }

    Result<void> pin(const ObjectId& id) { return setPinned(id, true); }
    Result<void> unpin(const ObjectId& id) { return setPinned(id, false); }

    /// Drop an object from the cache; false if it was not cached
    bool remove(const ObjectId& id) {
        std::vector<TierMove> moves;
        bool removed = withEntry(id, [&](Tier& t, size_t i, CacheEntry& e) {
            moves.push_back({TierMoveKind::DROP, id, e.size_bytes, i, std::nullopt, t.backend_id, ""});
            t.used_bytes -= e.size_bytes;
            t.entries.erase(id);
            std::unique_lock ilock(index_mtx_);
            index_.erase(id);
        });
        dispatch(moves);
        return removed;
    }

    [[nodiscard]] std::optional<CacheEntry> find(const ObjectId& id) {
        std::optional<CacheEntry> out;
        withEntry(id, [&](Tier&, size_t, CacheEntry& e) { out = e; });
        return out;
    }

    /// Resize a tier and evict down to the new capacity
    Result<EvictionOutcome> setTierCapacity(size_t tier, int64_t bytes) {
        if (tier >= tiers_.size()) return Err<EvictionOutcome>(ErrorCode::INVALID_ARGUMENT, "no tier " + std::to_string(tier));
        if (bytes <= 0) return Err<EvictionOutcome>(ErrorCode::INVALID_POLICY, "tier capacity must be positive");
        {
            std::lock_guard<std::mutex> lock(tiers_[tier]->mtx);
            tiers_[tier]->capacity_bytes = bytes;
        }
        LOG_INFO("TieredCacheManager", "Tier " + tiers_[tier]->name + " capacity set to " + formatBytes(bytes));
        return evict(tier);
    }

    /**
     * @brief Apply idle demotion and eviction
     * @return Number of entries moved or dropped
     */
    size_t runMaintenance() {
        size_t actions = 0;
        auto now = clock_();
        std::vector<TierMove> moves;

        // Collect first so an entry moves at most one tier per pass
        std::vector<std::vector<ObjectId>> due(tiers_.size());
        for (size_t i = 0; i < tiers_.size(); ++i) {
            std::lock_guard<std::mutex> lock(tiers_[i]->mtx);
            for (const auto& [oid, e] : tiers_[i]->entries) {
                if (idleDue(i, e, now)) due[i].push_back(oid);
            }
        }
        for (size_t n = tiers_.size(); n-- > 0;) {
            for (const auto& oid : due[n]) {
                if (isLast(n)) {
                    std::lock_guard<std::mutex> lock(tiers_[n]->mtx);
                    auto it = tiers_[n]->entries.find(oid);
                    if (it != tiers_[n]->entries.end() && idleDue(n, it->second, now) && dropLocked(n, oid, moves)) ++actions;
                } else {
                    std::scoped_lock lock(tiers_[n]->mtx, tiers_[n + 1]->mtx);
                    auto it = tiers_[n]->entries.find(oid);
                    if (it != tiers_[n]->entries.end() && idleDue(n, it->second, now) && demoteLocked(n, oid, moves, nullptr)) ++actions;
                }
            }
            if (!isLast(n)) {
                EvictionOutcome out;
                auto r = cascade(n + 1, out);
                if (!r) LOG_WARNING("TieredCacheManager", "Maintenance left tier " + tiers_[n + 1]->name + " over capacity");
                actions += out.demoted.size() + out.removed.size();
                moves.insert(moves.end(), out.moves.begin(), out.moves.end());
            }
        }
        dispatch(moves);
        if (actions > 0) LOG_DEBUG("TieredCacheManager", "Maintenance moved " + std::to_string(actions) + " entries");
        return actions;
    }

    [[nodiscard]] CacheStatistics statistics() const {
        CacheStatistics s;
        for (const auto& tp : tiers_) {
            std::lock_guard<std::mutex> lock(tp->mtx);
            TierStatistics ts = tp->stats;
            ts.name = tp->name;
            ts.backend_id = tp->backend_id;
            ts.capacity_bytes = tp->capacity_bytes;
            ts.used_bytes = tp->used_bytes;
            ts.entries = tp->entries.size();
            ts.pinned = static_cast<size_t>(std::count_if(tp->entries.begin(), tp->entries.end(),
                [](const auto& kv) { return kv.second.pinned; }));
            s.tiers.push_back(ts);
        }
        s.hits = hits_.load();
        s.misses = misses_.load();
        s.bypasses = bypasses_.load();
        return s;
    }

    /// Placement invariants: used bytes match entries, each id in exactly one tier
    [[nodiscard]] bool checkInvariants() const {
        std::unordered_map<ObjectId, size_t> seen;
        for (size_t i = 0; i < tiers_.size(); ++i) {
            std::lock_guard<std::mutex> lock(tiers_[i]->mtx);
            int64_t sum = 0;
            for (const auto& [oid, e] : tiers_[i]->entries) {
                if (!seen.emplace(oid, i).second || e.tier != i) return false;
                sum += e.size_bytes;
            }
            if (sum != tiers_[i]->used_bytes) return false;
        }
        std::shared_lock ilock(index_mtx_);
        if (index_.size() != seen.size()) return false;
        for (const auto& [oid, i] : seen) {
            auto it = index_.find(oid);
            if (it == index_.end() || it->second != i) return false;
        }
        return true;
    }

    [[nodiscard]] std::string generateReport() const {
        auto s = statistics();
        std::ostringstream oss;
        oss << "=== Cache Report ===\n"
            << "Hits: " << s.hits << "  Misses: " << s.misses << "  Bypasses: " << s.bypasses
            << "  Hit ratio: " << std::fixed << std::setprecision(1) << s.hitRatio() * 100.0 << "%\n";
        for (size_t i = 0; i < s.tiers.size(); ++i) {
            const auto& t = s.tiers[i];
            double pct = t.capacity_bytes ? 100.0 * static_cast<double>(t.used_bytes) / static_cast<double>(t.capacity_bytes) : 0.0;
            oss << "  [" << i << "] " << t.name << " (" << t.backend_id << "): "
                << formatBytes(t.used_bytes) << " / " << formatBytes(t.capacity_bytes)
                << " (" << std::setprecision(1) << pct << "%), " << t.entries << " entries, "
                << t.pinned << " pinned, +" << t.promotions << " -" << t.demotions << " x" << t.evictions << "\n";
        }
        return oss.str();
    }

private:
    static constexpr int kMaxRetries = 64;

    struct Tier {
        std::string name;
        BackendId backend_id;
        int64_t promote_threshold = 1;
        Seconds demote_after{0};
        mutable std::mutex mtx;
        std::atomic<int64_t> capacity_bytes{0};
        int64_t used_bytes = 0;
        std::unordered_map<ObjectId, CacheEntry> entries;
        TierStatistics stats;
    };

    TieredCacheManager(std::vector<TierConfig> tiers, ClockFn clock, EventBus* events, ThreadPool* pool)
        : clock_(std::move(clock)), events_(events), pool_(pool) {
        for (const auto& c : tiers) {
            auto t = std::make_unique<Tier>();
            t->name = c.name;
            t->backend_id = c.backend_id;
            t->promote_threshold = c.promote_threshold;
            t->demote_after = c.demote_after;
            t->capacity_bytes = c.capacity_bytes;
            tiers_.push_back(std::move(t));
        }
    }

    [[nodiscard]] bool isLast(size_t i) const { return i + 1 == tiers_.size(); }

    /// Idle check only; overflow goes through cascade(). Caller holds the tier lock.
    bool idleDue(size_t i, const CacheEntry& e, TimePoint now) const {
        TierState st = stateOf(*tiers_[i]);
        st.used_bytes = 0;
        auto a = decideCacheAction(e, st, nullptr, isLast(i), now);
        return a == CacheAction::DEMOTE || a == CacheAction::EVICT;
    }

    /// Caller holds t.mtx
    static TierState stateOf(const Tier& t) {
        return TierState{t.capacity_bytes.load(), t.used_bytes, t.promote_threshold, t.demote_after};
    }

    std::optional<size_t> locate(const ObjectId& id) const {
        std::shared_lock lock(index_mtx_);
        auto it = index_.find(id);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    /// Run f on the entry under its tier lock, retrying if the entry moves
    template<typename F>
    bool withEntry(const ObjectId& id, F&& f) {
        for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
            auto loc = locate(id);
            if (!loc) return false;
            Tier& t = *tiers_[*loc];
            std::lock_guard<std::mutex> lock(t.mtx);
            auto it = t.entries.find(id);
            if (it == t.entries.end()) continue;
            f(t, *loc, it->second);
            return true;
        }
        LOG_WARNING("TieredCacheManager", "Gave up locating " + id + " after repeated moves");
        return false;
    }

    Result<void> setPinned(const ObjectId& id, bool pinned) {
        bool found = withEntry(id, [pinned](Tier&, size_t, CacheEntry& e) { e.pinned = pinned; });
        if (!found) return Err(ErrorCode::NOT_FOUND, "object not cached: " + id);
        LOG_DEBUG("TieredCacheManager", (pinned ? "Pinned " : "Unpinned ") + id);
        return Ok();
    }

    /// Existing entry: update recency, maybe promote, shed overflow
    std::optional<AccessResult> touch(const ObjectId& id, size_t i, int64_t size) {
        AccessResult res;
        bool want_promote = false;
        bool over = false;
        {
            Tier& t = *tiers_[i];
            std::lock_guard<std::mutex> lock(t.mtx);
            auto it = t.entries.find(id);
            if (it == t.entries.end()) return std::nullopt;
            auto now = clock_();
            CacheEntry& e = it->second;
            e.last_access_time = now;
            ++e.access_count;
            if (size != e.size_bytes) {
                t.used_bytes += size - e.size_bytes;
                e.size_bytes = size;
            }
            ++t.stats.hits;
            ++hits_;
            res.tier = i;
            res.hit = true;
            // Capacity is atomic so the faster tier is read without its lock;
            // promote() re-checks under both locks.
            std::optional<TierState> faster;
            if (i > 0) faster = TierState{tiers_[i - 1]->capacity_bytes.load(), 0,
                                          tiers_[i - 1]->promote_threshold, tiers_[i - 1]->demote_after};
            auto action = decideCacheAction(e, stateOf(t), faster ? &*faster : nullptr, isLast(i), now);
            want_promote = action == CacheAction::PROMOTE;
            over = t.used_bytes > t.capacity_bytes.load();
        }
        if (want_promote && promote(id, i, res)) {
            res.promoted = true;
            over = true;
        }
        if (over) {
            EvictionOutcome out;
            auto r = cascade(i, out);
            if (!r) LOG_WARNING("TieredCacheManager", r.error().message);
            res.evicted.insert(res.evicted.end(), out.removed.begin(), out.removed.end());
            res.moves.insert(res.moves.end(), out.moves.begin(), out.moves.end());
        }
        return res;
    }

    /**
     * @brief Move an entry from tier i to i - 1, demoting LRU victims to make room
     * @return false if the entry moved away or the faster tier cannot make room
     */
    bool promote(const ObjectId& id, size_t i, AccessResult& res) {
        Tier& src = *tiers_[i];
        Tier& dst = *tiers_[i - 1];
        std::vector<ObjectId> victims;
        {
            std::scoped_lock lock(dst.mtx, src.mtx);
            auto it = src.entries.find(id);
            if (it == src.entries.end()) return false;
            int64_t size = it->second.size_bytes;
            if (size > dst.capacity_bytes) return false;
            int64_t need = dst.used_bytes + size - dst.capacity_bytes;
            if (need > 0) {
                int64_t freed = 0;
                for (const CacheEntry* v : lruOrder(dst)) {
                    if (freed >= need) break;
                    victims.push_back(v->object_id);
                    freed += v->size_bytes;
                }
                if (freed < need) return false;
            }
            for (const auto& v : victims) demoteLocked(i - 1, v, res.moves, nullptr);

            it = src.entries.find(id);
            CacheEntry e = std::move(it->second);
            src.entries.erase(it);
            src.used_bytes -= e.size_bytes;
            e.tier = i - 1;
            dst.used_bytes += e.size_bytes;
            ++dst.stats.promotions;
            res.moves.push_back({TierMoveKind::PROMOTE, id, e.size_bytes, i, i - 1, src.backend_id, dst.backend_id});
            dst.entries.emplace(id, std::move(e));
            std::unique_lock ilock(index_mtx_);
            index_[id] = i - 1;
        }
        res.tier = i - 1;
        LOG_DEBUG("TieredCacheManager", "Promoted " + id + " to " + dst.name +
                  (victims.empty() ? "" : ", demoted " + std::to_string(victims.size()) + " entries"));
        return true;
    }

    /// New object: slowest tier with headroom, else make room in the last tier
    Result<std::optional<AccessResult>> place(const ObjectId& id, int64_t size) {
        auto now = clock_();
        for (size_t n = tiers_.size(); n-- > 0;) {
            Tier& t = *tiers_[n];
            std::lock_guard<std::mutex> lock(t.mtx);
            if (t.used_bytes + size > t.capacity_bytes) continue;
            std::unique_lock ilock(index_mtx_);
            if (index_.count(id)) return std::optional<AccessResult>{};
            AccessResult res;
            insertLocked(t, n, id, size, now, res);
            return std::optional<AccessResult>{std::move(res)};
        }

        size_t last = tiers_.size() - 1;
        Tier& t = *tiers_[last];
        std::lock_guard<std::mutex> lock(t.mtx);
        std::vector<const CacheEntry*> victims;
        int64_t need = t.used_bytes + size - t.capacity_bytes;
        int64_t freed = 0;
        if (size <= t.capacity_bytes) {
            for (const CacheEntry* v : lruOrder(t)) {
                if (freed >= need) break;
                victims.push_back(v);
                freed += v->size_bytes;
            }
        }
        if (size > t.capacity_bytes || freed < need) {
            ++bypasses_;
            LOG_DEBUG("TieredCacheManager", "No evictable capacity for " + id + " (" + formatBytes(size) + ")");
            return Err<std::optional<AccessResult>>(ErrorCode::TIER_FULL, "no evictable capacity for " + id);
        }
        std::unique_lock ilock(index_mtx_);
        if (index_.count(id)) return std::optional<AccessResult>{};
        AccessResult res;
        std::vector<ObjectId> ids;
        for (const CacheEntry* v : victims) ids.push_back(v->object_id);
        for (const auto& vid : ids) {
            auto& e = t.entries.at(vid);
            res.moves.push_back({TierMoveKind::EVICT, vid, e.size_bytes, last, std::nullopt, t.backend_id, ""});
            t.used_bytes -= e.size_bytes;
            t.entries.erase(vid);
            index_.erase(vid);
            ++t.stats.evictions;
            res.evicted.push_back(vid);
        }
        insertLocked(t, last, id, size, now, res);
        return std::optional<AccessResult>{std::move(res)};
    }

    /// Caller holds t.mtx and the index write lock
    void insertLocked(Tier& t, size_t n, const ObjectId& id, int64_t size, TimePoint now, AccessResult& res) {
        CacheEntry e;
        e.object_id = id;
        e.tier = n;
        e.size_bytes = size;
        e.last_access_time = e.inserted_at = now;
        e.access_count = 1;
        t.entries.emplace(id, e);
        t.used_bytes += size;
        index_[id] = n;
        ++misses_;
        res.tier = n;
        res.hit = false;
        res.moves.push_back({TierMoveKind::PLACE, id, size, std::nullopt, n, "", t.backend_id});
    }

    /// Unpinned entries, least recently used first, then least accessed
    static std::vector<const CacheEntry*> lruOrder(const Tier& t) {
        std::vector<const CacheEntry*> v;
        for (const auto& [oid, e] : t.entries) if (!e.pinned) v.push_back(&e);
        std::sort(v.begin(), v.end(), [](const CacheEntry* a, const CacheEntry* b) {
            if (a->last_access_time != b->last_access_time) return a->last_access_time < b->last_access_time;
            if (a->access_count != b->access_count) return a->access_count < b->access_count;
            return a->object_id < b->object_id;
        });
        return v;
    }

    /**
     * @brief Move one entry from tier i to i + 1
     *
     * Caller holds both tier locks. The demoted entry restarts its access
     * count so it has to earn promotion again.
     */
    bool demoteLocked(size_t i, const ObjectId& id, std::vector<TierMove>& moves, EvictionOutcome* out) {
        Tier& src = *tiers_[i];
        Tier& dst = *tiers_[i + 1];
        auto it = src.entries.find(id);
        if (it == src.entries.end() || it->second.pinned) return false;
        CacheEntry e = std::move(it->second);
        src.entries.erase(it);
        src.used_bytes -= e.size_bytes;
        ++src.stats.demotions;
        e.tier = i + 1;
        e.access_count = 0;
        dst.used_bytes += e.size_bytes;
        moves.push_back({TierMoveKind::DEMOTE, id, e.size_bytes, i, i + 1, src.backend_id, dst.backend_id});
        dst.entries.emplace(id, std::move(e));
        {
            std::unique_lock ilock(index_mtx_);
            index_[id] = i + 1;
        }
        if (out) out->demoted.push_back(id);
        return true;
    }

    /// Caller holds the tier lock
    bool dropLocked(size_t i, const ObjectId& id, std::vector<TierMove>& moves) {
        Tier& t = *tiers_[i];
        auto it = t.entries.find(id);
        if (it == t.entries.end() || it->second.pinned) return false;
        moves.push_back({TierMoveKind::EVICT, id, it->second.size_bytes, i, std::nullopt, t.backend_id, ""});
        t.used_bytes -= it->second.size_bytes;
        t.entries.erase(it);
        ++t.stats.evictions;
        std::unique_lock ilock(index_mtx_);
        index_.erase(id);
        return true;
    }

    /// Shed overflow from tier i and every slower tier it spills into
    Result<void> cascade(size_t i, EvictionOutcome& out) {
        for (size_t cur = i; cur < tiers_.size(); ++cur) {
            bool spilled = false;
            auto now = clock_();
            if (isLast(cur)) {
                Tier& t = *tiers_[cur];
                std::lock_guard<std::mutex> lock(t.mtx);
                while (t.used_bytes > t.capacity_bytes) {
                    auto order = lruOrder(t);
                    if (order.empty()) return tierFull(t);
                    const CacheEntry& victim = *order.front();
                    if (decideCacheAction(victim, stateOf(t), nullptr, true, now) != CacheAction::EVICT) return tierFull(t);
                    ObjectId vid = victim.object_id;
                    dropLocked(cur, vid, out.moves);
                    out.removed.push_back(vid);
                }
            } else {
                Tier& t = *tiers_[cur];
                std::scoped_lock lock(t.mtx, tiers_[cur + 1]->mtx);
                while (t.used_bytes > t.capacity_bytes) {
                    auto order = lruOrder(t);
                    if (order.empty()) return tierFull(t);
                    const CacheEntry& victim = *order.front();
                    if (decideCacheAction(victim, stateOf(t), nullptr, false, now) != CacheAction::DEMOTE) return tierFull(t);
                    ObjectId vid = victim.object_id;
                    demoteLocked(cur, vid, out.moves, &out);
                    spilled = true;
                }
            }
            if (!spilled) break;
        }
        return Ok();
    }

    static Result<void> tierFull(const Tier& t) {
        return Err(ErrorCode::TIER_FULL, "tier " + t.name + " over capacity with only pinned entries");
    }

    /// Publish events and hand data movement to the pool, outside all locks
    void dispatch(const std::vector<TierMove>& moves) {
        if (moves.empty()) return;
        MoveHandler h;
        { std::lock_guard<std::mutex> lock(handler_mtx_); h = handler_; }
        for (const auto& m : moves) {
            if (events_) {
                switch (m.kind) {
                    case TierMoveKind::PROMOTE:
                        events_->emit(EventType::CACHE_PROMOTED, "TieredCacheManager", m.object_id + " -> " + m.to_backend, m.to_backend, m.object_id);
                        break;
                    case TierMoveKind::DEMOTE:
                        events_->emit(EventType::CACHE_DEMOTED, "TieredCacheManager", m.object_id + " -> " + m.to_backend, m.to_backend, m.object_id);
                        break;
                    case TierMoveKind::EVICT:
                        events_->emit(EventType::CACHE_EVICTED, "TieredCacheManager", m.object_id + " left " + m.from_backend, m.from_backend, m.object_id);
                        break;
                    default:
                        break;
                }
            }
            if (!h) continue;
            auto job = [h, m] {
                try {
                    h(m);
                } catch (const std::exception& e) {
                    LOG_ERROR("TieredCacheManager", "Move handler failed for " + m.object_id + ": " + e.what());
                }
            };
            if (pool_) {
                auto posted = pool_->post(job);
                if (!posted) LOG_WARNING("TieredCacheManager", "Dropped tier move for " + m.object_id + ": " + posted.error().message);
            } else {
                job();
            }
        }
    }

    ClockFn clock_;
    EventBus* events_;
    ThreadPool* pool_;
    std::vector<std::unique_ptr<Tier>> tiers_;
    mutable std::shared_mutex index_mtx_;
    std::unordered_map<ObjectId, size_t> index_;
    std::atomic<uint64_t> hits_{0}, misses_{0}, bypasses_{0};
    std::mutex handler_mtx_;
    MoveHandler handler_;
};

} // namespace tierguard
#endif
