/**
 * @file test_all.cpp
 * @brief Component tests for TierGuard
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "test_helpers.hpp"
#include "policy_store.hpp"
#include "resource_tracker.hpp"
#include "quota_enforcer.hpp"
#include "violation_reporter.hpp"
#include "tiered_cache_manager.hpp"
#include "replication_coordinator.hpp"
#include "cancellation.hpp"

#include <thread>
#include <chrono>
#include <atomic>

using namespace tierguard;
using namespace tierguard::testing;

TEST_CASE_SUITE(ContextNestsOutermostFirst, Result) {
    Error inner(ErrorCode::ADAPTER_TIMEOUT, "put timed out");
    Error outer = inner.within("disk/obj").within("store");
    REQUIRE_EQ(outer.context, "store / disk/obj");
    REQUIRE_EQ(outer.toString(), "ADAPTER_TIMEOUT: put timed out [store / disk/obj]");
    REQUIRE(outer.isRetryable());
    REQUIRE_FALSE(outer.isRefusal());

    Result<void> ok = Ok();
    REQUIRE_OK(ok.withContext("unused"));
    auto failed = Err<int>(ErrorCode::RETENTION_LOCKED, "held").withContext("obj");
    REQUIRE_ERR(failed, ErrorCode::RETENTION_LOCKED);
    REQUIRE(failed.error().isRefusal());
    REQUIRE_EQ(failed.error().context, "obj");
}

//=============================================================================
// Policy Store
//=============================================================================

TEST_CASE_SUITE(RejectsInvalidPolicies, PolicyStore) {
    PolicyStore store;
    REQUIRE_ERR(store.set("disk", StorageQuotaPolicy{-1, 0, 0.8}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(store.set("disk", StorageQuotaPolicy{1000, 0, 1.5}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(store.set("disk", TrafficQuotaPolicy{100, Seconds(0), 0, 0.8}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(store.set("disk", ReplicationPolicy{ReplicationStrategy::SIMPLE, 3, 2, {}}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(store.set("disk", ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 2, {"a", "a"}}),
                ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(store.set("disk", CachePolicy{0, 1, Seconds(0)}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(store.set("bad|id", RetentionPolicy{}), ErrorCode::INVALID_ARGUMENT);
    REQUIRE_FALSE(store.get("disk", PolicyKind::STORAGE_QUOTA).has_value());
    REQUIRE_EMPTY(store.list("disk"));
}

TEST_CASE_SUITE(ReplacesPolicyOfSameKind, PolicyStore) {
    PolicyStore store;
    REQUIRE_OK(store.set("disk", StorageQuotaPolicy{1000, 10, 0.8}));
    REQUIRE_OK(store.set("disk", StorageQuotaPolicy{2000, 20, 0.9}));
    REQUIRE_SIZE(store.list("disk"), 1u);
    auto q = store.getAs<StorageQuotaPolicy>("disk");
    REQUIRE(q.has_value());
    REQUIRE_EQ(q->max_bytes, 2000);
    REQUIRE_EQ(q->max_files, 20);

    REQUIRE_OK(store.set("disk", ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 2, {"tape"}}));
    REQUIRE_SIZE(store.list("disk"), 2u);
    REQUIRE_FALSE(store.get("disk", PolicyKind::CACHE).has_value());
}

TEST_CASE_SUITE(DisabledPolicyReadsAsUnconfigured, PolicyStore) {
    PolicyStore store;
    REQUIRE_OK(store.set("disk", RetentionPolicy{Seconds(60), Seconds(0), false}));
    REQUIRE_OK(store.setEnabled("disk", PolicyKind::RETENTION, false));
    REQUIRE_FALSE(store.get("disk", PolicyKind::RETENTION).has_value());
    auto all = store.list("disk");
    REQUIRE_SIZE(all, 1u);
    REQUIRE_FALSE(all[0].enabled);

    // Replacing the body keeps the flag
    REQUIRE_OK(store.set("disk", RetentionPolicy{Seconds(120), Seconds(0), true}));
    REQUIRE_FALSE(store.get("disk", PolicyKind::RETENTION).has_value());
    REQUIRE_OK(store.setEnabled("disk", PolicyKind::RETENTION, true));
    REQUIRE(store.getAs<RetentionPolicy>("disk")->legal_hold);

    REQUIRE_ERR(store.setEnabled("disk", PolicyKind::CACHE, true), ErrorCode::NOT_FOUND);
    REQUIRE_OK(store.remove("disk", PolicyKind::RETENTION));
    REQUIRE_ERR(store.remove("disk", PolicyKind::RETENTION), ErrorCode::NOT_FOUND);
}

TEST_CASE_SUITE(SnapshotIsUnaffectedByLaterWrites, PolicyStore) {
    PolicyStore store;
    REQUIRE_OK(store.set("disk", StorageQuotaPolicy{1000, 0, 0.8}));
    auto before = store.snapshot("disk");
    REQUIRE_OK(store.set("disk", StorageQuotaPolicy{5000, 0, 0.8}));
    REQUIRE_EQ(std::get<StorageQuotaPolicy>(before->at(PolicyKind::STORAGE_QUOTA).policy).max_bytes, 1000);
    REQUIRE_EQ(store.getAs<StorageQuotaPolicy>("disk")->max_bytes, 5000);
}

TEST_CASE_SUITE(ChangeListenerAndBackends, PolicyStore) {
    PolicyStore store;
    int changes = 0;
    store.setChangeListener([&changes] { ++changes; });
    REQUIRE_OK(store.registerBackend(BackendInfo{"disk", {}, "us-east", true}));
    REQUIRE_ERR(store.registerBackend(BackendInfo{"disk", {}, "us-east", true}), ErrorCode::ALREADY_EXISTS);
    REQUIRE_OK(store.set("disk", CachePolicy{100, 2, Seconds(0)}));
    REQUIRE_OK(store.setBackendEnabled("disk", false));
    REQUIRE_FALSE(store.isBackendEnabled("disk"));
    REQUIRE(store.isBackendEnabled("not-registered-yet"));
    REQUIRE_ERR(store.setBackendEnabled("ghost", true), ErrorCode::BACKEND_NOT_FOUND);
    REQUIRE_EQ(changes, 3);
}

TEST_CASE_SUITE(EncodedPolicyDecodes, PolicyStore) {
    Policy p = ReplicationPolicy{ReplicationStrategy::GEO_AWARE, 2, 3, {"east", "west", "tape"}};
    auto decoded = decodePolicy(PolicyKind::REPLICATION, encodePolicy(p));
    REQUIRE_OK(decoded);
    const auto& r = std::get<ReplicationPolicy>(decoded.value());
    REQUIRE(r.strategy == ReplicationStrategy::GEO_AWARE);
    REQUIRE_EQ(r.min_redundancy, 2);
    REQUIRE_EQ(r.max_redundancy, 3);
    REQUIRE_SIZE(r.preferred_backends, 3u);
    REQUIRE_EQ(r.preferred_backends[2], "tape");

    auto quota = decodePolicy(PolicyKind::STORAGE_QUOTA, encodePolicy(StorageQuotaPolicy{1000, 0, 0.12345678}));
    REQUIRE_OK(quota);
    REQUIRE(std::get<StorageQuotaPolicy>(quota.value()).warn_threshold == 0.12345678);
    auto traffic = decodePolicy(PolicyKind::TRAFFIC_QUOTA,
                                encodePolicy(TrafficQuotaPolicy{100, Seconds(60), 0, 0.1 + 0.2}));
    REQUIRE_OK(traffic);
    REQUIRE(std::get<TrafficQuotaPolicy>(traffic.value()).warn_threshold == 0.1 + 0.2);

    REQUIRE_ERR(decodePolicy(PolicyKind::STORAGE_QUOTA, "max_bytes=lots"), ErrorCode::CONFIG_PARSE_ERROR);
    REQUIRE_ERR(decodePolicy(PolicyKind::REPLICATION, "strategy=random"), ErrorCode::CONFIG_PARSE_ERROR);
}

//=============================================================================
// Resource Tracker
//=============================================================================

TEST_CASE_SUITE(WindowResetsLazily, ResourceTracker) {
    ManualClock clock;
    ResourceTracker tracker(clock.fn(), Seconds(60));
    tracker.record("disk", UsageDelta::read(100));
    tracker.record("disk", UsageDelta::read(50));
    auto u = tracker.snapshot("disk");
    REQUIRE_EQ(u.bytes_transferred_in_window, 150);
    REQUIRE_EQ(u.request_count_in_window, 2);

    clock.advance(Seconds(59));
    REQUIRE_EQ(tracker.snapshot("disk").bytes_transferred_in_window, 150);

    clock.advance(Seconds(1));
    u = tracker.snapshot("disk");
    REQUIRE_EQ(u.bytes_transferred_in_window, 0);
    REQUIRE_EQ(u.request_count_in_window, 0);
    REQUIRE_EQ(u.lifetime_bytes_transferred, 150u);
    REQUIRE_EQ(u.lifetime_requests, 2u);
    REQUIRE(u.last_reset_time == clock.now());
}

TEST_CASE_SUITE(ReservationsCountAsPending, ResourceTracker) {
    ResourceTracker tracker;
    UsageLimits limits{100, 0, 0, 0};
    auto first = tracker.reserve("disk", UsageDelta::store(60), limits);
    REQUIRE_OK(first);
    REQUIRE_EQ(tracker.snapshot("disk").pending_bytes, 60);
    REQUIRE_ERR(tracker.reserve("disk", UsageDelta::store(50), limits), ErrorCode::QUOTA_EXCEEDED);

    REQUIRE_OK(tracker.release(first.value()));
    auto second = tracker.reserve("disk", UsageDelta::store(50), limits);
    REQUIRE_OK(second);
    REQUIRE_OK(tracker.commit(second.value()));
    auto u = tracker.snapshot("disk");
    REQUIRE_EQ(u.bytes_used, 50);
    REQUIRE_EQ(u.file_count, 1);
    REQUIRE_EQ(u.pending_bytes, 0);
    REQUIRE_EQ(tracker.openReservations("disk"), 0u);
    REQUIRE_ERR(tracker.commit(second.value()), ErrorCode::NOT_FOUND);
}

TEST_CASE_SUITE(StorageCountersNeverGoNegative, ResourceTracker) {
    ResourceTracker tracker;
    tracker.record("disk", UsageDelta::store(10));
    tracker.record("disk", UsageDelta::remove(100));
    tracker.record("disk", UsageDelta::remove(100));
    auto u = tracker.snapshot("disk");
    REQUIRE_EQ(u.bytes_used, 0);
    REQUIRE_EQ(u.file_count, 0);
}

//=============================================================================
// Quota Enforcer
//=============================================================================

namespace {
struct QuotaRig {
    ManualClock clock;
    PolicyStore policies{clock.fn()};
    ResourceTracker tracker{clock.fn()};
    EventBus events;
    ViolationReporter violations{&events, clock.fn()};
    QuotaEnforcer quotas{policies, tracker, violations, &events};

    void store(const BackendId& b, int64_t size) {
        auto r = quotas.reserve(b, UsageDelta::store(size));
        if (!r) throw std::runtime_error("reserve failed: " + r.error().toString());
        auto c = quotas.commit(r.value());
        if (!c) throw std::runtime_error("commit failed: " + c.error().toString());
    }
};
}

TEST_CASE_SUITE(WarnThenRejectAtHardLimit, QuotaEnforcer) {
    QuotaRig rig;
    REQUIRE_OK(rig.policies.set("disk", StorageQuotaPolicy{1000, 0, 0.8}));

    rig.store("disk", 850);
    REQUIRE(rig.violations.hasOpen("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN));
    REQUIRE_EQ(rig.events.countOf(EventType::QUOTA_WARNING), 1u);

    REQUIRE_ERR(rig.quotas.reserve("disk", UsageDelta::store(200)), ErrorCode::QUOTA_EXCEEDED);
    auto u = rig.tracker.snapshot("disk");
    REQUIRE_EQ(u.bytes_used, 850);
    REQUIRE_EQ(u.pending_bytes, 0);
    REQUIRE(rig.violations.hasOpen("disk", PolicyKind::STORAGE_QUOTA, Severity::CRITICAL));

    rig.tracker.record("disk", UsageDelta::remove(850));
    rig.quotas.refresh("disk");
    REQUIRE_FALSE(rig.violations.hasOpen("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN));
    REQUIRE_FALSE(rig.violations.hasOpen("disk", PolicyKind::STORAGE_QUOTA, Severity::CRITICAL));
}

TEST_CASE_SUITE(RecordKeepsTheWorstMetric, QuotaEnforcer) {
    QuotaRig rig;
    REQUIRE_OK(rig.policies.set("disk", StorageQuotaPolicy{1000, 10, 0.8}));
    rig.tracker.record("disk", UsageDelta{890, 7, false, 0});

    auto d = rig.quotas.check("disk", UsageDelta::store(10));
    REQUIRE_OK(d);
    REQUIRE(d->verdict == QuotaVerdict::WARN);
    REQUIRE_SIZE(d->findings, 2u);
    auto open = rig.violations.list();
    REQUIRE_SIZE(open, 1u);
    REQUIRE_EQ(open[0].message, "bytes");
    REQUIRE_NEAR(open[0].current_value, 900.0, 0.001);
    REQUIRE_NEAR(open[0].limit_value, 1000.0, 0.001);
    REQUIRE_EQ(rig.events.countOf(EventType::QUOTA_WARNING), 2u);

    // Files now sit closer to their limit than bytes do
    rig.tracker.record("disk", UsageDelta{0, 2, false, 0});
    REQUIRE_OK(rig.quotas.check("disk", UsageDelta::store(10)));
    open = rig.violations.list();
    REQUIRE_SIZE(open, 1u);
    REQUIRE_EQ(open[0].message, "files");
    REQUIRE_NEAR(open[0].current_value, 10.0, 0.001);
}

TEST_CASE_SUITE(EvaluateHasNoSideEffects, QuotaEnforcer) {
    QuotaRig rig;
    REQUIRE_OK(rig.policies.set("disk", StorageQuotaPolicy{100, 0, 0.8}));
    auto d = rig.quotas.evaluate("disk", UsageDelta::store(500));
    REQUIRE(d.verdict == QuotaVerdict::REJECT);
    REQUIRE_FALSE(d.allowed());
    REQUIRE_NOT_EMPTY(d.findings);
    REQUIRE_EQ(rig.violations.size(), 0u);
    REQUIRE_EQ(rig.tracker.snapshot("disk").pending_bytes, 0);
}

TEST_CASE_SUITE(UnconfiguredBackendAllowsEverything, QuotaEnforcer) {
    QuotaRig rig;
    auto d = rig.quotas.evaluate("disk", UsageDelta::store(1ll << 40));
    REQUIRE(d.verdict == QuotaVerdict::ALLOW);
    REQUIRE_EMPTY(d.evaluated);
}

TEST_CASE_SUITE(TrafficWindowLimitsRequests, QuotaEnforcer) {
    QuotaRig rig;
    REQUIRE_OK(rig.policies.set("disk", TrafficQuotaPolicy{0, Seconds(60), 2, 0.8}));
    for (int i = 0; i < 2; ++i) {
        auto r = rig.quotas.reserve("disk", UsageDelta::read(10));
        REQUIRE_OK(r);
        REQUIRE_OK(rig.quotas.commit(r.value()));
    }
    REQUIRE_ERR(rig.quotas.reserve("disk", UsageDelta::read(10)), ErrorCode::QUOTA_EXCEEDED);

    rig.clock.advance(Seconds(60));
    auto again = rig.quotas.reserve("disk", UsageDelta::read(10));
    REQUIRE_OK(again);
    REQUIRE_OK(rig.quotas.release(again.value()));
    // Storage quotas are not consulted for reads
    REQUIRE_OK(rig.policies.set("disk", StorageQuotaPolicy{1, 1, 0.8}));
    rig.tracker.record("disk", UsageDelta{5, 1, false, 0});
    REQUIRE(rig.quotas.evaluate("disk", UsageDelta::read(10)).verdict != QuotaVerdict::REJECT);
}

TEST_CASE_SUITE(DisabledBackendRefusesWritesOnly, QuotaEnforcer) {
    QuotaRig rig;
    REQUIRE_OK(rig.policies.registerBackend(BackendInfo{"disk", {}, "", false}));
    REQUIRE_ERR(rig.quotas.reserve("disk", UsageDelta::store(10)), ErrorCode::BACKEND_DISABLED);
    auto read = rig.quotas.reserve("disk", UsageDelta::read(10));
    REQUIRE_OK(read);
    REQUIRE_OK(rig.quotas.release(read.value()));
}

//=============================================================================
// Violation Reporter
//=============================================================================

TEST_CASE_SUITE(RepeatedReportsUpdateOneRecord, ViolationReporter) {
    ManualClock clock;
    EventBus events;
    ViolationReporter reporter(&events, clock.fn());
    auto first = reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 850, 1000);
    clock.advance(Seconds(5));
    auto second = reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 900, 1000);
    REQUIRE_EQ(first, second);
    REQUIRE_EQ(reporter.size(), 1u);
    auto v = reporter.list()[0];
    REQUIRE_EQ(v.occurrences, 2u);
    REQUIRE_NEAR(v.current_value, 900.0, 0.001);
    REQUIRE(v.detected_at > v.first_detected_at);
    REQUIRE_EQ(events.countOf(EventType::VIOLATION_RAISED), 1u);

    reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::CRITICAL, 1050, 1000);
    REQUIRE_EQ(reporter.size(), 2u);
    REQUIRE_EQ(reporter.resolve("disk", PolicyKind::STORAGE_QUOTA), 2u);
    REQUIRE_EQ(reporter.resolve("disk", PolicyKind::STORAGE_QUOTA), 0u);

    reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 850, 1000);
    REQUIRE_EQ(reporter.size(), 3u);
    auto s = reporter.summary();
    REQUIRE_EQ(s.unresolved, 1u);
    REQUIRE_EQ(s.critical, 1u);
    REQUIRE_EQ(s.warnings, 2u);
}

TEST_CASE_SUITE(ListenerFiresOnlyOnChange, ViolationReporter) {
    ViolationReporter reporter;
    int changes = 0;
    reporter.setChangeListener([&] { ++changes; });
    reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 850, 1000, "bytes");
    REQUIRE_EQ(changes, 1);
    reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 850, 1000, "bytes");
    reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 850, 1000);
    REQUIRE_EQ(changes, 1);
    REQUIRE_EQ(reporter.list()[0].occurrences, 3u);
    reporter.report("disk", PolicyKind::STORAGE_QUOTA, Severity::WARN, 870, 1000, "bytes");
    REQUIRE_EQ(changes, 2);
    REQUIRE_EQ(reporter.resolve("disk", PolicyKind::STORAGE_QUOTA), 1u);
    REQUIRE_EQ(changes, 3);
}

TEST_CASE_SUITE(FiltersAndResolveById, ViolationReporter) {
    ViolationReporter reporter;
    reporter.report("a", PolicyKind::STORAGE_QUOTA, Severity::WARN, 1, 2);
    auto id = reporter.report("b", PolicyKind::TRAFFIC_QUOTA, Severity::CRITICAL, 3, 2);
    reporter.report("b", PolicyKind::REPLICATION, Severity::CRITICAL, 1, 2);

    ViolationFilter only_b;
    only_b.backend_id = "b";
    REQUIRE_SIZE(reporter.list(only_b), 2u);
    ViolationFilter critical;
    critical.severity = Severity::CRITICAL;
    REQUIRE_SIZE(reporter.list(critical), 2u);

    REQUIRE_OK(reporter.resolveById(id));
    ViolationFilter open;
    open.resolved = false;
    REQUIRE_SIZE(reporter.list(open), 2u);
    REQUIRE_ERR(reporter.resolveById("VIO-missing"), ErrorCode::NOT_FOUND);
    REQUIRE_CONTAINS(reporter.generateReport(), "=== Violation Report ===");
}

//=============================================================================
// Tiered Cache
//=============================================================================

namespace {
std::unique_ptr<TieredCacheManager> makeCache(std::vector<TierConfig> tiers, const ManualClock& clock) {
    auto created = TieredCacheManager::create(std::move(tiers), clock.fn());
    if (!created) throw std::runtime_error(created.error().toString());
    return std::move(created.value());
}

size_t tierOf(TieredCacheManager& cache, const ObjectId& id) {
    auto e = cache.find(id);
    if (!e) throw std::runtime_error(id + " is not cached");
    return e->tier;
}
}

TEST_CASE_SUITE(DecisionFunction, TieredCache) {
    auto now = Clock::now();
    CacheEntry e;
    e.size_bytes = 30;
    e.access_count = 3;
    e.last_access_time = now;
    TierState tier{1000, 100, 1, Seconds(0)};
    TierState faster{100, 0, 3, Seconds(0)};

    REQUIRE(decideCacheAction(e, tier, &faster, false, now) == CacheAction::PROMOTE);
    REQUIRE(decideCacheAction(e, tier, nullptr, false, now) == CacheAction::KEEP);

    e.access_count = 2;
    REQUIRE(decideCacheAction(e, tier, &faster, false, now) == CacheAction::KEEP);

    TierState over{100, 150, 1, Seconds(0)};
    REQUIRE(decideCacheAction(e, over, nullptr, false, now) == CacheAction::DEMOTE);
    REQUIRE(decideCacheAction(e, over, nullptr, true, now) == CacheAction::EVICT);
    e.pinned = true;
    REQUIRE(decideCacheAction(e, over, nullptr, true, now) == CacheAction::KEEP);
    e.pinned = false;

    TierState idle{1000, 10, 1, Seconds(60)};
    REQUIRE(decideCacheAction(e, idle, nullptr, false, now + Seconds(59)) == CacheAction::KEEP);
    REQUIRE(decideCacheAction(e, idle, nullptr, false, now + Seconds(60)) == CacheAction::DEMOTE);

    e.size_bytes = 500;
    e.access_count = 10;
    REQUIRE(decideCacheAction(e, tier, &faster, false, now) == CacheAction::KEEP);
}

TEST_CASE_SUITE(PromotionDemotesLeastRecentlyUsed, TieredCache) {
    ManualClock clock;
    auto cache = makeCache({TierConfig{"fast", "ssd", 100, 2, Seconds(0)},
                            TierConfig{"slow", "hdd", 1000, 1, Seconds(0)}}, clock);

    for (int i = 1; i <= 6; ++i) {
        auto r = cache->access("obj" + std::to_string(i), 30);
        REQUIRE_OK(r);
        REQUIRE_FALSE(r->hit);
        REQUIRE_EQ(r->tier, 1u);
        clock.advance(Seconds(1));
    }
    for (int i = 1; i <= 3; ++i) {
        auto r = cache->access("obj" + std::to_string(i), 30);
        REQUIRE_OK(r);
        REQUIRE(r->promoted);
        clock.advance(Seconds(1));
    }
    REQUIRE_EQ(cache->statistics().tiers[0].used_bytes, 90);

    auto r = cache->access("obj4", 30);
    REQUIRE_OK(r);
    REQUIRE(r->promoted);
    REQUIRE_EQ(tierOf(*cache, "obj4"), 0u);
    REQUIRE_EQ(tierOf(*cache, "obj1"), 1u);
    REQUIRE_EQ(cache->find("obj1")->access_count, 0u);
    REQUIRE_EQ(tierOf(*cache, "obj2"), 0u);
    REQUIRE_EQ(tierOf(*cache, "obj3"), 0u);

    auto stats = cache->statistics();
    REQUIRE_EQ(stats.tiers[0].used_bytes, 90);
    REQUIRE_EQ(stats.tiers[0].demotions, 1u);
    REQUIRE_EQ(stats.tiers[0].promotions, 4u);
    REQUIRE_EQ(stats.tiers[1].used_bytes, 90);
    REQUIRE(cache->checkInvariants());
}

TEST_CASE_SUITE(PinnedEntriesAreNeverDemoted, TieredCache) {
    ManualClock clock;
    auto cache = makeCache({TierConfig{"fast", "ssd", 60, 2, Seconds(0)},
                            TierConfig{"slow", "hdd", 1000, 1, Seconds(0)}}, clock);
    for (const char* id : {"a", "b", "c"}) {
        REQUIRE_OK(cache->access(id, 30));
        clock.advance(Seconds(1));
    }
    REQUIRE_OK(cache->access("a", 30));
    clock.advance(Seconds(1));
    REQUIRE_OK(cache->access("b", 30));
    clock.advance(Seconds(1));
    REQUIRE_OK(cache->pin("a"));

    REQUIRE_OK(cache->access("c", 30));
    REQUIRE_EQ(tierOf(*cache, "a"), 0u);
    REQUIRE_EQ(tierOf(*cache, "c"), 0u);
    REQUIRE_EQ(tierOf(*cache, "b"), 1u);
    REQUIRE(cache->find("a")->pinned);
    REQUIRE_ERR(cache->pin("missing"), ErrorCode::NOT_FOUND);
}

TEST_CASE_SUITE(EvictIsIdempotent, TieredCache) {
    ManualClock clock;
    auto cache = makeCache({TierConfig{"only", "ssd", 100, 1, Seconds(0)}}, clock);
    REQUIRE_OK(cache->access("x", 60));
    clock.advance(Seconds(1));
    REQUIRE_OK(cache->access("y", 30));

    auto shrunk = cache->setTierCapacity(0, 50);
    REQUIRE_OK(shrunk);
    REQUIRE_SIZE(shrunk->removed, 1u);
    REQUIRE_EQ(shrunk->removed[0], "x");
    REQUIRE_FALSE(cache->find("x").has_value());

    auto again = cache->evict(0);
    REQUIRE_OK(again);
    REQUIRE(again->empty());
    REQUIRE(cache->evict(0)->empty());
    REQUIRE_EQ(cache->statistics().tiers[0].used_bytes, 30);
    REQUIRE_ERR(cache->evict(3), ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE_SUITE(TierFullWhenOnlyPinnedEntriesRemain, TieredCache) {
    ManualClock clock;
    auto cache = makeCache({TierConfig{"only", "ssd", 100, 1, Seconds(0)}}, clock);
    REQUIRE_OK(cache->access("big", 80));
    REQUIRE_OK(cache->pin("big"));
    REQUIRE_ERR(cache->access("other", 50), ErrorCode::TIER_FULL);
    REQUIRE_ERR(cache->access("huge", 500), ErrorCode::TIER_FULL);
    REQUIRE_EQ(cache->statistics().bypasses, 2u);
    REQUIRE_OK(cache->unpin("big"));
    REQUIRE_OK(cache->access("other", 50));
    REQUIRE_FALSE(cache->find("big").has_value());
}

TEST_CASE_SUITE(IdleEntriesAreDemotedByMaintenance, TieredCache) {
    ManualClock clock;
    auto cache = makeCache({TierConfig{"fast", "ssd", 100, 1, Seconds(10)},
                            TierConfig{"slow", "hdd", 1000, 1, Seconds(0)}}, clock);
    REQUIRE_OK(cache->access("doc", 40));
    REQUIRE_OK(cache->access("doc", 40));
    REQUIRE_EQ(tierOf(*cache, "doc"), 0u);

    clock.advance(Seconds(5));
    REQUIRE_EQ(cache->runMaintenance(), 0u);
    clock.advance(Seconds(6));
    REQUIRE_EQ(cache->runMaintenance(), 1u);
    REQUIRE_EQ(tierOf(*cache, "doc"), 1u);
    REQUIRE(cache->checkInvariants());
}

TEST_CASE_SUITE(MoveHandlerSeesPlacements, TieredCache) {
    ManualClock clock;
    auto cache = makeCache({TierConfig{"fast", "ssd", 100, 2, Seconds(0)},
                            TierConfig{"slow", "hdd", 1000, 1, Seconds(0)}}, clock);
    std::vector<TierMove> moves;
    cache->setMoveHandler([&moves](const TierMove& m) { moves.push_back(m); });

    REQUIRE_OK(cache->access("obj", 10));
    REQUIRE_OK(cache->access("obj", 10));
    REQUIRE(cache->remove("obj"));
    REQUIRE_FALSE(cache->remove("obj"));

    REQUIRE_SIZE(moves, 3u);
    REQUIRE(moves[0].kind == TierMoveKind::PLACE);
    REQUIRE_EQ(moves[0].to_backend, "hdd");
    REQUIRE(moves[1].kind == TierMoveKind::PROMOTE);
    REQUIRE_EQ(moves[1].from_backend, "hdd");
    REQUIRE_EQ(moves[1].to_backend, "ssd");
    REQUIRE(moves[2].kind == TierMoveKind::DROP);
    REQUIRE_FALSE(moves[2].to_tier.has_value());
}

TEST_CASE_SUITE(RejectsBadTierConfiguration, TieredCache) {
    REQUIRE_ERR(TieredCacheManager::create({}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(TieredCacheManager::create({TierConfig{"t", "b", 0, 1, Seconds(0)}}), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(TieredCacheManager::create({TierConfig{"t", "b", 10, 0, Seconds(0)}}), ErrorCode::INVALID_POLICY);
}

//=============================================================================
// Retry and Cancellation
//=============================================================================

TEST_CASE_SUITE(RetriesOnlyTransientErrors, Retry) {
    RetryPolicy policy{4, Millis(1), 2.0, Millis(4)};
    REQUIRE_EQ(policy.delayAfter(1).count(), 1);
    REQUIRE_EQ(policy.delayAfter(3).count(), 4);
    REQUIRE_EQ(policy.delayAfter(5).count(), 4);

    int calls = 0;
    uint32_t attempts = 0;
    auto r = withRetry<int>(policy, CancellationToken(), [&] {
        ++calls;
        return calls < 3 ? Err<int>(ErrorCode::ADAPTER_ERROR, "flaky") : Result<int>(7);
    }, &attempts);
    REQUIRE_OK(r);
    REQUIRE_EQ(r.value(), 7);
    REQUIRE_EQ(attempts, 3u);

    calls = 0;
    auto permanent = withRetry<int>(policy, CancellationToken(), [&] {
        ++calls;
        return Err<int>(ErrorCode::NOT_FOUND, "gone");
    });
    REQUIRE_ERR(permanent, ErrorCode::NOT_FOUND);
    REQUIRE_EQ(calls, 1);

    calls = 0;
    auto exhausted = withRetry<void>(policy, CancellationToken(), [&] {
        ++calls;
        return Err(ErrorCode::ADAPTER_TIMEOUT, "slow");
    });
    REQUIRE_ERR(exhausted, ErrorCode::ADAPTER_TIMEOUT);
    REQUIRE_EQ(calls, 4);
}

TEST_CASE_SUITE(TokenStopsWork, Retry) {
    CancellationToken token;
    auto copy = token;
    REQUIRE_OK(token.check());
    copy.cancel();
    REQUIRE_ERR(token.check(), ErrorCode::CANCELLED);
    REQUIRE_FALSE(token.waitFor(Millis(1000)));

    auto deadline = CancellationToken::withTimeout(Millis(10));
    std::this_thread::sleep_for(Millis(20));
    REQUIRE_ERR(deadline.check(), ErrorCode::ADAPTER_TIMEOUT);
    REQUIRE_EQ(deadline.remaining()->count(), 0);
    REQUIRE_FALSE(CancellationToken().remaining().has_value());
}

//=============================================================================
// Replication Coordinator
//=============================================================================

namespace {
struct ReplicationRig {
    PolicyStore policies;
    ResourceTracker tracker;
    EventBus events;
    ViolationReporter violations{&events};
    QuotaEnforcer quotas{policies, tracker, violations, &events};
    AdapterRegistry adapters;
    ThreadPool pool{4};
    ReplicationCoordinator coord{policies, quotas, tracker, adapters, violations, pool,
                                 RetryPolicy{2, Millis(1), 1.0, Millis(1)}, &events};
    std::map<BackendId, std::shared_ptr<FaultyAdapter>> backends;

    ReplicationRig() {
        for (const auto& [id, region] : std::vector<std::pair<std::string, std::string>>{
                 {"src", "us"}, {"A", "us"}, {"B", "eu"}, {"C", "ap"}}) {
            auto a = std::make_shared<FaultyAdapter>(id);
            if (!policies.registerBackend(BackendInfo{id, {}, region, true})) throw std::runtime_error("register " + id);
            if (!adapters.add(a)) throw std::runtime_error("adapter " + id);
            backends[id] = a;
        }
    }

    ~ReplicationRig() { pool.shutdown(); }

    ReplicationRequest request(const ObjectId& id, int64_t size) {
        auto data = std::make_shared<const Bytes>(static_cast<size_t>(size), uint8_t{7});
        return ReplicationRequest{id, size, data, "src", "src"};
    }

    ReplicaStatus statusOf(const ObjectId& id, const BackendId& b) {
        auto set = coord.get(id);
        if (!set || !set->target(b)) throw std::runtime_error("no target " + b + " for " + id);
        return set->target(b)->status;
    }
};

ReplicationPolicy policyABC(int32_t min, int32_t max) {
    return ReplicationPolicy{ReplicationStrategy::SIMPLE, min, max, {"A", "B", "C"}};
}
}

TEST_CASE_SUITE(SkipsBackendWithoutQuota, Replication) {
    ReplicationRig rig;
    REQUIRE_OK(rig.policies.set("A", StorageQuotaPolicy{100, 0, 0.8}));
    rig.tracker.record("A", UsageDelta{100, 1, false, 0});

    auto r = rig.coord.ensure(rig.request("obj", 50), policyABC(2, 3), CancellationToken());
    REQUIRE_OK(r);
    REQUIRE_EQ(r->verifiedCount(), 2u);
    REQUIRE(r->target("A") == nullptr);
    REQUIRE(rig.statusOf("obj", "B") == ReplicaStatus::VERIFIED);
    REQUIRE(rig.statusOf("obj", "C") == ReplicaStatus::VERIFIED);
    REQUIRE(rig.backends["B"]->contains("obj"));
    REQUIRE_FALSE(rig.backends["A"]->contains("obj"));
    REQUIRE_EQ(rig.tracker.snapshot("B").bytes_used, 50);
    REQUIRE_EQ(rig.tracker.snapshot("A").pending_bytes, 0);
    // Skipping a full backend during selection is not a violation
    REQUIRE_EQ(rig.violations.size(), 0u);
}

TEST_CASE_SUITE(RepairRetriesFailedThenAddsNewTarget, Replication) {
    ReplicationRig rig;
    REQUIRE_OK(rig.policies.set("A", StorageQuotaPolicy{100, 0, 0.8}));
    rig.tracker.record("A", UsageDelta{100, 1, false, 0});
    rig.backends["C"]->failPuts(true);

    auto first = rig.coord.ensure(rig.request("obj", 50), policyABC(2, 3), CancellationToken());
    REQUIRE_ERR(first, ErrorCode::INSUFFICIENT_REDUNDANCY);
    REQUIRE(rig.statusOf("obj", "B") == ReplicaStatus::VERIFIED);
    REQUIRE(rig.statusOf("obj", "C") == ReplicaStatus::FAILED);
    REQUIRE_EQ(rig.tracker.snapshot("C").bytes_used, 0);
    REQUIRE(rig.violations.hasOpen("src", PolicyKind::REPLICATION, Severity::CRITICAL));
    REQUIRE_SIZE(rig.coord.degraded(), 1u);

    int puts_before = rig.backends["C"]->puts();
    rig.tracker.record("A", UsageDelta::remove(100));
    auto repaired = rig.coord.repair("obj", CancellationToken());
    REQUIRE_OK(repaired);
    REQUIRE_GT(rig.backends["C"]->puts(), puts_before);
    REQUIRE(rig.statusOf("obj", "C") == ReplicaStatus::FAILED);
    REQUIRE(rig.statusOf("obj", "A") == ReplicaStatus::VERIFIED);
    REQUIRE_EQ(repaired->verifiedCount(), 2u);
    REQUIRE_FALSE(rig.violations.hasOpen("src", PolicyKind::REPLICATION, Severity::CRITICAL));
    REQUIRE_EMPTY(rig.coord.degraded());

    rig.backends["C"]->failPuts(false);
    auto healed = rig.coord.repair("obj", CancellationToken());
    REQUIRE_OK(healed);
    REQUIRE_EQ(healed->verifiedCount(), 3u);
    REQUIRE_EQ(healed->countOf(ReplicaStatus::PENDING), 0u);

    // A settled set is left alone
    int puts_settled = rig.backends["C"]->puts();
    REQUIRE_OK(rig.coord.repair("obj", CancellationToken()));
    REQUIRE_EQ(rig.backends["C"]->puts(), puts_settled);
}

TEST_CASE_SUITE(TransientFailuresAreRetried, Replication) {
    ReplicationRig rig;
    rig.backends["B"]->failNextPuts(1);
    auto r = rig.coord.ensure(rig.request("obj", 20), ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"B"}},
                              CancellationToken());
    REQUIRE_OK(r);
    REQUIRE_EQ(r->target("B")->attempts, 2u);
    REQUIRE_EQ(rig.coord.statistics().retries, 1u);
}

TEST_CASE_SUITE(TimeoutMarksTargetFailed, Replication) {
    ReplicationRig rig;
    rig.backends["C"]->setLatency(Millis(500));
    auto token = CancellationToken::withTimeout(Millis(50));
    auto r = rig.coord.ensure(rig.request("obj", 10), ReplicationPolicy{ReplicationStrategy::SIMPLE, 2, 2, {"B", "C"}},
                              token);
    REQUIRE_ERR(r, ErrorCode::INSUFFICIENT_REDUNDANCY);
    auto set = rig.coord.get("obj");
    REQUIRE(set.has_value());
    REQUIRE_EQ(set->countOf(ReplicaStatus::PENDING), 0u);
    REQUIRE(set->target("C")->status == ReplicaStatus::FAILED);
    REQUIRE(set->target("B")->status == ReplicaStatus::VERIFIED);
}

TEST_CASE_SUITE(DeadlineHoldsAgainstStalledAdapter, Replication) {
    ReplicationRig rig;
    rig.backends["C"]->stallPuts(Millis(600));
    auto start = std::chrono::steady_clock::now();
    auto r = rig.coord.ensure(rig.request("obj", 10), ReplicationPolicy{ReplicationStrategy::SIMPLE, 2, 2, {"B", "C"}},
                              CancellationToken::withTimeout(Millis(50)));
    auto took = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
    REQUIRE_ERR(r, ErrorCode::INSUFFICIENT_REDUNDANCY);
    REQUIRE(took < Millis(400));
    REQUIRE(rig.statusOf("obj", "C") == ReplicaStatus::FAILED);
    REQUIRE(rig.statusOf("obj", "B") == ReplicaStatus::VERIFIED);
    REQUIRE_CONTAINS(rig.coord.get("obj")->target("C")->last_error, "ADAPTER_TIMEOUT");
    REQUIRE_EQ(rig.tracker.snapshot("C").pending_bytes, 0);

    // The stalled put lands later and is removed without touching usage
    rig.pool.waitAll();
    REQUIRE_FALSE(rig.backends["C"]->contains("obj"));
    REQUIRE_EQ(rig.tracker.snapshot("C").bytes_used, 0);
    REQUIRE(rig.backends["B"]->contains("obj"));
}

TEST_CASE_SUITE(ConcurrentEnsureRunsOnce, Replication) {
    ReplicationRig rig;
    rig.backends["B"]->setLatency(Millis(100));
    auto policy = ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"B"}};
    Result<ReplicaSet> other = Err<ReplicaSet>(ErrorCode::INTERNAL_ERROR, "not run");
    std::thread t([&] { other = rig.coord.ensure(rig.request("obj", 10), policy, CancellationToken()); });
    std::this_thread::sleep_for(Millis(20));
    auto mine = rig.coord.ensure(rig.request("obj", 10), policy, CancellationToken());
    t.join();

    REQUIRE_OK(mine);
    REQUIRE_OK(other);
    REQUIRE_EQ(mine->verifiedCount(), 1u);
    REQUIRE_EQ(other->verifiedCount(), 1u);
    REQUIRE_EQ(rig.coord.statistics().copies_attempted, 1u);
    REQUIRE_EQ(rig.tracker.snapshot("B").file_count, 1);
}

TEST_CASE_SUITE(ForeignExceptionFreesTheObject, Replication) {
    ReplicationRig rig;
    auto policy = ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"B"}};
    rig.backends["B"]->throwForeign(true);
    bool escaped = false;
    try {
        (void)rig.coord.ensure(rig.request("obj", 10), policy, CancellationToken());
    } catch (int) {
        escaped = true;
    }
    REQUIRE(escaped);

    rig.backends["B"]->throwForeign(false);
    auto again = rig.coord.ensure(rig.request("obj", 10), policy, CancellationToken());
    REQUIRE_OK(again);
    REQUIRE_EQ(again->verifiedCount(), 1u);
    REQUIRE(rig.backends["B"]->contains("obj"));
}

TEST_CASE_SUITE(VerifyDetectsLostCopy, Replication) {
    ReplicationRig rig;
    REQUIRE_OK(rig.coord.ensure(rig.request("obj", 40), ReplicationPolicy{ReplicationStrategy::SIMPLE, 2, 2, {"B", "C"}},
                                CancellationToken()));
    rig.backends["C"]->drop("obj");

    auto checked = rig.coord.verify("obj", CancellationToken());
    REQUIRE_OK(checked);
    REQUIRE(checked->target("C")->status == ReplicaStatus::FAILED);
    REQUIRE_EQ(rig.tracker.snapshot("C").bytes_used, 0);
    REQUIRE_EQ(rig.coord.statistics().verification_failures, 1u);
    REQUIRE_SIZE(rig.coord.degraded(), 1u);
    REQUIRE_EQ(rig.events.countOf(EventType::REPLICATION_DEGRADED), 1u);

    auto repaired = rig.coord.repair("obj", CancellationToken());
    REQUIRE_OK(repaired);
    REQUIRE(rig.backends["C"]->contains("obj"));
    REQUIRE_EMPTY(rig.coord.degraded());
}

TEST_CASE_SUITE(TruncatedCopyFailsVerification, Replication) {
    ReplicationRig rig;
    rig.backends["B"]->truncateWrites(true);
    auto r = rig.coord.ensure(rig.request("obj", 40), ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"B", "C"}},
                              CancellationToken());
    REQUIRE_OK(r);
    REQUIRE(r->target("B")->status == ReplicaStatus::FAILED);
    REQUIRE_CONTAINS(r->target("B")->last_error, "verification");
    REQUIRE(r->target("C")->status == ReplicaStatus::VERIFIED);
}

TEST_CASE_SUITE(GeoAwarePrefersNewRegions, Replication) {
    ReplicationRig rig;
    auto r = rig.coord.ensure(rig.request("obj", 10),
                              ReplicationPolicy{ReplicationStrategy::GEO_AWARE, 2, 2, {"A", "B", "C"}},
                              CancellationToken());
    REQUIRE_OK(r);
    REQUIRE(r->target("A") == nullptr);
    REQUIRE(r->target("B")->status == ReplicaStatus::VERIFIED);
    REQUIRE(r->target("C")->status == ReplicaStatus::VERIFIED);
}

TEST_CASE_SUITE(PayloadFetchedFromSource, Replication) {
    ReplicationRig rig;
    Bytes data(25, 3);
    REQUIRE_OK(rig.backends["src"]->put("obj", data, CancellationToken()));
    ReplicationRequest req{"obj", 25, nullptr, "src", "src"};
    auto r = rig.coord.ensure(req, ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"B"}}, CancellationToken());
    REQUIRE_OK(r);
    REQUIRE_EQ(rig.backends["src"]->gets(), 1);
    REQUIRE(rig.backends["B"]->contains("obj"));

    ReplicationRequest missing{"ghost", 25, nullptr, "src", "src"};
    REQUIRE_ERR(rig.coord.ensure(missing, ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"B"}}, CancellationToken()),
                ErrorCode::NOT_FOUND);
}

TEST_CASE_SUITE(RemoveDeletesEveryCopy, Replication) {
    ReplicationRig rig;
    REQUIRE_OK(rig.coord.ensure(rig.request("obj", 30), ReplicationPolicy{ReplicationStrategy::SIMPLE, 2, 2, {"B", "C"}},
                                CancellationToken()));
    std::vector<std::string> seen;
    rig.coord.setChangeListener([&seen](const ObjectId& id, const ReplicaSet* set) {
        seen.push_back(id + (set ? ":set" : ":gone"));
    });

    rig.backends["C"]->failRemoves(true);
    REQUIRE_ERR(rig.coord.remove("obj", CancellationToken()), ErrorCode::ADAPTER_ERROR);
    REQUIRE(rig.coord.get("obj").has_value());
    REQUIRE_SIZE(rig.coord.get("obj")->targets, 1u);

    rig.backends["C"]->failRemoves(false);
    REQUIRE_OK(rig.coord.remove("obj", CancellationToken()));
    REQUIRE_FALSE(rig.coord.get("obj").has_value());
    REQUIRE_FALSE(rig.backends["B"]->contains("obj"));
    REQUIRE_FALSE(rig.backends["C"]->contains("obj"));
    REQUIRE_EQ(rig.tracker.snapshot("B").bytes_used, 0);
    REQUIRE_EQ(rig.tracker.snapshot("C").bytes_used, 0);
    REQUIRE_EQ(seen.back(), "obj:gone");
}

TEST_CASE_SUITE(RejectsInvalidRequests, Replication) {
    ReplicationRig rig;
    REQUIRE_ERR(rig.coord.ensure(rig.request("", 10), policyABC(1, 1), CancellationToken()), ErrorCode::INVALID_ARGUMENT);
    REQUIRE_ERR(rig.coord.ensure(rig.request("obj", 10), policyABC(2, 1), CancellationToken()), ErrorCode::INVALID_POLICY);
    REQUIRE_ERR(rig.coord.repair("nothing", CancellationToken()), ErrorCode::NOT_FOUND);
    REQUIRE_ERR(rig.coord.verify("nothing", CancellationToken()), ErrorCode::NOT_FOUND);
}

int main(int argc, char* argv[]) {
    Logger::instance().setLevel(LogLevel::LOG_WARNING);
    return TestRunner::instance().run(RunOptions::parse(argc, argv));
}
