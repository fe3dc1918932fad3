/**
 * @file test_stress.cpp
 * @brief TierGuard concurrency stress tests
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <random>
#include <iomanip>
#include <functional>

#include "test_helpers.hpp"
#include "policy_engine.hpp"

using namespace std::chrono;
using namespace tierguard;
using namespace tierguard::testing;

struct StressTestResult {
    std::string name;
    bool passed{true};
    double duration_ms{0};
    size_t operations{0};
    double ops_per_second{0};
    std::string note;

    void print() const {
        std::cout << std::setw(45) << std::left << name << " ";
        std::cout << (passed ? "\033[32mPASS\033[0m" : "\033[31mFAIL\033[0m");
        std::cout << " | " << std::fixed << std::setprecision(2)
                  << std::setw(10) << std::right << duration_ms << " ms"
                  << " | " << std::setw(10) << operations << " ops"
                  << " | " << std::setw(12) << ops_per_second << " ops/sec";
        if (!note.empty()) std::cout << "\n    (" << note << ")";
        std::cout << "\n";
    }
};

class StressTestRunner {
    std::vector<std::pair<std::string, std::function<StressTestResult()>>> tests_;
public:
    void addTest(const std::string& name, std::function<StressTestResult()> func) {
        tests_.push_back({name, func});
    }

    /// @return Number of failed tests
    size_t run() {
        std::cout << "\n+==============================================================================+\n";
        std::cout << "|               TierGuard v" << VERSION << " Stress Test Suite                              |\n";
        std::cout << "+==============================================================================+\n\n";

        size_t passed = 0, failed = 0;
        double total_time = 0;

        for (auto& [name, func] : tests_) {
            try {
                auto result = func();
                result.name = name;
                result.print();
                if (result.passed) passed++; else failed++;
                total_time += result.duration_ms;
            } catch (const std::exception& e) {
                StressTestResult result;
                result.name = name;
                result.passed = false;
                result.note = e.what();
                result.print();
                failed++;
            }
        }

        std::cout << "\n=== Stress Test Summary ===\n";
        std::cout << "Passed: " << passed << ", Failed: " << failed << ", Total: " << (passed + failed) << "\n";
        std::cout << "Total Time: " << std::fixed << std::setprecision(2) << total_time << " ms\n\n";
        return failed;
    }
};

namespace {

void finish(StressTestResult& result, high_resolution_clock::time_point start) {
    auto end = high_resolution_clock::now();
    result.duration_ms = duration_cast<microseconds>(end - start).count() / 1000.0;
    result.ops_per_second = result.duration_ms > 0 ? result.operations / (result.duration_ms / 1000.0) : 0;
}

template<typename Fn>
void runThreads(int count, Fn fn) {
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(count));
    for (int t = 0; t < count; ++t) threads.emplace_back(fn, t);
    for (auto& th : threads) th.join();
}

} // namespace

// =============================================================================
// Resource Tracker Stress Tests
// =============================================================================

StressTestResult stress_tracker_reservation_race() {
    StressTestResult result;
    const int threads = 8, per_thread = 500;
    result.operations = threads * per_thread;

    ResourceTracker tracker;
    UsageLimits limits;
    limits.max_bytes = 1000;
    std::atomic<int> granted{0}, refused{0};

    auto start = high_resolution_clock::now();
    runThreads(threads, [&](int) {
        for (int i = 0; i < per_thread; ++i) {
            auto r = tracker.reserve("disk", UsageDelta::store(10), limits);
            if (!r) { ++refused; continue; }
            ++granted;
            // Every third reservation is abandoned
            auto done = (i % 3 == 0) ? tracker.release(*r) : tracker.commit(*r);
            if (!done) throw std::runtime_error(done.error().toString());
        }
    });
    finish(result, start);

    auto u = tracker.snapshot("disk");
    result.passed = u.bytes_used <= 1000 && u.pending_bytes == 0 && u.bytes_used == u.file_count * 10;
    result.note = "granted " + std::to_string(granted.load()) + ", refused " + std::to_string(refused.load()) +
                  ", used " + std::to_string(u.bytes_used);
    return result;
}

StressTestResult stress_quota_enforcer_contention() {
    StressTestResult result;
    const int threads = 8, per_thread = 250;
    result.operations = threads * per_thread;

    PolicyStore policies;
    ResourceTracker tracker;
    EventBus events;
    ViolationReporter violations(&events);
    QuotaEnforcer quotas(policies, tracker, violations, &events);
    if (!policies.set("disk", StorageQuotaPolicy{5000, 0, 0.8})) throw std::runtime_error("policy rejected");
    if (!policies.set("disk", TrafficQuotaPolicy{0, Seconds(3600), 1500, 0.9})) throw std::runtime_error("policy rejected");

    std::atomic<int> stored{0};
    auto start = high_resolution_clock::now();
    runThreads(threads, [&](int t) {
        for (int i = 0; i < per_thread; ++i) {
            auto delta = (t % 2 == 0) ? UsageDelta::store(20) : UsageDelta::read(20);
            auto r = quotas.reserve("disk", delta);
            if (!r) continue;
            auto committed = quotas.commit(*r);
            if (!committed) throw std::runtime_error(committed.error().toString());
            if (delta.bytes > 0) ++stored;
        }
    });
    finish(result, start);

    auto u = tracker.snapshot("disk");
    bool within = u.bytes_used <= 5000 && u.request_count_in_window <= 1500;
    bool consistent = u.bytes_used == stored.load() * 20;
    ViolationFilter critical;
    critical.severity = Severity::CRITICAL;
    critical.resolved = false;
    // One record per (backend, kind, severity) regardless of how many threads hit the limit
    bool deduplicated = violations.list(critical).size() <= 2;
    result.passed = within && consistent && deduplicated;
    result.note = "bytes " + std::to_string(u.bytes_used) + ", requests " + std::to_string(u.request_count_in_window);
    return result;
}

// =============================================================================
// Tiered Cache Stress Tests
// =============================================================================

StressTestResult stress_cache_concurrent_access() {
    StressTestResult result;
    const int threads = 8, per_thread = 2000;
    result.operations = threads * per_thread;

    auto created = TieredCacheManager::create({TierConfig{"ram", "mem", 2000, 3, Seconds(0)},
                                               TierConfig{"ssd", "ssd", 8000, 2, Seconds(0)},
                                               TierConfig{"hdd", "hdd", 30000, 1, Seconds(0)}});
    if (!created) throw std::runtime_error(created.error().toString());
    auto cache = std::move(created.value());
    std::atomic<size_t> bypassed{0};

    auto start = high_resolution_clock::now();
    runThreads(threads, [&](int t) {
        std::mt19937 rng(static_cast<unsigned>(42 + t));
        std::uniform_int_distribution<int> pick(0, 499);
        for (int i = 0; i < per_thread; ++i) {
            int n = pick(rng);
            ObjectId id = "obj" + std::to_string(n);
            auto r = cache->access(id, 10 + (n % 7) * 20);
            if (!r) {
                if (!r.error().is(ErrorCode::TIER_FULL) && !r.error().is(ErrorCode::RESOURCE_BUSY))
                    throw std::runtime_error(r.error().toString());
                ++bypassed;
            }
            if (i % 97 == 0) (void)cache->pin(id);
            if (i % 89 == 0) (void)cache->unpin(id);
            if (i % 211 == 0) cache->remove(id);
            if (i % 503 == 0) cache->runMaintenance();
        }
    });
    finish(result, start);

    auto stats = cache->statistics();
    result.passed = cache->checkInvariants();
    result.note = "hit ratio " + std::to_string(stats.hitRatio()).substr(0, 4) + ", " +
                  std::to_string(bypassed.load()) + " bypassed";
    return result;
}

// =============================================================================
// Replication Stress Tests
// =============================================================================

StressTestResult stress_replication_convergence() {
    StressTestResult result;
    const int threads = 8, objects = 200;
    result.operations = objects * 2;

    PolicyStore policies;
    ResourceTracker tracker;
    EventBus events;
    ViolationReporter violations(&events);
    QuotaEnforcer quotas(policies, tracker, violations, &events);
    AdapterRegistry adapters;
    ThreadPool pool(4);
    ReplicationCoordinator coord(policies, quotas, tracker, adapters, violations, pool,
                                 RetryPolicy{4, Millis(1), 1.0, Millis(1)}, &events);
    std::map<BackendId, std::shared_ptr<FaultyAdapter>> backends;
    for (const auto& id : {"src", "r1", "r2", "r3"}) {
        auto a = std::make_shared<FaultyAdapter>(id);
        if (!policies.registerBackend(BackendInfo{id, {}, id, true})) throw std::runtime_error("register");
        if (!adapters.add(a)) throw std::runtime_error("adapter");
        backends[id] = a;
    }
    backends["r2"]->failNextPuts(objects / 4);
    ReplicationPolicy policy{ReplicationStrategy::GEO_AWARE, 2, 2, {"r1", "r2", "r3"}};
    auto payload = std::make_shared<const Bytes>(64, uint8_t{5});
    std::atomic<int> failures{0};

    auto start = high_resolution_clock::now();
    // Two threads per object id so concurrent ensures coalesce
    runThreads(threads, [&](int t) {
        for (int i = t / 2; i < objects; i += threads / 2) {
            ReplicationRequest req{"doc" + std::to_string(i), 64, payload, "src", "src"};
            auto r = coord.ensure(req, policy, CancellationToken::withTimeout(Millis(5000)));
            if (!r) ++failures;
        }
    });
    finish(result, start);
    pool.waitAll();

    bool converged = true;
    for (int i = 0; i < objects; ++i) {
        auto set = coord.get("doc" + std::to_string(i));
        if (!set || set->verifiedCount() != 2) converged = false;
    }
    int64_t copies = tracker.snapshot("r1").file_count + tracker.snapshot("r2").file_count +
                     tracker.snapshot("r3").file_count;
    auto stats = coord.statistics();
    pool.shutdown();

    result.passed = failures.load() == 0 && converged && copies == objects * 2 && coord.degraded().empty();
    result.note = std::to_string(stats.coalesced) + " coalesced, " + std::to_string(stats.retries) + " retries";
    return result;
}

// =============================================================================
// Engine Stress Tests
// =============================================================================

StressTestResult stress_engine_store_read() {
    StressTestResult result;
    const int threads = 8, per_thread = 100;
    result.operations = threads * per_thread * 2;

    TempDir dir("tierguard-stress");
    EngineConfig config;
    config.data_dir = dir.path().string();
    config.log_to_file = false;
    config.log_level = "WARNING";
    config.replication_base_delay_ms = 1;
    config.replication_max_delay_ms = 5;

    PolicyEngine engine;
    auto init = engine.initialize(config);
    if (!init) throw std::runtime_error(init.error().toString());
    for (const auto& id : {"primary", "mirror", "fast", "slow"}) {
        auto r = engine.registerBackend(BackendInfo{id, {}, id, true}, std::make_shared<MemoryBackendAdapter>(id));
        if (!r) throw std::runtime_error(r.error().toString());
    }
    for (auto r : {engine.setPolicy("primary", StorageQuotaPolicy{threads * per_thread * 100 / 2, 0, 0.9}),
                   engine.setPolicy("primary", ReplicationPolicy{ReplicationStrategy::SIMPLE, 1, 1, {"mirror"}}),
                   engine.setPolicy("fast", CachePolicy{4000, 2, Seconds(0)}),
                   engine.setPolicy("slow", CachePolicy{20000, 1, Seconds(0)}),
                   engine.configureCacheTiers({"fast", "slow"}),
                   engine.start()}) {
        if (!r) throw std::runtime_error(r.error().toString());
    }

    std::atomic<int> stored{0}, rejected{0}, read_errors{0};
    auto start = high_resolution_clock::now();
    runThreads(threads, [&](int t) {
        for (int i = 0; i < per_thread; ++i) {
            ObjectId id = "t" + std::to_string(t) + "-" + std::to_string(i);
            auto s = engine.storeObject("primary", id, Bytes(100, static_cast<uint8_t>(t)));
            if (!s) {
                if (!s.error().is(ErrorCode::QUOTA_EXCEEDED)) throw std::runtime_error(s.error().toString());
                ++rejected;
                continue;
            }
            ++stored;
            auto r = engine.readObject(id);
            if (!r || r->size() != 100) ++read_errors;
        }
    });
    finish(result, start);

    auto u = engine.usage("primary");
    auto m = engine.usage("mirror");
    bool quota_held = u.bytes_used <= threads * per_thread * 100 / 2;
    bool consistent = static_cast<int>(engine.listObjects().size()) == stored.load() &&
                      u.bytes_used == stored.load() * 100 && m.bytes_used == u.bytes_used;
    engine.stop();

    result.passed = quota_held && consistent && read_errors.load() == 0 && rejected.load() > 0;
    result.note = std::to_string(stored.load()) + " stored, " + std::to_string(rejected.load()) + " rejected";
    return result;
}

int main() {
    Logger::instance().setLevel(LogLevel::LOG_WARNING);
    StressTestRunner runner;

    runner.addTest("Tracker: Reservation Race (8 threads)", stress_tracker_reservation_race);
    runner.addTest("Quota: Enforcer Contention (8 threads)", stress_quota_enforcer_contention);
    runner.addTest("Cache: Concurrent Access (16K ops)", stress_cache_concurrent_access);
    runner.addTest("Replication: Convergence (200 objects)", stress_replication_convergence);
    runner.addTest("Engine: Store/Read (8 threads)", stress_engine_store_read);

    return runner.run() == 0 ? 0 : 1;
}
