/**
 * @file policy_engine.hpp
 * @brief Engine handle coordinating policies, usage, cache and replicas
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * The PolicyEngine owns every component; there is no process-wide policy or
 * usage state. Typical lifecycle:
 *   initialize(config) -> registerBackend(...) -> configureCacheTiers(...)
 *   -> start() -> object operations -> stop()
 * Backends are registered before start() so usage can be rebuilt through
 * their adapters when no warm state is available.
 */
#ifndef TIERGUARD_POLICY_ENGINE_HPP
#define TIERGUARD_POLICY_ENGINE_HPP

#include "tg_types.hpp"
#include "tg_config.hpp"
#include "tg_logger.hpp"
#include "event_system.hpp"
#include "thread_pool.hpp"
#include "policy_store.hpp"
#include "resource_tracker.hpp"
#include "violation_reporter.hpp"
#include "quota_enforcer.hpp"
#include "tiered_cache_manager.hpp"
#include "replication_coordinator.hpp"
#include "state_store.hpp"

#include <memory>
#include <filesystem>
#include <atomic>

namespace tierguard {

/**
 * @struct MaintenanceReport
 * @brief Work done by one runMaintenance() pass
 */
struct MaintenanceReport {
    size_t cache_actions = 0;
    size_t repaired = 0;
    size_t still_degraded = 0;
    size_t backends_refreshed = 0;
};

/**
 * @class PolicyEngine
 * @brief Main entry point for embedding applications
 */
class PolicyEngine {
public:
    explicit PolicyEngine(ClockFn clock = systemClock());
    ~PolicyEngine();
    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    // Lifecycle
    Result<void> initialize(const EngineConfig& config);
    Result<void> start();
    void stop();
    bool isInitialized() const { return initialized_; }
    bool isRunning() const { return running_; }
    static std::string getVersion() { return VERSION; }

    // Backends
    Result<void> registerBackend(const BackendInfo& info, std::shared_ptr<BackendAdapter> adapter);
    Result<void> setBackendEnabled(const BackendId& id, bool enabled);
    std::vector<BackendInfo> listBackends() const;

    // Policy configuration
    Result<void> setPolicy(const BackendId& backend, const Policy& policy);
    std::optional<Policy> getPolicy(const BackendId& backend, PolicyKind kind) const;
    std::vector<PolicyEntry> listPolicies(const BackendId& backend) const;
    Result<void> setPolicyEnabled(const BackendId& backend, PolicyKind kind, bool enabled);
    Result<void> removePolicy(const BackendId& backend, PolicyKind kind);

    // Cache tiers, fastest first; each backend needs a cache policy
    Result<void> configureCacheTiers(const std::vector<BackendId>& tier_backends);
    Result<void> pinObject(const ObjectId& id);
    Result<void> unpinObject(const ObjectId& id);

    // Objects
    Result<ObjectRecord> storeObject(const BackendId& backend, const ObjectId& id, const Bytes& data);
    Result<ObjectRecord> storeObject(const BackendId& backend, const ObjectId& id, const Bytes& data,
                                     const CancellationToken& token);
    Result<Bytes> readObject(const ObjectId& id);
    Result<Bytes> readObject(const ObjectId& id, const CancellationToken& token);
    Result<void> deleteObject(const ObjectId& id);
    Result<void> deleteObject(const ObjectId& id, const CancellationToken& token);
    std::optional<ObjectRecord> getObject(const ObjectId& id) const;
    std::vector<ObjectRecord> listObjects() const;
    std::vector<ObjectRecord> archiveCandidates() const;

    // Replication
    Result<ReplicaSet> repairReplicas(const ObjectId& id);
    Result<ReplicaSet> verifyReplicas(const ObjectId& id);
    std::optional<ReplicaSet> replicaSet(const ObjectId& id) const;

    // Background work, driven by the embedding application
    MaintenanceReport runMaintenance();
    Result<void> rebuildUsage();

    // Queries
    UsageRecord usage(const BackendId& backend);
    std::vector<UsageRecord> allUsage();
    std::vector<Violation> violations(const ViolationFilter& filter = {}) const;
    ViolationSummary violationSummary() const;
    std::optional<CacheStatistics> cacheStatistics() const;
    std::string statusReport();

    // Component access
    const EngineConfig& config() const { return config_; }
    EventBus& events() { return *events_; }
    PolicyStore& policies() { return *policies_; }
    ResourceTracker& tracker() { return *tracker_; }
    QuotaEnforcer& quotas() { return *quotas_; }
    ViolationReporter& violationReporter() { return *violations_; }
    ReplicationCoordinator& replication() { return *replication_; }
    AdapterRegistry& adapters() { return adapters_; }
    std::shared_ptr<TieredCacheManager> cache() const;

private:
    Result<void> requireInitialized() const;
    Result<void> requireRunning() const;
    CancellationToken operationToken() const;

    Result<void> loadPersistedState();
    void installListeners();
    void restoreUsage();
    void persistPolicies();
    void persistViolations();
    void onReplicaChange(const ObjectId& id, const ReplicaSet* set);
    void onTierMove(const TierMove& move);
    bool holdsDurableCopy(const ObjectId& id, const BackendId& backend) const;

    Result<Bytes> readFrom(const BackendId& backend, const ObjectId& id, int64_t size,
                           const CancellationToken& token);

    ClockFn clock_;
    EngineConfig config_;
    std::atomic<bool> initialized_;
    std::atomic<bool> running_;

    AdapterRegistry adapters_;
    std::unique_ptr<EventBus> events_;
    std::unique_ptr<PolicyStore> policies_;
    std::unique_ptr<ResourceTracker> tracker_;
    std::unique_ptr<ViolationReporter> violations_;
    std::unique_ptr<QuotaEnforcer> quotas_;
    std::unique_ptr<StateStore> state_;
    std::mutex persist_mtx_;

    mutable std::mutex cache_mtx_;
    std::shared_ptr<TieredCacheManager> cache_;

    mutable std::shared_mutex catalog_mtx_;
    std::map<ObjectId, ObjectRecord> objects_;
    std::set<ObjectId> storing_;            ///< Ids with a store in progress

    std::unique_ptr<ReplicationCoordinator> replication_;
    std::unique_ptr<ThreadPool> pool_;      // declared last so workers stop first
};

} // namespace tierguard
#endif // TIERGUARD_POLICY_ENGINE_HPP
