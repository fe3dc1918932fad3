/**
 * @file policy_engine.cpp
 * @brief PolicyEngine implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "policy_engine.hpp"
#include <sstream>
#include <iomanip>

namespace tierguard {

PolicyEngine::PolicyEngine(ClockFn clock)
    : clock_(std::move(clock)), initialized_(false), running_(false) {}

PolicyEngine::~PolicyEngine() {
    stop();
    if (pool_) pool_->shutdown();
}

//=============================================================================
// Lifecycle
//=============================================================================

Result<void> PolicyEngine::initialize(const EngineConfig& config) {
    if (initialized_) return Err(ErrorCode::INVALID_STATE, "engine already initialized");
    auto valid = EngineConfigValidator::validate(config);
    if (!valid) return valid;
    config_ = config;

    auto level = logLevelFromString(config_.log_level).value_or(LogLevel::LOG_INFO);
    Logger::instance().setLevel(level);
    Logger::instance().setConsoleOutput(config_.log_to_console);
    if (config_.log_to_file && !Logger::instance().initialize(config_.logDir(), level))
        return Err(ErrorCode::IO_ERROR, "cannot open log directory " + config_.logDir().string());

    events_ = std::make_unique<EventBus>(config_.event_history_limit);
    policies_ = std::make_unique<PolicyStore>(clock_);
    tracker_ = std::make_unique<ResourceTracker>(clock_, config_.defaultWindow());
    violations_ = std::make_unique<ViolationReporter>(events_.get(), clock_);
    quotas_ = std::make_unique<QuotaEnforcer>(*policies_, *tracker_, *violations_, events_.get());
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(config_.worker_threads), "engine");
    replication_ = std::make_unique<ReplicationCoordinator>(*policies_, *quotas_, *tracker_, adapters_, *violations_,
                                                            *pool_, config_.retryPolicy(), events_.get(), clock_);

    if (config_.persist_state) {
        state_ = std::make_unique<StateStore>(config_.stateDir());
        auto opened = state_->open();
        if (!opened) return opened;
        auto loaded = loadPersistedState();
        if (!loaded) return loaded;
    }
    installListeners();

    initialized_ = true;
    LOG_INFO("PolicyEngine", std::string("Initialized v") + VERSION + " at " + config_.data_dir);
    return Ok();
}

Result<void> PolicyEngine::start() {
    auto ready = requireInitialized();
    if (!ready) return ready;
    if (running_) return Err(ErrorCode::INVALID_STATE, "engine already running");

    restoreUsage();
    running_ = true;
    events_->emit(EventType::ENGINE_STARTED, "PolicyEngine", "Engine started");
    LOG_INFO("PolicyEngine", "Started with " + std::to_string(listBackends().size()) + " backends, " +
             std::to_string(listObjects().size()) + " objects");
    return Ok();
}

void PolicyEngine::stop() {
    if (!running_) return;
    running_ = false;
    pool_->waitAll();

    if (state_) {
        auto warm = state_->saveWarmState(tracker_->snapshotAll(), clock_());
        if (!warm) LOG_ERROR("PolicyEngine", "Saving warm state failed: " + warm.error().toString());

        std::map<ObjectId, ObjectRecord> snapshot;
        {
            std::shared_lock lock(catalog_mtx_);
            snapshot = objects_;
        }
        auto compacted = state_->compactCatalog(snapshot, replication_->list());
        if (!compacted) LOG_ERROR("PolicyEngine", "Catalog compaction failed: " + compacted.error().toString());
    }

    events_->emit(EventType::ENGINE_STOPPED, "PolicyEngine", "Engine stopped");
    LOG_INFO("PolicyEngine", "Stopped");
}

Result<void> PolicyEngine::requireInitialized() const {
    if (!initialized_) return Err(ErrorCode::INVALID_STATE, "engine not initialized");
    return Ok();
}

Result<void> PolicyEngine::requireRunning() const {
    if (!initialized_) return Err(ErrorCode::INVALID_STATE, "engine not initialized");
    if (!running_) return Err(ErrorCode::INVALID_STATE, "engine not running");
    return Ok();
}

/// Bound for one engine operation including its retries
CancellationToken PolicyEngine::operationToken() const {
    auto attempts = std::max(1, config_.replication_max_attempts);
    return CancellationToken::withTimeout(Millis(config_.adapter_timeout_ms * attempts));
}

Result<void> PolicyEngine::loadPersistedState() {
    auto loaded = state_->loadPolicies();
    if (!loaded) return Err(loaded.error());
    for (const auto& [backend, entry] : loaded.value()) {
        auto r = policies_->restore(backend, entry);
        if (!r) LOG_WARNING("PolicyEngine", "Dropped persisted policy on " + backend + ": " + r.error().toString());
    }

    auto history = state_->loadViolations();
    if (history) violations_->restore(history.value());
    else LOG_WARNING("PolicyEngine", "Violation history unreadable: " + history.error().toString());

    auto catalog = state_->replayCatalog();
    if (!catalog) return Err(catalog.error());
    {
        std::unique_lock lock(catalog_mtx_);
        objects_ = catalog->objects;
    }
    for (const auto& [id, set] : catalog->replicas) replication_->restore(set);

    LOG_INFO("PolicyEngine", "Loaded " + std::to_string(loaded->size()) + " policies, " +
             std::to_string(catalog->objects.size()) + " objects from " + state_->directory().string());
    return Ok();
}

void PolicyEngine::installListeners() {
    policies_->setChangeListener([this] { persistPolicies(); });
    violations_->setChangeListener([this] { persistViolations(); });
    replication_->setChangeListener([this](const ObjectId& id, const ReplicaSet* set) { onReplicaChange(id, set); });
}

void PolicyEngine::persistPolicies() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(persist_mtx_);
    auto r = state_->savePolicies(policies_->exportAll());
    if (!r) LOG_ERROR("PolicyEngine", "Saving policies failed: " + r.error().toString());
}

void PolicyEngine::persistViolations() {
    if (!state_) return;
    std::lock_guard<std::mutex> lock(persist_mtx_);
    auto r = state_->saveViolations(violations_->list());
    if (!r) LOG_ERROR("PolicyEngine", "Saving violations failed: " + r.error().toString());
}

void PolicyEngine::restoreUsage() {
    if (!state_) return;
    auto warm = state_->consumeWarmState(clock_(), config_.warmStateMaxAge());
    if (warm) {
        for (const auto& u : warm.value()) tracker_->restore(u);
        LOG_INFO("PolicyEngine", "Restored usage of " + std::to_string(warm->size()) + " backends from warm state");
        return;
    }
    LOG_INFO("PolicyEngine", "Rebuilding usage: " + warm.error().toString());
    auto rebuilt = rebuildUsage();
    if (!rebuilt) LOG_WARNING("PolicyEngine", "Usage rebuild failed: " + rebuilt.error().toString());
}

Result<void> PolicyEngine::rebuildUsage() {
    auto ready = requireInitialized();
    if (!ready) return ready;

    std::map<BackendId, std::pair<int64_t, int64_t>> totals;
    for (const auto& b : listBackends()) totals[b.id] = {0, 0};

    size_t missing = 0, unknown = 0;
    for (const auto& obj : listObjects()) {
        std::vector<BackendId> holders{obj.backend_id};
        holders.insert(holders.end(), obj.replica_backends.begin(), obj.replica_backends.end());
        for (const auto& b : holders) {
            auto adapter = adapters_.get(b);
            if (!adapter) { ++unknown; continue; }
            auto token = CancellationToken::withTimeout(config_.adapterTimeout());
            auto st = guardedCall<ObjectStat>(b, "stat", [&] { return adapter->stat(obj.object_id, token); });
            if (!st) {
                if (st.error().is(ErrorCode::NOT_FOUND)) {
                    ++missing;
                    LOG_WARNING("PolicyEngine", obj.object_id + " is missing from " + b);
                } else {
                    ++unknown;
                }
                continue;
            }
            totals[b].first += st->size_bytes;
            totals[b].second += 1;
        }
    }
    for (const auto& [b, t] : totals) tracker_->rebuild(b, t.first, t.second);
    LOG_INFO("PolicyEngine", "Rebuilt usage of " + std::to_string(totals.size()) + " backends (" +
             std::to_string(missing) + " missing, " + std::to_string(unknown) + " unreachable copies)");
    return Ok();
}

//=============================================================================
// Backends and policies
//=============================================================================

Result<void> PolicyEngine::registerBackend(const BackendInfo& info, std::shared_ptr<BackendAdapter> adapter) {
    auto ready = requireInitialized();
    if (!ready) return ready;
    if (!adapter) return Err(ErrorCode::INVALID_ARGUMENT, "null adapter for " + info.id);
    if (adapter->id() != info.id)
        return Err(ErrorCode::INVALID_ARGUMENT, "adapter id " + adapter->id() + " does not match " + info.id);
    if (adapters_.has(info.id)) return Err(ErrorCode::ALREADY_EXISTS, "backend already registered: " + info.id);

    auto r = policies_->registerBackend(info);
    if (!r) return r;
    auto added = adapters_.add(std::move(adapter));
    if (!added) return added;

    events_->emit(EventType::BACKEND_REGISTERED, "PolicyEngine",
                  info.id + " (" + costTierToString(info.capabilities.cost_tier) + ")", info.id);
    return Ok();
}

Result<void> PolicyEngine::setBackendEnabled(const BackendId& id, bool enabled) {
    auto ready = requireInitialized();
    if (!ready) return ready;
    auto r = policies_->setBackendEnabled(id, enabled);
    if (!r) return r;
    events_->emit(enabled ? EventType::BACKEND_ENABLED : EventType::BACKEND_DISABLED, "PolicyEngine", id, id);
    return Ok();
}

std::vector<BackendInfo> PolicyEngine::listBackends() const {
    if (!initialized_) return {};
    return policies_->listBackends();
}

Result<void> PolicyEngine::setPolicy(const BackendId& backend, const Policy& policy) {
    auto ready = requireInitialized();
    if (!ready) return ready;
    auto r = policies_->set(backend, policy);
    if (!r) return r;

    PolicyKind kind = policyKindOf(policy);
    events_->emit(EventType::POLICY_CHANGED, "PolicyEngine", policyKindToString(kind) + " " + encodePolicy(policy), backend);

    if (const auto* cp = std::get_if<CachePolicy>(&policy)) {
        if (auto c = cache()) {
            for (size_t i = 0; i < c->tierCount(); ++i) {
                if (c->tierBackend(i) != backend) continue;
                auto resized = c->setTierCapacity(i, cp->tier_capacity_bytes);
                if (!resized) LOG_WARNING("PolicyEngine", "Tier " + c->tierName(i) + " resize: " + resized.error().toString());
            }
        }
    }
    if (kind == PolicyKind::STORAGE_QUOTA || kind == PolicyKind::TRAFFIC_QUOTA) quotas_->refresh(backend);
    return Ok();
}

std::optional<Policy> PolicyEngine::getPolicy(const BackendId& backend, PolicyKind kind) const {
    if (!initialized_) return std::nullopt;
    return policies_->get(backend, kind);
}

std::vector<PolicyEntry> PolicyEngine::listPolicies(const BackendId& backend) const {
    if (!initialized_) return {};
    return policies_->list(backend);
}

Result<void> PolicyEngine::setPolicyEnabled(const BackendId& backend, PolicyKind kind, bool enabled) {
    auto ready = requireInitialized();
    if (!ready) return ready;
    auto r = policies_->setEnabled(backend, kind, enabled);
    if (!r) return r;
    events_->emit(EventType::POLICY_CHANGED, "PolicyEngine",
                  policyKindToString(kind) + (enabled ? " enabled" : " disabled"), backend);
    if (kind == PolicyKind::STORAGE_QUOTA || kind == PolicyKind::TRAFFIC_QUOTA) {
        if (enabled) quotas_->refresh(backend);
        else violations_->resolve(backend, kind);
    }
    return Ok();
}

Result<void> PolicyEngine::removePolicy(const BackendId& backend, PolicyKind kind) {
    auto ready = requireInitialized();
    if (!ready) return ready;
    auto r = policies_->remove(backend, kind);
    if (!r) return r;
    events_->emit(EventType::POLICY_REMOVED, "PolicyEngine", policyKindToString(kind), backend);
    if (kind == PolicyKind::STORAGE_QUOTA || kind == PolicyKind::TRAFFIC_QUOTA) violations_->resolve(backend, kind);
    return Ok();
}

//=============================================================================
// Cache tiers
//=============================================================================

Result<void> PolicyEngine::configureCacheTiers(const std::vector<BackendId>& tier_backends) {
    auto ready = requireInitialized();
    if (!ready) return ready;
    if (tier_backends.empty()) return Err(ErrorCode::INVALID_ARGUMENT, "no tier backends");

    std::vector<TierConfig> tiers;
    std::set<BackendId> seen;
    for (const auto& b : tier_backends) {
        if (!seen.insert(b).second) return Err(ErrorCode::INVALID_ARGUMENT, "backend listed twice: " + b);
        if (!policies_->getBackend(b)) return Err(ErrorCode::BACKEND_NOT_FOUND, "unknown backend " + b);
        auto cp = policies_->getAs<CachePolicy>(b);
        if (!cp) return Err(ErrorCode::INVALID_POLICY, "no cache policy on " + b);
        tiers.push_back(TierConfig::fromPolicy(b, b, *cp));
    }

    auto created = TieredCacheManager::create(std::move(tiers), clock_, events_.get(), pool_.get());
    if (!created) return Err(created.error());
    std::shared_ptr<TieredCacheManager> manager(std::move(created.value()));
    manager->setMoveHandler([this](const TierMove& m) { onTierMove(m); });
    {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        cache_ = manager;
    }
    LOG_INFO("PolicyEngine", "Configured " + std::to_string(tier_backends.size()) + " cache tiers");
    return Ok();
}

std::shared_ptr<TieredCacheManager> PolicyEngine::cache() const {
    std::lock_guard<std::mutex> lock(cache_mtx_);
    return cache_;
}

Result<void> PolicyEngine::pinObject(const ObjectId& id) {
    auto c = cache();
    if (!c) return Err(ErrorCode::INVALID_STATE, "no cache tiers configured");
    return c->pin(id);
}

Result<void> PolicyEngine::unpinObject(const ObjectId& id) {
    auto c = cache();
    if (!c) return Err(ErrorCode::INVALID_STATE, "no cache tiers configured");
    return c->unpin(id);
}

bool PolicyEngine::holdsDurableCopy(const ObjectId& id, const BackendId& backend) const {
    {
        std::shared_lock lock(catalog_mtx_);
        auto it = objects_.find(id);
        if (it != objects_.end() && it->second.backend_id == backend) return true;
    }
    auto set = replication_->get(id);
    if (!set) return false;
    const auto* t = set->target(backend);
    return t && t->status != ReplicaStatus::FAILED;
}

/// Carries out a placement change on the tier backends; runs on the pool
void PolicyEngine::onTierMove(const TierMove& move) {
    auto token = operationToken();
    auto retry = config_.retryPolicy();

    if (move.to_tier && !holdsDurableCopy(move.object_id, move.to_backend)) {
        auto rec = getObject(move.object_id);
        if (!rec) return;
        std::optional<Bytes> data;
        for (const auto& src : {move.from_backend, rec->backend_id}) {
            auto adapter = src.empty() ? nullptr : adapters_.get(src);
            if (!adapter) continue;
            auto got = withRetry<Bytes>(retry, token, [&] {
                return guardedCall<Bytes>(src, "get", [&] { return adapter->get(move.object_id, token); });
            });
            if (got && static_cast<int64_t>(got->size()) == move.size_bytes) {
                data = std::move(got.value());
                break;
            }
        }
        auto dst = adapters_.get(move.to_backend);
        if (!data || !dst) {
            LOG_WARNING("PolicyEngine", "Tier copy of " + move.object_id + " to " + move.to_backend + " skipped: no source");
            return;
        }

        // A tier backend's own quota wins over its cache capacity. A refused
        // copy drops the entry, so reads go to the home backend and the
        // source tier copy is still cleaned up below.
        auto reservation = quotas_->reserve(move.to_backend, UsageDelta::store(move.size_bytes));
        auto c = cache();
        if (!reservation) {
            LOG_INFO("PolicyEngine", "Tier copy of " + move.object_id + " to " + move.to_backend + " refused: " +
                     reservation.error().toString());
            auto now_at = c ? c->find(move.object_id) : std::nullopt;
            if (now_at && now_at->tier == *move.to_tier) c->remove(move.object_id);
        } else {
            auto put = withRetry<void>(retry, token, [&] {
                return guardedCall<void>(move.to_backend, "put", [&] { return dst->put(move.object_id, *data, token); });
            });
            if (!put) {
                auto released = quotas_->release(*reservation);
                if (!released) LOG_WARNING("PolicyEngine", "Release failed: " + released.error().toString());
                LOG_WARNING("PolicyEngine", "Tier copy of " + move.object_id + " to " + move.to_backend + " failed: " + put.error().toString());
                return;
            }
            auto committed = quotas_->commit(*reservation);
            if (!committed) LOG_WARNING("PolicyEngine", "Commit failed: " + committed.error().toString());

            // The entry may have moved on while the copy was in flight
            auto now_at = c ? c->find(move.object_id) : std::nullopt;
            if (!now_at || now_at->tier != *move.to_tier) {
                auto undo = guardedCall<void>(move.to_backend, "remove", [&] { return dst->remove(move.object_id, token); });
                if (undo) tracker_->record(move.to_backend, UsageDelta::remove(move.size_bytes));
            }
        }
    }

    if (move.from_tier && move.from_backend != move.to_backend &&
        !holdsDurableCopy(move.object_id, move.from_backend)) {
        auto src = adapters_.get(move.from_backend);
        if (!src) return;
        auto removed = withRetry<void>(retry, token, [&] {
            return guardedCall<void>(move.from_backend, "remove", [&] { return src->remove(move.object_id, token); });
        });
        if (removed) tracker_->record(move.from_backend, UsageDelta::remove(move.size_bytes));
        else if (!removed.error().is(ErrorCode::NOT_FOUND))
            LOG_WARNING("PolicyEngine", "Tier cleanup of " + move.object_id + " on " + move.from_backend + " failed: " + removed.error().toString());
    }
}

//=============================================================================
// Objects
//=============================================================================

Result<ObjectRecord> PolicyEngine::storeObject(const BackendId& backend, const ObjectId& id, const Bytes& data) {
    return storeObject(backend, id, data, operationToken());
}

Result<ObjectRecord> PolicyEngine::storeObject(const BackendId& backend, const ObjectId& id, const Bytes& data,
                                               const CancellationToken& token) {
    auto ready = requireRunning();
    if (!ready) return Err<ObjectRecord>(ready.error());
    if (id.empty()) return Err<ObjectRecord>(ErrorCode::INVALID_ARGUMENT, "empty object id");
    auto info = policies_->getBackend(backend);
    if (!info) return Err<ObjectRecord>(ErrorCode::BACKEND_NOT_FOUND, "unknown backend " + backend);
    if (!info->enabled) return Err<ObjectRecord>(ErrorCode::BACKEND_DISABLED, "backend disabled: " + backend);
    auto adapter = adapters_.get(backend);
    if (!adapter) return Err<ObjectRecord>(ErrorCode::BACKEND_NOT_FOUND, "no adapter for " + backend);

    {
        std::unique_lock lock(catalog_mtx_);
        if (objects_.count(id) || !storing_.insert(id).second)
            return Err<ObjectRecord>(ErrorCode::ALREADY_EXISTS, "object exists: " + id);
    }
    struct StoringGuard {
        PolicyEngine& e;
        const ObjectId& id;
        ~StoringGuard() {
            std::unique_lock lock(e.catalog_mtx_);
            e.storing_.erase(id);
        }
    } guard{*this, id};

    const int64_t size = static_cast<int64_t>(data.size());
    auto reservation = quotas_->reserve(backend, UsageDelta::store(size));
    if (!reservation) {
        if (reservation.error().isRefusal()) LOG_INFO("PolicyEngine", "Store of " + id + " refused: " + reservation.error().toString());
        return Err<ObjectRecord>(reservation.error().within(id));
    }

    auto put = withRetry<void>(config_.retryPolicy(), token, [&] {
        return guardedCall<void>(backend, "put", [&] { return adapter->put(id, data, token); });
    });
    if (!put) {
        auto released = quotas_->release(*reservation);
        if (!released) LOG_WARNING("PolicyEngine", "Release failed: " + released.error().toString());
        LOG_WARNING("PolicyEngine", "Store of " + id + " on " + backend + " failed: " + put.error().toString());
        return Err<ObjectRecord>(put.error().within(backend + "/" + id));
    }
    auto committed = quotas_->commit(*reservation);
    if (!committed) LOG_WARNING("PolicyEngine", "Commit failed: " + committed.error().toString());

    ObjectRecord rec{id, backend, size, clock_(), {}};
    {
        std::unique_lock lock(catalog_mtx_);
        objects_[id] = rec;
    }
    if (state_) {
        auto journaled = state_->appendPut(rec);
        if (!journaled) LOG_ERROR("PolicyEngine", "Journal write failed for " + id + ": " + journaled.error().toString());
    }
    events_->emit(EventType::OBJECT_STORED, "PolicyEngine", formatBytes(size), backend, id);

    if (auto c = cache()) {
        auto placed = c->access(id, size);
        if (!placed) {
            if (placed.error().is(ErrorCode::TIER_FULL)) LOG_DEBUG("PolicyEngine", id + " bypasses the cache: " + placed.error().message);
            else LOG_WARNING("PolicyEngine", "Cache placement of " + id + " failed: " + placed.error().toString());
        }
    }

    if (auto rp = policies_->getAs<ReplicationPolicy>(backend)) {
        ReplicationRequest req{id, size, std::make_shared<const Bytes>(data), backend, backend};
        auto replicated = replication_->ensure(req, *rp, token);
        if (!replicated) {
            return Err<ObjectRecord>(replicated.error().code,
                                     "stored " + id + " on " + backend + " but replication failed: " + replicated.error().message);
        }
    }
    return getObject(id).value_or(rec);
}

Result<Bytes> PolicyEngine::readObject(const ObjectId& id) {
    return readObject(id, operationToken());
}

Result<Bytes> PolicyEngine::readObject(const ObjectId& id, const CancellationToken& token) {
    auto ready = requireRunning();
    if (!ready) return Err<Bytes>(ready.error());
    auto rec = getObject(id);
    if (!rec) return Err<Bytes>(ErrorCode::NOT_FOUND, "no object " + id);

    std::vector<BackendId> sources;
    if (auto c = cache()) {
        auto hit = c->access(id, rec->size_bytes);
        if (hit && hit->hit) sources.push_back(c->tierBackend(hit->tier));
        else if (!hit && !hit.error().is(ErrorCode::TIER_FULL))
            LOG_WARNING("PolicyEngine", "Cache lookup of " + id + " failed: " + hit.error().toString());
    }
    sources.push_back(rec->backend_id);
    sources.insert(sources.end(), rec->replica_backends.begin(), rec->replica_backends.end());

    std::set<BackendId> tried;
    Error last(ErrorCode::NOT_FOUND, "no readable copy of " + id);
    for (const auto& b : sources) {
        if (!tried.insert(b).second) continue;
        auto data = readFrom(b, id, rec->size_bytes, token);
        if (data) return data;
        last = data.error().within(b);
        LOG_DEBUG("PolicyEngine", "Read of " + id + " from " + b + " failed: " + last.toString());
        if (!token.check()) break;
    }
    return Err<Bytes>(last);
}

Result<Bytes> PolicyEngine::readFrom(const BackendId& backend, const ObjectId& id, int64_t size,
                                     const CancellationToken& token) {
    auto adapter = adapters_.get(backend);
    if (!adapter) return Err<Bytes>(ErrorCode::BACKEND_NOT_FOUND, "no adapter for " + backend);
    auto reservation = quotas_->reserve(backend, UsageDelta::read(size));
    if (!reservation) return Err<Bytes>(reservation.error());

    auto data = withRetry<Bytes>(config_.retryPolicy(), token, [&] {
        return guardedCall<Bytes>(backend, "get", [&] { return adapter->get(id, token); });
    });
    if (data && static_cast<int64_t>(data->size()) != size)
        data = Err<Bytes>(ErrorCode::ADAPTER_ERROR, backend + " returned " + std::to_string(data->size()) + " bytes for " + id);
    if (!data) {
        auto released = quotas_->release(*reservation);
        if (!released) LOG_WARNING("PolicyEngine", "Release failed: " + released.error().toString());
        return data;
    }
    auto committed = quotas_->commit(*reservation);
    if (!committed) LOG_WARNING("PolicyEngine", "Commit failed: " + committed.error().toString());
    return data;
}

Result<void> PolicyEngine::deleteObject(const ObjectId& id) {
    return deleteObject(id, operationToken());
}

Result<void> PolicyEngine::deleteObject(const ObjectId& id, const CancellationToken& token) {
    auto ready = requireRunning();
    if (!ready) return ready;
    auto rec = getObject(id);
    if (!rec) return Err(ErrorCode::NOT_FOUND, "no object " + id);

    if (auto rp = policies_->getAs<RetentionPolicy>(rec->backend_id)) {
        if (rp->legal_hold) return Err(ErrorCode::RETENTION_LOCKED, id + " is under legal hold");
        auto age = clock_() - rec->created_at;
        if (rp->minimum_age_before_delete.count() > 0 && age < rp->minimum_age_before_delete) {
            return Err(ErrorCode::RETENTION_LOCKED, id + " is younger than the minimum retention of " +
                       std::to_string(rp->minimum_age_before_delete.count()) + "s");
        }
    }

    if (replication_->get(id)) {
        auto r = replication_->remove(id, token);
        if (!r) return r;
    }

    auto adapter = adapters_.get(rec->backend_id);
    if (!adapter) return Err(ErrorCode::BACKEND_NOT_FOUND, "no adapter for " + rec->backend_id);
    auto removed = withRetry<void>(config_.retryPolicy(), token, [&] {
        return guardedCall<void>(rec->backend_id, "remove", [&] { return adapter->remove(id, token); });
    });
    if (!removed && !removed.error().is(ErrorCode::NOT_FOUND)) return removed;
    if (removed) tracker_->record(rec->backend_id, UsageDelta::remove(rec->size_bytes));

    {
        std::unique_lock lock(catalog_mtx_);
        objects_.erase(id);
    }
    if (auto c = cache()) c->remove(id);
    if (state_) {
        auto journaled = state_->appendDelete(id);
        if (!journaled) LOG_ERROR("PolicyEngine", "Journal write failed for " + id + ": " + journaled.error().toString());
    }
    quotas_->refresh(rec->backend_id);
    events_->emit(EventType::OBJECT_DELETED, "PolicyEngine", id, rec->backend_id, id);
    return Ok();
}

std::optional<ObjectRecord> PolicyEngine::getObject(const ObjectId& id) const {
    std::shared_lock lock(catalog_mtx_);
    auto it = objects_.find(id);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

std::vector<ObjectRecord> PolicyEngine::listObjects() const {
    std::shared_lock lock(catalog_mtx_);
    std::vector<ObjectRecord> out;
    out.reserve(objects_.size());
    for (const auto& [id, r] : objects_) out.push_back(r);
    return out;
}

std::vector<ObjectRecord> PolicyEngine::archiveCandidates() const {
    std::vector<ObjectRecord> out;
    if (!initialized_) return out;
    auto now = clock_();
    for (const auto& rec : listObjects()) {
        auto rp = policies_->getAs<RetentionPolicy>(rec.backend_id);
        if (!rp || rp->maximum_age_before_archive.count() <= 0) continue;
        if (now - rec.created_at >= rp->maximum_age_before_archive) out.push_back(rec);
    }
    return out;
}

//=============================================================================
// Replication
//=============================================================================

void PolicyEngine::onReplicaChange(const ObjectId& id, const ReplicaSet* set) {
    if (!set) return;
    {
        std::unique_lock lock(catalog_mtx_);
        auto it = objects_.find(id);
        if (it != objects_.end()) it->second.replica_backends = set->backendsWith(ReplicaStatus::VERIFIED);
    }
    if (state_) {
        auto r = state_->appendReplicas(*set);
        if (!r) LOG_ERROR("PolicyEngine", "Journal write failed for replicas of " + id + ": " + r.error().toString());
    }
}

Result<ReplicaSet> PolicyEngine::repairReplicas(const ObjectId& id) {
    auto ready = requireRunning();
    if (!ready) return Err<ReplicaSet>(ready.error());
    return replication_->repair(id, operationToken());
}

Result<ReplicaSet> PolicyEngine::verifyReplicas(const ObjectId& id) {
    auto ready = requireRunning();
    if (!ready) return Err<ReplicaSet>(ready.error());
    return replication_->verify(id, operationToken());
}

std::optional<ReplicaSet> PolicyEngine::replicaSet(const ObjectId& id) const {
    if (!initialized_) return std::nullopt;
    return replication_->get(id);
}

MaintenanceReport PolicyEngine::runMaintenance() {
    MaintenanceReport report;
    if (!running_) return report;
    if (auto c = cache()) report.cache_actions = c->runMaintenance();
    for (const auto& id : replication_->degraded()) {
        auto r = replication_->repair(id, operationToken());
        if (r) ++report.repaired;
        else ++report.still_degraded;
    }
    for (const auto& b : policies_->listBackends()) {
        quotas_->refresh(b.id);
        ++report.backends_refreshed;
    }
    LOG_DEBUG("PolicyEngine", "Maintenance: " + std::to_string(report.cache_actions) + " cache actions, " +
              std::to_string(report.repaired) + " repaired, " + std::to_string(report.still_degraded) + " degraded");
    return report;
}

//=============================================================================
// Queries
//=============================================================================

UsageRecord PolicyEngine::usage(const BackendId& backend) {
    if (!initialized_) return UsageRecord{};
    return tracker_->snapshot(backend);
}

std::vector<UsageRecord> PolicyEngine::allUsage() {
    if (!initialized_) return {};
    return tracker_->snapshotAll();
}

std::vector<Violation> PolicyEngine::violations(const ViolationFilter& filter) const {
    if (!initialized_) return {};
    return violations_->list(filter);
}

ViolationSummary PolicyEngine::violationSummary() const {
    if (!initialized_) return ViolationSummary{};
    return violations_->summary();
}

std::optional<CacheStatistics> PolicyEngine::cacheStatistics() const {
    auto c = cache();
    if (!c) return std::nullopt;
    return c->statistics();
}

std::string PolicyEngine::statusReport() {
    std::ostringstream oss;
    oss << "=== TierGuard Status ===\n"
        << "Version: " << VERSION << "\n"
        << "State: " << (running_ ? "Running" : (initialized_ ? "Stopped" : "Uninitialized")) << "\n";
    if (!initialized_) return oss.str();

    oss << "Objects: " << listObjects().size() << "\n\n--- Backends ---\n";
    for (const auto& b : policies_->listBackends()) {
        auto u = tracker_->snapshot(b.id);
        oss << std::left << std::setw(16) << b.id << std::setw(6) << costTierToString(b.capabilities.cost_tier)
            << std::setw(10) << (b.enabled ? "enabled" : "disabled")
            << formatBytes(u.bytes_used) << " in " << u.file_count << " files, window "
            << formatBytes(u.bytes_transferred_in_window) << " / " << u.request_count_in_window << " requests\n";
    }
    oss << "\n" << violations_->generateReport();
    if (auto c = cache()) oss << "\n" << c->generateReport();
    oss << "\n" << replication_->generateReport();
    return oss.str();
}

} // namespace tierguard
