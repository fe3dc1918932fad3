/**
 * @file policy_store.hpp
 * @brief Backend registry and per-backend policy documents
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_POLICY_STORE_HPP
#define TIERGUARD_POLICY_STORE_HPP

#include "backend_policy.hpp"
#include "tg_logger.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <mutex>
#include <atomic>

namespace tierguard {

/**
 * @struct PolicyEntry
 * @brief A stored policy with its enable flag
 */
struct PolicyEntry {
    Policy policy;
    bool enabled = true;
    TimePoint updated_at;

    [[nodiscard]] PolicyKind kind() const { return policyKindOf(policy); }
};

using PolicySet = std::map<PolicyKind, PolicyEntry>;

/**
 * @class PolicyStore
 * @brief Owns backend descriptions and their policies
 *
 * Each backend's policy set is immutable once published; writers build a new
 * set and swap the pointer under the write lock, so readers always observe a
 * complete set. Policies may be attached before the backend is registered.
 */
class PolicyStore {
public:
    using ChangeListener = std::function<void()>;

    explicit PolicyStore(ClockFn clock = systemClock()) : clock_(std::move(clock)) {}

    //=========================================================================
    // Backends
    //=========================================================================

    Result<void> registerBackend(const BackendInfo& info) {
        if (!isValidBackendId(info.id)) return Err(ErrorCode::INVALID_ARGUMENT, "invalid backend id '" + info.id + "'");
        {
            std::unique_lock lock(mtx_);
            if (backends_.count(info.id)) return Err(ErrorCode::ALREADY_EXISTS, "backend already registered: " + info.id);
            backends_[info.id] = info;
            ++generation_;
        }
        LOG_INFO("PolicyStore", "Registered backend " + info.id + " (" + costTierToString(info.capabilities.cost_tier) +
                 (info.region.empty() ? "" : ", region " + info.region) + ")");
        notify();
        return Ok();
    }

    Result<void> setBackendEnabled(const BackendId& id, bool enabled) {
        {
            std::unique_lock lock(mtx_);
            auto it = backends_.find(id);
            if (it == backends_.end()) return Err(ErrorCode::BACKEND_NOT_FOUND, id);
            if (it->second.enabled == enabled) return Ok();
            it->second.enabled = enabled;
            ++generation_;
        }
        LOG_INFO("PolicyStore", "Backend " + id + (enabled ? " enabled" : " disabled"));
        notify();
        return Ok();
    }

    [[nodiscard]] std::optional<BackendInfo> getBackend(const BackendId& id) const {
        std::shared_lock lock(mtx_);
        auto it = backends_.find(id);
        if (it == backends_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] std::vector<BackendInfo> listBackends() const {
        std::shared_lock lock(mtx_);
        std::vector<BackendInfo> out;
        for (const auto& [id, b] : backends_) out.push_back(b);
        return out;
    }

    /// Unregistered backends count as enabled so policies can be staged early
    [[nodiscard]] bool isBackendEnabled(const BackendId& id) const {
        std::shared_lock lock(mtx_);
        auto it = backends_.find(id);
        return it == backends_.end() || it->second.enabled;
    }

    //=========================================================================
    // Policies
    //=========================================================================

    /**
     * @brief Validate and install a policy, replacing any of the same kind
     */
    Result<void> set(const BackendId& backend, const Policy& policy) {
        if (!isValidBackendId(backend)) return Err(ErrorCode::INVALID_ARGUMENT, "invalid backend id '" + backend + "'");
        auto valid = validatePolicy(policy);
        if (!valid) {
            LOG_WARNING("PolicyStore", "Rejected policy for " + backend + ": " + valid.error().toString());
            return valid;
        }
        PolicyKind kind = policyKindOf(policy);
        {
            std::unique_lock lock(mtx_);
            auto next = copyOf(backend);
            bool enabled = true;
            auto prev = next->find(kind);
            if (prev != next->end()) enabled = prev->second.enabled;
            (*next)[kind] = PolicyEntry{policy, enabled, clock_()};
            policies_[backend] = std::move(next);
            ++generation_;
        }
        LOG_INFO("PolicyStore", "Set " + policyKindToString(kind) + " policy on " + backend + ": " + encodePolicy(policy));
        notify();
        return Ok();
    }

    /// Enabled policy of the given kind, or std::nullopt when not configured
    [[nodiscard]] std::optional<Policy> get(const BackendId& backend, PolicyKind kind) const {
        auto set = snapshot(backend);
        if (!set) return std::nullopt;
        auto it = set->find(kind);
        if (it == set->end() || !it->second.enabled) return std::nullopt;
        return it->second.policy;
    }

    template<typename T>
    [[nodiscard]] std::optional<T> getAs(const BackendId& backend) const {
        auto p = get(backend, PolicyKindTraits<T>::kind);
        if (!p) return std::nullopt;
        return std::get<T>(*p);
    }

    /// Every stored policy of the backend, disabled ones included
    [[nodiscard]] std::vector<PolicyEntry> list(const BackendId& backend) const {
        std::vector<PolicyEntry> out;
        auto set = snapshot(backend);
        if (set) for (const auto& [k, e] : *set) out.push_back(e);
        return out;
    }

    Result<void> setEnabled(const BackendId& backend, PolicyKind kind, bool enabled) {
        {
            std::unique_lock lock(mtx_);
            auto it = policies_.find(backend);
            if (it == policies_.end() || !it->second->count(kind))
                return Err(ErrorCode::NOT_FOUND, policyKindToString(kind) + " policy not set on " + backend);
            auto next = std::make_shared<PolicySet>(*it->second);
            auto& entry = next->at(kind);
            if (entry.enabled == enabled) return Ok();
            entry.enabled = enabled;
            entry.updated_at = clock_();
            it->second = std::move(next);
            ++generation_;
        }
        LOG_INFO("PolicyStore", policyKindToString(kind) + " policy on " + backend + (enabled ? " enabled" : " disabled"));
        notify();
        return Ok();
    }

    Result<void> remove(const BackendId& backend, PolicyKind kind) {
        {
            std::unique_lock lock(mtx_);
            auto it = policies_.find(backend);
            if (it == policies_.end() || !it->second->count(kind))
                return Err(ErrorCode::NOT_FOUND, policyKindToString(kind) + " policy not set on " + backend);
            auto next = std::make_shared<PolicySet>(*it->second);
            next->erase(kind);
            it->second = std::move(next);
            ++generation_;
        }
        LOG_INFO("PolicyStore", "Removed " + policyKindToString(kind) + " policy from " + backend);
        notify();
        return Ok();
    }

    /// Immutable view of a backend's policies; nullptr when none were ever set
    [[nodiscard]] std::shared_ptr<const PolicySet> snapshot(const BackendId& backend) const {
        std::shared_lock lock(mtx_);
        auto it = policies_.find(backend);
        return it == policies_.end() ? nullptr : it->second;
    }

    [[nodiscard]] std::map<BackendId, PolicySet> exportAll() const {
        std::shared_lock lock(mtx_);
        std::map<BackendId, PolicySet> out;
        for (const auto& [id, set] : policies_) if (!set->empty()) out[id] = *set;
        return out;
    }

    /**
     * @brief Install a previously persisted entry without notifying listeners
     */
    Result<void> restore(const BackendId& backend, const PolicyEntry& entry) {
        auto valid = validatePolicy(entry.policy);
        if (!valid) return valid;
        std::unique_lock lock(mtx_);
        auto next = copyOf(backend);
        (*next)[entry.kind()] = entry;
        policies_[backend] = std::move(next);
        ++generation_;
        return Ok();
    }

    [[nodiscard]] uint64_t generation() const { return generation_.load(); }

    void setChangeListener(ChangeListener l) {
        std::lock_guard<std::mutex> lock(listener_mtx_);
        listener_ = std::move(l);
    }

private:
    /// Caller holds the write lock
    std::shared_ptr<PolicySet> copyOf(const BackendId& backend) const {
        auto it = policies_.find(backend);
        return it == policies_.end() ? std::make_shared<PolicySet>() : std::make_shared<PolicySet>(*it->second);
    }

    void notify() {
        ChangeListener l;
        { std::lock_guard<std::mutex> lock(listener_mtx_); l = listener_; }
        if (l) l();
    }

    ClockFn clock_;
    mutable std::shared_mutex mtx_;
    std::map<BackendId, BackendInfo> backends_;
    std::map<BackendId, std::shared_ptr<const PolicySet>> policies_;
    std::atomic<uint64_t> generation_{0};
    std::mutex listener_mtx_;
    ChangeListener listener_;
};

} // namespace tierguard
#endif
