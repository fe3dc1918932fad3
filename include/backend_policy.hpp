/**
 * @file backend_policy.hpp
 * @brief Policy documents attached to storage backends
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * A backend carries at most one policy of each kind. Policies are a closed
 * set of variants held in a std::variant; validation and the text encoding
 * used by the state store live here so every holder agrees on them.
 */
#ifndef TIERGUARD_BACKEND_POLICY_HPP
#define TIERGUARD_BACKEND_POLICY_HPP

#include "tg_types.hpp"
#include "result.hpp"
#include <variant>
#include <map>
#include <set>
#include <vector>
#include <sstream>
#include <iomanip>

namespace tierguard {

//=============================================================================
// Backend Description
//=============================================================================

/**
 * @struct BackendCapabilities
 * @brief What a backend can do and what it costs
 */
struct BackendCapabilities {
    bool supports_replication = true;
    bool supports_streaming = false;
    CostTier cost_tier = CostTier::WARM;
};

/**
 * @struct BackendInfo
 * @brief Registered storage backend
 */
struct BackendInfo {
    BackendId id;
    BackendCapabilities capabilities;
    std::string region;         ///< Failure domain used by geo-aware replication
    bool enabled = true;        ///< Disabled backends take no new writes or replicas
};

/// Ids end up in pipe/semicolon delimited state files
inline bool isValidBackendId(const BackendId& id) {
    if (id.empty() || id.size() > 128) return false;
    for (char c : id) {
        if (c == '|' || c == ';' || c == ',' || c == '=' || c == ' ' || c == '\t' || c == '\n' || c == '\r') return false;
    }
    return true;
}

//=============================================================================
// Policy Variants
//=============================================================================

/**
 * @struct StorageQuotaPolicy
 * @brief Capacity limits; 0 means unlimited
 */
struct StorageQuotaPolicy {
    int64_t max_bytes = 0;
    int64_t max_files = 0;
    double warn_threshold = 0.8;
};

/**
 * @struct TrafficQuotaPolicy
 * @brief Transfer limits per fixed window; 0 means unlimited
 *
 * The window is a fixed window reset lazily on the first access after it
 * elapses, so a burst straddling a reset may see up to twice the limit.
 */
struct TrafficQuotaPolicy {
    int64_t max_bytes_per_window = 0;
    Seconds window_duration{3600};
    int64_t max_requests_per_window = 0;
    double warn_threshold = 0.8;
};

/**
 * @struct ReplicationPolicy
 * @brief Redundancy requirements for objects stored on the backend
 */
struct ReplicationPolicy {
    ReplicationStrategy strategy = ReplicationStrategy::SIMPLE;
    int32_t min_redundancy = 1;
    int32_t max_redundancy = 1;
    std::vector<BackendId> preferred_backends;
};

/**
 * @struct RetentionPolicy
 * @brief Deletion guard and archive age; zero durations disable a rule
 */
struct RetentionPolicy {
    Seconds minimum_age_before_delete{0};
    Seconds maximum_age_before_archive{0};
    bool legal_hold = false;
};

/**
 * @struct CachePolicy
 * @brief Settings of the cache tier backed by this backend
 */
struct CachePolicy {
    int64_t tier_capacity_bytes = 0;
    int64_t promote_threshold = 3;  ///< Accesses needed to move one tier faster
    Seconds demote_threshold{0};    ///< Idle time before demotion; 0 disables
};

using Policy = std::variant<StorageQuotaPolicy, TrafficQuotaPolicy, ReplicationPolicy,
                            RetentionPolicy, CachePolicy>;

template<typename T> struct PolicyKindTraits;
template<> struct PolicyKindTraits<StorageQuotaPolicy> { static constexpr PolicyKind kind = PolicyKind::STORAGE_QUOTA; };
template<> struct PolicyKindTraits<TrafficQuotaPolicy> { static constexpr PolicyKind kind = PolicyKind::TRAFFIC_QUOTA; };
template<> struct PolicyKindTraits<ReplicationPolicy> { static constexpr PolicyKind kind = PolicyKind::REPLICATION; };
template<> struct PolicyKindTraits<RetentionPolicy> { static constexpr PolicyKind kind = PolicyKind::RETENTION; };
template<> struct PolicyKindTraits<CachePolicy> { static constexpr PolicyKind kind = PolicyKind::CACHE; };

inline PolicyKind policyKindOf(const Policy& p) {
    return std::visit([](const auto& v) {
        return PolicyKindTraits<std::decay_t<decltype(v)>>::kind;
    }, p);
}

//=============================================================================
// Validation
//=============================================================================

namespace detail {

inline bool validThreshold(double t) { return t > 0.0 && t <= 1.0; }

inline Result<void> check(const StorageQuotaPolicy& p) {
    if (p.max_bytes < 0) return Err(ErrorCode::INVALID_POLICY, "max_bytes must not be negative");
    if (p.max_files < 0) return Err(ErrorCode::INVALID_POLICY, "max_files must not be negative");
    if (!validThreshold(p.warn_threshold)) return Err(ErrorCode::INVALID_POLICY, "warn_threshold must be in (0, 1]");
    return Ok();
}

inline Result<void> check(const TrafficQuotaPolicy& p) {
    if (p.max_bytes_per_window < 0) return Err(ErrorCode::INVALID_POLICY, "max_bytes_per_window must not be negative");
    if (p.max_requests_per_window < 0) return Err(ErrorCode::INVALID_POLICY, "max_requests_per_window must not be negative");
    if (p.window_duration.count() <= 0) return Err(ErrorCode::INVALID_POLICY, "window_duration must be positive");
    if (!validThreshold(p.warn_threshold)) return Err(ErrorCode::INVALID_POLICY, "warn_threshold must be in (0, 1]");
    return Ok();
}

inline Result<void> check(const ReplicationPolicy& p) {
    if (p.min_redundancy < 1) return Err(ErrorCode::INVALID_POLICY, "min_redundancy must be at least 1");
    if (p.max_redundancy < p.min_redundancy) return Err(ErrorCode::INVALID_POLICY, "max_redundancy must not be below min_redundancy");
    std::set<BackendId> seen;
    for (const auto& b : p.preferred_backends) {
        if (!isValidBackendId(b)) return Err(ErrorCode::INVALID_POLICY, "invalid preferred backend id '" + b + "'");
        if (!seen.insert(b).second) return Err(ErrorCode::INVALID_POLICY, "duplicate preferred backend '" + b + "'");
    }
    return Ok();
}

inline Result<void> check(const RetentionPolicy& p) {
    if (p.minimum_age_before_delete.count() < 0) return Err(ErrorCode::INVALID_POLICY, "minimum_age_before_delete must not be negative");
    if (p.maximum_age_before_archive.count() < 0) return Err(ErrorCode::INVALID_POLICY, "maximum_age_before_archive must not be negative");
    return Ok();
}

inline Result<void> check(const CachePolicy& p) {
    if (p.tier_capacity_bytes <= 0) return Err(ErrorCode::INVALID_POLICY, "tier_capacity_bytes must be positive");
    if (p.promote_threshold < 1) return Err(ErrorCode::INVALID_POLICY, "promote_threshold must be at least 1");
    if (p.demote_threshold.count() < 0) return Err(ErrorCode::INVALID_POLICY, "demote_threshold must not be negative");
    return Ok();
}

} // namespace detail

/**
 * @brief Validate ranges and per-variant invariants
 * @return INVALID_POLICY naming the first offending field
 */
inline Result<void> validatePolicy(const Policy& p) {
    auto r = std::visit([](const auto& v) { return detail::check(v); }, p);
    return r.withContext(policyKindToString(policyKindOf(p)));
}

//=============================================================================
// Text Encoding
//=============================================================================

/**
 * @brief Encode a policy body as "key=value;key=value"
 */
inline std::string encodePolicy(const Policy& p) {
    std::ostringstream oss;
    oss << std::setprecision(17);
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, StorageQuotaPolicy>) {
            oss << "max_bytes=" << v.max_bytes << ";max_files=" << v.max_files
                << ";warn_threshold=" << v.warn_threshold;
        } else if constexpr (std::is_same_v<T, TrafficQuotaPolicy>) {
            oss << "max_bytes_per_window=" << v.max_bytes_per_window
                << ";window_seconds=" << v.window_duration.count()
                << ";max_requests_per_window=" << v.max_requests_per_window
                << ";warn_threshold=" << v.warn_threshold;
        } else if constexpr (std::is_same_v<T, ReplicationPolicy>) {
            oss << "strategy=" << strategyToString(v.strategy) << ";min_redundancy=" << v.min_redundancy
                << ";max_redundancy=" << v.max_redundancy << ";preferred=";
            for (size_t i = 0; i < v.preferred_backends.size(); ++i) {
                if (i) oss << ",";
                oss << v.preferred_backends[i];
            }
        } else if constexpr (std::is_same_v<T, RetentionPolicy>) {
            oss << "min_age_seconds=" << v.minimum_age_before_delete.count()
                << ";archive_age_seconds=" << v.maximum_age_before_archive.count()
                << ";legal_hold=" << (v.legal_hold ? 1 : 0);
        } else {
            oss << "capacity=" << v.tier_capacity_bytes << ";promote_threshold=" << v.promote_threshold
                << ";demote_seconds=" << v.demote_threshold.count();
        }
    }, p);
    return oss.str();
}

namespace detail {

inline std::map<std::string, std::string> splitFields(const std::string& body) {
    std::map<std::string, std::string> fields;
    std::istringstream iss(body);
    std::string item;
    while (std::getline(iss, item, ';')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) continue;
        fields[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return fields;
}

} // namespace detail

/**
 * @brief Decode a body produced by encodePolicy()
 * @return CONFIG_PARSE_ERROR on malformed numbers or unknown enum names
 */
inline Result<Policy> decodePolicy(PolicyKind kind, const std::string& body) {
    auto f = detail::splitFields(body);
    auto num = [&f](const std::string& key) -> int64_t {
        auto it = f.find(key);
        return it == f.end() || it->second.empty() ? 0 : std::stoll(it->second);
    };
    auto real = [&f](const std::string& key, double def) -> double {
        auto it = f.find(key);
        return it == f.end() || it->second.empty() ? def : std::stod(it->second);
    };
    try {
        switch (kind) {
            case PolicyKind::STORAGE_QUOTA:
                return Policy{StorageQuotaPolicy{num("max_bytes"), num("max_files"), real("warn_threshold", 0.8)}};
            case PolicyKind::TRAFFIC_QUOTA:
                return Policy{TrafficQuotaPolicy{num("max_bytes_per_window"), Seconds(num("window_seconds")),
                                                 num("max_requests_per_window"), real("warn_threshold", 0.8)}};
            case PolicyKind::REPLICATION: {
                ReplicationPolicy r;
                auto s = strategyFromString(f["strategy"]);
                if (!s) return Err<Policy>(ErrorCode::CONFIG_PARSE_ERROR, "unknown strategy '" + f["strategy"] + "'");
                r.strategy = *s;
                r.min_redundancy = static_cast<int32_t>(num("min_redundancy"));
                r.max_redundancy = static_cast<int32_t>(num("max_redundancy"));
                std::istringstream list(f["preferred"]);
                std::string b;
                while (std::getline(list, b, ',')) if (!b.empty()) r.preferred_backends.push_back(b);
                return Policy{r};
            }
            case PolicyKind::RETENTION:
                return Policy{RetentionPolicy{Seconds(num("min_age_seconds")), Seconds(num("archive_age_seconds")),
                                              num("legal_hold") != 0}};
            case PolicyKind::CACHE:
                return Policy{CachePolicy{num("capacity"), num("promote_threshold"), Seconds(num("demote_seconds"))}};
        }
    } catch (const std::exception& e) {
        return Err<Policy>(ErrorCode::CONFIG_PARSE_ERROR, "bad policy field in '" + body + "': " + e.what());
    }
    return Err<Policy>(ErrorCode::CONFIG_PARSE_ERROR, "unknown policy kind");
}

} // namespace tierguard
#endif
