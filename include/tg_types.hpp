/**
 * @file tg_types.hpp
 * @brief Core type definitions for the TierGuard policy engine
 * @version 1.0.0
 * @date 2025
 * @author Bennie Shearer
 *
 * Copyright (c) 2025 Bennie Shearer
 * MIT License - see LICENSE file for details
 *
 * Enumerations, identifiers, clock aliases and small formatting helpers
 * shared by every engine component.
 */

#ifndef TIERGUARD_TG_TYPES_HPP
#define TIERGUARD_TG_TYPES_HPP

#include <string>
#include <cstdint>
#include <chrono>
#include <vector>
#include <optional>
#include <functional>
#include <atomic>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace tierguard {

//=============================================================================
// Version Information
//=============================================================================
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* COPYRIGHT = "Copyright (c) 2025 Bennie Shearer";

//=============================================================================
// Identifiers and Time
//=============================================================================

using BackendId = std::string;
using ObjectId = std::string;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

/// Time source injected into components that evaluate windows or ages
using ClockFn = std::function<TimePoint()>;

inline ClockFn systemClock() { return [] { return Clock::now(); }; }

inline int64_t toEpochMillis(TimePoint tp) {
    return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(int64_t ms) { return TimePoint(Millis(ms)); }

//=============================================================================
// Core Enumerations
//=============================================================================

/**
 * @enum PolicyKind
 * @brief Discriminator for the five policy variants
 */
enum class PolicyKind {
    STORAGE_QUOTA,  ///< Capacity and file-count limits
    TRAFFIC_QUOTA,  ///< Per-window transfer and request limits
    REPLICATION,    ///< Redundancy requirements
    RETENTION,      ///< Minimum age, archive age, legal hold
    CACHE           ///< Tier capacity and promotion/demotion thresholds
};

constexpr PolicyKind ALL_POLICY_KINDS[] = {
    PolicyKind::STORAGE_QUOTA, PolicyKind::TRAFFIC_QUOTA, PolicyKind::REPLICATION,
    PolicyKind::RETENTION, PolicyKind::CACHE
};

/**
 * @enum CostTier
 * @brief Relative cost class of a backend
 */
enum class CostTier { HOT, WARM, COLD };

/**
 * @enum ReplicationStrategy
 * @brief How replica targets are ordered
 */
enum class ReplicationStrategy {
    SIMPLE,     ///< Declared preference order
    GEO_AWARE   ///< Distinct regions first, then declared order
};

/**
 * @enum Severity
 * @brief Violation severity
 */
enum class Severity { WARN, CRITICAL };

/**
 * @enum ReplicaStatus
 * @brief Lifecycle of one replica target
 */
enum class ReplicaStatus { PENDING, VERIFIED, FAILED };

/**
 * @enum CacheAction
 * @brief Outcome of the cache placement decision
 */
enum class CacheAction { KEEP, PROMOTE, DEMOTE, EVICT };

/**
 * @enum QuotaVerdict
 * @brief Outcome of a quota evaluation
 */
enum class QuotaVerdict { ALLOW, WARN, REJECT };

//=============================================================================
// String Conversions
//=============================================================================

inline std::string policyKindToString(PolicyKind k) {
    switch (k) {
        case PolicyKind::STORAGE_QUOTA: return "storage_quota";
        case PolicyKind::TRAFFIC_QUOTA: return "traffic_quota";
        case PolicyKind::REPLICATION: return "replication";
        case PolicyKind::RETENTION: return "retention";
        case PolicyKind::CACHE: return "cache";
    }
    return "unknown";
}

inline std::optional<PolicyKind> policyKindFromString(const std::string& s) {
    for (auto k : ALL_POLICY_KINDS) if (policyKindToString(k) == s) return k;
    return std::nullopt;
}

inline std::string costTierToString(CostTier t) {
    switch (t) {
        case CostTier::HOT: return "hot";
        case CostTier::WARM: return "warm";
        case CostTier::COLD: return "cold";
    }
    return "unknown";
}

inline std::optional<CostTier> costTierFromString(const std::string& s) {
    if (s == "hot") return CostTier::HOT;
    if (s == "warm") return CostTier::WARM;
    if (s == "cold") return CostTier::COLD;
    return std::nullopt;
}

inline std::string strategyToString(ReplicationStrategy s) {
    return s == ReplicationStrategy::GEO_AWARE ? "geo_aware" : "simple";
}

inline std::optional<ReplicationStrategy> strategyFromString(const std::string& s) {
    if (s == "simple") return ReplicationStrategy::SIMPLE;
    if (s == "geo_aware") return ReplicationStrategy::GEO_AWARE;
    return std::nullopt;
}

inline std::string severityToString(Severity s) {
    return s == Severity::CRITICAL ? "critical" : "warn";
}

inline std::optional<Severity> severityFromString(const std::string& s) {
    if (s == "warn") return Severity::WARN;
    if (s == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

inline std::string replicaStatusToString(ReplicaStatus s) {
    switch (s) {
        case ReplicaStatus::PENDING: return "pending";
        case ReplicaStatus::VERIFIED: return "verified";
        case ReplicaStatus::FAILED: return "failed";
    }
    return "unknown";
}

inline std::optional<ReplicaStatus> replicaStatusFromString(const std::string& s) {
    if (s == "pending") return ReplicaStatus::PENDING;
    if (s == "verified") return ReplicaStatus::VERIFIED;
    if (s == "failed") return ReplicaStatus::FAILED;
    return std::nullopt;
}

inline std::string cacheActionToString(CacheAction a) {
    switch (a) {
        case CacheAction::KEEP: return "keep";
        case CacheAction::PROMOTE: return "promote";
        case CacheAction::DEMOTE: return "demote";
        case CacheAction::EVICT: return "evict";
    }
    return "unknown";
}

inline std::string verdictToString(QuotaVerdict v) {
    switch (v) {
        case QuotaVerdict::ALLOW: return "allow";
        case QuotaVerdict::WARN: return "warn";
        case QuotaVerdict::REJECT: return "reject";
    }
    return "unknown";
}

//=============================================================================
// Utility Functions
//=============================================================================

inline std::string formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    int unit = 0;
    double size = static_cast<double>(bytes < 0 ? -bytes : bytes);
    while (size >= 1024.0 && unit < 5) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    if (bytes < 0) oss << "-";
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << size << " " << units[unit];
    return oss.str();
}

inline std::string formatTime(TimePoint tp) {
    auto t = Clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

inline std::string generateId(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto ms = toEpochMillis(Clock::now());
    std::ostringstream oss;
    oss << prefix << "-" << std::hex << ms << "-" << std::dec << ++counter;
    return oss.str();
}

} // namespace tierguard

#endif // TIERGUARD_TG_TYPES_HPP
