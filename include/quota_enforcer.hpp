/**
 * @file quota_enforcer.hpp
 * @brief Storage and traffic quota decisions
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Combines the policy store and the resource tracker into allow / warn /
 * reject verdicts. evaluate() has no side effects; check() and reserve()
 * also file or resolve violations.
 */
#ifndef TIERGUARD_QUOTA_ENFORCER_HPP
#define TIERGUARD_QUOTA_ENFORCER_HPP

#include "policy_store.hpp"
#include "resource_tracker.hpp"
#include "violation_reporter.hpp"
#include "event_system.hpp"
#include <map>
#include <sstream>

namespace tierguard {

/**
 * @struct QuotaFinding
 * @brief One limit that a projected usage reaches or crosses
 */
struct QuotaFinding {
    PolicyKind kind = PolicyKind::STORAGE_QUOTA;
    Severity severity = Severity::WARN;
    std::string metric;         ///< "bytes", "files", "window_bytes", "window_requests"
    int64_t projected = 0;
    int64_t limit = 0;
};

/**
 * @struct QuotaDecision
 * @brief Verdict plus the findings behind it
 */
struct QuotaDecision {
    QuotaVerdict verdict = QuotaVerdict::ALLOW;
    std::vector<QuotaFinding> findings;
    std::vector<PolicyKind> evaluated;  ///< Policy kinds that took part

    [[nodiscard]] bool allowed() const { return verdict != QuotaVerdict::REJECT; }

    [[nodiscard]] std::string describe() const {
        if (findings.empty()) return verdictToString(verdict);
        std::ostringstream oss;
        oss << verdictToString(verdict) << ":";
        for (const auto& f : findings) {
            oss << " " << f.metric << " " << f.projected << "/" << f.limit
                << (f.severity == Severity::CRITICAL ? " (over limit)" : " (near limit)");
        }
        return oss.str();
    }
};

class QuotaEnforcer {
public:
    QuotaEnforcer(PolicyStore& policies, ResourceTracker& tracker, ViolationReporter& violations,
                  EventBus* events = nullptr)
        : policies_(policies), tracker_(tracker), violations_(violations), events_(events) {}

    /**
     * @brief Project current + pending + delta against the backend's quotas
     *
     * Storage quotas are consulted for deltas that change stored bytes or
     * files; traffic quotas for transfers. A zero delta consults both.
     */
    [[nodiscard]] QuotaDecision evaluate(const BackendId& backend, const UsageDelta& delta) {
        QuotaDecision d;
        syncWindow(backend);
        UsageRecord u = tracker_.snapshot(backend);

        bool refresh = delta.bytes == 0 && delta.files == 0 && !delta.is_transfer && delta.transfer_bytes == 0;
        bool storage = refresh || delta.bytes != 0 || delta.files != 0;
        bool traffic = refresh || delta.is_transfer || delta.transfer_bytes > 0;

        if (storage) {
            if (auto q = policies_.getAs<StorageQuotaPolicy>(backend)) {
                d.evaluated.push_back(PolicyKind::STORAGE_QUOTA);
                test(d, PolicyKind::STORAGE_QUOTA, "bytes", u.bytes_used + u.pending_bytes + delta.bytes,
                     q->max_bytes, q->warn_threshold);
                test(d, PolicyKind::STORAGE_QUOTA, "files", u.file_count + u.pending_files + delta.files,
                     q->max_files, q->warn_threshold);
            }
        }
        if (traffic) {
            if (auto q = policies_.getAs<TrafficQuotaPolicy>(backend)) {
                d.evaluated.push_back(PolicyKind::TRAFFIC_QUOTA);
                test(d, PolicyKind::TRAFFIC_QUOTA, "window_bytes",
                     u.bytes_transferred_in_window + u.pending_transfer_bytes + std::max<int64_t>(0, delta.transfer_bytes),
                     q->max_bytes_per_window, q->warn_threshold);
                test(d, PolicyKind::TRAFFIC_QUOTA, "window_requests",
                     u.request_count_in_window + u.pending_requests + (delta.is_transfer ? 1 : 0),
                     q->max_requests_per_window, q->warn_threshold);
            }
        }
        for (const auto& f : d.findings) {
            if (f.severity == Severity::CRITICAL) d.verdict = QuotaVerdict::REJECT;
            else if (d.verdict == QuotaVerdict::ALLOW) d.verdict = QuotaVerdict::WARN;
        }
        return d;
    }

    /**
     * @brief evaluate() and record the outcome as violations
     * @return QUOTA_EXCEEDED on reject, otherwise the decision
     */
    Result<QuotaDecision> check(const BackendId& backend, const UsageDelta& delta) {
        QuotaDecision d = evaluate(backend, delta);
        file(backend, d);
        if (d.verdict == QuotaVerdict::REJECT) {
            LOG_WARNING("QuotaEnforcer", "Rejected operation on " + backend + ": " + d.describe());
            return Err<QuotaDecision>(ErrorCode::QUOTA_EXCEEDED, backend + " " + d.describe());
        }
        return d;
    }

    /**
     * @brief Check and reserve in one step
     *
     * The tracker re-validates under its own lock, so two callers racing for
     * the last headroom cannot both succeed.
     */
    Result<Reservation> reserve(const BackendId& backend, const UsageDelta& delta) {
        if (delta.bytes > 0 && !policies_.isBackendEnabled(backend))
            return Err<Reservation>(ErrorCode::BACKEND_DISABLED, "backend disabled: " + backend);
        auto checked = check(backend, delta);
        if (!checked) return Err<Reservation>(checked.error());

        auto r = tracker_.reserve(backend, delta, limitsFor(backend));
        if (!r) {
            file(backend, evaluate(backend, delta));
            LOG_WARNING("QuotaEnforcer", "Reservation lost race on " + backend + ": " + r.error().message);
        }
        return r;
    }

    Result<void> commit(const Reservation& r) { return tracker_.commit(r); }
    Result<void> release(const Reservation& r) { return tracker_.release(r); }

    /// Re-evaluate with no delta so stale violations clear after usage drops
    void refresh(const BackendId& backend) { file(backend, evaluate(backend, UsageDelta{})); }

    [[nodiscard]] UsageLimits limitsFor(const BackendId& backend) const {
        UsageLimits l;
        if (auto q = policies_.getAs<StorageQuotaPolicy>(backend)) {
            l.max_bytes = q->max_bytes;
            l.max_files = q->max_files;
        }
        if (auto q = policies_.getAs<TrafficQuotaPolicy>(backend)) {
            l.max_bytes_per_window = q->max_bytes_per_window;
            l.max_requests_per_window = q->max_requests_per_window;
        }
        return l;
    }

    /// Whether the backend sits below every warn threshold after the delta
    [[nodiscard]] bool hasIdleCapacity(const BackendId& backend, const UsageDelta& delta) {
        return evaluate(backend, delta).verdict == QuotaVerdict::ALLOW;
    }

private:
    static void test(QuotaDecision& d, PolicyKind kind, const std::string& metric,
                     int64_t projected, int64_t limit, double warn_threshold) {
        if (limit <= 0) return;
        if (projected > limit) {
            d.findings.push_back({kind, Severity::CRITICAL, metric, projected, limit});
        } else if (static_cast<double>(projected) >= warn_threshold * static_cast<double>(limit)) {
            d.findings.push_back({kind, Severity::WARN, metric, projected, limit});
        }
    }

    void syncWindow(const BackendId& backend) {
        if (auto q = policies_.getAs<TrafficQuotaPolicy>(backend)) tracker_.setWindowDuration(backend, q->window_duration);
    }

    static double ratio(const QuotaFinding& f) {
        return static_cast<double>(f.projected) / static_cast<double>(f.limit);
    }

    /**
     * Violations dedup on (backend, kind, severity), so metrics of one kind
     * share a record. The record carries the metric closest to or furthest
     * past its limit; every finding still gets its own event.
     */
    void file(const BackendId& backend, const QuotaDecision& d) {
        std::map<std::pair<PolicyKind, Severity>, const QuotaFinding*> worst;
        for (const auto& f : d.findings) {
            auto& w = worst[{f.kind, f.severity}];
            if (!w || ratio(f) > ratio(*w)) w = &f;
        }
        for (const auto& [key, f] : worst) {
            violations_.report(backend, f->kind, f->severity, static_cast<double>(f->projected),
                               static_cast<double>(f->limit), f->metric);
        }
        for (const auto& f : d.findings) {
            if (events_) {
                events_->emit(f.severity == Severity::CRITICAL ? EventType::QUOTA_EXCEEDED : EventType::QUOTA_WARNING,
                              "QuotaEnforcer", f.metric + " " + std::to_string(f.projected) + "/" +
                              std::to_string(f.limit), backend);
            }
        }
        for (PolicyKind kind : d.evaluated) {
            bool warn = false, critical = false;
            for (const auto& f : d.findings) {
                if (f.kind != kind) continue;
                if (f.severity == Severity::CRITICAL) critical = true; else warn = true;
            }
            if (!warn && !critical) violations_.resolve(backend, kind);
            else if (!critical) violations_.resolve(backend, kind, Severity::CRITICAL);
        }
    }

    PolicyStore& policies_;
    ResourceTracker& tracker_;
    ViolationReporter& violations_;
    EventBus* events_;
};

} // namespace tierguard
#endif
