/**
 * @file violation_reporter.hpp
 * @brief Deduplicated log of policy violations
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_VIOLATION_REPORTER_HPP
#define TIERGUARD_VIOLATION_REPORTER_HPP

#include "tg_types.hpp"
#include "result.hpp"
#include "tg_logger.hpp"
#include "event_system.hpp"
#include <vector>
#include <mutex>
#include <sstream>
#include <algorithm>

namespace tierguard {

/**
 * @struct Violation
 * @brief One detected policy breach
 */
struct Violation {
    std::string id;
    BackendId backend_id;
    PolicyKind kind = PolicyKind::STORAGE_QUOTA;
    Severity severity = Severity::WARN;
    TimePoint detected_at;          ///< Most recent detection
    TimePoint first_detected_at;
    double current_value = 0.0;
    double limit_value = 0.0;
    std::string message;
    bool resolved = false;
    std::optional<TimePoint> resolved_at;
    uint64_t occurrences = 1;
};

/**
 * @struct ViolationFilter
 * @brief Query filter; unset fields match everything
 */
struct ViolationFilter {
    std::optional<BackendId> backend_id;
    std::optional<PolicyKind> kind;
    std::optional<Severity> severity;
    std::optional<bool> resolved;
};

/**
 * @struct ViolationSummary
 * @brief Counts over the whole log
 */
struct ViolationSummary {
    size_t total = 0;
    size_t unresolved = 0;
    size_t critical = 0;
    size_t warnings = 0;
};

/**
 * @class ViolationReporter
 * @brief Append-only violation log
 *
 * A report matching an unresolved record with the same backend, kind and
 * severity updates that record instead of appending a new one.
 */
class ViolationReporter {
public:
    using ChangeListener = std::function<void()>;

    explicit ViolationReporter(EventBus* events = nullptr, ClockFn clock = systemClock())
        : events_(events), clock_(std::move(clock)) {}

    /**
     * @brief Record a violation
     * @return Id of the new or updated record
     */
    std::string report(const BackendId& backend, PolicyKind kind, Severity severity,
                       double current, double limit, const std::string& message = "") {
        std::string id;
        bool fresh = false;
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto now = clock_();
            auto it = std::find_if(log_.begin(), log_.end(), [&](const Violation& v) {
                return !v.resolved && v.backend_id == backend && v.kind == kind && v.severity == severity;
            });
            if (it != log_.end()) {
                changed = it->current_value != current || it->limit_value != limit ||
                          (!message.empty() && it->message != message);
                it->current_value = current;
                it->limit_value = limit;
                it->detected_at = now;
                if (!message.empty()) it->message = message;
                ++it->occurrences;
                id = it->id;
            } else {
                Violation v;
                v.id = generateId("VIO");
                v.backend_id = backend;
                v.kind = kind;
                v.severity = severity;
                v.detected_at = v.first_detected_at = now;
                v.current_value = current;
                v.limit_value = limit;
                v.message = message;
                log_.push_back(v);
                id = v.id;
                fresh = true;
            }
        }
        if (fresh) {
            std::string text = severityToString(severity) + " " + policyKindToString(kind) + " violation on " + backend +
                               " (" + formatValue(current) + " / " + formatValue(limit) + ")" +
                               (message.empty() ? "" : ": " + message);
            if (severity == Severity::CRITICAL) LOG_ERROR("ViolationReporter", text);
            else LOG_WARNING("ViolationReporter", text);
            if (events_) events_->emit(EventType::VIOLATION_RAISED, "ViolationReporter", text, backend);
        }
        // A repeat with the same values only bumps the counters
        if (fresh || changed) notify();
        return id;
    }

    std::string report(const Violation& v) {
        return report(v.backend_id, v.kind, v.severity, v.current_value, v.limit_value, v.message);
    }

    /**
     * @brief Resolve open records of a backend and kind
     * @param severity Restrict to one severity when set
     * @return Number of records resolved
     */
    size_t resolve(const BackendId& backend, PolicyKind kind, std::optional<Severity> severity = std::nullopt) {
        size_t n = 0;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto now = clock_();
            for (auto& v : log_) {
                if (v.resolved || v.backend_id != backend || v.kind != kind) continue;
                if (severity && v.severity != *severity) continue;
                v.resolved = true;
                v.resolved_at = now;
                ++n;
            }
        }
        if (n > 0) {
            std::string text = "Resolved " + std::to_string(n) + " " + policyKindToString(kind) + " violation(s) on " + backend;
            LOG_INFO("ViolationReporter", text);
            if (events_) events_->emit(EventType::VIOLATION_RESOLVED, "ViolationReporter", text, backend);
            notify();
        }
        return n;
    }

    Result<void> resolveById(const std::string& id) {
        BackendId backend;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = std::find_if(log_.begin(), log_.end(), [&](const Violation& v) { return v.id == id; });
            if (it == log_.end()) return Err(ErrorCode::NOT_FOUND, "violation " + id);
            if (it->resolved) return Ok();
            it->resolved = true;
            it->resolved_at = clock_();
            backend = it->backend_id;
        }
        if (events_) events_->emit(EventType::VIOLATION_RESOLVED, "ViolationReporter", "Resolved " + id, backend);
        notify();
        return Ok();
    }

    /// Matching records ordered by detection time, oldest first
    [[nodiscard]] std::vector<Violation> list(const ViolationFilter& filter = {}) const {
        std::vector<Violation> out;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (const auto& v : log_) {
                if (filter.backend_id && v.backend_id != *filter.backend_id) continue;
                if (filter.kind && v.kind != *filter.kind) continue;
                if (filter.severity && v.severity != *filter.severity) continue;
                if (filter.resolved && v.resolved != *filter.resolved) continue;
                out.push_back(v);
            }
        }
        std::stable_sort(out.begin(), out.end(), [](const Violation& a, const Violation& b) {
            return a.detected_at < b.detected_at;
        });
        return out;
    }

    [[nodiscard]] bool hasOpen(const BackendId& backend, PolicyKind kind, Severity severity) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::any_of(log_.begin(), log_.end(), [&](const Violation& v) {
            return !v.resolved && v.backend_id == backend && v.kind == kind && v.severity == severity;
        });
    }

    [[nodiscard]] ViolationSummary summary() const {
        std::lock_guard<std::mutex> lock(mtx_);
        ViolationSummary s;
        s.total = log_.size();
        for (const auto& v : log_) {
            if (!v.resolved) ++s.unresolved;
            if (v.severity == Severity::CRITICAL) ++s.critical; else ++s.warnings;
        }
        return s;
    }

    [[nodiscard]] size_t size() const { std::lock_guard<std::mutex> lock(mtx_); return log_.size(); }

    /// Replace the log with persisted records
    void restore(std::vector<Violation> records) {
        std::lock_guard<std::mutex> lock(mtx_);
        log_ = std::move(records);
    }

    void setChangeListener(ChangeListener l) {
        std::lock_guard<std::mutex> lock(listener_mtx_);
        listener_ = std::move(l);
    }

    [[nodiscard]] std::string generateReport() const {
        auto s = summary();
        std::ostringstream oss;
        oss << "=== Violation Report ===\n"
            << "Total: " << s.total << "  Open: " << s.unresolved
            << "  Critical: " << s.critical << "  Warnings: " << s.warnings << "\n";
        for (const auto& v : list({std::nullopt, std::nullopt, std::nullopt, false})) {
            oss << "  [" << severityToString(v.severity) << "] " << v.backend_id << " "
                << policyKindToString(v.kind) << " " << formatValue(v.current_value) << "/"
                << formatValue(v.limit_value) << " x" << v.occurrences << " since "
                << formatTime(v.first_detected_at) << "\n";
        }
        return oss.str();
    }

private:
    static std::string formatValue(double v) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(v == static_cast<double>(static_cast<int64_t>(v)) ? 0 : 2) << v;
        return oss.str();
    }

    void notify() {
        ChangeListener l;
        { std::lock_guard<std::mutex> lock(listener_mtx_); l = listener_; }
        if (l) l();
    }

    EventBus* events_;
    ClockFn clock_;
    mutable std::mutex mtx_;
    std::vector<Violation> log_;
    std::mutex listener_mtx_;
    ChangeListener listener_;
};

} // namespace tierguard
#endif
