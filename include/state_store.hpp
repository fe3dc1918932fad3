/**
 * @file state_store.hpp
 * @brief On-disk engine state
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Files under the state directory, each starting with a versioned header
 * line followed by pipe-delimited records:
 *   policies.db      one record per (backend, kind), rewritten on change
 *   violations.db    one record per violation, rewritten on change
 *   catalog.journal  PUT / DEL / REPLICAS records appended as they happen,
 *                    compacted on clean stop
 *   warm.state       usage records saved on clean stop, deleted once read
 * Rewrites go to a .tmp file that is renamed over the old one.
 */
#ifndef TIERGUARD_STATE_STORE_HPP
#define TIERGUARD_STATE_STORE_HPP

#include "policy_store.hpp"
#include "resource_tracker.hpp"
#include "violation_reporter.hpp"
#include "replication_coordinator.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace tierguard {

constexpr int STATE_FORMAT_VERSION = 1;

/**
 * @struct ObjectRecord
 * @brief Catalog entry for a stored object
 */
struct ObjectRecord {
    ObjectId object_id;
    BackendId backend_id;                   ///< Backend of record
    int64_t size_bytes = 0;
    TimePoint created_at;
    std::vector<BackendId> replica_backends;  ///< Verified replicas
};

/**
 * @struct CatalogState
 * @brief Result of replaying the catalog journal
 */
struct CatalogState {
    std::map<ObjectId, ObjectRecord> objects;
    std::map<ObjectId, ReplicaSet> replicas;
    size_t records_applied = 0;
    size_t records_skipped = 0;
};

namespace detail {

/// Percent-encode the characters the record formats use as separators
inline std::string escapeField(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c == '%' || c == '|' || c == ';' || c == ',' || c == '\n' || c == '\r') {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0xF];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

inline std::string unescapeField(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

inline std::vector<std::string> splitFields(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream iss(s);
    while (std::getline(iss, field, sep)) out.push_back(field);
    if (!s.empty() && s.back() == sep) out.emplace_back();
    return out;
}

inline std::string header(const char* tag) {
    return std::string(tag) + " " + std::to_string(STATE_FORMAT_VERSION);
}

/// Accepts "<tag> <version>" with optional trailing fields
inline bool headerMatches(const std::string& line, const char* tag) {
    std::istringstream iss(line);
    std::string t;
    int version = 0;
    iss >> t >> version;
    return t == tag && version == STATE_FORMAT_VERSION;
}

} // namespace detail

class StateStore {
public:
    explicit StateStore(std::filesystem::path dir) : dir_(std::move(dir)) {}
    ~StateStore() { close(); }

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /// Create the directory and open the catalog journal for appending
    Result<void> open() {
        std::lock_guard<std::mutex> lock(journal_mtx_);
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) return Err(ErrorCode::IO_ERROR, "cannot create " + dir_.string() + ": " + ec.message());
        return openJournalLocked();
    }

    void close() {
        std::lock_guard<std::mutex> lock(journal_mtx_);
        if (journal_.is_open()) journal_.close();
    }

    [[nodiscard]] const std::filesystem::path& directory() const { return dir_; }
    [[nodiscard]] std::filesystem::path policiesPath() const { return dir_ / "policies.db"; }
    [[nodiscard]] std::filesystem::path violationsPath() const { return dir_ / "violations.db"; }
    [[nodiscard]] std::filesystem::path catalogPath() const { return dir_ / "catalog.journal"; }
    [[nodiscard]] std::filesystem::path warmStatePath() const { return dir_ / "warm.state"; }

    //=========================================================================
    // Policies
    //=========================================================================

    Result<void> savePolicies(const std::map<BackendId, PolicySet>& all) {
        std::ostringstream oss;
        oss << detail::header("TIERGUARD-POLICIES") << "\n";
        for (const auto& [backend, set] : all) {
            for (const auto& [kind, entry] : set) {
                oss << backend << "|" << policyKindToString(kind) << "|" << (entry.enabled ? 1 : 0) << "|"
                    << toEpochMillis(entry.updated_at) << "|" << encodePolicy(entry.policy) << "\n";
            }
        }
        return writeAtomically(policiesPath(), oss.str());
    }

    Result<std::vector<std::pair<BackendId, PolicyEntry>>> loadPolicies() const {
        using Loaded = std::vector<std::pair<BackendId, PolicyEntry>>;
        Loaded out;
        auto lines = readRecords(policiesPath(), "TIERGUARD-POLICIES");
        if (!lines) {
            if (lines.error().is(ErrorCode::NOT_FOUND)) return out;
            return Err<Loaded>(lines.error());
        }
        for (const auto& line : lines.value()) {
            auto f = detail::splitFields(line, '|');
            if (f.size() != 5) { skipped("policies.db", line); continue; }
            auto kind = policyKindFromString(f[1]);
            if (!kind) { skipped("policies.db", line); continue; }
            auto policy = decodePolicy(*kind, f[4]);
            if (!policy) { skipped("policies.db", line); continue; }
            try {
                PolicyEntry e{policy.value(), f[2] == "1", fromEpochMillis(std::stoll(f[3]))};
                out.emplace_back(f[0], e);
            } catch (const std::exception&) {
                skipped("policies.db", line);
            }
        }
        return out;
    }

    //=========================================================================
    // Violations
    //=========================================================================

    Result<void> saveViolations(const std::vector<Violation>& all) {
        std::ostringstream oss;
        oss << std::setprecision(17) << detail::header("TIERGUARD-VIOLATIONS") << "\n";
        for (const auto& v : all) {
            oss << v.id << "|" << v.backend_id << "|" << policyKindToString(v.kind) << "|"
                << severityToString(v.severity) << "|" << toEpochMillis(v.detected_at) << "|"
                << toEpochMillis(v.first_detected_at) << "|" << v.current_value << "|" << v.limit_value << "|"
                << (v.resolved ? 1 : 0) << "|" << (v.resolved_at ? toEpochMillis(*v.resolved_at) : -1) << "|"
                << v.occurrences << "|" << detail::escapeField(v.message) << "\n";
        }
        return writeAtomically(violationsPath(), oss.str());
    }

    Result<std::vector<Violation>> loadViolations() const {
        std::vector<Violation> out;
        auto lines = readRecords(violationsPath(), "TIERGUARD-VIOLATIONS");
        if (!lines) {
            if (lines.error().is(ErrorCode::NOT_FOUND)) return out;
            return Err<std::vector<Violation>>(lines.error());
        }
        for (const auto& line : lines.value()) {
            auto f = detail::splitFields(line, '|');
            auto kind = f.size() == 12 ? policyKindFromString(f[2]) : std::nullopt;
            auto sev = f.size() == 12 ? severityFromString(f[3]) : std::nullopt;
            if (!kind || !sev) { skipped("violations.db", line); continue; }
            try {
                Violation v;
                v.id = f[0];
                v.backend_id = f[1];
                v.kind = *kind;
                v.severity = *sev;
                v.detected_at = fromEpochMillis(std::stoll(f[4]));
                v.first_detected_at = fromEpochMillis(std::stoll(f[5]));
                v.current_value = std::stod(f[6]);
                v.limit_value = std::stod(f[7]);
                v.resolved = f[8] == "1";
                int64_t resolved_ms = std::stoll(f[9]);
                if (resolved_ms >= 0) v.resolved_at = fromEpochMillis(resolved_ms);
                v.occurrences = std::stoull(f[10]);
                v.message = detail::unescapeField(f[11]);
                out.push_back(std::move(v));
            } catch (const std::exception&) {
                skipped("violations.db", line);
            }
        }
        return out;
    }

    //=========================================================================
    // Catalog journal
    //=========================================================================

    Result<void> appendPut(const ObjectRecord& r) {
        std::ostringstream oss;
        oss << "PUT|" << detail::escapeField(r.object_id) << "|" << r.backend_id << "|" << r.size_bytes << "|"
            << toEpochMillis(r.created_at);
        return append(oss.str());
    }

    Result<void> appendDelete(const ObjectId& id) {
        return append("DEL|" + detail::escapeField(id));
    }

    Result<void> appendReplicas(const ReplicaSet& s) { return append(encodeReplicas(s)); }

    /// Rebuild objects and replica sets from the journal
    Result<CatalogState> replayCatalog() const {
        CatalogState state;
        auto lines = readRecords(catalogPath(), "TIERGUARD-CATALOG");
        if (!lines) {
            if (lines.error().is(ErrorCode::NOT_FOUND)) return state;
            return Err<CatalogState>(lines.error());
        }
        for (const auto& line : lines.value()) {
            if (applyRecord(state, line)) ++state.records_applied;
            else { ++state.records_skipped; skipped("catalog.journal", line); }
        }
        for (auto& [id, rec] : state.objects) {
            auto it = state.replicas.find(id);
            if (it != state.replicas.end()) rec.replica_backends = it->second.backendsWith(ReplicaStatus::VERIFIED);
        }
        LOG_INFO("StateStore", "Replayed catalog: " + std::to_string(state.objects.size()) + " objects, " +
                 std::to_string(state.records_applied) + " records");
        return state;
    }

    /// Replace the journal with one PUT (and REPLICAS) record per live object
    Result<void> compactCatalog(const std::map<ObjectId, ObjectRecord>& objects,
                                const std::vector<ReplicaSet>& replicas) {
        std::ostringstream oss;
        oss << detail::header("TIERGUARD-CATALOG") << "\n";
        for (const auto& [id, r] : objects) {
            oss << "PUT|" << detail::escapeField(id) << "|" << r.backend_id << "|" << r.size_bytes << "|"
                << toEpochMillis(r.created_at) << "\n";
        }
        for (const auto& s : replicas) {
            if (objects.count(s.object_id)) oss << encodeReplicas(s) << "\n";
        }
        std::lock_guard<std::mutex> lock(journal_mtx_);
        if (journal_.is_open()) journal_.close();
        auto written = writeAtomically(catalogPath(), oss.str());
        auto reopened = openJournalLocked();
        if (!written) return written;
        return reopened;
    }

    //=========================================================================
    // Warm state
    //=========================================================================

    Result<void> saveWarmState(const std::vector<UsageRecord>& usage, TimePoint saved_at) {
        std::ostringstream oss;
        oss << detail::header("TIERGUARD-WARM") << " " << toEpochMillis(saved_at) << "\n";
        for (const auto& u : usage) {
            oss << u.backend_id << "|" << u.bytes_used << "|" << u.file_count << "|"
                << u.bytes_transferred_in_window << "|" << u.request_count_in_window << "|"
                << toEpochMillis(u.last_reset_time) << "|" << u.window_duration.count() << "|"
                << u.lifetime_bytes_transferred << "|" << u.lifetime_requests << "\n";
        }
        return writeAtomically(warmStatePath(), oss.str());
    }

    /**
     * @brief Read and delete the warm state file
     * @return NOT_FOUND when absent, STATE_VERSION_MISMATCH on a foreign
     *         header, INVALID_STATE when older than @p max_age
     */
    Result<std::vector<UsageRecord>> consumeWarmState(TimePoint now, Seconds max_age) {
        using Records = std::vector<UsageRecord>;
        auto path = warmStatePath();
        std::ifstream in(path);
        if (!in) return Err<Records>(ErrorCode::NOT_FOUND, "no warm state");
        std::string head;
        std::vector<std::string> lines;
        std::getline(in, head);
        for (std::string line; std::getline(in, line);) if (!line.empty()) lines.push_back(line);
        in.close();

        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) LOG_WARNING("StateStore", "Could not remove warm state: " + ec.message());

        if (!detail::headerMatches(head, "TIERGUARD-WARM"))
            return Err<Records>(ErrorCode::STATE_VERSION_MISMATCH, "warm state header '" + head + "'");
        std::istringstream hs(head);
        std::string tag;
        int version = 0;
        int64_t saved_ms = -1;
        hs >> tag >> version >> saved_ms;
        if (saved_ms < 0) return Err<Records>(ErrorCode::STATE_VERSION_MISMATCH, "warm state has no timestamp");
        if (now - fromEpochMillis(saved_ms) > max_age)
            return Err<Records>(ErrorCode::INVALID_STATE, "warm state saved " + formatTime(fromEpochMillis(saved_ms)) + " is stale");

        Records out;
        for (const auto& line : lines) {
            auto f = detail::splitFields(line, '|');
            if (f.size() != 9) { skipped("warm.state", line); continue; }
            try {
                UsageRecord u;
                u.backend_id = f[0];
                u.bytes_used = std::stoll(f[1]);
                u.file_count = std::stoll(f[2]);
                u.bytes_transferred_in_window = std::stoll(f[3]);
                u.request_count_in_window = std::stoll(f[4]);
                u.last_reset_time = fromEpochMillis(std::stoll(f[5]));
                u.window_duration = Seconds(std::stoll(f[6]));
                u.lifetime_bytes_transferred = std::stoull(f[7]);
                u.lifetime_requests = std::stoull(f[8]);
                out.push_back(std::move(u));
            } catch (const std::exception&) {
                skipped("warm.state", line);
            }
        }
        return out;
    }

private:
    static std::string encodeReplicas(const ReplicaSet& s) {
        std::ostringstream oss;
        oss << "REPLICAS|" << detail::escapeField(s.object_id) << "|" << s.size_bytes << "|" << s.policy_backend << "|"
            << s.source_backend << "|" << detail::escapeField(encodePolicy(Policy{s.policy})) << "|";
        bool first = true;
        for (const auto& t : s.targets) {
            if (!first) oss << ";";
            first = false;
            oss << t.backend_id << "," << replicaStatusToString(t.status) << "," << t.attempts << ","
                << toEpochMillis(t.updated_at) << "," << detail::escapeField(t.last_error);
        }
        return oss.str();
    }

    static bool applyRecord(CatalogState& state, const std::string& line) {
        auto f = detail::splitFields(line, '|');
        if (f.empty()) return false;
        try {
            if (f[0] == "PUT" && f.size() == 5) {
                ObjectRecord r;
                r.object_id = detail::unescapeField(f[1]);
                r.backend_id = f[2];
                r.size_bytes = std::stoll(f[3]);
                r.created_at = fromEpochMillis(std::stoll(f[4]));
                state.objects[r.object_id] = r;
                return true;
            }
            if (f[0] == "DEL" && f.size() == 2) {
                auto id = detail::unescapeField(f[1]);
                state.objects.erase(id);
                state.replicas.erase(id);
                return true;
            }
            if (f[0] == "REPLICAS" && f.size() == 7) {
                ReplicaSet s;
                s.object_id = detail::unescapeField(f[1]);
                s.size_bytes = std::stoll(f[2]);
                s.policy_backend = f[3];
                s.source_backend = f[4];
                auto policy = decodePolicy(PolicyKind::REPLICATION, detail::unescapeField(f[5]));
                if (!policy) return false;
                s.policy = std::get<ReplicationPolicy>(policy.value());
                if (!f[6].empty()) {
                    for (const auto& item : detail::splitFields(f[6], ';')) {
                        auto tf = detail::splitFields(item, ',');
                        if (tf.size() != 5) return false;
                        auto status = replicaStatusFromString(tf[1]);
                        if (!status) return false;
                        s.targets.push_back(ReplicaTarget{tf[0], *status, static_cast<uint32_t>(std::stoul(tf[2])),
                                                          detail::unescapeField(tf[4]), fromEpochMillis(std::stoll(tf[3]))});
                    }
                }
                state.replicas[s.object_id] = std::move(s);
                return true;
            }
        } catch (const std::exception&) {
            return false;
        }
        return false;
    }

    Result<void> append(const std::string& record) {
        std::lock_guard<std::mutex> lock(journal_mtx_);
        if (!journal_.is_open()) return Err(ErrorCode::INVALID_STATE, "catalog journal not open");
        journal_ << record << "\n";
        journal_.flush();
        if (!journal_) return Err(ErrorCode::IO_ERROR, "write to " + catalogPath().string() + " failed");
        return Ok();
    }

    Result<void> openJournalLocked() {
        auto path = catalogPath();
        std::error_code ec;
        bool fresh = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;
        journal_.open(path, std::ios::app);
        if (!journal_) return Err(ErrorCode::IO_ERROR, "cannot open " + path.string());
        if (fresh) {
            journal_ << detail::header("TIERGUARD-CATALOG") << "\n";
            journal_.flush();
        }
        return Ok();
    }

    /// Body lines of a state file after validating its header
    static Result<std::vector<std::string>> readRecords(const std::filesystem::path& path, const char* tag) {
        using Lines = std::vector<std::string>;
        std::ifstream in(path);
        if (!in) return Err<Lines>(ErrorCode::NOT_FOUND, path.string());
        std::string line;
        if (!std::getline(in, line) || !detail::headerMatches(line, tag))
            return Err<Lines>(ErrorCode::STATE_VERSION_MISMATCH, path.filename().string() + " header '" + line + "'");
        Lines out;
        while (std::getline(in, line)) if (!line.empty()) out.push_back(line);
        return out;
    }

    static Result<void> writeAtomically(const std::filesystem::path& path, const std::string& content) {
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) return Err(ErrorCode::IO_ERROR, "cannot write " + tmp.string());
            out << content;
            out.flush();
            if (!out) return Err(ErrorCode::IO_ERROR, "write to " + tmp.string() + " failed");
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) return Err(ErrorCode::IO_ERROR, "rename to " + path.string() + " failed: " + ec.message());
        return Ok();
    }

    static void skipped(const char* file, const std::string& line) {
        LOG_WARNING("StateStore", std::string("Skipping malformed record in ") + file + ": " + line);
    }

    std::filesystem::path dir_;
    std::mutex journal_mtx_;
    std::ofstream journal_;
};

} // namespace tierguard
#endif
