/**
 * @file backend_adapter.hpp
 * @brief Interface to storage backends and an in-memory implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Adapters are supplied by the embedding application. Every call carries a
 * CancellationToken; an adapter that outlives the token's deadline reports
 * ADAPTER_TIMEOUT.
 */
#ifndef TIERGUARD_BACKEND_ADAPTER_HPP
#define TIERGUARD_BACKEND_ADAPTER_HPP

#include "tg_types.hpp"
#include "result.hpp"
#include "cancellation.hpp"
#include "tg_logger.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <thread>

namespace tierguard {

using Bytes = std::vector<uint8_t>;

struct ObjectStat {
    int64_t size_bytes = 0;
    TimePoint modified_at;
};

/**
 * @class BackendAdapter
 * @brief Minimal object interface a backend must provide
 */
class BackendAdapter {
public:
    virtual ~BackendAdapter() = default;

    [[nodiscard]] virtual const BackendId& id() const = 0;
    virtual Result<void> put(const ObjectId& object, const Bytes& data, const CancellationToken& token) = 0;
    virtual Result<Bytes> get(const ObjectId& object, const CancellationToken& token) = 0;
    virtual Result<void> remove(const ObjectId& object, const CancellationToken& token) = 0;
    /// NOT_FOUND when the object is absent
    virtual Result<ObjectStat> stat(const ObjectId& object, const CancellationToken& token) = 0;
};

/**
 * @brief Invoke an adapter, turning escaped exceptions into ADAPTER_ERROR
 */
template<typename T, typename F>
Result<T> guardedCall(const BackendId& backend, const char* op, F&& f) {
    try {
        return f();
    } catch (const std::exception& e) {
        LOG_ERROR("BackendAdapter", std::string(op) + " on " + backend + " threw: " + e.what());
        return Err<T>(ErrorCode::ADAPTER_ERROR, backend + " " + op + ": " + e.what());
    }
}

/**
 * @class AdapterRegistry
 * @brief Adapters by backend id
 */
class AdapterRegistry {
public:
    Result<void> add(std::shared_ptr<BackendAdapter> adapter) {
        if (!adapter) return Err(ErrorCode::INVALID_ARGUMENT, "null adapter");
        std::unique_lock lock(mtx_);
        auto [it, inserted] = adapters_.emplace(adapter->id(), adapter);
        if (!inserted) return Err(ErrorCode::ALREADY_EXISTS, "adapter already registered: " + adapter->id());
        return Ok();
    }

    [[nodiscard]] std::shared_ptr<BackendAdapter> get(const BackendId& id) const {
        std::shared_lock lock(mtx_);
        auto it = adapters_.find(id);
        return it == adapters_.end() ? nullptr : it->second;
    }

    [[nodiscard]] bool has(const BackendId& id) const { return get(id) != nullptr; }

    [[nodiscard]] std::vector<BackendId> ids() const {
        std::shared_lock lock(mtx_);
        std::vector<BackendId> out;
        for (const auto& [id, a] : adapters_) out.push_back(id);
        return out;
    }

private:
    mutable std::shared_mutex mtx_;
    std::map<BackendId, std::shared_ptr<BackendAdapter>> adapters_;
};

/**
 * @class MemoryBackendAdapter
 * @brief Process-local backend, optionally with simulated latency
 */
class MemoryBackendAdapter : public BackendAdapter {
public:
    explicit MemoryBackendAdapter(BackendId id, Millis latency = Millis(0))
        : id_(std::move(id)), latency_(latency) {}

    [[nodiscard]] const BackendId& id() const override { return id_; }

    Result<void> put(const ObjectId& object, const Bytes& data, const CancellationToken& token) override {
        if (auto gate = delay(token); !gate) return gate;
        std::lock_guard<std::mutex> lock(mtx_);
        objects_[object] = Stored{data, Clock::now()};
        return Ok();
    }

    Result<Bytes> get(const ObjectId& object, const CancellationToken& token) override {
        if (auto gate = delay(token); !gate) return Err<Bytes>(gate.error());
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = objects_.find(object);
        if (it == objects_.end()) return Err<Bytes>(ErrorCode::NOT_FOUND, object + " not on " + id_);
        return it->second.data;
    }

    Result<void> remove(const ObjectId& object, const CancellationToken& token) override {
        if (auto gate = delay(token); !gate) return gate;
        std::lock_guard<std::mutex> lock(mtx_);
        if (objects_.erase(object) == 0) return Err(ErrorCode::NOT_FOUND, object + " not on " + id_);
        return Ok();
    }

    Result<ObjectStat> stat(const ObjectId& object, const CancellationToken& token) override {
        if (auto gate = delay(token); !gate) return Err<ObjectStat>(gate.error());
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = objects_.find(object);
        if (it == objects_.end()) return Err<ObjectStat>(ErrorCode::NOT_FOUND, object + " not on " + id_);
        return ObjectStat{static_cast<int64_t>(it->second.data.size()), it->second.modified_at};
    }

    void setLatency(Millis latency) { std::lock_guard<std::mutex> lock(mtx_); latency_ = latency; }

    [[nodiscard]] size_t objectCount() const { std::lock_guard<std::mutex> lock(mtx_); return objects_.size(); }

    [[nodiscard]] bool contains(const ObjectId& object) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return objects_.count(object) > 0;
    }

    [[nodiscard]] int64_t totalBytes() const {
        std::lock_guard<std::mutex> lock(mtx_);
        int64_t total = 0;
        for (const auto& [k, v] : objects_) total += static_cast<int64_t>(v.data.size());
        return total;
    }

private:
    struct Stored {
        Bytes data;
        TimePoint modified_at;
    };

    Result<void> delay(const CancellationToken& token) {
        Millis d;
        { std::lock_guard<std::mutex> lock(mtx_); d = latency_; }
        if (d.count() > 0 && !token.waitFor(d)) {
            auto why = token.check();
            return why ? Err(ErrorCode::ADAPTER_TIMEOUT, id_ + " call interrupted") : Err(why.error());
        }
        return token.check();
    }

    BackendId id_;
    Millis latency_;
    mutable std::mutex mtx_;
    std::map<ObjectId, Stored> objects_;
};

} // namespace tierguard
#endif
