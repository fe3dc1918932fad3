/**
 * @file event_system.hpp
 * @brief Observer pattern event bus for engine notifications
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_EVENT_SYSTEM_HPP
#define TIERGUARD_EVENT_SYSTEM_HPP

#include "tg_types.hpp"
#include "tg_logger.hpp"
#include <map>
#include <mutex>
#include <deque>
#include <algorithm>
#include <atomic>
#include <exception>

namespace tierguard {

enum class EventType {
    BACKEND_REGISTERED, BACKEND_ENABLED, BACKEND_DISABLED,
    POLICY_CHANGED, POLICY_REMOVED,
    QUOTA_WARNING, QUOTA_EXCEEDED,
    VIOLATION_RAISED, VIOLATION_RESOLVED,
    CACHE_PROMOTED, CACHE_DEMOTED, CACHE_EVICTED,
    REPLICA_VERIFIED, REPLICA_FAILED, REPLICATION_DEGRADED,
    OBJECT_STORED, OBJECT_DELETED,
    ENGINE_STARTED, ENGINE_STOPPED
};

struct Event {
    EventType type = EventType::ENGINE_STARTED;
    std::string source;
    std::string message;
    BackendId backend_id;
    ObjectId object_id;
    TimePoint timestamp;
};

using EventCallback = std::function<void(const Event&)>;

/**
 * @class EventBus
 * @brief Fan-out of engine events to subscribers
 *
 * Owned by the engine instance. Callbacks run on the publishing thread after
 * the bus lock is released, so a subscriber may publish again.
 */
class EventBus {
public:
    using SubscriberId = uint64_t;

    explicit EventBus(size_t history_limit = 1000) : history_limit_(history_limit) {}
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriberId subscribe(EventType type, EventCallback cb) {
        std::lock_guard<std::mutex> lock(mtx_);
        SubscriberId id = next_++;
        subs_[type].emplace_back(id, std::move(cb));
        return id;
    }

    SubscriberId subscribeAll(EventCallback cb) {
        std::lock_guard<std::mutex> lock(mtx_);
        SubscriberId id = next_++;
        global_.emplace_back(id, std::move(cb));
        return id;
    }

    void unsubscribe(SubscriberId id) {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& [t, v] : subs_) v.erase(std::remove_if(v.begin(), v.end(), [id](const Sub& s){ return s.id == id; }), v.end());
        global_.erase(std::remove_if(global_.begin(), global_.end(), [id](const Sub& s){ return s.id == id; }), global_.end());
    }

    void publish(const Event& event) {
        std::vector<EventCallback> cbs;
        { std::lock_guard<std::mutex> lock(mtx_);
          events_.push_back(event);
          while (events_.size() > history_limit_) events_.pop_front();
          auto it = subs_.find(event.type);
          if (it != subs_.end()) for (const auto& s : it->second) cbs.push_back(s.cb);
          for (const auto& s : global_) cbs.push_back(s.cb);
        }
        for (const auto& cb : cbs) {
            try {
                cb(event);
            } catch (const std::exception& e) {
                LOG_ERROR("EventBus", "Subscriber failed on " + eventTypeToString(event.type) + ": " + e.what());
            }
        }
    }

    void emit(EventType type, const std::string& src, const std::string& msg,
              const BackendId& backend = "", const ObjectId& object = "") {
        Event e;
        e.type = type;
        e.source = src;
        e.message = msg;
        e.backend_id = backend;
        e.object_id = object;
        e.timestamp = Clock::now();
        publish(e);
    }

    std::vector<Event> getRecentEvents(size_t n = 100) const {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t start = n >= events_.size() ? 0 : events_.size() - n;
        return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(start), events_.end());
    }

    size_t countOf(EventType type) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
            [type](const Event& e) { return e.type == type; }));
    }

    void reset() { std::lock_guard<std::mutex> lock(mtx_); subs_.clear(); global_.clear(); events_.clear(); }

    static std::string eventTypeToString(EventType t) {
        switch (t) {
            case EventType::BACKEND_REGISTERED: return "BACKEND_REGISTERED";
            case EventType::BACKEND_ENABLED: return "BACKEND_ENABLED";
            case EventType::BACKEND_DISABLED: return "BACKEND_DISABLED";
            case EventType::POLICY_CHANGED: return "POLICY_CHANGED";
            case EventType::POLICY_REMOVED: return "POLICY_REMOVED";
            case EventType::QUOTA_WARNING: return "QUOTA_WARNING";
            case EventType::QUOTA_EXCEEDED: return "QUOTA_EXCEEDED";
            case EventType::VIOLATION_RAISED: return "VIOLATION_RAISED";
            case EventType::VIOLATION_RESOLVED: return "VIOLATION_RESOLVED";
            case EventType::CACHE_PROMOTED: return "CACHE_PROMOTED";
            case EventType::CACHE_DEMOTED: return "CACHE_DEMOTED";
            case EventType::CACHE_EVICTED: return "CACHE_EVICTED";
            case EventType::REPLICA_VERIFIED: return "REPLICA_VERIFIED";
            case EventType::REPLICA_FAILED: return "REPLICA_FAILED";
            case EventType::REPLICATION_DEGRADED: return "REPLICATION_DEGRADED";
            case EventType::OBJECT_STORED: return "OBJECT_STORED";
            case EventType::OBJECT_DELETED: return "OBJECT_DELETED";
            case EventType::ENGINE_STARTED: return "ENGINE_STARTED";
            case EventType::ENGINE_STOPPED: return "ENGINE_STOPPED";
        }
        return "UNKNOWN";
    }

private:
    struct Sub { SubscriberId id; EventCallback cb; Sub(SubscriberId i, EventCallback c) : id(i), cb(std::move(c)) {} };
    mutable std::mutex mtx_;
    std::map<EventType, std::vector<Sub>> subs_;
    std::vector<Sub> global_;
    std::deque<Event> events_;
    size_t history_limit_;
    std::atomic<SubscriberId> next_{1};
};

} // namespace tierguard
#endif
