#pragma once

#include "toolroute/core/errors.hpp"
#include "toolroute/core/result.hpp"
#include "toolroute/core/types.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace toolroute::cache {

using namespace toolroute::core;

// Identity used for memoization and in-flight coordination
struct CacheKey {
    std::string scope;    // e.g. "openai_compatible/gpt-4o-mini"
    std::string digest;   // hash of the normalized input

    std::string str() const { return scope + "|" + digest; }
    bool operator==(const CacheKey& other) const = default;
};

struct CacheOptions {
    Duration ttl = std::chrono::hours(24);
    size_t max_entries = 512;
};

// Runs a computation somewhere (inline, on a pool, ...)
using Launcher = std::function<void(std::function<void()>)>;

inline Launcher inline_launcher() {
    return [](std::function<void()> task) { task(); };
}

// Content-addressed memoization with at most one computation in flight per key.
//
// Successful values are stored until their TTL expires or they are invalidated.
// Errors are handed to every waiting caller but never stored, and the pending
// entry is removed before the waiters are released so a later call retries.
template<typename V>
class Cache {
public:
    using Value = KResult<V>;
    using Compute = std::function<Value()>;

    struct Pending {
        std::shared_future<Value> future;
        bool cache_hit = false;   // served from a stored entry
        bool joined = false;      // attached to another caller's computation
    };

    struct Stats {
        size_t hits = 0;
        size_t joins = 0;
        size_t computes = 0;
        size_t evictions = 0;
    };

    explicit Cache(CacheOptions options = {}) : options_(options) {}

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // Return the stored value, join an in-flight computation, or start one via launch.
    Pending get_or_compute(const CacheKey& key, Compute compute,
                           const Launcher& launch = inline_launcher()) {
        auto id = key.str();
        std::shared_ptr<std::promise<Value>> promise;
        Pending pending;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = entries_.find(id);
            if (it != entries_.end()) {
                if (std::chrono::steady_clock::now() < it->second.expires) {
                    stats_.hits++;
                    pending.future = ready(Value::ok(it->second.value));
                    pending.cache_hit = true;
                    return pending;
                }
                entries_.erase(it);
            }

            auto in_flight = pending_.find(id);
            if (in_flight != pending_.end()) {
                stats_.joins++;
                pending.future = in_flight->second;
                pending.joined = true;
                return pending;
            }

            // Registered before the computation starts
            promise = std::make_shared<std::promise<Value>>();
            pending.future = promise->get_future().share();
            pending_.emplace(id, pending.future);
            stats_.computes++;
        }

        auto task = [this, id, promise, compute = std::move(compute)]() {
            Value value = run(compute);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (value.is_ok()) {
                    store_locked(id, value.value());
                }
                pending_.erase(id);
            }
            promise->set_value(std::move(value));
        };

        try {
            launch(std::move(task));
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                pending_.erase(id);
            }
            promise->set_value(Value::err(Error::from_exception(e)));
        }

        return pending;
    }

    std::optional<V> peek(const CacheKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key.str());
        if (it == entries_.end() || std::chrono::steady_clock::now() >= it->second.expires) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void put(const CacheKey& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_locked(key.str(), std::move(value));
    }

    void invalidate(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key.str());
    }

    // Drop every stored entry; in-flight computations are left to finish
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Entry {
        V value;
        std::chrono::steady_clock::time_point expires;
    };

    static std::shared_future<Value> ready(Value value) {
        std::promise<Value> p;
        p.set_value(std::move(value));
        return p.get_future().share();
    }

    static Value run(const Compute& compute) {
        try {
            return compute();
        } catch (const std::exception& e) {
            return Value::err(Error::from_exception(e));
        }
    }

    void store_locked(const std::string& id, V value) {
        auto now = std::chrono::steady_clock::now();
        if (entries_.size() >= options_.max_entries && !entries_.count(id)) {
            evict_one_locked(now);
        }
        entries_.insert_or_assign(id, Entry{std::move(value), now + options_.ttl});
    }

    // Expired entries first, otherwise the one closest to expiry
    void evict_one_locked(std::chrono::steady_clock::time_point now) {
        auto victim = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->second.expires <= now) {
                victim = it;
                break;
            }
            if (victim == entries_.end() || it->second.expires < victim->second.expires) {
                victim = it;
            }
        }
        if (victim != entries_.end()) {
            entries_.erase(victim);
            stats_.evictions++;
        }
    }

    CacheOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, std::shared_future<Value>> pending_;
    Stats stats_;
};

}  // namespace toolroute::cache
