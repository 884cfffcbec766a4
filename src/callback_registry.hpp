#pragma once
#include "log.hpp"
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// Ordered observer lists keyed by channel (RF protocol name, pin number,
// DHT sensor). Callbacks are never de-duplicated and run in registration
// order. A throwing callback is logged and the remaining ones still run.
template <typename Key, typename... Args>
class CallbackRegistry
{
public:
    using Callback = std::function<void(Args...)>;

    explicit CallbackRegistry(const std::string &name) : name_(name) {}

    void add(const Key &key, Callback callback)
    {
        if (!callback) return;
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_[key].push_back(std::move(callback));
    }

    // Returns the number of callbacks invoked.
    size_t dispatch(const Key &key, Args... args) const
    {
        std::vector<Callback> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = callbacks_.find(key);
            if (it == callbacks_.end()) return 0;
            targets = it->second;
        }
        // Invoked without the lock so a callback may register more callbacks
        for (const auto &cb : targets)
        {
            try
            {
                cb(args...);
            }
            catch (const std::exception &e)
            {
                logError(name_ + " callback failed: " + e.what());
            }
            catch (...)
            {
                logError(name_ + " callback failed with a non-standard exception");
            }
        }
        return targets.size();
    }

    std::vector<Key> keys() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> out;
        out.reserve(callbacks_.size());
        for (const auto &kv : callbacks_)
            out.push_back(kv.first);
        return out;
    }

    size_t count(const Key &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callbacks_.find(key);
        return it == callbacks_.end() ? 0 : it->second.size();
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return callbacks_.empty();
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<Key, std::vector<Callback>> callbacks_;
};
