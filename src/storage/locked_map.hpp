#pragma once

#include "storage/map_engine.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cowmap {

// Thread-safe map backed by std::unordered_map.  Baseline for comparison
// with CopyOnWriteMap.
//
// Concurrency model:
//   - get() / keys() / size() / snapshot() acquire a shared (read) lock.
//   - put() / del() / clear() acquire an exclusive (write) lock.
//   Multiple concurrent readers are allowed; writers are exclusive and block
//   readers while they run.
template <typename V>
class LockedMap final : public MapEngine<V> {
public:
    using Snapshot = typename MapEngine<V>::Snapshot;

    LockedMap() = default;

    LockedMap(const LockedMap&)            = delete;
    LockedMap& operator=(const LockedMap&) = delete;

    [[nodiscard]] std::optional<V> get(std::string_view key) const override {
        validate_key(key);
        std::shared_lock lock(mutex_);
        auto it = map_.find(std::string(key));
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void put(std::string key, V value) override {
        validate_key(key);
        std::unique_lock lock(mutex_);
        map_.insert_or_assign(std::move(key), std::move(value));
    }

    bool del(std::string_view key) override {
        validate_key(key);
        std::unique_lock lock(mutex_);
        return map_.erase(std::string(key)) > 0;
    }

    [[nodiscard]] std::vector<std::string> keys() const override {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(map_.size());
        for (const auto& [k, _] : map_) {
            result.push_back(k);
        }
        return result;
    }

    [[nodiscard]] std::size_t size() const override {
        std::shared_lock lock(mutex_);
        return map_.size();
    }

    // Full copy under the read lock.
    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const override {
        std::shared_lock lock(mutex_);
        return std::make_shared<const Snapshot>(map_);
    }

    void clear() override {
        std::unique_lock lock(mutex_);
        map_.clear();
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "locked"; }

private:
    mutable std::shared_mutex mutex_;
    Snapshot                  map_;
};

extern template class LockedMap<std::string>;

} // namespace cowmap
