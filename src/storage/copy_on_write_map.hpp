#pragma once

#include "storage/map_engine.hpp"
#include "storage/map_options.hpp"
#include "storage/snapshot_cell.hpp"

#include <boost/smart_ptr/make_shared.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cowmap {

// ── CopyOnWriteMap ───────────────────────────────────────────────────────────
//
// Read-mostly map with copy-on-write updates; reads never take the writer lock.
//
// Concurrency model:
//   - get() / keys() / size() / snapshot() load the published snapshot from
//     a SnapshotCell and never take the writer mutex.
//   - put() / del() / clear() take the writer mutex, build a complete new
//     snapshot from the current one and publish it with one atomic store.
//
// Every write costs O(size) whether or not the key already exists.  The
// design only pays off when gets outnumber puts by orders of magnitude and
// the key set stays small (see MapOptions).
//
// Failure atomicity: if duplication throws (std::bad_alloc, or V's copy
// constructor), the half-built snapshot is dropped and the previously
// published one stays visible.

template <typename V>
class CopyOnWriteMap final : public MapEngine<V> {
public:
    using Snapshot = typename MapEngine<V>::Snapshot;

    explicit CopyOnWriteMap(MapOptions options = {})
        : options_(options)
        , cell_(boost::make_shared<Snapshot>()) {}

    CopyOnWriteMap(const CopyOnWriteMap&)            = delete;
    CopyOnWriteMap& operator=(const CopyOnWriteMap&) = delete;

    [[nodiscard]] std::optional<V> get(std::string_view key) const override {
        validate_key(key);
        const auto current = cell_.load();
        auto it = current->find(std::string(key));
        if (it == current->end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void put(std::string key, V value) override {
        validate_key(key);
        std::lock_guard lock(write_mutex_);

        const auto current = cell_.load();
        auto next = duplicate(*current, std::string_view{});
        next->insert_or_assign(std::move(key), std::move(value));
        publish(std::move(next));
    }

    bool del(std::string_view key) override {
        validate_key(key);
        std::lock_guard lock(write_mutex_);

        const auto current = cell_.load();
        if (current->find(std::string(key)) == current->end()) {
            return false; // nothing to publish
        }
        publish(duplicate(*current, key));
        return true;
    }

    [[nodiscard]] std::vector<std::string> keys() const override {
        const auto current = cell_.load();
        std::vector<std::string> result;
        result.reserve(current->size());
        for (const auto& [k, _] : *current) {
            result.push_back(k);
        }
        return result;
    }

    [[nodiscard]] std::size_t size() const override {
        return cell_.load()->size();
    }

    // The returned snapshot is the published one, not a copy.  It never
    // changes after being obtained.
    [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const override {
        return cell_.load_shared();
    }

    void clear() override {
        std::lock_guard lock(write_mutex_);
        publish(boost::make_shared<Snapshot>());
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "cow"; }

    [[nodiscard]] const MapOptions& options() const noexcept { return options_; }

private:
    // Copies `from` into a fresh snapshot with room for one more entry,
    // leaving out `skip` when it is non-empty.
    [[nodiscard]] boost::shared_ptr<Snapshot> duplicate(const Snapshot& from,
                                                      std::string_view skip) const {
        try {
            auto next = boost::make_shared<Snapshot>();
            next->reserve(from.size() + 1);
            for (const auto& [k, v] : from) {
                if (!skip.empty() && k == skip) {
                    continue;
                }
                next->emplace(k, v);
            }
            return next;
        } catch (const std::bad_alloc&) {
            spdlog::error("cow map: out of memory duplicating {} entries, keeping previous snapshot",
                          from.size());
            throw;
        }
    }

    // Caller must hold write_mutex_.
    void publish(boost::shared_ptr<Snapshot> next) {
        const std::size_t n = next->size();
        cell_.store(std::move(next));
        spdlog::debug("cow map: published snapshot with {} entries", n);

        if (n > options_.max_keys && !size_warning_logged_) {
            size_warning_logged_ = true;
            spdlog::warn("cow map grew to {} keys (max_keys={}); every write copies the whole map",
                         n, options_.max_keys);
        }
    }

    const MapOptions         options_;
    SnapshotCell<Snapshot>   cell_;
    std::mutex               write_mutex_;
    bool                     size_warning_logged_ = false; // guarded by write_mutex_
};

extern template class CopyOnWriteMap<std::string>;

} // namespace cowmap
