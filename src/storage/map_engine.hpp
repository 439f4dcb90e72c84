#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cowmap {

// ── MapEngine ────────────────────────────────────────────────────────────────
//
// Abstract interface for a thread-safe string-keyed map.
//
// Implementations must be safe for any number of concurrent callers.  The
// concrete engine (copy-on-write or reader/writer locked) is selected by the
// caller; both honour the same contract:
//   - get() reports absence with std::nullopt, never with an exception.
//   - Every operation taking a key rejects an empty key with
//     std::invalid_argument before touching any state.

template <typename V>
class MapEngine {
public:
    using Snapshot = std::unordered_map<std::string, V>;

    virtual ~MapEngine() = default;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] virtual std::optional<V> get(std::string_view key) const = 0;

    // Inserts or overwrites `key` with `value`.
    virtual void put(std::string key, V value) = 0;

    // Removes `key`.  Returns true if the key existed, false otherwise.
    virtual bool del(std::string_view key) = 0;

    // Returns all keys (order is unspecified).
    [[nodiscard]] virtual std::vector<std::string> keys() const = 0;

    // Returns the number of stored key-value pairs.
    [[nodiscard]] virtual std::size_t size() const = 0;

    // Returns an immutable view of the whole map at one point in time.
    [[nodiscard]] virtual std::shared_ptr<const Snapshot> snapshot() const = 0;

    // Removes all entries.
    virtual void clear() = 0;

    // Short engine label used in log lines.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// Throws std::invalid_argument if `key` is empty.
inline void validate_key(std::string_view key) {
    if (key.empty()) {
        throw std::invalid_argument("key must not be empty");
    }
}

} // namespace cowmap
