#pragma once

#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/smart_ptr/atomic_shared_ptr.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

namespace cowmap {

// ── SnapshotCell ─────────────────────────────────────────────────────────────
//
// Holds the currently published immutable snapshot of type T.
//
//   - load()  returns the published snapshot.
//   - store() atomically replaces it. Readers observe either the old or the
//             new snapshot, never anything in between.
//
// Both operations take a short internal spinlock (acquire/release) around
// the pointer swap; a reader can spin for the few instructions a concurrent
// store() holds it, but never waits on a writer's map copy or write lock.
// The cell is not lock-free (boost::atomic_shared_ptr::is_lock_free() is
// false).
//
// The cell never holds a null snapshot. An old snapshot is destroyed when the
// last reader that loaded it releases its pointer.
//
// store() does not serialize writers against each other; callers that do a
// read-copy-modify-store sequence must hold their own write lock.

template <typename T>
class SnapshotCell {
public:
    using pointer = boost::shared_ptr<const T>;

    explicit SnapshotCell(pointer initial) {
        if (!initial) {
            throw std::invalid_argument("SnapshotCell requires a non-null initial snapshot");
        }
        current_.store(std::move(initial));
    }

    SnapshotCell(const SnapshotCell&)            = delete;
    SnapshotCell& operator=(const SnapshotCell&) = delete;

    [[nodiscard]] pointer load() const {
        return current_.load();
    }

    void store(pointer next) {
        if (!next) {
            throw std::invalid_argument("SnapshotCell cannot publish a null snapshot");
        }
        current_.store(std::move(next));
    }

    // Same snapshot as load(), as a std::shared_ptr.  The returned pointer
    // keeps the snapshot alive for as long as any copy of it exists.
    [[nodiscard]] std::shared_ptr<const T> load_shared() const {
        pointer held = current_.load();
        const T* raw = held.get();
        return std::shared_ptr<const T>(raw, [held = std::move(held)](const T*) {});
    }

private:
    boost::atomic_shared_ptr<const T> current_;
};

} // namespace cowmap
