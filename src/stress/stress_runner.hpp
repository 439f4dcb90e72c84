#pragma once

#include "common/stress_config.hpp"
#include "storage/map_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <thread>
#include <vector>

namespace cowmap {

// ── StressReport ─────────────────────────────────────────────────────────────
// Outcome of one run_stress() call.

struct StressReport {
    uint64_t    gets          = 0; // get() calls issued by all workers
    uint64_t    puts          = 0; // put() calls issued by all workers
    uint64_t    hits          = 0; // get() calls that found their key
    uint64_t    invalid_reads = 0; // get() results that were never written for that key
    std::size_t distinct_keys = 0; // keys present at start, preloaded or put
    std::size_t final_size    = 0; // engine.size() after all workers joined

    // True when no read observed a value that never existed and no key was
    // lost or invented.
    [[nodiscard]] bool ok() const noexcept {
        return invalid_reads == 0 && final_size == distinct_keys;
    }
};

// ── spawn_workers ────────────────────────────────────────────────────────────
//
// Starts `count` threads, thread t being the one returned by make_thread(t).
// If starting one fails (std::system_error when the thread limit is hit), the
// threads already running are joined before the exception propagates, so
// no joinable std::thread is ever destroyed.

template <typename MakeThread>
[[nodiscard]] std::vector<std::thread> spawn_workers(uint32_t count, MakeThread&& make_thread) {
    std::vector<std::thread> workers;
    workers.reserve(count);
    try {
        for (uint32_t t = 0; t < count; ++t) {
            workers.push_back(make_thread(t));
        }
    } catch (const std::exception&) {
        for (auto& w : workers) w.join();
        throw;
    }
    return workers;
}

// ── run_stress ───────────────────────────────────────────────────────────────
//
// Drives `engine` with cfg.threads concurrent workers for cfg.duration_ms.
//
//   1. Preloads keys "0".."initial_keys-1", each with value == key.
//   2. Each worker repeatedly draws a key k from [0, key_space) and with
//      probability 1 / (ratio + 1) calls put(k, k), otherwise get(k).
//   3. After all workers join, compares engine.size() with the number of
//      distinct keys ever written.
//
// Since every value written equals its key, a get() returning anything else
// is counted as an invalid read.
//
// An exception thrown inside a worker stops that worker; the first one is
// rethrown from run_stress() after every worker has been joined.

[[nodiscard]] StressReport run_stress(MapEngine<std::string>& engine, const StressConfig& cfg);

} // namespace cowmap
