#include "stress/stress_runner.hpp"

#include "common/logger.hpp"

#include <chrono>
#include <exception>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace cowmap {

namespace {

using steady = std::chrono::steady_clock;

// Per-worker tallies, merged once the worker has been joined.
struct WorkerStats {
    uint64_t gets          = 0;
    uint64_t puts          = 0;
    uint64_t hits          = 0;
    uint64_t invalid_reads = 0;
    std::unordered_set<uint32_t> written;
};

uint64_t pick_base_seed(uint64_t configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

void run_worker(MapEngine<std::string>& engine,
                const StressConfig& cfg,
                uint64_t seed,
                steady::time_point deadline,
                WorkerStats& stats)
{
    std::mt19937_64 rng{seed};
    std::uniform_int_distribution<uint32_t> pick_key(0, cfg.key_space - 1);
    std::uniform_int_distribution<uint32_t> pick_op(0, cfg.ratio);

    // The deadline is checked once per batch.
    constexpr int kBatch = 256;

    while (steady::now() < deadline) {
        for (int i = 0; i < kBatch; ++i) {
            const uint32_t k   = pick_key(rng);
            const std::string key = std::to_string(k);

            if (pick_op(rng) == 0) {
                engine.put(key, key);
                stats.written.insert(k);
                ++stats.puts;
                continue;
            }

            auto value = engine.get(key);
            ++stats.gets;
            if (value) {
                ++stats.hits;
                if (*value != key) {
                    ++stats.invalid_reads;
                }
            }
        }
    }
}

} // anonymous namespace

StressReport run_stress(MapEngine<std::string>& engine, const StressConfig& cfg) {
    auto logger = make_component_logger("stress", parse_log_level(cfg.log_level));

    std::unordered_set<std::string> distinct;
    for (auto& key : engine.keys()) {
        distinct.insert(std::move(key));
    }
    for (uint32_t i = 0; i < cfg.initial_keys; ++i) {
        const std::string key = std::to_string(i);
        engine.put(key, key);
        distinct.insert(key);
    }

    const uint64_t base_seed = pick_base_seed(cfg.seed);
    logger->info("engine={} threads={} initial_keys={} key_space={} ratio={} duration={}ms seed={}",
                 engine.name(), cfg.threads, cfg.initial_keys, cfg.key_space,
                 cfg.ratio, cfg.duration_ms, base_seed);

    std::vector<WorkerStats> stats(cfg.threads);
    std::exception_ptr first_error;
    std::mutex error_mutex;

    const auto deadline = steady::now() + std::chrono::milliseconds(cfg.duration_ms);

    std::vector<std::thread> workers;
    try {
        workers = spawn_workers(cfg.threads, [&](uint32_t t) {
            return std::thread([&, t] {
                try {
                    run_worker(engine, cfg, base_seed + t, deadline, stats[t]);
                } catch (const std::exception& e) {
                    logger->error("worker {} stopped: {}", t, e.what());
                    std::lock_guard lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                }
            });
        });
    } catch (const std::exception& e) {
        logger->error("could not start {} workers: {}", cfg.threads, e.what());
        throw;
    }
    for (auto& w : workers) w.join();

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    StressReport report;
    for (const auto& s : stats) {
        report.gets          += s.gets;
        report.puts          += s.puts;
        report.hits          += s.hits;
        report.invalid_reads += s.invalid_reads;
        for (uint32_t k : s.written) {
            distinct.insert(std::to_string(k));
        }
    }
    report.distinct_keys = distinct.size();
    report.final_size    = engine.size();

    logger->debug("gets={} puts={} hits={}", report.gets, report.puts, report.hits);
    return report;
}

} // namespace cowmap
