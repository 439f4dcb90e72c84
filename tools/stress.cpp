// Concurrency soak check for the map engines.
//
// Runs the mixed get/put workload from stress/stress_runner.hpp against the
// selected engine and checks that no read observed a value that was never
// written and that the final key count equals the number of distinct keys
// ever written.
//
// Exit status: 0 on success, 1 on a configuration error or a failed check.

#include "common/logger.hpp"
#include "common/stress_config.hpp"
#include "storage/copy_on_write_map.hpp"
#include "storage/locked_map.hpp"
#include "storage/map_engine.hpp"
#include "stress/stress_runner.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    cowmap::StressConfig cfg;
    try {
        cfg = cowmap::parse_stress_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = cowmap::parse_log_level(cfg.log_level);
    cowmap::init_default_logger(level);
    auto logger = cowmap::make_component_logger("cowmap-stress", level);

    // ── Engine ───────────────────────────────────────────────────────────────
    std::unique_ptr<cowmap::MapEngine<std::string>> engine;
    if (cfg.engine == "locked") {
        engine = std::make_unique<cowmap::LockedMap<std::string>>();
    } else {
        cowmap::MapOptions options;
        options.max_keys                  = cfg.max_keys;
        options.expected_read_write_ratio = cfg.ratio;
        engine = std::make_unique<cowmap::CopyOnWriteMap<std::string>>(options);
    }

    // ── Run ──────────────────────────────────────────────────────────────────
    cowmap::StressReport report;
    try {
        report = cowmap::run_stress(*engine, cfg);
    } catch (const std::exception& e) {
        logger->critical("stress run aborted: {}", e.what());
        return 1;
    }

    logger->info("gets={} puts={} hits={} invalid_reads={} distinct_keys={} final_size={}",
                 report.gets, report.puts, report.hits, report.invalid_reads,
                 report.distinct_keys, report.final_size);

    if (!report.ok()) {
        if (report.invalid_reads > 0) {
            logger->error("{} reads returned a value that was never written", report.invalid_reads);
        }
        if (report.final_size != report.distinct_keys) {
            logger->error("final size {} != distinct keys written {}",
                          report.final_size, report.distinct_keys);
        }
        return 1;
    }

    logger->info("{} engine passed", engine->name());
    return 0;
}
