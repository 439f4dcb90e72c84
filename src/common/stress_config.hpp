#pragma once

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace cowmap {

// ── StressConfig ──────────────────────────────────────────────────────────────
// Settings for one cowmap-stress run.  Populated by parse_stress_config().

struct StressConfig {
    std::string   engine        = "cow";      // "cow" or "locked"
    uint32_t      threads       = 24;         // Worker threads, each mixing gets and puts
    uint32_t      initial_keys  = 100;        // Keys "0".."initial_keys-1" loaded before start
    uint32_t      key_space     = 1000000;    // Keys are drawn from [0, key_space)
    uint32_t      ratio         = 20000;      // Gets per put
    uint32_t      duration_ms   = 1000;       // Wall-clock run time
    uint32_t      max_keys      = 10000;      // MapOptions::max_keys for the cow engine
    uint64_t      seed          = 0;          // Base RNG seed, 0 = std::random_device
    std::string   log_level     = "info";     // spdlog level string
};

// ── parse_stress_config ───────────────────────────────────────────────────────
// Parse CLI arguments into a StressConfig.
//
// On success: returns a fully validated StressConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - engine is "cow" or "locked"
//   - threads, ratio, duration-ms, key-space and max-keys are > 0
//   - initial-keys <= key-space

[[nodiscard]] StressConfig parse_stress_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with cowmap-stress
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace cowmap
