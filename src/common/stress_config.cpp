#include "common/stress_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace cowmap {

namespace {

void require_positive(uint64_t value, const char* option) {
    if (value == 0) {
        throw std::runtime_error(fmt::format("{} must be > 0", option));
    }
}

// Validate the fully populated StressConfig.
void validate(const StressConfig& cfg) {
    if (cfg.engine != "cow" && cfg.engine != "locked") {
        throw std::runtime_error(
            fmt::format("--engine must be 'cow' or 'locked', got '{}'", cfg.engine));
    }

    require_positive(cfg.threads,     "--threads");
    require_positive(cfg.ratio,       "--ratio");
    require_positive(cfg.duration_ms, "--duration-ms");
    require_positive(cfg.key_space,   "--key-space");
    require_positive(cfg.max_keys,    "--max-keys");

    if (cfg.initial_keys > cfg.key_space) {
        throw std::runtime_error(
            fmt::format("--initial-keys ({}) must not exceed --key-space ({})",
                        cfg.initial_keys, cfg.key_space));
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const StressConfig defaults;
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("engine",
            po::value<std::string>()->default_value(defaults.engine),
            "Map engine under test: cow (default) or locked")
        ("threads",
            po::value<uint32_t>()->default_value(defaults.threads),
            "Number of concurrent worker threads")
        ("initial-keys",
            po::value<uint32_t>()->default_value(defaults.initial_keys),
            "Keys loaded into the map before workers start")
        ("key-space",
            po::value<uint32_t>()->default_value(defaults.key_space),
            "Workers draw keys uniformly from [0, key-space)")
        ("ratio",
            po::value<uint32_t>()->default_value(defaults.ratio),
            "Number of get calls per put call")
        ("duration-ms",
            po::value<uint32_t>()->default_value(defaults.duration_ms),
            "How long the workers run, in milliseconds")
        ("max-keys",
            po::value<uint32_t>()->default_value(defaults.max_keys),
            "Soft key limit for the cow engine (logged when exceeded)")
        ("seed",
            po::value<uint64_t>()->default_value(defaults.seed),
            "Base RNG seed; 0 picks one from std::random_device")
        ("log-level",
            po::value<std::string>()->default_value(defaults.log_level),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_stress_config ───────────────────────────────────────────────────────

StressConfig parse_stress_config(int argc, char* argv[]) {
    po::options_description desc("cowmap-stress options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    StressConfig cfg;
    cfg.engine       = vm["engine"].as<std::string>();
    cfg.threads      = vm["threads"].as<uint32_t>();
    cfg.initial_keys = vm["initial-keys"].as<uint32_t>();
    cfg.key_space    = vm["key-space"].as<uint32_t>();
    cfg.ratio        = vm["ratio"].as<uint32_t>();
    cfg.duration_ms  = vm["duration-ms"].as<uint32_t>();
    cfg.max_keys     = vm["max-keys"].as<uint32_t>();
    cfg.seed         = vm["seed"].as<uint64_t>();
    cfg.log_level    = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace cowmap
