#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cowmap {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger ("cowmap").  Library code logs through
// spdlog's default logger, so call this once at program start to get the
// project's pattern and level.  Calling it again only updates the level.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::info);

// Create (or retrieve if already exists) a named logger for one component,
// e.g. "stress".
std::shared_ptr<spdlog::logger> make_component_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace cowmap
