#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace isa {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger (CLI, launcher, tests).
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::warn);

// Create (or retrieve if already exists) a named client logger.
//   name   – embedded in every log line as [<name>]
//   level  – initial log level
// Each Client carries one of these; connections and dispatch loops log through it.
std::shared_ptr<spdlog::logger> make_client_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::warn);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::warn on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace isa
