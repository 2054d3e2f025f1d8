#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

namespace isa {

// ── ClientConfig ──────────────────────────────────────────────────────────────
// Configuration of one isa-cli invocation.
// Populated by parse_config() from CLI arguments.

struct ClientConfig {
    std::string host;           // Server address
    uint16_t    port = 0;       // Server port (0 when --server is used)
    std::string password;       // Handshake secret (from --password or --password-file)
    std::string server_name;    // Launch/discover this named server instead of host:port
    std::string log_level;      // spdlog level string

    std::string                   command;  // Command name, e.g. "echo"
    std::optional<nlohmann::json> args;     // Command arguments (JSON), absent if none

    bool async_mode = false;    // Dispatch as asynchronous command
    bool show_notes = false;    // Print NOTE payloads to stderr

    [[nodiscard]] bool launches_server() const noexcept { return !server_name.empty(); }
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ClientConfig.
//
// On success: returns a fully validated ClientConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (--help also throws, carrying the help text).
//
// Validates:
//   - a command name is given
//   - args, when given, is valid JSON
//   - without --server: port in [1, 65535] and exactly one of --password /
//     --password-file
//   - with --server: no explicit port or password
//
// Usage: isa-cli [options] COMMAND [JSON_ARGS]
//   Example: isa-cli --port 4711 --password s3cret echo '"hello"'

[[nodiscard]] ClientConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with isa-cli options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace isa
