#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace isa {

// ── Command ───────────────────────────────────────────────────────────────────
//
// One request to the server: a command name and optional JSON arguments.
// Encodes to exactly one line, "<name> <json>\n"; absent arguments encode as
// the empty string (never "null"), the separating space is always present.

struct Command {
    std::string                   name;
    std::optional<nlohmann::json> args;

    // Wire form, '\n'-terminated.
    [[nodiscard]] std::string encode() const;

    // Wire form without the trailing newline, for logs.
    [[nodiscard]] std::string describe() const;
};

// Build a command without arguments.
[[nodiscard]] Command make_command(std::string name);

// Build a command whose arguments are any type with a to_json overload.
template <typename T>
[[nodiscard]] Command make_command(std::string name, const T& args) {
    return Command{std::move(name), nlohmann::json(args)};
}

namespace protocol {

// Serialize a command into a wire-ready line.
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string encode_command(std::string_view name,
                                         const std::optional<nlohmann::json>& args);

} // namespace protocol
} // namespace isa
