#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace isa {

// ── ResponseKind ──────────────────────────────────────────────────────────────

enum class ResponseKind : uint8_t {
    Ok           = 0,
    Error        = 1,
    Finished     = 2,
    Failed       = 3,
    Note         = 4,
    Unrecognized = 5,
};

[[nodiscard]] std::string_view to_string(ResponseKind kind) noexcept;

// ── ClassifiedLine ────────────────────────────────────────────────────────────
//
// One server line split into its kind and the payload that follows the prefix
// token.  For Unrecognized lines `rest` holds the whole (trimmed) line.

struct ClassifiedLine {
    ResponseKind kind = ResponseKind::Unrecognized;
    std::string  rest;
};

// ── Prefix table ──────────────────────────────────────────────────────────────
//
// Consulted in order, first match wins.  Matching is a case-sensitive prefix
// test on the trimmed line.

struct ResponsePrefix {
    std::string_view token;
    ResponseKind     kind;
};

inline constexpr std::array<ResponsePrefix, 5> kResponsePrefixes{{
    {"OK",       ResponseKind::Ok},
    {"ERROR",    ResponseKind::Error},
    {"FINISHED", ResponseKind::Finished},
    {"FAILED",   ResponseKind::Failed},
    {"NOTE",     ResponseKind::Note},
}};

namespace protocol {

// Classify one line (without its trailing '\n').  Never fails: lines that match
// no prefix come back as Unrecognized and are skipped by the dispatch loops.
// Thread-safe: pure function, no shared state.
[[nodiscard]] ClassifiedLine classify(std::string_view line);

// Strip leading and trailing ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

} // namespace protocol
} // namespace isa
