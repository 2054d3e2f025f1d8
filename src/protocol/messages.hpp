#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

namespace isa {

// ── Unit ──────────────────────────────────────────────────────────────────────
//
// Payload of commands that answer with nothing.  The server sends an empty
// string, which the payload decoder reads as JSON null.

struct Unit {
    friend bool operator==(const Unit&, const Unit&) noexcept { return true; }
};

void to_json(nlohmann::json& j, const Unit&);

// ── Position ──────────────────────────────────────────────────────────────────
// Source position of a message within theory text.  Every field is optional.

struct Position {
    std::optional<uint64_t>    line;
    std::optional<uint64_t>    offset;
    std::optional<uint64_t>    end_offset;
    std::optional<std::string> file;
    std::optional<uint64_t>    id;

    bool operator==(const Position&) const = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

// ── Message ───────────────────────────────────────────────────────────────────
//
// Wire shape: {"kind": "...", "message": "...", "pos": {...}?}
// kind is one of writeln, warning, error (open set).

struct Message {
    std::string             kind;
    std::string             text;
    std::optional<Position> position;

    bool operator==(const Message&) const = default;
};

void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);

// ── Task ──────────────────────────────────────────────────────────────────────
// Server-assigned id of an accepted asynchronous command.

struct Task {
    std::string task;

    bool operator==(const Task&) const = default;
};

void to_json(nlohmann::json& j, const Task& t);
void from_json(const nlohmann::json& j, Task& t);

// ── FailedOutcome ─────────────────────────────────────────────────────────────
//
// Terminal state of a task that failed.  On the wire the task id, the message
// and the command-specific context are flattened into one JSON object.

template <typename F>
struct FailedOutcome {
    Task             task;
    Message          message;
    std::optional<F> context;
};

template <typename F>
void from_json(const nlohmann::json& j, FailedOutcome<F>& f) {
    f.task    = j.get<Task>();
    f.message = j.get<Message>();
    f.context.reset();

    if constexpr (std::is_same_v<F, Unit>) {
        // Unit carries no context.
    } else if constexpr (std::is_same_v<F, nlohmann::json>) {
        f.context = j;
    } else {
        // The context is absent when the remaining fields do not form an F.
        try {
            f.context = j.get<F>();
        } catch (const nlohmann::json::exception&) {
            f.context.reset();
        }
    }
}

// ── Outcomes ──────────────────────────────────────────────────────────────────
//
// Server-reported outcomes of a call.  None of these is an engine error.

template <typename T>
struct OkResult {
    T value;
};

template <typename E>
struct ErrorResult {
    E value;
};

template <typename T>
struct FinishedResult {
    T value;
};

// Outcome of a synchronous command: OK or ERROR.
template <typename T, typename E>
using SyncResult = std::variant<OkResult<T>, ErrorResult<E>>;

// Outcome of an asynchronous command:
//   ErrorResult<Message>  – rejected before a task existed
//   FinishedResult<T>     – task succeeded
//   FailedOutcome<F>      – task failed
template <typename T, typename F>
using AsyncResult = std::variant<ErrorResult<Message>, FinishedResult<T>, FailedOutcome<F>>;

template <typename T, typename E>
[[nodiscard]] bool is_ok(const SyncResult<T, E>& r) noexcept {
    return std::holds_alternative<OkResult<T>>(r);
}

template <typename T, typename F>
[[nodiscard]] bool is_finished(const AsyncResult<T, F>& r) noexcept {
    return std::holds_alternative<FinishedResult<T>>(r);
}

} // namespace isa
