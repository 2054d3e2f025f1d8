#pragma once

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (1.74) without including it
#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "client/dispatcher.hpp"
#include "network/connection.hpp"
#include "protocol/command.hpp"
#include "protocol/messages.hpp"
#include "protocol/schema.hpp"

namespace isa::client {

// ── Client ────────────────────────────────────────────────────────────────────
//
// Typed command surface of an Isabelle server.
//
// Every operation opens its own connection, authenticates, dispatches exactly
// one command and closes the connection again; nothing is shared between
// calls except the (read-only) endpoint and password.  Independent calls may
// therefore run concurrently on the same executor.
//
// All operations are coroutines running on the caller's executor:
//   auto r = co_await client.echo("hello");
// For plain blocking code see client/blocking.hpp.
//
// Engine failures are thrown (ConnectionError, AuthenticationError,
// ProtocolError); server-reported failures are returned as result variants.

class Client {
public:
    Client(std::string host,
           uint16_t    port,
           std::string password,
           std::shared_ptr<spdlog::logger> logger = nullptr);

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    // ── Synchronous commands ──────────────────────────────────────────────────

    // Identity: returns its argument.
    boost::asio::awaitable<SyncResult<std::string, std::string>> echo(std::string text);

    // Shut the server process down, stopping all sessions.  Other connections'
    // pending commands may be disrupted.
    boost::asio::awaitable<SyncResult<Unit, std::string>> shutdown();

    // Ask the server to cancel `task`.  Advisory: the task may still finish,
    // and an in-flight dispatch for it keeps waiting for FINISHED/FAILED.
    boost::asio::awaitable<SyncResult<Unit, Unit>> cancel(std::string task);

    // Remove theories from a session.
    boost::asio::awaitable<SyncResult<PurgeTheoriesResults, Unit>>
    purge_theories(const PurgeTheoriesArgs& args);

    // ── Asynchronous commands ─────────────────────────────────────────────────

    // Build a session image.
    boost::asio::awaitable<AsyncResult<SessionBuildResults, SessionBuildResults>>
    session_build(const SessionBuildArgs& args, NoteHandler on_note = {});

    // Start a PIDE session (building its image on demand).
    boost::asio::awaitable<AsyncResult<SessionStartResult, Unit>>
    session_start(const SessionBuildArgs& args, NoteHandler on_note = {});

    // Stop a session.
    boost::asio::awaitable<AsyncResult<SessionStopResult, SessionStopResult>>
    session_stop(const SessionStopArgs& args, NoteHandler on_note = {});

    // Load theories into a session, resolving dependencies implicitly.
    boost::asio::awaitable<AsyncResult<UseTheoriesResults, Unit>>
    use_theories(const UseTheoriesArgs& args, NoteHandler on_note = {});

    // ── Generic ───────────────────────────────────────────────────────────────

    // Run any synchronous command with raw JSON arguments and results.
    boost::asio::awaitable<SyncResult<nlohmann::json, nlohmann::json>>
    call_sync(std::string name, std::optional<nlohmann::json> args = std::nullopt);

    // Run any asynchronous command with raw JSON arguments and results.
    boost::asio::awaitable<AsyncResult<nlohmann::json, nlohmann::json>>
    call_async(std::string name,
               std::optional<nlohmann::json> args = std::nullopt,
               NoteHandler on_note = {});

    // Open and authenticate a fresh connection on the calling coroutine's
    // executor.
    boost::asio::awaitable<std::unique_ptr<network::Connection>> connect();

private:
    template <typename R, typename E>
    boost::asio::awaitable<SyncResult<R, E>> run_sync(Command command);

    template <typename T, typename F>
    boost::asio::awaitable<AsyncResult<T, F>> run_async(Command command, NoteHandler on_note);

    std::string host_;
    uint16_t    port_;
    std::string password_;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace isa::client
