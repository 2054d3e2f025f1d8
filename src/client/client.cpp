#include "client/client.hpp"

#include "network/handshake.hpp"

#include <boost/asio/this_coro.hpp>

namespace isa::client {

Client::Client(std::string host,
               uint16_t    port,
               std::string password,
               std::shared_ptr<spdlog::logger> logger)
    : host_(std::move(host)),
      port_(port),
      password_(std::move(password)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

// ── Connection setup ──────────────────────────────────────────────────────────

boost::asio::awaitable<std::unique_ptr<network::Connection>> Client::connect() {
    auto executor = co_await boost::asio::this_coro::executor;

    auto connection = std::make_unique<network::Connection>(executor, logger_);
    co_await connection->open(host_, port_);
    co_await network::authenticate(*connection, password_);

    logger_->info("Client connected to {}:{}", host_, port_);
    co_return std::move(connection);
}

template <typename R, typename E>
boost::asio::awaitable<SyncResult<R, E>> Client::run_sync(Command command) {
    auto connection = co_await connect();
    auto result = co_await dispatch_sync<R, E>(command, *connection);
    connection->close();
    co_return result;
}

template <typename T, typename F>
boost::asio::awaitable<AsyncResult<T, F>> Client::run_async(Command command,
                                                            NoteHandler on_note) {
    auto connection = co_await connect();
    auto result = co_await dispatch_async<T, F>(command, *connection, on_note);
    connection->close();
    co_return result;
}

// ── Synchronous commands ──────────────────────────────────────────────────────

boost::asio::awaitable<SyncResult<std::string, std::string>> Client::echo(std::string text) {
    return run_sync<std::string, std::string>(make_command("echo", text));
}

boost::asio::awaitable<SyncResult<Unit, std::string>> Client::shutdown() {
    return run_sync<Unit, std::string>(make_command("shutdown"));
}

boost::asio::awaitable<SyncResult<Unit, Unit>> Client::cancel(std::string task) {
    return run_sync<Unit, Unit>(make_command("cancel", CancelArgs{std::move(task)}));
}

boost::asio::awaitable<SyncResult<PurgeTheoriesResults, Unit>>
Client::purge_theories(const PurgeTheoriesArgs& args) {
    return run_sync<PurgeTheoriesResults, Unit>(make_command("purge_theories", args));
}

// ── Asynchronous commands ─────────────────────────────────────────────────────

boost::asio::awaitable<AsyncResult<SessionBuildResults, SessionBuildResults>>
Client::session_build(const SessionBuildArgs& args, NoteHandler on_note) {
    return run_async<SessionBuildResults, SessionBuildResults>(
        make_command("session_build", args), std::move(on_note));
}

boost::asio::awaitable<AsyncResult<SessionStartResult, Unit>>
Client::session_start(const SessionBuildArgs& args, NoteHandler on_note) {
    return run_async<SessionStartResult, Unit>(
        make_command("session_start", args), std::move(on_note));
}

boost::asio::awaitable<AsyncResult<SessionStopResult, SessionStopResult>>
Client::session_stop(const SessionStopArgs& args, NoteHandler on_note) {
    return run_async<SessionStopResult, SessionStopResult>(
        make_command("session_stop", args), std::move(on_note));
}

boost::asio::awaitable<AsyncResult<UseTheoriesResults, Unit>>
Client::use_theories(const UseTheoriesArgs& args, NoteHandler on_note) {
    return run_async<UseTheoriesResults, Unit>(
        make_command("use_theories", args), std::move(on_note));
}

// ── Generic ───────────────────────────────────────────────────────────────────

boost::asio::awaitable<SyncResult<nlohmann::json, nlohmann::json>>
Client::call_sync(std::string name, std::optional<nlohmann::json> args) {
    return run_sync<nlohmann::json, nlohmann::json>(
        Command{std::move(name), std::move(args)});
}

boost::asio::awaitable<AsyncResult<nlohmann::json, nlohmann::json>>
Client::call_async(std::string name, std::optional<nlohmann::json> args, NoteHandler on_note) {
    return run_async<nlohmann::json, nlohmann::json>(
        Command{std::move(name), std::move(args)}, std::move(on_note));
}

} // namespace isa::client
