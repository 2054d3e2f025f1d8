#pragma once

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (1.74) without including it
#include <boost/asio/awaitable.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <utility>
#include <variant>

#include "network/connection.hpp"
#include "protocol/command.hpp"
#include "protocol/messages.hpp"
#include "protocol/payload.hpp"
#include "protocol/response.hpp"

namespace isa::client {

// Observer for the NOTE lines of an asynchronous command.  Invoked once per
// NOTE, in arrival order, before the terminal result is returned.
using NoteHandler = std::function<void(const nlohmann::json&)>;

// ── Read loops ────────────────────────────────────────────────────────────────

// Read lines until OK or ERROR.  Every other line is logged and skipped.
// Throws ConnectionError if the stream ends first.
boost::asio::awaitable<ClassifiedLine> await_reply(network::Connection& connection);

// Read lines until FINISHED or FAILED for `task`.  NOTE payloads are decoded
// and handed to `on_note` (a payload that is not JSON is handed over as a JSON
// string holding the raw text); all other lines are logged and skipped.
// Throws ConnectionError if the stream ends first.  NOTE lines never end the
// loop.
boost::asio::awaitable<ClassifiedLine> await_completion(network::Connection& connection,
                                                        const Task& task,
                                                        const NoteHandler& on_note);

// ── dispatch_sync ─────────────────────────────────────────────────────────────
//
// Send `command` on an authenticated connection and wait for its single
// terminal reply: OK decodes as R, ERROR decodes as E.
template <typename R, typename E>
boost::asio::awaitable<SyncResult<R, E>> dispatch_sync(const Command& command,
                                                       network::Connection& connection) {
    connection.logger().debug("dispatch [{}] > {}", connection.peer(), command.describe());
    co_await connection.write_line(command.encode());

    const auto reply = co_await await_reply(connection);
    if (reply.kind == ResponseKind::Ok) {
        co_return SyncResult<R, E>{OkResult<R>{protocol::decode<R>(reply.rest)}};
    }
    co_return SyncResult<R, E>{ErrorResult<E>{protocol::decode<E>(reply.rest)}};
}

// ── dispatch_async ────────────────────────────────────────────────────────────
//
//   AwaitingAcceptance --OK(Task)--> AwaitingCompletion
//   AwaitingAcceptance --ERROR-----> ErrorResult<Message>   (no task created)
//   AwaitingCompletion --NOTE------> AwaitingCompletion     (on_note)
//   AwaitingCompletion --FINISHED--> FinishedResult<T>
//   AwaitingCompletion --FAILED----> FailedOutcome<F>
//
// Unrecognized lines loop in either state.
template <typename T, typename F>
boost::asio::awaitable<AsyncResult<T, F>> dispatch_async(const Command& command,
                                                         network::Connection& connection,
                                                         const NoteHandler& on_note = {}) {
    auto accepted = co_await dispatch_sync<Task, Message>(command, connection);
    if (auto* rejected = std::get_if<ErrorResult<Message>>(&accepted)) {
        connection.logger().debug("dispatch [{}] {} rejected: {}",
            connection.peer(), command.name, rejected->value.text);
        co_return AsyncResult<T, F>{std::move(*rejected)};
    }

    const Task task = std::move(std::get<OkResult<Task>>(accepted).value);
    connection.logger().debug("dispatch [{}] {} accepted as task {}",
        connection.peer(), command.name, task.task);

    const auto done = co_await await_completion(connection, task, on_note);
    if (done.kind == ResponseKind::Finished) {
        co_return AsyncResult<T, F>{FinishedResult<T>{protocol::decode<T>(done.rest)}};
    }
    co_return AsyncResult<T, F>{protocol::decode<FailedOutcome<F>>(done.rest)};
}

} // namespace isa::client
