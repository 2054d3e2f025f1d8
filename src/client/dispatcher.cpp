#include "client/dispatcher.hpp"

#include "common/errors.hpp"

#include <string>

namespace isa::client {

namespace {

// NOTE payloads are informational; text that is not JSON reaches the observer
// as a JSON string.
nlohmann::json note_payload(const std::string& text) {
    try {
        return protocol::parse_payload(text);
    } catch (const ProtocolError&) {
        return nlohmann::json(text);
    }
}

} // namespace

boost::asio::awaitable<ClassifiedLine> await_reply(network::Connection& connection) {
    auto& log = connection.logger();

    for (;;) {
        const std::string line = co_await connection.read_line();
        auto classified = protocol::classify(line);

        switch (classified.kind) {
            case ResponseKind::Ok:
            case ResponseKind::Error:
                log.debug("dispatch [{}] < {} {}",
                    connection.peer(), to_string(classified.kind), classified.rest);
                co_return classified;

            case ResponseKind::Unrecognized:
                // The server occasionally emits bare diagnostic tokens.
                log.trace("dispatch [{}] skipping unrecognized line '{}'",
                    connection.peer(), classified.rest);
                break;

            default:
                log.trace("dispatch [{}] skipping {} line while awaiting reply",
                    connection.peer(), to_string(classified.kind));
                break;
        }
    }
}

boost::asio::awaitable<ClassifiedLine> await_completion(network::Connection& connection,
                                                        const Task& task,
                                                        const NoteHandler& on_note) {
    auto& log = connection.logger();

    for (;;) {
        const std::string line = co_await connection.read_line();
        auto classified = protocol::classify(line);

        switch (classified.kind) {
            case ResponseKind::Finished:
            case ResponseKind::Failed:
                log.debug("dispatch [{}] task {} < {}",
                    connection.peer(), task.task, to_string(classified.kind));
                co_return classified;

            case ResponseKind::Note: {
                log.trace("dispatch [{}] task {} note: {}",
                    connection.peer(), task.task, classified.rest);
                if (on_note) {
                    on_note(note_payload(classified.rest));
                }
                break;
            }

            case ResponseKind::Unrecognized:
                log.trace("dispatch [{}] skipping unrecognized line '{}'",
                    connection.peer(), classified.rest);
                break;

            default:
                log.trace("dispatch [{}] task {} skipping stray {} line",
                    connection.peer(), task.task, to_string(classified.kind));
                break;
        }
    }
}

} // namespace isa::client
