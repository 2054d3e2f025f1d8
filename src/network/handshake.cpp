#include "network/handshake.hpp"

#include "common/errors.hpp"
#include "network/connection.hpp"

#include <string>

namespace isa::network {

boost::asio::awaitable<void> authenticate(Connection& connection, std::string_view password) {
    auto& log = connection.logger();

    std::string reply;
    try {
        co_await connection.write_line(std::string(password) + "\n");
        reply = co_await connection.read_line();
    } catch (const ConnectionError& e) {
        connection.close();
        throw AuthenticationError(e.what());
    }

    log.trace("Handshake [{}] reply: '{}'", connection.peer(), reply);

    if (!reply.starts_with("OK")) {
        connection.close();
        throw AuthenticationError(
            reply.empty() ? std::string("empty reply") : "server replied '" + reply + "'");
    }

    log.debug("Handshake [{}] ok", connection.peer());
}

} // namespace isa::network
