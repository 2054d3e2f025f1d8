#pragma once

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (1.74) without including it
#include <boost/asio/awaitable.hpp>

#include <string_view>

namespace isa::network {

class Connection;

// Authenticate a freshly opened connection.
//
// Writes the password followed by '\n', then reads exactly one line.  The
// connection is ready for commands iff that line starts with "OK".  Any other
// line, or a transport failure while exchanging it, throws AuthenticationError
// and closes the connection.
//
// Must run exactly once per connection, before the first command.
boost::asio::awaitable<void> authenticate(Connection& connection, std::string_view password);

} // namespace isa::network
