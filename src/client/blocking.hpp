#pragma once

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (1.74) without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <utility>

namespace isa::client {

// Run one client operation to completion on a private io_context owned by the
// calling thread, which stays blocked on socket I/O for the whole call.
// Exceptions thrown by the operation are rethrown here.
//
//   auto result = isa::client::run_blocking(client.echo("hello"));
//
// The operation must not be bound to another executor: it picks up the
// private io_context through this_coro::executor.
template <typename T>
T run_blocking(boost::asio::awaitable<T> operation) {
    boost::asio::io_context ioc{1};
    auto result = boost::asio::co_spawn(ioc, std::move(operation), boost::asio::use_future);
    ioc.run();
    return result.get();
}

} // namespace isa::client
