#pragma once

#include <utility> // std::exchange, used by boost/asio/awaitable.hpp (1.74) without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace isa::network {

// ── Connection ────────────────────────────────────────────────────────────────
//
// One TCP connection to the server, used for exactly one logical call.
//
//   - open() resolves and connects (co_await, Boost.Asio coroutines)
//   - write_line() writes the whole line before returning; nothing is buffered
//     in user space, so a completed write is a flushed write
//   - read_line() suspends the calling coroutine until a full '\n'-terminated
//     line is buffered, and returns it without the terminator
//
// Every failure is thrown as ConnectionError.  Reading after the peer closed
// the socket yields ConnectionErrorReason::Closed.
//
// Not thread-safe: drive it from a single coroutine.  close() may be called by
// the owner to abort a pending read (external deadline).

class Connection {
public:
    // Upper bound on a single line; protects against a runaway server.
    static constexpr std::size_t kMaxLineBytes = 64u * 1024u * 1024u; // 64 MiB

    Connection(boost::asio::any_io_executor executor,
               std::shared_ptr<spdlog::logger> logger);

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    ~Connection();

    // ── Lifecycle ─────────────────────────────────────────────────────────────

    // Resolve host and connect.  Throws ConnectionError (ResolveFailed /
    // ConnectFailed).
    boost::asio::awaitable<void> open(std::string host, uint16_t port);

    // Close the socket.  Pending operations complete with an error.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }

    // ── I/O ───────────────────────────────────────────────────────────────────

    // Write `line`, appending '\n' if it is not already terminated.
    boost::asio::awaitable<void> write_line(std::string_view line);

    // Read one line, '\n' and a trailing '\r' stripped.
    boost::asio::awaitable<std::string> read_line();

    // ── Accessors ─────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

    [[nodiscard]] spdlog::logger& logger() const noexcept { return *logger_; }

    [[nodiscard]] std::size_t bytes_written() const noexcept { return bytes_written_; }

private:
    boost::asio::ip::tcp::socket    socket_;
    std::shared_ptr<spdlog::logger> logger_;

    std::string peer_;          // "host:port", for logging
    std::string read_buffer_;   // bytes received past the last returned line
    std::size_t bytes_written_ = 0;
};

} // namespace isa::network
