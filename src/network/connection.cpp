#include "network/connection.hpp"

#include "common/errors.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

namespace isa::network {

namespace {
using tcp = boost::asio::ip::tcp;

// Error-code completion token: the coroutine resumes with `ec` set instead of
// an exception being thrown.
auto use_awaitable(boost::system::error_code& ec) {
    return boost::asio::redirect_error(boost::asio::use_awaitable, ec);
}
} // namespace

// ── Constructor / destructor ──────────────────────────────────────────────────

Connection::Connection(boost::asio::any_io_executor executor,
                       std::shared_ptr<spdlog::logger> logger)
    : socket_(std::move(executor)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

Connection::~Connection() {
    close();
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

boost::asio::awaitable<void> Connection::open(std::string host, uint16_t port) {
    peer_ = host + ":" + std::to_string(port);

    boost::system::error_code ec;

    tcp::resolver resolver(socket_.get_executor());
    auto endpoints = co_await resolver.async_resolve(
        host, std::to_string(port), use_awaitable(ec));
    if (ec) {
        logger_->warn("Connection [{}] resolve failed: {}", peer_, ec.message());
        throw ConnectionError(ConnectionErrorReason::ResolveFailed,
                              peer_ + ": " + ec.message());
    }

    co_await boost::asio::async_connect(socket_, endpoints, use_awaitable(ec));
    if (ec) {
        logger_->warn("Connection [{}] connect failed: {}", peer_, ec.message());
        throw ConnectionError(ConnectionErrorReason::ConnectFailed,
                              peer_ + ": " + ec.message());
    }

    // Lines are small and strictly request/response; disable Nagle.
    boost::system::error_code opt_ec;
    socket_.set_option(tcp::no_delay(true), opt_ec);

    logger_->debug("Connection [{}] connected", peer_);
}

void Connection::close() noexcept {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    logger_->trace("Connection [{}] closed", peer_);
}

// ── write_line ────────────────────────────────────────────────────────────────

boost::asio::awaitable<void> Connection::write_line(std::string_view line) {
    if (!socket_.is_open()) {
        throw ConnectionError(ConnectionErrorReason::Closed, peer_);
    }

    std::string data(line);
    if (data.empty() || data.back() != '\n') {
        data += '\n';
    }

    // async_write completes only once every byte has been handed to the kernel.
    boost::system::error_code ec;
    const auto written = co_await boost::asio::async_write(
        socket_, boost::asio::buffer(data), use_awaitable(ec));
    if (ec) {
        logger_->warn("Connection [{}] write error: {}", peer_, ec.message());
        close();
        throw ConnectionError(ConnectionErrorReason::WriteFailed,
                              peer_ + ": " + ec.message());
    }

    bytes_written_ += written;
}

// ── read_line ─────────────────────────────────────────────────────────────────

boost::asio::awaitable<std::string> Connection::read_line() {
    if (!socket_.is_open()) {
        throw ConnectionError(ConnectionErrorReason::Closed, peer_);
    }

    boost::system::error_code ec;
    const auto n = co_await boost::asio::async_read_until(
        socket_, boost::asio::dynamic_buffer(read_buffer_, kMaxLineBytes), '\n',
        use_awaitable(ec));

    if (ec) {
        close();
        if (ec == boost::asio::error::eof ||
            ec == boost::asio::error::connection_reset ||
            ec == boost::asio::error::operation_aborted) {
            logger_->debug("Connection [{}] closed by peer ({} unread bytes)",
                peer_, read_buffer_.size());
            throw ConnectionError(ConnectionErrorReason::Closed, peer_);
        }
        logger_->warn("Connection [{}] read error: {}", peer_, ec.message());
        throw ConnectionError(ConnectionErrorReason::ReadFailed,
                              peer_ + ": " + ec.message());
    }

    std::string line = read_buffer_.substr(0, n - 1); // strip the '\n'
    read_buffer_.erase(0, n);

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    co_return line;
}

} // namespace isa::network
