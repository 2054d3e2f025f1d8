#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace isa {

// ── ClientError ───────────────────────────────────────────────────────────────
//
// Base of every engine failure: the protocol itself broke and the call has no
// outcome.  Server-reported failures of an operation are not errors; they come
// back as ErrorResult / FailedOutcome values.

class ClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── ConnectionError ───────────────────────────────────────────────────────────

enum class ConnectionErrorReason : uint8_t {
    ResolveFailed = 0,
    ConnectFailed = 1,
    WriteFailed   = 2,
    ReadFailed    = 3,
    Closed        = 4,
};

[[nodiscard]] std::string_view to_string(ConnectionErrorReason reason) noexcept;

// Socket open/write/read failure or unexpected close.  Fatal to the call.
class ConnectionError : public ClientError {
public:
    ConnectionError(ConnectionErrorReason reason, const std::string& detail);

    [[nodiscard]] ConnectionErrorReason reason() const noexcept { return reason_; }

private:
    ConnectionErrorReason reason_;
};

// ── AuthenticationError ───────────────────────────────────────────────────────

// The handshake did not produce an OK line.  The connection is unusable.
class AuthenticationError : public ClientError {
public:
    explicit AuthenticationError(const std::string& detail);
};

// ── ProtocolError ─────────────────────────────────────────────────────────────

// A classified payload could not be decoded into the expected type.
class ProtocolError : public ClientError {
public:
    ProtocolError(std::string payload, const std::string& diagnostic);

    // The raw text that failed to decode.
    [[nodiscard]] const std::string& payload() const noexcept { return payload_; }

private:
    std::string payload_;
};

} // namespace isa
