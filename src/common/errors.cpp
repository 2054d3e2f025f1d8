#include "common/errors.hpp"

#include <format>

namespace isa {

std::string_view to_string(ConnectionErrorReason reason) noexcept {
    switch (reason) {
        case ConnectionErrorReason::ResolveFailed: return "resolve failed";
        case ConnectionErrorReason::ConnectFailed: return "connect failed";
        case ConnectionErrorReason::WriteFailed:   return "write failed";
        case ConnectionErrorReason::ReadFailed:    return "read failed";
        case ConnectionErrorReason::Closed:        return "connection closed";
    }
    return "unknown";
}

ConnectionError::ConnectionError(ConnectionErrorReason reason, const std::string& detail)
    : ClientError(detail.empty()
                      ? std::string(to_string(reason))
                      : std::format("{}: {}", to_string(reason), detail)),
      reason_(reason) {}

AuthenticationError::AuthenticationError(const std::string& detail)
    : ClientError(std::format("handshake failed: {}", detail)) {}

ProtocolError::ProtocolError(std::string payload, const std::string& diagnostic)
    : ClientError(std::format("cannot decode payload '{}': {}", payload, diagnostic)),
      payload_(std::move(payload)) {}

} // namespace isa
