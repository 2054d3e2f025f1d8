#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "protocol/messages.hpp"

namespace isa::protocol {

// Parse the payload of a classified line.
//
// The wire represents an empty/unit payload as an empty string, so empty text
// is read as the literal `null`.  Anything else must be valid JSON; on failure
// a ProtocolError carries the text and the parser diagnostic.
[[nodiscard]] nlohmann::json parse_payload(std::string_view text);

// Decode a payload into T (any type with a from_json overload, Unit, or
// nlohmann::json itself).  Throws ProtocolError; never coerces.
template <typename T>
[[nodiscard]] T decode(std::string_view text) {
    nlohmann::json j = parse_payload(text);

    if constexpr (std::is_same_v<T, nlohmann::json>) {
        return j;
    } else if constexpr (std::is_same_v<T, Unit>) {
        if (!j.is_null()) {
            throw ProtocolError(std::string(text), "expected an empty payload");
        }
        return Unit{};
    } else {
        try {
            return j.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw ProtocolError(std::string(text), e.what());
        }
    }
}

} // namespace isa::protocol
