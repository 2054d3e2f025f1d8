#include "protocol/payload.hpp"

namespace isa::protocol {

nlohmann::json parse_payload(std::string_view text) {
    if (text.empty()) {
        text = "null";
    }

    try {
        return nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(std::string(text), e.what());
    }
}

} // namespace isa::protocol
