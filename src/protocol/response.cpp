#include "protocol/response.hpp"

namespace isa {

std::string_view to_string(ResponseKind kind) noexcept {
    switch (kind) {
        case ResponseKind::Ok:           return "OK";
        case ResponseKind::Error:        return "ERROR";
        case ResponseKind::Finished:     return "FINISHED";
        case ResponseKind::Failed:       return "FAILED";
        case ResponseKind::Note:         return "NOTE";
        case ResponseKind::Unrecognized: return "UNRECOGNIZED";
    }
    return "UNKNOWN";
}

namespace protocol {

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

ClassifiedLine classify(std::string_view line) {
    const auto trimmed = trim(line);

    for (const auto& prefix : kResponsePrefixes) {
        if (trimmed.starts_with(prefix.token)) {
            return ClassifiedLine{prefix.kind,
                                  std::string(trim(trimmed.substr(prefix.token.size())))};
        }
    }

    return ClassifiedLine{ResponseKind::Unrecognized, std::string(trimmed)};
}

} // namespace protocol
} // namespace isa
