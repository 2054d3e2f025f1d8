#include "protocol/command.hpp"

namespace isa {

std::string Command::encode() const {
    return protocol::encode_command(name, args);
}

std::string Command::describe() const {
    std::string line = encode();
    line.pop_back();
    return line;
}

Command make_command(std::string name) {
    return Command{std::move(name), std::nullopt};
}

namespace protocol {

std::string encode_command(std::string_view name,
                           const std::optional<nlohmann::json>& args) {
    std::string line(name);
    line += ' ';
    if (args) {
        // Compact form: the JSON text must not contain a raw newline.
        line += args->dump();
    }
    line += '\n';
    return line;
}

} // namespace protocol
} // namespace isa
