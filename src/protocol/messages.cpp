#include "protocol/messages.hpp"

namespace isa {

namespace {

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

} // namespace

void to_json(nlohmann::json& j, const Unit&) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json::object();
    put_optional(j, "line",       p.line);
    put_optional(j, "offset",     p.offset);
    put_optional(j, "end_offset", p.end_offset);
    put_optional(j, "file",       p.file);
    put_optional(j, "id",         p.id);
}

void from_json(const nlohmann::json& j, Position& p) {
    get_optional(j, "line",       p.line);
    get_optional(j, "offset",     p.offset);
    get_optional(j, "end_offset", p.end_offset);
    get_optional(j, "file",       p.file);
    get_optional(j, "id",         p.id);
}

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json{{"kind", m.kind}, {"message", m.text}};
    put_optional(j, "pos", m.position);
}

void from_json(const nlohmann::json& j, Message& m) {
    j.at("kind").get_to(m.kind);
    j.at("message").get_to(m.text);
    get_optional(j, "pos", m.position);
}

void to_json(nlohmann::json& j, const Task& t) {
    j = nlohmann::json{{"task", t.task}};
}

void from_json(const nlohmann::json& j, Task& t) {
    j.at("task").get_to(t.task);
}

} // namespace isa
