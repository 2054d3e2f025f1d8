#include "protocol/schema.hpp"

namespace isa {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

} // namespace

// ── Arguments ─────────────────────────────────────────────────────────────────

SessionBuildArgs SessionBuildArgs::for_session(std::string session) {
    SessionBuildArgs args;
    args.session = std::move(session);
    return args;
}

UseTheoriesArgs UseTheoriesArgs::for_session(std::string session_id,
                                             std::vector<std::string> theories) {
    UseTheoriesArgs args;
    args.session_id = std::move(session_id);
    args.theories   = std::move(theories);
    return args;
}

PurgeTheoriesArgs PurgeTheoriesArgs::for_session(std::string session_id,
                                                 std::vector<std::string> theories) {
    PurgeTheoriesArgs args;
    args.session_id = std::move(session_id);
    args.theories   = std::move(theories);
    return args;
}

void to_json(nlohmann::json& j, const CancelArgs& a) {
    j = nlohmann::json{{"task", a.task}};
}

void to_json(nlohmann::json& j, const SessionBuildArgs& a) {
    j = nlohmann::json{{"session", a.session}};
    put_optional(j, "preferences", a.preferences);
    put_optional(j, "options",     a.options);
    put_optional(j, "dirs",        a.dirs);
    if (!a.include_sessions.empty()) {
        j["include_sessions"] = a.include_sessions;
    }
}

void to_json(nlohmann::json& j, const SessionStopArgs& a) {
    j = nlohmann::json{{"session_id", a.session_id}};
}

void to_json(nlohmann::json& j, const UseTheoriesArgs& a) {
    j = nlohmann::json{{"session_id", a.session_id}, {"theories", a.theories}};
    put_optional(j, "master_dir",         a.master_dir);
    put_optional(j, "unicode_symbols",    a.unicode_symbols);
    put_optional(j, "export_pattern",     a.export_pattern);
    put_optional(j, "check_delay",        a.check_delay);
    put_optional(j, "check_limit",        a.check_limit);
    put_optional(j, "watchdog_timeout",   a.watchdog_timeout);
    put_optional(j, "nodes_status_delay", a.nodes_status_delay);
}

void to_json(nlohmann::json& j, const PurgeTheoriesArgs& a) {
    j = nlohmann::json{{"session_id", a.session_id}, {"theories", a.theories}};
    put_optional(j, "master_dir", a.master_dir);
    put_optional(j, "all",        a.all);
}

// ── Results ───────────────────────────────────────────────────────────────────

void from_json(const nlohmann::json& j, Timing& t) {
    j.at("elapsed").get_to(t.elapsed);
    j.at("cpu").get_to(t.cpu);
    j.at("gc").get_to(t.gc);
}

void from_json(const nlohmann::json& j, SessionBuildResult& r) {
    j.at("session").get_to(r.session);
    j.at("ok").get_to(r.ok);
    j.at("return_code").get_to(r.return_code);
    j.at("timeout").get_to(r.timeout);
    j.at("timing").get_to(r.timing);
}

void from_json(const nlohmann::json& j, SessionBuildResults& r) {
    j.at("ok").get_to(r.ok);
    j.at("return_code").get_to(r.return_code);
    j.at("sessions").get_to(r.sessions);
}

void from_json(const nlohmann::json& j, SessionStartResult& r) {
    j.at("task").get_to(r.task);
    j.at("session_id").get_to(r.session_id);
    get_optional(j, "tmp_dir", r.tmp_dir);
}

void from_json(const nlohmann::json& j, SessionStopResult& r) {
    j.at("task").get_to(r.task);
    j.at("ok").get_to(r.ok);
    j.at("return_code").get_to(r.return_code);
}

void from_json(const nlohmann::json& j, Node& n) {
    j.at("node_name").get_to(n.node_name);
    j.at("theory_name").get_to(n.theory_name);
}

void to_json(nlohmann::json& j, const Node& n) {
    j = nlohmann::json{{"node_name", n.node_name}, {"theory_name", n.theory_name}};
}

void from_json(const nlohmann::json& j, NodeStatus& s) {
    j.at("ok").get_to(s.ok);
    j.at("total").get_to(s.total);
    j.at("unprocessed").get_to(s.unprocessed);
    j.at("running").get_to(s.running);
    j.at("warned").get_to(s.warned);
    j.at("failed").get_to(s.failed);
    j.at("canceled").get_to(s.canceled);
    j.at("consolidated").get_to(s.consolidated);
    j.at("percentage").get_to(s.percentage);
}

void from_json(const nlohmann::json& j, Export& e) {
    j.at("name").get_to(e.name);
    j.at("base64").get_to(e.base64);
    j.at("body").get_to(e.body);
}

void from_json(const nlohmann::json& j, NodeResults& r) {
    j.get_to(r.node);
    j.at("status").get_to(r.status);
    j.at("messages").get_to(r.messages);
    j.at("exports").get_to(r.exports);
}

void from_json(const nlohmann::json& j, UseTheoriesResults& r) {
    j.at("task").get_to(r.task);
    j.at("ok").get_to(r.ok);
    j.at("errors").get_to(r.errors);
    j.at("nodes").get_to(r.nodes);
}

void from_json(const nlohmann::json& j, PurgeTheoriesResults& r) {
    j.at("purged").get_to(r.purged);
    j.at("retained").get_to(r.retained);
}

void from_json(const nlohmann::json& j, TheoryProgress& p) {
    j.at("kind").get_to(p.kind);
    j.at("message").get_to(p.message);
    j.at("session").get_to(p.session);
    get_optional(j, "percentage", p.percentage);
}

} // namespace isa
