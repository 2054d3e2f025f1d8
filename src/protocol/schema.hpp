#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocol/messages.hpp"

namespace isa {

// ── Command arguments ─────────────────────────────────────────────────────────
//
// Optional fields are left out of the encoded JSON when absent, so the server
// applies its own defaults.

// Arguments for `cancel`.
struct CancelArgs {
    std::string task;   // id of the task to cancel
};

// Arguments for `session_build` and `session_start`.
struct SessionBuildArgs {
    std::string                             session;          // target session name
    std::optional<std::string>              preferences;      // system options environment
    std::optional<std::vector<std::string>> options;          // "name=value" or "name"
    std::optional<std::vector<std::string>> dirs;             // extra ROOT/ROOTS dirs
    std::vector<std::string>                include_sessions; // omitted when empty

    [[nodiscard]] static SessionBuildArgs for_session(std::string session);
};

// Arguments for `session_stop`.
struct SessionStopArgs {
    std::string session_id;
};

// Arguments for `use_theories`.
struct UseTheoriesArgs {
    std::string                session_id;
    std::vector<std::string>   theories;
    std::optional<std::string> master_dir;
    std::optional<bool>        unicode_symbols;
    std::optional<std::string> export_pattern;
    std::optional<double>      check_delay;
    std::optional<uint64_t>    check_limit;
    std::optional<double>      watchdog_timeout;
    std::optional<double>      nodes_status_delay;

    [[nodiscard]] static UseTheoriesArgs for_session(std::string session_id,
                                                     std::vector<std::string> theories);
};

// Arguments for `purge_theories`.
struct PurgeTheoriesArgs {
    std::string                session_id;
    std::vector<std::string>   theories;
    std::optional<std::string> master_dir;
    std::optional<bool>        all;

    [[nodiscard]] static PurgeTheoriesArgs for_session(std::string session_id,
                                                       std::vector<std::string> theories);
};

void to_json(nlohmann::json& j, const CancelArgs& a);
void to_json(nlohmann::json& j, const SessionBuildArgs& a);
void to_json(nlohmann::json& j, const SessionStopArgs& a);
void to_json(nlohmann::json& j, const UseTheoriesArgs& a);
void to_json(nlohmann::json& j, const PurgeTheoriesArgs& a);

// ── Results ───────────────────────────────────────────────────────────────────

struct Timing {
    double elapsed = 0.0;
    double cpu     = 0.0;
    double gc      = 0.0;
};

// Per-session entry of a `session_build` result.
struct SessionBuildResult {
    std::string session;
    bool        ok          = false;
    int64_t     return_code = 0;     // zero iff ok
    bool        timeout     = false; // build aborted after running too long
    Timing      timing;
};

// `session_build` result (also the FAILED context).
struct SessionBuildResults {
    bool                            ok          = false;
    int64_t                         return_code = 0;
    std::vector<SessionBuildResult> sessions;
};

// `session_start` result.
struct SessionStartResult {
    std::string                task;
    std::string                session_id;
    std::optional<std::string> tmp_dir;  // default master_dir of the session
};

// `session_stop` result (also the FAILED context).
struct SessionStopResult {
    std::string task;
    bool        ok          = false;
    int64_t     return_code = 0;
};

struct Node {
    std::string node_name;
    std::string theory_name;
};

struct NodeStatus {
    bool     ok           = false;
    uint64_t total        = 0;
    uint64_t unprocessed  = 0;
    uint64_t running      = 0;
    uint64_t warned       = 0;
    uint64_t failed       = 0;
    bool     canceled     = false;
    bool     consolidated = false;
    uint64_t percentage   = 0;
};

struct Export {
    std::string name;
    bool        base64 = false;
    std::string body;
};

// Per-theory entry of a `use_theories` result.  The node fields are flattened
// into the entry on the wire.
struct NodeResults {
    Node                 node;
    NodeStatus           status;
    std::vector<Message> messages;
    std::vector<Export>  exports;
};

// `use_theories` result.
struct UseTheoriesResults {
    std::string              task;
    bool                     ok = false;
    std::vector<Message>     errors;
    std::vector<NodeResults> nodes;
};

// `purge_theories` result.  The documented shape is {purged: [String]}; servers
// actually answer with node records in two lists.
struct PurgeTheoriesResults {
    std::vector<Node> purged;
    std::vector<Node> retained;
};

// Progress NOTE emitted while theories are loaded.
struct TheoryProgress {
    std::string             kind;      // "writeln"
    std::string             message;
    std::string             session;
    std::optional<uint64_t> percentage;
};

void from_json(const nlohmann::json& j, Timing& t);
void from_json(const nlohmann::json& j, SessionBuildResult& r);
void from_json(const nlohmann::json& j, SessionBuildResults& r);
void from_json(const nlohmann::json& j, SessionStartResult& r);
void from_json(const nlohmann::json& j, SessionStopResult& r);
void from_json(const nlohmann::json& j, Node& n);
void from_json(const nlohmann::json& j, NodeStatus& s);
void from_json(const nlohmann::json& j, Export& e);
void from_json(const nlohmann::json& j, NodeResults& r);
void from_json(const nlohmann::json& j, UseTheoriesResults& r);
void from_json(const nlohmann::json& j, PurgeTheoriesResults& r);
void from_json(const nlohmann::json& j, TheoryProgress& p);

void to_json(nlohmann::json& j, const Node& n);

} // namespace isa
