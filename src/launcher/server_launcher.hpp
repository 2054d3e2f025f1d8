#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace isa::launcher {

// ── ServerInfo ────────────────────────────────────────────────────────────────
// Everything the client needs to reach a running server.

struct ServerInfo {
    std::string name;
    std::string host;
    uint16_t    port = 0;
    std::string password;
};

// Parse the banner line printed by `isabelle server`:
//   server "NAME" = HOST:PORT (password "PASSWORD")
// Backslashes are dropped before matching.
// Throws std::runtime_error if the line does not have that shape.
[[nodiscard]] ServerInfo parse_server_banner(std::string_view line);

// ── ServerProcess ─────────────────────────────────────────────────────────────
//
// Starts (or discovers) a named server by running `isabelle server -n NAME` and
// reading the banner from its stdout.  If a server with that name is already
// running, the launched process prints the banner of the existing instance and
// exits; only the info is kept in that case.
//
// The server keeps running when this object is destroyed.  Call exit() to stop
// it (runs `isabelle server -n NAME -x`).

class ServerProcess {
public:
    // Launch and block until the banner line has been read.
    //   name        – server name (-n)
    //   executable  – isabelle binary, looked up in PATH
    // Throws std::system_error if the process cannot be spawned, and
    // std::runtime_error if no valid banner is printed.
    explicit ServerProcess(std::string name = "isabelle",
                           std::string executable = "isabelle");

    ServerProcess(const ServerProcess&)            = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    ~ServerProcess();

    [[nodiscard]] const ServerInfo& info() const noexcept { return info_; }

    // True if this object started the server process and it is still running.
    [[nodiscard]] bool owns_process() const noexcept { return pid_ > 0; }

    // Stop the named server and reap the launched process (killed if it is
    // still alive afterwards).  Returns the exit status of the `-x` command.
    int exit();

private:
    std::string executable_;
    ServerInfo  info_;
    pid_t       pid_ = -1;
};

// ── batch_process ─────────────────────────────────────────────────────────────
//
// Runs the raw ML process in batch mode (`isabelle process`), without a server.

struct ProcessArgs {
    std::vector<std::string>           theories;      // -T, loaded in order
    std::vector<std::string>           session_dirs;  // -d
    std::optional<std::string>         logic;         // -l (server default: HOL)
    std::map<std::string, std::string> options;       // -o key=value

    [[nodiscard]] static ProcessArgs load_theories(std::vector<std::string> theories) {
        ProcessArgs args;
        args.theories = std::move(theories);
        return args;
    }
};

struct ProcessOutput {
    int         exit_code = -1;  // -1 if terminated by a signal
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool success() const noexcept { return exit_code == 0; }
};

// Argument vector for `executable process ...`.
[[nodiscard]] std::vector<std::string> process_command_line(const ProcessArgs& args,
                                                            const std::string& executable);

// Run `executable process` with `args`, in `cwd` when given, and block until it
// exits.  Captures stdout and stderr in full.
// Throws std::runtime_error if `cwd` is not a directory, std::system_error if
// the process cannot be spawned.  A failing process is not an error: check
// ProcessOutput::exit_code (127 when the executable could not be run).
[[nodiscard]] ProcessOutput batch_process(
    const ProcessArgs& args,
    const std::optional<std::filesystem::path>& cwd = std::nullopt,
    const std::string& executable = "isabelle");

} // namespace isa::launcher
