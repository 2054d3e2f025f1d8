#include "launcher/server_launcher.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace isa::launcher {

namespace {

// Pipe whose ends are closed in any exec'd child, so a child only keeps the
// descriptors that spawn() dup2()s onto its stdout/stderr.
void make_pipe(int fds[2]) {
    if (pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

// fork/exec `args`, optionally connecting the child's stdout/stderr to the
// given descriptors and running it in `cwd`.
pid_t spawn(const std::vector<std::string>& args,
            int stdout_fd,
            int stderr_fd = -1,
            const char* cwd = nullptr) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        if (stdout_fd >= 0) {
            dup2(stdout_fd, STDOUT_FILENO);
        }
        if (stderr_fd >= 0) {
            dup2(stderr_fd, STDERR_FILENO);
        }
        if (cwd != nullptr && chdir(cwd) != 0) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127); // exec failed
    }
    return pid;
}

// Read up to (not including) the first '\n'.  Returns what was read if the
// pipe closes first.
std::string read_first_line(int fd) {
    std::string line;
    char c = 0;
    for (;;) {
        const ssize_t n = ::read(fd, &c, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0 || c == '\n') {
            break;
        }
        line += c;
    }
    return line;
}

// Read both pipes until each reports end-of-file.  Both descriptors are
// closed on return.
void read_all(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            for (auto& p : fds) {
                if (p.fd >= 0) close(p.fd);
            }
            throw std::system_error(saved, std::generic_category(), "poll");
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                close(fds[i].fd);
                fds[i].fd = -1;  // ignored by poll()
                --open_count;
                continue;
            }
            sinks[i]->append(buf, static_cast<std::size_t>(n));
        }
    }
}

int wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace

// ── parse_server_banner ───────────────────────────────────────────────────────

ServerInfo parse_server_banner(std::string_view line) {
    std::string text;
    text.reserve(line.size());
    for (char c : line) {
        if (c != '\\') text += c;
    }
    while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }

    static const std::regex kBanner{
        R"re(^(?:server "([^"]*)" = )?(.*):([0-9]+) \(password "(.*)"\)$)re"};

    std::smatch m;
    if (!std::regex_search(text, m, kBanner)) {
        throw std::runtime_error(std::format("Unrecognised server banner: '{}'", text));
    }

    ServerInfo info;
    info.name     = m[1].str();
    info.host     = m[2].str();
    info.password = m[4].str();

    const std::string port = m[3].str();
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), info.port);
    if (ec != std::errc{} || ptr != port.data() + port.size() || info.port == 0) {
        throw std::runtime_error(std::format("Invalid port in server banner: '{}'", port));
    }

    return info;
}

// ── ServerProcess ─────────────────────────────────────────────────────────────

ServerProcess::ServerProcess(std::string name, std::string executable)
    : executable_(std::move(executable)) {
    int fds[2];
    make_pipe(fds);

    pid_t pid = -1;
    try {
        pid = spawn({executable_, "server", "-n", name}, fds[1]);
    } catch (...) {
        close(fds[0]);
        close(fds[1]);
        throw;
    }
    close(fds[1]);

    const std::string banner = read_first_line(fds[0]);
    close(fds[0]);

    spdlog::debug("ServerProcess [{}] banner: {}", name, banner);

    try {
        info_ = parse_server_banner(banner);
    } catch (const std::runtime_error&) {
        kill(pid, SIGTERM);
        wait_for(pid);
        throw;
    }
    if (info_.name.empty()) {
        info_.name = name;
    }

    // A server that was already running: the launched process just reported
    // it and exited.
    int status = 0;
    if (waitpid(pid, &status, WNOHANG) == pid) {
        spdlog::info("ServerProcess [{}] attached to running server at {}:{}",
            info_.name, info_.host, info_.port);
    } else {
        pid_ = pid;
        spdlog::info("ServerProcess [{}] started (pid {}) at {}:{}",
            info_.name, pid_, info_.host, info_.port);
    }
}

ServerProcess::~ServerProcess() {
    // The server outlives this handle; only reap it if it already ended.
    if (pid_ > 0) {
        int status = 0;
        waitpid(pid_, &status, WNOHANG);
    }
}

int ServerProcess::exit() {
    const pid_t stopper = spawn({executable_, "server", "-n", info_.name, "-x"}, -1);
    const int rc = wait_for(stopper);

    if (pid_ > 0) {
        int status = 0;
        if (waitpid(pid_, &status, WNOHANG) == 0) {
            spdlog::warn("ServerProcess [{}] still running after exit, killing pid {}",
                info_.name, pid_);
            kill(pid_, SIGKILL);
            wait_for(pid_);
        }
        pid_ = -1;
    }

    spdlog::info("ServerProcess [{}] exited (rc={})", info_.name, rc);
    return rc;
}

// ── batch_process ─────────────────────────────────────────────────────────────

std::vector<std::string> process_command_line(const ProcessArgs& args,
                                              const std::string& executable) {
    std::vector<std::string> argv{executable, "process"};
    if (args.logic) {
        argv.insert(argv.end(), {"-l", *args.logic});
    }
    for (const auto& theory : args.theories) {
        argv.insert(argv.end(), {"-T", theory});
    }
    for (const auto& dir : args.session_dirs) {
        argv.insert(argv.end(), {"-d", dir});
    }
    for (const auto& [key, value] : args.options) {
        argv.insert(argv.end(), {"-o", key + "=" + value});
    }
    return argv;
}

ProcessOutput batch_process(const ProcessArgs& args,
                            const std::optional<std::filesystem::path>& cwd,
                            const std::string& executable) {
    if (cwd && !std::filesystem::is_directory(*cwd)) {
        throw std::runtime_error(
            std::format("batch_process: '{}' is not a directory", cwd->string()));
    }

    const auto argv = process_command_line(args, executable);
    const std::string dir = cwd ? cwd->string() : std::string();

    int out_pipe[2];
    int err_pipe[2];
    make_pipe(out_pipe);
    try {
        make_pipe(err_pipe);
    } catch (...) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw;
    }

    pid_t pid = -1;
    try {
        pid = spawn(argv, out_pipe[1], err_pipe[1], cwd ? dir.c_str() : nullptr);
    } catch (...) {
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            close(fd);
        }
        throw;
    }
    close(out_pipe[1]);
    close(err_pipe[1]);

    spdlog::debug("batch_process: started pid {} ({} theories)", pid, args.theories.size());

    ProcessOutput output;
    try {
        read_all(out_pipe[0], err_pipe[0], output.stdout_text, output.stderr_text);
    } catch (...) {
        kill(pid, SIGKILL);
        wait_for(pid);
        throw;
    }
    output.exit_code = wait_for(pid);

    spdlog::debug("batch_process: pid {} exited (rc={})", pid, output.exit_code);
    return output;
}

} // namespace isa::launcher
