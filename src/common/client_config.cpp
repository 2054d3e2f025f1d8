#include "common/client_config.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace isa {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// First line of a password file, trailing whitespace removed.
[[nodiscard]] std::string read_password_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::format("Cannot open --password-file '{}'", path));
    }
    std::string line;
    std::getline(in, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    if (line.empty()) {
        throw std::runtime_error(std::format("--password-file '{}' is empty", path));
    }
    return line;
}

// Parse a decimal port number.  Rejects signs, junk and values above 65535.
[[nodiscard]] uint16_t parse_port(std::string_view sv) {
    uint16_t value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(
            std::format("--port must be an integer in [1, 65535], got '{}'", sv));
    }
    return value;
}

[[nodiscard]] nlohmann::json parse_args(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            std::format("Command arguments are not valid JSON: {}", e.what()));
    }
}

// Validate the fully populated ClientConfig.
void validate(const ClientConfig& cfg, bool has_port, bool has_password) {
    if (cfg.command.empty()) {
        throw std::runtime_error("A command name is required");
    }
    if (cfg.command.find_first_of(" \t\r\n") != std::string::npos) {
        throw std::runtime_error(
            std::format("Command name must be a single token, got '{}'", cfg.command));
    }

    if (cfg.launches_server()) {
        if (has_port || has_password) {
            throw std::runtime_error(
                "--server cannot be combined with --port, --password or --password-file");
        }
        return;
    }

    if (!has_port) {
        throw std::runtime_error("--port is required unless --server is given");
    }
    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    if (!has_password) {
        throw std::runtime_error(
            "--password or --password-file is required unless --server is given");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("127.0.0.1"),
            "Server address")
        ("port,p",
            po::value<std::string>(),
            "Server port")
        ("password",
            po::value<std::string>(),
            "Server password")
        ("password-file",
            po::value<std::string>(),
            "Read the server password from the first line of this file")
        ("server,s",
            po::value<std::string>(),
            "Start or discover the named server instead of connecting to --host/--port")
        ("async,a",
            po::bool_switch()->default_value(false),
            "Dispatch as an asynchronous command (wait for FINISHED/FAILED)")
        ("notes,n",
            po::bool_switch()->default_value(false),
            "Print NOTE payloads of asynchronous commands to stderr")
        ("log-level,l",
            po::value<std::string>()->default_value("warn"),
            "Log level: trace|debug|info|warn|error|critical|off")
        ("command",
            po::value<std::string>(),
            "Command name")
        ("args",
            po::value<std::string>(),
            "Command arguments as JSON");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ClientConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("isa-cli options");
    add_options(desc);

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", 1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: isa-cli [options] COMMAND [JSON_ARGS]\n" << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(std::format("Argument error: {}", e.what()));
    }

    if (vm.count("password") && vm.count("password-file")) {
        throw std::runtime_error("--password and --password-file are mutually exclusive");
    }

    ClientConfig cfg;
    cfg.host       = vm["host"].as<std::string>();
    cfg.log_level  = vm["log-level"].as<std::string>();
    cfg.async_mode = vm["async"].as<bool>();
    cfg.show_notes = vm["notes"].as<bool>();

    if (vm.count("port"))     cfg.port        = parse_port(vm["port"].as<std::string>());
    if (vm.count("server"))   cfg.server_name = vm["server"].as<std::string>();
    if (vm.count("command"))  cfg.command     = vm["command"].as<std::string>();
    if (vm.count("args"))     cfg.args        = parse_args(vm["args"].as<std::string>());

    if (vm.count("password")) {
        cfg.password = vm["password"].as<std::string>();
    } else if (vm.count("password-file")) {
        cfg.password = read_password_file(vm["password-file"].as<std::string>());
    }

    validate(cfg, vm.count("port") > 0,
             vm.count("password") > 0 || vm.count("password-file") > 0);
    return cfg;
}

} // namespace isa
