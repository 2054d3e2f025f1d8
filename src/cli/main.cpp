#include "client/client.hpp"
#include "common/client_config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "launcher/server_launcher.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace asio = boost::asio;

namespace {

// Exit codes.
constexpr int kExitOk      = 0; // OK / FINISHED
constexpr int kExitEngine  = 1; // argument, connection, handshake or protocol error
constexpr int kExitFailure = 2; // ERROR / FAILED reported by the server

void print_line(const char* kind, const nlohmann::json& payload) {
    if (payload.is_null()) {
        fprintf(stdout, "%s\n", kind);
    } else {
        fprintf(stdout, "%s %s\n", kind, payload.dump().c_str());
    }
}

// Print a sync outcome the way the server framed it.
int report(const isa::SyncResult<nlohmann::json, nlohmann::json>& result) {
    if (const auto* ok = std::get_if<isa::OkResult<nlohmann::json>>(&result)) {
        print_line("OK", ok->value);
        return kExitOk;
    }
    print_line("ERROR", std::get<isa::ErrorResult<nlohmann::json>>(result).value);
    return kExitFailure;
}

// Print an async outcome.  FAILED prints the flattened wire object again.
int report(const isa::AsyncResult<nlohmann::json, nlohmann::json>& result) {
    return std::visit(
        [](const auto& r) -> int {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, isa::FinishedResult<nlohmann::json>>) {
                print_line("FINISHED", r.value);
                return kExitOk;
            } else if constexpr (std::is_same_v<T, isa::ErrorResult<isa::Message>>) {
                print_line("ERROR", nlohmann::json(r.value));
                return kExitFailure;
            } else {
                nlohmann::json j = r.context.value_or(nlohmann::json::object());
                j["task"]    = r.task.task;
                j["kind"]    = r.message.kind;
                j["message"] = r.message.text;
                print_line("FAILED", j);
                return kExitFailure;
            }
        },
        result);
}

asio::awaitable<int> run_command(isa::client::Client& client, const isa::ClientConfig& cfg) {
    if (!cfg.async_mode) {
        co_return report(co_await client.call_sync(cfg.command, cfg.args));
    }

    isa::client::NoteHandler on_note;
    if (cfg.show_notes) {
        on_note = [](const nlohmann::json& note) {
            fprintf(stderr, "NOTE %s\n", note.dump().c_str());
        };
    }
    co_return report(co_await client.call_async(cfg.command, cfg.args, on_note));
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    isa::ClientConfig cfg;
    try {
        cfg = isa::parse_config(argc, argv);
    } catch (const std::exception& ex) {
        fprintf(stderr, "%s\n", ex.what());
        return kExitEngine;
    }

    isa::init_default_logger(isa::parse_log_level(cfg.log_level));

    try {
        std::optional<isa::launcher::ServerProcess> server;
        if (cfg.launches_server()) {
            server.emplace(cfg.server_name);
            cfg.host     = server->info().host;
            cfg.port     = server->info().port;
            cfg.password = server->info().password;
        }

        spdlog::debug("isa-cli: {} {} on {}:{}",
            cfg.async_mode ? "async" : "sync", cfg.command, cfg.host, cfg.port);

        isa::client::Client client(cfg.host, cfg.port, cfg.password,
            isa::make_client_logger("isa-client", isa::parse_log_level(cfg.log_level)));

        asio::io_context ioc{1};
        int exit_code = kExitEngine;
        std::exception_ptr failure;

        asio::co_spawn(ioc, run_command(client, cfg),
            [&](std::exception_ptr e, int code) {
                failure   = e;
                exit_code = code;
            });
        ioc.run();

        if (failure) {
            std::rethrow_exception(failure);
        }
        return exit_code;

    } catch (const isa::ClientError& ex) {
        spdlog::error("isa-cli: {}", ex.what());
        return kExitEngine;
    } catch (const std::exception& ex) {
        spdlog::error("isa-cli: exception: {}", ex.what());
        return kExitEngine;
    }
}
