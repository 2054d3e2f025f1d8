#include "launcher/server_launcher.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace isa::launcher {

namespace fs = std::filesystem;

// ── parse_server_banner ───────────────────────────────────────────────────────

TEST(ServerBannerTest, ParsesFullBanner) {
    const auto info = parse_server_banner(
        R"(server "isabelle" = 127.0.0.1:4711 (password "7c1b4f0e-9f31"))");

    EXPECT_EQ(info.name,     "isabelle");
    EXPECT_EQ(info.host,     "127.0.0.1");
    EXPECT_EQ(info.port,     4711u);
    EXPECT_EQ(info.password, "7c1b4f0e-9f31");
}

TEST(ServerBannerTest, ParsesBannerWithoutName) {
    const auto info = parse_server_banner(R"(localhost:9999 (password "pw"))");

    EXPECT_TRUE(info.name.empty());
    EXPECT_EQ(info.host,     "localhost");
    EXPECT_EQ(info.port,     9999u);
    EXPECT_EQ(info.password, "pw");
}

TEST(ServerBannerTest, DropsBackslashesAndTrailingCarriageReturn) {
    const auto info = parse_server_banner(
        "server \\\"test\\\" = 127.0.0.1:1234 (password \\\"abc\\\")\r");

    EXPECT_EQ(info.name,     "test");
    EXPECT_EQ(info.port,     1234u);
    EXPECT_EQ(info.password, "abc");
}

TEST(ServerBannerTest, RejectsGarbage) {
    EXPECT_THROW((void)parse_server_banner("*** Unknown Isabelle tool"), std::runtime_error);
    EXPECT_THROW((void)parse_server_banner(""), std::runtime_error);
}

TEST(ServerBannerTest, RejectsBadPort) {
    EXPECT_THROW((void)parse_server_banner(R"(127.0.0.1:0 (password "pw"))"),
                 std::runtime_error);
    EXPECT_THROW((void)parse_server_banner(R"(127.0.0.1:99999 (password "pw"))"),
                 std::runtime_error);
}

// ── Fixture ───────────────────────────────────────────────────────────────────
//
// Shell scripts standing in for the isabelle executable.

class FakeIsabelleTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& p : cleanup_) {
            std::error_code ec;
            fs::remove_all(p, ec);
        }
    }

    // Temp path unique to this process and test.
    fs::path temp_path(const std::string& stem) {
        auto p = fs::temp_directory_path() /
                 (stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(cleanup_.size()));
        cleanup_.push_back(p);
        return p;
    }

    std::string make_script(const std::string& body) {
        const auto path = temp_path("isa_fake_isabelle");
        {
            std::ofstream out(path, std::ios::trunc);
            out << "#!/bin/sh\n" << body;
        }
        fs::permissions(path, fs::perms::owner_all);
        return path.string();
    }

    // Answers `server -n NAME -x` with exit code 0 and otherwise prints
    // `banner`, then runs `after_banner`.  With `keep_running` it then lingers
    // like a fresh server, else it exits like a launcher that found a running
    // one.
    std::string make_executable(const std::string& banner, bool keep_running,
                                const std::string& after_banner = "") {
        return make_script(
            "if [ \"$4\" = \"-x\" ]; then exit 0; fi\n"
            "printf '%s\\n' '" + banner + "'\n" +
            after_banner +
            (keep_running ? "exec sleep 30\n" : "exit 0\n"));
    }

    std::vector<fs::path> cleanup_;
};

// ── ServerProcess ─────────────────────────────────────────────────────────────

using ServerProcessTest = FakeIsabelleTest;

TEST_F(ServerProcessTest, StartsServerAndStopsIt) {
    const auto exe = make_executable(
        R"(server "unit" = 127.0.0.1:4711 (password "secret"))", true);

    ServerProcess server("unit", exe);

    EXPECT_TRUE(server.owns_process());
    EXPECT_EQ(server.info().name,     "unit");
    EXPECT_EQ(server.info().host,     "127.0.0.1");
    EXPECT_EQ(server.info().port,     4711u);
    EXPECT_EQ(server.info().password, "secret");

    EXPECT_EQ(server.exit(), 0);
    EXPECT_FALSE(server.owns_process());
}

TEST_F(ServerProcessTest, FallsBackToRequestedName) {
    const auto exe = make_executable(R"(127.0.0.1:4712 (password "pw"))", true);

    ServerProcess server("fallback", exe);
    EXPECT_EQ(server.info().name, "fallback");
    EXPECT_EQ(server.exit(), 0);
}

TEST_F(ServerProcessTest, RejectsMissingBanner) {
    const auto exe = make_executable("Bad Isabelle server", false);
    EXPECT_THROW(ServerProcess("unit", exe), std::runtime_error);
}

TEST_F(ServerProcessTest, RejectsMissingExecutable) {
    EXPECT_THROW(ServerProcess("unit", "/nonexistent/isabelle"), std::runtime_error);
}

TEST_F(ServerProcessTest, ServerKeepsOnlyItsStdoutPipeEnd) {
    // The fake server lists its open descriptors once the banner is out.
    const auto listing = temp_path("isa_fd_listing");
    const auto exe = make_executable(
        R"(127.0.0.1:4713 (password "pw"))", true,
        "ls -l /proc/$$/fd > '" + listing.string() + ".tmp'\n"
        "mv '" + listing.string() + ".tmp' '" + listing.string() + "'\n");
    cleanup_.push_back(listing.string() + ".tmp");

    ServerProcess server("fds", exe);

    for (int i = 0; i < 500 && !fs::exists(listing); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(fs::exists(listing));

    std::ifstream in(listing);
    std::vector<std::string> lines;
    std::string stdout_target;
    for (std::string line; std::getline(in, line);) {
        const auto arrow = line.find(" -> ");
        if (arrow == std::string::npos) continue;
        const auto target = line.substr(arrow + 4);
        if (line.substr(0, arrow).ends_with(" 1")) stdout_target = target;
        lines.push_back(target);
    }
    ASSERT_NE(stdout_target.find("pipe:"), std::string::npos);
    EXPECT_EQ(std::count(lines.begin(), lines.end(), stdout_target), 1);

    EXPECT_EQ(server.exit(), 0);
}

// ── batch_process ─────────────────────────────────────────────────────────────

using BatchProcessTest = FakeIsabelleTest;

TEST_F(BatchProcessTest, BuildsCommandLine) {
    ProcessArgs args = ProcessArgs::load_theories({"Draft.A", "~~/src/HOL/Examples/Drinker"});
    args.session_dirs = {"thys"};
    args.logic = "HOL";
    args.options = {{"threads", "4"}, {"quick_and_dirty", "true"}};

    const auto argv = process_command_line(args, "isabelle");
    EXPECT_EQ(argv, (std::vector<std::string>{
        "isabelle", "process", "-l", "HOL",
        "-T", "Draft.A", "-T", "~~/src/HOL/Examples/Drinker",
        "-d", "thys",
        "-o", "quick_and_dirty=true", "-o", "threads=4",
    }));
}

TEST_F(BatchProcessTest, CapturesOutputAndExitCode) {
    const auto exe = make_script(
        "echo \"args: $*\"\n"
        "echo \"*** Bad theory\" >&2\n"
        "exit 3\n");

    ProcessArgs args = ProcessArgs::load_theories({"A"});
    args.session_dirs = {"d"};
    const auto out = batch_process(args, std::nullopt, exe);

    EXPECT_EQ(out.exit_code, 3);
    EXPECT_FALSE(out.success());
    EXPECT_EQ(out.stdout_text, "args: process -T A -d d\n");
    EXPECT_EQ(out.stderr_text, "*** Bad theory\n");
}

TEST_F(BatchProcessTest, DrainsBothStreamsPastPipeCapacity) {
    const auto exe = make_script(
        "i=0\n"
        "while [ $i -lt 20000 ]; do\n"
        "  echo \"out $i\"; echo \"err $i\" >&2; i=$((i+1))\n"
        "done\n");

    const auto out = batch_process(ProcessArgs{}, std::nullopt, exe);

    EXPECT_TRUE(out.success());
    EXPECT_EQ(std::count(out.stdout_text.begin(), out.stdout_text.end(), '\n'), 20000);
    EXPECT_EQ(std::count(out.stderr_text.begin(), out.stderr_text.end(), '\n'), 20000);
    EXPECT_TRUE(out.stdout_text.ends_with("out 19999\n"));
}

TEST_F(BatchProcessTest, RunsInWorkingDirectory) {
    const auto dir = temp_path("isa_batch_cwd");
    fs::create_directories(dir);
    const auto exe = make_script("pwd -P\n");

    const auto out = batch_process(ProcessArgs{}, dir, exe);

    EXPECT_TRUE(out.success());
    EXPECT_EQ(out.stdout_text, fs::canonical(dir).string() + "\n");
}

TEST_F(BatchProcessTest, RejectsMissingWorkingDirectory) {
    const auto exe = make_script("exit 0\n");
    EXPECT_THROW((void)batch_process(ProcessArgs{}, fs::path("/nonexistent/isa/dir"), exe),
                 std::runtime_error);
}

TEST_F(BatchProcessTest, MissingExecutableExitsWith127) {
    const auto out = batch_process(ProcessArgs{}, std::nullopt, "/nonexistent/isabelle");
    EXPECT_EQ(out.exit_code, 127);
    EXPECT_TRUE(out.stdout_text.empty());
}

} // namespace isa::launcher
