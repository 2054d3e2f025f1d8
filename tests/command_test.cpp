#include "protocol/command.hpp"
#include "protocol/schema.hpp"

#include <gtest/gtest.h>

#include <string>

namespace isa {

// ── encode_command ────────────────────────────────────────────────────────────

TEST(EncodeCommand, WithoutArgsKeepsSeparatingSpace) {
    EXPECT_EQ(protocol::encode_command("shutdown", std::nullopt), "shutdown \n");
}

TEST(EncodeCommand, AbsentArgsAreNotNull) {
    const auto line = make_command("shutdown").encode();
    EXPECT_EQ(line.find("null"), std::string::npos);
}

TEST(EncodeCommand, StringArgIsJsonQuoted) {
    EXPECT_EQ(make_command("echo", std::string("hello")).encode(), "echo \"hello\"\n");
}

TEST(EncodeCommand, ExplicitNullArgIsEncoded) {
    // Present-but-null is different from absent.
    EXPECT_EQ(protocol::encode_command("echo", nlohmann::json(nullptr)), "echo null\n");
}

TEST(EncodeCommand, ObjectArgIsCompactSingleLine) {
    nlohmann::json args = {{"task", "abc"}, {"text", "two\nlines"}};
    const auto line = make_command("cancel", args).encode();

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    // Exactly one newline: the terminator.  Embedded newlines are escaped.
    EXPECT_EQ(line.find('\n'), line.size() - 1);
    EXPECT_EQ(line.rfind("cancel ", 0), 0u);
}

TEST(EncodeCommand, NameIsNeverAltered) {
    EXPECT_EQ(make_command("Session_Build").encode(), "Session_Build \n");
}

TEST(EncodeCommand, DescribeDropsTerminator) {
    EXPECT_EQ(make_command("echo", std::string("x")).describe(), "echo \"x\"");
}

TEST(EncodeCommand, TypedArguments) {
    const auto line = make_command("cancel", CancelArgs{"task-1"}).encode();
    EXPECT_EQ(line, "cancel {\"task\":\"task-1\"}\n");
}

} // namespace isa
