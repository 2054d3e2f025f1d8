#include "protocol/response.hpp"

#include <gtest/gtest.h>

#include <string>

namespace isa::protocol {

// ── Recognized prefixes ───────────────────────────────────────────────────────

TEST(Classify, Ok) {
    const auto c = classify("OK \"hello\"");
    EXPECT_EQ(c.kind, ResponseKind::Ok);
    EXPECT_EQ(c.rest, "\"hello\"");
}

TEST(Classify, OkWithoutPayload) {
    const auto c = classify("OK");
    EXPECT_EQ(c.kind, ResponseKind::Ok);
    EXPECT_TRUE(c.rest.empty());
}

TEST(Classify, Error) {
    const auto c = classify("ERROR {\"kind\":\"error\",\"message\":\"bad\"}");
    EXPECT_EQ(c.kind, ResponseKind::Error);
    EXPECT_EQ(c.rest, "{\"kind\":\"error\",\"message\":\"bad\"}");
}

TEST(Classify, FinishedFailedNote) {
    EXPECT_EQ(classify("FINISHED {}").kind, ResponseKind::Finished);
    EXPECT_EQ(classify("FAILED {}").kind,   ResponseKind::Failed);
    EXPECT_EQ(classify("NOTE {}").kind,     ResponseKind::Note);
}

TEST(Classify, StripsSurroundingWhitespace) {
    const auto c = classify("  NOTE   {\"percentage\": 50}  \r");
    EXPECT_EQ(c.kind, ResponseKind::Note);
    EXPECT_EQ(c.rest, "{\"percentage\": 50}");
}

// ── Unrecognized ──────────────────────────────────────────────────────────────

TEST(Classify, BareNumberIsUnrecognized) {
    const auto c = classify("42");
    EXPECT_EQ(c.kind, ResponseKind::Unrecognized);
    EXPECT_EQ(c.rest, "42");
}

TEST(Classify, EmptyLineIsUnrecognized) {
    EXPECT_EQ(classify("").kind, ResponseKind::Unrecognized);
}

TEST(Classify, MatchingIsCaseSensitive) {
    EXPECT_EQ(classify("ok \"x\"").kind,       ResponseKind::Unrecognized);
    EXPECT_EQ(classify("Finished {}").kind,    ResponseKind::Unrecognized);
}

TEST(Classify, PrefixMustBeAtStart) {
    EXPECT_EQ(classify("x OK").kind, ResponseKind::Unrecognized);
}

// ── Table ─────────────────────────────────────────────────────────────────────

TEST(ResponsePrefixes, FixedPrecedence) {
    ASSERT_EQ(kResponsePrefixes.size(), 5u);
    EXPECT_EQ(kResponsePrefixes[0].token, "OK");
    EXPECT_EQ(kResponsePrefixes[1].token, "ERROR");
    EXPECT_EQ(kResponsePrefixes[2].token, "FINISHED");
    EXPECT_EQ(kResponsePrefixes[3].token, "FAILED");
    EXPECT_EQ(kResponsePrefixes[4].token, "NOTE");
}

TEST(ResponsePrefixes, EveryTokenClassifiesToItsKind) {
    for (const auto& prefix : kResponsePrefixes) {
        EXPECT_EQ(classify(std::string(prefix.token) + " {}").kind, prefix.kind)
            << prefix.token;
        EXPECT_EQ(to_string(prefix.kind), prefix.token);
    }
}

TEST(Trim, Whitespace) {
    EXPECT_EQ(trim("  a b \t"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

} // namespace isa::protocol
