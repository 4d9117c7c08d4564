#include <gtest/gtest.h>
#include <bridge/command_line.hpp>

TEST(CommandLine, PlainArgumentUnchanged) {
    EXPECT_EQ(quote_argument("contacts"), "contacts");
    EXPECT_EQ(quote_argument("a1b2c3"), "a1b2c3");
}

TEST(CommandLine, WhitespaceIsDoubleQuoted) {
    EXPECT_EQ(quote_argument("hello world"), "\"hello world\"");
    EXPECT_EQ(quote_argument("tab\there"), "\"tab\there\"");
}

TEST(CommandLine, EmbeddedDoubleQuoteEscaped) {
    EXPECT_EQ(quote_argument("say \"hi\""), "\"say \\\"hi\\\"\"");
}

TEST(CommandLine, SingleQuoteNeverUsedForWrapping) {
    // Apostrophes must survive: wrapped in double quotes, kept literally
    EXPECT_EQ(quote_argument("don't"), "\"don't\"");
}

TEST(CommandLine, EmptyArgumentSentAsEmptyQuotes) {
    EXPECT_EQ(quote_argument(""), "\"\"");
}

TEST(CommandLine, BuildJoinsWithSpaces) {
    auto r = build_command_line({"msg", "Alice Smith", "it's \"fine\""});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "msg \"Alice Smith\" \"it's \\\"fine\\\"\"");
}

TEST(CommandLine, BuildRejectsEmptyList) {
    auto r = build_command_line({});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "empty command");
}

TEST(CommandLine, BuildRejectsNewlineInArgument) {
    auto r = build_command_line({"msg", "bob", "two\nlines"});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("argument 2"), std::string::npos);
}

TEST(CommandLine, ValidateText) {
    EXPECT_TRUE(validate_command_text("infos").is_ok());
    EXPECT_TRUE(validate_command_text("").is_err());
    EXPECT_TRUE(validate_command_text("a\rb").is_err());
    EXPECT_TRUE(validate_command_text(std::string("a\0b", 3)).is_err());
}
