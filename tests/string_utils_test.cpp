#include <gtest/gtest.h>

#include "sandprobe/utils/string_utils.hpp"

namespace sandprobe {
namespace {

using utils::StringUtils;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::Trim("  ok \n\t"), "ok");
    EXPECT_EQ(StringUtils::Trim(" \n "), "");
    EXPECT_EQ(StringUtils::Trim(""), "");
}

TEST(StringUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(StringUtils::ContainsIgnoreCase("Permission DENIED", "denied"));
    EXPECT_TRUE(StringUtils::ContainsIgnoreCase("HTTP/1.1 404 Not Found", "not found"));
    EXPECT_FALSE(StringUtils::ContainsIgnoreCase("all good", "blocked"));
}

TEST(StringUtilsTest, TruncateAppendsMarkerOnlyWhenShortened) {
    EXPECT_EQ(StringUtils::Truncate("abc", 3), "abc");
    EXPECT_EQ(StringUtils::Truncate("abcdef", 3), "abc...");
    EXPECT_EQ(StringUtils::Truncate(std::string(250, 'x'), 200).size(), 203u);
}

TEST(StringUtilsTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(StringUtils::ShellQuote("/etc/agentsh/config.yaml"), "'/etc/agentsh/config.yaml'");
    EXPECT_EQ(StringUtils::ShellQuote("it's"), "'it'\\''s'");
}

TEST(StringUtilsTest, SubstituteReplacesEveryPlaceholder) {
    auto text = StringUtils::Substitute("agentsh session info {session_id} && echo {session_id}",
                                        {{"session_id", "s-1"}});
    EXPECT_EQ(text, "agentsh session info s-1 && echo s-1");
    EXPECT_EQ(StringUtils::Substitute("no placeholders", {{"x", "y"}}), "no placeholders");
}

} // namespace
} // namespace sandprobe
