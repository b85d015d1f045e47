#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/shell/shell_words.hpp"

namespace {

using drift::core::shell::has_shell_metacharacters;
using drift::core::shell::normalize_whitespace;
using drift::core::shell::split_compound;
using drift::core::shell::split_words;

TEST(ShellWordsTest, SplitsOnWhitespace) {
    const auto words = split_words("  ls   -la\tsrc ");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(words.value(), (std::vector<std::string>{"ls", "-la", "src"}));
}

TEST(ShellWordsTest, HonoursQuotes) {
    const auto words = split_words(R"(echo 'a  b' "c \"d\"" e\ f)");
    ASSERT_TRUE(words.has_value());
    EXPECT_EQ(words.value(), (std::vector<std::string>{"echo", "a  b", "c \"d\"", "e f"}));
}

TEST(ShellWordsTest, EmptyQuotedWordIsKept) {
    const auto words = split_words("printf ''");
    ASSERT_TRUE(words.has_value());
    ASSERT_EQ(words->size(), 2u);
    EXPECT_EQ((*words)[1], "");
}

TEST(ShellWordsTest, UnbalancedQuoteFails) {
    EXPECT_FALSE(split_words("echo 'oops").has_value());
    EXPECT_FALSE(split_words("echo \"oops").has_value());
    EXPECT_FALSE(split_words("echo trailing\\").has_value());
}

TEST(ShellWordsTest, SplitsCompoundCommands) {
    const auto segments = split_compound("cd src && make; ls | wc -l || true & echo done");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments.value(),
              (std::vector<std::string>{"cd src", "make", "ls", "wc -l", "true", "echo done"}));
}

TEST(ShellWordsTest, RedirectionsAreNotSeparators) {
    const auto segments = split_compound("make 2>&1 >| build.log; cat &> out.txt");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments.value(),
              (std::vector<std::string>{"make 2>&1 >| build.log", "cat &> out.txt"}));
}

TEST(ShellWordsTest, QuotedSeparatorsStayInSegment) {
    const auto segments = split_compound("echo 'a; b' \"c && d\"");
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 1u);
}

TEST(ShellWordsTest, DetectsMetacharacters) {
    EXPECT_FALSE(has_shell_metacharacters("ls -la src"));
    EXPECT_FALSE(has_shell_metacharacters("echo 'a | b'"));
    EXPECT_FALSE(has_shell_metacharacters("grep \"x y\" file.txt"));
    EXPECT_TRUE(has_shell_metacharacters("ls | wc -l"));
    EXPECT_TRUE(has_shell_metacharacters("echo hi > out.txt"));
    EXPECT_TRUE(has_shell_metacharacters("rm *.log"));
    EXPECT_TRUE(has_shell_metacharacters("echo \"$HOME\""));
    EXPECT_TRUE(has_shell_metacharacters("cat ~/notes"));
    EXPECT_TRUE(has_shell_metacharacters("FOO=1 env"));
    EXPECT_TRUE(has_shell_metacharacters("echo 'unbalanced"));
}

TEST(ShellWordsTest, NormalizesWhitespace) {
    EXPECT_EQ(normalize_whitespace("  rm \t -rf\n  / "), "rm -rf /");
    EXPECT_EQ(normalize_whitespace(""), "");
}

}  // namespace
