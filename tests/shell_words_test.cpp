#include "taskrunner/util/shell_words.hpp"

#include "gtest/gtest.h"

using namespace taskrunner;

using Words = std::vector<std::string>;

TEST(ShellWordsTest, SplitsOnBlanks) {
  auto words = split_shell_words("  bash  -e\t-x ");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"bash", "-e", "-x"}));
}

TEST(ShellWordsTest, EmptyInput_NoWords) {
  auto words = split_shell_words("");
  ASSERT_TRUE(words.has_value());
  EXPECT_TRUE(words->empty());
}

TEST(ShellWordsTest, SingleQuotesAreLiteral) {
  auto words = split_shell_words(R"(bash -c 'echo "$HOME" \n')");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"bash", "-c", R"(echo "$HOME" \n)"}));
}

TEST(ShellWordsTest, DoubleQuotesHonorEscapes) {
  auto words = split_shell_words(R"(say "a \"b\" \x")");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"say", R"(a "b" \x)"}));
}

TEST(ShellWordsTest, DoubleQuotesEscapeShellSpecials) {
  // POSIX sh rules: \$ and \` lose the backslash inside double quotes
  auto words = split_shell_words(R"(echo "\$HOME \`id\`")");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"echo", "$HOME `id`"}));
}

TEST(ShellWordsTest, AdjacentQuotedPartsJoin) {
  auto words = split_shell_words(R"(--opt='a b'"c"d)");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"--opt=a bcd"}));
}

TEST(ShellWordsTest, EmptyQuotesProduceEmptyWord) {
  auto words = split_shell_words("cmd '' x");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"cmd", "", "x"}));
}

TEST(ShellWordsTest, BackslashEscapesBlank) {
  auto words = split_shell_words(R"(/opt/my\ tool run)");
  ASSERT_TRUE(words.has_value());
  EXPECT_EQ(*words, (Words{"/opt/my tool", "run"}));
}

TEST(ShellWordsTest, UnterminatedQuote_ParseError) {
  auto words = split_shell_words("bash -c 'oops");
  ASSERT_FALSE(words.has_value());
  EXPECT_EQ(words.error(), make_error_code(Error::ParseError));

  EXPECT_FALSE(split_shell_words(R"(say "hi)").has_value());
  EXPECT_FALSE(split_shell_words(R"(trailing\)").has_value());
}

TEST(ShellWordsTest, JoinQuotesOnlyWhatNeedsIt) {
  Words words{"notify", "{\"task\":\"a b\"}", "it's", ""};
  EXPECT_EQ(join_shell_words(words),
            R"(notify '{"task":"a b"}' 'it'"'"'s' '')");
}

TEST(ShellWordsTest, JoinThenSplitGivesBackWords) {
  Words words{"python3", "-u", "/srv/tasks/10 setup.py", "it's"};
  auto split = split_shell_words(join_shell_words(words));
  ASSERT_TRUE(split.has_value());
  EXPECT_EQ(*split, words);
}
