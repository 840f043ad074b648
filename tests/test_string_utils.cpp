#include <gtest/gtest.h>
#include <util/string_utils.hpp>

using StringUtils::split_args;

TEST(StringUtils, SplitArgsOnWhitespace) {
    std::vector<std::string> words;
    ASSERT_TRUE(split_args("  make  app   -l ../src ", words));
    EXPECT_EQ(words, (std::vector<std::string>{"make", "app", "-l", "../src"}));
}

TEST(StringUtils, SplitArgsQuotes) {
    std::vector<std::string> words;
    ASSERT_TRUE(split_args("describe app \"A small 'demo'\" 'it''s'", words));
    EXPECT_EQ(words, (std::vector<std::string>{"describe", "app", "A small 'demo'", "its"}));
}

TEST(StringUtils, SplitArgsEscapes) {
    std::vector<std::string> words;
    ASSERT_TRUE(split_args("make -i \\*.log my\\ app", words));
    EXPECT_EQ(words, (std::vector<std::string>{"make", "-i", "*.log", "my app"}));
}

TEST(StringUtils, SplitArgsUnterminatedQuote) {
    std::vector<std::string> words;
    EXPECT_FALSE(split_args("describe app \"oops", words));
}

TEST(StringUtils, SplitArgsEmptyQuotedWord) {
    std::vector<std::string> words;
    ASSERT_TRUE(split_args("describe app ''", words));
    EXPECT_EQ(words, (std::vector<std::string>{"describe", "app", ""}));
}

TEST(StringUtils, JoinAndSplit) {
    EXPECT_EQ(StringUtils::join({"a", "b", "c"}, 1), "b c");
    EXPECT_EQ(StringUtils::join({}), "");
    EXPECT_EQ(StringUtils::split("a,b,,c", ','), (std::vector<std::string>{"a", "b", "", "c"}));
}
