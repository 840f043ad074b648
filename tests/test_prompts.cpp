#include <gtest/gtest.h>
#include <cli/prompts.hpp>
#include <iostream>
#include <sstream>

class PromptTest : public ::testing::Test {
protected:
    std::stringbuf input;
    std::streambuf* saved = nullptr;

    void SetUp() override {
        saved = std::cin.rdbuf(&input);
    }

    void TearDown() override {
        std::cin.rdbuf(saved);
    }
};

TEST_F(PromptTest, AnswerRead) {
    input.str("my-project\n");
    EXPECT_EQ(prompt_line("Name", "dflt"), "my-project");
}

TEST_F(PromptTest, EmptyAnswerGivesDefault) {
    input.str("\n");
    EXPECT_EQ(prompt_line("Name", "dflt"), "dflt");
    input.str("\n");
    EXPECT_TRUE(prompt_yes_no("Continue?", true));
}

TEST_F(PromptTest, ClosedInputDoesNotStickAcrossPrompts) {
    input.str("");
    EXPECT_FALSE(prompt_yes_no("Delete?"));
    EXPECT_FALSE(std::cin.fail());

    // A later prompt in the same session still reads its answer
    input.str("y\n");
    EXPECT_TRUE(prompt_yes_no("Delete?"));
}
