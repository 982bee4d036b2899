#include <gtest/gtest.h>
#include "oracle/response_parser.hpp"
#include "oracle/prompt_builder.hpp"

using namespace gamemind;

// ─── Subgoal parsing ───────────────────────────────────────────

TEST(ResponseParserTest, NumberedListWithBlankLine) {
    auto subgoals = parseSubgoals("1. Find trees\n2. Chop wood\n\n3. Return");
    EXPECT_EQ(subgoals, (std::vector<std::string>{"Find trees", "Chop wood", "Return"}));
}

TEST(ResponseParserTest, BulletMarkers) {
    auto subgoals = parseSubgoals("- gather stone\n* build furnace\n\xE2\x80\xA2 smelt iron\n");
    EXPECT_EQ(subgoals, (std::vector<std::string>{"gather stone", "build furnace", "smelt iron"}));
}

TEST(ResponseParserTest, MultiDigitNumbersAndIndentation) {
    auto subgoals = parseSubgoals("   10.   Drink water  \r\n\t11. Sleep in bed");
    EXPECT_EQ(subgoals, (std::vector<std::string>{"Drink water", "Sleep in bed"}));
}

TEST(ResponseParserTest, UnmarkedLinesKept) {
    auto subgoals = parseSubgoals("Here is a plan\nfind water");
    EXPECT_EQ(subgoals, (std::vector<std::string>{"Here is a plan", "find water"}));
}

TEST(ResponseParserTest, ShortFragmentsDropped) {
    auto subgoals = parseSubgoals("1. go\n2. run\n3. eat food\n-\n4.");
    EXPECT_EQ(subgoals, (std::vector<std::string>{"eat food"}));
}

TEST(ResponseParserTest, DigitsWithoutDotAreText) {
    auto subgoals = parseSubgoals("3 apples to collect");
    EXPECT_EQ(subgoals, (std::vector<std::string>{"3 apples to collect"}));
}

TEST(ResponseParserTest, TruncatedToFive) {
    auto subgoals = parseSubgoals("1. aaaa\n2. bbbb\n3. cccc\n4. dddd\n5. eeee\n6. ffff\n7. gggg");
    ASSERT_EQ(subgoals.size(), 5);
    EXPECT_EQ(subgoals.back(), "eeee");

    auto three = parseSubgoals("1. aaaa\n2. bbbb\n3. cccc\n4. dddd", 3);
    EXPECT_EQ(three.size(), 3);
}

TEST(ResponseParserTest, EmptyInput) {
    EXPECT_TRUE(parseSubgoals("").empty());
    EXPECT_TRUE(parseSubgoals("\n\n   \n").empty());
}

// ─── Task analysis heuristics ──────────────────────────────────

TEST(ResponseParserTest, ComplexityFromWordCount) {
    EXPECT_EQ(estimateComplexity("collect wood"), Complexity::SIMPLE);
    EXPECT_EQ(estimateComplexity("one two three four five six seven eight nine"),
              Complexity::SIMPLE);
    EXPECT_EQ(estimateComplexity("one two three four five six seven eight nine ten"),
              Complexity::MEDIUM);
    EXPECT_EQ(estimateComplexity(
                  "a b c d e f g h i j k l m n o p q r s t"),
              Complexity::COMPLEX);
}

TEST(ResponseParserTest, StepsCountActionWords) {
    EXPECT_EQ(estimateSteps("nothing relevant here"), 2);
    EXPECT_EQ(estimateSteps("Collect wood, then craft a table and Place it"), 3);
    EXPECT_EQ(estimateSteps("collect collect collect"), 2);
    EXPECT_EQ(estimateSteps("find, move, use, collect, craft, place, defeat"), 6);
}

TEST(ResponseParserTest, ComplexityNames) {
    EXPECT_EQ(toString(Complexity::SIMPLE), "simple");
    EXPECT_EQ(toString(Complexity::MEDIUM), "medium");
    EXPECT_EQ(toString(Complexity::COMPLEX), "complex");
}

TEST(ResponseParserTest, TrimAndLower) {
    EXPECT_EQ(trim("  \tabc \n"), "abc");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(toLower("Make WOOD_Pickaxe"), "make wood_pickaxe");
}

// ─── Prompts ───────────────────────────────────────────────────

TEST(PromptBuilderTest, RendersEverySlot) {
    EXPECT_EQ(renderTemplate("{goal}: plan for {goal}", "goal", "survive"),
              "survive: plan for survive");
    EXPECT_EQ(renderTemplate("no slot", "goal", "x"), "no slot");
    EXPECT_EQ(renderTemplate("{task}", "goal", "x"), "{task}");
}

TEST(PromptBuilderTest, SubgoalPromptAppendsState) {
    Observation state = {{"health", 7}};
    std::string prompt = buildSubgoalPrompt("Subgoals for: {goal}", "collect wood", &state);
    EXPECT_EQ(prompt, "Subgoals for: collect wood\n\nCurrent state: {\"health\":7}");

    EXPECT_EQ(buildSubgoalPrompt("Subgoals for: {goal}", "collect wood", nullptr),
              "Subgoals for: collect wood");

    Observation null_state;
    EXPECT_EQ(buildSubgoalPrompt("{goal}", "x", &null_state), "x");
}

TEST(PromptBuilderTest, TaskPrompt) {
    EXPECT_EQ(buildTaskPrompt("Analyze: {task}.", "place furnace"), "Analyze: place furnace.");
}

TEST(PromptBuilderTest, ChatPromptLabelsRoles) {
    std::vector<ChatMessage> messages = {
        {ChatRole::SYSTEM, "Be brief."},
        {ChatRole::USER, "collect wood?"},
        {ChatRole::ASSISTANT, "find trees"},
        {ChatRole::USER, "then?"}};
    EXPECT_EQ(buildChatPrompt(messages),
              "System: Be brief.\n\nUser: collect wood?\n\nAssistant: find trees\n\n"
              "User: then?\n\nAssistant: ");
    EXPECT_EQ(buildChatPrompt({}), "Assistant: ");
}
