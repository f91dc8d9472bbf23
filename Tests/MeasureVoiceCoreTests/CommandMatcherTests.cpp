#include "CommandMatcher.hpp"
#include "Config.hpp"
#include "Utf8.hpp"

#include <gtest/gtest.h>

using namespace mv;

TEST(SimilarityTest, EditDistance) {
    EXPECT_EQ(levenshtein(U"kitten", U"sitting"), 3u);
    EXPECT_EQ(levenshtein(U"", U"abc"), 3u);
    EXPECT_EQ(levenshtein(U"暂停录音", U"暂挺录音"), 1u);
}

TEST(SimilarityTest, Ratio) {
    EXPECT_DOUBLE_EQ(similarity(std::string("暂停"), std::string("暂停")), 1.0);
    EXPECT_DOUBLE_EQ(similarity(std::string("暂停录音"), std::string("暂挺录音")), 0.75);
    EXPECT_DOUBLE_EQ(similarity(std::string(""), std::string("")), 1.0);
}

class CommandMatcherTest : public ::testing::Test {
protected:
    CommandConfig config = default_config().commands;
};

TEST_F(CommandMatcherTest, ExactPhrase) {
    CommandMatcher m(config);
    auto r = m.match("暂停");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, CommandKind::pause);
    EXPECT_EQ(r->score, 1.0);

    EXPECT_EQ(m.match("继续")->kind, CommandKind::resume);
    EXPECT_EQ(m.match("停止录音")->kind, CommandKind::stop);
}

TEST_F(CommandMatcherTest, ContainedPhraseWithoutNumbers) {
    CommandMatcher m(config);
    auto r = m.match("好的继续吧");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, CommandKind::resume);
}

TEST_F(CommandMatcherTest, ContainedPhraseNextToNumberIsNotACommand) {
    CommandMatcher m(config);
    EXPECT_FALSE(m.match("继续十二点五").has_value());
}

TEST_F(CommandMatcherTest, FuzzyMatchHonoursThreshold) {
    EXPECT_FALSE(CommandMatcher(config).match("暂挺录音").has_value());

    config.similarity_threshold = 0.7f;
    auto r = CommandMatcher(config).match("暂挺录音");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, CommandKind::pause);
    EXPECT_DOUBLE_EQ(r->score, 0.75);
}

TEST_F(CommandMatcherTest, ExactModeIgnoresContainment) {
    config.match_mode = "exact";
    CommandMatcher m(config);
    EXPECT_EQ(m.mode(), MatchMode::exact);
    EXPECT_TRUE(m.match("暂停").has_value());
    EXPECT_FALSE(m.match("好的暂停吧").has_value());
}

TEST_F(CommandMatcherTest, ShortTextNeverMatches) {
    config.vocabulary[CommandKind::stop].push_back("停");
    CommandMatcher m(config);
    EXPECT_FALSE(m.match("停").has_value());
}

TEST_F(CommandMatcherTest, ContextPrefixWithValidId) {
    CommandMatcher m(config);
    auto r = m.match_context("切换到二百", 100);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->prefix, "切换到");
    EXPECT_EQ(r->spoken_value, 200.0);
    ASSERT_TRUE(r->context_value.has_value());
    EXPECT_EQ(*r->context_value, 200);
}

TEST_F(CommandMatcherTest, ContextPrefixWithInvalidId) {
    CommandMatcher m(config);
    auto r = m.match_context("设置二十五", 100);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->prefix, "设置");
    EXPECT_FALSE(r->context_value.has_value());
}

TEST_F(CommandMatcherTest, PrefixWithoutNumeralIsNotContext) {
    CommandMatcher m(config);
    EXPECT_FALSE(m.match_context("切换模式", 100).has_value());
    EXPECT_FALSE(m.match_context("二百", 100).has_value());
}

TEST_F(CommandMatcherTest, PrefixEndsAtSkipsSpaces) {
    CommandMatcher m(config);
    const std::u32string text = utf8::decode("序号 300");
    EXPECT_TRUE(m.prefix_ends_at(text, 3));
    EXPECT_FALSE(m.prefix_ends_at(text, 1));
}
