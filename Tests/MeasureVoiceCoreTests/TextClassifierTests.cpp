#include "Config.hpp"
#include "TextClassifier.hpp"
#include "TestSupport.hpp"

#include <fstream>

#include <gtest/gtest.h>

using namespace mv;

class TextClassifierTest : public ::testing::Test {
protected:
    AppConfig config = default_config();
    TextClassifier classifier{config.commands, config.extractor};
};

TEST_F(TextClassifierTest, NormalizeStripsPunctuationAndFillers) {
    EXPECT_EQ(classifier.normalize("嗯，二十五点三。"), "二十五点三");
    EXPECT_EQ(classifier.normalize("那个 继续！"), "继续");
    EXPECT_EQ(classifier.normalize("二 百"), "二百");
}

TEST_F(TextClassifierTest, NormalizeKeepsSpacesBetweenLatinWords) {
    EXPECT_EQ(classifier.normalize("  Price  200,  Length 50 "), "price 200 length 50");
}

TEST_F(TextClassifierTest, EmptyAndPunctuationOnlyAreNoise) {
    EXPECT_EQ(classifier.classify("").kind, TextKind::noise);
    auto c = classifier.classify("，。！");
    EXPECT_EQ(c.kind, TextKind::noise);
    EXPECT_EQ(c.reason, "empty");
}

TEST_F(TextClassifierTest, FeedbackKeywordIsNoise) {
    auto c = classifier.classify("成功提取二十五");
    EXPECT_EQ(c.kind, TextKind::noise);
    EXPECT_EQ(c.reason, "feedback");
}

TEST_F(TextClassifierTest, VocabularyCommands) {
    auto pause = classifier.classify("暂停。");
    ASSERT_EQ(pause.kind, TextKind::command);
    EXPECT_EQ(pause.command->kind, CommandKind::pause);

    auto resume = classifier.classify("嗯，继续");
    ASSERT_EQ(resume.kind, TextKind::command);
    EXPECT_EQ(resume.command->kind, CommandKind::resume);

    auto stop = classifier.classify("停止录音");
    ASSERT_EQ(stop.kind, TextKind::command);
    EXPECT_EQ(stop.command->kind, CommandKind::stop);
}

TEST_F(TextClassifierTest, SetContextCommand) {
    auto c = classifier.classify("切换到三百");
    ASSERT_EQ(c.kind, TextKind::command);
    EXPECT_EQ(c.command->kind, CommandKind::set_context);
    EXPECT_EQ(c.command->context_value, std::optional<int64_t>(300));
}

TEST_F(TextClassifierTest, InvalidContextIdIsUnknownCommand) {
    auto c = classifier.classify("切换到二十五");
    ASSERT_EQ(c.kind, TextKind::command);
    EXPECT_EQ(c.command->kind, CommandKind::unknown);
    EXPECT_EQ(c.reason, "invalid context id");
}

TEST_F(TextClassifierTest, EverythingElseIsMeasurement) {
    auto c = classifier.classify("二十五点三");
    EXPECT_EQ(c.kind, TextKind::measurement);
    EXPECT_EQ(c.text, "二十五点三");

    EXPECT_EQ(classifier.classify("继续 十二点五").kind, TextKind::measurement);
}

TEST_F(TextClassifierTest, CorrectionsApplyAfterNormalization) {
    classifier.add_correction("暂挺", "暂停");
    EXPECT_EQ(classifier.correction_count(), 1u);
    auto c = classifier.classify("暂挺");
    ASSERT_EQ(c.kind, TextKind::command);
    EXPECT_EQ(c.command->kind, CommandKind::pause);
}

TEST_F(TextClassifierTest, LoadsCorrectionFile) {
    test::TempDir dir;
    const std::string path = dir.file("corrections.txt");
    {
        std::ofstream out(path);
        out << "# spoken form = intended form\n"
            << "\n"
            << "鸡蛋 = 继续\n"
            << "no separator here\n";
    }
    ASSERT_TRUE(classifier.load_corrections(path));
    EXPECT_EQ(classifier.correction_count(), 1u);
    EXPECT_EQ(classifier.classify("鸡蛋").command->kind, CommandKind::resume);
}

TEST_F(TextClassifierTest, MissingCorrectionFileIsNotFatal) {
    EXPECT_FALSE(classifier.load_corrections("/nonexistent/corrections.txt"));
    EXPECT_EQ(classifier.correction_count(), 0u);
}
