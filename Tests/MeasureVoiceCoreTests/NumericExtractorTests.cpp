#include "CommandMatcher.hpp"
#include "Config.hpp"
#include "NumericExtractor.hpp"

#include <gtest/gtest.h>

using namespace mv;

class NumericExtractorTest : public ::testing::Test {
protected:
    AppConfig config = default_config();
    CommandMatcher matcher{config.commands};
    NumericExtractor extractor{config.extractor, matcher};

    using Values = std::vector<double>;
};

TEST_F(NumericExtractorTest, StandaloneNumberIsAccepted) {
    EXPECT_EQ(extractor.extract_values("200"), (Values{200.0}));
    EXPECT_EQ(extractor.extract_values("二百"), (Values{200.0}));
}

TEST_F(NumericExtractorTest, HundredMultipleInsideSentenceIsNoise) {
    EXPECT_TRUE(extractor.extract_values("吃饭二百").empty());

    auto result = extractor.extract("吃饭二百");
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].disposition, CandidateDisposition::contextual_noise);
    EXPECT_EQ(result.candidates[0].left_context, 2u);
    EXPECT_EQ(result.candidates[0].right_context, 0u);
}

TEST_F(NumericExtractorTest, OnlyNonHundredMultiplesSurviveContext) {
    EXPECT_EQ(extractor.extract_values("price 200 length 50"), (Values{50.0}));
}

TEST_F(NumericExtractorTest, OtherValuesAcceptedInAnyContext) {
    EXPECT_EQ(extractor.extract_values("温度负十度"), (Values{-10.0}));
    EXPECT_EQ(extractor.extract_values("负十度"), (Values{-10.0}));
    EXPECT_EQ(extractor.extract_values("长度二十五点三厘米"), (Values{25.3}));
}

TEST_F(NumericExtractorTest, SingleCharacterOfContextKeepsHundredMultiple) {
    EXPECT_EQ(extractor.extract_values("二百米"), (Values{200.0}));
}

TEST_F(NumericExtractorTest, ContextPrefixNumeralIsNotAMeasurement) {
    auto result = extractor.extract("切换到200");
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].disposition, CandidateDisposition::command_numeral);
    EXPECT_TRUE(result.values().empty());

    EXPECT_TRUE(extractor.extract_values("序号三百").empty());
}

TEST_F(NumericExtractorTest, ConcatenatedReadings) {
    EXPECT_EQ(extractor.extract_values("一千二三百"), (Values{1200.0, 300.0}));
}

TEST_F(NumericExtractorTest, OutOfRangeIsReportedNotClamped) {
    config.extractor.max_value = 1000.0;
    NumericExtractor bounded(config.extractor, matcher);

    std::vector<ErrorCode> reported;
    bounded.set_error_callback([&](ErrorCode code, const std::string&) {
        reported.push_back(code);
    });

    auto result = bounded.extract("五千");
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].disposition, CandidateDisposition::out_of_range);
    EXPECT_EQ(result.accepted_count(), 0u);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], ErrorCode::value_out_of_range);
}

TEST_F(NumericExtractorTest, CandidateCarriesSpan) {
    auto result = extractor.extract("长度二十五");
    ASSERT_EQ(result.candidates.size(), 1u);
    const auto& c = result.candidates[0];
    EXPECT_EQ(c.span, "二十五");
    EXPECT_EQ(c.char_begin, 2u);
    EXPECT_EQ(c.char_end, 5u);
    EXPECT_EQ(c.byte_begin, 6u);
    EXPECT_EQ(c.byte_end, 15u);
}

TEST_F(NumericExtractorTest, NoNumeralsNoCandidates) {
    EXPECT_TRUE(extractor.extract("今天天气很好").candidates.empty());
}
