#include "ChineseNumerals.hpp"
#include "Utf8.hpp"

#include <gtest/gtest.h>

using namespace mv;

namespace {

std::vector<double> values_in(const std::string& text) {
    std::vector<double> out;
    for (const auto& span : find_numerals(utf8::decode(text))) out.push_back(span.value);
    return out;
}

} // namespace

TEST(ChineseNumeralsTest, ParsesUnits) {
    EXPECT_EQ(parse_numeral(std::string("二百")), 200.0);
    EXPECT_EQ(parse_numeral(std::string("两百")), 200.0);
    EXPECT_EQ(parse_numeral(std::string("十五")), 15.0);
    EXPECT_EQ(parse_numeral(std::string("二十三")), 23.0);
    EXPECT_EQ(parse_numeral(std::string("一百零五")), 105.0);
    EXPECT_EQ(parse_numeral(std::string("三千零二十")), 3020.0);
    EXPECT_EQ(parse_numeral(std::string("十二万三千")), 123000.0);
    EXPECT_EQ(parse_numeral(std::string("一亿")), 1e8);
}

TEST(ChineseNumeralsTest, TrailingUnitMayBeOmitted) {
    EXPECT_EQ(parse_numeral(std::string("一千二")), 1200.0);
    EXPECT_EQ(parse_numeral(std::string("一百二")), 120.0);
    EXPECT_EQ(parse_numeral(std::string("一万五")), 15000.0);
}

TEST(ChineseNumeralsTest, DigitByDigitAndArabic) {
    EXPECT_EQ(parse_numeral(std::string("一二三")), 123.0);
    EXPECT_EQ(parse_numeral(std::string("二〇二四")), 2024.0);
    EXPECT_EQ(parse_numeral(std::string("200")), 200.0);
    EXPECT_EQ(parse_numeral(std::string("3万")), 30000.0);
}

TEST(ChineseNumeralsTest, Decimals) {
    EXPECT_DOUBLE_EQ(*parse_numeral(std::string("二十五点三")), 25.3);
    EXPECT_DOUBLE_EQ(*parse_numeral(std::string("点八四")), 0.84);
    EXPECT_DOUBLE_EQ(*parse_numeral(std::string("零点五")), 0.5);
    EXPECT_DOUBLE_EQ(*parse_numeral(std::string("12.75")), 12.75);
}

TEST(ChineseNumeralsTest, Negatives) {
    EXPECT_EQ(parse_numeral(std::string("负十")), -10.0);
    EXPECT_DOUBLE_EQ(*parse_numeral(std::string("负数二十五点五")), -25.5);
    EXPECT_EQ(parse_numeral(std::string("-7")), -7.0);
}

TEST(ChineseNumeralsTest, RejectsMalformed) {
    EXPECT_FALSE(parse_numeral(std::string("")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("负")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("百")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("十百")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("abc")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("一万万")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("一亿亿")).has_value());
    EXPECT_FALSE(parse_numeral(std::string("一亿二亿")).has_value());
}

TEST(ChineseNumeralsTest, FindsNumeralsInSentence) {
    EXPECT_EQ(values_in("温度二十五度"), (std::vector<double>{25.0}));
    EXPECT_EQ(values_in("price 200 length 50"), (std::vector<double>{200.0, 50.0}));
    EXPECT_EQ(values_in("负十度"), (std::vector<double>{-10.0}));
    EXPECT_TRUE(values_in("没有数字").empty());
}

TEST(ChineseNumeralsTest, SplitsConcatenatedReadings) {
    EXPECT_EQ(values_in("一千二三百"), (std::vector<double>{1200.0, 300.0}));
}

TEST(ChineseNumeralsTest, SpanCoversNegativeMarker) {
    const auto spans = find_numerals(utf8::decode("温度负十度"));
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].begin, 2u);
    EXPECT_EQ(spans[0].end, 4u);
    EXPECT_EQ(spans[0].value, -10.0);
}

TEST(ChineseNumeralsTest, NumeralCharacters) {
    EXPECT_TRUE(is_numeral_char(U'五'));
    EXPECT_TRUE(is_numeral_char(U'百'));
    EXPECT_TRUE(is_numeral_char(U'点'));
    EXPECT_TRUE(is_numeral_char(U'7'));
    EXPECT_FALSE(is_numeral_char(U'负'));
    EXPECT_FALSE(is_numeral_char(U'度'));
}
