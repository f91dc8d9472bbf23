#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mv {

/// A numeral located inside a sentence, in code-point offsets.
/// [begin, end) includes a leading negative marker when there is one.
struct NumeralSpan {
    size_t  begin = 0;
    size_t  end   = 0;
    double  value = 0.0;
};

/// Convert one spoken numeral to a value.
///
/// Accepts Chinese numerals with units (十 百 千 万 亿), 零 separators,
/// 两 and 幺 as digits, the spoken omission of a trailing unit (一千二 =
/// 1200, 一万五 = 15000), digit-by-digit readings (一二三 = 123), decimals
/// with 点 including a leading 点 (点八四 = 0.84), Arabic literals and
/// Arabic digits followed by a unit (3万), and a leading 负 / 负数 / '-'.
///
/// Returns std::nullopt for anything else, including malformed unit order.
std::optional<double> parse_numeral(const std::u32string& numeral);
std::optional<double> parse_numeral(const std::string& numeral_utf8);

/// Find every numeral in `text`, left to right.
///
/// A run of concatenated readings such as 一千二三百 is split into separate
/// numerals (1200 and 300).  Runs that cannot be parsed are skipped.
std::vector<NumeralSpan> find_numerals(const std::u32string& text);

/// Characters that can appear inside a numeral (digits, Chinese digits,
/// units, the decimal marks).  The negative markers are not included.
bool is_numeral_char(char32_t cp);

} // namespace mv
