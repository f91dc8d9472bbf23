#include "ChineseNumerals.hpp"

#include "Utf8.hpp"

#include <cstdio>
#include <cstdlib>

namespace mv {

namespace {

constexpr size_t kMaxDigits = 15;   // keeps every integer exact in a double

int chinese_digit(char32_t cp) {
    switch (cp) {
        case U'零': case U'〇': return 0;
        case U'一': case U'幺': return 1;
        case U'二': case U'两': return 2;
        case U'三': return 3;
        case U'四': return 4;
        case U'五': return 5;
        case U'六': return 6;
        case U'七': return 7;
        case U'八': return 8;
        case U'九': return 9;
        default:    return -1;
    }
}

double unit_value(char32_t cp) {
    switch (cp) {
        case U'十': return 10.0;
        case U'百': return 100.0;
        case U'千': return 1000.0;
        case U'万': return 1e4;
        case U'亿': return 1e8;
        default:    return 0.0;
    }
}

bool is_ascii_digit(char32_t cp) { return cp >= U'0' && cp <= U'9'; }
bool is_digit(char32_t cp)       { return is_ascii_digit(cp) || chinese_digit(cp) >= 0; }
bool is_dot(char32_t cp)         { return cp == U'点' || cp == U'.'; }

bool is_nonzero_chinese_digit(char32_t cp) { return chinese_digit(cp) > 0; }

/// Digits read one by one, no units: 一二三 = 123, 二〇二四 = 2024.
bool collect_digits(const std::u32string& s, std::string& digits) {
    digits.clear();
    for (char32_t c : s) {
        if (is_ascii_digit(c)) {
            digits.push_back(static_cast<char>(c));
            continue;
        }
        int d = chinese_digit(c);
        if (d < 0) return false;
        digits.push_back(static_cast<char>('0' + d));
    }
    return !digits.empty() && digits.size() <= kMaxDigits;
}

struct Token {
    enum Kind { digit, zero, unit } kind;
    double value;
};

bool tokenize(const std::u32string& s, std::vector<Token>& out) {
    out.clear();
    size_t i = 0;
    while (i < s.size()) {
        char32_t c = s[i];
        if (is_ascii_digit(c)) {
            size_t j = i;
            double v = 0.0;
            while (j < s.size() && is_ascii_digit(s[j])) {
                if (j - i >= kMaxDigits) return false;
                v = v * 10.0 + static_cast<double>(s[j] - U'0');
                ++j;
            }
            out.push_back(Token{Token::digit, v});
            i = j;
            continue;
        }
        int d = chinese_digit(c);
        if (d == 0) {
            out.push_back(Token{Token::zero, 0.0});
        } else if (d > 0) {
            out.push_back(Token{Token::digit, static_cast<double>(d)});
        } else if (double u = unit_value(c); u > 0.0) {
            out.push_back(Token{Token::unit, u});
        } else {
            return false;
        }
        ++i;
    }
    return true;
}

std::optional<double> parse_integer(const std::u32string& s) {
    if (s.empty()) return std::nullopt;

    bool has_unit = false;
    for (char32_t c : s) {
        if (unit_value(c) > 0.0) has_unit = true;
    }

    if (!has_unit) {
        std::string digits;
        if (!collect_digits(s, digits)) return std::nullopt;
        return std::strtod(digits.c_str(), nullptr);
    }

    std::vector<Token> tokens;
    if (!tokenize(s, tokens)) return std::nullopt;

    double number     = 0.0;   // everything already scaled by 万 / 亿
    double section    = 0.0;   // current group below 万
    double prev_unit  = 0.0;   // unit right before the pending digit
    double last_small = 0.0;
    double last_big   = 0.0;
    std::optional<double> pending;

    for (const Token& t : tokens) {
        switch (t.kind) {
            case Token::digit:
                if (pending) return std::nullopt;
                pending = t.value;
                break;

            case Token::zero:
                if (pending) return std::nullopt;
                prev_unit = 0.0;
                break;

            case Token::unit:
                if (t.value < 1e4) {
                    if (last_small != 0.0 && t.value >= last_small) return std::nullopt;
                    double v;
                    if (pending)             v = *pending;
                    else if (t.value == 10.0) v = 1.0;          // 十五
                    else                     return std::nullopt;
                    section += v * t.value;
                    last_small = t.value;
                } else if (t.value == 1e4) {
                    if (last_big == 1e4) return std::nullopt;
                    double v = section + pending.value_or(0.0);
                    if (v == 0.0) return std::nullopt;
                    number += v * 1e4;
                    section    = 0.0;
                    last_small = 0.0;
                    last_big   = 1e4;
                } else {
                    if (last_big == 1e8) return std::nullopt;
                    double v = number + section + pending.value_or(0.0);
                    if (v == 0.0) return std::nullopt;
                    number     = v * 1e8;
                    section    = 0.0;
                    last_small = 0.0;
                    last_big   = 1e8;
                }
                pending.reset();
                prev_unit = t.value;
                break;
        }
    }

    if (pending) {
        // 一百二 = 120, 一万五 = 15000; after 十 or 零 the digit is a unit digit.
        section += prev_unit >= 100.0 ? *pending * (prev_unit / 10.0) : *pending;
    }
    return number + section;
}

bool starts_numeral(const std::u32string& text, size_t k) {
    if (k >= text.size()) return false;
    char32_t c = text[k];
    if (is_digit(c) || c == U'十') return true;
    return is_dot(c) && k + 1 < text.size() && is_digit(text[k + 1]);
}

size_t scan_run(const std::u32string& text, size_t k) {
    bool dot_seen = false;
    size_t j = k;
    while (j < text.size()) {
        char32_t c = text[j];
        if (is_digit(c) || (!dot_seen && unit_value(c) > 0.0)) {
            ++j;
        } else if (!dot_seen && is_dot(c) && j + 1 < text.size() && is_digit(text[j + 1])) {
            dot_seen = true;
            ++j;
        } else {
            break;
        }
    }
    return j;
}

} // namespace

// ---------------------------------------------------------------------------
// parse_numeral
// ---------------------------------------------------------------------------

std::optional<double> parse_numeral(const std::u32string& numeral) {
    size_t i = 0;
    bool negative = false;
    if (numeral.size() >= 2 && numeral[0] == U'负' && numeral[1] == U'数') {
        negative = true;
        i = 2;
    } else if (!numeral.empty() && (numeral[0] == U'负' || numeral[0] == U'-')) {
        negative = true;
        i = 1;
    }

    const std::u32string body = numeral.substr(i);
    if (body.empty()) return std::nullopt;

    size_t dot = std::u32string::npos;
    for (size_t k = 0; k < body.size(); ++k) {
        if (is_dot(body[k])) {
            dot = k;
            break;
        }
    }

    double value;
    if (dot == std::u32string::npos) {
        auto v = parse_integer(body);
        if (!v) return std::nullopt;
        value = *v;
    } else {
        const std::u32string int_part  = body.substr(0, dot);
        const std::u32string frac_part = body.substr(dot + 1);

        double int_value = 0.0;     // 点八四
        if (!int_part.empty()) {
            auto v = parse_integer(int_part);
            if (!v) return std::nullopt;
            int_value = *v;
        }

        std::string frac_digits;
        if (!collect_digits(frac_part, frac_digits)) return std::nullopt;

        // Build the literal and parse once so 25.3 is the nearest double.
        char int_buf[32];
        std::snprintf(int_buf, sizeof(int_buf), "%.0f", int_value);
        const std::string literal = std::string(int_buf) + "." + frac_digits;
        value = std::strtod(literal.c_str(), nullptr);
    }

    return negative ? -value : value;
}

std::optional<double> parse_numeral(const std::string& numeral_utf8) {
    return parse_numeral(utf8::decode(numeral_utf8));
}

// ---------------------------------------------------------------------------
// find_numerals
// ---------------------------------------------------------------------------

std::vector<NumeralSpan> find_numerals(const std::u32string& text) {
    std::vector<NumeralSpan> out;
    const size_t n = text.size();

    size_t i = 0;
    while (i < n) {
        size_t body = i;
        if (text[i] == U'负') {
            body = i + 1;
            if (body < n && text[body] == U'数') ++body;
        } else if (text[i] == U'-') {
            body = i + 1;
            if (body >= n || !is_ascii_digit(text[body])) {
                ++i;
                continue;
            }
        }
        if (!starts_numeral(text, body)) {
            ++i;
            continue;
        }

        const size_t end = scan_run(text, body);

        size_t int_end = end;
        bool has_unit = false;
        for (size_t k = body; k < end; ++k) {
            if (is_dot(text[k])) {
                int_end = k;
                break;
            }
            if (unit_value(text[k]) > 0.0) has_unit = true;
        }

        // Concatenated readings: 一千二三百 -> 一千二 | 三百.
        std::vector<size_t> cuts;
        if (has_unit) {
            for (size_t k = body + 1; k < int_end; ++k) {
                if (is_nonzero_chinese_digit(text[k]) && is_nonzero_chinese_digit(text[k - 1])) {
                    cuts.push_back(k);
                }
            }
        }
        cuts.push_back(end);

        size_t piece_begin = i;    // first piece carries the negative marker
        for (size_t cut : cuts) {
            auto value = parse_numeral(text.substr(piece_begin, cut - piece_begin));
            if (value) {
                out.push_back(NumeralSpan{piece_begin, cut, *value});
            }
            piece_begin = cut;
        }
        i = end;
    }
    return out;
}

bool is_numeral_char(char32_t cp) {
    return is_digit(cp) || unit_value(cp) > 0.0 || is_dot(cp);
}

} // namespace mv
