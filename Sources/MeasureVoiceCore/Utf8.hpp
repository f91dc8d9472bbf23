#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mv {
namespace utf8 {

/// Decode UTF-8 into code points.  Malformed bytes decode to U+FFFD, one
/// per offending byte.  When `byte_offsets` is given it receives the byte
/// offset of every code point plus a final entry equal to text.size().
std::u32string decode(const std::string& text,
                      std::vector<size_t>* byte_offsets = nullptr);

std::string encode(const std::u32string& text);
std::string encode(char32_t cp);

/// Number of code points.
size_t length(const std::string& text);

bool is_cjk(char32_t cp);
bool is_space(char32_t cp);

/// ASCII and CJK/fullwidth punctuation.
bool is_punctuation(char32_t cp);

} // namespace utf8
} // namespace mv
