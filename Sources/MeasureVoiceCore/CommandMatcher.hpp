#pragma once

#include "Config.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mv {

enum class MatchMode {
    exact,
    contains,
    fuzzy
};

std::optional<MatchMode> match_mode_from_string(const std::string& s);

/// Edit distance over code points.
size_t levenshtein(const std::u32string& a, const std::u32string& b);

/// 1 - distance / max(len(a), len(b)); 1.0 for two empty strings.
double similarity(const std::u32string& a, const std::u32string& b);
double similarity(const std::string& a, const std::string& b);

struct CommandMatch {
    CommandKind kind  = CommandKind::unknown;
    std::string phrase;
    double      score = 0.0;   // 1.0 for exact and containment matches
};

/// A set-context prefix found in a sentence.
struct ContextPrefixMatch {
    std::string             prefix;
    size_t                  numeral_begin = 0;   // code points
    size_t                  numeral_end   = 0;
    double                  spoken_value  = 0.0;
    std::optional<int64_t>  context_value;       // set only when valid
};

/// Matches normalized text against the command vocabulary and the
/// set-context prefixes.
///
/// Vocabulary phrases (and texts) shorter than `min_match_length` code
/// points never match.  In `contains` and `fuzzy` mode a phrase found inside
/// a longer text only counts when the rest of the text carries no numeral,
/// so "继续 十二点五" is not swallowed as Resume.
class CommandMatcher {
public:
    explicit CommandMatcher(const CommandConfig& config);

    std::optional<CommandMatch> match(const std::string& text) const;

    /// First set-context prefix that is directly followed by a numeral.
    /// `context_value` is filled when the numeral is a positive multiple of
    /// `hundred_multiple`.
    std::optional<ContextPrefixMatch> match_context(const std::string& text,
                                                    int64_t hundred_multiple) const;

    /// Whether a set-context prefix ends right before code point `pos`
    /// (spaces in between are skipped).
    bool prefix_ends_at(const std::u32string& text, size_t pos) const;

    MatchMode mode() const { return mode_; }

private:
    struct Entry {
        CommandKind     kind;
        std::string     phrase;
        std::u32string  cps;
    };

    std::vector<Entry>          entries_;    // longest phrase first
    std::vector<std::u32string> prefixes_;   // longest first
    MatchMode                   mode_;
    double                      threshold_;
    size_t                      min_length_;
};

} // namespace mv
