#include "CommandMatcher.hpp"

#include "ChineseNumerals.hpp"
#include "Utf8.hpp"

#include <algorithm>
#include <cmath>

namespace mv {

std::optional<MatchMode> match_mode_from_string(const std::string& s) {
    if (s == "exact")    return MatchMode::exact;
    if (s == "contains") return MatchMode::contains;
    if (s == "fuzzy")    return MatchMode::fuzzy;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Similarity
// ---------------------------------------------------------------------------

size_t levenshtein(const std::u32string& a, const std::u32string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double similarity(const std::u32string& a, const std::u32string& b) {
    const size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein(a, b)) / static_cast<double>(longest);
}

double similarity(const std::string& a, const std::string& b) {
    return similarity(utf8::decode(a), utf8::decode(b));
}

// ---------------------------------------------------------------------------
// CommandMatcher
// ---------------------------------------------------------------------------

CommandMatcher::CommandMatcher(const CommandConfig& config)
    : mode_(match_mode_from_string(config.match_mode).value_or(MatchMode::fuzzy)),
      threshold_(config.similarity_threshold),
      min_length_(static_cast<size_t>(std::max(1, config.min_match_length))) {
    for (const auto& [kind, phrases] : config.vocabulary) {
        for (const auto& phrase : phrases) {
            std::u32string cps = utf8::decode(phrase);
            if (cps.size() < min_length_) continue;
            entries_.push_back(Entry{kind, phrase, std::move(cps)});
        }
    }
    std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        return a.cps.size() > b.cps.size();
    });

    for (const auto& p : config.context_prefixes) {
        if (!p.empty()) prefixes_.push_back(utf8::decode(p));
    }
    std::stable_sort(prefixes_.begin(), prefixes_.end(),
                     [](const std::u32string& a, const std::u32string& b) {
                         return a.size() > b.size();
                     });
}

std::optional<CommandMatch> CommandMatcher::match(const std::string& text) const {
    const std::u32string cps = utf8::decode(text);
    if (cps.size() < min_length_) return std::nullopt;

    for (const auto& e : entries_) {
        if (e.cps == cps) return CommandMatch{e.kind, e.phrase, 1.0};
    }
    if (mode_ == MatchMode::exact) return std::nullopt;

    for (const auto& e : entries_) {
        size_t pos = cps.find(e.cps);
        if (pos == std::u32string::npos) continue;
        std::u32string rest = cps.substr(0, pos) + cps.substr(pos + e.cps.size());
        if (find_numerals(rest).empty()) {
            return CommandMatch{e.kind, e.phrase, 1.0};
        }
    }
    if (mode_ == MatchMode::contains) return std::nullopt;

    if (!find_numerals(cps).empty()) return std::nullopt;

    const Entry* best = nullptr;
    double best_score = 0.0;
    for (const auto& e : entries_) {
        double s = similarity(cps, e.cps);
        if (s >= threshold_ && s > best_score) {
            best = &e;
            best_score = s;
        }
    }
    if (!best) return std::nullopt;
    return CommandMatch{best->kind, best->phrase, best_score};
}

std::optional<ContextPrefixMatch> CommandMatcher::match_context(const std::string& text,
                                                                int64_t hundred_multiple) const {
    const std::u32string cps = utf8::decode(text);
    const std::vector<NumeralSpan> numerals = find_numerals(cps);

    for (const auto& span : numerals) {
        if (!prefix_ends_at(cps, span.begin)) continue;

        // Longest prefix that ends at the numeral, for reporting.
        size_t end = span.begin;
        while (end > 0 && utf8::is_space(cps[end - 1])) --end;
        ContextPrefixMatch m;
        for (const auto& p : prefixes_) {
            if (p.size() <= end && cps.compare(end - p.size(), p.size(), p) == 0) {
                m.prefix = utf8::encode(p);
                break;
            }
        }
        m.numeral_begin = span.begin;
        m.numeral_end   = span.end;
        m.spoken_value  = span.value;

        const double v = span.value;
        if (v > 0.0 && std::floor(v) == v && hundred_multiple > 0 &&
            std::fmod(v, static_cast<double>(hundred_multiple)) == 0.0) {
            m.context_value = static_cast<int64_t>(v);
        }
        return m;
    }
    return std::nullopt;
}

bool CommandMatcher::prefix_ends_at(const std::u32string& text, size_t pos) const {
    size_t end = std::min(pos, text.size());
    while (end > 0 && utf8::is_space(text[end - 1])) --end;

    for (const auto& p : prefixes_) {
        if (p.size() <= end && text.compare(end - p.size(), p.size(), p) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace mv
