#include "NumericExtractor.hpp"

#include "ChineseNumerals.hpp"
#include "Logger.hpp"
#include "Utf8.hpp"

#include <cmath>
#include <sstream>

namespace mv {

namespace {

bool counts_as_context(char32_t cp) {
    return !utf8::is_space(cp) && !is_numeral_char(cp) &&
           cp != U'负' && cp != U'-';
}

std::string format_value(double v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// ExtractionResult
// ---------------------------------------------------------------------------

std::vector<double> ExtractionResult::values() const {
    std::vector<double> out;
    for (const auto& c : candidates) {
        if (c.disposition == CandidateDisposition::accepted) out.push_back(c.value);
    }
    return out;
}

size_t ExtractionResult::accepted_count() const {
    size_t n = 0;
    for (const auto& c : candidates) {
        if (c.disposition == CandidateDisposition::accepted) ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// NumericExtractor
// ---------------------------------------------------------------------------

NumericExtractor::NumericExtractor(const ExtractorConfig& config, const CommandMatcher& matcher)
    : config_(config), matcher_(matcher) {}

bool NumericExtractor::is_hundred_multiple(double value) const {
    if (value == 0.0 || std::floor(value) != value || config_.hundred_multiple <= 0) {
        return false;
    }
    return std::fmod(std::fabs(value), static_cast<double>(config_.hundred_multiple)) == 0.0;
}

ExtractionResult NumericExtractor::extract(const std::string& text) const {
    ExtractionResult result;

    std::vector<size_t> byte_offsets;
    const std::u32string cps = utf8::decode(text, &byte_offsets);

    // Prefix sums of context characters so each span is O(1).
    std::vector<size_t> context_before(cps.size() + 1, 0);
    for (size_t i = 0; i < cps.size(); ++i) {
        context_before[i + 1] = context_before[i] + (counts_as_context(cps[i]) ? 1 : 0);
    }
    const size_t total_context = context_before[cps.size()];

    for (const auto& span : find_numerals(cps)) {
        MeasurementCandidate c;
        c.char_begin    = span.begin;
        c.char_end      = span.end;
        c.byte_begin    = byte_offsets[span.begin];
        c.byte_end      = byte_offsets[span.end];
        c.span          = text.substr(c.byte_begin, c.byte_end - c.byte_begin);
        c.value         = span.value;
        c.left_context  = context_before[span.begin];
        c.right_context = total_context - context_before[span.end];

        const bool hundred = is_hundred_multiple(c.value);
        if (hundred && matcher_.prefix_ends_at(cps, span.begin)) {
            c.disposition = CandidateDisposition::command_numeral;
        } else if (hundred &&
                   c.left_context + c.right_context >= config_.min_context_length) {
            c.disposition = CandidateDisposition::contextual_noise;
        } else if (c.value < config_.min_value || c.value > config_.max_value) {
            c.disposition = CandidateDisposition::out_of_range;
            std::string detail = "'" + c.span + "' = " + format_value(c.value) +
                                 " outside [" + format_value(config_.min_value) + ", " +
                                 format_value(config_.max_value) + "]";
            Logger::warn(std::string(error_code_to_string(ErrorCode::value_out_of_range)) +
                         ": " + detail);
            if (error_cb_) error_cb_(ErrorCode::value_out_of_range, detail);
        } else {
            c.disposition = CandidateDisposition::accepted;
        }

        Logger::debug("Numeral '" + c.span + "' = " + format_value(c.value) +
                      " context " + std::to_string(c.left_context) + "/" +
                      std::to_string(c.right_context) + " -> " +
                      disposition_to_string(c.disposition));
        result.candidates.push_back(std::move(c));
    }
    return result;
}

std::vector<double> NumericExtractor::extract_values(const std::string& text) const {
    return extract(text).values();
}

} // namespace mv
