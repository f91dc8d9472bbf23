#pragma once

#include "CommandMatcher.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mv {

struct ExtractionResult {
    std::vector<MeasurementCandidate> candidates;   // every numeral, in order

    /// Values of the accepted candidates, in order.
    std::vector<double> values() const;
    size_t accepted_count() const;
};

/// Pulls measurement values out of a sentence while refusing numbers that
/// are only incidental to it.
///
/// Every numeral is scored by how many non-numeric, non-space code points
/// stand left and right of it in the whole sentence.  Then, per numeral:
///   - a non-zero integral multiple of `hundred_multiple` right after a
///     set-context prefix is a command numeral;
///   - a non-zero integral multiple of `hundred_multiple` with at least
///     `min_context_length` of context is contextual noise;
///   - a value outside [min_value, max_value] is out of range (reported
///     as ValueOutOfRange, never clamped);
///   - everything else is accepted.
class NumericExtractor {
public:
    NumericExtractor(const ExtractorConfig& config, const CommandMatcher& matcher);

    NumericExtractor(const NumericExtractor&) = delete;
    NumericExtractor& operator=(const NumericExtractor&) = delete;

    /// Receives ValueOutOfRange reports.
    void set_error_callback(ErrorCallback cb) { error_cb_ = std::move(cb); }

    ExtractionResult extract(const std::string& text) const;

    /// Shorthand for extract(text).values().
    std::vector<double> extract_values(const std::string& text) const;

private:
    bool is_hundred_multiple(double value) const;

    ExtractorConfig         config_;
    const CommandMatcher&   matcher_;
    ErrorCallback           error_cb_;
};

} // namespace mv
