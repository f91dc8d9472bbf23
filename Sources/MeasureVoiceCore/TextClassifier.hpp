#pragma once

#include "CommandMatcher.hpp"
#include "Config.hpp"
#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mv {

enum class TextKind {
    command,
    measurement,
    noise
};

inline const char* text_kind_to_string(TextKind k) {
    switch (k) {
        case TextKind::command:     return "command";
        case TextKind::measurement: return "measurement";
        case TextKind::noise:       return "noise";
    }
    return "unknown";
}

struct Classification {
    TextKind                kind = TextKind::noise;
    std::string             raw;
    std::string             text;      // normalized and corrected
    std::optional<Command>  command;   // set when kind == command
    std::string             reason;    // why noise, or which rule matched
};

/// Decides what a recognized utterance is.
///
/// Order of checks on the normalized, corrected text:
///   1. empty                                 -> noise
///   2. contains a feedback keyword           -> noise (our own TTS)
///   3. set-context prefix + numeral          -> SetContext, or Unknown when
///                                               the numeral is not a valid
///                                               context id
///   4. command vocabulary                    -> Pause / Resume / Stop
///   5. anything else                         -> measurement
class TextClassifier {
public:
    TextClassifier(const CommandConfig& commands, const ExtractorConfig& extractor);

    TextClassifier(const TextClassifier&) = delete;
    TextClassifier& operator=(const TextClassifier&) = delete;

    /// Load `wrong=correct` lines.  Blank lines and lines starting with '#'
    /// are skipped.  Returns false if the file cannot be read; previously
    /// loaded rules are kept either way.
    bool load_corrections(const std::string& path);
    void add_correction(const std::string& wrong, const std::string& correct);
    size_t correction_count() const { return corrections_.size(); }

    /// Strip punctuation and filler tokens, lower-case ASCII, collapse
    /// whitespace (dropping it entirely next to CJK characters).
    std::string normalize(const std::string& raw) const;

    /// Apply every correction rule in load order.
    std::string correct(const std::string& text) const;

    bool is_feedback(const std::string& text) const;

    Classification classify(const std::string& raw) const;

    const CommandMatcher& matcher() const { return matcher_; }

private:
    CommandConfig                                       config_;
    int64_t                                             hundred_multiple_;
    CommandMatcher                                      matcher_;
    std::vector<std::u32string>                         fillers_;   // longest first
    std::vector<std::pair<std::string, std::string>>    corrections_;
};

} // namespace mv
