#include "TextClassifier.hpp"

#include "Logger.hpp"
#include "Utf8.hpp"

#include <algorithm>
#include <fstream>

namespace mv {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TextClassifier::TextClassifier(const CommandConfig& commands, const ExtractorConfig& extractor)
    : config_(commands),
      hundred_multiple_(extractor.hundred_multiple),
      matcher_(commands) {
    for (const auto& f : config_.filler_tokens) {
        if (!f.empty()) fillers_.push_back(utf8::decode(f));
    }
    std::stable_sort(fillers_.begin(), fillers_.end(),
                     [](const std::u32string& a, const std::u32string& b) {
                         return a.size() > b.size();
                     });
}

// ---------------------------------------------------------------------------
// Corrections
// ---------------------------------------------------------------------------

bool TextClassifier::load_corrections(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Logger::warn("Correction dictionary " + path + " not found, continuing without it");
        return false;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string wrong   = trim(line.substr(0, eq));
        std::string correct = trim(line.substr(eq + 1));
        if (wrong.empty()) continue;
        corrections_.emplace_back(std::move(wrong), std::move(correct));
        ++loaded;
    }
    Logger::info("Loaded " + std::to_string(loaded) + " voice correction rules from " + path);
    return true;
}

void TextClassifier::add_correction(const std::string& wrong, const std::string& correct) {
    if (!wrong.empty()) corrections_.emplace_back(wrong, correct);
}

std::string TextClassifier::correct(const std::string& text) const {
    std::string out = text;
    for (const auto& [wrong, right] : corrections_) {
        replace_all(out, wrong, right);
    }
    if (out != text) {
        Logger::debug("Voice correction: '" + text + "' -> '" + out + "'");
    }
    return out;
}

// ---------------------------------------------------------------------------
// normalize
// ---------------------------------------------------------------------------

std::string TextClassifier::normalize(const std::string& raw) const {
    std::u32string in = utf8::decode(raw);

    // Punctuation becomes a space so it still separates Latin words.
    for (auto& c : in) {
        if (utf8::is_punctuation(c)) c = U' ';
        else if (c >= U'A' && c <= U'Z') c = c - U'A' + U'a';
    }

    // Fillers, longest first.
    for (const auto& f : fillers_) {
        size_t pos = 0;
        while ((pos = in.find(f, pos)) != std::u32string::npos) {
            in.replace(pos, f.size(), U" ");
            pos += 1;
        }
    }

    std::u32string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        if (!utf8::is_space(in[i])) {
            out.push_back(in[i++]);
            continue;
        }
        size_t j = i;
        while (j < in.size() && utf8::is_space(in[j])) ++j;
        // One space survives only between two non-CJK characters.
        if (!out.empty() && j < in.size() &&
            !utf8::is_cjk(out.back()) && !utf8::is_cjk(in[j])) {
            out.push_back(U' ');
        }
        i = j;
    }
    return utf8::encode(out);
}

bool TextClassifier::is_feedback(const std::string& text) const {
    for (const auto& keyword : config_.feedback_keywords) {
        if (!keyword.empty() && text.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// classify
// ---------------------------------------------------------------------------

Classification TextClassifier::classify(const std::string& raw) const {
    Classification c;
    c.raw  = raw;
    c.text = correct(normalize(raw));

    if (c.text.empty()) {
        c.reason = "empty";
        return c;
    }
    if (is_feedback(c.text)) {
        c.reason = "feedback";
        Logger::debug("Ignoring own feedback: '" + c.text + "'");
        return c;
    }

    if (auto ctx = matcher_.match_context(c.text, hundred_multiple_)) {
        c.kind = TextKind::command;
        if (ctx->context_value) {
            c.command = Command::set_context(*ctx->context_value);
            c.reason  = "context prefix";
        } else {
            c.command = Command{CommandKind::unknown, std::nullopt, ctx->prefix};
            c.reason  = "invalid context id";
            Logger::warn("Context id must be a positive multiple of " +
                         std::to_string(hundred_multiple_) + ": '" + c.text + "'");
        }
        if (c.command->phrase.empty()) c.command->phrase = ctx->prefix;
        return c;
    }

    if (auto m = matcher_.match(c.text)) {
        c.kind    = TextKind::command;
        c.command = Command{m->kind, std::nullopt, m->phrase};
        c.reason  = m->score < 1.0 ? "fuzzy vocabulary" : "vocabulary";
        return c;
    }

    c.kind   = TextKind::measurement;
    c.reason = "measurement";
    return c;
}

} // namespace mv
