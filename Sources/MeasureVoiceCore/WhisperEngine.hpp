#pragma once

#include "AsrEngine.hpp"
#include "Config.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mv {

/// AsrEngine backed by whisper.cpp's C API.
/// Loads a ggml model once, then transcribes utterances on demand.
class WhisperEngine : public AsrEngine {
public:
    explicit WhisperEngine(const RecognitionConfig& config);
    ~WhisperEngine() override;

    // Non-copyable.
    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /// Load the model named by RecognitionConfig::model_path.
    /// Returns false if the file is missing or not a whisper model.
    bool init();

    std::optional<std::string> transcribe(const std::vector<float>& pcm,
                                          int sample_rate) override;

    bool is_ready() const override;

private:
    static constexpr int kWhisperRate = 16000;

    RecognitionConfig           config_;
    struct whisper_context*     ctx_ = nullptr;   // opaque whisper.h handle
    mutable std::mutex          mu_;
};

} // namespace mv
