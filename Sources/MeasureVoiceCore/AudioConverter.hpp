#pragma once

#include <string>
#include <vector>

namespace mv {

/// FFmpeg helpers for getting audio into the pipeline's format: mono
/// float32 PCM at a chosen rate.
///
/// decode_file() serves the offline replay path; resample() is used by the
/// ASR engine to reach 16 kHz.
class AudioConverter {
public:
    AudioConverter() = delete;

    /// Decode any audio file libavformat can open to mono float32 PCM at
    /// `target_sample_rate`.  Throws std::runtime_error on failure.
    static std::vector<float> decode_file(const std::string& input_path,
                                          int target_sample_rate = 16000);

    /// Resample mono float32 PCM with libswresample.  Returns an empty vector
    /// on failure or empty input; returns the input unchanged when the rates
    /// already match.
    static std::vector<float> resample(const std::vector<float>& input_data,
                                       int input_rate,
                                       int output_rate);
};

} // namespace mv
