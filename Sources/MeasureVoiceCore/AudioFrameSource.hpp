#pragma once

#include "Config.hpp"
#include "Errors.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mv {

/// Captures from a microphone through FFmpeg's libavdevice and delivers
/// fixed-size frames of mono float32 PCM.
///
/// The device is named by an input format ("alsa", "pulse", "avfoundation")
/// and a device string ("default", "hw:1", ":0").  Whatever sample format
/// and rate the device produces is converted with libswresample to
/// AudioConfig::sample_rate and cut into AudioConfig::hop_size frames.
///
/// Capture runs on its own thread.  The frame callback is invoked on that
/// thread and must not block.
///
/// A read error is a glitch.  After `max_read_failures` consecutive errors,
/// or at end of stream, the device is closed and reopened with the same
/// retry and backoff as start().  Once those attempts are spent capture
/// ends and DeviceUnavailable is reported through the error callback.
class AudioFrameSource {
public:
    explicit AudioFrameSource(const AudioConfig& config);
    ~AudioFrameSource();

    // Non-copyable.
    AudioFrameSource(const AudioFrameSource&) = delete;
    AudioFrameSource& operator=(const AudioFrameSource&) = delete;

    /// Open the device and start the capture thread.
    ///
    /// Opening is retried `open_retries` times with exponential backoff.
    /// Throws DeviceUnavailable once every attempt has failed.  Returns false
    /// without side effects if capture is already running.
    bool start(FrameCallback frame_cb);

    /// Stop capture, join the thread and release the device.  Safe to call
    /// repeatedly.  Sequence numbers continue if the source is restarted.
    void stop();

    bool is_running() const;

    /// Receives DeviceReadGlitch and DeviceUnavailable reports from the
    /// capture thread.  The callback may call stop().
    void set_error_callback(ErrorCallback cb);

    uint64_t glitch_count() const   { return glitches_.load(); }
    uint64_t frames_emitted() const { return emitted_.load(); }

    /// RMS of the most recent frame, clamped to [0, 1].
    float input_level() const { return level_.load(); }

private:
    /// One attempt at opening the device and preparing decoder + resampler.
    bool open_device(std::string& error);
    void close_device();

    /// Close and reopen after the device went away mid-session.
    bool reacquire_device(std::string& error);

    void capture_loop();

    /// Push converted samples into the hop buffer and emit whole frames.
    void emit_samples(const float* samples, size_t count);

    void report_glitch(const std::string& detail);
    void report_device_lost(const std::string& detail);

    static int interrupt_cb(void* opaque);

    AudioConfig             config_;

    std::atomic<bool>       running_{false};
    std::atomic<bool>       closing_{false};   // aborts blocking FFmpeg reads
    std::thread             capture_thread_;
    mutable std::mutex      mu_;

    FrameCallback           frame_cb_;
    ErrorCallback           error_cb_;

    std::vector<float>      pending_;
    uint64_t                next_sequence_ = 0;

    std::atomic<uint64_t>   glitches_{0};
    std::atomic<uint64_t>   emitted_{0};
    std::atomic<float>      level_{0.0f};

    // FFmpeg opaque handles, typed as void* to keep FFmpeg headers out of
    // the public interface.
    void*   fmt_ctx_    = nullptr;   // AVFormatContext*
    void*   codec_ctx_  = nullptr;   // AVCodecContext*  (device PCM decoder)
    void*   swr_ctx_    = nullptr;   // SwrContext*
    int     stream_idx_ = -1;
};

} // namespace mv
