#include "AudioFrameSource.hpp"

#include "Logger.hpp"
#include "SpeechScorer.hpp"

#include <algorithm>
#include <chrono>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
}

namespace mv {

namespace {

std::string av_error_string(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioFrameSource::AudioFrameSource(const AudioConfig& config)
    : config_(config) {
    avdevice_register_all();
}

AudioFrameSource::~AudioFrameSource() {
    stop();
}

void AudioFrameSource::set_error_callback(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    error_cb_ = std::move(cb);
}

bool AudioFrameSource::is_running() const {
    return running_.load();
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

bool AudioFrameSource::start(FrameCallback frame_cb) {
    std::lock_guard<std::mutex> lock(mu_);

    if (running_.load() || capture_thread_.joinable()) {
        return false;
    }

    int backoff_ms = std::max(0, config_.retry_backoff_ms);
    const int attempts = 1 + std::max(0, config_.open_retries);
    std::string error;
    closing_.store(false);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (open_device(error)) {
            frame_cb_ = std::move(frame_cb);
            pending_.clear();
            running_.store(true);
            capture_thread_ = std::thread(&AudioFrameSource::capture_loop, this);
            Logger::info("Audio capture started on " + config_.input_format + ":" +
                         config_.device);
            return true;
        }
        close_device();
        Logger::warn("Opening audio device failed (attempt " + std::to_string(attempt) +
                     "/" + std::to_string(attempts) + "): " + error);
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms *= 2;
        }
    }

    throw DeviceUnavailable("audio device " + config_.input_format + ":" +
                            config_.device + " unavailable: " + error);
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

void AudioFrameSource::stop() {
    closing_.store(true);
    running_.store(false);

    // Called from the capture thread's own error callback: the loop exits
    // on return, and a later stop() from elsewhere joins it.
    if (capture_thread_.joinable() &&
        capture_thread_.get_id() != std::this_thread::get_id()) {
        capture_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (fmt_ctx_) {
        close_device();
        Logger::info("Audio capture stopped (" + std::to_string(emitted_.load()) +
                     " frames, " + std::to_string(glitches_.load()) + " glitches)");
    }
    pending_.clear();
    level_.store(0.0f);
}

// ---------------------------------------------------------------------------
// open_device / close_device
// ---------------------------------------------------------------------------

int AudioFrameSource::interrupt_cb(void* opaque) {
    auto* self = static_cast<AudioFrameSource*>(opaque);
    return self->closing_.load() ? 1 : 0;
}

bool AudioFrameSource::open_device(std::string& error) {
    const AVInputFormat* input = av_find_input_format(config_.input_format.c_str());
    if (!input) {
        error = "input format '" + config_.input_format + "' not available";
        return false;
    }

    AVDictionary* options = nullptr;
    av_dict_set(&options, "sample_rate", std::to_string(config_.sample_rate).c_str(), 0);
    av_dict_set(&options, "channels", "1", 0);

    AVFormatContext* ifmt = avformat_alloc_context();
    if (!ifmt) {
        av_dict_free(&options);
        error = "out of memory";
        return false;
    }
    ifmt->interrupt_callback.callback = &AudioFrameSource::interrupt_cb;
    ifmt->interrupt_callback.opaque   = this;

    int ret = avformat_open_input(&ifmt, config_.device.c_str(), input, &options);
    av_dict_free(&options);
    if (ret < 0) {
        // avformat_open_input frees the context on failure.
        error = av_error_string(ret);
        return false;
    }
    fmt_ctx_ = ifmt;

    ret = avformat_find_stream_info(ifmt, nullptr);
    if (ret < 0) {
        error = "no stream info: " + av_error_string(ret);
        return false;
    }

    stream_idx_ = av_find_best_stream(ifmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_idx_ < 0) {
        error = "device has no audio stream";
        return false;
    }
    AVStream* stream = ifmt->streams[stream_idx_];

    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        error = "no decoder for device sample format";
        return false;
    }
    AVCodecContext* dec = avcodec_alloc_context3(decoder);
    if (!dec) {
        error = "out of memory";
        return false;
    }
    codec_ctx_ = dec;
    avcodec_parameters_to_context(dec, stream->codecpar);
    if (avcodec_open2(dec, decoder, nullptr) < 0) {
        error = "failed to open decoder";
        return false;
    }

    AVChannelLayout in_layout{};
    if (dec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&in_layout, std::max(1, dec->ch_layout.nb_channels));
    } else {
        av_channel_layout_copy(&in_layout, &dec->ch_layout);
    }
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;

    SwrContext* swr = nullptr;
    ret = swr_alloc_set_opts2(&swr,
        &out_layout, AV_SAMPLE_FMT_FLT, config_.sample_rate,
        &in_layout, dec->sample_fmt, dec->sample_rate,
        0, nullptr);
    av_channel_layout_uninit(&in_layout);
    if (ret < 0 || swr_init(swr) < 0) {
        if (swr) swr_free(&swr);
        error = "failed to initialize resampler";
        return false;
    }
    swr_ctx_ = swr;
    return true;
}

bool AudioFrameSource::reacquire_device(std::string& error) {
    int backoff_ms = std::max(0, config_.retry_backoff_ms);
    const int attempts = 1 + std::max(0, config_.open_retries);

    for (int attempt = 1; attempt <= attempts && running_.load(); ++attempt) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            close_device();
            if (open_device(error)) {
                pending_.clear();
                Logger::info("Audio device reopened on attempt " + std::to_string(attempt));
                return true;
            }
            close_device();
        }
        Logger::warn("Reopening audio device failed (attempt " + std::to_string(attempt) +
                     "/" + std::to_string(attempts) + "): " + error);
        if (attempt < attempts) {
            // Sleep in short steps so stop() is not held up by the backoff.
            const auto until = std::chrono::steady_clock::now() +
                               std::chrono::milliseconds(backoff_ms);
            while (running_.load() && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            backoff_ms *= 2;
        }
    }
    return false;
}

void AudioFrameSource::close_device() {
    if (swr_ctx_) {
        swr_free(reinterpret_cast<SwrContext**>(&swr_ctx_));
        swr_ctx_ = nullptr;
    }
    if (codec_ctx_) {
        avcodec_free_context(reinterpret_cast<AVCodecContext**>(&codec_ctx_));
        codec_ctx_ = nullptr;
    }
    if (fmt_ctx_) {
        avformat_close_input(reinterpret_cast<AVFormatContext**>(&fmt_ctx_));
        fmt_ctx_ = nullptr;
    }
    stream_idx_ = -1;
}

// ---------------------------------------------------------------------------
// capture_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void AudioFrameSource::capture_loop() {
    AVPacket* pkt   = av_packet_alloc();
    AVFrame*  frame = av_frame_alloc();
    std::vector<float> converted;
    int read_failures = 0;

    while (running_.load() && pkt && frame) {
        // Reloaded every pass: reacquire_device() replaces the contexts.
        auto* ifmt = reinterpret_cast<AVFormatContext*>(fmt_ctx_);
        auto* dec  = reinterpret_cast<AVCodecContext*>(codec_ctx_);
        auto* swr  = reinterpret_cast<SwrContext*>(swr_ctx_);

        int ret = av_read_frame(ifmt, pkt);
        if (ret == AVERROR(EAGAIN)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }
        if (ret == AVERROR_EXIT || !running_.load()) {
            break;
        }
        if (ret < 0) {
            // End of stream from a capture device means it went away.
            const bool lost = ret == AVERROR_EOF ||
                              ++read_failures >= std::max(1, config_.max_read_failures);
            if (ret != AVERROR_EOF) {
                report_glitch("read failed: " + av_error_string(ret));
            }
            if (!lost) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            Logger::warn("Audio device lost (" + av_error_string(ret) + "), reopening");
            std::string error;
            if (!reacquire_device(error)) {
                if (running_.load()) report_device_lost(error);
                break;
            }
            read_failures = 0;
            continue;
        }
        read_failures = 0;
        if (pkt->stream_index != stream_idx_) {
            av_packet_unref(pkt);
            continue;
        }

        ret = avcodec_send_packet(dec, pkt);
        av_packet_unref(pkt);
        if (ret < 0) {
            report_glitch("decode failed: " + av_error_string(ret));
            continue;
        }

        while (avcodec_receive_frame(dec, frame) == 0) {
            int out_samples = static_cast<int>(av_rescale_rnd(
                swr_get_delay(swr, dec->sample_rate) + frame->nb_samples,
                config_.sample_rate, dec->sample_rate, AV_ROUND_UP));
            converted.resize(static_cast<size_t>(std::max(0, out_samples)));
            uint8_t* out_buf = reinterpret_cast<uint8_t*>(converted.data());
            int n = swr_convert(swr, &out_buf, out_samples,
                                const_cast<const uint8_t**>(frame->extended_data),
                                frame->nb_samples);
            if (n < 0) {
                report_glitch("resample failed: " + av_error_string(n));
                continue;
            }
            emit_samples(converted.data(), static_cast<size_t>(n));
        }
    }

    av_frame_free(&frame);
    av_packet_free(&pkt);
    running_.store(false);
}

// ---------------------------------------------------------------------------
// emit_samples
// ---------------------------------------------------------------------------

void AudioFrameSource::emit_samples(const float* samples, size_t count) {
    pending_.insert(pending_.end(), samples, samples + count);

    const size_t hop = static_cast<size_t>(config_.hop_size);
    size_t offset = 0;
    while (pending_.size() - offset >= hop) {
        AudioFrame f;
        f.sequence       = next_sequence_++;
        f.sample_rate    = config_.sample_rate;
        f.captured_at_ms = steady_now_ms();
        f.samples.assign(pending_.begin() + static_cast<std::ptrdiff_t>(offset),
                         pending_.begin() + static_cast<std::ptrdiff_t>(offset + hop));
        offset += hop;

        level_.store(std::min(1.0f, EnergyScorer::compute_rms(f.samples.data(),
                                                              f.samples.size())));
        ++emitted_;
        if (frame_cb_) frame_cb_(std::move(f));
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
}

void AudioFrameSource::report_device_lost(const std::string& detail) {
    running_.store(false);
    const std::string what = "audio device " + config_.input_format + ":" +
                             config_.device + " lost: " + detail;
    Logger::error(std::string(error_code_to_string(ErrorCode::device_unavailable)) + ": " +
                  what);

    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(mu_);
        cb = error_cb_;
    }
    if (cb) cb(ErrorCode::device_unavailable, what);
}

void AudioFrameSource::report_glitch(const std::string& detail) {
    ++glitches_;
    Logger::warn(std::string(error_code_to_string(ErrorCode::device_read_glitch)) + ": " +
                 detail);

    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(mu_);
        cb = error_cb_;
    }
    if (cb) cb(ErrorCode::device_read_glitch, detail);
}

} // namespace mv
