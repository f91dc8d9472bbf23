#include "AudioConverter.hpp"

#include <stdexcept>

extern "C" {
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

/// Owns every FFmpeg object decode_file() allocates, so each early throw
/// releases whatever was opened so far.
struct DecodeState {
    AVFormatContext* fmt   = nullptr;
    AVCodecContext*  dec   = nullptr;
    SwrContext*      swr   = nullptr;
    AVPacket*        pkt   = nullptr;
    AVFrame*         frame = nullptr;

    ~DecodeState() {
        if (frame) av_frame_free(&frame);
        if (pkt)   av_packet_free(&pkt);
        if (swr)   swr_free(&swr);
        if (dec)   avcodec_free_context(&dec);
        if (fmt)   avformat_close_input(&fmt);
    }
};

void convert_frame(SwrContext* swr, const AVFrame* frame, int in_rate,
                   int out_rate, std::vector<float>& out) {
    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr, in_rate) + frame->nb_samples, out_rate, in_rate, AV_ROUND_UP));
    if (out_samples <= 0) return;

    size_t base = out.size();
    out.resize(base + static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(out.data() + base);
    int converted = swr_convert(swr, &out_buf, out_samples,
                                const_cast<const uint8_t**>(frame->extended_data),
                                frame->nb_samples);
    out.resize(base + static_cast<size_t>(converted > 0 ? converted : 0));
}

} // namespace

// ---------------------------------------------------------------------------
// decode_file
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::decode_file(const std::string& input_path,
                                               int target_sample_rate) {
    DecodeState st;
    std::vector<float> pcm_out;

    int ret = avformat_open_input(&st.fmt, input_path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw std::runtime_error("Failed to open audio file '" + input_path + "': " +
                                 av_error_string(ret));
    }
    if (avformat_find_stream_info(st.fmt, nullptr) < 0) {
        throw std::runtime_error("Failed to find stream info in '" + input_path + "'");
    }

    int audio_idx = av_find_best_stream(st.fmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_idx < 0) {
        throw std::runtime_error("No audio stream in '" + input_path + "'");
    }
    AVStream* stream = st.fmt->streams[audio_idx];

    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) throw std::runtime_error("No decoder for audio codec");
    st.dec = avcodec_alloc_context3(decoder);
    if (!st.dec) throw std::runtime_error("Failed to allocate decoder context");
    avcodec_parameters_to_context(st.dec, stream->codecpar);
    if (avcodec_open2(st.dec, decoder, nullptr) < 0) {
        throw std::runtime_error("Failed to open audio decoder");
    }

    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    ret = swr_alloc_set_opts2(&st.swr,
        &out_layout, AV_SAMPLE_FMT_FLT, target_sample_rate,
        &st.dec->ch_layout, st.dec->sample_fmt, st.dec->sample_rate,
        0, nullptr);
    if (ret < 0 || swr_init(st.swr) < 0) {
        throw std::runtime_error("Failed to initialize audio resampler");
    }

    st.pkt   = av_packet_alloc();
    st.frame = av_frame_alloc();
    if (!st.pkt || !st.frame) throw std::runtime_error("Out of memory");

    const int in_rate = st.dec->sample_rate;
    while (av_read_frame(st.fmt, st.pkt) >= 0) {
        if (st.pkt->stream_index == audio_idx &&
            avcodec_send_packet(st.dec, st.pkt) >= 0) {
            while (avcodec_receive_frame(st.dec, st.frame) == 0) {
                convert_frame(st.swr, st.frame, in_rate, target_sample_rate, pcm_out);
            }
        }
        av_packet_unref(st.pkt);
    }

    // Flush decoder, then resampler.
    avcodec_send_packet(st.dec, nullptr);
    while (avcodec_receive_frame(st.dec, st.frame) == 0) {
        convert_frame(st.swr, st.frame, in_rate, target_sample_rate, pcm_out);
    }
    int tail = swr_get_out_samples(st.swr, 0);
    if (tail > 0) {
        size_t base = pcm_out.size();
        pcm_out.resize(base + static_cast<size_t>(tail));
        uint8_t* out_buf = reinterpret_cast<uint8_t*>(pcm_out.data() + base);
        int converted = swr_convert(st.swr, &out_buf, tail, nullptr, 0);
        pcm_out.resize(base + static_cast<size_t>(converted > 0 ? converted : 0));
    }

    return pcm_out;
}

// ---------------------------------------------------------------------------
// resample
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::resample(const std::vector<float>& input_data,
                                            int input_rate,
                                            int output_rate) {
    if (input_data.empty() || input_rate <= 0 || output_rate <= 0) {
        return {};
    }
    if (input_rate == output_rate) {
        return input_data;
    }

    AVChannelLayout mono_layout = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* swr = nullptr;
    int ret = swr_alloc_set_opts2(&swr,
        &mono_layout, AV_SAMPLE_FMT_FLT, output_rate,
        &mono_layout, AV_SAMPLE_FMT_FLT, input_rate,
        0, nullptr);
    if (ret < 0 || swr_init(swr) < 0) {
        if (swr) swr_free(&swr);
        return {};
    }

    int max_out = static_cast<int>(av_rescale_rnd(
        static_cast<int64_t>(input_data.size()), output_rate, input_rate, AV_ROUND_UP)) + 32;
    std::vector<float> output(static_cast<size_t>(max_out));

    const uint8_t* in_buf = reinterpret_cast<const uint8_t*>(input_data.data());
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(output.data());

    int converted = swr_convert(swr, &out_buf, max_out, &in_buf,
                                static_cast<int>(input_data.size()));
    if (converted >= 0) {
        uint8_t* tail_buf = reinterpret_cast<uint8_t*>(output.data() + converted);
        int flushed = swr_convert(swr, &tail_buf, max_out - converted, nullptr, 0);
        if (flushed > 0) converted += flushed;
    }
    swr_free(&swr);

    if (converted <= 0) return {};
    output.resize(static_cast<size_t>(converted));
    return output;
}

} // namespace mv
