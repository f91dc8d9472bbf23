#include "FeedbackSuppressor.hpp"
#include "SpeechScorer.hpp"
#include "TestSupport.hpp"
#include "VoiceActivityDetector.hpp"

#include <atomic>
#include <thread>

#include <gtest/gtest.h>

using namespace mv;
using mv::test::kLoud;
using mv::test::make_frame;

TEST(FeedbackSuppressorTest, PassesFramesWhenIdle) {
    FeedbackSuppressor s;
    AudioFrame f = make_frame(0, kLoud);
    const std::vector<float> original = f.samples;
    EXPECT_FALSE(s.process(f));
    EXPECT_FALSE(f.suppressed);
    EXPECT_EQ(f.samples, original);
}

TEST(FeedbackSuppressorTest, SilencesAndTagsDuringPlayback) {
    FeedbackSuppressor s;
    s.set_playing(true);
    EXPECT_TRUE(s.is_playing());

    AudioFrame f = make_frame(0, kLoud);
    EXPECT_TRUE(s.process(f));
    EXPECT_TRUE(f.suppressed);
    for (float v : f.samples) EXPECT_EQ(v, 0.0f);
    EXPECT_EQ(s.suppressed_frames(), 1u);
    EXPECT_EQ(s.playback_count(), 1u);
}

TEST(FeedbackSuppressorTest, ReleaseTailKeepsMuting) {
    FeedbackSuppressor s(200);
    s.set_playing(true);
    s.set_playing(false);
    EXPECT_FALSE(s.is_playing());

    int suppressed = 0;
    for (uint64_t i = 0; i < 30; ++i) {
        AudioFrame f = make_frame(i, kLoud);
        if (s.process(f)) ++suppressed;
    }
    EXPECT_EQ(suppressed, 20);
}

TEST(FeedbackSuppressorTest, RepeatedStateIsNotANewPlayback) {
    FeedbackSuppressor s;
    s.set_playing(true);
    s.set_playing(true);
    s.set_playing(false);
    s.set_playing(true);
    EXPECT_EQ(s.playback_count(), 2u);
}

TEST(FeedbackSuppressorTest, NoSpeechStartWhilePlayingUnderConcurrentCalls) {
    FeedbackSuppressor s;
    VadConfig config;
    config.min_speech_duration_ms = 100;
    VoiceActivityDetector vad(config, std::make_unique<EnergyScorer>(0.015f));

    s.set_playing(true);
    std::atomic<bool> done{false};
    std::thread playback([&] {
        while (!done.load()) s.set_playing(true);
    });

    bool started = false;
    for (uint64_t i = 0; i < 500; ++i) {
        AudioFrame f = make_frame(i, kLoud);
        s.process(f);
        if (vad.process(f).kind == VadEventKind::speech_start) started = true;
    }
    done = true;
    playback.join();

    EXPECT_FALSE(started);
    EXPECT_EQ(s.suppressed_frames(), 500u);
}

TEST(FeedbackSuppressorTest, EveryFrameIsEitherUntouchedOrFullySilenced) {
    FeedbackSuppressor s;
    std::atomic<bool> done{false};
    std::thread toggler([&] {
        bool on = false;
        while (!done.load()) {
            on = !on;
            s.set_playing(on);
        }
    });

    const AudioFrame reference = make_frame(0, kLoud);
    for (int i = 0; i < 2000; ++i) {
        AudioFrame f = reference;
        const bool suppressed = s.process(f);
        EXPECT_EQ(f.suppressed, suppressed);
        if (suppressed) {
            for (float v : f.samples) ASSERT_EQ(v, 0.0f);
        } else {
            ASSERT_EQ(f.samples, reference.samples);
        }
    }
    done = true;
    toggler.join();
}
