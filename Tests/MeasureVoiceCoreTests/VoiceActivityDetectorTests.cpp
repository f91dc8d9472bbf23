#include "SpeechScorer.hpp"
#include "TestSupport.hpp"
#include "VoiceActivityDetector.hpp"

#include <gtest/gtest.h>

using namespace mv;
using mv::test::kLoud;
using mv::test::make_frame;

namespace {

VadConfig test_vad_config() {
    VadConfig c;
    c.scorer                    = ScorerKind::energy;
    c.energy_threshold          = 0.015f;
    c.min_speech_duration_ms    = 300;
    c.min_silence_duration_ms   = 600;
    c.long_utterance_ms         = 2000;
    c.long_utterance_silence_ms = 300;
    c.max_segment_ms            = 15000;
    return c;
}

std::unique_ptr<SpeechScorer> energy() {
    return std::make_unique<EnergyScorer>(0.015f);
}

struct Feed {
    std::vector<VadEvent> events;
    uint64_t next = 0;

    void run(VoiceActivityDetector& vad, int frames, float amplitude) {
        for (int i = 0; i < frames; ++i) {
            VadEvent e = vad.process(make_frame(next, amplitude));
            if (e.kind != VadEventKind::none) events.push_back(e);
            ++next;
        }
    }
};

} // namespace

TEST(EnergyScorerTest, Rms) {
    const float samples[] = {0.5f, -0.5f, 0.5f, -0.5f};
    EXPECT_FLOAT_EQ(EnergyScorer::compute_rms(samples, 4), 0.5f);
    EXPECT_FLOAT_EQ(EnergyScorer::compute_rms(samples, 0), 0.0f);

    EnergyScorer scorer(0.015f);
    EXPECT_TRUE(scorer.score(make_frame(0, kLoud)).speech);
    EXPECT_FALSE(scorer.score(make_frame(0, 0.0f)).speech);
}

TEST(VoiceActivityDetectorTest, ShortBurstNeverStartsSpeech) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    Feed feed;
    feed.run(vad, 10, 0.0f);
    feed.run(vad, 20, kLoud);    // 200 ms
    feed.run(vad, 100, 0.0f);
    EXPECT_TRUE(feed.events.empty());
    EXPECT_EQ(vad.state(), VadState::silence);
}

TEST(VoiceActivityDetectorTest, StartCarriesOnsetAndEndFollowsSilence) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    Feed feed;
    feed.run(vad, 10, 0.0f);
    feed.run(vad, 40, kLoud);    // onset at frame 10
    ASSERT_EQ(feed.events.size(), 1u);
    EXPECT_EQ(feed.events[0].kind, VadEventKind::speech_start);
    EXPECT_EQ(feed.events[0].sequence, 10u);
    EXPECT_EQ(vad.state(), VadState::speech);

    feed.run(vad, 59, 0.0f);     // 590 ms is not enough
    EXPECT_EQ(feed.events.size(), 1u);
    feed.run(vad, 1, 0.0f);
    ASSERT_EQ(feed.events.size(), 2u);
    EXPECT_EQ(feed.events[1].kind, VadEventKind::speech_end);
    EXPECT_FALSE(feed.events[1].forced);
    EXPECT_EQ(feed.events[1].sequence, 109u);
    EXPECT_EQ(vad.state(), VadState::silence);
}

TEST(VoiceActivityDetectorTest, ShortPauseInsideUtteranceDoesNotEndIt) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    Feed feed;
    feed.run(vad, 40, kLoud);
    feed.run(vad, 30, 0.0f);
    feed.run(vad, 20, kLoud);
    EXPECT_EQ(feed.events.size(), 1u);
    EXPECT_EQ(vad.state(), VadState::speech);
}

TEST(VoiceActivityDetectorTest, LongUtteranceUsesShorterSilence) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    Feed feed;
    feed.run(vad, 250, kLoud);   // 2.5 s
    feed.run(vad, 30, 0.0f);     // 300 ms
    ASSERT_EQ(feed.events.size(), 2u);
    EXPECT_EQ(feed.events[1].kind, VadEventKind::speech_end);
}

TEST(VoiceActivityDetectorTest, MaxSegmentForcesEnd) {
    VadConfig config = test_vad_config();
    config.max_segment_ms = 1000;
    VoiceActivityDetector vad(config, energy());
    Feed feed;
    feed.run(vad, 100, kLoud);
    ASSERT_EQ(feed.events.size(), 2u);
    EXPECT_EQ(feed.events[1].kind, VadEventKind::speech_end);
    EXPECT_TRUE(feed.events[1].forced);
}

TEST(VoiceActivityDetectorTest, SuppressedFramesAreSilence) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    for (uint64_t i = 0; i < 100; ++i) {
        AudioFrame f = make_frame(i, kLoud);
        f.suppressed = true;
        EXPECT_EQ(vad.process(f).kind, VadEventKind::none);
        EXPECT_FALSE(vad.last_frame_speech());
    }
    EXPECT_EQ(vad.state(), VadState::silence);
}

TEST(VoiceActivityDetectorTest, InjectedScorerIsReported) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    EXPECT_EQ(vad.scorer_status().active, "energy");
    EXPECT_FALSE(vad.scorer_status().fallback);
}

TEST(VoiceActivityDetectorTest, ResetReturnsToSilence) {
    VoiceActivityDetector vad(test_vad_config(), energy());
    Feed feed;
    feed.run(vad, 40, kLoud);
    ASSERT_EQ(vad.state(), VadState::speech);
    vad.reset();
    EXPECT_EQ(vad.state(), VadState::silence);
}
