#include "RecognitionDispatcher.hpp"
#include "TestSupport.hpp"

#include <thread>

#include <gtest/gtest.h>

using namespace mv;
using namespace std::chrono_literals;
using mv::test::FakeAsrEngine;
using mv::test::kLoud;
using mv::test::make_frame;

namespace {

SpeechSegment segment_of(int frames) {
    SpeechSegment s;
    for (int i = 0; i < frames; ++i) s.frames.push_back(make_frame(i, kLoud));
    s.start_sequence = 0;
    s.end_sequence   = static_cast<uint64_t>(frames - 1);
    s.duration_ms    = frames * 10;
    return s;
}

RecognitionConfig config_with(int timeout_ms, int retries) {
    RecognitionConfig c;
    c.timeout_ms  = timeout_ms;
    c.max_retries = retries;
    return c;
}

} // namespace

TEST(RecognitionDispatcherTest, ReturnsEngineText) {
    FakeAsrEngine engine;
    engine.push(std::string("二十五"));
    RecognitionDispatcher d(engine, config_with(5000, 1));

    auto out = d.recognize(segment_of(50));
    EXPECT_EQ(out.status, RecognitionStatus::ok);
    EXPECT_EQ(out.result.text, "二十五");
    EXPECT_EQ(out.attempts, 1);
    EXPECT_EQ(out.result.duration_ms, 500);
    EXPECT_EQ(engine.last_samples(), 50u * mv::test::kHop);
}

TEST(RecognitionDispatcherTest, RetriesAFailedCall) {
    FakeAsrEngine engine;
    engine.push(std::nullopt);
    engine.push(std::string("继续"));
    RecognitionDispatcher d(engine, config_with(5000, 1));

    auto out = d.recognize(segment_of(30));
    EXPECT_EQ(out.status, RecognitionStatus::ok);
    EXPECT_EQ(out.result.text, "继续");
    EXPECT_EQ(out.attempts, 2);
    EXPECT_EQ(d.failures(), 1u);
}

TEST(RecognitionDispatcherTest, GivesUpAfterRetries) {
    FakeAsrEngine engine;
    RecognitionDispatcher d(engine, config_with(5000, 2));

    auto out = d.recognize(segment_of(30));
    EXPECT_EQ(out.status, RecognitionStatus::failed);
    EXPECT_EQ(out.attempts, 3);
    EXPECT_EQ(engine.calls(), 3);
}

TEST(RecognitionDispatcherTest, EngineExceptionCountsAsFailure) {
    FakeAsrEngine engine;
    engine.set_throw(true);
    RecognitionDispatcher d(engine, config_with(5000, 0));

    auto out = d.recognize(segment_of(30));
    EXPECT_EQ(out.status, RecognitionStatus::failed);
    EXPECT_EQ(out.attempts, 1);
}

TEST(RecognitionDispatcherTest, TimeoutIsNotRetriedAndLateResultIsDropped) {
    FakeAsrEngine engine;
    engine.set_fallback(std::string("too late"));
    engine.set_delay(300ms);
    RecognitionDispatcher d(engine, config_with(50, 3));

    auto out = d.recognize(segment_of(30));
    EXPECT_EQ(out.status, RecognitionStatus::timed_out);
    EXPECT_EQ(out.attempts, 1);
    EXPECT_EQ(d.timeouts(), 1u);

    for (int i = 0; i < 100 && d.late_results_discarded() == 0; ++i) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_EQ(d.late_results_discarded(), 1u);
    EXPECT_EQ(engine.calls(), 1);
}

TEST(RecognitionDispatcherTest, CancelReleasesWaitingCaller) {
    FakeAsrEngine engine;
    engine.set_fallback(std::string("ignored"));
    engine.set_delay(400ms);
    RecognitionDispatcher d(engine, config_with(10000, 0));

    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        d.cancel();
    });
    const auto t0 = std::chrono::steady_clock::now();
    auto out = d.recognize(segment_of(30));
    const auto waited = std::chrono::steady_clock::now() - t0;
    canceller.join();

    EXPECT_EQ(out.status, RecognitionStatus::cancelled);
    EXPECT_LT(waited, 5s);
    EXPECT_TRUE(d.is_cancelled());

    // Sticky: nothing reaches the engine afterwards.
    auto again = d.recognize(segment_of(30));
    EXPECT_EQ(again.status, RecognitionStatus::cancelled);
    EXPECT_EQ(again.attempts, 0);
}

TEST(RecognitionDispatcherTest, SlowCallDoesNotStarveTheNext) {
    FakeAsrEngine engine;
    engine.push(std::string("二百"));
    engine.push(std::string("三十五"));
    engine.set_delay(450ms);
    RecognitionDispatcher d(engine, config_with(150, 0));

    auto first = d.recognize(segment_of(30));
    EXPECT_EQ(first.status, RecognitionStatus::timed_out);

    // The first call is still running on the engine.
    engine.set_delay(0ms);
    auto second = d.recognize(segment_of(30));
    EXPECT_EQ(second.status, RecognitionStatus::ok);
    EXPECT_EQ(second.result.text, "三十五");
    EXPECT_EQ(engine.calls(), 2);
    EXPECT_EQ(d.late_results_discarded(), 1u);
    EXPECT_EQ(d.timeouts(), 1u);
}
