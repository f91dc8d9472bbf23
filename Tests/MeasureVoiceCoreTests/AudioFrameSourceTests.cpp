#include "AudioFrameSource.hpp"
#include "TestSupport.hpp"

#include <thread>

#include <gtest/gtest.h>

using namespace mv;
using namespace std::chrono_literals;

namespace {

/// libavfilter's lavfi input: a finite sine source that ends like an
/// unplugged device.
AudioConfig lavfi_config(const std::string& graph) {
    AudioConfig c;
    c.input_format     = "lavfi";
    c.device           = graph;
    c.sample_rate      = mv::test::kRate;
    c.hop_size         = mv::test::kHop;
    c.open_retries     = 2;
    c.retry_backoff_ms = 1;
    return c;
}

} // namespace

TEST(AudioFrameSourceTest, UnknownInputThrowsAfterRetries) {
    AudioConfig c;
    c.input_format     = "no-such-input";
    c.open_retries     = 2;
    c.retry_backoff_ms = 1;
    AudioFrameSource source(c);

    EXPECT_THROW(source.start([](AudioFrame&&) {}), DeviceUnavailable);
    EXPECT_FALSE(source.is_running());
}

TEST(AudioFrameSourceTest, EndOfStreamReopensDevice) {
    AudioFrameSource source(lavfi_config("sine=frequency=440:duration=0.2:sample_rate=16000"));

    std::mutex mu;
    std::vector<uint64_t> sequences;
    std::vector<ErrorCode> errors;
    source.set_error_callback([&](ErrorCode code, const std::string&) {
        std::lock_guard<std::mutex> lock(mu);
        errors.push_back(code);
    });
    try {
        source.start([&](AudioFrame&& f) {
            std::lock_guard<std::mutex> lock(mu);
            sequences.push_back(f.sequence);
        });
    } catch (const DeviceUnavailable& e) {
        GTEST_SKIP() << "lavfi input not available: " << e.what();
    }

    // One pass of the source is 20 frames; more than that means it was
    // reopened after end of stream.
    for (int i = 0; i < 250; ++i) {
        {
            std::lock_guard<std::mutex> lock(mu);
            if (sequences.size() >= 60) break;
        }
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_TRUE(source.is_running());
    source.stop();
    EXPECT_FALSE(source.is_running());

    std::lock_guard<std::mutex> lock(mu);
    ASSERT_GE(sequences.size(), 60u);
    for (size_t i = 1; i < sequences.size(); ++i) {
        EXPECT_EQ(sequences[i], sequences[i - 1] + 1);
    }
    EXPECT_TRUE(errors.empty());
}

TEST(AudioFrameSourceTest, RestartContinuesSequence) {
    AudioFrameSource source(lavfi_config("sine=frequency=440:duration=0.05:sample_rate=16000"));
    try {
        source.start([](AudioFrame&&) {});
    } catch (const DeviceUnavailable& e) {
        GTEST_SKIP() << "lavfi input not available: " << e.what();
    }
    for (int i = 0; i < 100 && source.frames_emitted() < 10; ++i) {
        std::this_thread::sleep_for(20ms);
    }
    source.stop();
    const uint64_t before = source.frames_emitted();

    std::mutex mu;
    std::optional<uint64_t> first;
    ASSERT_TRUE(source.start([&](AudioFrame&& f) {
        std::lock_guard<std::mutex> lock(mu);
        if (!first) first = f.sequence;
    }));
    for (int i = 0; i < 100 && source.frames_emitted() < before + 10; ++i) {
        std::this_thread::sleep_for(20ms);
    }
    source.stop();

    std::lock_guard<std::mutex> lock(mu);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, before);
}
