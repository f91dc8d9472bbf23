#pragma once

#include "AsrEngine.hpp"
#include "Config.hpp"
#include "Types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mv {

enum class RecognitionStatus {
    ok,
    failed,
    timed_out,
    cancelled
};

inline const char* recognition_status_to_string(RecognitionStatus s) {
    switch (s) {
        case RecognitionStatus::ok:        return "ok";
        case RecognitionStatus::failed:    return "failed";
        case RecognitionStatus::timed_out: return "timed_out";
        case RecognitionStatus::cancelled: return "cancelled";
    }
    return "unknown";
}

struct RecognitionOutcome {
    RecognitionStatus status   = RecognitionStatus::failed;
    RecognitionResult result;
    int               attempts = 0;
};

/// Hands finished segments to an AsrEngine with a deadline.
///
/// Engine calls run on a dedicated inference thread; recognize() waits at
/// most `timeout_ms` per attempt, counted from the moment the inference
/// thread starts the engine call.  A call queued behind a timed-out one
/// waits for the engine to come free and then gets its full budget.
/// A failed call is retried up to
/// `max_retries` times; a timed-out call is not retried, and whatever it
/// eventually returns is discarded.  cancel() releases a waiting caller
/// immediately and makes every later call return `cancelled`.
class RecognitionDispatcher {
public:
    RecognitionDispatcher(AsrEngine& engine, const RecognitionConfig& config);
    ~RecognitionDispatcher();

    RecognitionDispatcher(const RecognitionDispatcher&) = delete;
    RecognitionDispatcher& operator=(const RecognitionDispatcher&) = delete;

    /// Blocks the calling thread until the outcome is known.
    RecognitionOutcome recognize(const SpeechSegment& segment);

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    uint64_t late_results_discarded() const { return late_discarded_.load(); }
    uint64_t timeouts() const               { return timeouts_.load(); }
    uint64_t failures() const               { return failures_.load(); }

private:
    struct Job {
        std::vector<float>          pcm;
        int                         sample_rate = 16000;

        std::mutex                  mu;
        std::condition_variable     cv;
        bool                        started   = false;
        bool                        done      = false;
        bool                        abandoned = false;
        std::optional<std::string>  text;
    };

    void inference_loop();

    AsrEngine&                          engine_;
    RecognitionConfig                   config_;

    std::thread                         worker_;
    std::mutex                          mu_;
    std::condition_variable             cv_;
    std::deque<std::shared_ptr<Job>>    queue_;
    std::shared_ptr<Job>                waiting_;   // job the caller blocks on
    bool                                shutdown_ = false;

    std::atomic<bool>                   cancelled_{false};
    std::atomic<uint64_t>               late_discarded_{0};
    std::atomic<uint64_t>               timeouts_{0};
    std::atomic<uint64_t>               failures_{0};
};

} // namespace mv
