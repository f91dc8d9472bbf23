#include "RecognitionDispatcher.hpp"

#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace mv {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

RecognitionDispatcher::RecognitionDispatcher(AsrEngine& engine,
                                             const RecognitionConfig& config)
    : engine_(engine), config_(config) {
    worker_ = std::thread(&RecognitionDispatcher::inference_loop, this);
}

RecognitionDispatcher::~RecognitionDispatcher() {
    cancel();
    {
        std::lock_guard<std::mutex> lock(mu_);
        shutdown_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ---------------------------------------------------------------------------
// recognize
// ---------------------------------------------------------------------------

RecognitionOutcome RecognitionDispatcher::recognize(const SpeechSegment& segment) {
    RecognitionOutcome outcome;
    outcome.result.segment_id  = segment.start_sequence;
    outcome.result.duration_ms = segment.duration_ms;

    const std::vector<float> pcm = segment.pcm();
    const int max_attempts = 1 + std::max(0, config_.max_retries);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (cancelled_.load()) {
            outcome.status = RecognitionStatus::cancelled;
            return outcome;
        }
        outcome.attempts = attempt;

        auto job = std::make_shared<Job>();
        job->pcm         = pcm;
        job->sample_rate = segment.sample_rate;
        {
            std::lock_guard<std::mutex> lock(mu_);
            queue_.push_back(job);
            waiting_ = job;
        }
        cv_.notify_all();

        bool finished;
        {
            std::unique_lock<std::mutex> lock(job->mu);
            // The deadline runs from the engine picking the call up, so a
            // call still queued behind an abandoned one keeps its full budget.
            job->cv.wait(lock, [&] {
                return job->started || job->done || cancelled_.load();
            });
            if (!cancelled_.load()) {
                job->cv.wait_for(lock, std::chrono::milliseconds(config_.timeout_ms),
                                 [&] { return job->done || cancelled_.load(); });
            }
            finished = job->done;
            if (!finished) job->abandoned = true;
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            waiting_.reset();
        }

        if (!finished) {
            if (cancelled_.load()) {
                outcome.status = RecognitionStatus::cancelled;
                return outcome;
            }
            ++timeouts_;
            outcome.status = RecognitionStatus::timed_out;
            Logger::warn(std::string(error_code_to_string(ErrorCode::recognition_timeout)) +
                         ": segment " + std::to_string(segment.start_sequence) +
                         " exceeded " + std::to_string(config_.timeout_ms) + " ms");
            return outcome;
        }

        if (job->text) {
            outcome.status      = RecognitionStatus::ok;
            outcome.result.text = std::move(*job->text);
            return outcome;
        }

        ++failures_;
        Logger::warn(std::string(error_code_to_string(ErrorCode::recognition_failed)) +
                     ": segment " + std::to_string(segment.start_sequence) +
                     " (attempt " + std::to_string(attempt) + "/" +
                     std::to_string(max_attempts) + ")");
    }

    outcome.status = RecognitionStatus::failed;
    return outcome;
}

// ---------------------------------------------------------------------------
// cancel
// ---------------------------------------------------------------------------

void RecognitionDispatcher::cancel() {
    cancelled_.store(true);

    std::shared_ptr<Job> waiting;
    {
        std::lock_guard<std::mutex> lock(mu_);
        waiting = waiting_;
        // Queued jobs have no caller left to hear their result.
        for (auto& job : queue_) {
            std::lock_guard<std::mutex> job_lock(job->mu);
            job->abandoned = true;
        }
        queue_.clear();
    }
    if (waiting) {
        std::lock_guard<std::mutex> job_lock(waiting->mu);
        waiting->cv.notify_all();
    }
}

// ---------------------------------------------------------------------------
// inference_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void RecognitionDispatcher::inference_loop() {
    for (;;) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
            if (shutdown_) return;
            job = queue_.front();
            queue_.pop_front();
        }
        {
            // Cancelled while still queued behind an earlier call.
            std::lock_guard<std::mutex> lock(job->mu);
            if (job->abandoned) continue;
            job->started = true;
            job->cv.notify_all();
        }

        std::optional<std::string> text;
        try {
            text = engine_.transcribe(job->pcm, job->sample_rate);
        } catch (const std::exception& e) {
            Logger::error(std::string("ASR engine threw: ") + e.what());
            text.reset();
        }

        std::lock_guard<std::mutex> lock(job->mu);
        if (job->abandoned) {
            ++late_discarded_;
            Logger::debug("Discarded late recognition result");
            continue;
        }
        job->text = std::move(text);
        job->done = true;
        job->cv.notify_all();
    }
}

} // namespace mv
