#include "MeasurementPipeline.hpp"

#include "Logger.hpp"

#include <sstream>

namespace mv {

namespace {

VoiceActivityDetector make_vad(const AppConfig& config, std::unique_ptr<SpeechScorer> scorer) {
    if (scorer) return VoiceActivityDetector(config.vad, std::move(scorer));
    return VoiceActivityDetector(config.vad, config.audio.sample_rate);
}

std::string join_values(const std::vector<double>& values) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) ss << ", ";
        ss << values[i];
    }
    ss << "]";
    return ss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

MeasurementPipeline::MeasurementPipeline(const AppConfig& config, AsrEngine& engine,
                                         PersistenceSink* sink)
    : MeasurementPipeline(config, engine, sink, nullptr) {}

MeasurementPipeline::MeasurementPipeline(const AppConfig& config, AsrEngine& engine,
                                         PersistenceSink* sink,
                                         std::unique_ptr<SpeechScorer> scorer)
    : config_(config),
      suppressor_(config.suppressor.release_tail_ms),
      vad_(make_vad(config, std::move(scorer))),
      assembler_(config.segment, config.vad.min_speech_duration_ms),
      dispatcher_(engine, config.recognition),
      classifier_(config.commands, config.extractor),
      extractor_(config.extractor, classifier_.matcher()),
      state_machine_(config.store.default_context_id),
      store_(sink),
      sink_(sink),
      frames_(config.audio.queue_capacity) {
    if (!config_.commands.correction_dictionary.empty()) {
        classifier_.load_corrections(config_.commands.correction_dictionary);
    }

    extractor_.set_error_callback([this](ErrorCode code, const std::string& detail) {
        report(code, detail);
    });
    store_.set_error_callback([this](ErrorCode code, const std::string& detail) {
        report(code, detail);
    });

    state_machine_.add_listener([this](const StateChange& change) {
        if (change.to == SessionState::stopped && change.from != SessionState::stopped) {
            on_stopped();
        }
    });
}

MeasurementPipeline::~MeasurementPipeline() {
    state_machine_.external_stop();
    // A session that never started still owns nothing to release.
    if (source_) source_->stop();
    frames_.close();
    segments_.close();
    dispatcher_.cancel();
    join_workers();
}

void MeasurementPipeline::set_error_callback(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(error_mu_);
    error_cb_ = std::move(cb);
}

void MeasurementPipeline::add_state_listener(StateChangeListener listener) {
    state_machine_.add_listener(std::move(listener));
}

size_t MeasurementPipeline::restore_from_sink() {
    if (!sink_) return 0;
    return store_.restore(sink_->load_all());
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void MeasurementPipeline::start() {
    if (state_machine_.state() != SessionState::idle) return;

    source_ = std::make_unique<AudioFrameSource>(config_.audio);
    source_->set_error_callback([this](ErrorCode code, const std::string& detail) {
        on_source_error(code, detail);
    });
    // Throws DeviceUnavailable; nothing else has started yet.
    source_->start([this](AudioFrame&& frame) { submit_frame(std::move(frame)); });

    start_workers();
    state_machine_.start();
}

void MeasurementPipeline::start_external() {
    if (state_machine_.state() != SessionState::idle) return;
    start_workers();
    state_machine_.start();
}

void MeasurementPipeline::start_workers() {
    if (workers_started_.exchange(true)) return;
    processing_thread_  = std::thread(&MeasurementPipeline::processing_loop, this);
    recognition_thread_ = std::thread(&MeasurementPipeline::recognition_loop, this);
}

void MeasurementPipeline::join_workers() {
    const auto self = std::this_thread::get_id();
    if (processing_thread_.joinable() && processing_thread_.get_id() != self) {
        processing_thread_.join();
    }
    if (recognition_thread_.joinable() && recognition_thread_.get_id() != self) {
        recognition_thread_.join();
    }
}

void MeasurementPipeline::submit_frame(AudioFrame frame) {
    const SessionState s = state_machine_.state();
    if (s != SessionState::recording && s != SessionState::paused) return;

    // Gate on arrival: a frame captured during playback stays muted however
    // long it waits in the queue.
    suppressor_.process(frame);

    {
        std::lock_guard<std::mutex> lock(idle_mu_);
        ++frames_in_flight_;
    }
    size_t dropped = 0;
    if (!frames_.push(std::move(frame), &dropped)) {
        finish_frames(1);
        return;
    }
    frames_received_.fetch_add(1);
    if (dropped > 0) finish_frames(dropped);
}

bool MeasurementPipeline::drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mu_);
    return idle_cv_.wait_for(lock, timeout, [&] {
        return frames_in_flight_ == 0 && segments_in_flight_ == 0;
    });
}

void MeasurementPipeline::wait_until_stopped() {
    state_machine_.wait_until_stopped();
    join_workers();
}

void MeasurementPipeline::finish_frames(size_t n) {
    {
        std::lock_guard<std::mutex> lock(idle_mu_);
        frames_in_flight_ = n > frames_in_flight_ ? 0 : frames_in_flight_ - n;
    }
    idle_cv_.notify_all();
}

void MeasurementPipeline::finish_segment() {
    {
        std::lock_guard<std::mutex> lock(idle_mu_);
        if (segments_in_flight_ > 0) --segments_in_flight_;
    }
    idle_cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Triggers
// ---------------------------------------------------------------------------

void MeasurementPipeline::on_key_toggle() {
    state_machine_.key_toggle();
}

void MeasurementPipeline::on_key_stop() {
    state_machine_.external_stop();
}

void MeasurementPipeline::on_recognized_command(const Command& command) {
    if (command.kind == CommandKind::unknown) return;
    commands_.fetch_add(1);
    state_machine_.apply(command);
}

void MeasurementPipeline::on_source_error(ErrorCode code, const std::string& detail) {
    report(code, detail);
    if (is_fatal(code)) state_machine_.external_stop("device_lost");
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

void MeasurementPipeline::processing_loop() {
    AudioFrame frame;
    while (frames_.pop(frame)) {
        const VadEvent event = vad_.process(frame);
        auto segment = assembler_.push(frame, event, vad_.last_frame_speech());

        segments_discarded_.store(assembler_.discarded_count());
        if (segment) {
            segments_emitted_.fetch_add(1);
            {
                std::lock_guard<std::mutex> lock(idle_mu_);
                ++segments_in_flight_;
            }
            if (!segments_.push(std::move(*segment))) finish_segment();
        }
        finish_frames(1);
    }

    if (assembler_.discard_open()) {
        Logger::info("Discarded the open segment at stop");
    }
    segments_discarded_.store(assembler_.discarded_count());
}

void MeasurementPipeline::recognition_loop() {
    SpeechSegment segment;
    while (segments_.pop(segment)) {
        if (state_machine_.state() == SessionState::stopped) {
            finish_segment();
            continue;
        }

        RecognitionOutcome outcome = dispatcher_.recognize(segment);
        switch (outcome.status) {
            case RecognitionStatus::ok:
                if (state_machine_.state() != SessionState::stopped) {
                    handle_text(outcome.result.text);
                }
                break;
            case RecognitionStatus::failed:
                recognition_failures_.fetch_add(1);
                report(ErrorCode::recognition_failed,
                       "segment " + std::to_string(segment.start_sequence) + " after " +
                       std::to_string(outcome.attempts) + " attempts");
                break;
            case RecognitionStatus::timed_out:
                recognition_timeouts_.fetch_add(1);
                report(ErrorCode::recognition_timeout,
                       "segment " + std::to_string(segment.start_sequence) + " exceeded " +
                       std::to_string(config_.recognition.timeout_ms) + " ms");
                break;
            case RecognitionStatus::cancelled:
                break;
        }
        finish_segment();
    }
}

// ---------------------------------------------------------------------------
// handle_text
// ---------------------------------------------------------------------------

Classification MeasurementPipeline::handle_text(const std::string& text) {
    utterances_.fetch_add(1);
    Classification c = classifier_.classify(text);

    switch (c.kind) {
        case TextKind::noise:
            noise_.fetch_add(1);
            Logger::info("Recognized '" + c.raw + "' -> noise (" + c.reason + ")");
            break;

        case TextKind::command:
            Logger::info("Recognized '" + c.raw + "' -> command " +
                         command_kind_to_string(c.command->kind) + " (" + c.reason + ")");
            if (c.command->kind == CommandKind::unknown) {
                noise_.fetch_add(1);
                break;
            }
            on_recognized_command(*c.command);
            if (command_cb_) command_cb_(*c.command, c.text);
            break;

        case TextKind::measurement: {
            if (state_machine_.state() != SessionState::recording) {
                discarded_while_paused_.fetch_add(1);
                Logger::info("Recognized '" + c.raw + "' while " +
                             session_state_to_string(state_machine_.state()) + ", discarded");
                break;
            }
            const ExtractionResult extraction = extractor_.extract(c.text);
            const std::vector<double> values = extraction.values();
            Logger::info("Recognized '" + c.raw + "' -> '" + c.text + "' values " +
                         join_values(values));
            if (values.empty()) {
                noise_.fetch_add(1);
                break;
            }
            const int64_t context = state_machine_.context_id();
            for (double v : values) {
                MeasurementRecord record;
                record.context_id = context;
                record.value      = v;
                record.raw_text   = c.raw;
                record.voice_entry_id = store_.append(record);
                measurements_.fetch_add(1);
                if (measurement_cb_) {
                    if (auto stored = store_.lookup(record.voice_entry_id)) {
                        measurement_cb_(*stored);
                    }
                }
            }
            break;
        }
    }
    return c;
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------

void MeasurementPipeline::on_stopped() {
    if (stop_handled_.exchange(true)) return;
    Logger::info("Stopping pipeline");

    // Intake first, then everything queued behind it.
    frames_.close();
    const size_t frames_dropped = frames_.clear();
    finish_frames(frames_dropped);

    segments_.close();
    const size_t segments_dropped = segments_.clear();
    for (size_t i = 0; i < segments_dropped; ++i) finish_segment();
    if (segments_dropped > 0) {
        Logger::info("Discarded " + std::to_string(segments_dropped) + " queued segments");
    }
    dispatcher_.cancel();

    if (source_) source_->stop();

    if (config_.store.renumber_on_stop) store_.renumber();
    const size_t pending = store_.flush_pending();
    if (pending > 0) {
        report(ErrorCode::persist_failed,
               std::to_string(pending) + " writes still pending at stop");
    }
}

void MeasurementPipeline::report(ErrorCode code, const std::string& detail) {
    Logger::warn(std::string(error_code_to_string(code)) + ": " + detail);
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(error_mu_);
        cb = error_cb_;
    }
    if (cb) cb(code, detail);
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

PipelineStats MeasurementPipeline::stats() const {
    PipelineStats s;
    s.frames_received        = frames_received_.load();
    s.frames_dropped         = frames_.dropped();
    s.frames_suppressed      = suppressor_.suppressed_frames();
    s.segments_emitted       = segments_emitted_.load();
    s.segments_discarded     = segments_discarded_.load();
    s.utterances             = utterances_.load();
    s.recognition_failures   = recognition_failures_.load();
    s.recognition_timeouts   = recognition_timeouts_.load();
    s.late_results_discarded = dispatcher_.late_results_discarded();
    s.commands               = commands_.load();
    s.measurements           = measurements_.load();
    s.noise                  = noise_.load();
    s.discarded_while_paused = discarded_while_paused_.load();
    return s;
}

} // namespace mv
