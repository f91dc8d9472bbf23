#pragma once

#include "AsrEngine.hpp"
#include "AudioFrameSource.hpp"
#include "BlockingQueue.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "FeedbackSuppressor.hpp"
#include "MeasurementStore.hpp"
#include "NumericExtractor.hpp"
#include "PersistenceSink.hpp"
#include "RecognitionDispatcher.hpp"
#include "SegmentAssembler.hpp"
#include "SessionStateMachine.hpp"
#include "SpeechScorer.hpp"
#include "TextClassifier.hpp"
#include "Types.hpp"
#include "VoiceActivityDetector.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mv {

/// Counters for the end-of-session summary.
struct PipelineStats {
    uint64_t frames_received        = 0;
    uint64_t frames_dropped         = 0;   // frame queue overflow
    uint64_t frames_suppressed      = 0;
    uint64_t segments_emitted       = 0;
    uint64_t segments_discarded     = 0;   // too short, or cut off by stop
    uint64_t utterances             = 0;   // segments with recognized text
    uint64_t recognition_failures   = 0;
    uint64_t recognition_timeouts   = 0;
    uint64_t late_results_discarded = 0;
    uint64_t commands               = 0;
    uint64_t measurements           = 0;   // records appended
    uint64_t noise                  = 0;
    uint64_t discarded_while_paused = 0;
};

/// Owns every stage and the threads between them:
///
///   capture thread  -->  frame queue  -->  processing worker
///     (suppressor)                             (VAD, assembler)
///                                                   |
///                                            segment queue
///                                                   |
///                                          recognition worker
///                     (dispatcher, classifier, extractor, state machine, store)
///
/// One worker per stage keeps frames and results in order.  Frames keep
/// flowing while paused so a spoken Resume is heard; measurements recognized
/// while paused are dropped, commands still apply.
///
/// Reaching Stopped, from any trigger, closes the frame intake, discards
/// open and queued segments, ignores a recognition still running, releases
/// the device and finalizes the store.
class MeasurementPipeline {
public:
    /// `sink` may be null for an in-memory session.  Neither the engine nor
    /// the sink is owned.
    MeasurementPipeline(const AppConfig& config, AsrEngine& engine,
                        PersistenceSink* sink = nullptr);

    /// Same, with an explicit VAD scorer instead of the configured one.
    MeasurementPipeline(const AppConfig& config, AsrEngine& engine,
                        PersistenceSink* sink,
                        std::unique_ptr<SpeechScorer> scorer);

    ~MeasurementPipeline();

    MeasurementPipeline(const MeasurementPipeline&) = delete;
    MeasurementPipeline& operator=(const MeasurementPipeline&) = delete;

    // ---- Callbacks (set before start) ----

    void set_measurement_callback(MeasurementCallback cb) { measurement_cb_ = std::move(cb); }
    void set_command_callback(CommandCallback cb)         { command_cb_ = std::move(cb); }
    void set_error_callback(ErrorCallback cb);
    void add_state_listener(StateChangeListener listener);

    /// Load persisted history from the sink so numbering continues.
    size_t restore_from_sink();

    // ---- Lifecycle ----

    /// Open the configured capture device and start recording.  Throws
    /// DeviceUnavailable once the device retries are exhausted.
    void start();

    /// Start recording without a device; frames come from submit_frame().
    void start_external();

    /// Feed one captured frame.  Never blocks; ignored unless recording or
    /// paused.
    void submit_frame(AudioFrame frame);

    /// Wait until every submitted frame and segment has been handled.
    bool drain(std::chrono::milliseconds timeout);

    void wait_until_stopped();

    // ---- Triggers ----

    void on_key_toggle();
    void on_key_stop();
    void on_recognized_command(const Command& command);

    /// Error from whatever feeds frames.  Reported through the error
    /// callback; a fatal code stops the session with trigger "device_lost".
    void on_source_error(ErrorCode code, const std::string& detail);

    /// Classify recognized text and act on it.  The recognition worker
    /// calls this for every utterance.
    Classification handle_text(const std::string& text);

    // ---- Access ----

    /// Playback gate for TTS output.
    FeedbackSuppressor& feedback() { return suppressor_; }
    TextClassifier& classifier()   { return classifier_; }
    MeasurementStore& store()      { return store_; }

    SessionState state() const { return state_machine_.state(); }
    int64_t context_id() const { return state_machine_.context_id(); }
    std::vector<int64_t> context_history() const { return state_machine_.context_history(); }

    bool delete_measurement(int64_t voice_entry_id) { return store_.remove(voice_entry_id); }
    void renumber() { store_.renumber(); }
    std::vector<MeasurementRecord> measurements() const { return store_.active_records(); }

    const ScorerStatus& scorer_status() const { return vad_.scorer_status(); }

    PipelineStats stats() const;

private:
    void start_workers();
    void join_workers();

    void processing_loop();
    void recognition_loop();

    /// Runs once, on whichever thread moved the session to Stopped.
    void on_stopped();

    void report(ErrorCode code, const std::string& detail);
    void finish_frames(size_t n);
    void finish_segment();

    AppConfig                           config_;

    // ---- Stages ----
    FeedbackSuppressor                  suppressor_;
    VoiceActivityDetector               vad_;
    SegmentAssembler                    assembler_;
    RecognitionDispatcher               dispatcher_;
    TextClassifier                      classifier_;
    NumericExtractor                    extractor_;
    SessionStateMachine                 state_machine_;
    MeasurementStore                    store_;
    PersistenceSink*                    sink_;
    std::unique_ptr<AudioFrameSource>   source_;

    // ---- Queues and workers ----
    BlockingQueue<AudioFrame>           frames_;
    BlockingQueue<SpeechSegment>        segments_;
    std::thread                         processing_thread_;
    std::thread                         recognition_thread_;
    std::atomic<bool>                   workers_started_{false};
    std::atomic<bool>                   stop_handled_{false};

    // Work submitted but not yet finished, for drain().
    std::mutex                          idle_mu_;
    std::condition_variable             idle_cv_;
    uint64_t                            frames_in_flight_   = 0;
    uint64_t                            segments_in_flight_ = 0;

    // ---- Callbacks ----
    MeasurementCallback                 measurement_cb_;
    CommandCallback                     command_cb_;
    std::mutex                          error_mu_;
    ErrorCallback                       error_cb_;

    // ---- Counters ----
    std::atomic<uint64_t>               frames_received_{0};
    std::atomic<uint64_t>               segments_emitted_{0};
    std::atomic<uint64_t>               segments_discarded_{0};
    std::atomic<uint64_t>               utterances_{0};
    std::atomic<uint64_t>               recognition_failures_{0};
    std::atomic<uint64_t>               recognition_timeouts_{0};
    std::atomic<uint64_t>               commands_{0};
    std::atomic<uint64_t>               measurements_{0};
    std::atomic<uint64_t>               noise_{0};
    std::atomic<uint64_t>               discarded_while_paused_{0};
};

} // namespace mv
