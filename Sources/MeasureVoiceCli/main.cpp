#include "AudioConverter.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "MeasurementDatabase.hpp"
#include "MeasurementPipeline.hpp"
#include "WhisperEngine.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
    g_interrupted = true;
}

struct Options {
    std::string config_path;
    std::string db_path;
    std::string model_path;
    std::string replay_path;
    bool        debug = false;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --config <file>   JSON configuration\n"
              << "  --db <file>       measurement database (overrides config)\n"
              << "  --model <file>    whisper model (overrides config)\n"
              << "  --replay <file>   feed an audio file instead of the microphone\n"
              << "  --debug           debug logging\n"
              << "\n"
              << "Keys while running:\n"
              << "  Enter / p   pause or resume\n"
              << "  s / q       stop\n"
              << "  d <id>      delete measurement <id>\n"
              << "  r           renumber rows\n"
              << "  l           list measurements\n"
              << "  c           show context id\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--db") {
            if (!next(opts.db_path)) return false;
        } else if (arg == "--model") {
            if (!next(opts.model_path)) return false;
        } else if (arg == "--replay") {
            if (!next(opts.replay_path)) return false;
        } else if (arg == "--debug") {
            opts.debug = true;
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

void print_records(const std::vector<mv::MeasurementRecord>& records) {
    if (records.empty()) {
        std::cout << "(no measurements)\n";
        return;
    }
    for (const auto& r : records) {
        std::cout << "  row " << r.row_id << "  #" << r.voice_entry_id
                  << "  context " << r.context_id << "  value " << r.value
                  << "  \"" << r.raw_text << "\"\n";
    }
}

/// Handle one line typed by the operator.
void handle_key(mv::MeasurementPipeline& pipeline, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;

    if (cmd.empty() || cmd == "p") {
        pipeline.on_key_toggle();
        std::cout << "[" << mv::session_state_to_string(pipeline.state()) << "]\n";
    } else if (cmd == "s" || cmd == "q") {
        pipeline.on_key_stop();
    } else if (cmd == "d") {
        int64_t id = 0;
        if (!(in >> id)) {
            std::cout << "usage: d <id>\n";
        } else if (pipeline.delete_measurement(id)) {
            std::cout << "deleted #" << id << "\n";
        } else {
            std::cout << "no live measurement #" << id << "\n";
        }
    } else if (cmd == "r") {
        pipeline.renumber();
        print_records(pipeline.measurements());
    } else if (cmd == "l") {
        print_records(pipeline.measurements());
    } else if (cmd == "c") {
        std::cout << "context " << pipeline.context_id() << "\n";
    } else {
        std::cout << "unknown key '" << cmd << "'\n";
    }
}

/// Read operator lines until the session stops.
void keyboard_loop(mv::MeasurementPipeline& pipeline) {
    std::string buffer;
    while (pipeline.state() != mv::SessionState::stopped) {
        if (g_interrupted.load()) {
            pipeline.on_key_stop();
            break;
        }
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int rc = poll(&pfd, 1, 200);
        if (rc <= 0) continue;

        char chunk[256];
        ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
        if (n <= 0) {
            // stdin closed: keep running until a voice or signal stop.
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }
        buffer.append(chunk, static_cast<size_t>(n));

        size_t nl;
        while ((nl = buffer.find('\n')) != std::string::npos) {
            handle_key(pipeline, buffer.substr(0, nl));
            buffer.erase(0, nl + 1);
        }
    }
}

/// Push a decoded file through the pipeline in capture-sized frames.
void replay_file(mv::MeasurementPipeline& pipeline, const mv::AppConfig& config,
                 const std::string& path) {
    std::vector<float> pcm = mv::AudioConverter::decode_file(path, config.audio.sample_rate);

    // Trailing silence so the last utterance reaches its endpoint.
    const int tail_ms = config.vad.min_silence_duration_ms + config.segment.speech_padding_ms;
    pcm.resize(pcm.size() + static_cast<size_t>(config.audio.sample_rate) * tail_ms / 1000, 0.0f);

    const size_t hop = static_cast<size_t>(config.audio.hop_size);
    const size_t batch = std::max<size_t>(1, config.audio.queue_capacity / 2);
    uint64_t sequence = 0;
    const auto t0 = std::chrono::steady_clock::now();

    for (size_t off = 0; off + hop <= pcm.size(); off += hop) {
        if (pipeline.state() == mv::SessionState::stopped || g_interrupted.load()) return;

        mv::AudioFrame frame;
        frame.sequence       = sequence++;
        frame.sample_rate    = config.audio.sample_rate;
        frame.captured_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        frame.samples.assign(pcm.begin() + static_cast<std::ptrdiff_t>(off),
                             pcm.begin() + static_cast<std::ptrdiff_t>(off + hop));
        pipeline.submit_frame(std::move(frame));

        // Keep the bounded frame queue from overflowing.
        if (sequence % batch == 0) {
            while (!pipeline.drain(std::chrono::milliseconds(200))) {
                if (pipeline.state() == mv::SessionState::stopped || g_interrupted.load()) return;
            }
        }
    }
    while (!pipeline.drain(std::chrono::milliseconds(200))) {
        if (pipeline.state() == mv::SessionState::stopped || g_interrupted.load()) return;
    }
}

void print_summary(const mv::MeasurementPipeline& pipeline) {
    const mv::PipelineStats s = pipeline.stats();
    std::cout << "\nSession summary\n"
              << "  frames received      " << s.frames_received << "\n"
              << "  frames dropped       " << s.frames_dropped << "\n"
              << "  frames suppressed    " << s.frames_suppressed << "\n"
              << "  segments             " << s.segments_emitted
              << " (" << s.segments_discarded << " discarded)\n"
              << "  utterances           " << s.utterances << "\n"
              << "  commands             " << s.commands << "\n"
              << "  measurements         " << s.measurements << "\n"
              << "  noise                " << s.noise << "\n"
              << "  paused, discarded    " << s.discarded_while_paused << "\n"
              << "  recognition failures " << s.recognition_failures
              << " (" << s.recognition_timeouts << " timeouts, "
              << s.late_results_discarded << " late results dropped)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    mv::AppConfig config;
    try {
        config = mv::load_config(opts.config_path);
        if (!opts.db_path.empty())    config.store.database_path   = opts.db_path;
        if (!opts.model_path.empty()) config.recognition.model_path = opts.model_path;
        mv::validate_config(config);
    } catch (const mv::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }

    mv::Logger::set_level(opts.debug ? mv::LogLevel::debug
                                     : mv::log_level_from_string(config.log.level));
    if (!config.log.file.empty() && !mv::Logger::set_file(config.log.file)) {
        std::cerr << "Cannot open log file " << config.log.file << "\n";
    }

    mv::MeasurementDatabase db(config.store.database_path);
    if (!db.open()) {
        std::cerr << "Cannot open database " << config.store.database_path << "\n";
        return 1;
    }

    mv::WhisperEngine engine(config.recognition);
    if (!engine.init()) {
        std::cerr << "Cannot load whisper model " << config.recognition.model_path << "\n";
        return 1;
    }

    mv::MeasurementPipeline pipeline(config, engine, &db);
    pipeline.restore_from_sink();

    pipeline.set_measurement_callback([](const mv::MeasurementRecord& r) {
        std::cout << "#" << r.voice_entry_id << " row " << r.row_id << " context "
                  << r.context_id << ": " << r.value << "\n";
    });
    pipeline.set_command_callback([&pipeline](const mv::Command& c, const std::string& text) {
        std::cout << "command " << mv::command_kind_to_string(c.kind) << " (\"" << text
                  << "\") -> " << mv::session_state_to_string(pipeline.state())
                  << ", context " << pipeline.context_id() << "\n";
    });
    pipeline.set_error_callback([](mv::ErrorCode code, const std::string& detail) {
        std::cerr << mv::error_code_to_string(code) << ": " << detail << "\n";
    });

    int status = 0;
    try {
        if (!opts.replay_path.empty()) {
            pipeline.start_external();
            replay_file(pipeline, config, opts.replay_path);
            pipeline.on_key_stop();
        } else {
            pipeline.start();
            std::cout << "Recording. Press Enter to pause, s to stop.\n";
            keyboard_loop(pipeline);
        }
        pipeline.wait_until_stopped();
    } catch (const mv::DeviceUnavailable& e) {
        std::cerr << "Audio device unavailable: " << e.what() << "\n";
        status = 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        pipeline.on_key_stop();
        status = 1;
    }

    print_summary(pipeline);
    std::cout << "\nMeasurements\n";
    print_records(pipeline.measurements());
    return status;
}
