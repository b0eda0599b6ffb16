#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "cuerpo/dispatcher.hpp"
#include "cuerpo/midi_sink.hpp"
#include "cuerpo/osc_sink.hpp"
#include "cuerpo/recording.hpp"
#include "cuerpo/session.hpp"
#include "cuerpo/session_config.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_sigint(int) { g_stop_requested = 1; }

struct CliOptions {
    std::string config_path;
    std::string replay_path;       // Empty = stdin
    std::string osc_target;        // host:port
    bool osc_bundle = false;
    std::string midi_path;
    std::string dump_path;
    bool realtime = false;
    bool verbose = false;
};

void print_usage() {
    std::cout << "cuerpo_sonoro Options:\n"
              << "  --config <path>          Session configuration (or CUERPO_CONFIG_PATH)\n"
              << "  --replay <path>          JSON-lines landmark recording (default: stdin)\n"
              << "  --osc <host:port>        Send the parameter and note stream over OSC/UDP\n"
              << "  --osc-bundle             Bundle the per-frame parameter updates\n"
              << "  --midi <path>            Write MPE MIDI bytes to a raw MIDI device\n"
              << "  --dump-features <path>   Write one feature snapshot per frame (JSON lines)\n"
              << "  --realtime               Pace replay by the frame timestamps\n"
              << "  --verbose                Log zone changes and note events\n"
              << "  --help                   Show this help\n\n";
}

void split_host_port(const std::string& target, std::string& host, uint16_t& port) {
    std::size_t colon = target.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == target.size()) {
        throw std::invalid_argument("--osc expects host:port, got '" + target + "'");
    }
    host = target.substr(0, colon);
    int p = 0;
    try {
        p = std::stoi(target.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("--osc port is not a number: '" + target + "'");
    }
    if (p <= 0 || p > 65535) throw std::invalid_argument("--osc port out of range: " + std::to_string(p));
    port = static_cast<uint16_t>(p);
}

cuerpo::SessionConfig load_config(const CliOptions& opts) {
    std::string path = opts.config_path;
    if (path.empty()) {
        if (const char* env_path = std::getenv("CUERPO_CONFIG_PATH"); env_path && *env_path) {
            path = env_path;
        }
    }
    if (path.empty()) {
        throw std::runtime_error("no configuration given (--config or CUERPO_CONFIG_PATH); "
                                 "hysteresis_margin, jerk_onset_threshold, min_retrigger_interval "
                                 "and the smoothing alphas have no defaults");
    }

    cuerpo::SessionConfig config;
    if (!config.load_from_file(path)) {
        // Session construction reports every violation
        std::cerr << "[Config] " << path << " is incomplete or out of range\n";
    }
    if (opts.verbose) config.verbose = true;
    return config;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << flag << " requires a value\n";
                std::exit(EXIT_FAILURE);
            }
            return argv[++i];
        };
        if (arg == "--config") opts.config_path = value("--config");
        else if (arg == "--replay") opts.replay_path = value("--replay");
        else if (arg == "--osc") opts.osc_target = value("--osc");
        else if (arg == "--osc-bundle") opts.osc_bundle = true;
        else if (arg == "--midi") opts.midi_path = value("--midi");
        else if (arg == "--dump-features") opts.dump_path = value("--dump-features");
        else if (arg == "--realtime") opts.realtime = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return EXIT_FAILURE;
        }
    }

    try {
        cuerpo::SessionConfig config = load_config(opts);
        cuerpo::Session session(config);

        // Sinks are declared before their dispatchers so the drain in stop() still has them
        std::vector<std::unique_ptr<cuerpo::OutputSink>> sinks;
        if (!opts.osc_target.empty()) {
            cuerpo::OscSinkConfig osc_cfg;
            split_host_port(opts.osc_target, osc_cfg.host, osc_cfg.port);
            osc_cfg.bundle_parameters = opts.osc_bundle;
            osc_cfg.verbose = config.verbose;
            auto osc = std::make_unique<cuerpo::OscSink>(osc_cfg);
            if (!osc->open()) throw std::runtime_error("cannot open OSC sink: " + osc->last_error());
            sinks.push_back(std::move(osc));
        }
        if (!opts.midi_path.empty()) {
            cuerpo::MidiSinkConfig midi_cfg;
            midi_cfg.device_path = opts.midi_path;
            midi_cfg.verbose = config.verbose;
            auto midi = std::make_unique<cuerpo::MidiSink>(midi_cfg);
            if (!midi->open()) throw std::runtime_error("cannot open MIDI sink: " + midi->last_error());
            sinks.push_back(std::move(midi));
        }
        if (sinks.empty()) {
            std::cerr << "[Main] No output configured (--osc / --midi); running dry\n";
        }

        cuerpo::DispatchConfig dispatch_cfg;
        dispatch_cfg.verbose = config.verbose;
        std::vector<std::unique_ptr<cuerpo::MessageDispatcher>> dispatchers;
        for (auto& sink : sinks) {
            dispatchers.push_back(std::make_unique<cuerpo::MessageDispatcher>(*sink, dispatch_cfg));
            dispatchers.back()->start();
        }

        std::ofstream dump;
        if (!opts.dump_path.empty()) {
            dump.open(opts.dump_path);
            if (!dump.is_open()) throw std::runtime_error("cannot write " + opts.dump_path);
        }

        std::ifstream replay_file;
        if (!opts.replay_path.empty()) {
            replay_file.open(opts.replay_path);
            if (!replay_file.is_open()) throw std::runtime_error("cannot open recording " + opts.replay_path);
        }
        std::istream& input = opts.replay_path.empty() ? std::cin : replay_file;
        cuerpo::RecordingReader reader(input);

        std::signal(SIGINT, handle_sigint);

        auto publish = [&dispatchers](const cuerpo::MessageBatch& batch) {
            for (auto& d : dispatchers) d->submit(batch);
        };

        auto wall_start = std::chrono::steady_clock::now();
        bool have_first = false;
        double first_t = 0.0;
        cuerpo::LandmarkFrame frame;
        cuerpo::MessageBatch batch;
        while (!g_stop_requested && reader.next(frame)) {
            if (opts.realtime) {
                if (!have_first) {
                    first_t = frame.timestamp;
                    have_first = true;
                }
                auto due = wall_start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                            std::chrono::duration<double>(frame.timestamp - first_t));
                std::this_thread::sleep_until(due);
            }

            batch.clear();
            if (!session.process(frame, batch)) continue;
            publish(batch);
            if (dump.is_open() && session.last_features()) {
                dump << session.last_features()->to_json() << "\n";
            }
        }

        batch.clear();
        session.end(batch);
        publish(batch);
        for (auto& d : dispatchers) d->stop();

        const auto& stats = session.stats();
        std::cerr << "[Main] " << stats.frames_processed << " frames processed, "
                  << stats.frames_rejected << " rejected, " << stats.zone_changes << " zone changes, "
                  << stats.onsets << " onsets, " << stats.messages_emitted << " messages\n";
        for (std::size_t i = 0; i < dispatchers.size(); ++i) {
            auto ds = dispatchers[i]->get_stats();
            std::cerr << "[Main] " << sinks[i]->name() << ": " << ds.delivered << " delivered, "
                      << ds.superseded << " superseded, " << ds.dropped << " dropped, "
                      << ds.compensations << " compensated, " << dispatchers[i]->parked() << " parked\n";
        }
        if (reader.skipped_lines() > 0) {
            std::cerr << "[Main] " << reader.skipped_lines() << " malformed recording lines skipped\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return 0;
}
