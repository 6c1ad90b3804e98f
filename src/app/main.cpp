/**
 * @file main.cpp
 * @brief AutoTune command-line entry point.
 *
 * Wires all modules into a complete experiment:
 *   Config → Logger → EventChannel → Tuner → TrialRunner → Scheduler → Telemetry
 */

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/experiment.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/trial_recorder.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace autotune;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint32_t budget_seconds = 0;
    uint32_t cancel_after_ms = 0;
    std::string tuner;
    uint32_t parallelism = 0;
    std::string log_dir;
    bool verbose = false;
};

void print_usage() {
    std::cout << "Usage: autotune [OPTIONS]\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --budget <seconds>     Training time budget\n"
              << "  --cancel-after <ms>    Cancel the experiment after a delay\n"
              << "  --tuner <name>         Tuner: random | grid\n"
              << "  --parallelism <n>      Trials run concurrently\n"
              << "  --log-dir <path>       Log output directory (\"-\" for stdout)\n"
              << "  --verbose              Debug-level logging\n"
              << "  --help, -h             Show this help message\n";
}

/// Store a numeric option in @p out; false (with a message) when malformed.
bool read_uint32(const char* option, const char* text, uint32_t& out) {
    auto value = parse_uint32(text);
    if (!value) {
        std::cerr << "Invalid value for " << option << ": " << value.error().message << "\n";
        return false;
    }
    out = *value;
    return true;
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--budget" && i + 1 < argc) {
            if (!read_uint32("--budget", argv[++i], args.budget_seconds)) return std::nullopt;
        } else if (arg == "--cancel-after" && i + 1 < argc) {
            if (!read_uint32("--cancel-after", argv[++i], args.cancel_after_ms)) return std::nullopt;
        } else if (arg == "--tuner" && i + 1 < argc) {
            args.tuner = argv[++i];
        } else if (arg == "--parallelism" && i + 1 < argc) {
            if (!read_uint32("--parallelism", argv[++i], args.parallelism)) return std::nullopt;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const Config& config, const std::string& prefix) {
    if (config.telemetry.log_dir.empty() || config.telemetry.log_dir == "-") {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(config.telemetry.log_dir, prefix,
                                          config.telemetry.max_file_size_mb,
                                          config.telemetry.rotate_count);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 2;
    }
    const auto& args = *parsed;

    // Load configuration
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    } else {
        std::cerr << "Config " << args.config_path << " not found, using defaults." << std::endl;
    }

    // Apply CLI overrides
    if (args.budget_seconds != 0) config.experiment.training_time_seconds = args.budget_seconds;
    if (!args.tuner.empty()) config.tuner.kind = args.tuner;
    if (args.parallelism != 0) config.experiment.parallelism = args.parallelism;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.verbose) config.telemetry.log_level = "debug";

    // ── Build the experiment ─────────────────
    Experiment experiment(Experiment::Options{
        .log_sink = make_sink(config, "autotune"),
        .log_level = LogLevel::Info
    });
    if (auto configured = experiment.configure(config); !configured) {
        std::cerr << "Invalid configuration: " << configured.error().message << std::endl;
        return 1;
    }

    std::optional<TrialEventRecorder> recorder;
    if (config.telemetry.record_trials) {
        recorder.emplace(experiment.events(), make_sink(config, "autotune_trials"));
    }

    experiment.logger().info("main", "AutoTune starting: budget "
        + std::to_string(config.experiment.training_time_seconds) + "s, tuner "
        + config.tuner.kind + ", " + std::to_string(config.search_space.size())
        + " parameters");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source cancel;
    std::optional<DelayedCancellation> cancel_timer;
    if (args.cancel_after_ms != 0) {
        cancel_timer.emplace(cancel, Duration{args.cancel_after_ms});
    }

    // ── Run, forwarding Ctrl+C as cancellation ─
    auto start = SteadyClock::now();
    auto future = experiment.run_async(cancel.get_token());
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_shutdown_requested && !cancel.stop_requested()) {
            experiment.logger().warn("main", "Shutdown requested, cancelling experiment");
            cancel.request_stop();
        }
    }
    auto elapsed = std::chrono::duration_cast<Duration>(SteadyClock::now() - start);

    Result<TrialResult> result = Error{ErrorCode::Generic, "experiment did not run"};
    try {
        result = future.get();
    } catch (const std::exception& e) {
        experiment.logger().error("main", std::string{"Experiment failed: "} + e.what());
        std::cerr << "Experiment aborted: " << e.what() << std::endl;
        return 1;
    }

    auto history = experiment.history();
    std::optional<TrialResult> best;
    if (result) best = *result;
    if (recorder) {
        recorder->record_summary(to_string(experiment.last_stop_reason()),
                                 history.size(), best, elapsed);
    }

    if (!result) {
        std::cerr << "Experiment ended without a result ("
                  << to_string(result.error().code) << "): "
                  << result.error().message << std::endl;
        return result.error().is(ErrorCode::Timeout) ? 3 : 1;
    }

    std::cout << "Best trial " << result->trial_id()
              << " metric " << result->metric
              << " parameters " << to_json(result->settings->parameters)
              << " (" << history.size() << " trials, "
              << to_string(experiment.last_stop_reason()) << ", "
              << elapsed.count() << "ms)" << std::endl;
    return 0;
}
