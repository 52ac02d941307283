#include "sconv/core/cancellation.hpp"
#include "sconv/core/format.hpp"
#include "sconv/events/components.hpp"
#include "sconv/events/event_bus.hpp"
#include "sconv/events/event_queue.hpp"
#include "sconv/io/destination.hpp"
#include "sconv/pipeline/config.hpp"
#include "sconv/pipeline/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <boost/algorithm/string/predicate.hpp>

#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kExitSucceeded = 0;
constexpr int kExitFailed = 1;
constexpr int kExitCancelled = 130;

struct CliOptions {
    std::string source;
    std::string destination;
    std::optional<fs::path> config_path;
    std::optional<std::uint64_t> declared_size;
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <source> <destination> [options]\n"
              << "\n"
              << "  <source>        local path, file:// or http(s):// URL\n"
              << "  <destination>   output file, or a directory to place it in\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE   JSON pipeline configuration\n"
              << "  --size BYTES    declared source size (skips the size probe)\n"
              << "  --verbose       debug logging\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = fs::path(argv[++i]);
        } else if (arg == "--size" && i + 1 < argc) {
            const std::string value = argv[++i];
            try {
                std::size_t consumed = 0;
                options.declared_size = std::stoull(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
            } catch (const std::exception&) {
                std::cerr << "Invalid --size value: " << value << "\n";
                return std::nullopt;
            }
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (boost::algorithm::starts_with(arg, "--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return std::nullopt;
    }
    options.source = positional[0];
    options.destination = positional[1];
    return options;
}

/// Last path segment of a path or URL, without query or fragment.
std::string source_file_name(const std::string& source) {
    std::string path = source;
    const auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.erase(cut);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || boost::algorithm::contains(name, ":")) {
        name = "output";
    }
    return name;
}

/// Output name for a source: ".mkv" becomes ".mp4", anything else gains ".mp4".
std::string output_name_for(const std::string& source) {
    fs::path name = source_file_name(source);
    if (boost::algorithm::iequals(name.extension().string(), ".mkv") || !name.has_extension()) {
        name.replace_extension(".mp4");
    } else if (!boost::algorithm::iequals(name.extension().string(), ".mp4")) {
        name += ".mp4";
    }
    return name.string();
}

fs::path resolve_target(const CliOptions& options) {
    fs::path target(options.destination);
    std::error_code ec;
    if (fs::is_directory(target, ec)) {
        target /= output_name_for(options.source);
    }
    return target;
}

std::string make_session_id() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "conv-" + std::to_string(::getpid()) + "-" + std::to_string(now);
}

void print_progress(const sconv::events::HeartbeatEvent& e) {
    spdlog::info("Converting ({}) read={} written={} elapsed={} rate={}",
                 sconv::pipeline::to_string(e.state),
                 sconv::format_bytes(e.bytes_in),
                 sconv::format_bytes(e.bytes_out),
                 sconv::format_duration(e.elapsed),
                 sconv::format_rate(e.bytes_in, e.elapsed));
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return kExitFailed;
    }

    spdlog::set_level(options->verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    sconv::pipeline::PipelineConfig config;
    if (options->config_path) {
        auto loaded = sconv::pipeline::load_config(*options->config_path);
        if (loaded.is_error()) {
            spdlog::error("Configuration error: {}", loaded.error());
            return kExitFailed;
        }
        config = std::move(loaded.value());
    }

    // Block the shutdown signals before any thread starts; the watcher
    // thread collects them with sigwait(). SIGUSR1 only wakes the watcher.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    if (const int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        spdlog::error("Failed to block signals: {}", std::strerror(rc));
        return kExitFailed;
    }

    sconv::CancellationToken cancel;
    std::thread signal_watcher([&signals, &cancel]() {
        while (true) {
            int signal_number = 0;
            if (sigwait(&signals, &signal_number) != 0 || signal_number == SIGUSR1) {
                return;
            }
            spdlog::warn("Received {}, cancelling conversion", strsignal(signal_number));
            cancel.request_cancel();
        }
    });

    const auto target = resolve_target(*options);
    sconv::io::FileDestination destination(target, config.overwrite_existing);

    sconv::events::EventBus bus;
    sconv::events::LoggerComponent logger(bus);
    sconv::events::MetricsComponent metrics(bus);

    const std::string session_id = make_session_id();
    sconv::pipeline::PipelineContext context{session_id, config, bus};
    sconv::events::EventChannel channel(bus, session_id);

    sconv::pipeline::Outcome outcome = sconv::pipeline::Cancelled{};
    std::thread worker([&]() {
        outcome = sconv::pipeline::run_pipeline(context, options->source, destination,
                                                options->declared_size, cancel);
    });

    // Closes after the session's SessionFinishedEvent.
    while (auto event = channel.pop()) {
        if (const auto* heartbeat = std::get_if<sconv::events::HeartbeatEvent>(&*event)) {
            print_progress(*heartbeat);
        }
    }
    worker.join();

    if (const int rc = pthread_kill(signal_watcher.native_handle(), SIGUSR1); rc == 0) {
        signal_watcher.join();
    } else {
        spdlog::warn("Failed to stop signal watcher: {}", std::strerror(rc));
        signal_watcher.detach();
    }

    if (options->verbose) {
        metrics.print_stats();
    }

    if (const auto* ok = std::get_if<sconv::pipeline::Succeeded>(&outcome)) {
        std::cout << ok->output_locator << "\n";
        return kExitSucceeded;
    }
    if (const auto* failed = std::get_if<sconv::pipeline::Failed>(&outcome)) {
        spdlog::error("Conversion failed: {}", failed->error.describe());
        return kExitFailed;
    }
    spdlog::warn("Conversion cancelled");
    return kExitCancelled;
}
