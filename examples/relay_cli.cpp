/**
 * @file relay_cli.cpp
 * @brief Run one transfer from a file or stdin to the configured destination
 *
 * Usage:
 *   relay_cli <config.json> <source|-> [--name N] [--kind K] [--size N] [--folder ID]
 *
 *   source   path of a local file, or "-" to read stdin
 *   --name   object name at the destination (defaults to the file name, or a
 *            timestamped name derived from --kind for stdin)
 *   --kind   document|photo|video|animation|audio|voice
 *   --size   declared byte count; a different staged size fails the transfer
 *   --folder destination folder id, overrides destination.folder_id
 *
 * Progress and diagnostics go to the log; the outcome is printed to stdout
 * as JSON. Ctrl+C cancels the transfer and removes the staged file.
 *
 * Try it against the local receiver:
 *   ./build/relay_receiver 8080 &
 *   echo '{"destination": {"kind": "http", "port": 8080}}' > relay.json
 *   ./build/relay_cli relay.json ./photo.jpg
 */

#include "relay/core/cancellation.hpp"
#include "relay/core/config.hpp"
#include "relay/events/components.hpp"
#include "relay/events/event_bus.hpp"
#include "relay/transfer/http_destination.hpp"
#include "relay/transfer/memory_destination.hpp"
#include "relay/transfer/mime.hpp"
#include "relay/transfer/orchestrator.hpp"
#include "relay/transfer/source.hpp"
#include "relay/transfer/staging.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = 1;
    }
}

struct CliOptions {
    fs::path config_path;
    std::string source;
    std::string name;
    relay::transfer::MediaKind kind = relay::transfer::MediaKind::Document;
    std::optional<std::uint64_t> declared_size;
    std::optional<std::string> folder_id;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <config.json> <source|-> [--name N] [--kind K] [--size N] [--folder ID]\n";
}

relay::Result<CliOptions> parse_arguments(int argc, char* argv[]) {
    if (argc < 3) {
        return relay::Err(std::string("Missing arguments"));
    }

    CliOptions options;
    options.config_path = argv[1];
    options.source = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i + 1 >= argc) {
            return relay::Err("Option " + arg + " needs a value");
        }
        const std::string value = argv[++i];

        if (arg == "--name") {
            options.name = value;
        } else if (arg == "--kind") {
            auto kind = relay::transfer::media_kind_from_string(value);
            if (!kind) {
                return relay::Err("Unknown media kind: " + value);
            }
            options.kind = *kind;
        } else if (arg == "--size") {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                return relay::Err("Invalid size: " + value);
            }
            options.declared_size = std::stoull(value);
        } else if (arg == "--folder") {
            options.folder_id = value;
        } else {
            return relay::Err("Unknown option: " + arg);
        }
    }
    return relay::Ok(options);
}

json outcome_to_json(const relay::transfer::TransferOutcome& outcome) {
    json j;
    if (outcome.is_ok()) {
        const auto& object = outcome.value();
        j["status"] = "completed";
        j["id"] = object.id;
        j["name"] = object.name;
        j["mime_type"] = object.mime_type;
        j["size"] = object.size;
        j["link"] = object.link;
        j["published"] = object.published;
        return j;
    }

    const auto& error = outcome.error();
    j["status"] = error.is_cancelled() ? "cancelled" : "failed";
    j["stage"] = relay::to_string(error.stage);
    j["retryability"] = relay::to_string(error.retryability);
    j["message"] = error.describe();
    j["cursor"] = error.cursor;
    j["attempts"] = error.attempts;
    if (error.status_code != 0) {
        j["status_code"] = error.status_code;
    }
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = parse_arguments(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error() << "\n";
        print_usage(argv[0]);
        return 2;
    }
    const CliOptions cli = parsed.value();

    auto loaded = relay::load_config(cli.config_path);
    if (loaded.is_error()) {
        spdlog::error("Configuration error: {}", loaded.error());
        return 2;
    }
    const relay::RelayConfig config = loaded.value();
    spdlog::set_level(relay::parse_log_level(config.log_level).value_or(spdlog::level::info));

    // ────────────────────────────────────────
    // Staging area, destination, observers
    // ────────────────────────────────────────
    relay::transfer::StagingStore staging(config.staging_dir);
    if (auto purged = staging.purge_orphans(); purged > 0) {
        spdlog::info("Removed {} staged file(s) left by earlier runs", purged);
    }

    std::unique_ptr<relay::transfer::Destination> destination;
    if (config.destination.kind == relay::DestinationKind::Http) {
        destination = std::make_unique<relay::transfer::HttpDestination>(
            relay::make_http_destination_options(config));
    } else {
        spdlog::info("Using in-memory destination (dry run)");
        destination = std::make_unique<relay::transfer::MemoryDestination>();
    }

    relay::events::EventBus bus;
    relay::events::LoggerComponent logger(bus);
    relay::events::MetricsComponent metrics(bus);

    relay::transfer::TransferOrchestrator orchestrator(
        relay::make_orchestrator_options(config), staging, *destination, bus);

    // ────────────────────────────────────────
    // Request
    // ────────────────────────────────────────
    relay::transfer::TransferRequest request;
    if (cli.source == "-") {
        try {
            request.source = std::make_shared<relay::transfer::DescriptorSource>(STDIN_FILENO, cli.declared_size);
        } catch (const std::exception& e) {
            spdlog::error("Cannot read standard input: {}", e.what());
            return 2;
        }
    } else {
        std::error_code ec;
        if (!fs::is_regular_file(cli.source, ec)) {
            spdlog::error("Source is not a readable file: {}", cli.source);
            return 2;
        }
        request.source = std::make_shared<relay::transfer::FileSource>(cli.source);
    }

    request.name = cli.name;
    if (request.name.empty() && cli.source != "-") {
        request.name = fs::path(cli.source).filename().string();
    }
    if (request.name.empty()) {
        request.name = relay::transfer::default_object_name(cli.kind, std::chrono::system_clock::now());
    }
    request.declared_size = cli.declared_size;
    request.folder_id = cli.folder_id.value_or(config.destination.folder_id);

    // ────────────────────────────────────────
    // Run, cancelling on Ctrl+C
    // ────────────────────────────────────────
    relay::CancellationToken cancel;
    std::atomic<bool> finished{false};
    std::signal(SIGINT, signal_handler);

    std::thread watcher([&]() {
        while (!finished.load()) {
            if (g_interrupted) {
                spdlog::warn("Interrupted, cancelling transfer");
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    auto outcome = orchestrator.run(request, cancel);
    finished = true;
    watcher.join();

    std::cout << outcome_to_json(outcome).dump(2) << std::endl;
    metrics.print_stats();

    if (outcome.is_ok()) {
        return 0;
    }
    return outcome.error().is_cancelled() ? 130 : 1;
}
