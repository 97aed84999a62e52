#include "chunkgate/core/config.hpp"
#include "chunkgate/events/components.hpp"
#include "chunkgate/events/event_bus.hpp"
#include "chunkgate/transfer/byte_source.hpp"
#include "chunkgate/transfer/chunk_sink.hpp"
#include "chunkgate/transfer/driver.hpp"
#include "chunkgate/transfer/status.hpp"
#include "chunkgate/transfer/store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using chunkgate::TransferConfig;
using chunkgate::transfer::TransferOutcome;

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> output_dir;
    std::vector<std::string> files;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config FILE] [--output DIR] FILE...\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            options.output_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            options.files.push_back(arg);
        }
    }
    if (options.files.empty()) {
        return std::nullopt;
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    TransferConfig config;
    if (options->config_path) {
        auto loaded = chunkgate::load_config(*options->config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error());
            return 2;
        }
        config = loaded.value();
    }
    if (options->output_dir) {
        config.output_dir = *options->output_dir;
    }

    // Already validated by load_config; the default is always valid.
    spdlog::set_level(chunkgate::parse_log_level(config.log_level).value_or(spdlog::level::info));

    spdlog::info("chunkgate: chunk size {} bytes, {} workers, output {}",
                 config.chunk_size, config.worker_threads, config.output_dir.string());

    chunkgate::events::EventBus bus;
    chunkgate::events::LoggerComponent logger(bus);
    chunkgate::events::MetricsComponent metrics(bus);
    chunkgate::events::EventHistory history(bus, config.history_size);

    chunkgate::transfer::TransferStore store(config.chunk_size,
                                             std::make_shared<chunkgate::transfer::FileByteSource>(),
                                             bus);

    chunkgate::transfer::DriverOptions driver_options;
    driver_options.max_failures = config.max_failures;
    driver_options.worker_threads = config.worker_threads;
    chunkgate::transfer::TransferDriver driver(store, bus,
                                               chunkgate::transfer::make_file_sink_factory(config.output_dir),
                                               driver_options);

    bool all_registered = true;
    for (const auto& file : options->files) {
        auto descriptor = chunkgate::transfer::describe_file(file);
        if (descriptor.is_error()) {
            spdlog::error("{}", descriptor.error());
            all_registered = false;
            continue;
        }
        store.register_source(descriptor.value());
    }

    driver.wait_idle();

    const auto reports = driver.reports();
    nlohmann::json status = chunkgate::transfer::status_to_json(store.snapshot(), history.recent());
    status["reports"] = nlohmann::json::array();
    bool all_completed = all_registered;
    for (const auto& report : reports) {
        status["reports"].push_back(chunkgate::transfer::report_to_json(report));
        if (report.outcome != TransferOutcome::Completed) {
            all_completed = false;
        }
    }
    std::cout << status.dump(2) << std::endl;

    const auto& stats = metrics.get_stats();
    spdlog::info("Transfers: {} completed, {} abandoned, {} bytes delivered",
                 stats.transfers_completed.load(), stats.transfers_abandoned.load(),
                 stats.bytes_delivered.load());

    return all_completed ? 0 : 1;
}
