#include "pbu/config/upload_config.hpp"
#include "pbu/events/components.hpp"
#include "pbu/events/event_bus.hpp"
#include "pbu/store/local_store.hpp"
#include "pbu/upload/batch_coordinator.hpp"
#include "pbu/upload/file_collector.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>   JSON configuration (default: config.json)\n"
              << "  -v, --verbose         Log every chunk append\n"
              << "  -h, --help            Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    fs::path config_path = "config.json";
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    auto config = pbu::config::load_config(config_path);
    if (config.is_error()) {
        spdlog::error("Configuration error: {}", config.error().message);
        return 2;
    }
    const auto& settings = config.value();
    spdlog::set_level(verbose ? spdlog::level::debug : settings.log_level);

    auto files = pbu::upload::collect_files(settings.local_path);
    if (files.is_error()) {
        spdlog::error("{}", files.error().to_string());
        return 1;
    }
    if (files.value().empty()) {
        spdlog::warn("Nothing to upload in '{}'", settings.local_path.string());
        return 0;
    }

    pbu::events::EventBus event_bus;
    pbu::events::LoggerComponent logger(event_bus);
    pbu::events::MetricsComponent metrics(event_bus);

    pbu::store::LocalUploadStore store(settings.store_options());
    pbu::upload::BatchCoordinator coordinator(store, settings.coordinator_options(), event_bus);

    const auto started = std::chrono::steady_clock::now();
    std::size_t committed_entries = 0;
    std::size_t failed_entries = 0;
    std::uint64_t uploaded_size = 0;

    for (const auto& batch : pbu::upload::split_into_batches(files.value())) {
        auto report = coordinator.upload(batch);
        if (report.is_error()) {
            spdlog::error("Batch aborted: {}", report.error().to_string());
            metrics.print_stats();
            return 1;
        }
        committed_entries += report.value().succeeded;
        failed_entries += report.value().failed;
        uploaded_size += report.value().bytes_uploaded;
    }

    spdlog::info("Committed {} of {} files ({} failed).", committed_entries, files.value().size(), failed_entries);
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    spdlog::info("Uploaded {} bytes in {:.2f} seconds.", uploaded_size, elapsed);
    if (elapsed > 0.0) {
        const double megabytes = static_cast<double>(uploaded_size) / static_cast<double>(pbu::upload::kMiB);
        spdlog::info("Approximate overall speed: {:.2f} MB/s.", megabytes / elapsed);
    }
    metrics.print_stats();

    return failed_entries == 0 ? 0 : 1;
}
