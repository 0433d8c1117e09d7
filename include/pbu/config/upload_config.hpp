#pragma once

#include "pbu/core/result.hpp"
#include "pbu/store/local_store.hpp"
#include "pbu/upload/batch_coordinator.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pbu::config {

/**
 * @brief Settings of one upload run
 *
 * JSON layout (every key optional):
 * {
 *   "paths":   { "local_path": "~/upload", "remote_path": "/Uploads" },
 *   "limits":  { "chunk_size": 8388608, "batch_thread_count": 4, "concurrent_thread_count": 8 },
 *   "finish":  { "poll_interval_ms": 500, "max_poll_attempts": 0 },
 *   "store":   { "root": "./remote", "async_finish": false, "async_polls": 0 },
 *   "logging": { "level": "info" }
 * }
 */
struct UploadConfig {
    std::filesystem::path local_path = ".";
    std::string remote_path = "/";

    std::uint64_t chunk_size = 8 * upload::kMiB;
    std::size_t batch_thread_count = 4;
    std::size_t concurrent_thread_count = 8;

    std::uint64_t poll_interval_ms = 500;
    std::size_t max_poll_attempts = 0;

    std::filesystem::path store_root = "./remote";
    bool async_finish = false;
    std::size_t async_polls = 0;

    spdlog::level::level_enum log_level = spdlog::level::info;

    upload::CoordinatorOptions coordinator_options() const;
    store::LocalUploadStore::Options store_options() const;
};

/// Parse JSON text; missing keys keep their defaults.
pbu::Result<UploadConfig> parse_config(const std::string& text);

pbu::Result<UploadConfig> load_config(const std::filesystem::path& path);

pbu::Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

/// Replace a leading "~" with $HOME.
std::filesystem::path expand_home(const std::string& path);

} // namespace pbu::config
