#include "pbu/config/upload_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pbu::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

pbu::Result<json> section(const json& root, const char* name) {
    if (!root.contains(name)) {
        return pbu::Ok(json::object());
    }
    const auto& value = root.at(name);
    if (!value.is_object()) {
        return pbu::Err<json>(ErrorCode::ConfigError, std::string("section '") + name + "' must be an object");
    }
    return pbu::Ok(value);
}

template<typename T>
pbu::Result<void> read_unsigned(const json& object, const char* section_name, const char* key, T& out) {
    if (!object.contains(key)) {
        return pbu::Ok();
    }
    const auto& value = object.at(key);
    if (!value.is_number_unsigned()) {
        return pbu::Err<void>(ErrorCode::ConfigError,
                              std::string(section_name) + "." + key + " must be a non-negative integer");
    }
    out = static_cast<T>(value.get<std::uint64_t>());
    return pbu::Ok();
}

pbu::Result<void> read_string(const json& object, const char* section_name, const char* key, std::string& out) {
    if (!object.contains(key)) {
        return pbu::Ok();
    }
    const auto& value = object.at(key);
    if (!value.is_string()) {
        return pbu::Err<void>(ErrorCode::ConfigError, std::string(section_name) + "." + key + " must be a string");
    }
    out = value.get<std::string>();
    return pbu::Ok();
}

pbu::Result<void> read_bool(const json& object, const char* section_name, const char* key, bool& out) {
    if (!object.contains(key)) {
        return pbu::Ok();
    }
    const auto& value = object.at(key);
    if (!value.is_boolean()) {
        return pbu::Err<void>(ErrorCode::ConfigError, std::string(section_name) + "." + key + " must be a boolean");
    }
    out = value.get<bool>();
    return pbu::Ok();
}

} // namespace

upload::CoordinatorOptions UploadConfig::coordinator_options() const {
    upload::CoordinatorOptions options;
    options.chunk_size = chunk_size;
    options.batch_thread_count = batch_thread_count;
    options.concurrent_thread_count = concurrent_thread_count;
    options.remote_folder = remote_path;
    options.poll_interval = std::chrono::milliseconds(poll_interval_ms);
    options.max_poll_attempts = max_poll_attempts;
    return options;
}

store::LocalUploadStore::Options UploadConfig::store_options() const {
    store::LocalUploadStore::Options options;
    options.root = store_root;
    options.async_finish = async_finish;
    options.async_polls = async_polls;
    return options;
}

pbu::Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    // from_str maps anything unknown to "off"
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return pbu::Err<spdlog::level::level_enum>(ErrorCode::ConfigError, "unknown log level: " + name);
    }
    return pbu::Ok(level);
}

fs::path expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return fs::path(path);
    }
    return fs::path(std::string(home) + path.substr(1));
}

pbu::Result<UploadConfig> parse_config(const std::string& text) {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return pbu::Err<UploadConfig>(ErrorCode::ConfigError, "invalid JSON");
    }
    if (!root.is_object()) {
        return pbu::Err<UploadConfig>(ErrorCode::ConfigError, "configuration must be a JSON object");
    }

    auto paths = section(root, "paths");
    auto limits = section(root, "limits");
    auto finish = section(root, "finish");
    auto store = section(root, "store");
    auto logging = section(root, "logging");
    for (const auto* part : {&paths, &limits, &finish, &store, &logging}) {
        if (part->is_error()) {
            return pbu::Err<UploadConfig>(part->error());
        }
    }

    UploadConfig config;
    std::string local_path = config.local_path.string();
    std::string store_root = config.store_root.string();
    std::string level = "info";

    const pbu::Result<void> reads[] = {
        read_string(paths.value(), "paths", "local_path", local_path),
        read_string(paths.value(), "paths", "remote_path", config.remote_path),
        read_unsigned(limits.value(), "limits", "chunk_size", config.chunk_size),
        read_unsigned(limits.value(), "limits", "batch_thread_count", config.batch_thread_count),
        read_unsigned(limits.value(), "limits", "concurrent_thread_count", config.concurrent_thread_count),
        read_unsigned(finish.value(), "finish", "poll_interval_ms", config.poll_interval_ms),
        read_unsigned(finish.value(), "finish", "max_poll_attempts", config.max_poll_attempts),
        read_string(store.value(), "store", "root", store_root),
        read_bool(store.value(), "store", "async_finish", config.async_finish),
        read_unsigned(store.value(), "store", "async_polls", config.async_polls),
        read_string(logging.value(), "logging", "level", level),
    };
    for (const auto& read : reads) {
        if (read.is_error()) {
            return pbu::Err<UploadConfig>(read.error());
        }
    }

    auto log_level = parse_log_level(level);
    if (log_level.is_error()) {
        return pbu::Err<UploadConfig>(log_level.error());
    }

    config.local_path = expand_home(local_path);
    config.store_root = expand_home(store_root);
    config.log_level = log_level.value();
    return pbu::Ok(std::move(config));
}

pbu::Result<UploadConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return pbu::Err<UploadConfig>(ErrorCode::ConfigError, "cannot read configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace pbu::config
