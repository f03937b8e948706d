#pragma once
// =============================================================================
// Scry Config Loader
// =============================================================================
// Loads settings from scry.json with nlohmann/json. Missing file or keys fall
// back to defaults.
// =============================================================================

#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include "scry_log.hpp"

namespace scry {
namespace config {

struct AdbConfig {
    std::string path = "adb";
};

struct StreamConfig {
    // 720x1600 is the most stable capture size over USB 2.0
    int width = 720;
    int height = 1600;
    int bit_rate = 8000000;
};

struct InputConfig {
    int swipe_step_ms = 30;
    int busy_timeout_ms = 2000;
};

struct TransferConfig {
    std::string download_dir = "/sdcard/Download/";
    int chunk_size = 64 * 1024;
};

struct SessionConfig {
    int max_reconnect_attempts = 1;
    int max_consecutive_decode_errors = 3;
};

struct LogConfig {
    std::string log_path = "scry.log";
    std::string level = "info";
};

struct AppConfig {
    AdbConfig adb;
    StreamConfig stream;
    InputConfig input;
    TransferConfig transfer;
    SessionConfig session;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.is_object() || !j.contains(section)) return def;
    const auto& sec = j[section];
    if (!sec.is_object() || !sec.contains(key)) return def;
    try {
        return sec[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        SLOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "scry.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("../scry.json");
    }
    if (!file.is_open()) {
        SLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        const AppConfig def;

        config.adb.path = jsonGet<std::string>(j, "adb", "path", def.adb.path);

        config.stream.width = jsonGet<int>(j, "stream", "width", def.stream.width);
        config.stream.height = jsonGet<int>(j, "stream", "height", def.stream.height);
        config.stream.bit_rate = jsonGet<int>(j, "stream", "bit_rate", def.stream.bit_rate);

        config.input.swipe_step_ms = jsonGet<int>(j, "input", "swipe_step_ms", def.input.swipe_step_ms);
        config.input.busy_timeout_ms = jsonGet<int>(j, "input", "busy_timeout_ms", def.input.busy_timeout_ms);

        config.transfer.download_dir = jsonGet<std::string>(j, "transfer", "download_dir", def.transfer.download_dir);
        config.transfer.chunk_size = jsonGet<int>(j, "transfer", "chunk_size", def.transfer.chunk_size);

        config.session.max_reconnect_attempts =
            jsonGet<int>(j, "session", "max_reconnect_attempts", def.session.max_reconnect_attempts);
        config.session.max_consecutive_decode_errors =
            jsonGet<int>(j, "session", "max_consecutive_decode_errors", def.session.max_consecutive_decode_errors);

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);
        config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);
    } catch (const nlohmann::json::exception& e) {
        SLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    if (config.stream.width <= 0 || config.stream.height <= 0) {
        SLOG_WARN("config", "Invalid stream size %dx%d, using defaults",
                  config.stream.width, config.stream.height);
        config.stream = StreamConfig{};
    }
    if (!config.transfer.download_dir.empty() && config.transfer.download_dir.back() != '/') {
        config.transfer.download_dir.push_back('/');
    }
    if (config.transfer.chunk_size <= 0) config.transfer.chunk_size = TransferConfig{}.chunk_size;
    if (config.input.swipe_step_ms <= 0) config.input.swipe_step_ms = InputConfig{}.swipe_step_ms;
    if (config.input.busy_timeout_ms <= 0) {
        SLOG_WARN("config", "Invalid input.busy_timeout_ms %d, using default", config.input.busy_timeout_ms);
        config.input.busy_timeout_ms = InputConfig{}.busy_timeout_ms;
    }
    if (config.stream.bit_rate <= 0) {
        SLOG_WARN("config", "Invalid stream.bit_rate %d, using default", config.stream.bit_rate);
        config.stream.bit_rate = StreamConfig{}.bit_rate;
    }

    SLOG_INFO("config", "Loaded: stream=%dx%d@%d, download_dir=%s",
              config.stream.width, config.stream.height, config.stream.bit_rate,
              config.transfer.download_dir.c_str());

    return config;
}

} // namespace config
} // namespace scry
