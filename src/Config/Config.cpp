#include "Config.hpp"
#include <spdlog/spdlog.h>

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    cache_default_ttl_ = std::chrono::milliseconds(300000);
    stream_throttle_ = std::chrono::milliseconds(1000);
    update_wait_ = std::chrono::milliseconds(3000);
    num_threads_ = 2;
    demo_ticks_ = 5;
    tick_interval_ = std::chrono::milliseconds(1500);
    log_level_ = "info";
    log_pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    valid_ = true;
    error_message_.clear();
}

bool Config::loadFromFile(const std::string& config_path) {
    try {
        YAML::Node config_node = YAML::LoadFile(config_path);
        return parseYaml(config_node);
    } catch (const YAML::BadFile& e) {
        spdlog::warn("Config file '{}' not found, using defaults", config_path);
        setDefaults();
        return true;
    } catch (const YAML::Exception& e) {
        error_message_ = "YAML parse error: " + std::string(e.what());
        spdlog::error("Failed to parse config: {}", error_message_);
        valid_ = false;
        return false;
    }
}

bool Config::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node config_node = YAML::Load(yaml_content);
        return parseYaml(config_node);
    } catch (const YAML::Exception& e) {
        error_message_ = "YAML parse error: " + std::string(e.what());
        spdlog::error("Failed to parse config: {}", error_message_);
        valid_ = false;
        return false;
    }
}

bool Config::parseYaml(const YAML::Node& config) {
    setDefaults();
    try {
        if (config["cache"]) {
            const auto& cache = config["cache"];
            if (cache["default_ttl_ms"]) {
                cache_default_ttl_ = std::chrono::milliseconds(cache["default_ttl_ms"].as<long long>());
            }
        }

        if (config["streams"]) {
            const auto& streams = config["streams"];
            if (streams["throttle_ms"]) {
                stream_throttle_ = std::chrono::milliseconds(streams["throttle_ms"].as<long long>());
            }
            if (streams["update_wait_ms"]) {
                update_wait_ = std::chrono::milliseconds(streams["update_wait_ms"].as<long long>());
            }
        }

        if (config["runtime"]) {
            const auto& runtime = config["runtime"];
            if (runtime["num_threads"]) {
                num_threads_ = runtime["num_threads"].as<unsigned int>();
            }
            if (runtime["demo_ticks"]) {
                demo_ticks_ = runtime["demo_ticks"].as<unsigned int>();
            }
            if (runtime["tick_interval_ms"]) {
                tick_interval_ = std::chrono::milliseconds(runtime["tick_interval_ms"].as<long long>());
            }
        }

        if (config["logging"]) {
            const auto& logging = config["logging"];
            if (logging["level"]) {
                log_level_ = logging["level"].as<std::string>();
            }
            if (logging["pattern"]) {
                log_pattern_ = logging["pattern"].as<std::string>();
            }
        }

        if (!validate()) {
            spdlog::error("Invalid configuration: {}", error_message_);
            valid_ = false;
            return false;
        }

        valid_ = true;
        error_message_.clear();

        spdlog::info("Configuration loaded successfully from YAML");
        return true;

    } catch (const YAML::Exception& e) {
        error_message_ = "YAML parse error: " + std::string(e.what());
        spdlog::error("Failed to parse YAML config: {}", error_message_);
        valid_ = false;
        return false;
    } catch (const std::exception& e) {
        error_message_ = "Config error: " + std::string(e.what());
        spdlog::error("Failed to load config: {}", error_message_);
        valid_ = false;
        return false;
    }
}

bool Config::validate() {
    if (cache_default_ttl_.count() <= 0) {
        error_message_ = "cache.default_ttl_ms must be positive";
        return false;
    }
    if (stream_throttle_.count() < 0) {
        error_message_ = "streams.throttle_ms must not be negative";
        return false;
    }
    if (update_wait_.count() <= 0) {
        error_message_ = "streams.update_wait_ms must be positive";
        return false;
    }
    if (num_threads_ == 0) {
        error_message_ = "runtime.num_threads must be at least 1";
        return false;
    }
    if (tick_interval_.count() <= 0) {
        error_message_ = "runtime.tick_interval_ms must be positive";
        return false;
    }
    return true;
}
