#pragma once

#include <chrono>
#include <string>
#include <yaml-cpp/yaml.h>

class Config {
public:
    static Config& getInstance();

    bool loadFromFile(const std::string& config_path = "config.yaml");
    bool loadFromString(const std::string& yaml_content);

    std::chrono::milliseconds getCacheDefaultTtl() const { return cache_default_ttl_; }

    std::chrono::milliseconds getStreamThrottle() const { return stream_throttle_; }
    std::chrono::milliseconds getUpdateWait() const { return update_wait_; }

    unsigned int getNumThreads() const { return num_threads_; }
    unsigned int getDemoTicks() const { return demo_ticks_; }
    std::chrono::milliseconds getTickInterval() const { return tick_interval_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogPattern() const { return log_pattern_; }

    bool isValid() const { return valid_; }
    std::string getError() const { return error_message_; }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

private:
    Config();

    void setDefaults();
    bool parseYaml(const YAML::Node& config);
    bool validate();

    std::chrono::milliseconds cache_default_ttl_{300000};

    std::chrono::milliseconds stream_throttle_{1000};
    std::chrono::milliseconds update_wait_{3000};

    unsigned int num_threads_ = 2;
    unsigned int demo_ticks_ = 5;
    std::chrono::milliseconds tick_interval_{1500};

    std::string log_level_ = "info";
    std::string log_pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

    bool valid_ = false;
    std::string error_message_;
};
