#pragma once

#include <string>
#include <cstdint>

namespace docflow {

struct ServerConfig {
    std::string host;
    uint16_t port;
    std::string path;
    uint32_t threads;
};

// Resilient Channel tuning; delays in milliseconds
struct ChannelConfig {
    uint32_t max_retries;
    uint32_t initial_retry_delay_ms;
    uint32_t max_retry_delay_ms;
    double jitter_ratio;
    uint32_t heartbeat_interval_ms;
    uint32_t heartbeat_timeout_ms;
    uint32_t message_queue_size;
};

struct TransferConfig {
    uint32_t fragment_size;
    uint32_t session_max_age_ms;
    uint32_t sweep_interval_ms;
    // Minimum gap between progress replies to an uploading peer; 0 answers every fragment
    uint32_t progress_interval_ms;
};

// Default stage selection when a file descriptor does not name one
struct PipelineDefaults {
    uint32_t worker_threads;
    std::string loader;
    std::string splitter;
    std::string vectorizer;
    std::string sink;
};

struct LoggingConfig {
    std::string level;
    std::string file;
};

struct Config {
    ServerConfig server;
    ChannelConfig channel;
    TransferConfig transfer;
    PipelineDefaults pipeline;
    LoggingConfig logging;
    std::string config_file;
};

// Built-in defaults, used for every key a YAML file leaves out
Config default_config();

// Load configuration from YAML file; a missing file yields the defaults
Config load_config(const std::string& config_file = "config.yaml");

} // namespace docflow
