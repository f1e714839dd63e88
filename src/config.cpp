#include "docflow/config.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <iostream>

namespace docflow {

Config default_config() {
    Config config;

    config.server.host = "0.0.0.0";
    config.server.port = 8000;
    config.server.path = "/ws/import_files";
    config.server.threads = 1;

    config.channel.max_retries = 5;
    config.channel.initial_retry_delay_ms = 1000;
    config.channel.max_retry_delay_ms = 30000;
    config.channel.jitter_ratio = 0.3;
    config.channel.heartbeat_interval_ms = 30000;
    config.channel.heartbeat_timeout_ms = 10000;
    config.channel.message_queue_size = 100;

    config.transfer.fragment_size = 2000;
    config.transfer.session_max_age_ms = 300000;
    config.transfer.sweep_interval_ms = 30000;
    config.transfer.progress_interval_ms = 2000;

    config.pipeline.worker_threads = 4;
    config.pipeline.loader = "Default";
    config.pipeline.splitter = "Token";
    config.pipeline.vectorizer = "Hashing";
    config.pipeline.sink = "Memory";

    config.logging.level = "info";
    config.logging.file = "";

    return config;
}

Config load_config(const std::string& config_file) {
    Config config = default_config();
    config.config_file = config_file;

    if (config_file.empty()) {
        return config;
    }
    if (!std::filesystem::exists(config_file)) {
        std::cerr << "Configuration file " << config_file << " not found, using defaults" << std::endl;
        return config;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(config_file);

        if (yaml["server"]) {
            const auto& server = yaml["server"];
            if (server["host"]) config.server.host = server["host"].as<std::string>();
            if (server["port"]) config.server.port = server["port"].as<uint16_t>();
            if (server["path"]) config.server.path = server["path"].as<std::string>();
            if (server["threads"]) config.server.threads = server["threads"].as<uint32_t>();
        }

        if (yaml["channel"]) {
            const auto& channel = yaml["channel"];
            if (channel["max_retries"]) config.channel.max_retries = channel["max_retries"].as<uint32_t>();
            if (channel["initial_retry_delay_ms"]) config.channel.initial_retry_delay_ms = channel["initial_retry_delay_ms"].as<uint32_t>();
            if (channel["max_retry_delay_ms"]) config.channel.max_retry_delay_ms = channel["max_retry_delay_ms"].as<uint32_t>();
            if (channel["jitter_ratio"]) config.channel.jitter_ratio = channel["jitter_ratio"].as<double>();
            if (channel["heartbeat_interval_ms"]) config.channel.heartbeat_interval_ms = channel["heartbeat_interval_ms"].as<uint32_t>();
            if (channel["heartbeat_timeout_ms"]) config.channel.heartbeat_timeout_ms = channel["heartbeat_timeout_ms"].as<uint32_t>();
            if (channel["message_queue_size"]) config.channel.message_queue_size = channel["message_queue_size"].as<uint32_t>();
        }

        if (yaml["transfer"]) {
            const auto& transfer = yaml["transfer"];
            if (transfer["fragment_size"]) config.transfer.fragment_size = transfer["fragment_size"].as<uint32_t>();
            if (transfer["session_max_age_ms"]) config.transfer.session_max_age_ms = transfer["session_max_age_ms"].as<uint32_t>();
            if (transfer["sweep_interval_ms"]) config.transfer.sweep_interval_ms = transfer["sweep_interval_ms"].as<uint32_t>();
            if (transfer["progress_interval_ms"]) config.transfer.progress_interval_ms = transfer["progress_interval_ms"].as<uint32_t>();
        }

        if (yaml["pipeline"]) {
            const auto& pipeline = yaml["pipeline"];
            if (pipeline["worker_threads"]) config.pipeline.worker_threads = pipeline["worker_threads"].as<uint32_t>();
            if (pipeline["loader"]) config.pipeline.loader = pipeline["loader"].as<std::string>();
            if (pipeline["splitter"]) config.pipeline.splitter = pipeline["splitter"].as<std::string>();
            if (pipeline["vectorizer"]) config.pipeline.vectorizer = pipeline["vectorizer"].as<std::string>();
            if (pipeline["sink"]) config.pipeline.sink = pipeline["sink"].as<std::string>();
        }

        if (yaml["logging"]) {
            const auto& log = yaml["logging"];
            if (log["level"]) config.logging.level = log["level"].as<std::string>();
            if (log["file"]) config.logging.file = log["file"].as<std::string>();
        }

    } catch (const YAML::Exception& e) {
        std::cerr << "Error loading configuration " << config_file << ": " << e.what()
                  << ", using defaults" << std::endl;
        Config defaults = default_config();
        defaults.config_file = config_file;
        return defaults;
    }

    // Zero values would disable the transport entirely
    if (config.transfer.fragment_size == 0) {
        std::cerr << "transfer.fragment_size must be positive, using 2000" << std::endl;
        config.transfer.fragment_size = 2000;
    }
    if (config.channel.message_queue_size == 0) {
        std::cerr << "channel.message_queue_size must be positive, using 100" << std::endl;
        config.channel.message_queue_size = 100;
    }

    return config;
}

} // namespace docflow
