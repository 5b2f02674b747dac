#include "config.h"
#include <fstream>
#include <sstream>

#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace kaddht {

namespace {

void read_seconds(const nlohmann::json& json, const char* name, std::chrono::seconds& target) {
    if (!json.contains(name)) {
        return;
    }
    const auto& value = json.at(name);
    if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
        LOG_CONFIG_WARN("Invalid value for '" << name << "', using default of " << target.count() << "s");
        return;
    }
    if (value.is_number_unsigned() ? value.get<uint64_t>() > static_cast<uint64_t>(MAX_CONFIG_DURATION.count())
                                   : value.get<int64_t>() > MAX_CONFIG_DURATION.count()) {
        LOG_CONFIG_WARN("Value for '" << name << "' exceeds " << MAX_CONFIG_DURATION.count()
                        << "s, using default of " << target.count() << "s");
        return;
    }
    target = std::chrono::seconds(value.get<int64_t>());
}

void read_flag(const nlohmann::json& json, const char* name, bool& target) {
    if (!json.contains(name)) {
        return;
    }
    const auto& value = json.at(name);
    if (!value.is_boolean()) {
        LOG_CONFIG_WARN("Invalid value for '" << name << "', using default");
        return;
    }
    target = value.get<bool>();
}

} // namespace

DhtConfig dht_config_from_json(const nlohmann::json& json) {
    DhtConfig config;
    if (!json.is_object()) {
        LOG_CONFIG_WARN("Configuration is not a JSON object, using defaults");
        return config;
    }

    if (json.contains("closer_peer_count")) {
        const auto& value = json.at("closer_peer_count");
        if (value.is_number_integer() && value.get<int64_t>() > 0) {
            config.closer_peer_count = value.get<size_t>();
        } else {
            LOG_CONFIG_WARN("Invalid value for 'closer_peer_count', using default of " << config.closer_peer_count);
        }
    }

    read_seconds(json, "max_record_age_seconds", config.max_record_age);
    read_seconds(json, "provider_addr_ttl_seconds", config.provider_addr_ttl);
    read_seconds(json, "provider_validity_seconds", config.provider_validity);
    read_seconds(json, "provider_cleanup_interval_seconds", config.provider_cleanup_interval);

    if (json.contains("log_level")) {
        const auto& value = json.at("log_level");
        LogLevel level;
        if (value.is_string() && parse_log_level(value.get<std::string>(), level)) {
            config.log_level = level;
        } else {
            LOG_CONFIG_WARN("Invalid value for 'log_level', using default");
        }
    }

    read_flag(json, "log_colors", config.log_colors);
    read_flag(json, "log_timestamps", config.log_timestamps);

    return config;
}

nlohmann::json dht_config_to_json(const DhtConfig& config) {
    nlohmann::json json;
    json["closer_peer_count"] = config.closer_peer_count;
    json["max_record_age_seconds"] = config.max_record_age.count();
    json["provider_addr_ttl_seconds"] = config.provider_addr_ttl.count();
    json["provider_validity_seconds"] = config.provider_validity.count();
    json["provider_cleanup_interval_seconds"] = config.provider_cleanup_interval.count();
    json["log_level"] = log_level_to_string(config.log_level);
    json["log_colors"] = config.log_colors;
    json["log_timestamps"] = config.log_timestamps;
    return json;
}

bool load_dht_config(const std::string& path, DhtConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_CONFIG_INFO("No configuration found at " << path << ", writing defaults");
        config = DhtConfig();
        return save_dht_config(path, config);
    }

    try {
        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string data = buffer.str();
        if (data.empty()) {
            LOG_CONFIG_ERROR("Configuration file is empty: " << path);
            return false;
        }

        config = dht_config_from_json(nlohmann::json::parse(data));
        LOG_CONFIG_INFO("Loaded configuration from " << path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file: " << e.what());
        return false;
    }
}

bool save_dht_config(const std::string& path, const DhtConfig& config) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        LOG_CONFIG_ERROR("Failed to open " << path << " for writing");
        return false;
    }

    file << dht_config_to_json(config).dump(4);
    if (!file.good()) {
        LOG_CONFIG_ERROR("Failed to write configuration to " << path);
        return false;
    }
    return true;
}

void apply_logging_config(const DhtConfig& config) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(config.log_level);
    logger.set_colors_enabled(config.log_colors);
    logger.set_timestamps_enabled(config.log_timestamps);
}

} // namespace kaddht
