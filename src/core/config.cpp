#include "chunkwire/core/config.hpp"
#include "chunkwire/core/utils.hpp"

namespace chunkwire::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = utils::StringUtils::trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = utils::StringUtils::trim(line.substr(0, eq_pos));
        std::string value = utils::StringUtils::trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto value = get_as<double>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["server.port"] = "7480";
    values_["storage.directory"] = "./chunkwire_data";
    values_["storage.backend"] = "sqlite";
    values_["storage.gc_after_hours"] = "168";
    values_["transfer.window_size"] = "10";
    values_["transfer.max_range_size"] = "64";
    values_["transfer.stall_timeout_ms"] = "10000";
    values_["transfer.stall_retry_cap"] = "3";
    values_["transfer.high_water_mark"] = "262144";
    values_["transfer.low_water_mark"] = "65536";
    values_["transfer.store_retry_attempts"] = "3";
    values_["transfer.store_retry_backoff_ms"] = "50";
    values_["transfer.auto_accept"] = "false";
    values_["transfer.reconnect_attempts"] = "5";
    values_["transfer.reconnect_delay_ms"] = "2000";
    values_["eta.window_ms"] = "4000";
    values_["eta.update_interval_ms"] = "1000";
    values_["eta.stall_ms"] = "2000";
    values_["eta.alpha"] = "0.5";
    values_["eta.beta"] = "0.3";
    values_["download.directory"] = "./downloads";
    values_["peer.id"] = "";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkwire.log";
}

}
