#include "config_loader.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace DiscordRelay {
namespace Config {

namespace {
    const char* const CONFIG_KEYS[] = {
        "DISCORD_BOT_TOKEN",
        "DISCORD_LOG_CHANNELID",
        "DISCORD_ADMIN_USERID",
        "DISCORD_API_BASE_URL",
        "DISCORD_API_VERSION",
        "DISCORD_HTTP_TIMEOUT_SECONDS",
        "DISCORD_SSL_VERIFY",
        "DISCORD_DEFAULT_RETRY_AFTER_MS",
        "DISCORD_FLUSH_POLL_MS",
        "DISCORD_FORCED_FLUSH_TIMEOUT_MS",
        "DISCORD_RELAY_LOG_FILE"
    };

    inline std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        auto b = s.find_first_not_of(ws);
        auto e = s.find_last_not_of(ws);
        if (b == std::string::npos) return "";
        return s.substr(b, e - b + 1);
    }

    inline bool to_bool(const std::string& v) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), ::tolower);
        return s == "1" || s == "true" || s == "yes";
    }

    int to_int(const std::string& key, const std::string& value) {
        try {
            size_t parsed_length = 0;
            int parsed_value = std::stoi(value, &parsed_length);
            if (parsed_length != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception&) {
            throw ConfigurationError("Invalid integer for " + key + ": '" + value + "'");
        }
    }
}

void apply_config_entry(NotifierConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "DISCORD_BOT_TOKEN") cfg.bot_token = value;
    else if (key == "DISCORD_LOG_CHANNELID") cfg.channel_id = value;
    else if (key == "DISCORD_ADMIN_USERID") cfg.admin_user_id = value;
    else if (key == "DISCORD_API_BASE_URL") cfg.api_base_url = value;
    else if (key == "DISCORD_API_VERSION") cfg.api_version = value;
    else if (key == "DISCORD_HTTP_TIMEOUT_SECONDS") cfg.timeout_seconds = to_int(key, value);
    else if (key == "DISCORD_SSL_VERIFY") cfg.enable_ssl_verification = to_bool(value);
    else if (key == "DISCORD_DEFAULT_RETRY_AFTER_MS") cfg.default_retry_after_ms = to_int(key, value);
    else if (key == "DISCORD_FLUSH_POLL_MS") cfg.flush_poll_interval_ms = to_int(key, value);
    else if (key == "DISCORD_FORCED_FLUSH_TIMEOUT_MS") cfg.forced_flush_timeout_ms = to_int(key, value);
    else if (key == "DISCORD_RELAY_LOG_FILE") cfg.log_file = value;
}

void load_env_file(NotifierConfig& cfg, const std::string& env_path) {
    std::ifstream in(env_path);
    if (!in.is_open()) {
        throw ConfigurationError(".env file not found at: " + env_path);
    }
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed_line = trim(line);
        if (trimmed_line.empty() || trimmed_line[0] == '#') continue;

        // Split on the first '=' only; values may themselves contain '='
        size_t separator_position = trimmed_line.find('=');
        if (separator_position == std::string::npos) continue;
        std::string key = trim(trimmed_line.substr(0, separator_position));
        std::string value = trim(trimmed_line.substr(separator_position + 1));
        if (key.empty()) continue;

        apply_config_entry(cfg, key, value);
    }
}

void apply_environment_overrides(NotifierConfig& cfg) {
    for (const char* key : CONFIG_KEYS) {
        const char* environment_value = std::getenv(key);
        if (environment_value != nullptr) {
            apply_config_entry(cfg, key, trim(environment_value));
        }
    }
}

NotifierConfig load_notifier_config(const std::string& env_path) {
    NotifierConfig config;
    load_env_file(config, env_path);
    apply_environment_overrides(config);

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        throw ConfigurationError(configuration_error_message);
    }
    return config;
}

bool validate_config(const NotifierConfig& config, std::string& error_message) {
    if (config.bot_token.empty()) {
        error_message = "DISCORD_BOT_TOKEN not found in configuration";
        return false;
    }
    if (config.channel_id.empty()) {
        error_message = "DISCORD_LOG_CHANNELID not found in configuration";
        return false;
    }
    if (config.api_base_url.empty() || config.api_version.empty()) {
        error_message = "Discord API base URL or version missing";
        return false;
    }
    if (config.timeout_seconds <= 0) {
        error_message = "DISCORD_HTTP_TIMEOUT_SECONDS must be positive";
        return false;
    }
    if (config.default_retry_after_ms < 0) {
        error_message = "DISCORD_DEFAULT_RETRY_AFTER_MS must not be negative";
        return false;
    }
    if (config.flush_poll_interval_ms <= 0 || config.forced_flush_timeout_ms <= 0) {
        error_message = "Flush interval and forced flush timeout must be positive";
        return false;
    }
    return true;
}

std::string build_messages_url(const NotifierConfig& config) {
    std::string base_url = config.api_base_url;
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    return base_url + "/api/" + config.api_version + "/channels/" + config.channel_id + "/messages";
}

} // namespace Config
} // namespace DiscordRelay
