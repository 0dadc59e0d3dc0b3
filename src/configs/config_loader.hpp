#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <stdexcept>
#include <string>
#include "notifier_config.hpp"

namespace DiscordRelay {
namespace Config {

// Fatal at construction time: the notifier refuses to start.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// Apply one KEY=VALUE line. Unknown keys are ignored. Throws ConfigurationError on malformed numbers.
void apply_config_entry(NotifierConfig& config, const std::string& key, const std::string& value);

// Load .env style KEY=VALUE file into config. Throws ConfigurationError if the file cannot be read.
void load_env_file(NotifierConfig& config, const std::string& env_path);

// Override config values with process environment variables of the same names.
void apply_environment_overrides(NotifierConfig& config);

// File, then environment, then validation. Throws ConfigurationError on any problem.
NotifierConfig load_notifier_config(const std::string& env_path);

// Validate notifier configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const NotifierConfig& config, std::string& error_message);

std::string build_messages_url(const NotifierConfig& config);

} // namespace Config
} // namespace DiscordRelay

#endif // CONFIG_LOADER_HPP
