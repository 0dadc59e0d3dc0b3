#ifndef MESSAGE_FORMATTER_HPP
#define MESSAGE_FORMATTER_HPP

#include <chrono>
#include <string>

namespace DiscordRelay {
namespace Core {

enum class Severity {
    LOG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

const char* severity_marker(Severity severity);
const char* severity_label(Severity severity);

// Parses "log", "info", "success", "warning", "error" (any case). Returns false if unknown.
bool parse_severity(const std::string& severity_name, Severity& severity);

/**
 * Builds the line posted to the channel:
 *   "<marker> [yyyy-MM-dd HH:mm:ss.mmm] [<origin>] <SEVERITY>: <text>"
 * ERROR lines are prefixed with "<@id> " when escalation_user_id is non-empty.
 */
class MessageFormatter {
public:
    explicit MessageFormatter(std::string escalation_user_id = "")
        : escalation_target(std::move(escalation_user_id)) {}

    std::string format(Severity severity, const std::string& text, const std::string& origin) const;
    std::string format(Severity severity, const std::string& text, const std::string& origin,
                       std::chrono::system_clock::time_point timestamp) const;

    std::string mention_token() const;
    bool has_escalation_target() const { return !escalation_target.empty(); }

private:
    std::string escalation_target;
};

} // namespace Core
} // namespace DiscordRelay

#endif // MESSAGE_FORMATTER_HPP
