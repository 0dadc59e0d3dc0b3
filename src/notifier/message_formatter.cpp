#include "message_formatter.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace DiscordRelay {
namespace Core {

const char* severity_marker(Severity severity) {
    switch (severity) {
        case Severity::LOG:     return "\xF0\x9F\x93\x9D"; // memo
        case Severity::INFO:    return "\xF0\x9F\x94\xB5"; // blue circle
        case Severity::SUCCESS: return "\xF0\x9F\x9F\xA2"; // green circle
        case Severity::WARNING: return "\xF0\x9F\x9F\xA1"; // yellow circle
        case Severity::ERROR:   return "\xF0\x9F\x94\xB4"; // red circle
    }
    return "\xF0\x9F\x93\x9D";
}

const char* severity_label(Severity severity) {
    switch (severity) {
        case Severity::LOG:     return "LOG";
        case Severity::INFO:    return "INFO";
        case Severity::SUCCESS: return "SUCCESS";
        case Severity::WARNING: return "WARNING";
        case Severity::ERROR:   return "ERROR";
    }
    return "LOG";
}

bool parse_severity(const std::string& severity_name, Severity& severity) {
    std::string lowered = severity_name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    if (lowered == "log") severity = Severity::LOG;
    else if (lowered == "info") severity = Severity::INFO;
    else if (lowered == "success") severity = Severity::SUCCESS;
    else if (lowered == "warning") severity = Severity::WARNING;
    else if (lowered == "error") severity = Severity::ERROR;
    else return false;
    return true;
}

std::string MessageFormatter::format(Severity severity, const std::string& text, const std::string& origin) const {
    return format(severity, text, origin, std::chrono::system_clock::now());
}

std::string MessageFormatter::format(Severity severity, const std::string& text, const std::string& origin,
                                     std::chrono::system_clock::time_point timestamp) const {
    std::stringstream formatted_stream;
    if (severity == Severity::ERROR && has_escalation_target()) {
        formatted_stream << mention_token() << ' ';
    }
    formatted_stream << severity_marker(severity)
                     << " [" << TimeUtils::format_time_with_milliseconds(timestamp) << "]"
                     << " [" << origin << "] "
                     << severity_label(severity) << ": " << text;
    return formatted_stream.str();
}

std::string MessageFormatter::mention_token() const {
    return "<@" + escalation_target + ">";
}

} // namespace Core
} // namespace DiscordRelay
