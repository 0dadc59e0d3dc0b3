#include "error_interceptor.hpp"

namespace DiscordRelay {
namespace Core {

namespace {
    // Set while this thread is inside log_error so nested writes are passed through only
    thread_local bool forwarding_in_progress = false;

    struct ForwardingGuard {
        ForwardingGuard() { forwarding_in_progress = true; }
        ~ForwardingGuard() { forwarding_in_progress = false; }
    };

    std::string trim_line(const std::string& line) {
        const char* whitespace = " \t\r\n";
        size_t first = line.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            return "";
        }
        size_t last = line.find_last_not_of(whitespace);
        return line.substr(first, last - first + 1);
    }

    bool starts_with(const std::string& value, const std::string& prefix) {
        return !prefix.empty() && value.compare(0, prefix.size(), prefix) == 0;
    }
}

ErrorInterceptor::ErrorInterceptor(DiscordNotifier& target_notifier, std::ostream& intercepted_stream)
    : notifier(target_notifier), stream(intercepted_stream), original_buffer(intercepted_stream.rdbuf()) {
    stream.rdbuf(this);
}

ErrorInterceptor::~ErrorInterceptor() {
    stream.rdbuf(original_buffer);
}

ErrorInterceptor::int_type ErrorInterceptor::overflow(int_type character) {
    if (traits_type::eq_int_type(character, traits_type::eof())) {
        return traits_type::not_eof(character);
    }
    char single_character = traits_type::to_char_type(character);
    if (original_buffer && original_buffer->sputc(single_character) == traits_type::eof()) {
        return traits_type::eof();
    }
    append_and_forward(&single_character, 1);
    return character;
}

std::streamsize ErrorInterceptor::xsputn(const char* characters, std::streamsize count) {
    std::streamsize written_count = original_buffer ? original_buffer->sputn(characters, count) : count;
    append_and_forward(characters, count);
    return written_count;
}

int ErrorInterceptor::sync() {
    return original_buffer ? original_buffer->pubsync() : 0;
}

void ErrorInterceptor::append_and_forward(const char* characters, std::streamsize count) {
    if (forwarding_in_progress) {
        return;
    }

    std::vector<std::string> completed_lines;
    {
        std::lock_guard<std::mutex> lock(line_mutex);
        line_buffer.append(characters, static_cast<size_t>(count));
        size_t newline_position;
        while ((newline_position = line_buffer.find('\n')) != std::string::npos) {
            completed_lines.push_back(line_buffer.substr(0, newline_position));
            line_buffer.erase(0, newline_position + 1);
        }
    }

    for (const std::string& completed_line : completed_lines) {
        std::string trimmed_line = trim_line(completed_line);
        if (!should_forward(trimmed_line)) {
            continue;
        }
        ForwardingGuard forwarding_guard;
        notifier.log_error(trimmed_line, "stderr");
    }
}

bool ErrorInterceptor::should_forward(const std::string& trimmed_line) const {
    if (trimmed_line.empty()) {
        return false;
    }
    if (starts_with(trimmed_line, severity_marker(Severity::ERROR))) {
        return false;
    }
    const MessageFormatter& formatter = notifier.get_formatter();
    if (formatter.has_escalation_target() && starts_with(trimmed_line, formatter.mention_token())) {
        return false;
    }
    return true;
}

} // namespace Core
} // namespace DiscordRelay
