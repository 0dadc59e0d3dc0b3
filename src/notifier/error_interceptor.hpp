#ifndef ERROR_INTERCEPTOR_HPP
#define ERROR_INTERCEPTOR_HPP

#include <iostream>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>
#include <vector>
#include "notifier/discord_notifier.hpp"

namespace DiscordRelay {
namespace Core {

/**
 * Tees a std::ostream (std::cerr by default) into the notifier.
 *
 * Everything written still reaches the original buffer. Each complete line is
 * trimmed and, when non-empty, posted with log_error(line, "stderr"). Lines that
 * already start with the ERROR marker or the mention token came from the notifier
 * itself and are only passed through.
 */
class ErrorInterceptor : public std::streambuf {
public:
    explicit ErrorInterceptor(DiscordNotifier& notifier, std::ostream& intercepted_stream = std::cerr);
    ~ErrorInterceptor() override;

    ErrorInterceptor(const ErrorInterceptor&) = delete;
    ErrorInterceptor& operator=(const ErrorInterceptor&) = delete;

protected:
    int_type overflow(int_type character) override;
    std::streamsize xsputn(const char* characters, std::streamsize count) override;
    int sync() override;

private:
    DiscordNotifier& notifier;
    std::ostream& stream;
    std::streambuf* original_buffer;

    std::mutex line_mutex;
    std::string line_buffer;

    void append_and_forward(const char* characters, std::streamsize count);
    bool should_forward(const std::string& trimmed_line) const;
};

} // namespace Core
} // namespace DiscordRelay

#endif // ERROR_INTERCEPTOR_HPP
