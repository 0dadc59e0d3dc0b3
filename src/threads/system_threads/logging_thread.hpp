#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <atomic>
#include <memory>
#include "logging/logger/async_logger.hpp"

namespace DiscordRelay {
namespace Threads {

// Drains the async logger to console and log file until the logger is stopped.
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<DiscordRelay::Logging::AsyncLogger> logger,
                  DiscordRelay::Logging::LoggingContext& context,
                  std::atomic<unsigned long>& iterations)
        : logger_ptr(logger), logging_context(&context), logger_iterations(&iterations) {}

    void operator()();

private:
    std::shared_ptr<DiscordRelay::Logging::AsyncLogger> logger_ptr;
    DiscordRelay::Logging::LoggingContext* logging_context;
    std::atomic<unsigned long>* logger_iterations;

    void setup_logging_thread();
    void execute_logging_processing_loop();
};

} // namespace Threads
} // namespace DiscordRelay

#endif // LOGGING_THREAD_HPP
