#include "async_logger.hpp"
#include "configs/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <sstream>
#include <fstream>
#include <stdexcept>

namespace DiscordRelay {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return thread_logging_context_ptr;
}

LoggingContext* find_logging_context() {
    return thread_local_logging_context_pointer;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void clear_logging_context() {
    thread_local_logging_context_pointer = nullptr;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* thread_logging_context_ptr = find_logging_context();

        std::string timestamp_string;
        try {
            timestamp_string = TimeUtils::get_current_human_readable_time();
        } catch (const std::exception& time_exception_error) {
            log_message_to_stderr("ERROR: TimeUtils failed: " + std::string(time_exception_error.what()));
            timestamp_string = "ERROR-TIME";
        }

        std::string thread_tag_string = thread_logging_context_ptr ? thread_logging_context_ptr->get_thread_tag() : "MAIN  ";
        std::stringstream log_stream;
        log_stream << timestamp_string << " [" << thread_tag_string << "]   " << message << std::endl;
        std::string log_formatted_string = log_stream.str();

        // A stopped logger has no thread draining it; write directly instead
        if (thread_logging_context_ptr && thread_logging_context_ptr->async_logger &&
            thread_logging_context_ptr->async_logger->running.load()) {
            try {
                thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
                return;
            } catch (const std::exception& logger_exception_error) {
                log_message_to_stderr("ERROR: Async logger enqueue failed: " + std::string(logger_exception_error.what()));
            }
        }

        if (thread_logging_context_ptr) {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::cout << log_formatted_string << std::flush;
        } else {
            std::cout << log_formatted_string << std::flush;
        }

        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (log_file_stream.is_open()) {
                log_file_stream << log_formatted_string;
            } else {
                log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
            }
        }
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
        std::cerr << message << std::endl;
    }
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::collect_all_available_messages_internal(std::vector<std::string>& message_buffer) {
    // Collect all available messages immediately (no waiting)
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(mtx);
    collect_all_available_messages_internal(message_buffer);
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    {
        std::lock_guard<std::mutex> cguard(console_mutex);
        *console_stream << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
    message_buffer.clear();
}

void AsyncLogger::process_logging_queue(std::ofstream& log_file) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        std::string line = std::move(queue.front());
        queue.pop();
        lock.unlock();

        output_log_line_internal(line, log_file);

        lock.lock();
    }
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const DiscordRelay::Config::NotifierConfig& config) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    std::string configuration_error_message;
    if (!DiscordRelay::Config::validate_config(config, configuration_error_message)) {
        log_message_to_stderr("ERROR: Config error: " + configuration_error_message);
        throw DiscordRelay::Config::ConfigurationError("Configuration validation failed: " + configuration_error_message);
    }

    auto logger_instance = std::make_shared<AsyncLogger>(config.log_file);
    logger_instance->running.store(true);

    thread_logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN  ");

    return logger_instance;
}

} // namespace Logging
} // namespace DiscordRelay
