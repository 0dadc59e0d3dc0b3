/**
 * Logging thread.
 * Owns the log file and writes everything the async logger collects.
 */
#include "logging_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include <fstream>
#include <vector>

using namespace DiscordRelay::Threads;
using namespace DiscordRelay::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    try {
        setup_logging_thread();
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        log_message_to_stderr("LoggingThread exception: " + std::string(exception.what()));
    }
}

void LoggingThread::setup_logging_thread() {
    set_logging_context(*logging_context);
    set_log_thread_tag("LOGGER");
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file;
    if (!logger_ptr->get_file_path().empty()) {
        log_file.open(logger_ptr->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            log_message_to_stderr("ERROR: Failed to open log file: " + logger_ptr->get_file_path());
        }
    }

    while (logger_ptr->running.load()) {
        try {
            logger_ptr->process_logging_queue(log_file);
            logger_iterations->fetch_add(1);
        } catch (const std::exception& exception) {
            log_message_to_stderr("LoggingThread loop iteration exception: " + std::string(exception.what()));
        }
    }

    // Final flush of anything queued between the last wake-up and stop()
    std::vector<std::string> message_buffer;
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}
