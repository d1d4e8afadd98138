#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Settings applied by init_logger().
 */
struct LoggerSettings {
    std::string path;                ///< Log file, appended to
    LogLevel level = LogLevel::INFO; ///< Minimum severity written
    std::size_t max_size = 0;        ///< Rotate above this many bytes, 0 disables rotation
    std::size_t max_files = 1;       ///< Rotated files kept
    bool json = false;               ///< One JSON object per line
    bool compress = false;           ///< Gzip rotated files
};

/**
 * @brief Open the log file and start the background writer.
 *
 * Calling it again switches to the new settings. When the file cannot be
 * opened the previous file stays active.
 *
 * @return `true` when @p settings.path was opened.
 */
bool init_logger(const LoggerSettings& settings);

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (any case).
 *
 * @param text Level name.
 * @param ok   Set to `false` when @p text is not a level name.
 */
LogLevel parse_log_level(const std::string& text, bool& ok);

/// Upper-case label written for @p level.
const char* level_label(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();

bool logger_initialized();

/**
 * @brief Block until every queued entry has reached the file.
 */
void flush_logger();

/**
 * @brief Queue a message with optional structured fields.
 *
 * Messages below the configured level are dropped before queuing. Without an
 * initialized logger the call does nothing.
 */
void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg, const LogFields& fields = {});
void log_info(const std::string& msg, const LogFields& fields = {});
void log_warning(const std::string& msg, const LogFields& fields = {});
void log_error(const std::string& msg, const LogFields& fields = {});

/**
 * @brief Drain the queue, stop the writer thread and close the file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
