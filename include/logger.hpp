#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Calling it again re-targets the logger.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Emit each entry as a JSON object instead of a plain text line.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Parse a level name such as `debug` or `WARNING`.
 *
 * @param name  Case-insensitive level name (`debug`, `info`, `warning`/`warn`,
 *              `error`/`err`).
 * @param level Receives the parsed level on success.
 * @return `true` when @p name was recognised.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Check whether the logger has been initialized.
 */
bool logger_initialized();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Block until every queued entry has been written.
 */
void flush_logger();

/**
 * @brief Stop the writer thread and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
