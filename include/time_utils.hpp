#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format a duration as "Dd, Hh, Mm, Ss".
 *
 * All four components are always present, e.g. `0d, 2h, 5m, 9s`.
 */
std::string format_age(std::chrono::seconds dur);

/**
 * @brief Time elapsed since @p file was last modified.
 *
 * @return `std::nullopt` if the file is missing or its timestamp lies in the
 *         future.
 */
std::optional<std::chrono::seconds> file_age(const std::filesystem::path& file);

#endif // TIME_UTILS_HPP
