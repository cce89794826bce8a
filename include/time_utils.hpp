#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.mmm.
 */
std::string timestamp();

/**
 * @brief Format an elapsed duration as seconds with millisecond precision, e.g. "1.250s".
 */
std::string format_elapsed(std::chrono::steady_clock::duration dur);

#endif // TIME_UTILS_HPP
