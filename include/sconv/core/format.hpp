#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sconv {

/**
 * @brief Human readable byte count ("512 B", "12.5 MB", "1.50 GB")
 */
std::string format_bytes(std::uint64_t bytes);

/**
 * @brief Transfer rate for log lines ("3.2 MB/s")
 */
std::string format_rate(std::uint64_t bytes, std::chrono::milliseconds elapsed);

/**
 * @brief Short duration for log lines ("45s", "3m 12s", "1h 4m")
 */
std::string format_duration(std::chrono::milliseconds elapsed);

} // namespace sconv
