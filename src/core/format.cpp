#include "sconv/core/format.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace sconv {

std::string format_bytes(std::uint64_t bytes) {
    static const std::array<const char*, 6> units{"B", "KB", "MB", "GB", "TB", "PB"};

    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit < units.size() - 1) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << ' ' << units[unit];
        return oss.str();
    }

    oss << std::fixed;
    if (size >= 100.0) {
        oss << std::setprecision(0);
    } else if (size >= 10.0) {
        oss << std::setprecision(1);
    } else {
        oss << std::setprecision(2);
    }
    oss << size << ' ' << units[unit];
    return oss.str();
}

std::string format_rate(std::uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) {
        return "n/a";
    }
    const auto per_second = static_cast<std::uint64_t>(
        static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count()));
    return format_bytes(per_second) + "/s";
}

std::string format_duration(std::chrono::milliseconds elapsed) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    std::ostringstream oss;
    if (total < 60) {
        oss << total << 's';
    } else if (total < 3600) {
        oss << total / 60 << "m " << total % 60 << 's';
    } else {
        oss << total / 3600 << "h " << (total % 3600) / 60 << 'm';
    }
    return oss.str();
}

} // namespace sconv
