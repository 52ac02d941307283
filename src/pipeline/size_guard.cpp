#include "sconv/pipeline/size_guard.hpp"

namespace sconv::pipeline {

const char* to_string(SizeClass size_class) {
    switch (size_class) {
        case SizeClass::Unknown: return "Unknown";
        case SizeClass::BelowThreshold: return "BelowThreshold";
        case SizeClass::AboveThreshold: return "AboveThreshold";
    }
    return "Unknown";
}

SizeGuard::SizeGuard(std::uint64_t threshold, WarningCallback on_warning)
    : threshold_(threshold),
      on_warning_(std::move(on_warning)) {
}

SizeClass SizeGuard::evaluate(std::optional<std::uint64_t> declared_size) {
    if (!declared_size) {
        watching_.store(true);
        return SizeClass::Unknown;
    }

    watching_.store(false);
    if (*declared_size > threshold_) {
        warn_once(declared_size, 0);
        return SizeClass::AboveThreshold;
    }
    return SizeClass::BelowThreshold;
}

void SizeGuard::observe(std::uint64_t bytes_seen) {
    if (watching_.load() && bytes_seen > threshold_) {
        warn_once(std::nullopt, bytes_seen);
    }
}

void SizeGuard::warn_once(std::optional<std::uint64_t> declared_size, std::uint64_t bytes_seen) {
    if (warned_.exchange(true)) {
        return;
    }
    if (on_warning_) {
        on_warning_(declared_size, bytes_seen, threshold_);
    }
}

} // namespace sconv::pipeline
