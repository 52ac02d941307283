#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace sconv::pipeline {

enum class SizeClass {
    Unknown,
    BelowThreshold,
    AboveThreshold
};

const char* to_string(SizeClass size_class);

/**
 * @brief Warns once when a transfer is larger than the configured threshold
 *
 * evaluate() runs before the first byte is requested. With an unknown size
 * the guard keeps watching observe() calls from the feeder thread and warns
 * the first time the running total crosses the threshold. Never blocks the
 * transfer.
 */
class SizeGuard {
public:
    /// (declared size if known, bytes seen so far, threshold)
    using WarningCallback =
        std::function<void(std::optional<std::uint64_t>, std::uint64_t, std::uint64_t)>;

    SizeGuard(std::uint64_t threshold, WarningCallback on_warning);

    SizeClass evaluate(std::optional<std::uint64_t> declared_size);

    void observe(std::uint64_t bytes_seen);

    bool warned() const noexcept { return warned_.load(); }

private:
    void warn_once(std::optional<std::uint64_t> declared_size, std::uint64_t bytes_seen);

    std::uint64_t threshold_;
    WarningCallback on_warning_;
    std::atomic<bool> watching_{false};
    std::atomic<bool> warned_{false};
};

} // namespace sconv::pipeline
