#pragma once

#include "sconv/core/result.hpp"
#include "sconv/pipeline/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sconv::pipeline {

std::vector<std::string> default_stream_copy_args();
std::vector<std::string> default_full_reencode_args();

/**
 * @brief Tunables for one pipeline run
 *
 * Defaults are usable as is; validate() is called by the orchestrator
 * before any work starts.
 */
struct PipelineConfig {
    static constexpr std::size_t kMinChunkSize = 4 * 1024;
    static constexpr std::size_t kMaxChunkSize = 64 * 1024 * 1024;
    static constexpr std::uint32_t kMaxRetries = 16;

    std::size_t chunk_size = 1024 * 1024;
    std::uint32_t source_read_retries = 2;
    std::uint32_t destination_write_retries = 2;
    std::chrono::milliseconds retry_backoff{500};
    std::uint64_t size_warning_threshold = 1024ULL * 1024 * 1024;
    std::chrono::milliseconds heartbeat_interval{5000};
    std::size_t diagnostic_limit = 16 * 1024;
    std::vector<std::string> stream_copy_args = default_stream_copy_args();
    std::vector<std::string> full_reencode_args = default_full_reencode_args();
    std::chrono::milliseconds http_timeout{120000};
    bool overwrite_existing = false;

    Result<void> validate() const;

    const std::vector<std::string>& args_for(ConversionStrategy strategy) const;
};

/**
 * @brief Parse a JSON config document; missing keys keep their defaults
 *
 * KEYS: chunk_size, source_read_retries, destination_write_retries,
 * retry_backoff_ms, size_warning_threshold, heartbeat_interval_ms,
 * diagnostic_limit, stream_copy_args, full_reencode_args, http_timeout_ms,
 * overwrite_existing
 */
Result<PipelineConfig> parse_config(const std::string& text);

Result<PipelineConfig> load_config(const std::filesystem::path& path);

} // namespace sconv::pipeline
