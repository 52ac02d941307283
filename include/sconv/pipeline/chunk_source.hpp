#pragma once

#include "sconv/core/cancellation.hpp"
#include "sconv/core/error.hpp"
#include "sconv/io/file_descriptor.hpp"
#include "sconv/io/origin.hpp"
#include "sconv/pipeline/config.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace sconv::pipeline {

/**
 * @brief Pulls the origin in bounded chunks and feeds the converter's stdin
 *
 * Holds one chunk buffer. Each chunk is read completely (with bounded
 * retries) before any of it is forwarded, so a failed read never leaves the
 * converter with half a chunk.
 */
class ChunkSource {
public:
    using ProgressCallback = std::function<void(std::uint64_t)>;

    ChunkSource(io::RemoteOrigin& origin, const PipelineConfig& config, const CancellationToken& cancel);

    /**
     * @brief Copy the whole origin into @p converter_input, starting at byte zero
     *
     * When @p expected_size is known, the source must end exactly there.
     *
     * RETURNS: bytes forwarded, or
     * - SourceReadError when retries are exhausted or the source ends at the wrong offset
     * - ConverterInputClosed when the converter stopped reading
     * - CancellationRequested
     */
    PipelineResult<std::uint64_t> pump(io::FileDescriptor& converter_input,
                                       std::optional<std::uint64_t> expected_size,
                                       const ProgressCallback& on_progress);

    std::uint64_t bytes_read() const noexcept { return bytes_read_.load(); }

private:
    PipelineResult<std::size_t> read_chunk(std::uint64_t offset, std::uint8_t* buffer);

    io::RemoteOrigin& origin_;
    const PipelineConfig& config_;
    const CancellationToken& cancel_;
    std::atomic<std::uint64_t> bytes_read_{0};
};

} // namespace sconv::pipeline
