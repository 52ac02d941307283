#pragma once

#include "sconv/core/cancellation.hpp"
#include "sconv/core/error.hpp"
#include "sconv/io/destination.hpp"
#include "sconv/io/file_descriptor.hpp"
#include "sconv/pipeline/config.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace sconv::pipeline {

/**
 * @brief Drains converter stdout into the destination, in order
 *
 * Keeps one chunk of look-ahead so the last chunk can be delivered with
 * final = true. At most two chunk buffers are alive at any time.
 */
class ChunkSink {
public:
    /// Receives the running total of accepted bytes.
    using ProgressCallback = std::function<void(std::uint64_t)>;

    ChunkSink(io::DestinationTransport& destination, const PipelineConfig& config, const CancellationToken& cancel);

    /**
     * @brief Deliver everything @p converter_output produces until end of stream
     *
     * RETURNS: bytes accepted by the destination (0 when the converter wrote
     * nothing, in which case no chunk is delivered), or
     * - DestinationWriteError when a chunk is still rejected after retries
     * - ConverterExitError when the output pipe cannot be read
     * - CancellationRequested
     */
    PipelineResult<std::uint64_t> drain(io::FileDescriptor& converter_output,
                                        const ProgressCallback& on_progress);

    std::uint64_t bytes_drained() const noexcept { return bytes_drained_.load(); }
    std::uint64_t bytes_accepted() const noexcept { return bytes_accepted_.load(); }

private:
    PipelineResult<std::size_t> fill(io::FileDescriptor& converter_output, std::vector<std::uint8_t>& buffer);
    PipelineResult<void> deliver(const std::vector<std::uint8_t>& chunk, std::size_t size, bool final);

    io::DestinationTransport& destination_;
    const PipelineConfig& config_;
    const CancellationToken& cancel_;
    std::atomic<std::uint64_t> bytes_drained_{0};
    std::atomic<std::uint64_t> bytes_accepted_{0};
};

} // namespace sconv::pipeline
