#include "sconv/pipeline/chunk_sink.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sconv::pipeline {

ChunkSink::ChunkSink(io::DestinationTransport& destination, const PipelineConfig& config, const CancellationToken& cancel)
    : destination_(destination),
      config_(config),
      cancel_(cancel) {
}

PipelineResult<std::uint64_t> ChunkSink::drain(io::FileDescriptor& converter_output,
                                              const ProgressCallback& on_progress) {
    bytes_drained_.store(0);
    bytes_accepted_.store(0);

    std::vector<std::uint8_t> current(config_.chunk_size);
    std::vector<std::uint8_t> next(config_.chunk_size);

    auto first = fill(converter_output, current);
    if (first.is_error()) {
        return Fail<std::uint64_t>(first.error().kind, first.error().message);
    }
    std::size_t current_size = first.value();
    if (current_size == 0) {
        return Ok(std::uint64_t{0});
    }

    while (true) {
        auto ahead = fill(converter_output, next);
        if (ahead.is_error()) {
            return Fail<std::uint64_t>(ahead.error().kind, ahead.error().message);
        }
        const std::size_t next_size = ahead.value();
        const bool final = next_size == 0;

        auto delivered = deliver(current, current_size, final);
        if (delivered.is_error()) {
            return Fail<std::uint64_t>(delivered.error().kind, delivered.error().message);
        }
        bytes_accepted_ += current_size;
        if (on_progress) {
            on_progress(bytes_accepted_.load());
        }

        if (final) {
            break;
        }
        std::swap(current, next);
        current_size = next_size;
    }

    spdlog::debug("Sink complete destination={} bytes={}", destination_.describe(), bytes_accepted_.load());
    return Ok(bytes_accepted_.load());
}

PipelineResult<std::size_t> ChunkSink::fill(io::FileDescriptor& converter_output, std::vector<std::uint8_t>& buffer) {
    auto result = converter_output.read_full(buffer.data(), buffer.size());
    if (result.is_error()) {
        return Fail<std::size_t>(ErrorKind::ConverterExitError,
                                 "failed to read converter output: " + result.error());
    }
    bytes_drained_ += result.value();
    return Ok(result.value());
}

PipelineResult<void> ChunkSink::deliver(const std::vector<std::uint8_t>& chunk, std::size_t size, bool final) {
    const std::uint32_t attempts = config_.destination_write_retries + 1;
    std::string last_error;

    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        if (cancel_.is_cancelled()) {
            return Fail<void>(ErrorKind::CancellationRequested, "cancelled while writing destination");
        }

        auto result = destination_.write_chunk(chunk.data(), size, final);
        if (result.is_ok()) {
            return Ok();
        }

        last_error = result.error();
        spdlog::warn("Destination write failed offset={} size={} attempt={}/{} error={}",
                     bytes_accepted_.load(), size, attempt, attempts, last_error);

        if (attempt < attempts && cancel_.wait_for(config_.retry_backoff)) {
            return Fail<void>(ErrorKind::CancellationRequested, "cancelled during write backoff");
        }
    }

    return Fail<void>(ErrorKind::DestinationWriteError,
                      "chunk at offset " + std::to_string(bytes_accepted_.load()) + " rejected after " +
                      std::to_string(attempts) + " attempts: " + last_error);
}

} // namespace sconv::pipeline
