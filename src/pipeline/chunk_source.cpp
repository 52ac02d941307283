#include "sconv/pipeline/chunk_source.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace sconv::pipeline {

ChunkSource::ChunkSource(io::RemoteOrigin& origin, const PipelineConfig& config, const CancellationToken& cancel)
    : origin_(origin),
      config_(config),
      cancel_(cancel) {
}

PipelineResult<std::uint64_t> ChunkSource::pump(io::FileDescriptor& converter_input,
                                                std::optional<std::uint64_t> expected_size,
                                                const ProgressCallback& on_progress) {
    std::vector<std::uint8_t> buffer(config_.chunk_size);
    std::uint64_t offset = 0;
    bytes_read_.store(0);

    while (true) {
        if (cancel_.is_cancelled()) {
            return Fail<std::uint64_t>(ErrorKind::CancellationRequested, "cancelled while reading source");
        }

        auto chunk = read_chunk(offset, buffer.data());
        if (chunk.is_error()) {
            return Fail<std::uint64_t>(chunk.error().kind, chunk.error().message);
        }

        const auto count = chunk.value();
        if (count > 0) {
            bytes_read_.store(offset + count);
            auto written = converter_input.write_all(buffer.data(), count);
            if (written.is_error()) {
                if (io::is_broken_pipe(written.error())) {
                    return Fail<std::uint64_t>(ErrorKind::ConverterInputClosed,
                                               "converter input closed at offset " + std::to_string(offset));
                }
                return Fail<std::uint64_t>(ErrorKind::InternalError,
                                           "writing converter input at offset " + std::to_string(offset) +
                                           " failed: " + written.error());
            }
            offset += count;
            if (on_progress) {
                on_progress(offset);
            }
        }

        if (count < config_.chunk_size) {
            break;
        }
    }

    if (expected_size && offset != *expected_size) {
        return Fail<std::uint64_t>(ErrorKind::SourceReadError,
                                   "source ended at " + std::to_string(offset) + " of " +
                                   std::to_string(*expected_size) + " bytes");
    }

    spdlog::debug("Source exhausted origin={} bytes={}", origin_.describe(), offset);
    return Ok(offset);
}

PipelineResult<std::size_t> ChunkSource::read_chunk(std::uint64_t offset, std::uint8_t* buffer) {
    const std::uint32_t attempts = config_.source_read_retries + 1;
    std::string last_error;

    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto result = origin_.read_range(offset, buffer, config_.chunk_size, cancel_);
        if (result.is_ok()) {
            return Ok(result.value());
        }

        if (cancel_.is_cancelled()) {
            return Fail<std::size_t>(ErrorKind::CancellationRequested, "cancelled while reading source");
        }

        last_error = result.error();
        spdlog::warn("Source read failed offset={} attempt={}/{} error={}",
                     offset, attempt, attempts, last_error);

        if (attempt < attempts && cancel_.wait_for(config_.retry_backoff)) {
            return Fail<std::size_t>(ErrorKind::CancellationRequested, "cancelled during read backoff");
        }
    }

    return Fail<std::size_t>(ErrorKind::SourceReadError,
                             "read at offset " + std::to_string(offset) + " failed after " +
                             std::to_string(attempts) + " attempts: " + last_error);
}

} // namespace sconv::pipeline
