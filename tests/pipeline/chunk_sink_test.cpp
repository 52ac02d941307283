#include "sconv/pipeline/chunk_sink.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <string>

using sconv::CancellationToken;
using sconv::ErrorKind;
using sconv::io::Pipe;
using sconv::pipeline::ChunkSink;
using sconv::pipeline::PipelineConfig;
using sconv::test_support::MemoryDestination;
using sconv::test_support::make_payload;

namespace {

constexpr std::size_t kChunk = PipelineConfig::kMinChunkSize;

PipelineConfig small_chunks() {
    PipelineConfig config;
    config.chunk_size = kChunk;
    config.destination_write_retries = 2;
    config.retry_backoff = std::chrono::milliseconds(1);
    return config;
}

// Fits in the kernel pipe buffer, so no writer thread is needed.
Pipe filled_pipe(const std::string& data) {
    auto pipe = Pipe::create();
    EXPECT_TRUE(pipe.is_ok());
    if (!data.empty()) {
        EXPECT_TRUE(pipe.value().write_end.write_all(
            reinterpret_cast<const std::uint8_t*>(data.data()), data.size()).is_ok());
    }
    pipe.value().write_end.close();
    return std::move(pipe.value());
}

} // namespace

TEST(ChunkSinkTest, DeliversInOrderWithSingleFinalChunk) {
    const auto payload = make_payload(5 * kChunk + 17);
    auto pipe = filled_pipe(payload);
    MemoryDestination destination;
    ASSERT_TRUE(destination.open().is_ok());
    const auto config = small_chunks();
    CancellationToken cancel;

    std::uint64_t last_progress = 0;
    ChunkSink sink(destination, config, cancel);
    auto drained = sink.drain(pipe.read_end, [&](std::uint64_t bytes) { last_progress = bytes; });

    ASSERT_TRUE(drained.is_ok());
    EXPECT_EQ(drained.value(), payload.size());
    EXPECT_EQ(destination.data(), payload);
    EXPECT_EQ(destination.final_chunks(), 1u);
    EXPECT_LE(destination.max_chunk(), kChunk);
    EXPECT_EQ(sink.bytes_drained(), payload.size());
    EXPECT_EQ(sink.bytes_accepted(), payload.size());
    EXPECT_EQ(last_progress, payload.size());
}

TEST(ChunkSinkTest, EmptyOutputDeliversNothing) {
    auto pipe = filled_pipe("");
    MemoryDestination destination;
    ASSERT_TRUE(destination.open().is_ok());
    const auto config = small_chunks();
    CancellationToken cancel;

    ChunkSink sink(destination, config, cancel);
    auto drained = sink.drain(pipe.read_end, nullptr);

    ASSERT_TRUE(drained.is_ok());
    EXPECT_EQ(drained.value(), 0u);
    EXPECT_EQ(destination.write_calls(), 0u);
}

TEST(ChunkSinkTest, RejectedChunkIsRetried) {
    const auto payload = make_payload(2 * kChunk);
    auto pipe = filled_pipe(payload);
    MemoryDestination destination;
    ASSERT_TRUE(destination.open().is_ok());
    destination.reject_writes(2);
    const auto config = small_chunks();
    CancellationToken cancel;

    ChunkSink sink(destination, config, cancel);
    auto drained = sink.drain(pipe.read_end, nullptr);

    ASSERT_TRUE(drained.is_ok());
    EXPECT_EQ(destination.data(), payload);
}

TEST(ChunkSinkTest, ExhaustedRetriesAreDestinationWriteError) {
    auto pipe = filled_pipe(make_payload(kChunk));
    MemoryDestination destination;
    ASSERT_TRUE(destination.open().is_ok());
    destination.reject_writes(10);
    const auto config = small_chunks();
    CancellationToken cancel;

    ChunkSink sink(destination, config, cancel);
    auto drained = sink.drain(pipe.read_end, nullptr);

    ASSERT_TRUE(drained.is_error());
    EXPECT_EQ(drained.error().kind, ErrorKind::DestinationWriteError);
    EXPECT_EQ(destination.write_calls(), config.destination_write_retries + 1);
    EXPECT_EQ(sink.bytes_accepted(), 0u);
}

TEST(ChunkSinkTest, CancelledTokenStopsDelivery) {
    auto pipe = filled_pipe(make_payload(kChunk));
    MemoryDestination destination;
    ASSERT_TRUE(destination.open().is_ok());
    const auto config = small_chunks();
    CancellationToken cancel;
    cancel.request_cancel();

    ChunkSink sink(destination, config, cancel);
    auto drained = sink.drain(pipe.read_end, nullptr);

    ASSERT_TRUE(drained.is_error());
    EXPECT_EQ(drained.error().kind, ErrorKind::CancellationRequested);
    EXPECT_EQ(destination.write_calls(), 0u);
}
