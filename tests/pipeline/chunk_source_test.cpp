#include "sconv/pipeline/chunk_source.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using sconv::CancellationToken;
using sconv::ErrorKind;
using sconv::io::Pipe;
using sconv::pipeline::ChunkSource;
using sconv::pipeline::PipelineConfig;
using sconv::test_support::MemoryOrigin;
using sconv::test_support::make_payload;

namespace {

constexpr std::size_t kChunk = PipelineConfig::kMinChunkSize;

PipelineConfig small_chunks() {
    PipelineConfig config;
    config.chunk_size = kChunk;
    config.source_read_retries = 2;
    config.retry_backoff = std::chrono::milliseconds(1);
    return config;
}

// Everything pumped below fits in the kernel pipe buffer.
std::string read_all(Pipe& pipe) {
    pipe.write_end.close();
    std::vector<std::uint8_t> buffer(64 * 1024);
    auto read = pipe.read_end.read_full(buffer.data(), buffer.size());
    EXPECT_TRUE(read.is_ok());
    return std::string(buffer.begin(), buffer.begin() + (read.is_ok() ? read.value() : 0));
}

} // namespace

TEST(ChunkSourceTest, ForwardsWholeOriginInBoundedChunks) {
    const auto payload = make_payload(10 * kChunk + 123);
    MemoryOrigin origin(payload);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    std::vector<std::uint64_t> progress;
    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, payload.size(), [&](std::uint64_t bytes) { progress.push_back(bytes); });

    ASSERT_TRUE(pumped.is_ok());
    EXPECT_EQ(pumped.value(), payload.size());
    EXPECT_EQ(source.bytes_read(), payload.size());
    EXPECT_EQ(read_all(pipe.value()), payload);
    EXPECT_EQ(origin.max_request(), kChunk);
    EXPECT_EQ(origin.requests(), 11u);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), payload.size());
}

TEST(ChunkSourceTest, ExactMultipleEndsWithEmptyRead) {
    const auto payload = make_payload(3 * kChunk);
    MemoryOrigin origin(payload);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, std::nullopt, nullptr);

    ASSERT_TRUE(pumped.is_ok());
    EXPECT_EQ(pumped.value(), payload.size());
    EXPECT_EQ(origin.requests(), 4u);
    EXPECT_EQ(read_all(pipe.value()), payload);
}

TEST(ChunkSourceTest, TransientFailuresAreRetried) {
    const auto payload = make_payload(2 * kChunk);
    MemoryOrigin origin(payload);
    origin.transient_failures(2);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, std::nullopt, nullptr);

    ASSERT_TRUE(pumped.is_ok());
    EXPECT_EQ(read_all(pipe.value()), payload);
}

TEST(ChunkSourceTest, PersistentFailureIsSourceReadError) {
    const auto payload = make_payload(10 * kChunk);
    MemoryOrigin origin(payload);
    origin.fail_from_request(3);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, std::nullopt, nullptr);

    ASSERT_TRUE(pumped.is_error());
    EXPECT_EQ(pumped.error().kind, ErrorKind::SourceReadError);
    EXPECT_EQ(origin.requests(), 3u + config.source_read_retries + 1);
    EXPECT_EQ(source.bytes_read(), 3 * kChunk);
    EXPECT_EQ(read_all(pipe.value()).size(), 3 * kChunk);
}

TEST(ChunkSourceTest, ClosedConverterInputIsReported) {
    MemoryOrigin origin(make_payload(2 * kChunk));
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());
    pipe.value().read_end.close();
    sconv::io::ignore_sigpipe();

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, std::nullopt, nullptr);

    ASSERT_TRUE(pumped.is_error());
    EXPECT_EQ(pumped.error().kind, ErrorKind::ConverterInputClosed);
}

TEST(ChunkSourceTest, CancelledTokenStopsBeforeReading) {
    MemoryOrigin origin(make_payload(kChunk));
    const auto config = small_chunks();
    CancellationToken cancel;
    cancel.request_cancel();
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, std::nullopt, nullptr);

    ASSERT_TRUE(pumped.is_error());
    EXPECT_EQ(pumped.error().kind, ErrorKind::CancellationRequested);
    EXPECT_EQ(origin.requests(), 0u);
}

TEST(ChunkSourceTest, KnownSizeMatchesForwardedBytes) {
    const auto payload = make_payload(2 * kChunk + 7);
    MemoryOrigin origin(payload);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, payload.size(), nullptr);

    ASSERT_TRUE(pumped.is_ok());
    EXPECT_EQ(read_all(pipe.value()), payload);
}

TEST(ChunkSourceTest, SourceEndingBeforeKnownSizeIsSourceReadError) {
    const auto payload = make_payload(2 * kChunk + 7);
    MemoryOrigin origin(payload);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, payload.size() + kChunk, nullptr);

    ASSERT_TRUE(pumped.is_error());
    EXPECT_EQ(pumped.error().kind, ErrorKind::SourceReadError);
    EXPECT_NE(pumped.error().message.find("source ended at"), std::string::npos);
    EXPECT_EQ(read_all(pipe.value()).size(), payload.size());
}

TEST(ChunkSourceTest, SourceRunningPastKnownSizeIsSourceReadError) {
    const auto payload = make_payload(3 * kChunk + 1);
    MemoryOrigin origin(payload);
    const auto config = small_chunks();
    CancellationToken cancel;
    auto pipe = Pipe::create();
    ASSERT_TRUE(pipe.is_ok());

    ChunkSource source(origin, config, cancel);
    auto pumped = source.pump(pipe.value().write_end, 2 * kChunk, nullptr);

    ASSERT_TRUE(pumped.is_error());
    EXPECT_EQ(pumped.error().kind, ErrorKind::SourceReadError);
}
