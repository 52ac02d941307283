#include "sconv/events/components.hpp"
#include "sconv/events/event_bus.hpp"
#include "sconv/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>

using sconv::events::AttemptFinishedEvent;
using sconv::events::DestinationResetEvent;
using sconv::events::EventBus;
using sconv::events::HeartbeatEvent;
using sconv::events::LoggerComponent;
using sconv::events::MetricsComponent;
using sconv::events::SessionFinishedEvent;
using sconv::events::SessionStartedEvent;
using sconv::events::SizeWarningEvent;
namespace pipeline = sconv::pipeline;

TEST(MetricsComponentTest, TracksFallbackSession) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SessionStartedEvent{"s1", "in.mkv", "out.mp4", std::uint64_t{4096}});

    pipeline::AttemptReport copy;
    copy.strategy = pipeline::ConversionStrategy::StreamCopy;
    copy.bytes_in = 4096;
    copy.classification = pipeline::Classification::FailRetryable;
    bus.emit(AttemptFinishedEvent{"s1", copy});
    bus.emit(DestinationResetEvent{"s1", "out.mp4", 100});

    pipeline::AttemptReport reencode;
    reencode.strategy = pipeline::ConversionStrategy::FullReencode;
    reencode.bytes_in = 4096;
    reencode.classification = pipeline::Classification::Success;
    bus.emit(AttemptFinishedEvent{"s1", reencode});
    bus.emit(HeartbeatEvent{});
    bus.emit(SessionFinishedEvent{"s1", pipeline::Succeeded{2048, "out.mp4"}, 2, std::chrono::milliseconds(30)});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.sessions_started.load(), 1u);
    EXPECT_EQ(stats.sessions_succeeded.load(), 1u);
    EXPECT_EQ(stats.attempts.load(), 2u);
    EXPECT_EQ(stats.fallbacks.load(), 1u);
    EXPECT_EQ(stats.heartbeats.load(), 1u);
    EXPECT_EQ(stats.bytes_read.load(), 8192u);
    EXPECT_EQ(stats.bytes_written.load(), 2048u);
}

TEST(MetricsComponentTest, CountsFailuresCancellationsAndWarnings) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(SizeWarningEvent{"s1", std::uint64_t{2}, 0, 1,
                              sconv::PipelineError{sconv::ErrorKind::SizeThresholdExceeded, "big"}});
    bus.emit(SessionFinishedEvent{
        "s1", pipeline::Failed{{sconv::ErrorKind::SourceReadError, "gone"}}, 1, std::chrono::milliseconds(1)});
    bus.emit(SessionFinishedEvent{"s2", pipeline::Cancelled{}, 1, std::chrono::milliseconds(1)});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.size_warnings.load(), 1u);
    EXPECT_EQ(stats.sessions_failed.load(), 1u);
    EXPECT_EQ(stats.sessions_cancelled.load(), 1u);
    EXPECT_EQ(stats.bytes_written.load(), 0u);
}

TEST(LoggerComponentTest, HandlesEveryEventAndUnsubscribes) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<SessionFinishedEvent>(), 1u);

        pipeline::AttemptReport report;
        report.exit_status = pipeline::ExitStatus{true, 1, 0};
        report.diagnostics = "Invalid data found when processing input";
        report.error = sconv::PipelineError{sconv::ErrorKind::ConverterExitError, "exit 1"};
        report.classification = pipeline::Classification::FailRetryable;

        EXPECT_NO_THROW(bus.emit(SessionStartedEvent{"s1", "in", "out", std::nullopt}));
        EXPECT_NO_THROW(bus.emit(AttemptFinishedEvent{"s1", report}));
        EXPECT_NO_THROW(bus.emit(HeartbeatEvent{}));
        EXPECT_NO_THROW(bus.emit(SessionFinishedEvent{
            "s1", pipeline::Failed{report.error.value()}, 1, std::chrono::milliseconds(2)}));
    }
    EXPECT_EQ(bus.subscriber_count<SessionFinishedEvent>(), 0u);
}
