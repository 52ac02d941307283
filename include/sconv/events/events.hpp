/**
 * @file events.hpp
 * @brief Events published by a pipeline run
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: AttemptStartedEvent, DestinationResetEvent.
 *
 * ORDERING (one session):
 * SessionStarted, [SizeWarning], AttemptStarted, Heartbeat*,
 * AttemptFinished, [DestinationReset, AttemptStarted, Heartbeat*,
 * AttemptFinished], SessionFinished. With an unknown size the SizeWarning
 * may arrive during the first attempt instead.
 */

#pragma once

#include "sconv/pipeline/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace sconv::events {

/**
 * @brief First event of every pipeline run
 *
 * WHO SUBSCRIBES: Logger, Metrics, CLI progress output
 */
struct SessionStartedEvent {
    std::string session_id;
    std::string source;
    std::string destination;
    std::optional<std::uint64_t> declared_size;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The transfer is larger than the configured threshold
 *
 * At most one per session. Informational only: the transfer continues.
 * declared_size is set when the warning came from the pre-flight check,
 * observed_bytes when it came from watching an unknown-size stream.
 */
struct SizeWarningEvent {
    std::string session_id;
    std::optional<std::uint64_t> declared_size;
    std::uint64_t observed_bytes = 0;
    std::uint64_t threshold = 0;
    PipelineError warning;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct AttemptStartedEvent {
    std::string session_id;
    pipeline::ConversionStrategy strategy = pipeline::ConversionStrategy::StreamCopy;
    std::uint32_t attempt_number = 1;
    int pid = -1;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct AttemptFinishedEvent {
    std::string session_id;
    pipeline::AttemptReport report;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Output of a failed attempt was dropped before the fallback attempt
 */
struct DestinationResetEvent {
    std::string session_id;
    std::string destination;
    std::uint64_t discarded_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Liveness signal, emitted only while an attempt is running
 */
struct HeartbeatEvent {
    std::string session_id;
    std::uint64_t sequence = 0;
    pipeline::SessionState state = pipeline::SessionState::AttemptingStreamCopy;
    std::uint64_t bytes_in = 0;
    std::uint64_t bytes_out = 0;
    std::chrono::milliseconds elapsed{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Last event of a session; every resource has been released
 */
struct SessionFinishedEvent {
    std::string session_id;
    pipeline::Outcome outcome;
    std::uint32_t attempts = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

using PipelineEvent = std::variant<
    SessionStartedEvent,
    SizeWarningEvent,
    AttemptStartedEvent,
    AttemptFinishedEvent,
    DestinationResetEvent,
    HeartbeatEvent,
    SessionFinishedEvent
>;

} // namespace sconv::events
