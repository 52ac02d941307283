#pragma once

#include "sconv/core/cancellation.hpp"
#include "sconv/core/error.hpp"
#include "sconv/events/event_bus.hpp"
#include "sconv/io/destination.hpp"
#include "sconv/io/origin.hpp"
#include "sconv/pipeline/config.hpp"
#include "sconv/pipeline/heartbeat.hpp"
#include "sconv/pipeline/session.hpp"
#include "sconv/pipeline/size_guard.hpp"
#include "sconv/pipeline/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sconv::pipeline {

/**
 * @brief Everything a pipeline run needs besides its endpoints
 *
 * The bus is owned by the caller and must outlive the run.
 */
struct PipelineContext {
    std::string session_id;
    PipelineConfig config;
    events::EventBus& bus;
};

/**
 * @brief Drives one transfer through the session state machine
 *
 * Idle -> SizeChecked -> AttemptingStreamCopy [-> AttemptingFullReencode]
 * -> Succeeded | Failed | Cancelled
 *
 * One instance runs one transfer. Every resource an attempt acquires
 * (converter process, pipes, feeder and drainer threads) is released before
 * the next attempt starts, and the heartbeat timer is stopped before the
 * session reaches a terminal state.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(const PipelineContext& context,
                         io::RemoteOrigin& origin,
                         io::DestinationTransport& destination,
                         const CancellationToken& cancel);

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /// Never throws; every failure is reported through the Outcome.
    Outcome run(std::optional<std::uint64_t> declared_size);

    const TransferSession& session() const noexcept { return session_; }
    const std::vector<AttemptReport>& attempts() const noexcept { return attempts_; }

private:
    Outcome run_session(std::optional<std::uint64_t> declared_size);
    AttemptReport run_attempt(ConversionStrategy strategy, std::uint32_t attempt_number);
    Outcome conclude(Outcome outcome);
    Result<void> advance(SessionState next_state);

    void on_size_warning(std::optional<std::uint64_t> declared_size,
                         std::uint64_t observed_bytes,
                         std::uint64_t threshold);
    void on_heartbeat(std::uint64_t sequence);

    const PipelineContext& context_;
    io::RemoteOrigin& origin_;
    io::DestinationTransport& destination_;
    const CancellationToken& cancel_;

    TransferSession session_;
    SizeGuard size_guard_;
    HeartbeatEmitter heartbeat_;
    std::vector<AttemptReport> attempts_;

    std::atomic<std::uint64_t> live_bytes_in_{0};
    std::atomic<std::uint64_t> live_bytes_out_{0};
};

/**
 * @brief Convert everything @p origin yields and deliver it to @p destination
 *
 * Events go to context.bus: SessionStarted, at most one SizeWarning,
 * Heartbeats while an attempt runs, AttemptStarted/AttemptFinished per
 * attempt, DestinationReset before a fallback, and SessionFinished last.
 */
Outcome run_pipeline(const PipelineContext& context,
                     io::RemoteOrigin& origin,
                     io::DestinationTransport& destination,
                     std::optional<std::uint64_t> declared_size,
                     const CancellationToken& cancel);

/// Same, with the origin picked from @p source_locator (path, file:// or http(s)://).
Outcome run_pipeline(const PipelineContext& context,
                     const std::string& source_locator,
                     io::DestinationTransport& destination,
                     std::optional<std::uint64_t> declared_size,
                     const CancellationToken& cancel);

} // namespace sconv::pipeline
