#include "sconv/pipeline/orchestrator.hpp"

#include "sconv/core/format.hpp"
#include "sconv/events/events.hpp"
#include "sconv/pipeline/chunk_sink.hpp"
#include "sconv/pipeline/chunk_source.hpp"
#include "sconv/pipeline/classify.hpp"
#include "sconv/pipeline/converter_process.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <thread>

namespace sconv::pipeline {
namespace {

SessionState terminal_state_for(const Outcome& outcome) {
    if (std::holds_alternative<Succeeded>(outcome)) {
        return SessionState::Succeeded;
    }
    if (std::holds_alternative<Failed>(outcome)) {
        return SessionState::Failed;
    }
    return SessionState::Cancelled;
}

Outcome failed(ErrorKind kind, std::string message) {
    return Failed{PipelineError{kind, std::move(message)}};
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(const PipelineContext& context,
                                           io::RemoteOrigin& origin,
                                           io::DestinationTransport& destination,
                                           const CancellationToken& cancel)
    : context_(context),
      origin_(origin),
      destination_(destination),
      cancel_(cancel),
      session_(context.session_id, origin.describe()),
      size_guard_(context.config.size_warning_threshold,
                  [this](std::optional<std::uint64_t> declared, std::uint64_t observed, std::uint64_t threshold) {
                      on_size_warning(declared, observed, threshold);
                  }) {
}

Outcome PipelineOrchestrator::run(std::optional<std::uint64_t> declared_size) {
    if (session_.state() != SessionState::Idle) {
        return failed(ErrorKind::InternalError, "session " + session_.session_id() + " already ran");
    }

    try {
        return run_session(declared_size);
    } catch (const std::exception& e) {
        spdlog::error("Pipeline session={} aborted by exception: {}", session_.session_id(), e.what());
        if (is_terminal(session_.state())) {
            return failed(ErrorKind::InternalError, e.what());
        }
        return conclude(failed(ErrorKind::InternalError, e.what()));
    }
}

Outcome PipelineOrchestrator::run_session(std::optional<std::uint64_t> declared_size) {
    context_.bus.emit(events::SessionStartedEvent{
        session_.session_id(), origin_.describe(), destination_.describe(), declared_size});

    if (auto valid = context_.config.validate(); valid.is_error()) {
        return conclude(failed(ErrorKind::InvalidConfig, valid.error()));
    }

    auto size = declared_size;
    if (!size) {
        auto probed = origin_.probe_size(cancel_);
        if (probed.is_error()) {
            spdlog::warn("Size probe failed session={} error={}", session_.session_id(), probed.error());
        } else {
            size = probed.value();
        }
    }
    session_.set_size(size);

    // Runs before the first byte is requested.
    const auto size_class = size_guard_.evaluate(size);
    spdlog::debug("Size check session={} size={} class={}", session_.session_id(),
                  size ? format_bytes(*size) : std::string("unknown"), to_string(size_class));
    if (auto res = advance(SessionState::SizeChecked); res.is_error()) {
        return conclude(failed(ErrorKind::InternalError, res.error()));
    }

    if (cancel_.is_cancelled()) {
        return conclude(Cancelled{});
    }

    if (auto opened = destination_.open(); opened.is_error()) {
        return conclude(failed(ErrorKind::DestinationWriteError, opened.error()));
    }

    heartbeat_.arm(context_.config.heartbeat_interval,
                   [this](std::uint64_t sequence) { on_heartbeat(sequence); });
    if (auto res = advance(attempting_state(ConversionStrategy::StreamCopy)); res.is_error()) {
        return conclude(failed(ErrorKind::InternalError, res.error()));
    }

    auto strategy = ConversionStrategy::StreamCopy;
    std::uint32_t attempt_number = 0;
    while (true) {
        if (cancel_.is_cancelled()) {
            return conclude(Cancelled{});
        }

        attempts_.push_back(run_attempt(strategy, ++attempt_number));
        const auto& report = attempts_.back();
        context_.bus.emit(events::AttemptFinishedEvent{session_.session_id(), report});

        auto next = next_state(session_.state(), report.classification);
        if (next.is_error()) {
            return conclude(failed(ErrorKind::InternalError, next.error()));
        }

        switch (next.value()) {
            case SessionState::AttemptingFullReencode: {
                if (cancel_.is_cancelled()) {
                    return conclude(Cancelled{});
                }
                if (auto reset = destination_.reset(); reset.is_error()) {
                    return conclude(failed(ErrorKind::DestinationWriteError,
                                           "reset before fallback failed: " + reset.error()));
                }
                context_.bus.emit(events::DestinationResetEvent{
                    session_.session_id(), destination_.describe(), report.bytes_accepted});
                strategy = ConversionStrategy::FullReencode;
                if (auto res = advance(attempting_state(strategy)); res.is_error()) {
                    return conclude(failed(ErrorKind::InternalError, res.error()));
                }
                continue;
            }
            case SessionState::Succeeded: {
                heartbeat_.disarm();
                if (cancel_.is_cancelled()) {
                    return conclude(Cancelled{});
                }
                auto committed = destination_.commit();
                if (committed.is_error()) {
                    return conclude(failed(ErrorKind::DestinationWriteError, committed.error()));
                }
                return conclude(Succeeded{report.bytes_accepted, committed.value()});
            }
            case SessionState::Cancelled:
                return conclude(Cancelled{});
            default: {
                const auto error = report.error.value_or(
                    PipelineError{ErrorKind::InternalError, "attempt failed without an error"});
                return conclude(Failed{error});
            }
        }
    }
}

AttemptReport PipelineOrchestrator::run_attempt(ConversionStrategy strategy, std::uint32_t attempt_number) {
    const auto& config = context_.config;
    const auto started = std::chrono::steady_clock::now();
    const auto elapsed = [started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    };

    AttemptReport report;
    report.strategy = strategy;
    live_bytes_in_.store(0);
    live_bytes_out_.store(0);

    AttemptFacts facts;
    auto launched = ConverterProcess::launch(config.args_for(strategy), config.diagnostic_limit);
    if (launched.is_error()) {
        context_.bus.emit(events::AttemptStartedEvent{session_.session_id(), strategy, attempt_number, -1});
        facts.cancelled = cancel_.is_cancelled();
        facts.launch_error = launched.error();
        const auto verdict = classify_attempt(facts);
        report.classification = verdict.classification;
        report.error = verdict.error;
        report.duration = elapsed();
        return report;
    }

    auto process = std::move(launched.value());
    report.pid = process->pid();
    context_.bus.emit(events::AttemptStartedEvent{session_.session_id(), strategy, attempt_number, report.pid});

    // Killing the converter unblocks the feeder and drainer threads.
    CancellationScope kill_on_cancel(cancel_, [&process]() { process->terminate(); });

    ChunkSource source(origin_, config, cancel_);
    ChunkSink sink(destination_, config, cancel_);
    std::optional<PipelineError> feed_error;
    std::optional<PipelineError> drain_error;

    std::thread feeder([&]() {
        try {
            auto pumped = source.pump(process->input(), session_.size(), [this](std::uint64_t bytes) {
                live_bytes_in_.store(bytes);
                size_guard_.observe(bytes);
            });
            if (pumped.is_error()) {
                feed_error = pumped.error();
            }
        } catch (const std::exception& e) {
            feed_error = PipelineError{ErrorKind::InternalError, std::string("feeder: ") + e.what()};
        }
        if (feed_error && feed_error->kind != ErrorKind::ConverterInputClosed) {
            process->terminate();
        }
        // EOF on the converter's stdin.
        process->input().close();
    });

    std::thread drainer([&]() {
        try {
            auto drained = sink.drain(process->output(), [this](std::uint64_t bytes) {
                live_bytes_out_.store(bytes);
            });
            if (drained.is_error()) {
                drain_error = drained.error();
            }
        } catch (const std::exception& e) {
            drain_error = PipelineError{ErrorKind::InternalError, std::string("drainer: ") + e.what()};
        }
        if (drain_error) {
            // Nobody reads stdout any more; the converter would stall on a full pipe.
            process->terminate();
        }
    });

    const auto exit_status = process->wait();
    feeder.join();
    drainer.join();

    facts.cancelled = cancel_.is_cancelled();
    facts.exit_status = exit_status;
    facts.bytes_out = sink.bytes_drained();
    facts.bytes_accepted = sink.bytes_accepted();
    facts.diagnostics = process->diagnostics();
    if (feed_error) {
        if (feed_error->kind == ErrorKind::ConverterInputClosed) {
            spdlog::debug("Converter stopped reading input session={} pid={} detail={}",
                          session_.session_id(), report.pid, feed_error->message);
        } else if (feed_error->kind != ErrorKind::CancellationRequested) {
            facts.source_error = feed_error;
        }
    }
    if (drain_error && drain_error->kind != ErrorKind::CancellationRequested) {
        facts.sink_error = drain_error;
    }

    const auto verdict = classify_attempt(facts);
    report.exit_status = exit_status;
    report.diagnostics = facts.diagnostics;
    report.bytes_in = live_bytes_in_.load();
    report.bytes_out = facts.bytes_out;
    report.bytes_accepted = facts.bytes_accepted;
    report.classification = verdict.classification;
    report.error = verdict.error;
    report.duration = elapsed();
    return report;
}

Outcome PipelineOrchestrator::conclude(Outcome outcome) {
    heartbeat_.disarm();
    if (!std::holds_alternative<Succeeded>(outcome)) {
        destination_.discard();
    }

    Result<void> transitioned = Ok();
    if (const auto* failure = std::get_if<Failed>(&outcome)) {
        transitioned = session_.mark_failed(failure->error);
    } else {
        transitioned = session_.transition_to(terminal_state_for(outcome));
    }
    if (transitioned.is_error()) {
        spdlog::error("Session {} could not enter terminal state: {}",
                      session_.session_id(), transitioned.error());
    }

    context_.bus.emit(events::SessionFinishedEvent{
        session_.session_id(), outcome, static_cast<std::uint32_t>(attempts_.size()), session_.elapsed()});
    return outcome;
}

Result<void> PipelineOrchestrator::advance(SessionState next_state) {
    const auto previous = session_.state();
    auto res = session_.transition_to(next_state);
    if (res.is_ok()) {
        spdlog::debug("Session {} state {} -> {}", session_.session_id(), to_string(previous), to_string(next_state));
    }
    return res;
}

void PipelineOrchestrator::on_size_warning(std::optional<std::uint64_t> declared_size,
                                           std::uint64_t observed_bytes,
                                           std::uint64_t threshold) {
    std::string message;
    if (declared_size) {
        message = "file size " + format_bytes(*declared_size) + " exceeds " + format_bytes(threshold) +
                  "; conversion may take a long time";
    } else {
        message = "transfer passed " + format_bytes(threshold) + " with unknown total size (" +
                  format_bytes(observed_bytes) + " so far)";
    }
    context_.bus.emit(events::SizeWarningEvent{
        session_.session_id(), declared_size, observed_bytes, threshold,
        PipelineError{ErrorKind::SizeThresholdExceeded, message}});
}

void PipelineOrchestrator::on_heartbeat(std::uint64_t sequence) {
    const auto state = session_.state();
    if (!is_attempting(state)) {
        return;
    }
    context_.bus.emit(events::HeartbeatEvent{
        session_.session_id(), sequence, state, live_bytes_in_.load(), live_bytes_out_.load(), session_.elapsed()});
}

Outcome run_pipeline(const PipelineContext& context,
                     io::RemoteOrigin& origin,
                     io::DestinationTransport& destination,
                     std::optional<std::uint64_t> declared_size,
                     const CancellationToken& cancel) {
    PipelineOrchestrator orchestrator(context, origin, destination, cancel);
    return orchestrator.run(declared_size);
}

Outcome run_pipeline(const PipelineContext& context,
                     const std::string& source_locator,
                     io::DestinationTransport& destination,
                     std::optional<std::uint64_t> declared_size,
                     const CancellationToken& cancel) {
    auto origin = io::make_origin(source_locator, context.config.http_timeout);
    if (origin.is_error()) {
        const Outcome outcome = failed(ErrorKind::SourceReadError, origin.error());
        context.bus.emit(events::SessionStartedEvent{
            context.session_id, source_locator, destination.describe(), declared_size});
        destination.discard();
        context.bus.emit(events::SessionFinishedEvent{context.session_id, outcome, 0, std::chrono::milliseconds(0)});
        return outcome;
    }
    return run_pipeline(context, *origin.value(), destination, declared_size, cancel);
}

} // namespace sconv::pipeline
