/**
 * @file components.hpp
 * @brief Ready-made pipeline event subscribers
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * run_pipeline(context, ...);
 * metrics.print_stats();
 */

#pragma once

#include "sconv/core/format.hpp"
#include "sconv/events/event_bus.hpp"
#include "sconv/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace sconv::events {

/**
 * @brief Logs every pipeline event through spdlog
 *
 * Heartbeats are logged at debug level; everything else at info or above.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        listen<SessionStartedEvent>([this](const SessionStartedEvent& e) { on_session_started(e); });
        listen<SizeWarningEvent>([this](const SizeWarningEvent& e) { on_size_warning(e); });
        listen<AttemptStartedEvent>([this](const AttemptStartedEvent& e) { on_attempt_started(e); });
        listen<AttemptFinishedEvent>([this](const AttemptFinishedEvent& e) { on_attempt_finished(e); });
        listen<DestinationResetEvent>([this](const DestinationResetEvent& e) { on_destination_reset(e); });
        listen<HeartbeatEvent>([this](const HeartbeatEvent& e) { on_heartbeat(e); });
        listen<SessionFinishedEvent>([this](const SessionFinishedEvent& e) { on_session_finished(e); });
    }

    ~LoggerComponent() {
        for (const auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    template<typename EventType>
    void listen(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    void on_session_started(const SessionStartedEvent& e) {
        spdlog::info("[SessionStarted] session={} source={} destination={} size={}",
                     e.session_id, e.source, e.destination,
                     e.declared_size ? format_bytes(*e.declared_size) : std::string("unknown"));
    }

    void on_size_warning(const SizeWarningEvent& e) {
        spdlog::warn("[SizeWarning] session={} {}", e.session_id, e.warning.message);
    }

    void on_attempt_started(const AttemptStartedEvent& e) {
        spdlog::info("[AttemptStarted] session={} attempt={} strategy={} pid={}",
                     e.session_id, e.attempt_number, pipeline::to_string(e.strategy), e.pid);
    }

    void on_attempt_finished(const AttemptFinishedEvent& e) {
        const auto& r = e.report;
        const auto level = r.classification == pipeline::Classification::Success
            ? spdlog::level::info
            : spdlog::level::warn;
        spdlog::log(level,
                    "[AttemptFinished] session={} strategy={} result={} exit={} in={} out={} accepted={} duration={}",
                    e.session_id,
                    pipeline::to_string(r.strategy),
                    pipeline::to_string(r.classification),
                    r.exit_status ? r.exit_status->describe() : std::string("not started"),
                    format_bytes(r.bytes_in),
                    format_bytes(r.bytes_out),
                    format_bytes(r.bytes_accepted),
                    format_duration(r.duration));
        if (r.error) {
            spdlog::log(level, "[AttemptFinished] session={} error={}", e.session_id, r.error->describe());
        }
        if (r.classification != pipeline::Classification::Success && !r.diagnostics.empty()) {
            spdlog::debug("[AttemptFinished] session={} converter stderr:\n{}", e.session_id, r.diagnostics);
        }
    }

    void on_destination_reset(const DestinationResetEvent& e) {
        spdlog::info("[DestinationReset] session={} destination={} discarded={}",
                     e.session_id, e.destination, format_bytes(e.discarded_bytes));
    }

    void on_heartbeat(const HeartbeatEvent& e) {
        spdlog::debug("[Heartbeat] session={} seq={} state={} in={} out={} rate={}",
                      e.session_id, e.sequence, pipeline::to_string(e.state),
                      format_bytes(e.bytes_in), format_bytes(e.bytes_out),
                      format_rate(e.bytes_in, e.elapsed));
    }

    void on_session_finished(const SessionFinishedEvent& e) {
        const bool succeeded = std::holds_alternative<pipeline::Succeeded>(e.outcome);
        spdlog::log(succeeded ? spdlog::level::info : spdlog::level::warn,
                    "[SessionFinished] session={} attempts={} duration={} outcome={}",
                    e.session_id, e.attempts, format_duration(e.duration), pipeline::describe(e.outcome));
    }

    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

/**
 * @brief Counts sessions, attempts, fallbacks and bytes
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_started{0};
        std::atomic<uint64_t> sessions_succeeded{0};
        std::atomic<uint64_t> sessions_failed{0};
        std::atomic<uint64_t> sessions_cancelled{0};
        std::atomic<uint64_t> attempts{0};
        std::atomic<uint64_t> fallbacks{0};
        std::atomic<uint64_t> size_warnings{0};
        std::atomic<uint64_t> heartbeats{0};
        std::atomic<uint64_t> bytes_read{0};
        std::atomic<uint64_t> bytes_written{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        listen<SessionStartedEvent>([this](const SessionStartedEvent&) {
            stats_.sessions_started++;
        });
        listen<SizeWarningEvent>([this](const SizeWarningEvent&) {
            stats_.size_warnings++;
        });
        listen<AttemptFinishedEvent>([this](const AttemptFinishedEvent& e) {
            stats_.attempts++;
            stats_.bytes_read += e.report.bytes_in;
        });
        listen<DestinationResetEvent>([this](const DestinationResetEvent&) {
            stats_.fallbacks++;
        });
        listen<HeartbeatEvent>([this](const HeartbeatEvent&) {
            stats_.heartbeats++;
        });
        listen<SessionFinishedEvent>([this](const SessionFinishedEvent& e) {
            on_session_finished(e);
        });
    }

    ~MetricsComponent() {
        for (const auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Pipeline statistics:");
        spdlog::info("  Sessions:      {} started, {} succeeded, {} failed, {} cancelled",
                     stats_.sessions_started.load(), stats_.sessions_succeeded.load(),
                     stats_.sessions_failed.load(), stats_.sessions_cancelled.load());
        spdlog::info("  Attempts:      {} ({} fallbacks)", stats_.attempts.load(), stats_.fallbacks.load());
        spdlog::info("  Size warnings: {}", stats_.size_warnings.load());
        spdlog::info("  Heartbeats:    {}", stats_.heartbeats.load());
        spdlog::info("  Bytes read:    {}", format_bytes(stats_.bytes_read.load()));
        spdlog::info("  Bytes written: {}", format_bytes(stats_.bytes_written.load()));
    }

private:
    template<typename EventType>
    void listen(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    void on_session_finished(const SessionFinishedEvent& e) {
        if (const auto* ok = std::get_if<pipeline::Succeeded>(&e.outcome)) {
            stats_.sessions_succeeded++;
            stats_.bytes_written += ok->bytes_written;
        } else if (std::holds_alternative<pipeline::Failed>(e.outcome)) {
            stats_.sessions_failed++;
        } else {
            stats_.sessions_cancelled++;
        }
    }

    EventBus& bus_;
    Stats stats_;
    std::vector<std::function<void()>> unsubscribers_;
};

} // namespace sconv::events
