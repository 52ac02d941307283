#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace sconv::pipeline {

namespace asio = boost::asio;

/**
 * @brief Fixed-rate liveness timer running on its own thread
 *
 * The timer is independent of byte movement: a stalled converter still
 * produces heartbeats until the emitter is disarmed.
 *
 * THREAD SAFETY:
 * - arm() and disarm() may be called from any thread except the timer
 *   thread itself (the callback must not call them)
 * - After disarm() returns no callback runs; one already running completes
 *   before disarm() returns
 */
class HeartbeatEmitter {
public:
    /// Receives the 1-based tick number.
    using Callback = std::function<void(std::uint64_t)>;

    HeartbeatEmitter();
    ~HeartbeatEmitter();

    HeartbeatEmitter(const HeartbeatEmitter&) = delete;
    HeartbeatEmitter& operator=(const HeartbeatEmitter&) = delete;

    /// Start ticking every @p interval; arming an armed emitter restarts it.
    void arm(std::chrono::milliseconds interval, Callback callback);

    /// Stop ticking. Idempotent.
    void disarm();

    bool armed() const;

private:
    void schedule_next();
    void on_tick(const boost::system::error_code& ec);

    asio::io_context io_context_;
    asio::steady_timer timer_;
    std::thread worker_;

    mutable std::mutex mutex_;
    bool armed_ = false;
    Callback callback_;
    std::chrono::milliseconds interval_{0};
    std::chrono::steady_clock::time_point next_tick_;
    std::uint64_t sequence_ = 0;
};

} // namespace sconv::pipeline
