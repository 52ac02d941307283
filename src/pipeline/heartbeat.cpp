#include "sconv/pipeline/heartbeat.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace sconv::pipeline {

HeartbeatEmitter::HeartbeatEmitter()
    : timer_(io_context_) {
}

HeartbeatEmitter::~HeartbeatEmitter() {
    disarm();
}

void HeartbeatEmitter::arm(std::chrono::milliseconds interval, Callback callback) {
    disarm();

    {
        std::lock_guard lock(mutex_);
        armed_ = true;
        callback_ = std::move(callback);
        interval_ = interval;
        sequence_ = 0;
        next_tick_ = std::chrono::steady_clock::now();
    }

    // Flush a cancel left queued by an earlier disarm().
    io_context_.restart();
    io_context_.poll();
    io_context_.restart();
    schedule_next();
    worker_ = std::thread([this]() { io_context_.run(); });
    spdlog::debug("Heartbeat armed interval={}ms", interval.count());
}

void HeartbeatEmitter::disarm() {
    {
        // Waits for a callback in progress, which runs under this lock.
        std::lock_guard lock(mutex_);
        if (!armed_ && !worker_.joinable()) {
            return;
        }
        armed_ = false;
        callback_ = nullptr;
    }

    asio::post(io_context_, [this]() { timer_.cancel(); });
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool HeartbeatEmitter::armed() const {
    std::lock_guard lock(mutex_);
    return armed_;
}

void HeartbeatEmitter::schedule_next() {
    next_tick_ += interval_;
    const auto now = std::chrono::steady_clock::now();
    if (next_tick_ <= now) {
        // Ticks missed behind a slow callback are dropped, not replayed.
        next_tick_ = now + interval_;
    }
    timer_.expires_at(next_tick_);
    timer_.async_wait([this](const boost::system::error_code& ec) { on_tick(ec); });
}

void HeartbeatEmitter::on_tick(const boost::system::error_code& ec) {
    if (ec) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (!armed_) {
            return;
        }
        ++sequence_;
        try {
            callback_(sequence_);
        } catch (const std::exception& e) {
            spdlog::error("Heartbeat callback failed: {}", e.what());
        }
    }

    schedule_next();
}

} // namespace sconv::pipeline
