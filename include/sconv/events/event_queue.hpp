/**
 * @file event_queue.hpp
 * @brief Pull-style access to pipeline events
 *
 * The bus calls handlers on whichever pipeline thread emitted the event.
 * Callers that prefer to consume events on their own thread attach an
 * EventChannel and pop from it.
 *
 * EXAMPLE:
 * EventChannel channel(bus, session_id);
 * std::thread worker([&] { run_pipeline(...); });
 * while (auto event = channel.pop()) { ... }   // ends after SessionFinished
 * worker.join();
 */

#pragma once

#include "sconv/events/event_bus.hpp"
#include "sconv/events/events.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <type_traits>
#include <vector>

namespace sconv::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - After close(), pop() drains what is left and then returns nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        return take_locked();
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once the queue is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        });
        return take_locked();
    }

    /// Everything queued right now, oldest first.
    std::vector<T> drain() {
        std::unique_lock lock(mutex_);
        std::vector<T> items;
        while (!queue_.empty()) {
            items.push_back(std::move(queue_.front()));
            queue_.pop();
        }
        return items;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Wake all waiting consumers; pushes are still accepted.
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

/**
 * @brief Queue of every PipelineEvent emitted on a bus
 *
 * With a session filter only that session's events are queued, and the
 * channel closes itself after the session's SessionFinishedEvent.
 * Unsubscribes on destruction.
 */
class EventChannel {
public:
    explicit EventChannel(EventBus& bus, std::optional<std::string> session_filter = std::nullopt)
        : bus_(bus), session_filter_(std::move(session_filter)) {
        subscribe<SessionStartedEvent>();
        subscribe<SizeWarningEvent>();
        subscribe<AttemptStartedEvent>();
        subscribe<AttemptFinishedEvent>();
        subscribe<DestinationResetEvent>();
        subscribe<HeartbeatEvent>();
        subscribe<SessionFinishedEvent>();
    }

    ~EventChannel() {
        for (const auto& unsubscribe : unsubscribers_) {
            unsubscribe();
        }
        queue_.close();
    }

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    std::optional<PipelineEvent> pop() { return queue_.pop(); }
    std::optional<PipelineEvent> try_pop() { return queue_.try_pop(); }

    template<typename Rep, typename Period>
    std::optional<PipelineEvent> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.pop_for(timeout);
    }

    std::vector<PipelineEvent> drain() { return queue_.drain(); }

    void close() { queue_.close(); }

private:
    template<typename EventType>
    void subscribe() {
        const auto id = bus_.subscribe<EventType>([this](const EventType& event) {
            if (session_filter_ && event.session_id != *session_filter_) {
                return;
            }
            queue_.push(PipelineEvent{event});
            if constexpr (std::is_same_v<EventType, SessionFinishedEvent>) {
                if (session_filter_) {
                    queue_.close();
                }
            }
        });
        unsubscribers_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    EventBus& bus_;
    std::optional<std::string> session_filter_;
    ThreadSafeQueue<PipelineEvent> queue_;
    std::vector<std::function<void()>> unsubscribers_;
};

} // namespace sconv::events
