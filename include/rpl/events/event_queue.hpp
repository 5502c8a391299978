/**
 * @file event_queue.hpp
 * @brief Blocking hand-off queue between threads
 *
 * Two users in the engine:
 * - EventBus: posted deliveries waiting for the dispatcher thread
 * - JobManager: worker outcomes from the io thread waiting for the
 *   coordinator loop
 *
 * EXAMPLE:
 * ThreadSafeQueue<WorkerOutcome> intake;
 * intake.push(outcome);                                   // io thread
 * if (auto first = intake.pop_for(200ms)) {               // coordinator
 *     handle(*first);
 *     for (auto& rest : intake.drain()) handle(rest);
 * }
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace rpl::events {

/**
 * @brief Multi-producer multi-consumer FIFO
 *
 * After close(), pushes are still accepted and queued items are still
 * handed out; blocking pops stop waiting and return nullopt once the
 * queue is empty.
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /// Waits for an item; nullopt once closed and empty
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return take_front();
    }

    /// As pop(), giving up after timeout
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return !items_.empty() || closed_; });
        return take_front();
    }

    /// Everything queued right now, oldest first
    std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& item : items_) {
            out.push_back(std::move(item));
        }
        items_.clear();
        return out;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace rpl::events
