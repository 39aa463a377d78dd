#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace hb {

// Bounded single-consumer queue. A full mailbox drops its oldest event so the
// producer never waits on a slow reader.
template <typename Event>
class Mailbox {
public:
    explicit Mailbox(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("mailbox capacity must be positive");
        }
    }

    void push(Event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            if (queue_.size() == capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    std::optional<Event> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    template <typename Rep, typename Period>
    std::optional<Event> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return popLocked();
    }

    std::vector<Event> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> out(std::make_move_iterator(queue_.begin()),
                               std::make_move_iterator(queue_.end()));
        queue_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::optional<Event> popLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        Event out = std::move(queue_.front());
        queue_.pop_front();
        return out;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> queue_;
    std::uint64_t dropped_ = 0;
    bool closed_ = false;
};

// Fan-out to every live mailbox. The hub only holds weak references:
// dropping the shared_ptr returned by subscribe() unsubscribes.
template <typename Event>
class BroadcastHub {
public:
    using Subscription = std::shared_ptr<Mailbox<Event>>;

    Subscription subscribe(std::size_t capacity) {
        auto mailbox = std::make_shared<Mailbox<Event>>(capacity);
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_.push_back(mailbox);
        return mailbox;
    }

    std::size_t publish(const Event& event) {
        std::vector<Subscription> live;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            live.reserve(subscribers_.size());
            auto out = subscribers_.begin();
            for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
                if (auto mailbox = it->lock()) {
                    live.push_back(std::move(mailbox));
                    *out++ = *it;
                }
            }
            subscribers_.erase(out, subscribers_.end());
        }
        for (auto& mailbox : live) {
            mailbox->push(event);
        }
        return live.size();
    }

    std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& weak : subscribers_) {
            if (!weak.expired()) {
                ++count;
            }
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<Mailbox<Event>>> subscribers_;
};

} // namespace hb
