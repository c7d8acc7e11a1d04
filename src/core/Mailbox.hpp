//
// Created by Malik T on 07/10/2025.
//

#ifndef HOLDEMSNG_MAILBOX_HPP
#define HOLDEMSNG_MAILBOX_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace holdem::core
{
    // Many producers, one consumer. FIFO.
    template <typename T>
    class Mailbox
    {
    public:
        Mailbox() = default;

        void push(T item)
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                q_.push_back(std::move(item));
            }
            cv_.notify_one();
        }

        // Blocks until an item arrives or the absolute deadline passes
        auto pop_until(std::chrono::steady_clock::time_point deadline) -> std::optional<T>
        {
            std::unique_lock<std::mutex> lock(m_);
            while (q_.empty())
            {
                if (cv_.wait_until(lock, deadline) == std::cv_status::timeout && q_.empty())
                {
                    return std::nullopt;
                }
            }
            T out = std::move(q_.front());
            q_.pop_front();
            return out;
        }

        auto pop() -> T
        {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait(lock, [&] { return !q_.empty(); });
            T out = std::move(q_.front());
            q_.pop_front();
            return out;
        }

        // Non-blocking pop (for drains / close)
        auto try_pop() -> std::optional<T>
        {
            std::lock_guard<std::mutex> lock(m_);
            if (q_.empty())
            {
                return std::nullopt;
            }
            T out = std::move(q_.front());
            q_.pop_front();
            return out;
        }

    private:
        std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
    };
}

#endif //HOLDEMSNG_MAILBOX_HPP
