//
// Created by Malik T on 07/10/2025.
//

#include "HumanSeat.hpp"

namespace holdem::core
{
    auto HumanSeat::Decide(std::shared_ptr<TableSnapshot const> view,
                           std::chrono::steady_clock::time_point deadline) -> std::optional<Decision>
    {
        (void)view;

        std::unique_lock<std::mutex> lk(mtx_);
        uint64_t const mine = ++generation_;
        waiting_ = true;
        cv_.notify_all();
        cv_.wait_until(lk, deadline, [&] { return !inbox_.empty() || generation_ != mine; });

        if (generation_ != mine) return std::nullopt;
        waiting_ = false;
        if (inbox_.empty()) return std::nullopt;

        Decision out = inbox_.front();
        inbox_.pop_front();
        return out;
    }

    auto HumanSeat::Deliver(Decision d) -> void
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            inbox_.push_back(std::move(d));
        }
        cv_.notify_all();
    }

    auto HumanSeat::Cancel() -> void
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++generation_;
            waiting_ = false;
            inbox_.clear();
        }
        cv_.notify_all();
    }

    auto HumanSeat::Waiting() const -> bool
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return waiting_;
    }
}
