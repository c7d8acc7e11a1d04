//
// Created by Malik T on 18/08/2025.
//

#include "RandomAi.hpp"
#include <algorithm>

#include "Exception.hpp"

namespace holdem::core
{
    RandomAI::RandomAI(uint64_t rng_seed, std::chrono::milliseconds think_time):
        rng_(rng_seed), think_time_(think_time) {}

    auto RandomAI::Decide(std::shared_ptr<TableSnapshot const> view,
                          std::chrono::steady_clock::time_point deadline) -> std::optional<Decision>
    {
        HLD_ASSERT(view, "Decide without a view");
        if (!view->legal) return std::nullopt;

        std::unique_lock<std::mutex> lk(mtx_);
        uint64_t const mine = ++generation_;
        cv_.notify_all();
        if (think_time_.count() > 0)
        {
            auto const wake = std::min(deadline, std::chrono::steady_clock::now() + think_time_);
            cv_.wait_until(lk, wake, [&] { return generation_ != mine; });
        }
        // a newer request or a Cancel took over
        if (generation_ != mine) return std::nullopt;

        LegalActions const& legal = *view->legal;
        std::vector<ActionType> options;
        if (legal.can_check) options.push_back(ActionType::Check);
        // folding for free is never offered
        else if (legal.can_fold) options.push_back(ActionType::Fold);
        if (legal.can_call) options.push_back(ActionType::Call);
        if (legal.can_raise) options.push_back(ActionType::Raise);
        if (options.empty()) return std::nullopt;

        switch (options[pick(options)])
        {
        case ActionType::Check: return CheckAction{};
        case ActionType::Fold: return FoldAction{};
        case ActionType::Call: return CallAction{};
        case ActionType::Raise:
            {
                ChipT const hi = std::min(legal.max_raise_to, legal.min_raise_to * 3);
                ChipT const to = std::uniform_int_distribution<ChipT>{legal.min_raise_to,
                                                                      std::max(hi, legal.min_raise_to)}(rng_);
                return RaiseAction{.to = to};
            }
        case ActionType::PostBlind: break;
        }
        return std::nullopt;
    }

    auto RandomAI::Cancel() -> void
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++generation_;
        }
        cv_.notify_all();
    }
}
