//
// Created by Malik T on 07/10/2025.
//

#ifndef HOLDEMSNG_HUMANSEAT_HPP
#define HOLDEMSNG_HUMANSEAT_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include "DecisionSource.hpp"

namespace holdem::core
{
    // A seat answered from outside (UI, socket). Decide blocks until Deliver or the deadline.
    class HumanSeat final : public DecisionSource
    {
    public:
        explicit HumanSeat(SeatIdxT seat) : seat_(seat) {}

        auto Decide(std::shared_ptr<TableSnapshot const> view,
                    std::chrono::steady_clock::time_point deadline) -> std::optional<Decision> override;

        // Queues an answer for the current or the next request
        auto Deliver(Decision d) -> void;
        // Wakes a waiting Decide with no answer; queued answers are dropped
        auto Cancel() -> void override;
        [[nodiscard]] auto Waiting() const -> bool;

        [[nodiscard]] auto Seat() const noexcept -> SeatIdxT { return seat_; }

    private:
        SeatIdxT seat_{};
        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::deque<Decision> inbox_;
        // a newer Decide or a Cancel supersedes the one waiting
        uint64_t generation_{0};
        bool waiting_{false};
    };
}

#endif //HOLDEMSNG_HUMANSEAT_HPP
