//
// Created by Malik T on 08/10/2025.
//

#ifndef HOLDEMSNG_TURNTIMER_HPP
#define HOLDEMSNG_TURNTIMER_HPP

#include <chrono>
#include <optional>
#include "Types.hpp"

namespace holdem::core
{
    // Deadline of the decision currently owed. At most one runs at a time; the ticket
    // tells answers for this turn apart from answers for older ones.
    class TurnTimer
    {
    public:
        using Clock = std::chrono::steady_clock;

        TurnTimer(std::chrono::milliseconds duration, std::chrono::milliseconds tick);

        auto Start(SeatIdxT seat, uint64_t ticket, Clock::time_point now) -> void;
        auto Cancel() noexcept -> void;
        // Stops the clock but remembers whose turn it was and what was left
        auto Freeze(Clock::time_point now) -> void;

        [[nodiscard]] auto Running() const noexcept -> bool { return running_; }
        [[nodiscard]] auto Frozen() const noexcept -> bool { return frozen_remaining_.has_value(); }
        [[nodiscard]] auto Seat() const noexcept -> std::optional<SeatIdxT> { return seat_; }
        [[nodiscard]] auto Ticket() const noexcept -> uint64_t { return ticket_; }
        [[nodiscard]] auto Deadline() const noexcept -> Clock::time_point { return deadline_; }
        [[nodiscard]] auto Duration() const noexcept -> std::chrono::milliseconds { return duration_; }

        [[nodiscard]] auto Remaining(Clock::time_point now) const -> std::chrono::milliseconds;
        [[nodiscard]] auto Expired(Clock::time_point now) const -> bool;
        // Earlier of the deadline and the next tick
        [[nodiscard]] auto NextWake(Clock::time_point now) const -> Clock::time_point;

    private:
        std::chrono::milliseconds duration_;
        std::chrono::milliseconds tick_;
        bool running_{false};
        std::optional<SeatIdxT> seat_{};
        uint64_t ticket_{0};
        Clock::time_point deadline_{};
        Clock::time_point next_tick_{};
        std::optional<std::chrono::milliseconds> frozen_remaining_{};
    };
}

#endif //HOLDEMSNG_TURNTIMER_HPP
