//
// Created by Malik T on 08/10/2025.
//

#include "TurnTimer.hpp"

#include <algorithm>
#include "Exception.hpp"

namespace holdem::core
{
    TurnTimer::TurnTimer(std::chrono::milliseconds const duration, std::chrono::milliseconds const tick) :
        duration_(duration),
        tick_(tick)
    {
        if (duration_.count() <= 0) HLD_THROW(error::Code::State, "Turn timeout must be positive");
        if (tick_.count() <= 0) HLD_THROW(error::Code::State, "Timer tick must be positive");
    }

    auto TurnTimer::Start(SeatIdxT const seat, uint64_t const ticket, Clock::time_point const now) -> void
    {
        HLD_ASSERT(!running_, "A turn timer is already running");
        running_ = true;
        seat_ = seat;
        ticket_ = ticket;
        deadline_ = now + duration_;
        next_tick_ = now + tick_;
        frozen_remaining_.reset();
    }

    auto TurnTimer::Cancel() noexcept -> void
    {
        running_ = false;
        seat_.reset();
        frozen_remaining_.reset();
    }

    auto TurnTimer::Freeze(Clock::time_point const now) -> void
    {
        if (!running_) return;
        frozen_remaining_ = Remaining(now);
        running_ = false;
    }

    auto TurnTimer::Remaining(Clock::time_point const now) const -> std::chrono::milliseconds
    {
        if (frozen_remaining_) return *frozen_remaining_;
        if (!running_) return std::chrono::milliseconds{0};
        return std::max(std::chrono::milliseconds{0},
                        std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now));
    }

    auto TurnTimer::Expired(Clock::time_point const now) const -> bool
    {
        return running_ && now >= deadline_;
    }

    auto TurnTimer::NextWake(Clock::time_point const now) const -> Clock::time_point
    {
        HLD_ASSERT(running_, "NextWake on an idle timer");
        Clock::time_point tick = next_tick_;
        // skip ticks missed while busy
        while (tick <= now) tick += tick_;
        return std::min(deadline_, tick);
    }
}
