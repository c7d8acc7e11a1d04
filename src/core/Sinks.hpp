//
// Created by Malik T on 07/10/2025.
//

#ifndef HOLDEMSNG_SINKS_HPP
#define HOLDEMSNG_SINKS_HPP

#include <chrono>
#include "State.hpp"
#include "Exception.hpp"

namespace holdem::core
{
    // Where table state goes after every mutation. Called on the coordinator thread.
    class BroadcastSink
    {
    public:
        virtual ~BroadcastSink() = default;

        virtual auto Publish(std::shared_ptr<TableSnapshot const> snapshot) -> void = 0;
        virtual auto TimerTick(SeatIdxT seat, std::chrono::milliseconds remaining) -> void
        {
            (void)seat;
            (void)remaining;
        }
        // A submitted action that did not apply
        virtual auto Rejected(SeatIdxT seat, error::RuleViolation const& why) -> void
        {
            (void)seat;
            (void)why;
        }
    };

    class PersistenceSink
    {
    public:
        virtual ~PersistenceSink() = default;

        virtual auto SaveHand(HandRecord const& record) -> void = 0;
        virtual auto SaveResult(TournamentResult const& result) -> void = 0;
    };
}

#endif //HOLDEMSNG_SINKS_HPP
