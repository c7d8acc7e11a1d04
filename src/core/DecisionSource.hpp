//
// Created by Malik T on 07/10/2025.
//

#ifndef HOLDEMSNG_DECISIONSOURCE_HPP
#define HOLDEMSNG_DECISIONSOURCE_HPP

#include <chrono>
#include "Actions.hpp"
#include "State.hpp"

namespace holdem::core
{
    class DecisionSource
    {
    public:
        virtual ~DecisionSource() = default;

        // Called off the coordinator thread with the seat's own view of the table.
        // Deadline is authoritative; nullopt or a late answer leaves the turn to the timer.
        virtual auto Decide(std::shared_ptr<TableSnapshot const> view,
                            std::chrono::steady_clock::time_point deadline) -> std::optional<Decision> = 0;

        // The pending request no longer matters (turn over, pause, shutdown)
        virtual auto Cancel() -> void {}
    };
}
#endif //HOLDEMSNG_DECISIONSOURCE_HPP
