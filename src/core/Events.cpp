//
// Created by Malik T on 06/10/2025.
//

#include "Events.hpp"

#include <algorithm>
#include <format>

namespace holdem::core
{
    auto EventBus::Subscribe(Handler h) -> SubscriptionId
    {
        std::lock_guard lk(mtx_);
        SubscriptionId const id = next_id_++;
        handlers_.emplace_back(id, std::move(h));
        return id;
    }

    auto EventBus::Unsubscribe(SubscriptionId const id) -> void
    {
        std::lock_guard lk(mtx_);
        std::erase_if(handlers_, [id](auto const& entry) { return entry.first == id; });
    }

    auto EventBus::Publish(GameEvent const& e) const -> void
    {
        std::vector<Handler> snapshot;
        {
            std::lock_guard lk(mtx_);
            snapshot.reserve(handlers_.size());
            for (auto const& [id, h] : handlers_) snapshot.push_back(h);
        }
        for (Handler const& h : snapshot) h(e);
    }

    auto to_string(GameEvent const& e) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& ev) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, AllInEvent>)
                return std::format("hand {}: P{} all-in ({} committed)", ev.hand_number,
                                   static_cast<int>(ev.seat), ev.committed);
            else if constexpr (std::is_same_v<T, ShowdownEvent>)
                return std::format("hand {}: showdown between {} seats", ev.hand_number, ev.entries.size());
            else if constexpr (std::is_same_v<T, EliminationEvent>)
                return std::format("hand {}: P{} eliminated in place {}", ev.hand_number,
                                   static_cast<int>(ev.seat), ev.finish_position);
            else if constexpr (std::is_same_v<T, BlindsIncreasedEvent>)
                return std::format("blinds up to level {} ({}/{})", ev.level + 1, ev.blinds.small_blind,
                                   ev.blinds.big_blind);
            else if constexpr (std::is_same_v<T, HandCompletedEvent>)
                return std::format("hand {} complete, pot {}", ev.hand_number, ev.pot_total);
            else
                return ev.winner
                           ? std::format("tournament won by P{}", static_cast<int>(*ev.winner))
                           : std::string{ev.aborted ? "tournament aborted" : "tournament over"};
        }, e);
    }
}
