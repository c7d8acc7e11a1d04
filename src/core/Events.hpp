//
// Created by Malik T on 06/10/2025.
//

#ifndef HOLDEMSNG_EVENTS_HPP
#define HOLDEMSNG_EVENTS_HPP

#include <functional>
#include <mutex>
#include <variant>
#include "State.hpp"

namespace holdem::core
{
    struct AllInEvent
    {
        uint32_t hand_number{};
        SeatIdxT seat{};
        ChipT committed{}; // total put in this hand
    };

    struct ShowdownEvent
    {
        uint32_t hand_number{};
        std::vector<ShowdownEntry> entries;
    };

    struct EliminationEvent
    {
        uint32_t hand_number{};
        SeatIdxT seat{};
        uint32_t finish_position{};
    };

    struct BlindsIncreasedEvent
    {
        uint32_t level{};
        BlindLevel blinds{};
    };

    struct HandCompletedEvent
    {
        uint32_t hand_number{};
        std::vector<SeatIdxT> winners;
        ChipT pot_total{};
    };

    struct TournamentCompletedEvent
    {
        std::optional<SeatIdxT> winner{};
        bool aborted{false};
    };

    using GameEvent = std::variant<AllInEvent, ShowdownEvent, EliminationEvent, BlindsIncreasedEvent,
                                   HandCompletedEvent, TournamentCompletedEvent>;

    // Synchronous fan-out. Handlers run on the publishing thread and must not publish back.
    class EventBus
    {
    public:
        using Handler = std::function<void(GameEvent const&)>;
        using SubscriptionId = uint64_t;

        auto Subscribe(Handler h) -> SubscriptionId;
        auto Unsubscribe(SubscriptionId id) -> void;
        auto Publish(GameEvent const& e) const -> void;

    private:
        mutable std::mutex mtx_;
        std::vector<std::pair<SubscriptionId, Handler>> handlers_;
        SubscriptionId next_id_{1};
    };

    auto to_string(GameEvent const& e) -> std::string;
}

#endif //HOLDEMSNG_EVENTS_HPP
