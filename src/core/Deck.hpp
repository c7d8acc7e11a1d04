//
// Created by Malik T on 03/10/2025.
//

#ifndef HOLDEMSNG_DECK_HPP
#define HOLDEMSNG_DECK_HPP

#include <random>
#include <span>
#include <utility>
#include "Types.hpp"

namespace holdem::core::debug {struct Inspector;}
namespace holdem::core
{
    // The 52 cards of one hand. Cards leave from the top and never come back.
    class Deck
    {
    public:
        // Ordered deck: suits Hearts..Spades, ranks Two..Ace
        Deck();

        // Rebuild a deck in a recorded order (replay). Throws on anything but 52 distinct cards.
        static auto FromOrder(std::vector<Card> order) -> Deck;

        // Fisher-Yates over the undealt cards
        auto Shuffle(std::mt19937_64& rng) -> void;

        // Two cards to each seat, one at a time in the given order
        auto DealHole(std::span<SeatIdxT const> order) -> std::vector<std::pair<SeatIdxT, HoleCards>>;
        auto DealCommunity(size_t n) -> std::vector<Card>;
        auto Burn() -> Card;

        [[nodiscard]] auto Remaining() const noexcept -> size_t { return cards_.size() - next_; }
        // Full order as shuffled, top first (dealt cards included)
        [[nodiscard]] auto Order() const noexcept -> std::vector<Card> const& { return cards_; }
        [[nodiscard]] auto Burned() const noexcept -> std::vector<Card> const& { return burned_; }

        friend struct debug::Inspector;
    private:
        explicit Deck(std::vector<Card> cards);
        auto Require(size_t n) const -> void;
        auto Take() -> Card;

    private:
        std::vector<Card> cards_;
        size_t next_{0};
        std::vector<Card> burned_;
    };
}

#endif //HOLDEMSNG_DECK_HPP
