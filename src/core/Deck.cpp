//
// Created by Malik T on 03/10/2025.
//
#include "Deck.hpp"

#include <format>
#include "Exception.hpp"
#include "Util.hpp"

namespace holdem::core
{
    Deck::Deck()
    {
        cards_.reserve(constants::DeckSize);
        for (size_t i{}; i < 4; ++i)
        {
            for (size_t j{static_cast<size_t>(Rank::Two)}; j <= static_cast<size_t>(Rank::Ace); ++j)
            {
                cards_.push_back(Card{static_cast<Suit>(i), static_cast<Rank>(j)});
            }
        }
    }

    Deck::Deck(std::vector<Card> cards) :
        cards_(std::move(cards))
    {
    }

    auto Deck::FromOrder(std::vector<Card> order) -> Deck
    {
        util::CardUniqueChecker checker{};
        checker.AddAll(order);
        HLD_INVARIANT(order.size() == constants::DeckSize && !checker.ContainsDup(),
                      std::format("Recorded deck is not 52 distinct cards (size {})", order.size()));
        return Deck(std::move(order));
    }

    auto Deck::Shuffle(std::mt19937_64& rng) -> void
    {
        HLD_ASSERT(next_ == 0, "Shuffle after dealing started");
        for (size_t i = cards_.size() - 1; i > 0; --i)
        {
            std::uniform_int_distribution<size_t> pick{0, i};
            std::swap(cards_[i], cards_[pick(rng)]);
        }
    }

    auto Deck::Require(size_t const n) const -> void
    {
        HLD_INVARIANT(Remaining() >= n,
                      std::format("Deck underflow: requested {} with {} remaining", n, Remaining()));
    }

    auto Deck::Take() -> Card
    {
        return cards_[next_++];
    }

    auto Deck::DealHole(std::span<SeatIdxT const> order) -> std::vector<std::pair<SeatIdxT, HoleCards>>
    {
        Require(order.size() * constants::HoleCardCount);

        std::vector<std::pair<SeatIdxT, HoleCards>> out;
        out.reserve(order.size());
        for (SeatIdxT const seat : order)
        {
            out.emplace_back(seat, HoleCards{});
        }
        //round robin: first card to everyone, then the second
        for (size_t round{}; round < constants::HoleCardCount; ++round)
        {
            for (auto& [seat, hole] : out)
            {
                hole[round] = Take();
            }
        }
        return out;
    }

    auto Deck::DealCommunity(size_t const n) -> std::vector<Card>
    {
        Require(n);
        std::vector<Card> out;
        out.reserve(n);
        for (size_t i{}; i < n; ++i) out.push_back(Take());
        return out;
    }

    auto Deck::Burn() -> Card
    {
        Require(1);
        burned_.push_back(Take());
        return burned_.back();
    }
}
