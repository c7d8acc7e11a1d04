//
// Created by Malik T on 02/10/2025.
//

#ifndef HOLDEMSNG_UTIL_HPP
#define HOLDEMSNG_UTIL_HPP

#include <array>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace holdem::core::util
{
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit) * 13 + (static_cast<uint64_t>(c.rank) - 2);
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        auto AddAll(std::span<Card const> cs) -> void
        {
            for (Card const& c : cs) Add(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
    private:
        uint64_t cards_;
        size_t count_;
        bool contains_dup_;
    };

    inline auto SuitChar(Suit const s) -> std::string_view
    {
        switch (s)
        {
            case Suit::Clubs:    return "c";
            case Suit::Diamonds: return "d";
            case Suit::Hearts:   return "h";
            case Suit::Spades:   return "s";
        }
        return "?";
    }

    inline auto RankChar(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, 13> map{
            "2","3","4","5","6","7","8","9","T","J","Q","K","A"
        };
        return map[static_cast<size_t>(r) - 2];
    }

    inline auto CardStr(Card const& c) -> std::string
    {
        return std::format("{}{}", RankChar(c.rank), SuitChar(c.suit));
    }

    inline auto CardsStr(std::span<Card const> cs) -> std::string
    {
        std::string out;
        for (size_t i{}; i < cs.size(); ++i)
        {
            out += (i ? " " : "");
            out += CardStr(cs[i]);
        }
        return out;
    }

    // Seat distance walking clockwise from `from` (exclusive) to `to`
    inline auto ClockwiseDistance(SeatIdxT from, SeatIdxT to, size_t n) -> size_t
    {
        return (static_cast<size_t>(to) + n - static_cast<size_t>(from) - 1) % n;
    }
}

#endif //HOLDEMSNG_UTIL_HPP
