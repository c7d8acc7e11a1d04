//
// Created by Malik T on 02/10/2025.
//

#ifndef HOLDEMSNG_TYPES_HPP
#define HOLDEMSNG_TYPES_HPP

#define HLD_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <utility>

namespace holdem::core::constants
{
    inline constexpr size_t DeckSize = 52;
    inline constexpr size_t HoleCardCount = 2;
    inline constexpr size_t BoardSize = 5;
    inline constexpr size_t MaxSeats = 10;
    inline constexpr size_t MinSeats = 2;
    inline constexpr uint32_t DefaultHandsPerLevel = 10;
}

namespace holdem::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };

    // Numeric value is the poker rank (2..14)
    enum class Rank : uint8_t
    {
        Two = 2,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    struct Card
    {
        Suit suit{Suit::Hearts};
        Rank rank{Rank::Two};
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.suit == b.suit && a.rank == b.rank; }

    using SeatIdxT = uint8_t;
    using ChipT = int64_t;
    using HoleCards = std::array<Card, constants::HoleCardCount>;

    enum class ActorKind : uint8_t
    {
        Human,
        Automated
    };

    enum class GameMode : uint8_t
    {
        Player,
        Spectator
    };

    enum class GameStatus : uint8_t
    {
        Waiting,
        Active,
        Paused,
        Completed
    };

    struct BlindLevel
    {
        ChipT small_blind{};
        ChipT big_blind{};
    };

    inline auto DefaultBlindSchedule() -> std::vector<BlindLevel>
    {
        return {
            {10, 20}, {20, 40}, {40, 80}, {75, 150},
            {150, 300}, {300, 600}, {500, 1000}, {1000, 2000}
        };
    }

    struct SeatConfig
    {
        std::string name;
        ActorKind kind{ActorKind::Automated};
    };

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        ChipT starting_stack{1000};
        std::vector<BlindLevel> blinds{DefaultBlindSchedule()};
        uint32_t hands_per_level{constants::DefaultHandsPerLevel};
        // Dealer of the first hand; later hands advance one live seat
        SeatIdxT initial_dealer{0};
        GameMode mode{GameMode::Player};
        // Seat whose redacted view is broadcast in player mode
        SeatIdxT viewer_seat{0};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30ULL)};
        std::chrono::milliseconds tick_interval{std::chrono::seconds(1ULL)};
    };
}

#endif //HOLDEMSNG_TYPES_HPP
