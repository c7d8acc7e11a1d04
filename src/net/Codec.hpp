//
// Created by Malik T on 10/10/2025.
//

#ifndef HOLDEMSNG_CODEC_HPP
#define HOLDEMSNG_CODEC_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "holdem_net_generated.h"

namespace holdem::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // What a player action decodes into
    struct DecodedAction
    {
        SeatIdxT actor{};
        Decision decision{};
        std::uint64_t msg_id{};
    };

    auto ToFbSuit(Suit s) noexcept -> holdem::gen::net::Suit;
    auto ToFbRank(Rank r) noexcept -> holdem::gen::net::Rank;
    auto ToFbPhase(Phase p) noexcept -> holdem::gen::net::Phase;
    auto ToFbStatus(GameStatus s) noexcept -> holdem::gen::net::Status;
    auto ToFbKind(ActionType t) noexcept -> holdem::gen::net::ActionKind;

    auto FromFbSuit(holdem::gen::net::Suit s) noexcept -> Suit;
    auto FromFbRank(holdem::gen::net::Rank r) noexcept -> Rank;
    auto FromFbPhase(holdem::gen::net::Phase p) noexcept -> Phase;

    // --- Outbound (server -> client) ---

    // Encodes the snapshot as given; redaction is the engine's job (SnapshotFor)
    auto BuildSnapshot(TableSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    auto BuildTimerTick(SeatIdxT seat, std::chrono::milliseconds remaining, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(SeatIdxT seat, error::RuleViolation const& v, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Client -> server ---

    auto BuildAction(SeatIdxT actor, Decision const& d, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer before touching it
    auto DecodePlayerAction(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>;
} // namespace holdem::core::net

#endif //HOLDEMSNG_CODEC_HPP
