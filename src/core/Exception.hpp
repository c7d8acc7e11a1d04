//
// Created by Malik T on 02/10/2025.
//

#ifndef HOLDEMSNG_EXCEPTION_HPP
#define HOLDEMSNG_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace holdem::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // engine misuse (not a user invalid move)
        InvalidAction, // proposed action cannot be applied
        Timeout, // deadline exceeded for a decision
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Invariant, // broken chip/card/ordering invariant, fatal
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvariantError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Invariant: throw InvariantError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define HLD_THROW(code_enum, msg) ::holdem::core::error::fail((code_enum), (msg), std::source_location::current())
#define HLD_ASSERT(cond, msg) do { if(!(cond)) ::holdem::core::error::fail(::holdem::core::error::Code::Assertion, (msg), std::source_location::current()); } while(0)
#define HLD_INVARIANT(cond, msg) do { if(!(cond)) ::holdem::core::error::fail(::holdem::core::error::Code::Invariant, (msg), std::source_location::current()); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        NoHandInProgress,
        WrongActor,
        SeatOutOfRange,
        ActorFolded,
        ActorAllIn,
        ActorEliminated,
        GamePaused,
        GameNotActive,
        StaleDecision,

        // Check
        Check_BetOutstanding,

        // Call
        Call_NothingToCall,

        // Raise
        Raise_StackTooShort,
        Raise_ActionNotReopened,
        Raise_NotAboveBet,
        Raise_BelowMinimum,
        Raise_ExceedsStack,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<SeatIdxT> actor{};
        std::optional<SeatIdxT> expected_actor{};

        std::optional<ChipT> bet_to_match{};
        std::optional<ChipT> current_bet{};
        std::optional<ChipT> stack{};
        std::optional<ChipT> attempted{}; // e.g. raise-to
        std::optional<ChipT> minimum{}; // e.g. min raise-to

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(SeatIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_expected(SeatIdxT s) -> RuleViolation&
        {
            expected_actor = s;
            return *this;
        }

        auto with_bet(ChipT to_match, ChipT mine) -> RuleViolation&
        {
            bet_to_match = to_match;
            current_bet = mine;
            return *this;
        }

        auto with_stack(ChipT v) -> RuleViolation&
        {
            stack = v;
            return *this;
        }

        auto with_attempted(ChipT v) -> RuleViolation&
        {
            attempted = v;
            return *this;
        }

        auto with_minimum(ChipT v) -> RuleViolation&
        {
            minimum = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::NoHandInProgress: return "No hand in progress";
        case E::WrongActor: return "Not this seat's turn";
        case E::SeatOutOfRange: return "Seat index out of range";
        case E::ActorFolded: return "Seat has folded";
        case E::ActorAllIn: return "Seat is all-in";
        case E::ActorEliminated: return "Seat is eliminated";
        case E::GamePaused: return "Game is paused";
        case E::GameNotActive: return "Game is not running";
        case E::StaleDecision: return "Decision belongs to an expired turn";

        case E::Check_BetOutstanding: return "Check: a bet is outstanding";
        case E::Call_NothingToCall: return "Call: nothing to call";

        case E::Raise_StackTooShort: return "Raise: stack does not exceed the call amount";
        case E::Raise_ActionNotReopened: return "Raise: action was not reopened by an incomplete raise";
        case E::Raise_NotAboveBet: return "Raise: amount does not exceed the bet to match";
        case E::Raise_BelowMinimum: return "Raise: below the minimum raise";
        case E::Raise_ExceedsStack: return "Raise: exceeds available chips";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.expected_actor) s += std::format(" | expected=P{}", static_cast<int>(*v.expected_actor));
        if (v.bet_to_match) s += std::format(" | to_match={}", *v.bet_to_match);
        if (v.current_bet) s += std::format(" | mine={}", *v.current_bet);
        if (v.stack) s += std::format(" | stack={}", *v.stack);
        if (v.attempted) s += std::format(" | attempted={}", *v.attempted);
        if (v.minimum) s += std::format(" | min={}", *v.minimum);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //HOLDEMSNG_EXCEPTION_HPP
