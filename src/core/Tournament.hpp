//
// Created by Malik T on 06/10/2025.
//

#ifndef HOLDEMSNG_TOURNAMENT_HPP
#define HOLDEMSNG_TOURNAMENT_HPP

#include <expected>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Deck.hpp"
#include "Blinds.hpp"
#include "Pots.hpp"
#include "Evaluator.hpp"
#include "Events.hpp"

namespace holdem::core::debug {struct Inspector;}
namespace holdem::core
{
    using ActionResult = std::expected<Action, error::RuleViolation>;

    // Authoritative state of one sit-and-go. Not thread-safe: a single owner drives it.
    class TournamentEngine
    {
    public:
        TournamentEngine() = delete;
        TournamentEngine(Config const& config,
                         std::vector<SeatConfig> const& seats,
                         std::shared_ptr<HandEvaluator const> evaluator,
                         std::shared_ptr<EventBus> events = nullptr,
                         std::unique_ptr<Rules> rules = nullptr);

        // Waiting -> Active
        auto Start() -> void;

        // Moves the button, posts blinds and deals. When blinds leave nobody able to act
        // the hand runs out and finishes inside this call.
        auto StartHand() -> void;

        // Ordinary rule violations come back as unexpected and leave the state untouched
        auto Apply(SeatIdxT seat, Decision const& d) -> ActionResult;
        [[nodiscard]] auto Validate(SeatIdxT seat, Decision const& d) const -> error::ValidateResult;
        [[nodiscard]] auto LegalFor(SeatIdxT seat) const -> LegalActions;
        // Check when it costs nothing, fold otherwise
        [[nodiscard]] auto TimeoutDecision(SeatIdxT seat) const -> Decision;

        auto Pause() -> void;
        auto Resume() -> void;
        // Ends the tournament where it stands; chips are not moved
        auto Abort(std::string_view reason) -> void;

        [[nodiscard]] auto Snapshot() const -> std::shared_ptr<TableSnapshot const>;
        [[nodiscard]] auto SnapshotFor(SeatIdxT viewer) const -> std::shared_ptr<TableSnapshot const>;

        // Records of hands finished since the last drain, oldest first
        auto DrainCompletedHands() -> std::vector<HandRecord>;
        [[nodiscard]] auto History() const noexcept -> std::vector<HandRecord> const& { return history_; }
        [[nodiscard]] auto Standings() const -> std::vector<Standing>;
        [[nodiscard]] auto Result() const -> std::optional<TournamentResult>;
        [[nodiscard]] auto Stats() const noexcept -> TournamentStats const& { return stats_; }

        [[nodiscard]] auto Status() const noexcept -> GameStatus { return status_; }
        [[nodiscard]] auto PhaseNow() const noexcept -> Phase { return phase_; }
        [[nodiscard]] auto HandInProgress() const noexcept -> bool;
        [[nodiscard]] auto CurrentActor() const noexcept -> std::optional<SeatIdxT>;
        [[nodiscard]] auto Dealer() const noexcept -> SeatIdxT { return dealer_; }
        [[nodiscard]] auto HandsPlayed() const noexcept -> uint32_t { return hands_played_; }
        [[nodiscard]] auto HandNumber() const noexcept -> uint32_t;
        [[nodiscard]] auto Aborted() const noexcept -> bool { return aborted_; }
        [[nodiscard]] auto PlayerCount() const noexcept -> size_t { return players_.size(); }
        [[nodiscard]] auto Player(SeatIdxT seat) const -> PlayerState const& { return players_.at(seat); }
        [[nodiscard]] auto Players() const noexcept -> std::span<PlayerState const> { return players_; }
        [[nodiscard]] auto TotalChips() const noexcept -> ChipT { return total_chips_; }
        [[nodiscard]] auto GetConfig() const noexcept -> Config const& { return cfg_; }

        // Re-runs a recorded hand from its setup and action log and returns the fresh record.
        // Throws InvalidActionError when a recorded action does not apply.
        static auto Replay(HandRecord const& record, std::shared_ptr<HandEvaluator const> evaluator) -> HandRecord;

        //allows class to directly access private data on an instance
        friend struct debug::Inspector;

    private:
        struct HandSetup
        {
            uint32_t number{};
            SeatIdxT dealer{};
            uint32_t level{};
            BlindLevel blinds{};
            Deck deck;
        };

        struct HandState
        {
            uint32_t number{};
            SeatIdxT small_blind_seat{};
            SeatIdxT big_blind_seat{};
            uint32_t level{};
            BlindLevel blinds{};

            Deck deck;
            std::vector<Card> community;
            std::vector<Action> actions;
            std::vector<ChipT> initial_stacks;
            std::vector<bool> eliminated_before;
            std::vector<std::optional<HoleCards>> hole_cards;

            BettingRound round{};
            // first actor of a street is the next owing seat after this one
            SeatIdxT anchor{};
            std::optional<SeatIdxT> actor{};
            uint32_t next_sequence{1};
        };

        auto BeginHand(HandSetup setup) -> void;
        // Deals streets / finishes the hand until some seat owes a decision
        auto Progress() -> void;
        auto DealStreet() -> void;
        auto FinishHand() -> void;
        auto EliminateBusted(uint32_t hand_number) -> std::vector<SeatIdxT>;
        auto UpdateStats(HandState const& h, ChipT pot_total, std::vector<ShowdownEntry> const& showdown) -> void;

        [[nodiscard]] auto Contributions() const -> std::vector<Contribution>;
        [[nodiscard]] auto InHandCount() const -> size_t;
        [[nodiscard]] auto BuildSnapshot(std::optional<SeatIdxT> viewer) const -> std::shared_ptr<TableSnapshot const>;
        auto CheckInvariants() const -> void;
        auto Emit(GameEvent const& e) const -> void;
        auto Bump() noexcept -> void { ++sequence_; }

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::shared_ptr<HandEvaluator const> evaluator_;
        std::shared_ptr<EventBus> events_;
        BlindManager blinds_;
        std::mt19937_64 rng_;

        std::vector<PlayerState> players_;
        ChipT total_chips_{0};

        GameStatus status_{GameStatus::Waiting};
        Phase phase_{Phase::BetweenHands};
        bool aborted_{false};
        bool first_hand_{true};
        SeatIdxT dealer_{0};
        uint32_t hands_played_{0};
        uint64_t sequence_{0};

        std::optional<HandState> hand_;
        // Outcome of the last finished hand, visible until the next one starts
        std::vector<Pot> last_pots_;
        std::vector<ShowdownEntry> last_showdown_;
        std::vector<Payout> last_payouts_;
        std::vector<SeatIdxT> revealed_;

        std::vector<HandRecord> history_;
        std::vector<HandRecord> pending_;
        std::vector<Standing> eliminations_; // first out first
        TournamentStats stats_{};
    };
}

#endif //HOLDEMSNG_TOURNAMENT_HPP
