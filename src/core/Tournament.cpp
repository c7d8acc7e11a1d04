//
// Created by Malik T on 06/10/2025.
//
#include "Tournament.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <ranges>

#include "NoLimitRules.hpp"
#include "Turn.hpp"
#include "Util.hpp"

namespace holdem::core
{
    namespace
    {
        inline auto Viol(error::RuleViolationCode code) -> error::RuleViolation
        {
            return error::RuleViolation{.code = code};
        }

        auto ToDecision(Action const& a) -> Decision
        {
            switch (a.type)
            {
            case ActionType::Fold: return FoldAction{};
            case ActionType::Check: return CheckAction{};
            case ActionType::Call: return CallAction{};
            case ActionType::Raise:
                if (!a.amount)
                    HLD_THROW(error::Code::InvalidAction,
                              std::format("Recorded raise #{} carries no amount", a.sequence));
                return RaiseAction{.to = *a.amount};
            case ActionType::PostBlind: break;
            }
            HLD_THROW(error::Code::InvalidAction, std::format("Action #{} is not a decision", a.sequence));
        }
    }

    TournamentEngine::TournamentEngine(Config const& config,
                                       std::vector<SeatConfig> const& seats,
                                       std::shared_ptr<HandEvaluator const> evaluator,
                                       std::shared_ptr<EventBus> events,
                                       std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(rules ? std::move(rules) : std::make_unique<NoLimitRules>()),
        evaluator_(std::move(evaluator)),
        events_(std::move(events)),
        blinds_(cfg_.blinds, cfg_.hands_per_level),
        rng_{cfg_.seed}
    {
        if (seats.size() < constants::MinSeats || seats.size() > constants::MaxSeats)
            HLD_THROW(error::Code::State, std::format("A table seats {}..{} players, got {}",
                                                      constants::MinSeats, constants::MaxSeats, seats.size()));
        if (!evaluator_) HLD_THROW(error::Code::State, "No hand evaluator");
        if (cfg_.starting_stack <= 0) HLD_THROW(error::Code::State, "Starting stack must be positive");
        if (cfg_.initial_dealer >= seats.size()) HLD_THROW(error::Code::State, "Initial dealer seat out of range");

        players_.reserve(seats.size());
        for (size_t i{}; i < seats.size(); ++i)
        {
            PlayerState p{};
            p.seat = static_cast<SeatIdxT>(i);
            p.name = seats[i].name.empty() ? std::format("P{}", i) : seats[i].name;
            p.kind = seats[i].kind;
            p.stack = cfg_.starting_stack;
            p.stack_at_hand_start = p.stack;
            players_.push_back(std::move(p));
        }
        total_chips_ = cfg_.starting_stack * static_cast<ChipT>(players_.size());
        dealer_ = cfg_.initial_dealer;
    }

    auto TournamentEngine::Start() -> void
    {
        if (status_ != GameStatus::Waiting)
            HLD_THROW(error::Code::State, std::format("Start from status {}", to_string(status_)));
        status_ = GameStatus::Active;
        Bump();
    }

    auto TournamentEngine::HandInProgress() const noexcept -> bool
    {
        return phase_ == Phase::PreFlop || phase_ == Phase::Flop || phase_ == Phase::Turn || phase_ == Phase::River;
    }

    auto TournamentEngine::CurrentActor() const noexcept -> std::optional<SeatIdxT>
    {
        if (!HandInProgress() || !hand_) return std::nullopt;
        return hand_->actor;
    }

    auto TournamentEngine::HandNumber() const noexcept -> uint32_t
    {
        return hand_ ? hand_->number : 0;
    }

    auto TournamentEngine::InHandCount() const -> size_t
    {
        return std::ranges::count_if(players_, [](PlayerState const& p) { return p.InHand(); });
    }

    auto TournamentEngine::Contributions() const -> std::vector<Contribution>
    {
        std::vector<Contribution> out;
        for (PlayerState const& p : players_)
        {
            if (!p.hole) continue;
            out.push_back(Contribution{.seat = p.seat, .amount = p.total_contributed, .folded = p.folded});
        }
        return out;
    }

    auto TournamentEngine::Emit(GameEvent const& e) const -> void
    {
        if (events_) events_->Publish(e);
    }

    auto TournamentEngine::StartHand() -> void
    {
        if (status_ != GameStatus::Active)
            HLD_THROW(error::Code::State, std::format("StartHand while {}", to_string(status_)));
        if (HandInProgress())
            HLD_THROW(error::Code::State, "StartHand while a hand is in progress");
        if (TurnManager::LiveCount(players_) < constants::MinSeats)
            HLD_THROW(error::Code::State, "StartHand with fewer than two live seats");

        SeatIdxT dealer{};
        if (first_hand_)
        {
            dealer = players_[cfg_.initial_dealer].eliminated
                         ? TurnManager::NextLive(cfg_.initial_dealer, players_)
                         : cfg_.initial_dealer;
            first_hand_ = false;
        }
        else
        {
            dealer = TurnManager::AdvanceDealer(dealer_, players_);
        }

        uint32_t const level = blinds_.LevelFor(hands_played_);
        HLD_INVARIANT(level == std::min(hands_played_ / cfg_.hands_per_level, blinds_.MaxLevel()),
                      "Blind level out of step with hands played");

        Deck deck{};
        deck.Shuffle(rng_);
        BeginHand(HandSetup{
            .number = hands_played_ + 1,
            .dealer = dealer,
            .level = level,
            .blinds = blinds_.Blinds(level),
            .deck = std::move(deck)
        });
    }

    auto TournamentEngine::BeginHand(HandSetup setup) -> void
    {
        dealer_ = setup.dealer;
        HLD_INVARIANT(dealer_ < players_.size() && !players_[dealer_].eliminated, "Dealer seat is not live");

        sequence_ = 0;
        last_pots_.clear();
        last_showdown_.clear();
        last_payouts_.clear();
        revealed_.clear();

        HandState h{};
        h.number = setup.number;
        h.level = setup.level;
        h.blinds = setup.blinds;
        h.deck = std::move(setup.deck);
        h.hole_cards.resize(players_.size());

        for (PlayerState& p : players_)
        {
            p.hole.reset();
            p.folded = false;
            p.all_in = false;
            p.has_acted = false;
            p.current_bet = 0;
            p.total_contributed = 0;
            p.stack_at_hand_start = p.stack;
            h.initial_stacks.push_back(p.stack);
            h.eliminated_before.push_back(p.eliminated);
        }

        auto const [sb, bb] = TurnManager::Blinds(dealer_, players_);
        h.small_blind_seat = sb;
        h.big_blind_seat = bb;

        phase_ = Phase::PreFlop;
        hand_ = std::move(h);
        HandState& hand = *hand_;

        for (auto const& [seat, blind] : {std::pair{sb, hand.blinds.small_blind}, std::pair{bb, hand.blinds.big_blind}})
        {
            PlayerState& p = players_[seat];
            Action a = rules_->PostBlind(p, BlindManager::PostingAmount(blind, p.stack));
            a.sequence = hand.next_sequence++;
            hand.actions.push_back(a);
        }
        hand.round = BettingRound{
            .bet_to_match = std::max(players_[sb].current_bet, players_[bb].current_bet),
            .min_raise = hand.blinds.big_blind
        };

        std::vector<SeatIdxT> const order = TurnManager::DealOrder(dealer_, players_);
        for (auto const& [seat, cards] : hand.deck.DealHole(order))
        {
            players_[seat].hole = cards;
            hand.hole_cards[seat] = cards;
        }

        // blinds count as all-in once the seat is dealt in
        for (Action const& a : hand.actions)
        {
            if (a.all_in) Emit(AllInEvent{hand.number, a.seat, players_[a.seat].total_contributed});
        }

        hand.anchor = TurnManager::StreetAnchor(Phase::PreFlop, dealer_, bb);
        Progress();
        Bump();
        CheckInvariants();
    }

    auto TournamentEngine::Progress() -> void
    {
        HandState& h = *hand_;
        while (true)
        {
            if (InHandCount() <= 1)
            {
                FinishHand();
                return;
            }
            if (rules_->IsClosed(h.round, players_))
            {
                if (phase_ == Phase::River)
                {
                    FinishHand();
                    return;
                }
                DealStreet();
                continue;
            }
            auto const next = TurnManager::FirstAfter(h.anchor, players_, [&](PlayerState const& p)
            {
                return rules_->OwesDecision(h.round, p);
            });
            HLD_INVARIANT(next.has_value(), "Betting round is open but nobody owes a decision");
            h.actor = *next;
            return;
        }
    }

    auto TournamentEngine::DealStreet() -> void
    {
        HandState& h = *hand_;
        for (PlayerState& p : players_)
        {
            p.current_bet = 0;
            p.has_acted = false;
        }
        h.round = BettingRound{.bet_to_match = 0, .min_raise = h.blinds.big_blind};

        h.deck.Burn();
        size_t const count = phase_ == Phase::PreFlop ? 3 : 1;
        for (Card const& c : h.deck.DealCommunity(count)) h.community.push_back(c);

        switch (phase_)
        {
        case Phase::PreFlop: phase_ = Phase::Flop;
            break;
        case Phase::Flop: phase_ = Phase::Turn;
            break;
        case Phase::Turn: phase_ = Phase::River;
            break;
        default:
            HLD_THROW(error::Code::State, std::format("No street follows {}", to_string(phase_)));
        }
        h.anchor = TurnManager::StreetAnchor(phase_, dealer_, h.big_blind_seat);
    }

    auto TournamentEngine::FinishHand() -> void
    {
        HandState& h = *hand_;
        h.actor.reset();

        std::vector<Contribution> const contributions = Contributions();
        std::vector<Pot> pots = PotManager::Compute(contributions);

        bool const went_to_showdown = InHandCount() >= 2;
        std::vector<std::optional<HandScore>> scores(players_.size());
        std::vector<ShowdownEntry> showdown;
        if (went_to_showdown)
        {
            phase_ = Phase::Showdown;
            HLD_INVARIANT(h.community.size() == constants::BoardSize, "Showdown before the river");
            for (PlayerState const& p : players_)
            {
                if (!p.InHand()) continue;
                scores[p.seat] = evaluator_->Score(*p.hole, h.community);
                showdown.push_back(ShowdownEntry{p.seat, scores[p.seat]->rank, scores[p.seat]->description});
                revealed_.push_back(p.seat);
            }
            Emit(ShowdownEvent{h.number, showdown});
        }

        auto const rank_of = [&](SeatIdxT const seat) -> uint32_t
        {
            HLD_INVARIANT(scores[seat].has_value(), std::format("P{} contests a pot without a hand", seat));
            return scores[seat]->rank;
        };
        std::vector<Payout> payouts = PotManager::Distribute(pots, rank_of, dealer_, players_.size());

        size_t all_ins{0};
        for (PlayerState const& p : players_)
        {
            if (p.hole && p.all_in) ++all_ins;
        }

        for (Payout const& pay : payouts) players_[pay.seat].stack += pay.amount;
        for (PlayerState& p : players_)
        {
            p.current_bet = 0;
            p.total_contributed = 0;
        }

        std::vector<SeatIdxT> winners;
        for (Payout const& pay : payouts) winners.push_back(pay.seat);
        std::ranges::sort(winners);
        auto const dup = std::ranges::unique(winners);
        winners.erase(dup.begin(), dup.end());

        std::vector<SeatIdxT> busted = EliminateBusted(h.number);
        ++hands_played_;

        ChipT const pot_total = PotManager::Total(pots);
        UpdateStats(h, pot_total, showdown);
        stats_.total_all_ins += static_cast<uint32_t>(all_ins);

        HandRecord rec{};
        rec.hand_number = h.number;
        rec.dealer = dealer_;
        rec.small_blind_seat = h.small_blind_seat;
        rec.big_blind_seat = h.big_blind_seat;
        rec.blind_level = h.level;
        rec.small_blind = h.blinds.small_blind;
        rec.big_blind = h.blinds.big_blind;
        rec.min_raise = h.blinds.big_blind;
        rec.initial_stacks = h.initial_stacks;
        rec.eliminated_before = h.eliminated_before;
        rec.hole_cards = h.hole_cards;
        rec.deck_order = h.deck.Order();
        rec.community = h.community;
        rec.actions = h.actions;
        rec.pots = pots;
        rec.payouts = payouts;
        rec.winners = winners;
        rec.showdown = showdown;
        rec.went_to_showdown = went_to_showdown;
        for (PlayerState const& p : players_) rec.final_stacks.push_back(p.stack);
        rec.eliminated = busted;

        history_.push_back(rec);
        pending_.push_back(std::move(rec));

        last_pots_ = std::move(pots);
        last_showdown_ = std::move(showdown);
        last_payouts_ = std::move(payouts);

        Emit(HandCompletedEvent{h.number, winners, pot_total});

        size_t const live = TurnManager::LiveCount(players_);
        if (live > 1 && blinds_.LevelFor(hands_played_) > blinds_.LevelFor(hands_played_ - 1))
        {
            uint32_t const level = blinds_.LevelFor(hands_played_);
            Emit(BlindsIncreasedEvent{level, blinds_.Blinds(level)});
        }

        if (live <= 1)
        {
            status_ = GameStatus::Completed;
            phase_ = Phase::Completed;
            auto const winner = TurnManager::FirstAfter(0, players_, [](PlayerState const& p) { return !p.eliminated; });
            if (winner)
                std::print("[Engine] Tournament won by {} after {} hands\n", players_[*winner].name, hands_played_);
            Emit(TournamentCompletedEvent{winner, false});
        }
        else
        {
            phase_ = Phase::BetweenHands;
        }
    }

    auto TournamentEngine::EliminateBusted(uint32_t const hand_number) -> std::vector<SeatIdxT>
    {
        std::vector<SeatIdxT> busted;
        for (PlayerState const& p : players_)
        {
            if (p.hole && !p.eliminated && p.stack == 0) busted.push_back(p.seat);
        }
        // shorter stack at the start of the hand finishes lower
        std::ranges::sort(busted, [&](SeatIdxT const a, SeatIdxT const b)
        {
            if (players_[a].stack_at_hand_start != players_[b].stack_at_hand_start)
                return players_[a].stack_at_hand_start < players_[b].stack_at_hand_start;
            return a < b;
        });

        size_t const live_after = TurnManager::LiveCount(players_) - busted.size();
        for (size_t i{}; i < busted.size(); ++i)
        {
            PlayerState& p = players_[busted[i]];
            p.eliminated = true;
            auto const position = static_cast<uint32_t>(live_after + busted.size() - i);
            eliminations_.push_back(Standing{
                .seat = p.seat, .name = p.name, .finish_position = position,
                .hands_survived = hand_number, .chips = 0
            });
            std::print("[Engine] {} eliminated in place {} (hand {})\n", p.name, position, hand_number);
            Emit(EliminationEvent{hand_number, p.seat, position});
        }
        return busted;
    }

    auto TournamentEngine::UpdateStats(HandState const& h, ChipT const pot_total,
                                       std::vector<ShowdownEntry> const& showdown) -> void
    {
        stats_.total_hands = hands_played_;
        if (pot_total > stats_.biggest_pot)
        {
            stats_.biggest_pot = pot_total;
            stats_.biggest_pot_hand = h.number;
        }
        for (Action const& a : h.actions)
        {
            if (a.type == ActionType::Fold) ++stats_.total_folds;
            if (a.type == ActionType::Raise) ++stats_.total_raises;
        }
        if (showdown.empty())
        {
            ++stats_.hands_won_without_showdown;
            return;
        }
        ++stats_.showdowns;
        auto const best = std::ranges::min_element(showdown, {}, &ShowdownEntry::rank);
        if (!stats_.best_hand_rank || best->rank < *stats_.best_hand_rank)
        {
            stats_.best_hand_rank = best->rank;
            stats_.best_hand_name = best->description;
            stats_.best_hand_seat = best->seat;
            stats_.best_hand_number = h.number;
        }
    }

    auto TournamentEngine::Validate(SeatIdxT const seat, Decision const& d) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        if (status_ == GameStatus::Paused)
            return std::unexpected(Viol(RVC::GamePaused).with_actor(seat));
        if (status_ != GameStatus::Active)
            return std::unexpected(Viol(RVC::GameNotActive).with_actor(seat));
        if (!HandInProgress() || !hand_)
            return std::unexpected(Viol(RVC::NoHandInProgress).with_phase(phase_));
        if (seat >= players_.size())
            return std::unexpected(Viol(RVC::SeatOutOfRange).with_actor(seat));
        if (!hand_->actor || *hand_->actor != seat)
        {
            auto v = Viol(RVC::WrongActor).with_phase(phase_).with_actor(seat);
            if (hand_->actor) v.with_expected(*hand_->actor);
            return std::unexpected(v);
        }
        if (auto ok = rules_->Validate(hand_->round, players_[seat], d); !ok)
        {
            auto v = ok.error();
            v.with_phase(phase_);
            return std::unexpected(v);
        }
        return {};
    }

    auto TournamentEngine::Apply(SeatIdxT const seat, Decision const& d) -> ActionResult
    {
        if (auto const ok = Validate(seat, d); !ok) return std::unexpected(ok.error());

        HandState& h = *hand_;
        Action a = rules_->Apply(h.round, players_, seat, d);
        a.sequence = h.next_sequence++;
        h.actions.push_back(a);
        if (a.all_in) Emit(AllInEvent{h.number, seat, players_[seat].total_contributed});

        h.anchor = seat;
        h.actor.reset();
        Progress();
        Bump();
        CheckInvariants();
        return a;
    }

    auto TournamentEngine::LegalFor(SeatIdxT const seat) const -> LegalActions
    {
        if (!HandInProgress() || !hand_ || seat >= players_.size()) return {};
        return rules_->Legal(hand_->round, players_[seat]);
    }

    auto TournamentEngine::TimeoutDecision(SeatIdxT const seat) const -> Decision
    {
        if (LegalFor(seat).can_check) return CheckAction{};
        return FoldAction{};
    }

    auto TournamentEngine::Pause() -> void
    {
        if (status_ != GameStatus::Active)
            HLD_THROW(error::Code::State, std::format("Pause from status {}", to_string(status_)));
        status_ = GameStatus::Paused;
        Bump();
    }

    auto TournamentEngine::Resume() -> void
    {
        if (status_ != GameStatus::Paused)
            HLD_THROW(error::Code::State, std::format("Resume from status {}", to_string(status_)));
        status_ = GameStatus::Active;
        Bump();
    }

    auto TournamentEngine::Abort(std::string_view const reason) -> void
    {
        if (status_ == GameStatus::Completed) return;
        std::print("[Engine] Tournament aborted: {}\n", reason);
        status_ = GameStatus::Completed;
        phase_ = Phase::Completed;
        aborted_ = true;
        if (hand_) hand_->actor.reset();
        Bump();
        Emit(TournamentCompletedEvent{std::nullopt, true});
    }

    auto TournamentEngine::DrainCompletedHands() -> std::vector<HandRecord>
    {
        std::vector<HandRecord> out;
        out.swap(pending_);
        return out;
    }

    auto TournamentEngine::Standings() const -> std::vector<Standing>
    {
        std::vector<Standing> out;
        for (PlayerState const& p : players_)
        {
            if (p.eliminated) continue;
            out.push_back(Standing{.seat = p.seat, .name = p.name, .hands_survived = hands_played_, .chips = p.stack});
        }
        std::ranges::sort(out, [](Standing const& a, Standing const& b)
        {
            if (a.chips != b.chips) return a.chips > b.chips;
            return a.seat < b.seat;
        });
        for (size_t i{}; i < out.size(); ++i) out[i].finish_position = static_cast<uint32_t>(i + 1);

        // last one out finished highest
        for (Standing const& s : eliminations_ | std::views::reverse) out.push_back(s);
        return out;
    }

    auto TournamentEngine::Result() const -> std::optional<TournamentResult>
    {
        if (status_ != GameStatus::Completed) return std::nullopt;

        TournamentResult r{};
        r.standings = Standings();
        r.stats = stats_;
        r.aborted = aborted_;
        if (!aborted_ && TurnManager::LiveCount(players_) == 1) r.winner = r.standings.front();
        return r;
    }

    auto TournamentEngine::Snapshot() const -> std::shared_ptr<TableSnapshot const>
    {
        return BuildSnapshot(std::nullopt);
    }

    auto TournamentEngine::SnapshotFor(SeatIdxT const viewer) const -> std::shared_ptr<TableSnapshot const>
    {
        HLD_ASSERT(viewer < players_.size(), "Snapshot viewer out of range");
        return BuildSnapshot(viewer);
    }

    auto TournamentEngine::BuildSnapshot(std::optional<SeatIdxT> const viewer) const
        -> std::shared_ptr<TableSnapshot const>
    {
        auto snap = std::make_shared<TableSnapshot>();
        snap->hand_number = HandNumber();
        snap->sequence = sequence_;
        snap->viewer = viewer;
        snap->status = status_;
        snap->mode = cfg_.mode;
        snap->phase = phase_;
        snap->aborted = aborted_;
        snap->dealer = dealer_;
        snap->hands_played = hands_played_;

        if (hand_)
        {
            snap->small_blind_seat = hand_->small_blind_seat;
            snap->big_blind_seat = hand_->big_blind_seat;
            snap->blind_level = hand_->level;
            snap->small_blind = hand_->blinds.small_blind;
            snap->big_blind = hand_->blinds.big_blind;
            snap->community = hand_->community;
            snap->actions = hand_->actions;
        }
        else
        {
            snap->blind_level = blinds_.LevelFor(hands_played_);
            snap->small_blind = blinds_.Blinds(snap->blind_level).small_blind;
            snap->big_blind = blinds_.Blinds(snap->blind_level).big_blind;
        }

        for (PlayerState const& p : players_)
        {
            PlayerView v{};
            v.seat = p.seat;
            v.name = p.name;
            v.kind = p.kind;
            v.stack = p.stack;
            v.current_bet = p.current_bet;
            v.total_contributed = p.total_contributed;
            v.folded = p.folded;
            v.all_in = p.all_in;
            v.eliminated = p.eliminated;
            v.has_acted = p.has_acted;
            v.is_dealer = p.seat == dealer_;
            bool const shown = !viewer || *viewer == p.seat || std::ranges::find(revealed_, p.seat) != revealed_.end();
            if (shown) v.hole = p.hole;
            snap->players.push_back(std::move(v));
        }

        if (HandInProgress())
        {
            snap->pots = PotManager::Compute(Contributions());
            snap->bet_to_match = hand_->round.bet_to_match;
            snap->min_raise = hand_->round.min_raise;
            snap->current_actor = hand_->actor;
            if (hand_->actor) snap->legal = rules_->Legal(hand_->round, players_[*hand_->actor]);
        }
        else
        {
            snap->pots = last_pots_;
        }
        snap->showdown = last_showdown_;
        snap->payouts = last_payouts_;
        return snap;
    }

    auto TournamentEngine::CheckInvariants() const -> void
    {
        ChipT sum{0};
        for (PlayerState const& p : players_)
        {
            HLD_INVARIANT(p.stack >= 0, std::format("{} has a negative stack", p.name));
            HLD_INVARIANT(p.current_bet <= p.total_contributed,
                          std::format("{} bet more this street than this hand", p.name));
            if (HandInProgress() && p.hole)
            {
                HLD_INVARIANT(p.stack + p.total_contributed == p.stack_at_hand_start,
                              std::format("{} chips leaked mid-hand", p.name));
            }
            sum += p.stack + p.total_contributed;
        }
        HLD_INVARIANT(sum == total_chips_, std::format("Chip total {} differs from {}", sum, total_chips_));

        if (!HandInProgress()) return;

        HLD_INVARIANT(!players_[dealer_].eliminated, "Dealer seat is not live");

        util::CardUniqueChecker checker{};
        checker.AddAll(hand_->community);
        checker.AddAll(hand_->deck.Burned());
        for (PlayerState const& p : players_)
        {
            if (p.hole) checker.AddAll(*p.hole);
        }
        HLD_INVARIANT(!checker.ContainsDup(), "A card is in two places");

        if (hand_->actor)
        {
            HLD_INVARIANT(players_[*hand_->actor].CanAct(), "Current actor cannot act");
        }
    }

    auto TournamentEngine::Replay(HandRecord const& record, std::shared_ptr<HandEvaluator const> evaluator)
        -> HandRecord
    {
        size_t const n = record.initial_stacks.size();
        if (n < constants::MinSeats || record.eliminated_before.size() != n || record.dealer >= n)
            HLD_THROW(error::Code::InvalidAction, std::format("Hand record {} is malformed", record.hand_number));

        Config cfg{};
        cfg.seed = 0;
        cfg.blinds = {BlindLevel{record.small_blind, record.big_blind}};
        cfg.initial_dealer = record.dealer;

        std::vector<SeatConfig> seats(n);
        TournamentEngine engine(cfg, seats, std::move(evaluator));
        engine.total_chips_ = 0;
        for (size_t i{}; i < n; ++i)
        {
            engine.players_[i].stack = record.initial_stacks[i];
            engine.players_[i].eliminated = record.eliminated_before[i];
            engine.total_chips_ += record.initial_stacks[i];
        }
        engine.status_ = GameStatus::Active;
        engine.first_hand_ = false;

        engine.BeginHand(HandSetup{
            .number = record.hand_number,
            .dealer = record.dealer,
            .level = record.blind_level,
            .blinds = BlindLevel{record.small_blind, record.big_blind},
            .deck = Deck::FromOrder(record.deck_order)
        });

        if (engine.hand_->small_blind_seat != record.small_blind_seat ||
            engine.hand_->big_blind_seat != record.big_blind_seat)
            HLD_THROW(error::Code::InvalidAction,
                      std::format("Hand {}: recorded blinds do not follow the dealer", record.hand_number));

        for (Action const& a : record.actions)
        {
            if (a.type == ActionType::PostBlind) continue;
            if (!engine.HandInProgress())
                HLD_THROW(error::Code::InvalidAction,
                          std::format("Hand {}: action #{} recorded after the hand ended", record.hand_number,
                                      a.sequence));

            ActionResult const r = engine.Apply(a.seat, ToDecision(a));
            if (!r)
                HLD_THROW(error::Code::InvalidAction,
                          std::format("Hand {}: action #{} by P{} rejected: {}", record.hand_number, a.sequence,
                                      a.seat, error::describe(r.error())));
            if (r->sequence != a.sequence || r->chips != a.chips)
                HLD_THROW(error::Code::InvalidAction,
                          std::format("Hand {}: action #{} diverges from the record", record.hand_number,
                                      a.sequence));
        }
        if (engine.HandInProgress())
            HLD_THROW(error::Code::InvalidAction,
                      std::format("Hand {}: recorded actions stop before the hand ends", record.hand_number));

        return engine.history_.back();
    }
}
