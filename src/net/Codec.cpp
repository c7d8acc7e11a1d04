//
// Created by Malik T on 10/10/2025.
//

#include "Codec.hpp"

#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fb = holdem::gen::net;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(holdem::core::Suit::Hearts) == static_cast<int>(fb::Suit::Hearts));
    static_assert(static_cast<int>(holdem::core::Rank::Two) == static_cast<int>(fb::Rank::Two));
    static_assert(static_cast<int>(holdem::core::Phase::River) == static_cast<int>(fb::Phase::River));

    auto ToFbCard(holdem::core::Card const& c) -> fb::Card
    {
        return fb::Card(holdem::core::net::ToFbSuit(c.suit), holdem::core::net::ToFbRank(c.rank));
    }

    auto ToFbCards(std::span<holdem::core::Card const> cs) -> std::vector<fb::Card>
    {
        std::vector<fb::Card> out;
        out.reserve(cs.size());
        for (holdem::core::Card const& c : cs) out.push_back(ToFbCard(c));
        return out;
    }

    auto FinishEnvelope(flatbuffers::FlatBufferBuilder& fbb, fb::Message type,
                        flatbuffers::Offset<void> msg) -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace holdem::core::net
{
    auto ToFbSuit(Suit s) noexcept -> fb::Suit
    {
        switch (s)
        {
        case Suit::Hearts: return fb::Suit::Hearts;
        case Suit::Diamonds: return fb::Suit::Diamonds;
        case Suit::Clubs: return fb::Suit::Clubs;
        case Suit::Spades: return fb::Suit::Spades;
        }
        return fb::Suit::Hearts;
    }

    auto FromFbSuit(fb::Suit s) noexcept -> Suit
    {
        switch (s)
        {
        case fb::Suit::Hearts: return Suit::Hearts;
        case fb::Suit::Diamonds: return Suit::Diamonds;
        case fb::Suit::Clubs: return Suit::Clubs;
        case fb::Suit::Spades: return Suit::Spades;
        }
        return Suit::Hearts;
    }

    // Both sides number ranks 2..14
    auto ToFbRank(Rank r) noexcept -> fb::Rank
    {
        return static_cast<fb::Rank>(static_cast<uint8_t>(r));
    }

    auto FromFbRank(fb::Rank r) noexcept -> Rank
    {
        auto const v = static_cast<uint8_t>(r);
        if (v < static_cast<uint8_t>(Rank::Two) || v > static_cast<uint8_t>(Rank::Ace)) return Rank::Two;
        return static_cast<Rank>(v);
    }

    auto ToFbPhase(Phase p) noexcept -> fb::Phase
    {
        switch (p)
        {
        case Phase::BetweenHands: return fb::Phase::BetweenHands;
        case Phase::PreFlop: return fb::Phase::PreFlop;
        case Phase::Flop: return fb::Phase::Flop;
        case Phase::Turn: return fb::Phase::Turn;
        case Phase::River: return fb::Phase::River;
        case Phase::Showdown: return fb::Phase::Showdown;
        case Phase::Completed: return fb::Phase::Completed;
        }
        return fb::Phase::BetweenHands;
    }

    auto FromFbPhase(fb::Phase p) noexcept -> Phase
    {
        switch (p)
        {
        case fb::Phase::BetweenHands: return Phase::BetweenHands;
        case fb::Phase::PreFlop: return Phase::PreFlop;
        case fb::Phase::Flop: return Phase::Flop;
        case fb::Phase::Turn: return Phase::Turn;
        case fb::Phase::River: return Phase::River;
        case fb::Phase::Showdown: return Phase::Showdown;
        case fb::Phase::Completed: return Phase::Completed;
        }
        return Phase::BetweenHands;
    }

    auto ToFbStatus(GameStatus s) noexcept -> fb::Status
    {
        switch (s)
        {
        case GameStatus::Waiting: return fb::Status::Waiting;
        case GameStatus::Active: return fb::Status::Active;
        case GameStatus::Paused: return fb::Status::Paused;
        case GameStatus::Completed: return fb::Status::Completed;
        }
        return fb::Status::Waiting;
    }

    auto ToFbKind(ActionType t) noexcept -> fb::ActionKind
    {
        switch (t)
        {
        case ActionType::Fold: return fb::ActionKind::Fold;
        case ActionType::Check: return fb::ActionKind::Check;
        case ActionType::Call: return fb::ActionKind::Call;
        case ActionType::Raise: return fb::ActionKind::Raise;
        case ActionType::PostBlind: return fb::ActionKind::PostBlind;
        }
        return fb::ActionKind::Fold;
    }

    // ---------- Snapshot (server -> client) ----------

    auto BuildSnapshot(TableSnapshot const& snap, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::SeatView>> seats;
        seats.reserve(snap.players.size());
        for (PlayerView const& pv : snap.players)
        {
            auto const name = fbb.CreateString(pv.name);
            std::vector<fb::Card> hole;
            if (pv.hole) hole = ToFbCards(*pv.hole);
            auto const hole_vec = fbb.CreateVectorOfStructs(hole);

            fb::SeatViewBuilder sv(fbb);
            sv.add_seat(pv.seat);
            sv.add_name(name);
            sv.add_human(pv.kind == ActorKind::Human);
            sv.add_stack(pv.stack);
            sv.add_current_bet(pv.current_bet);
            sv.add_total_contributed(pv.total_contributed);
            sv.add_hole(hole_vec);
            sv.add_folded(pv.folded);
            sv.add_all_in(pv.all_in);
            sv.add_eliminated(pv.eliminated);
            sv.add_is_dealer(pv.is_dealer);
            seats.push_back(sv.Finish());
        }
        auto const seats_vec = fbb.CreateVector(seats);

        auto const board_vec = fbb.CreateVectorOfStructs(ToFbCards(snap.community));

        std::vector<flatbuffers::Offset<fb::PotView>> pots;
        pots.reserve(snap.pots.size());
        for (Pot const& p : snap.pots)
        {
            pots.push_back(fb::CreatePotView(fbb, p.amount, fbb.CreateVector(p.eligible)));
        }
        auto const pots_vec = fbb.CreateVector(pots);

        std::vector<flatbuffers::Offset<fb::LoggedAction>> log;
        log.reserve(snap.actions.size());
        for (Action const& a : snap.actions)
        {
            log.push_back(fb::CreateLoggedAction(fbb, a.sequence, a.seat, ToFbKind(a.type),
                                                 a.amount.value_or(-1), a.chips, a.all_in));
        }
        auto const log_vec = fbb.CreateVector(log);

        std::vector<flatbuffers::Offset<fb::ShowdownLine>> shown;
        for (ShowdownEntry const& e : snap.showdown)
        {
            shown.push_back(fb::CreateShowdownLine(fbb, e.seat, e.rank, fbb.CreateString(e.description)));
        }
        auto const shown_vec = fbb.CreateVector(shown);

        std::vector<flatbuffers::Offset<fb::PayoutLine>> paid;
        for (Payout const& p : snap.payouts)
        {
            paid.push_back(fb::CreatePayoutLine(fbb, static_cast<uint32_t>(p.pot_index), p.seat, p.amount));
        }
        auto const paid_vec = fbb.CreateVector(paid);

        flatbuffers::Offset<fb::Legal> legal{};
        if (snap.legal)
        {
            LegalActions const& la = *snap.legal;
            legal = fb::CreateLegal(fbb, la.can_fold, la.can_check, la.can_call, la.can_raise,
                                    la.call_amount, la.min_raise_to, la.max_raise_to);
        }

        fb::TableViewBuilder tv(fbb);
        tv.add_schema_version(1);
        tv.add_hand_number(snap.hand_number);
        tv.add_sequence(snap.sequence);
        tv.add_viewer(snap.viewer ? static_cast<int16_t>(*snap.viewer) : int16_t{-1});
        tv.add_status(ToFbStatus(snap.status));
        tv.add_spectator(snap.mode == GameMode::Spectator);
        tv.add_phase(ToFbPhase(snap.phase));
        tv.add_aborted(snap.aborted);
        tv.add_dealer(snap.dealer);
        tv.add_blind_level(snap.blind_level);
        tv.add_small_blind(snap.small_blind);
        tv.add_big_blind(snap.big_blind);
        tv.add_hands_played(snap.hands_played);
        tv.add_players(seats_vec);
        tv.add_community(board_vec);
        tv.add_pots(pots_vec);
        tv.add_bet_to_match(snap.bet_to_match);
        tv.add_min_raise(snap.min_raise);
        tv.add_current_actor(snap.current_actor ? static_cast<int16_t>(*snap.current_actor) : int16_t{-1});
        if (snap.legal) tv.add_legal(legal);
        tv.add_actions(log_vec);
        tv.add_showdown(shown_vec);
        tv.add_payouts(paid_vec);
        auto const view = tv.Finish();

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, view);
        return FinishEnvelope(fbb, fb::Message::SnapshotMsg, sm.Union());
    }

    auto BuildTimerTick(SeatIdxT seat, std::chrono::milliseconds remaining, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const tick = fb::CreateTimerTick(fbb, msg_id, seat, static_cast<int64_t>(remaining.count()));
        return FinishEnvelope(fbb, fb::Message::TimerTick, tick.Union());
    }

    auto BuildViolation(SeatIdxT seat, error::RuleViolation const& v, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, msg_id, seat, static_cast<int16_t>(v.code), txt);
        return FinishEnvelope(fbb, fb::Message::Violation, vio.Union());
    }

    // ---------- Client -> server ----------

    auto BuildAction(SeatIdxT actor, Decision const& d, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        ChipT const raise_to = std::holds_alternative<RaiseAction>(d) ? std::get<RaiseAction>(d).to : 0;
        auto const m = fb::CreatePlayerActionMsg(fbb, msg_id, actor, ToFbKind(TypeOf(d)), raise_to);
        return FinishEnvelope(fbb, fb::Message::PlayerActionMsg, m.Union());
    }

    auto DecodePlayerAction(std::span<std::byte const> bytes) -> std::expected<DecodedAction, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"malformed envelope"});

        auto const* env = fb::GetEnvelope(data);
        if (env->message_type() != fb::Message::PlayerActionMsg)
            return std::unexpected(ParseError{"not a PlayerActionMsg"});

        auto const* pam = env->message_as_PlayerActionMsg();
        if (!pam) return std::unexpected(ParseError{"empty PlayerActionMsg"});
        DecodedAction out{};
        out.actor = pam->actor();
        out.msg_id = pam->msg_id();

        switch (pam->kind())
        {
        case fb::ActionKind::Fold:
            out.decision = FoldAction{};
            return out;
        case fb::ActionKind::Check:
            out.decision = CheckAction{};
            return out;
        case fb::ActionKind::Call:
            out.decision = CallAction{};
            return out;
        case fb::ActionKind::Raise:
            if (pam->raise_to() <= 0)
                return std::unexpected(ParseError{"raise without a positive amount"});
            out.decision = RaiseAction{pam->raise_to()};
            return out;
        case fb::ActionKind::PostBlind:
            return std::unexpected(ParseError{"blinds are posted by the table"});
        }
        return std::unexpected(ParseError{"unknown action kind"});
    }
} // namespace holdem::core::net
