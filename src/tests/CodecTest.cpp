#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include "../core/Tournament.hpp"
#include "../core/Exception.hpp"
#include "../debug/Inspector.hpp"
#include "../net/Codec.hpp"  // BuildSnapshot + DecodePlayerAction
#include "holdem_net_generated.h"
#include "TestTables.hpp"

using namespace holdem::core;
using holdem::core::net::BuildAction;
using holdem::core::net::BuildSnapshot;
using holdem::core::net::DecodePlayerAction;
namespace fb = holdem::gen::net;

namespace
{
    inline std::span<const std::byte> AsBytes(const flatbuffers::DetachedBuffer& buf)
    {
        const uint8_t* p = buf.data();
        return {reinterpret_cast<const std::byte*>(p), buf.size()};
    }

    // PlayerActionMsg built by hand, bypassing BuildAction's checks
    inline flatbuffers::DetachedBuffer MakeActionFB(SeatIdxT actor, fb::ActionKind kind, int64_t raise_to,
                                                    uint64_t msg_id)
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::PlayerActionMsg> pam =
            fb::CreatePlayerActionMsg(fbb, msg_id, actor, kind, raise_to);
        flatbuffers::Offset<fb::Envelope> env =
            fb::CreateEnvelope(fbb, fb::Message::PlayerActionMsg, pam.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    inline const fb::TableView* ViewOf(const flatbuffers::DetachedBuffer& buf)
    {
        const fb::Envelope* env = fb::GetEnvelope(buf.data());
        if (env->message_type() != fb::Message::SnapshotMsg) return nullptr;
        return env->message_as_SnapshotMsg()->view();
    }
} // namespace

// ================== TESTS ==================

TEST(Codec, ActionsDecodeAsBuilt)
{
    std::array<Decision, 4> const decisions{FoldAction{}, CheckAction{}, CallAction{}, RaiseAction{.to = 240}};
    uint64_t msg_id{100};
    for (Decision const& d : decisions)
    {
        flatbuffers::DetachedBuffer const buf = BuildAction(3, d, ++msg_id);
        auto const decoded = DecodePlayerAction(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
        EXPECT_EQ(decoded->actor, 3);
        EXPECT_EQ(decoded->msg_id, msg_id);
        EXPECT_EQ(TypeOf(decoded->decision), TypeOf(d));
    }

    auto const raise = DecodePlayerAction(AsBytes(BuildAction(0, RaiseAction{.to = 240}, 1)));
    ASSERT_TRUE(raise.has_value());
    ASSERT_TRUE(std::holds_alternative<RaiseAction>(raise->decision));
    EXPECT_EQ(std::get<RaiseAction>(raise->decision).to, 240);
}

TEST(Codec, RaiseNeedsAnAmount)
{
    auto const r = DecodePlayerAction(AsBytes(MakeActionFB(1, fb::ActionKind::Raise, 0, 9)));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "raise without a positive amount");
}

TEST(Codec, ClientsCannotPostBlinds)
{
    auto const r = DecodePlayerAction(AsBytes(MakeActionFB(1, fb::ActionKind::PostBlind, 20, 9)));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "blinds are posted by the table");
}

TEST(Codec, GarbageIsRejected)
{
    std::array<std::byte, 2> const tiny{std::byte{1}, std::byte{2}};
    auto const small = DecodePlayerAction(tiny);
    ASSERT_FALSE(small.has_value());
    EXPECT_EQ(small.error().message, "buffer too small");

    std::vector<std::byte> noise(64);
    for (size_t i{}; i < noise.size(); ++i) noise[i] = static_cast<std::byte>(0xA5 ^ (i * 37));
    auto const junk = DecodePlayerAction(noise);
    ASSERT_FALSE(junk.has_value());

    // a well-formed frame of the wrong kind
    flatbuffers::DetachedBuffer const tick = net::BuildTimerTick(0, std::chrono::milliseconds{500}, 4);
    auto const wrong = DecodePlayerAction(AsBytes(tick));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().message, "not a PlayerActionMsg");
}

TEST(Codec, LiveSnapshotFieldsSurvive)
{
    auto eng = holdem::test::MakeEngine(3, holdem::test::Seeded(0xA11CE5EEDULL));
    eng->Start();
    eng->StartHand();
    ASSERT_TRUE(eng->Apply(0, RaiseAction{.to = 60}).has_value());

    auto const snap = eng->SnapshotFor(1);
    flatbuffers::DetachedBuffer const buf = BuildSnapshot(*snap, 77);

    flatbuffers::Verifier verifier(buf.data(), buf.size());
    ASSERT_TRUE(fb::VerifyEnvelopeBuffer(verifier));
    EXPECT_EQ(fb::GetEnvelope(buf.data())->message_as_SnapshotMsg()->msg_id(), 77u);

    const fb::TableView* view = ViewOf(buf);
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(view->hand_number(), 1u);
    EXPECT_EQ(view->sequence(), snap->sequence);
    EXPECT_EQ(view->viewer(), 1);
    EXPECT_FALSE(view->spectator());
    EXPECT_EQ(view->status(), fb::Status::Active);
    EXPECT_EQ(view->phase(), fb::Phase::PreFlop);
    EXPECT_EQ(view->small_blind(), 10);
    EXPECT_EQ(view->big_blind(), 20);
    EXPECT_EQ(view->bet_to_match(), 60);
    EXPECT_EQ(view->min_raise(), 40);
    EXPECT_EQ(view->current_actor(), 1);

    ASSERT_EQ(view->players()->size(), 3u);
    EXPECT_EQ(view->players()->Get(0)->hole()->size(), 0u);
    EXPECT_EQ(view->players()->Get(1)->hole()->size(), 2u);
    EXPECT_EQ(view->players()->Get(2)->hole()->size(), 0u);
    EXPECT_TRUE(view->players()->Get(0)->is_dealer());
    EXPECT_EQ(view->players()->Get(0)->stack(), 940);
    EXPECT_EQ(view->players()->Get(1)->name()->str(), "P1");

    const fb::Card* mine = view->players()->Get(1)->hole()->Get(0);
    EXPECT_EQ(net::FromFbSuit(mine->suit()), snap->players[1].hole->at(0).suit);
    EXPECT_EQ(net::FromFbRank(mine->rank()), snap->players[1].hole->at(0).rank);

    ASSERT_NE(view->legal(), nullptr);
    EXPECT_TRUE(view->legal()->can_call());
    EXPECT_EQ(view->legal()->call_amount(), 50);
    EXPECT_EQ(view->legal()->min_raise_to(), 100);

    ASSERT_EQ(view->actions()->size(), 3u);
    EXPECT_EQ(view->actions()->Get(0)->kind(), fb::ActionKind::PostBlind);
    EXPECT_EQ(view->actions()->Get(2)->kind(), fb::ActionKind::Raise);
    EXPECT_EQ(view->actions()->Get(2)->amount(), 60);
}

TEST(Codec, ShowdownAndPayoutsAreCarried)
{
    Config cfg = holdem::test::Seeded(5);
    cfg.mode = GameMode::Spectator;
    auto eng = holdem::test::MakeEngine(3, cfg);
    eng->Start();
    debug::Inspector::SetStacks(*eng, {100, 300, 500});
    debug::Inspector::StartHandWithDeck(*eng, holdem::test::RiggedDeck(
                                            {1, 2, 0},
                                            {{0, holdem::test::Hole("Ah Ad")}, {1, holdem::test::Hole("Kh Kd")},
                                             {2, holdem::test::Hole("7c 2s")}},
                                            "4c 8d 9h Js 3s"));
    ASSERT_TRUE(eng->Apply(0, RaiseAction{100}).has_value());
    ASSERT_TRUE(eng->Apply(1, RaiseAction{300}).has_value());
    ASSERT_TRUE(eng->Apply(2, CallAction{}).has_value());

    flatbuffers::DetachedBuffer const buf = BuildSnapshot(*eng->Snapshot(), 1);
    const fb::TableView* view = ViewOf(buf);
    ASSERT_NE(view, nullptr);
    EXPECT_TRUE(view->spectator());
    EXPECT_EQ(view->viewer(), -1);
    EXPECT_EQ(view->current_actor(), -1);
    EXPECT_EQ(view->legal(), nullptr);
    EXPECT_EQ(view->community()->size(), 5u);

    ASSERT_EQ(view->pots()->size(), 2u);
    EXPECT_EQ(view->pots()->Get(1)->amount(), 400);
    EXPECT_EQ(view->pots()->Get(1)->eligible()->size(), 2u);
    EXPECT_EQ(view->showdown()->size(), 3u);
    ASSERT_EQ(view->payouts()->size(), 2u);

    ChipT paid{0};
    for (const fb::PayoutLine* p : *view->payouts()) paid += p->amount();
    EXPECT_EQ(paid, 700);
}

TEST(Codec, TickAndViolationFrames)
{
    flatbuffers::DetachedBuffer const tick = net::BuildTimerTick(2, std::chrono::milliseconds{1500}, 11);
    const fb::Envelope* te = fb::GetEnvelope(tick.data());
    ASSERT_EQ(te->message_type(), fb::Message::TimerTick);
    EXPECT_EQ(te->message_as_TimerTick()->seat(), 2);
    EXPECT_EQ(te->message_as_TimerTick()->remaining_ms(), 1500);
    EXPECT_EQ(te->message_as_TimerTick()->msg_id(), 11u);

    error::RuleViolation v{.code = error::RuleViolationCode::Raise_BelowMinimum};
    v.with_actor(1).with_attempted(30).with_minimum(40);
    flatbuffers::DetachedBuffer const vio = net::BuildViolation(1, v, 12);
    const fb::Envelope* ve = fb::GetEnvelope(vio.data());
    ASSERT_EQ(ve->message_type(), fb::Message::Violation);
    EXPECT_EQ(ve->message_as_Violation()->code(), static_cast<int16_t>(error::RuleViolationCode::Raise_BelowMinimum));
    EXPECT_EQ(ve->message_as_Violation()->text()->str(), error::describe(v));
}
