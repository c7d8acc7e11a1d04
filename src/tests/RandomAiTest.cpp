//
// Created by Malik T on 13/10/2025.
//
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "../core/RandomAi.hpp"
#include "../core/Tournament.hpp"
#include "../debug/RecordingSource.hpp"
#include "TestTables.hpp"

using namespace holdem::core;
using namespace holdem::test;

namespace
{
auto soon() -> std::chrono::steady_clock::time_point
{
    return std::chrono::steady_clock::now() + std::chrono::seconds{1};
}
} // anonymous namespace

TEST(RandomAI, EveryAnswerIsLegal)
{
    for (uint64_t const seed : {1ull, 2ull, 3ull, 4ull})
    {
        auto eng = MakeEngine(5, Seeded(seed));
        RandomAI ai(seed);
        eng->Start();

        for (size_t steps{}; steps < 2000 && eng->Status() == GameStatus::Active; ++steps)
        {
            if (!eng->HandInProgress())
            {
                eng->StartHand();
                continue;
            }
            SeatIdxT const actor = *eng->CurrentActor();
            std::optional<Decision> const d = ai.Decide(eng->SnapshotFor(actor), soon());
            ASSERT_TRUE(d.has_value());

            LegalActions const legal = eng->LegalFor(actor);
            if (auto const* r = std::get_if<RaiseAction>(&*d))
            {
                EXPECT_GE(r->to, std::min(legal.min_raise_to, legal.max_raise_to));
                EXPECT_LE(r->to, legal.max_raise_to);
            }
            if (legal.can_check) EXPECT_NE(TypeOf(*d), ActionType::Fold);

            ActionResult const applied = eng->Apply(actor, *d);
            ASSERT_TRUE(applied.has_value()) << error::describe(applied.error());
        }
    }
}

TEST(RandomAI, NoAnswerWhenNotActing)
{
    auto eng = MakeEngine(3);
    eng->Start();
    eng->StartHand();

    // seat 0 acts first; seat 1 sees no options
    RandomAI ai(9);
    EXPECT_FALSE(ai.Decide(eng->SnapshotFor(1), soon()).has_value());
    EXPECT_TRUE(ai.Decide(eng->SnapshotFor(0), soon()).has_value());
}

TEST(RandomAI, SameSeedSameChoices)
{
    auto eng = MakeEngine(2);
    eng->Start();
    eng->StartHand();
    auto const view = eng->SnapshotFor(0);

    RandomAI a(77);
    RandomAI b(77);
    for (int i{}; i < 20; ++i)
    {
        std::optional<Decision> const x = a.Decide(view, soon());
        std::optional<Decision> const y = b.Decide(view, soon());
        ASSERT_TRUE(x && y);
        EXPECT_EQ(TypeOf(*x), TypeOf(*y));
    }
}

TEST(RandomAI, ThinkTimeStopsAtTheDeadline)
{
    auto eng = MakeEngine(2);
    eng->Start();
    eng->StartHand();

    RandomAI slow(5, std::chrono::milliseconds{5000});
    auto const t0 = std::chrono::steady_clock::now();
    std::optional<Decision> const d = slow.Decide(eng->SnapshotFor(0), t0 + std::chrono::milliseconds{30});
    EXPECT_TRUE(d.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds{2});
}

TEST(RandomAI, CancelCutsThinkingShort)
{
    auto eng = MakeEngine(2);
    eng->Start();
    eng->StartHand();

    RandomAI slow(5, std::chrono::milliseconds{5000});
    auto const t0 = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&]
    {
        return slow.Decide(eng->SnapshotFor(0), t0 + std::chrono::seconds{10});
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    slow.Cancel();

    EXPECT_FALSE(pending.get().has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds{2});
}

TEST(RandomAI, NewerRequestSupersedesOlder)
{
    auto eng = MakeEngine(2);
    eng->Start();
    eng->StartHand();
    auto const view = eng->SnapshotFor(0);

    RandomAI slow(6, std::chrono::milliseconds{200});
    auto older = std::async(std::launch::async, [&] { return slow.Decide(view, soon()); });
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    auto newer = std::async(std::launch::async, [&] { return slow.Decide(view, soon()); });

    EXPECT_FALSE(older.get().has_value());
    EXPECT_TRUE(newer.get().has_value());
}

TEST(RandomAI, RecordingWrapperSeesEachCall)
{
    auto eng = MakeEngine(2);
    eng->Start();
    eng->StartHand();

    auto const wrapped = debug::WrapRecording({std::make_shared<RandomAI>(3)});
    auto* rec = debug::AsRecording(wrapped.front().get());
    ASSERT_NE(rec, nullptr);

    (void)wrapped.front()->Decide(eng->SnapshotFor(0), soon());
    (void)wrapped.front()->Decide(eng->SnapshotFor(1), soon());
    EXPECT_EQ(rec->Calls(), 2u);
    EXPECT_TRUE(rec->Last().has_value());
}
