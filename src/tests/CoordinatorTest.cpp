//
// Created by Malik T on 14/10/2025.
//
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "../core/Coordinator.hpp"
#include "../core/HumanSeat.hpp"
#include "../core/RandomAi.hpp"
#include "TestTables.hpp"

using namespace holdem::core;
using namespace holdem::test;
using namespace std::chrono_literals;
using RVC = error::RuleViolationCode;

namespace
{
class CaptureSink final : public BroadcastSink
{
public:
    auto Publish(std::shared_ptr<TableSnapshot const> snapshot) -> void override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        snaps_.push_back(std::move(snapshot));
    }

    auto TimerTick(SeatIdxT seat, std::chrono::milliseconds remaining) -> void override
    {
        (void)seat;
        (void)remaining;
        std::lock_guard<std::mutex> lk(mtx_);
        ++ticks_;
    }

    auto Rejected(SeatIdxT seat, error::RuleViolation const& why) -> void override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        rejected_.emplace_back(seat, why);
    }

    auto Snaps() const -> std::vector<std::shared_ptr<TableSnapshot const>>
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return snaps_;
    }

    auto RejectedList() const -> std::vector<std::pair<SeatIdxT, error::RuleViolation>>
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return rejected_;
    }

    auto Ticks() const -> size_t
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return ticks_;
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::shared_ptr<TableSnapshot const>> snaps_;
    std::vector<std::pair<SeatIdxT, error::RuleViolation>> rejected_;
    size_t ticks_{0};
};

class MemoryStore final : public PersistenceSink
{
public:
    auto SaveHand(HandRecord const& record) -> void override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        hands_.push_back(record);
    }

    auto SaveResult(TournamentResult const& result) -> void override
    {
        std::lock_guard<std::mutex> lk(mtx_);
        result_ = result;
    }

    auto Hands() const -> std::vector<HandRecord>
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return hands_;
    }

    auto Result() const -> std::optional<TournamentResult>
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return result_;
    }

private:
    mutable std::mutex mtx_;
    std::vector<HandRecord> hands_;
    std::optional<TournamentResult> result_;
};

// Always answers the same thing, legal or not
class StubbornSource final : public DecisionSource
{
public:
    explicit StubbornSource(Decision d) : d_(d) {}

    auto Decide(std::shared_ptr<TableSnapshot const> view,
                std::chrono::steady_clock::time_point deadline) -> std::optional<Decision> override
    {
        (void)view;
        (void)deadline;
        return d_;
    }

private:
    Decision d_;
};

auto eventually(std::function<bool()> const& pred, std::chrono::milliseconds limit = 5s) -> bool
{
    auto const until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until)
    {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

auto fast_config(std::chrono::milliseconds timeout, std::chrono::milliseconds tick = 10ms) -> Config
{
    Config cfg = Seeded(42);
    cfg.turn_timeout = timeout;
    cfg.tick_interval = tick;
    return cfg;
}

auto seats_of(std::vector<ActorKind> const& kinds) -> std::vector<SeatConfig>
{
    std::vector<SeatConfig> out;
    for (size_t i{}; i < kinds.size(); ++i) out.push_back(SeatConfig{.name = "P" + std::to_string(i), .kind = kinds[i]});
    return out;
}

struct Table
{
    std::shared_ptr<CaptureSink> sink = std::make_shared<CaptureSink>();
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    std::vector<std::shared_ptr<HumanSeat>> humans;
    std::unique_ptr<GameCoordinator> coord;
};

// Every seat answered by a HumanSeat the test drives
auto human_table(size_t n, Config const& cfg) -> Table
{
    Table t;
    std::vector<std::shared_ptr<DecisionSource>> sources;
    for (size_t i{}; i < n; ++i)
    {
        t.humans.push_back(std::make_shared<HumanSeat>(static_cast<SeatIdxT>(i)));
        sources.push_back(t.humans.back());
    }
    auto eng = std::make_unique<TournamentEngine>(cfg, seats_of(std::vector<ActorKind>(n, ActorKind::Human)),
                                                  std::make_shared<StandardEvaluator>());
    t.coord = std::make_unique<GameCoordinator>(std::move(eng), std::move(sources), t.sink, t.store);
    return t;
}

auto latest_actions(GameCoordinator const& c) -> size_t
{
    auto const snap = c.LatestSnapshot();
    return snap ? snap->actions.size() : 0;
}
} // anonymous namespace

TEST(Coordinator, RandomSeatsPlayToTheEnd)
{
    auto sink = std::make_shared<CaptureSink>();
    auto store = std::make_shared<MemoryStore>();
    auto eng = std::make_unique<TournamentEngine>(fast_config(2s), MakeSeats(3), std::make_shared<StandardEvaluator>());
    GameCoordinator coord(std::move(eng), RandomSeats(3, 42), sink, store);

    ASSERT_TRUE(coord.Start().has_value());
    coord.Wait();

    EXPECT_TRUE(coord.Finished());
    TournamentEngine const& done = coord.Engine();
    EXPECT_EQ(done.Status(), GameStatus::Completed);
    EXPECT_FALSE(done.Aborted());
    EXPECT_EQ(store->Hands().size(), done.HandsPlayed());

    std::optional<TournamentResult> const result = store->Result();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->winner.has_value());
    EXPECT_EQ(result->winner->chips, 3000);

    auto const snaps = sink->Snaps();
    ASSERT_FALSE(snaps.empty());
    EXPECT_EQ(snaps.back()->status, GameStatus::Completed);
    EXPECT_TRUE(sink->RejectedList().empty());
}

TEST(Coordinator, SilentSeatFoldsOnTimeout)
{
    Table t = human_table(2, fast_config(60ms));
    ASSERT_TRUE(t.coord->Start().has_value());

    ASSERT_TRUE(eventually([&] { return t.store->Hands().size() >= 2; }));
    t.coord->RequestStop();
    t.coord->Wait();

    // the dealer owes the small blind difference and is folded; the big blind never has to act
    for (HandRecord const& h : t.store->Hands())
    {
        ASSERT_FALSE(h.actions.empty());
        Action const& last = h.actions.back();
        EXPECT_EQ(last.type, ActionType::Fold);
        EXPECT_EQ(last.seat, h.dealer);
        EXPECT_EQ(h.winners, (std::vector<SeatIdxT>{h.big_blind_seat}));
    }
    EXPECT_GT(t.sink->Ticks(), 0u);

    std::optional<TournamentResult> const result = t.store->Result();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->aborted);
}

TEST(Coordinator, SilentBigBlindChecksOnTimeout)
{
    Table t = human_table(2, fast_config(80ms));
    ASSERT_TRUE(t.coord->Start().has_value());

    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));
    t.humans[0]->Deliver(CallAction{});

    // seat 1 has the option and lets the clock run out
    std::shared_ptr<TableSnapshot const> snap;
    ASSERT_TRUE(eventually([&]
    {
        snap = t.coord->LatestSnapshot();
        return snap && snap->hand_number == 1 && snap->actions.size() >= 4;
    }));
    ASSERT_GE(snap->actions.size(), 4u);
    EXPECT_EQ(snap->actions[2].type, ActionType::Call);
    EXPECT_EQ(snap->actions[3].type, ActionType::Check);
    EXPECT_EQ(snap->actions[3].seat, 1);

    t.coord->RequestStop();
    t.coord->Wait();
}

TEST(Coordinator, DeliveredDecisionsDriveTheHand)
{
    Table t = human_table(2, fast_config(5s));
    ASSERT_TRUE(t.coord->Start().has_value());

    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));
    t.humans[0]->Deliver(CallAction{});
    ASSERT_TRUE(eventually([&] { return t.humans[1]->Waiting(); }));
    t.humans[1]->Deliver(CheckAction{});

    ASSERT_TRUE(eventually([&]
    {
        auto const snap = t.coord->LatestSnapshot();
        return snap && snap->phase == Phase::Flop;
    }));

    // broadcasts carry seat 0's view only
    auto const snap = t.coord->LatestSnapshot();
    EXPECT_EQ(snap->viewer, std::optional<SeatIdxT>{0});
    EXPECT_TRUE(snap->players[0].hole.has_value());
    EXPECT_FALSE(snap->players[1].hole.has_value());
    EXPECT_EQ(snap->community.size(), 3u);
    EXPECT_EQ(snap->current_actor, std::optional<SeatIdxT>{1});

    t.coord->RequestStop();
    t.coord->Wait();
    EXPECT_TRUE(t.coord->Engine().Aborted());
}

TEST(Coordinator, IllegalHumanAnswerIsRejectedAndAskedAgain)
{
    Table t = human_table(2, fast_config(5s));
    ASSERT_TRUE(t.coord->Start().has_value());

    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));
    t.humans[0]->Deliver(CheckAction{});
    ASSERT_TRUE(eventually([&] { return !t.sink->RejectedList().empty(); }));

    auto const rejected = t.sink->RejectedList();
    EXPECT_EQ(rejected[0].first, 0);
    EXPECT_EQ(rejected[0].second.code, RVC::Check_BetOutstanding);
    EXPECT_EQ(latest_actions(*t.coord), 2u);

    // same turn: the seat is asked again and its next answer counts
    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));
    t.humans[0]->Deliver(CallAction{});
    ASSERT_TRUE(eventually([&] { return latest_actions(*t.coord) == 3u; }));
    EXPECT_EQ(t.coord->LatestSnapshot()->current_actor, std::optional<SeatIdxT>{1});

    t.coord->RequestStop();
    t.coord->Wait();
}

TEST(Coordinator, RepeatedIllegalAnswersStillTimeOut)
{
    Table t = human_table(2, fast_config(100ms));
    ASSERT_TRUE(t.coord->Start().has_value());
    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));

    // seat 0 faces the big blind and keeps trying to check
    std::atomic<bool> done{false};
    std::thread spammer([&]
    {
        while (!done.load())
        {
            t.humans[0]->Deliver(CheckAction{});
            std::this_thread::sleep_for(5ms);
        }
    });

    bool const settled = eventually([&] { return !t.store->Hands().empty(); }, 3s);
    done.store(true);
    spammer.join();
    t.coord->RequestStop();
    t.coord->Wait();

    ASSERT_TRUE(settled);
    HandRecord const first = t.store->Hands().front();
    ASSERT_EQ(first.actions.size(), 3u);
    EXPECT_EQ(first.actions[2].type, ActionType::Fold);
    EXPECT_EQ(first.actions[2].seat, 0);

    auto const rejected = t.sink->RejectedList();
    ASSERT_FALSE(rejected.empty());
    EXPECT_EQ(rejected[0].second.code, RVC::Check_BetOutstanding);
}

TEST(Coordinator, IllegalAutomatedAnswerFallsBack)
{
    auto sink = std::make_shared<CaptureSink>();
    auto store = std::make_shared<MemoryStore>();
    auto eng = std::make_unique<TournamentEngine>(fast_config(5s), MakeSeats(2), std::make_shared<StandardEvaluator>());
    std::vector<std::shared_ptr<DecisionSource>> sources{
        std::make_shared<StubbornSource>(CheckAction{}),
        std::make_shared<StubbornSource>(CheckAction{})
    };
    GameCoordinator coord(std::move(eng), std::move(sources), sink, store);
    ASSERT_TRUE(coord.Start().has_value());

    ASSERT_TRUE(eventually([&] { return !store->Hands().empty(); }));
    coord.RequestStop();
    coord.Wait();

    HandRecord const first = store->Hands().front();
    ASSERT_EQ(first.actions.size(), 3u);
    EXPECT_EQ(first.actions[2].type, ActionType::Fold);
    EXPECT_EQ(first.actions[2].seat, 0);

    auto const rejected = sink->RejectedList();
    ASSERT_FALSE(rejected.empty());
    EXPECT_EQ(rejected[0].second.code, RVC::Check_BetOutstanding);
}

TEST(Coordinator, SubmitChecksTheActor)
{
    Table t = human_table(3, fast_config(5s));
    ASSERT_TRUE(t.coord->Start().has_value());
    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));

    CommandReply const wrong = t.coord->Submit(PlayerActionCmd{.seat = 2, .decision = FoldAction{}}).get();
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, RVC::WrongActor);
    EXPECT_EQ(wrong.error().expected_actor, std::optional<SeatIdxT>{0});

    CommandReply const raise = t.coord->Submit(PlayerActionCmd{.seat = 0, .decision = RaiseAction{.to = 60}}).get();
    EXPECT_TRUE(raise.has_value());
    EXPECT_EQ(latest_actions(*t.coord), 3u);
    EXPECT_EQ(t.coord->LatestSnapshot()->current_actor, std::optional<SeatIdxT>{1});

    auto const rejected = t.sink->RejectedList();
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].first, 2);

    t.coord->RequestStop();
    t.coord->Wait();
}

TEST(Coordinator, PauseHoldsTheClockAndResumeRestartsIt)
{
    Table t = human_table(2, fast_config(300ms));
    ASSERT_TRUE(t.coord->Start().has_value());
    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));

    ASSERT_TRUE(t.coord->Submit(PauseRequest{.reason = "player disconnected"}).get().has_value());
    EXPECT_EQ(t.coord->LatestSnapshot()->status, GameStatus::Paused);
    size_t const before = latest_actions(*t.coord);

    // well past the turn timeout: nothing may happen while paused
    std::this_thread::sleep_for(700ms);
    EXPECT_EQ(latest_actions(*t.coord), before);
    EXPECT_EQ(t.coord->LatestSnapshot()->status, GameStatus::Paused);

    CommandReply const blocked = t.coord->Submit(PlayerActionCmd{.seat = 0, .decision = CallAction{}}).get();
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, RVC::GamePaused);

    // a second pause is harmless
    EXPECT_TRUE(t.coord->Submit(PauseRequest{}).get().has_value());

    ASSERT_TRUE(t.coord->Submit(ResumeRequest{}).get().has_value());
    EXPECT_EQ(t.coord->LatestSnapshot()->status, GameStatus::Active);
    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));
    t.humans[0]->Deliver(CallAction{});
    ASSERT_TRUE(eventually([&] { return latest_actions(*t.coord) > before; }));
    EXPECT_EQ(t.coord->LatestSnapshot()->actions[before].type, ActionType::Call);

    t.coord->RequestStop();
    t.coord->Wait();
}

TEST(Coordinator, PauseDuringThinkTimeKeepsPlaying)
{
    auto sink = std::make_shared<CaptureSink>();
    auto store = std::make_shared<MemoryStore>();
    auto eng = std::make_unique<TournamentEngine>(fast_config(3s), MakeSeats(2), std::make_shared<StandardEvaluator>());
    std::vector<std::shared_ptr<DecisionSource>> sources{
        std::make_shared<RandomAI>(11, 150ms),
        std::make_shared<RandomAI>(12, 150ms)
    };
    GameCoordinator coord(std::move(eng), std::move(sources), sink, store);
    ASSERT_TRUE(coord.Start().has_value());

    // every cycle lands inside somebody's think time
    for (int i{}; i < 5; ++i)
    {
        std::this_thread::sleep_for(40ms);
        ASSERT_TRUE(coord.Submit(PauseRequest{}).get().has_value());
        std::this_thread::sleep_for(10ms);
        ASSERT_TRUE(coord.Submit(ResumeRequest{}).get().has_value());
    }

    size_t const before = latest_actions(coord);
    ASSERT_TRUE(eventually([&] { return latest_actions(coord) > before || !store->Hands().empty(); }));

    coord.RequestStop();
    coord.Wait();
    EXPECT_TRUE(sink->RejectedList().empty());
}

TEST(Coordinator, OnlyOneTournamentAtATime)
{
    Table first = human_table(2, fast_config(5s));
    ASSERT_TRUE(first.coord->Start().has_value());
    EXPECT_TRUE(SessionGuard::Active());

    Table second = human_table(2, fast_config(5s));
    std::expected<void, StartRejected> const refused = second.coord->Start();
    ASSERT_FALSE(refused.has_value());
    EXPECT_FALSE(refused.error().reason.empty());

    EXPECT_FALSE(first.coord->Start().has_value());

    first.coord->RequestStop();
    first.coord->Wait();
    EXPECT_FALSE(SessionGuard::Active());

    // the table is free again
    ASSERT_TRUE(second.coord->Start().has_value());
    second.coord->RequestStop();
    second.coord->Wait();
}

TEST(Coordinator, StopAbortsAndClosesSubmissions)
{
    Table t = human_table(2, fast_config(5s));
    ASSERT_TRUE(t.coord->Start().has_value());
    ASSERT_TRUE(eventually([&] { return t.humans[0]->Waiting(); }));

    t.coord->RequestStop();
    t.coord->Wait();

    EXPECT_TRUE(t.coord->Finished());
    EXPECT_TRUE(t.coord->Engine().Aborted());
    EXPECT_FALSE(t.humans[0]->Waiting());

    std::optional<TournamentResult> const result = t.store->Result();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->aborted);
    EXPECT_FALSE(result->winner.has_value());

    CommandReply const late = t.coord->Submit(ResumeRequest{}).get();
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, RVC::GameNotActive);
}

TEST(Coordinator, ConstructionIsValidated)
{
    auto sink = std::make_shared<CaptureSink>();
    EXPECT_THROW(GameCoordinator(nullptr, RandomSeats(2, 1), sink), error::StateError);

    auto eng = std::make_unique<TournamentEngine>(Seeded(1), MakeSeats(3), std::make_shared<StandardEvaluator>());
    EXPECT_THROW(GameCoordinator(std::move(eng), RandomSeats(2, 1), sink), error::StateError);

    auto started = std::make_unique<TournamentEngine>(Seeded(1), MakeSeats(2), std::make_shared<StandardEvaluator>());
    started->Start();
    EXPECT_THROW(GameCoordinator(std::move(started), RandomSeats(2, 1), sink), error::StateError);
}
