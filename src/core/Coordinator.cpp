//
// Created by Malik T on 08/10/2025.
//

#include "Coordinator.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace holdem::core
{
    namespace
    {
        template <class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };

        inline auto Viol(error::RuleViolationCode code) -> error::RuleViolation
        {
            return error::RuleViolation{.code = code};
        }
    }

    GameCoordinator::GameCoordinator(std::unique_ptr<TournamentEngine> engine,
                                     std::vector<std::shared_ptr<DecisionSource>> sources,
                                     std::shared_ptr<BroadcastSink> broadcast,
                                     std::shared_ptr<PersistenceSink> persistence) :
        engine_(std::move(engine)),
        sources_(std::move(sources)),
        broadcast_(std::move(broadcast)),
        persistence_(std::move(persistence)),
        mailbox_(std::make_shared<Mailbox<Inbound>>()),
        timer_(engine_ ? engine_->GetConfig().turn_timeout : std::chrono::milliseconds{1},
               engine_ ? engine_->GetConfig().tick_interval : std::chrono::milliseconds{1})
    {
        if (!engine_) HLD_THROW(error::Code::State, "Coordinator without an engine");
        if (engine_->Status() != GameStatus::Waiting)
            HLD_THROW(error::Code::State, "Coordinator needs an engine that has not started");
        if (sources_.size() != engine_->PlayerCount())
            HLD_THROW(error::Code::State, std::format("{} decision sources for {} seats",
                                                      sources_.size(), engine_->PlayerCount()));
        if (std::ranges::any_of(sources_, [](auto const& s) { return !s; }))
            HLD_THROW(error::Code::State, "Null decision source");
    }

    GameCoordinator::~GameCoordinator()
    {
        if (thread_.joinable())
        {
            RequestStop();
            thread_.join();
        }
    }

    auto GameCoordinator::Start() -> std::expected<void, StartRejected>
    {
        if (started_.exchange(true))
            return std::unexpected(StartRejected{"Coordinator was already started"});

        std::optional<SessionGuard::Lease> lease = SessionGuard::Acquire();
        if (!lease)
        {
            started_.store(false);
            std::print("[Coordinator] Start rejected: a tournament is already running\n");
            return std::unexpected(StartRejected{"A tournament is already running"});
        }

        thread_ = std::thread([this, l = std::move(*lease)]() mutable
        {
            Run(std::move(l));
        });
        return {};
    }

    auto GameCoordinator::Submit(Command cmd) -> std::future<CommandReply>
    {
        std::promise<CommandReply> promise;
        std::future<CommandReply> fut = promise.get_future();

        std::lock_guard<std::mutex> lk(submit_mtx_);
        if (closed_)
        {
            promise.set_value(std::unexpected(Viol(error::RuleViolationCode::GameNotActive)));
            return fut;
        }
        mailbox_->push(Inbound{std::move(cmd), std::move(promise)});
        return fut;
    }

    auto GameCoordinator::RequestStop() -> void
    {
        mailbox_->push(Inbound{StopSignal{}});
    }

    auto GameCoordinator::Wait() -> void
    {
        if (thread_.joinable()) thread_.join();
        if (fatal_) std::rethrow_exception(fatal_);
    }

    auto GameCoordinator::LatestSnapshot() const -> std::shared_ptr<TableSnapshot const>
    {
        std::lock_guard<std::mutex> lk(snap_mtx_);
        return latest_;
    }

    auto GameCoordinator::Engine() const -> TournamentEngine const&
    {
        HLD_ASSERT(!started_.load() || Finished(), "Engine read while the coordinator runs");
        return *engine_;
    }

    auto GameCoordinator::Run(SessionGuard::Lease lease) -> void
    {
        (void)lease; // held for the lifetime of the loop

        try
        {
            Loop();
        }
        catch (error::InvariantError const& e)
        {
            std::print("[Coordinator] Invariant broken, aborting: {}\n", e.message());
            engine_->Abort(e.message());
            fatal_ = std::current_exception();
        }
        catch (std::exception const& e)
        {
            std::print("[Coordinator] Loop failed, aborting: {}\n", e.what());
            engine_->Abort(e.what());
            fatal_ = std::current_exception();
        }

        Publish();
        if (persistence_)
        {
            if (auto const result = engine_->Result()) persistence_->SaveResult(*result);
        }
        Close();
        finished_.store(true, std::memory_order_release);
    }

    auto GameCoordinator::Loop() -> void
    {
        engine_->Start();
        std::print("[Coordinator] Tournament started with {} seats\n", engine_->PlayerCount());
        Publish();

        while (!stop_)
        {
            // commands already waiting go first
            while (!stop_)
            {
                std::optional<Inbound> in = mailbox_->try_pop();
                if (!in) break;
                Handle(std::move(*in));
            }
            if (stop_) break;

            GameStatus const status = engine_->Status();
            if (status == GameStatus::Completed) break;

            if (status == GameStatus::Active && !engine_->HandInProgress())
            {
                engine_->StartHand();
                std::print("[Coordinator] Hand {} dealt, dealer P{}\n", engine_->HandNumber(),
                           static_cast<int>(engine_->Dealer()));
                AfterMutation();
                continue;
            }
            if (status == GameStatus::Active && !timer_.Running()) OpenTurn();
            WaitForInput();
        }

        if (engine_->Status() != GameStatus::Completed) engine_->Abort("stop requested");
        FlushHands();
    }

    auto GameCoordinator::OpenTurn() -> void
    {
        std::optional<SeatIdxT> const actor = engine_->CurrentActor();
        HLD_INVARIANT(actor.has_value(), "Hand in progress without a current actor");

        timer_.Start(*actor, ++ticket_, TurnTimer::Clock::now());
        RequestDecision();
    }

    auto GameCoordinator::RequestDecision() -> void
    {
        HLD_ASSERT(timer_.Running(), "Decision requested without a running timer");
        SeatIdxT const seat = *timer_.Seat();

        std::shared_ptr<DecisionSource> source = sources_[seat];
        std::shared_ptr<TableSnapshot const> view = engine_->SnapshotFor(seat);
        auto const deadline = timer_.Deadline();
        uint64_t const ticket = timer_.Ticket();

        std::thread worker([source = std::move(source), view = std::move(view), deadline, ticket, seat,
                               box = mailbox_]() mutable
        {
            std::optional<Decision> d;
            try
            {
                d = source->Decide(std::move(view), deadline);
            }
            catch (std::exception const& e)
            {
                // the turn falls to the timer
                std::print("[Coordinator] Seat {} source failed: {}\n", static_cast<int>(seat), e.what());
            }
            box->push(Inbound{SourceAnswer{seat, ticket, std::move(d)}});
        });
        worker.detach();
    }

    auto GameCoordinator::WaitForInput() -> void
    {
        std::optional<Inbound> in;
        if (timer_.Running())
            in = mailbox_->pop_until(timer_.NextWake(TurnTimer::Clock::now()));
        else
            in = mailbox_->pop();

        if (in)
        {
            Handle(std::move(*in));
            return;
        }

        if (ExpireIfDue()) return;
        if (broadcast_) broadcast_->TimerTick(*timer_.Seat(), timer_.Remaining(TurnTimer::Clock::now()));
    }

    auto GameCoordinator::ExpireIfDue() -> std::optional<SeatIdxT>
    {
        if (!timer_.Expired(TurnTimer::Clock::now())) return std::nullopt;

        SeatIdxT const seat = *timer_.Seat();
        HLD_INVARIANT(engine_->CurrentActor() == seat, "Turn timer runs for a seat that is not acting");
        ApplyDefault(seat, "timed out");
        return seat;
    }

    auto GameCoordinator::Handle(Inbound in) -> void
    {
        std::visit(Overloaded{
                       [&](Command const& cmd)
                       {
                           // a move that arrives after the deadline loses to the clock
                           auto const* act = std::get_if<PlayerActionCmd>(&cmd);
                           std::optional<SeatIdxT> expired;
                           if (act) expired = ExpireIfDue();

                           CommandReply reply;
                           if (expired && *expired == act->seat)
                           {
                               std::print("[Coordinator] Late move from P{} dropped\n", static_cast<int>(act->seat));
                               reply = std::unexpected(
                                   Viol(error::RuleViolationCode::StaleDecision).with_actor(act->seat));
                           }
                           else
                           {
                               reply = HandleCommand(cmd);
                           }
                           if (in.reply) in.reply->set_value(reply);
                       },
                       [&](SourceAnswer const& answer)
                       {
                           if (!ExpireIfDue()) HandleAnswer(answer);
                       },
                       [&](StopSignal const&) { stop_ = true; }
                   }, in.msg);
    }

    auto GameCoordinator::HandleCommand(Command const& cmd) -> CommandReply
    {
        using RVC = error::RuleViolationCode;

        return std::visit(Overloaded{
            [&](PlayerActionCmd const& c) -> CommandReply
            {
                CommandReply r = TryApply(c.seat, c.decision);
                if (!r)
                {
                    std::print("[Coordinator] Rejected P{}: {}\n", static_cast<int>(c.seat),
                               error::describe(r.error()));
                    if (broadcast_) broadcast_->Rejected(c.seat, r.error());
                }
                return r;
            },
            [&](PauseRequest const& c) -> CommandReply
            {
                if (engine_->Status() == GameStatus::Paused) return {};
                if (engine_->Status() != GameStatus::Active) return std::unexpected(Viol(RVC::GameNotActive));

                if (std::optional<SeatIdxT> const seat = timer_.Seat())
                {
                    timer_.Freeze(TurnTimer::Clock::now());
                    sources_[*seat]->Cancel();
                }
                ++ticket_;
                engine_->Pause();
                std::print("[Coordinator] Paused{}\n", c.reason.empty() ? "" : std::format(" ({})", c.reason));
                Publish();
                return {};
            },
            [&](ResumeRequest const&) -> CommandReply
            {
                if (engine_->Status() == GameStatus::Active) return {};
                if (engine_->Status() != GameStatus::Paused) return std::unexpected(Viol(RVC::GameNotActive));

                // the actor gets a fresh full turn
                timer_.Cancel();
                engine_->Resume();
                std::print("[Coordinator] Resumed\n");
                Publish();
                return {};
            }
        }, cmd);
    }

    auto GameCoordinator::HandleAnswer(SourceAnswer const& answer) -> void
    {
        if (!timer_.Running() || answer.ticket != timer_.Ticket()) return; // stale
        if (!answer.decision) return;

        CommandReply const r = TryApply(answer.seat, *answer.decision);
        if (r) return;

        std::print("[Coordinator] Invalid answer from P{}: {}\n", static_cast<int>(answer.seat),
                   error::describe(r.error()));
        if (broadcast_) broadcast_->Rejected(answer.seat, r.error());

        bool const human = engine_->Player(answer.seat).kind == ActorKind::Human;
        if (human && !timer_.Expired(TurnTimer::Clock::now()))
        {
            // same turn, same deadline
            RequestDecision();
            return;
        }
        ApplyDefault(answer.seat, human ? "timed out" : "answered illegally");
    }

    auto GameCoordinator::TryApply(SeatIdxT const seat, Decision const& d) -> CommandReply
    {
        using RVC = error::RuleViolationCode;

        if (engine_->Status() == GameStatus::Paused)
            return std::unexpected(Viol(RVC::GamePaused).with_actor(seat));

        ActionResult const r = engine_->Apply(seat, d);
        if (!r) return std::unexpected(r.error());

        EndTurn(seat);
        AfterMutation();
        return {};
    }

    auto GameCoordinator::ApplyDefault(SeatIdxT const seat, std::string_view const why) -> void
    {
        Decision const d = engine_->TimeoutDecision(seat);
        ActionResult const r = engine_->Apply(seat, d);
        if (!r)
            HLD_THROW(error::Code::State, std::format("Default {} for P{} rejected: {}", to_string(TypeOf(d)),
                                                      static_cast<int>(seat), error::describe(r.error())));

        std::print("[Coordinator] P{} {} -> {}\n", static_cast<int>(seat), why, to_string(TypeOf(d)));
        EndTurn(seat);
        AfterMutation();
    }

    auto GameCoordinator::EndTurn(SeatIdxT const seat) -> void
    {
        timer_.Cancel();
        ++ticket_;
        sources_[seat]->Cancel();
    }

    auto GameCoordinator::AfterMutation() -> void
    {
        Publish();
        FlushHands();
    }

    auto GameCoordinator::Publish() -> void
    {
        Config const& cfg = engine_->GetConfig();
        std::shared_ptr<TableSnapshot const> snap = cfg.mode == GameMode::Spectator
                                                        ? engine_->Snapshot()
                                                        : engine_->SnapshotFor(cfg.viewer_seat);
        {
            std::lock_guard<std::mutex> lk(snap_mtx_);
            latest_ = snap;
        }
        if (broadcast_) broadcast_->Publish(std::move(snap));
    }

    auto GameCoordinator::FlushHands() -> void
    {
        for (HandRecord const& rec : engine_->DrainCompletedHands())
        {
            if (persistence_) persistence_->SaveHand(rec);
        }
    }

    auto GameCoordinator::Close() -> void
    {
        {
            std::lock_guard<std::mutex> lk(submit_mtx_);
            closed_ = true;
        }
        for (std::shared_ptr<DecisionSource> const& s : sources_) s->Cancel();

        // nothing more will be applied; answer whoever is still waiting
        while (std::optional<Inbound> in = mailbox_->try_pop())
        {
            if (in->reply) in->reply->set_value(std::unexpected(Viol(error::RuleViolationCode::GameNotActive)));
        }
    }
}
