//
// Created by Malik T on 08/10/2025.
//

#ifndef HOLDEMSNG_COORDINATOR_HPP
#define HOLDEMSNG_COORDINATOR_HPP

#include <atomic>
#include <exception>
#include <expected>
#include <future>
#include <mutex>
#include <thread>
#include <variant>
#include "DecisionSource.hpp"
#include "Mailbox.hpp"
#include "Session.hpp"
#include "Sinks.hpp"
#include "Tournament.hpp"
#include "TurnTimer.hpp"

namespace holdem::core
{
    struct PlayerActionCmd
    {
        SeatIdxT seat{};
        Decision decision{};
    };

    struct PauseRequest
    {
        std::string reason;
    };

    struct ResumeRequest {};

    using Command = std::variant<PlayerActionCmd, PauseRequest, ResumeRequest>;
    using CommandReply = std::expected<void, error::RuleViolation>;

    struct StartRejected
    {
        std::string reason;
    };

    // Single writer of the engine. Every state change happens on its own thread, in the
    // order messages reach the mailbox: external commands, answers from decision sources,
    // timer expiry. Observers only ever see immutable snapshots.
    class GameCoordinator
    {
    public:
        GameCoordinator(std::unique_ptr<TournamentEngine> engine,
                        std::vector<std::shared_ptr<DecisionSource>> sources,
                        std::shared_ptr<BroadcastSink> broadcast,
                        std::shared_ptr<PersistenceSink> persistence = nullptr);
        ~GameCoordinator();

        GameCoordinator(GameCoordinator const&) = delete;
        GameCoordinator& operator=(GameCoordinator const&) = delete;

        // Fails while another tournament holds the process-wide session
        auto Start() -> std::expected<void, StartRejected>;

        // Resolved on the coordinator thread. Do not block on it from a sink callback.
        auto Submit(Command cmd) -> std::future<CommandReply>;

        // Aborts the tournament at the next message boundary
        auto RequestStop() -> void;
        // Joins the loop; rethrows the error that ended it, if any
        auto Wait() -> void;

        [[nodiscard]] auto Finished() const noexcept -> bool { return finished_.load(std::memory_order_acquire); }
        [[nodiscard]] auto LatestSnapshot() const -> std::shared_ptr<TableSnapshot const>;
        // Only while not running
        [[nodiscard]] auto Engine() const -> TournamentEngine const&;

    private:
        struct SourceAnswer
        {
            SeatIdxT seat{};
            uint64_t ticket{};
            std::optional<Decision> decision{};
        };

        struct StopSignal {};

        struct Inbound
        {
            std::variant<Command, SourceAnswer, StopSignal> msg;
            std::optional<std::promise<CommandReply>> reply{};
        };

        auto Run(SessionGuard::Lease lease) -> void;
        auto Loop() -> void;
        auto OpenTurn() -> void;
        auto RequestDecision() -> void;
        auto WaitForInput() -> void;
        // Applies the default for an expired turn; returns the seat that timed out
        auto ExpireIfDue() -> std::optional<SeatIdxT>;
        auto Handle(Inbound in) -> void;
        auto HandleCommand(Command const& cmd) -> CommandReply;
        auto HandleAnswer(SourceAnswer const& answer) -> void;
        auto TryApply(SeatIdxT seat, Decision const& d) -> CommandReply;
        auto ApplyDefault(SeatIdxT seat, std::string_view why) -> void;
        auto EndTurn(SeatIdxT seat) -> void;
        auto AfterMutation() -> void;
        auto Publish() -> void;
        auto FlushHands() -> void;
        auto Close() -> void;

    private:
        std::unique_ptr<TournamentEngine> engine_;
        std::vector<std::shared_ptr<DecisionSource>> sources_;
        std::shared_ptr<BroadcastSink> broadcast_;
        std::shared_ptr<PersistenceSink> persistence_;
        std::shared_ptr<Mailbox<Inbound>> mailbox_;

        // loop thread only
        TurnTimer timer_;
        uint64_t ticket_{0};
        bool stop_{false};

        std::atomic<bool> started_{false};
        std::atomic<bool> finished_{false};
        std::mutex submit_mtx_;
        bool closed_{false};
        std::thread thread_;
        std::exception_ptr fatal_;

        mutable std::mutex snap_mtx_;
        std::shared_ptr<TableSnapshot const> latest_;
    };
}

#endif //HOLDEMSNG_COORDINATOR_HPP
