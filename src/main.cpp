//
// Created by Malik T on 13/10/2025.
//

//
// main.cpp: sit-and-go table server using WebSocket++
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <format>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Coordinator.hpp"
#include "core/Evaluator.hpp"
#include "core/Exception.hpp"
#include "core/HumanSeat.hpp"
#include "core/RandomAi.hpp"
#include "core/Tournament.hpp"
#include "debug/HandHistoryLog.hpp"
#include "net/Codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    using namespace holdem::core;

    constexpr SeatIdxT HumanSeatIdx = 0;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint32_t n_players{6};
        std::uint64_t seed{123456789ULL};
        ChipT         stack{1000};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30)};
        bool          spectator{false};
        std::string   history{"hand_history.txt"};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--stack")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.stack = static_cast<ChipT>(v); }
            }
            else if (arg == "--turn-timeout-ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.turn_timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--history")
            {
                if (i + 1 < argc) { cfg.history = argv[++i]; }
            }
            else if (arg == "--spectator")
            {
                cfg.spectator = true;
            }
        }
        return cfg;
    }

    // The one client connection a table serves
    struct ClientChannel
    {
        std::weak_ptr<WsServer> ep;

        std::mutex mtx;
        std::condition_variable cv;
        Hdl hdl;
        bool connected{false};
        bool ever_connected{false};

        auto SendBinary(flatbuffers::DetachedBuffer const& buf) -> bool
        {
            auto ep_sp = ep.lock();
            Hdl target;
            {
                std::lock_guard<std::mutex> lk(mtx);
                if (!ep_sp || !connected)
                {
                    return false;
                }
                target = hdl;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(target, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
            if (ec)
            {
                std::print("[Server] send failed: {}\n", ec.message());
                return false;
            }
            return true;
        }
    };

    class WsBroadcastSink final : public BroadcastSink
    {
    public:
        explicit WsBroadcastSink(std::shared_ptr<ClientChannel> chan) : chan_(std::move(chan)) {}

        auto Publish(std::shared_ptr<TableSnapshot const> snapshot) -> void override
        {
            chan_->SendBinary(net::BuildSnapshot(*snapshot, next_id_++));
        }

        auto TimerTick(SeatIdxT seat, std::chrono::milliseconds remaining) -> void override
        {
            chan_->SendBinary(net::BuildTimerTick(seat, remaining, next_id_++));
        }

        auto Rejected(SeatIdxT seat, error::RuleViolation const& why) -> void override
        {
            chan_->SendBinary(net::BuildViolation(seat, why, next_id_++));
        }

        // Violations found by the server itself (bad frames, spoofed seats)
        auto Reject(SeatIdxT seat, error::RuleViolation const& why) -> void
        {
            chan_->SendBinary(net::BuildViolation(seat, why, next_id_++));
        }

    private:
        std::shared_ptr<ClientChannel> chan_;
        std::atomic<std::uint64_t> next_id_{1};
    };

    auto MakeSeats(ServerConfig const& sc) -> std::vector<SeatConfig>
    {
        std::vector<SeatConfig> seats;
        seats.reserve(sc.n_players);
        for (std::uint32_t i = 0; i < sc.n_players; ++i)
        {
            bool const human = !sc.spectator && i == HumanSeatIdx;
            seats.push_back(SeatConfig{
                .name = human ? std::string{"You"} : std::format("Bot {}", i),
                .kind = human ? ActorKind::Human : ActorKind::Automated
            });
        }
        return seats;
    }
}

int main(int argc, char** argv)
{
    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[Server] starting on port {} with {} seat(s){}\n",
               sc.port, sc.n_players, sc.spectator ? ", spectator mode" : "");

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    auto chan = std::make_shared<ClientChannel>();
    chan->ep = ep;
    auto sink = std::make_shared<WsBroadcastSink>(chan);

    Config cfg;
    cfg.seed         = sc.seed;
    cfg.starting_stack = sc.stack;
    cfg.turn_timeout = sc.turn_timeout;
    cfg.mode         = sc.spectator ? GameMode::Spectator : GameMode::Player;
    cfg.viewer_seat  = HumanSeatIdx;

    std::vector<SeatConfig> const seats = MakeSeats(sc);

    std::shared_ptr<HumanSeat> human;
    std::vector<std::shared_ptr<DecisionSource>> sources;
    sources.reserve(seats.size());
    for (std::size_t i = 0; i < seats.size(); ++i)
    {
        if (seats[i].kind == ActorKind::Human)
        {
            human = std::make_shared<HumanSeat>(static_cast<SeatIdxT>(i));
            sources.push_back(human);
        }
        else
        {
            // bots take a moment so a watching client can follow along
            sources.push_back(std::make_shared<RandomAI>(sc.seed + static_cast<uint64_t>(i * 1337u),
                                                         std::chrono::milliseconds{400}));
        }
    }

    std::unique_ptr<GameCoordinator> coord;
    std::shared_ptr<debug::HandHistoryLog> history;
    try
    {
        auto events = std::make_shared<EventBus>();
        events->Subscribe([](GameEvent const& e) { std::print("[Event] {}\n", to_string(e)); });
        auto engine = std::make_unique<TournamentEngine>(cfg, seats, std::make_shared<StandardEvaluator>(), events);
        history = std::make_shared<debug::HandHistoryLog>(sc.history);
        history->start(cfg, seats);
        coord = std::make_unique<GameCoordinator>(std::move(engine), sources, sink, history);
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("[Server] cannot set up the table: {}\n", e.message());
        return 1;
    }

    // Replies to pause/resume arrive on the coordinator thread; read them at shutdown
    std::mutex replies_mx;
    std::vector<std::future<CommandReply>> control_replies;
    auto submit_control = [&](Command cmd)
    {
        std::future<CommandReply> f = coord->Submit(std::move(cmd));
        std::lock_guard<std::mutex> lk(replies_mx);
        control_replies.push_back(std::move(f));
    };

    ep->set_open_handler([&](Hdl hdl)
    {
        bool reconnect = false;
        {
            std::lock_guard<std::mutex> lk(chan->mtx);
            if (chan->connected)
            {
                std::print("[Server] extra connection rejected (table has its client)\n");
                websocketpp::lib::error_code ec;
                ep->close(hdl, websocketpp::close::status::try_again_later, "Table already observed", ec);
                return;
            }
            chan->hdl = hdl;
            chan->connected = true;
            reconnect = chan->ever_connected;
            chan->ever_connected = true;
        }
        chan->cv.notify_all();

        std::print("[Server] client {}\n", reconnect ? "reconnected" : "connected");
        if (reconnect && !sc.spectator)
        {
            submit_control(ResumeRequest{});
        }
        else if (std::shared_ptr<TableSnapshot const> snap = coord->LatestSnapshot())
        {
            sink->Publish(std::move(snap));
        }
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        {
            std::lock_guard<std::mutex> lk(chan->mtx);
            if (!chan->connected || chan->hdl.owner_before(hdl) || hdl.owner_before(chan->hdl))
            {
                return;
            }
            chan->connected = false;
        }
        std::print("[Server] client disconnected\n");
        if (!sc.spectator)
        {
            submit_control(PauseRequest{"player disconnected"});
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        (void)hdl;
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] ignoring non-binary frame\n");
            return;
        }
        if (!human)
        {
            return; // spectators only watch
        }

        auto const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        std::expected<net::DecodedAction, net::ParseError> parsed = net::DecodePlayerAction(bytes);
        if (!parsed)
        {
            std::print("[Server] parse error: {}\n", parsed.error().message);
            return;
        }

        // Anti-spoof: the connection only speaks for the human seat
        if (parsed->actor != human->Seat())
        {
            std::print("[Server] spoofed actor {} rejected\n", static_cast<int>(parsed->actor));
            sink->Reject(parsed->actor, error::RuleViolation{.code = error::RuleViolationCode::WrongActor}
                                            .with_actor(parsed->actor).with_expected(human->Seat()));
            return;
        }
        if (!human->Waiting())
        {
            sink->Reject(parsed->actor, error::RuleViolation{.code = error::RuleViolationCode::WrongActor}
                                            .with_actor(parsed->actor));
            return;
        }
        human->Deliver(parsed->decision);
    });

    ep->listen(sc.port);
    ep->start_accept();
    std::thread net_thr([ep]
    {
        ep->run();
    });

    {
        std::unique_lock<std::mutex> lk(chan->mtx);
        chan->cv.wait(lk, [&] { return chan->connected; });
    }

    if (std::expected<void, StartRejected> started = coord->Start(); !started)
    {
        std::print("[Server] {}\n", started.error().reason);
        ep->stop_listening();
        ep->stop();
        net_thr.join();
        return 1;
    }

    int rc = 0;
    try
    {
        coord->Wait();
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("[Server] tournament failed: {}\n", e.message());
        rc = 1;
    }
    catch (std::exception const& e)
    {
        std::print("[Server] tournament failed: {}\n", e.what());
        rc = 1;
    }

    {
        std::lock_guard<std::mutex> lk(replies_mx);
        for (std::future<CommandReply>& f : control_replies)
        {
            if (CommandReply const r = f.get(); !r)
            {
                std::print("[Server] control command refused: {}\n", error::describe(r.error()));
            }
        }
    }

    if (std::optional<TournamentResult> const result = coord->Engine().Result(); result && result->winner)
    {
        std::print("[Server] winner: {} after {} hands\n", result->winner->name, result->stats.total_hands);
    }

    // Keep the socket up a moment to flush frames
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    ep->stop_listening();
    {
        std::lock_guard<std::mutex> lk(chan->mtx);
        if (chan->connected)
        {
            websocketpp::lib::error_code ec;
            ep->close(chan->hdl, websocketpp::close::status::going_away, "Tournament over", ec);
        }
    }
    ep->stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return rc;
}
