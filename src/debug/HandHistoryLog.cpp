#include "HandHistoryLog.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using namespace holdem::core;

namespace
{

auto s_action(Action const& a) -> std::string
{
    std::string out = std::format("#{} P{} {}", a.sequence, static_cast<int>(a.seat), to_string(a.type));
    if (a.type == ActionType::Raise && a.amount)
    {
        out += std::format(" to {}", *a.amount);
    }
    else if (a.amount)
    {
        out += std::format(" {}", *a.amount);
    }
    if (a.all_in)
    {
        out += " (all-in)";
    }
    return out;
}

auto s_seats(std::vector<SeatIdxT> const& seats) -> std::string
{
    std::string serial;
    for (size_t i{}; i < seats.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += std::format("P{}", static_cast<int>(seats[i]));
    }
    return serial;
}

auto s_stacks(std::vector<ChipT> const& stacks) -> std::string
{
    std::string serial;
    for (size_t i{}; i < stacks.size(); ++i)
    {
        serial += std::format("{}{}:{}", (i ? "," : ""), i, stacks[i]);
    }
    return serial;
}

} // anonymous namespace

namespace holdem::core::debug
{

HandHistoryLog::HandHistoryLog(std::string path)
    : out_(path, std::ios::out | std::ios::trunc)
{
    if (!out_.is_open())
    {
        HLD_THROW(error::Code::State, std::format("Cannot open hand history '{}'", path));
    }
}

HandHistoryLog::~HandHistoryLog() = default;

auto HandHistoryLog::start(Config const& cfg, std::vector<SeatConfig> const& seats) -> void
{
    std::lock_guard<std::mutex> lk(mtx_);
    out_ << std::format("Seed={}\n", cfg.seed);
    out_ << std::format("Players={}\n", seats.size());
    out_ << std::format("Stack={}\n", cfg.starting_stack);
    for (size_t i{}; i < seats.size(); ++i)
    {
        out_ << std::format("Seat {}: {} ({})\n", i, seats[i].name,
                            seats[i].kind == ActorKind::Human ? "human" : "auto");
    }
    out_.flush();
}

auto HandHistoryLog::SaveHand(HandRecord const& r) -> void
{
    std::lock_guard<std::mutex> lk(mtx_);
    out_ << std::format("Hand {} level={} blinds={}/{} dealer=P{} sb=P{} bb=P{}\n",
                        r.hand_number, r.blind_level + 1, r.small_blind, r.big_blind,
                        static_cast<int>(r.dealer), static_cast<int>(r.small_blind_seat),
                        static_cast<int>(r.big_blind_seat));
    out_ << std::format("Stacks: [{}]\n", s_stacks(r.initial_stacks));

    for (size_t seat{}; seat < r.hole_cards.size(); ++seat)
    {
        if (!r.hole_cards[seat]) continue;
        out_ << std::format("Hole P{}: {}\n", seat, util::CardsStr(*r.hole_cards[seat]));
    }
    for (Action const& a : r.actions)
    {
        out_ << std::format("Action: {}\n", s_action(a));
    }
    out_ << std::format("Board: [{}]\n", util::CardsStr(r.community));

    for (ShowdownEntry const& e : r.showdown)
    {
        out_ << std::format("Show P{}: {} (rank {})\n", static_cast<int>(e.seat), e.description, e.rank);
    }
    for (size_t i{}; i < r.pots.size(); ++i)
    {
        out_ << std::format("Pot {}: {} eligible=[{}]\n", i, r.pots[i].amount, s_seats(r.pots[i].eligible));
    }
    for (Payout const& p : r.payouts)
    {
        out_ << std::format("Payout: pot {} -> P{} {}\n", p.pot_index, static_cast<int>(p.seat), p.amount);
    }
    if (!r.eliminated.empty())
    {
        out_ << std::format("Eliminated: [{}]\n", s_seats(r.eliminated));
    }
    out_ << std::format("Final: [{}]\n\n", s_stacks(r.final_stacks));
    ++hands_;
}

auto HandHistoryLog::SaveResult(TournamentResult const& result) -> void
{
    std::lock_guard<std::mutex> lk(mtx_);
    out_ << (result.aborted ? "Result: aborted\n" : "Result: complete\n");
    for (Standing const& s : result.standings)
    {
        out_ << std::format("Place {}: {} (P{}) chips={} hands={}\n", s.finish_position, s.name,
                            static_cast<int>(s.seat), s.chips, s.hands_survived);
    }
    TournamentStats const& st = result.stats;
    out_ << std::format("Hands={} BiggestPot={} (hand {}) Showdowns={} Folds={} Raises={} AllIns={}\n",
                        st.total_hands, st.biggest_pot, st.biggest_pot_hand, st.showdowns, st.total_folds,
                        st.total_raises, st.total_all_ins);
    if (!st.best_hand_name.empty())
    {
        out_ << std::format("BestHand={} (hand {})\n", st.best_hand_name, st.best_hand_number);
    }
    out_.flush();
}

auto HandHistoryLog::flush() -> void
{
    std::lock_guard<std::mutex> lk(mtx_);
    out_.flush();
}

auto HandHistoryLog::HandsWritten() const -> size_t
{
    std::lock_guard<std::mutex> lk(mtx_);
    return hands_;
}

} // namespace holdem::core::debug
