//
// Created by Malik T on 20/08/2025.
//

#ifndef HOLDEMSNG_HANDHISTORYLOG_HPP
#define HOLDEMSNG_HANDHISTORYLOG_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "../core/Sinks.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace holdem::core::debug
{
    // Plain-text hand history, one block per hand
    class HandHistoryLog final : public PersistenceSink
    {
    public:
        explicit HandHistoryLog(std::string path);
        ~HandHistoryLog() override;

        HandHistoryLog(HandHistoryLog const&) = delete;
        auto operator=(HandHistoryLog const&) -> HandHistoryLog& = delete;

        // Session header (seed, seats, starting stack)
        auto start(Config const& cfg, std::vector<SeatConfig> const& seats) -> void;

        auto SaveHand(HandRecord const& record) -> void override;
        auto SaveResult(TournamentResult const& result) -> void override;

        // Manual flush
        auto flush() -> void;

        [[nodiscard]] auto HandsWritten() const -> size_t;

    private:
        mutable std::mutex mtx_;
        std::ofstream out_;
        size_t hands_{0};
    };
}

#endif //HOLDEMSNG_HANDHISTORYLOG_HPP
