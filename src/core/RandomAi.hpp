//
// Created by Malik T on 18/08/2025.
//

#ifndef HOLDEMSNG_RANDOMAI_HPP
#define HOLDEMSNG_RANDOMAI_HPP

#include <condition_variable>
#include <mutex>
#include <random>
#include "DecisionSource.hpp"

namespace holdem::core
{
    // Uniform over the legal action kinds; raises land between the minimum and three times it
    class RandomAI final : public DecisionSource
    {
    public:
        explicit RandomAI(uint64_t rng_seed, std::chrono::milliseconds think_time = std::chrono::milliseconds{0});

        auto Decide(std::shared_ptr<TableSnapshot const> view,
                    std::chrono::steady_clock::time_point deadline) -> std::optional<Decision> override;
        // Cuts short any Decide still thinking; it returns no answer
        auto Cancel() -> void override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mutex mtx_; // guards rng_ and generation_
        std::condition_variable cv_;
        uint64_t generation_{0};
        std::mt19937 rng_;
        std::chrono::milliseconds think_time_;
    };
}

#endif //HOLDEMSNG_RANDOMAI_HPP
