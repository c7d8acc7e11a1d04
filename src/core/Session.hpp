//
// Created by Malik T on 07/10/2025.
//

#ifndef HOLDEMSNG_SESSION_HPP
#define HOLDEMSNG_SESSION_HPP

#include <atomic>
#include <utility>
#include <optional>

namespace holdem::core
{
    // At most one running tournament per process
    class SessionGuard
    {
    public:
        class Lease
        {
        public:
            Lease(Lease&& other) noexcept : held_(std::exchange(other.held_, false)) {}
            Lease& operator=(Lease&& other) noexcept;
            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;
            ~Lease();

        private:
            friend class SessionGuard;
            Lease() : held_(true) {}
            bool held_{false};
        };

        // Empty when another session holds the table
        static auto Acquire() -> std::optional<Lease>;
        static auto Active() noexcept -> bool;

    private:
        static std::atomic<bool> active_;
    };
}

#endif //HOLDEMSNG_SESSION_HPP
