//
// Created by Malik T on 07/10/2025.
//

#include "Session.hpp"

namespace holdem::core
{
    std::atomic<bool> SessionGuard::active_{false};

    auto SessionGuard::Lease::operator=(Lease&& other) noexcept -> Lease&
    {
        if (this != &other)
        {
            if (held_) active_.store(false, std::memory_order_release);
            held_ = std::exchange(other.held_, false);
        }
        return *this;
    }

    SessionGuard::Lease::~Lease()
    {
        if (held_) active_.store(false, std::memory_order_release);
    }

    auto SessionGuard::Acquire() -> std::optional<Lease>
    {
        bool expected = false;
        if (!active_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return std::nullopt;
        return Lease{};
    }

    auto SessionGuard::Active() noexcept -> bool
    {
        return active_.load(std::memory_order_acquire);
    }
}
