//
// Created by malikt on 8/20/25.
//

#ifndef HOLDEMSNG_RECORDINGSOURCE_HPP
#define HOLDEMSNG_RECORDINGSOURCE_HPP

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "../core/DecisionSource.hpp"

namespace holdem::core::debug
{
    class RecordingSource final : public DecisionSource
    {
    public:
        explicit RecordingSource(std::shared_ptr<DecisionSource> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Decide(std::shared_ptr<TableSnapshot const> s,
                    std::chrono::steady_clock::time_point deadline) -> std::optional<Decision> override
        {
            std::optional<Decision> d = inner_->Decide(std::move(s), deadline);
            std::lock_guard<std::mutex> lk(mtx_);
            ++calls_;
            if (d) last_ = d;
            return d;
        }

        auto Cancel() -> void override
        {
            inner_->Cancel();
        }

        auto Calls() const -> size_t
        {
            std::lock_guard<std::mutex> lk(mtx_);
            return calls_;
        }

        auto Last() const -> std::optional<Decision>
        {
            std::lock_guard<std::mutex> lk(mtx_);
            return last_;
        }

    private:
        std::shared_ptr<DecisionSource> inner_;
        mutable std::mutex mtx_;
        std::optional<Decision> last_{};
        size_t calls_{0};
    };

    // Helper to wrap every seat's source
    inline auto WrapRecording(std::vector<std::shared_ptr<DecisionSource>> const& sources)
        -> std::vector<std::shared_ptr<DecisionSource>>
    {
        std::vector<std::shared_ptr<DecisionSource>> out;
        out.reserve(sources.size());

        for (auto const& s : sources)
        {
            out.emplace_back(std::make_shared<RecordingSource>(s));
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(DecisionSource* s) -> RecordingSource*
    {
        return dynamic_cast<RecordingSource*>(s);
    }
} // namespace holdem::core::debug

#endif //HOLDEMSNG_RECORDINGSOURCE_HPP
