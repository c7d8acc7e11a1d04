//
// Created by Malik T on 02/10/2025.
//

#ifndef HOLDEMSNG_OMEGAEXCEPTION_HPP
#define HOLDEMSNG_OMEGAEXCEPTION_HPP

#include <algorithm>
#include <exception>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>

namespace holdem::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    template <typename T>
    class OmegaException : public std::exception
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> char const* override { return err_str_.c_str(); }

        [[nodiscard]]
        auto message() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // last frames are the runtime's own entry points
            auto const shown = backtrace_.size() > 3 ? backtrace_.size() - 3 : backtrace_.size();
            for (std::size_t i{}; i < shown; ++i)
            {
                auto const& entry = backtrace_[i];
                s += std::format("{}({}):{}\n", entry.source_file(), entry.source_line(), entry.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<holdem::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(holdem::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed to process with code ({}): {}\n{}\n", static_cast<int>(p.data()),
                                    p.message(), p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //HOLDEMSNG_OMEGAEXCEPTION_HPP
