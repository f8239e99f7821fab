//
// OmegaException.hpp
//

#ifndef GUNZI_OMEGAEXCEPTION_HPP
#define GUNZI_OMEGAEXCEPTION_HPP
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

namespace gunzi::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    //
    // No std::stacktrace on our toolchains, so layers that rethrow leave a note instead
    // (room, round, phase, seat) and to_str() prints them innermost first.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto trail() const noexcept -> std::vector<std::string> const& { return trail_; }

        auto annotate(std::string note) -> OmegaException&
        {
            trail_.push_back(std::move(note));
            return *this;
        }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}) in `{}`", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.function_name());
            for (std::string const& note : trail_)
            {
                s += std::format("\n  while {}", note);
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::vector<std::string> trail_;
    };
}

//extension to std format to allow use with std::print();
template <class T>
struct std::formatter<gunzi::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(gunzi::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //GUNZI_OMEGAEXCEPTION_HPP
