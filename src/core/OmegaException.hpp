//
// OmegaException.hpp
//

#ifndef GIFTSIEGE_OMEGAEXCEPTION_HPP
#define GIFTSIEGE_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace siege::core
{
    // Carries the error text, a caller supplied category and where it was raised.
    // Only thrown for engine misuse, never for an ordinary rule violation.
    template <typename T>
    class OmegaException
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
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        [[nodiscard]]
        auto data() const noexcept -> T const& { return usr_data_; }

        // Origin line followed by the raising frames, innermost first.
        [[nodiscard]]
        auto to_str(std::size_t max_frames = 16) const -> std::string
        {
            std::string s = std::format("{}({}:{}) in `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            std::size_t n = 0;
            for (std::stacktrace_entry const& e : backtrace_)
            {
                if (n++ == max_frames) break;
                s += std::format("  at {}({}): {}\n", e.source_file(), e.source_line(), e.description());
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

// Allows OmegaException to be passed straight to std::print.
template <class T>
struct std::formatter<siege::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(siege::core::OmegaException<T> const& e, FormatContext& ctx) const
    {
        std::string s = std::format("error ({}): {}\n{}", static_cast<int>(e.data()), e.what(), e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //GIFTSIEGE_OMEGAEXCEPTION_HPP
