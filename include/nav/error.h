#pragma once

#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nav {
    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    /// Raised by the libcurl URL API.
    class client_error : public error {
    public:
        using error::error;
    };

    /// Thrown when a route template cannot be compiled into a matcher.
    /// A malformed template is a bug in the caller's route table and is
    /// not meant to be recovered from.
    class pattern_error : public error {
        std::string src;
    public:
        template <typename... T>
        pattern_error(
            std::string_view source,
            fmt::format_string<T...> format,
            T&&... args
        ) :
            error(format, std::forward<T>(args)...),
            src(source)
        {}

        auto source() const noexcept -> std::string_view {
            return src;
        }
    };
}
