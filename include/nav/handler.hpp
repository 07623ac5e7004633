#pragma once

#include "pattern.hpp"
#include "url.h"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>

namespace nav {
    enum class result {
        succeeded,
        failed
    };

    class route;

    struct handler {
        virtual ~handler() = default;

        virtual auto handle(
            const url& url,
            const route& route,
            const parameters& params
        ) -> std::optional<result> = 0;
    };

    template <typename F>
    concept handler_function = std::invocable<
        F&,
        const url&,
        const route&,
        const parameters&
    >;

    namespace detail {
        template <typename R>
        concept handler_result =
            std::same_as<R, void> ||
            std::same_as<R, result> ||
            std::same_as<R, std::optional<result>>;

        template <handler_result R>
        class handler : public nav::handler {
            using function = std::function<
                R(const url&, const route&, const parameters&)
            >;

            function fn;
        public:
            handler(function&& fn) : fn(std::forward<function>(fn)) {}

            auto handle(
                const url& url,
                const route& route,
                const parameters& params
            ) -> std::optional<result> override {
                if constexpr (std::is_void_v<R>) {
                    fn(url, route, params);
                    return std::nullopt;
                }
                else return fn(url, route, params);
            }
        };
    }

    /// Wraps a callable taking (url, route, parameters) and returning
    /// nothing, a result, or an optional result.
    template <handler_function F>
    auto make_handler(F&& f) -> std::shared_ptr<handler> {
        using R = std::invoke_result_t<
            F&,
            const url&,
            const route&,
            const parameters&
        >;

        return std::make_shared<detail::handler<R>>(std::forward<F>(f));
    }
}

template <>
struct fmt::formatter<nav::result> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(nav::result result, FormatContext& ctx) const {
        auto name = std::string_view();

        switch (result) {
            case nav::result::succeeded: name = "succeeded"; break;
            case nav::result::failed: name = "failed"; break;
        }

        return formatter<std::string_view>::format(name, ctx);
    }
};
