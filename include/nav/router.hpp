#pragma once

#include "pattern.hpp"
#include "route.hpp"

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace nav {
    /// Resolves paths to the first registered template that matches them.
    ///
    /// Registration is expected to finish before routing begins; once built,
    /// the router may be shared by concurrent readers.
    class router {
        struct entry {
            nav::pattern pattern;
            nav::route route;
        };

        alias_table alias_map;
        std::vector<entry> entries;
    public:
        router() = default;

        router(const router&) = delete;

        router(router&&) = default;

        auto operator=(const router&) -> router& = delete;

        auto operator=(router&&) -> router& = default;

        /// Defines or replaces an alias. Routes compiled before this call
        /// are not affected.
        auto alias(std::string_view name, std::string_view pattern)
            -> router&;

        /// Merges a JSON object of alias names to sub-patterns.
        auto alias(const nlohmann::json& aliases) -> router&;

        auto aliases() const noexcept -> const alias_table&;

        auto add(
            std::string_view pattern,
            std::shared_ptr<nav::handler> handler
        ) -> nav::route;

        auto add(
            std::initializer_list<std::string_view> patterns,
            std::shared_ptr<nav::handler> handler
        ) -> nav::route;

        /// Compiles every template against the current aliases and appends
        /// them in order. Nothing is appended if any template fails.
        auto add(
            const std::vector<std::string>& patterns,
            std::shared_ptr<nav::handler> handler
        ) -> nav::route;

        /// Binds another template to an existing route's handler.
        auto add(std::string_view pattern, const nav::route& route)
            -> nav::route;

        template <handler_function F>
        auto add(std::string_view pattern, F&& f) -> nav::route {
            return add(pattern, make_handler(std::forward<F>(f)));
        }

        template <handler_function F>
        auto add(
            std::initializer_list<std::string_view> patterns,
            F&& f
        ) -> nav::route {
            return add(patterns, make_handler(std::forward<F>(f)));
        }

        template <handler_function F>
        auto add(const std::vector<std::string>& patterns, F&& f)
            -> nav::route {
            return add(patterns, make_handler(std::forward<F>(f)));
        }

        auto dispatch(const url& url) const -> result;

        /// Accepts a full URL or a bare path. Unparseable text fails the
        /// same way an unroutable path does.
        auto dispatch(std::string_view url) const -> result;

        auto dispatch(const char* url) const -> result {
            return dispatch(std::string_view(url));
        }

        auto match(std::string_view path) const -> std::optional<routed>;

        auto route(const url& url) const -> std::optional<routed>;

        auto route(std::string_view url) const -> std::optional<routed>;

        auto route(const char* url) const -> std::optional<routed> {
            return route(std::string_view(url));
        }

        auto size() const noexcept -> std::size_t;
    };
}
