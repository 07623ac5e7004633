#include <nav/error.h>
#include <nav/router.hpp>

#include <timber/timber>

namespace nav {
    auto router::alias(std::string_view name, std::string_view pattern)
        -> router& {
        alias_map.insert_or_assign(std::string(name), std::string(pattern));
        TIMBER_DEBUG("Alias {{{}}} = {}", name, pattern);
        return *this;
    }

    auto router::alias(const nlohmann::json& aliases) -> router& {
        if (!aliases.is_object()) {
            throw error(
                "Aliases must be a JSON object, not {}",
                aliases.type_name()
            );
        }

        for (const auto& item : aliases.items()) {
            alias(item.key(), item.value().get<std::string>());
        }

        return *this;
    }

    auto router::aliases() const noexcept -> const alias_table& {
        return alias_map;
    }

    auto router::add(
        std::string_view pattern,
        std::shared_ptr<nav::handler> handler
    ) -> nav::route {
        return add(std::vector<std::string> {std::string(pattern)}, handler);
    }

    auto router::add(
        std::initializer_list<std::string_view> patterns,
        std::shared_ptr<nav::handler> handler
    ) -> nav::route {
        return add(
            std::vector<std::string>(patterns.begin(), patterns.end()),
            handler
        );
    }

    auto router::add(
        const std::vector<std::string>& patterns,
        std::shared_ptr<nav::handler> handler
    ) -> nav::route {
        if (patterns.empty()) {
            throw error("Route patterns must contain at least one pattern");
        }

        if (!handler) throw error("Route handler must not be null");

        auto compiled = std::vector<entry>();
        compiled.reserve(patterns.size());

        for (const auto& pattern : patterns) {
            compiled.push_back(entry {
                .pattern = compile(pattern, alias_map),
                .route = nav::route(pattern, handler)
            });
        }

        auto first = compiled.front().route;

        entries.reserve(entries.size() + compiled.size());
        for (auto& item : compiled) {
            TIMBER_DEBUG(
                "Route #{} '{}' registered",
                entries.size(),
                item.route.pattern()
            );
            entries.push_back(std::move(item));
        }

        return first;
    }

    auto router::add(std::string_view pattern, const nav::route& route)
        -> nav::route {
        return add(pattern, route.handler());
    }

    auto router::dispatch(const url& url) const -> result {
        const auto routed = route(url);
        if (!routed) return result::failed;

        return routed->route(url, routed->params)
            .value_or(result::succeeded);
    }

    auto router::dispatch(std::string_view url) const -> result {
        const auto parsed = nav::url::parse(url);
        if (!parsed) {
            TIMBER_DEBUG("Cannot dispatch malformed URL '{}'", url);
            return result::failed;
        }

        return dispatch(*parsed);
    }

    auto router::match(std::string_view path) const
        -> std::optional<routed> {
        const auto normalized = normalize(path);

        for (const auto& entry : entries) {
            if (auto params = entry.pattern.match(normalized)) {
                TIMBER_TRACE(
                    "Path '{}' matched route '{}'",
                    normalized,
                    entry.route.pattern()
                );

                return routed {
                    .route = entry.route,
                    .params = std::move(*params)
                };
            }
        }

        TIMBER_DEBUG("No route matches path '{}'", normalized);
        return std::nullopt;
    }

    auto router::route(const url& url) const -> std::optional<routed> {
        return match(url.path());
    }

    auto router::route(std::string_view url) const -> std::optional<routed> {
        const auto parsed = nav::url::parse(url);
        if (!parsed) return std::nullopt;

        return route(*parsed);
    }

    auto router::size() const noexcept -> std::size_t {
        return entries.size();
    }
}
