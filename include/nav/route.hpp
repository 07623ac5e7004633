#pragma once

#include "handler.hpp"
#include "parser.hpp"

#include <nlohmann/json.hpp>

namespace nav {
    namespace detail {
        template <typename T>
        struct is_optional : std::false_type {};

        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template <typename T>
        inline constexpr bool is_optional_v = is_optional<T>::value;
    }

    /// The identity a template was registered under: the template text and
    /// the handler shared by every template of the same registration.
    class route {
        std::string tmpl;
        std::shared_ptr<nav::handler> fn;
    public:
        route(std::string_view pattern, std::shared_ptr<nav::handler> handler);

        auto operator==(const route& other) const -> bool = default;

        auto operator()(
            const url& url,
            const parameters& params
        ) const -> std::optional<result>;

        auto handler() const noexcept -> const std::shared_ptr<nav::handler>&;

        auto pattern() const noexcept -> std::string_view;
    };

    struct routed {
        nav::route route;
        parameters params;

        template <typename T>
        auto param(std::string_view name) const -> T {
            const auto result = params.find(std::string(name));

            if (result == params.end()) {
                if constexpr (detail::is_optional_v<T>) return T();
                else throw error("Missing path parameter '{}'", name);
            }
            else {
                try {
                    return parser<T>::parse(result->second);
                }
                catch (const std::exception& ex) {
                    throw error(
                        "Failed to parse path parameter '{}': {}",
                        name,
                        ex.what()
                    );
                }
            }
        }
    };

    auto to_json(nlohmann::json& json, const routed& routed) -> void;
}

template <>
struct fmt::formatter<nav::route> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const nav::route& route, FormatContext& ctx) const {
        return formatter<std::string_view>::format(route.pattern(), ctx);
    }
};
