#pragma once

#include <fmt/format.h>
#include <map>
#include <memory>
#include <optional>
#include <re2/re2.h>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nav {
    /// Maps an alias name to the raw RE2 sub-pattern that replaces the
    /// default body of any parameter with the same name.
    using alias_table = std::map<std::string, std::string, std::less<>>;

    using parameters = std::unordered_map<std::string, std::string>;

    /// Trims surrounding whitespace and reduces the path to a single leading
    /// slash with no trailing slash. Blank input yields "/".
    auto normalize(std::string_view path) -> std::string;

    class pattern {
        std::string src;
        std::vector<std::string> params;
        std::unique_ptr<const re2::RE2> regex;
    public:
        pattern(
            std::string_view source,
            std::vector<std::string>&& names,
            std::unique_ptr<const re2::RE2>&& regex
        );

        auto expression() const -> const std::string&;

        /// Matches an already normalized path against the whole expression.
        /// Parameters whose group did not take part in the match are absent
        /// from the result.
        auto match(std::string_view path) const -> std::optional<parameters>;

        /// Parameter names in capture group order.
        auto names() const noexcept -> std::span<const std::string>;

        auto source() const noexcept -> std::string_view;
    };

    /// Compiles a route template such as "/users/{id}/posts/{slug?}".
    ///
    /// Throws pattern_error if the resulting expression is rejected by RE2
    /// or if an alias introduces capturing groups of its own.
    auto compile(std::string_view source, const alias_table& aliases)
        -> pattern;
}

template <>
struct fmt::formatter<nav::pattern> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const nav::pattern& pattern, FormatContext& ctx) const {
        return formatter<std::string_view>::format(pattern.source(), ctx);
    }
};
