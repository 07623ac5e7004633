#include <nav/error.h>
#include <nav/pattern.hpp>

#include <timber/timber>

namespace {
    constexpr auto whitespace = std::string_view(" \t\n\v\f\r");
    constexpr auto default_body = std::string_view("[^/]+");

    struct parameter {
        std::string_view name;
        bool optional;
        std::size_t length;
    };

    auto is_name_char(char c) noexcept -> bool {
        return
            (c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '_' ||
            c == '-';
    }

    auto is_reserved(char c) noexcept -> bool {
        return c == '{' || c == '}' || c == '?';
    }

    /// Reads "{name}" or "{name?}" from the start of 'text'.
    auto read_parameter(std::string_view text) -> std::optional<parameter> {
        if (!text.starts_with('{')) return std::nullopt;

        const auto close = text.find('}');
        if (close == std::string_view::npos) return std::nullopt;

        auto name = text.substr(1, close - 1);
        const auto optional = name.ends_with('?');
        if (optional) name.remove_suffix(1);

        if (name.empty()) return std::nullopt;
        for (const auto c : name) {
            if (!is_name_char(c)) return std::nullopt;
        }

        return parameter {
            .name = name,
            .optional = optional,
            .length = close + 1
        };
    }

    auto quote(char c) -> std::string {
        return RE2::QuoteMeta(re2::StringPiece(&c, 1));
    }
}

namespace nav {
    auto normalize(std::string_view path) -> std::string {
        const auto first = path.find_first_not_of(whitespace);
        if (first == std::string_view::npos) return "/";

        const auto last = path.find_last_not_of(whitespace);
        path = path.substr(first, last - first + 1);

        const auto begin = path.find_first_not_of('/');
        if (begin == std::string_view::npos) return "/";

        const auto end = path.find_last_not_of('/');
        return fmt::format("/{}", path.substr(begin, end - begin + 1));
    }

    pattern::pattern(
        std::string_view source,
        std::vector<std::string>&& names,
        std::unique_ptr<const re2::RE2>&& regex
    ) :
        src(source),
        params(std::forward<std::vector<std::string>>(names)),
        regex(std::forward<std::unique_ptr<const re2::RE2>>(regex))
    {}

    auto pattern::expression() const -> const std::string& {
        return regex->pattern();
    }

    auto pattern::match(std::string_view path) const
        -> std::optional<parameters> {
        auto groups = std::vector<re2::StringPiece>(params.size() + 1);

        const auto matched = regex->Match(
            path,
            0,
            path.size(),
            RE2::ANCHOR_BOTH,
            groups.data(),
            static_cast<int>(groups.size())
        );

        if (!matched) return std::nullopt;

        auto result = parameters();

        for (auto i = std::size_t(); i < params.size(); ++i) {
            const auto& group = groups[i + 1];

            // RE2 leaves groups that did not participate as null pieces.
            if (group.data() == nullptr) continue;

            result.insert_or_assign(
                params[i],
                std::string(group.data(), group.size())
            );
        }

        return result;
    }

    auto pattern::names() const noexcept -> std::span<const std::string> {
        return params;
    }

    auto pattern::source() const noexcept -> std::string_view {
        return src;
    }

    auto compile(std::string_view source, const alias_table& aliases)
        -> pattern {
        const auto path = normalize(source);
        const auto text = std::string_view(path);

        auto expression = std::string("^");
        auto names = std::vector<std::string>();

        const auto group = [&](const parameter& param) -> std::string {
            names.emplace_back(param.name);

            const auto alias = aliases.find(param.name);
            const auto body = alias == aliases.end() ?
                default_body : std::string_view(alias->second);

            return fmt::format("({})", body);
        };

        auto i = std::size_t();

        while (i < text.size()) {
            const auto c = text[i];
            const auto rest = text.substr(i);

            if (c == '\\' && i + 1 < text.size() && is_reserved(text[i + 1])) {
                expression += quote(text[i + 1]);
                i += 2;
                continue;
            }

            if (c == '/') {
                const auto param = read_parameter(rest.substr(1));

                if (param && param->optional) {
                    expression += fmt::format("(?:/{})?", group(*param));
                    i += param->length + 1;
                    continue;
                }
            }

            if (c == '{') {
                if (const auto param = read_parameter(rest)) {
                    expression += param->optional ?
                        fmt::format("(?:{})?", group(*param)) :
                        group(*param);
                    i += param->length;
                    continue;
                }
            }

            expression += quote(c);
            ++i;
        }

        expression += '$';

        // Paths are raw bytes; matching must not depend on valid UTF-8.
        auto options = RE2::Options();
        options.set_encoding(RE2::Options::EncodingLatin1);
        options.set_log_errors(false);

        auto regex = std::make_unique<const re2::RE2>(expression, options);

        if (!regex->ok()) {
            TIMBER_ERROR(
                "Failed to compile route '{}' ({}): {}",
                source,
                expression,
                regex->error()
            );

            throw pattern_error(
                source,
                "Error compiling pattern '{}' ({}): {}",
                source,
                expression,
                regex->error()
            );
        }

        const auto captures =
            static_cast<std::size_t>(regex->NumberOfCapturingGroups());

        if (captures != names.size()) {
            TIMBER_ERROR(
                "Route '{}' ({}) has {} captures for {} parameters",
                source,
                expression,
                captures,
                names.size()
            );

            throw pattern_error(
                source,
                "Error compiling pattern '{}' ({}): expected {} capturing "
                "groups, found {}; alias patterns must use (?:...) groups",
                source,
                expression,
                names.size(),
                captures
            );
        }

        TIMBER_TRACE("Compiled route '{}' to {}", source, expression);

        return pattern(source, std::move(names), std::move(regex));
    }
}
