#pragma once

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nav {
    class url final {
        CURLU* handle;

        auto check_return_code(CURLUcode code) const -> void;

        auto get(CURLUPart what, unsigned int flags = 0) const -> std::string;

        auto set(
            CURLUPart part,
            const char* content,
            unsigned int flags = 0
        ) -> void;

        auto set(
            CURLUPart part,
            std::string_view content,
            unsigned int flags = 0
        ) -> void;

        auto try_get(
            CURLUPart what,
            CURLUcode none,
            unsigned int flags = 0
        ) const -> std::optional<std::string>;
    public:
        /// Parses a full URL or a bare path such as "/users/42". Returns an
        /// empty optional if the text is neither.
        static auto parse(std::string_view text) -> std::optional<url>;

        url();

        url(const char* str);

        url(std::string_view text);

        url(const url& other);

        url(url&& other);

        ~url();

        auto operator=(const char* str) -> url&;

        auto operator=(std::string_view text) -> url&;

        auto operator=(const url& other) -> url&;

        auto operator=(url&& other) -> url&;

        auto fragment() const -> std::optional<std::string>;

        auto host() const -> std::optional<std::string>;

        auto path() const -> std::string;

        auto path(std::string_view value) -> void;

        auto query() const -> std::optional<std::string>;

        auto scheme() const -> std::optional<std::string>;

        /// The full URL, or only the path for a URL built from a bare path.
        auto string() const -> std::string;
    };

    auto from_json(const nlohmann::json& json, url& url) -> void;

    auto to_json(nlohmann::json& json, const url& url) -> void;
}

template <>
struct fmt::formatter<nav::url> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const nav::url& url, FormatContext& ctx) const {
        return formatter<std::string_view>::format(url.string(), ctx);
    }
};
