#include <nav/error.h>
#include <nav/url.h>

#include <memory>
#include <utility>

namespace {
    // Route URLs commonly use application-specific schemes.
    constexpr auto url_flags = CURLU_NON_SUPPORT_SCHEME;

    using curl_string = std::unique_ptr<char, decltype(&curl_free)>;

    auto take(char* part) -> std::string {
        const auto owned = curl_string(part, &curl_free);
        return owned ? std::string(owned.get()) : std::string();
    }

    constexpr auto whitespace = std::string_view(" \t\n\v\f\r");

    auto trim(std::string_view text) -> std::string_view {
        const auto first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos) return std::string_view();

        const auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }
}

namespace nav {
    auto url::parse(std::string_view text) -> std::optional<url> {
        try {
            const auto trimmed = trim(text);

            if (trimmed.starts_with('/')) {
                auto result = url();
                result.path(trimmed);
                return result;
            }

            return url(text);
        }
        catch (const client_error&) {
            return std::nullopt;
        }
    }

    url::url() : handle(curl_url()) {
        if (!handle) throw client_error("Failed to allocate URL handle");
    }

    url::url(const char* str) : url() { set(CURLUPART_URL, str, url_flags); }

    url::url(std::string_view text) : url() {
        set(CURLUPART_URL, text, url_flags);
    }

    url::url(const url& other) : handle(curl_url_dup(other.handle)) {
        if (!handle) throw client_error("Failed to duplicate URL handle");
    }

    url::url(url&& other) : handle(std::exchange(other.handle, nullptr)) {}

    url::~url() { curl_url_cleanup(handle); }

    auto url::operator=(const char* str) -> url& {
        set(CURLUPART_URL, str, url_flags);
        return *this;
    }

    auto url::operator=(std::string_view text) -> url& {
        set(CURLUPART_URL, text, url_flags);
        return *this;
    }

    auto url::operator=(const url& other) -> url& {
        if (handle != other.handle) {
            curl_url_cleanup(handle);

            handle = curl_url_dup(other.handle);
            if (!handle) throw client_error("Failed to duplicate URL handle");
        }

        return *this;
    }

    auto url::operator=(url&& other) -> url& {
        if (handle != other.handle) {
            curl_url_cleanup(handle);
            handle = std::exchange(other.handle, nullptr);
        }

        return *this;
    }

    auto url::check_return_code(CURLUcode code) const -> void {
        if (code != CURLUE_OK) throw client_error(curl_url_strerror(code));
    }

    auto url::fragment() const -> std::optional<std::string> {
        return try_get(CURLUPART_FRAGMENT, CURLUE_NO_FRAGMENT);
    }

    auto url::get(CURLUPart what, unsigned int flags) const -> std::string {
        char* part = nullptr;
        const auto code = curl_url_get(handle, what, &part, flags);
        auto result = take(part);

        check_return_code(code);
        return result;
    }

    auto url::host() const -> std::optional<std::string> {
        return try_get(CURLUPART_HOST, CURLUE_NO_HOST);
    }

    auto url::path() const -> std::string { return get(CURLUPART_PATH); }

    auto url::path(std::string_view value) -> void {
        set(CURLUPART_PATH, value);
    }

    auto url::query() const -> std::optional<std::string> {
        return try_get(CURLUPART_QUERY, CURLUE_NO_QUERY);
    }

    auto url::scheme() const -> std::optional<std::string> {
        return try_get(CURLUPART_SCHEME, CURLUE_NO_SCHEME);
    }

    auto url::set(CURLUPart part, const char* content, unsigned int flags)
        -> void {
        check_return_code(curl_url_set(handle, part, content, flags));
    }

    auto url::set(CURLUPart part, std::string_view content, unsigned int flags)
        -> void {
        const auto str = std::string(content);
        set(part, str.c_str(), flags);
    }

    auto url::string() const -> std::string {
        char* part = nullptr;
        const auto code = curl_url_get(handle, CURLUPART_URL, &part, 0);
        auto result = take(part);

        // A URL built from a bare path has no scheme or host to print.
        if (code == CURLUE_NO_SCHEME || code == CURLUE_NO_HOST) return path();

        check_return_code(code);
        return result;
    }

    auto url::try_get(CURLUPart what, CURLUcode none, unsigned int flags) const
        -> std::optional<std::string> {
        char* part = nullptr;
        const auto code = curl_url_get(handle, what, &part, flags);
        auto result = take(part);

        if (code == CURLUE_OK) return result;
        if (code == none) return std::nullopt;

        throw client_error(curl_url_strerror(code));
    }

    auto from_json(const nlohmann::json& json, url& url) -> void {
        url = json.get<std::string>();
    }

    auto to_json(nlohmann::json& json, const url& url) -> void {
        json = url.string();
    }
}
