#include <nav/route.hpp>

namespace nav {
    route::route(
        std::string_view pattern,
        std::shared_ptr<nav::handler> handler
    ) :
        tmpl(pattern),
        fn(std::move(handler))
    {}

    auto route::operator()(
        const url& url,
        const parameters& params
    ) const -> std::optional<result> {
        return fn->handle(url, *this, params);
    }

    auto route::handler() const noexcept
        -> const std::shared_ptr<nav::handler>& {
        return fn;
    }

    auto route::pattern() const noexcept -> std::string_view {
        return tmpl;
    }

    auto to_json(nlohmann::json& json, const routed& routed) -> void {
        json = {
            {"route", std::string(routed.route.pattern())},
            {"params", routed.params}
        };
    }
}
