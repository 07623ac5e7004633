#include <nav/nav>

#include <gtest/gtest.h>

using namespace std::literals;

namespace {
    auto noop(const nav::url&, const nav::route&, const nav::parameters&)
        -> void {}

    auto make_routed(nav::parameters&& params) -> nav::routed {
        return nav::routed {
            .route = nav::route("/users/{id}", nav::make_handler(noop)),
            .params = std::move(params)
        };
    }
}

TEST(Routed, StringParam) {
    const auto routed = make_routed({{"id", "ada"}});

    EXPECT_EQ("ada"sv, routed.param<std::string_view>("id"));
    EXPECT_EQ("ada", routed.param<std::string>("id"));
}

TEST(Routed, IntegerParam) {
    const auto routed = make_routed({{"id", "42"}, {"big", "300"}});

    EXPECT_EQ(42, routed.param<int>("id"));
    EXPECT_EQ(42u, routed.param<unsigned long>("id"));
    EXPECT_THROW(routed.param<std::uint8_t>("big"), nav::error);
}

TEST(Routed, NegativeUnsignedParam) {
    const auto routed = make_routed({{"id", "-5"}, {"small", "-1"}});

    EXPECT_THROW(routed.param<unsigned long>("id"), nav::error);
    EXPECT_THROW(routed.param<unsigned long long>("id"), nav::error);
    EXPECT_THROW(routed.param<unsigned int>("small"), nav::error);
    EXPECT_EQ(-5, routed.param<long>("id"));
}

TEST(Routed, FilesystemPathParam) {
    const auto routed = make_routed({{"file", "report.tar.gz"}});
    const auto path = routed.param<std::filesystem::path>("file");

    EXPECT_EQ(std::filesystem::path("report.tar.gz"), path);
    EXPECT_EQ(".gz", path.extension().string());
}

TEST(Routed, InvalidIntegerParam) {
    const auto routed = make_routed({{"id", "abc"}, {"mixed", "12abc"}});

    EXPECT_THROW(routed.param<int>("id"), nav::error);
    EXPECT_THROW(routed.param<int>("mixed"), nav::error);
}

TEST(Routed, BoolParam) {
    const auto routed = make_routed({{"on", "yes"}, {"off", "f"}});

    EXPECT_TRUE(routed.param<bool>("on"));
    EXPECT_FALSE(routed.param<bool>("off"));
}

TEST(Routed, DurationParam) {
    const auto routed = make_routed({{"ttl", "30"}});

    EXPECT_EQ(30s, routed.param<std::chrono::seconds>("ttl"));
}

TEST(Routed, MissingParam) {
    const auto routed = make_routed({});

    EXPECT_THROW(routed.param<int>("id"), nav::error);
    EXPECT_FALSE(routed.param<std::optional<int>>("id"));
}

TEST(Routed, OptionalParam) {
    const auto routed = make_routed({{"id", "7"}});

    EXPECT_EQ(7, routed.param<std::optional<int>>("id"));
}

TEST(Routed, JSONSupport) {
    const auto routed = make_routed({{"id", "42"}});
    const nlohmann::json json = routed;

    EXPECT_EQ("/users/{id}", json["route"].get<std::string>());
    EXPECT_EQ("42", json["params"]["id"].get<std::string>());
}

TEST(Route, Invoke) {
    auto seen = std::string();

    const auto route = nav::route("/users/{id}", nav::make_handler([&](
        const nav::url&,
        const nav::route& route,
        const nav::parameters& params
    ) {
        seen = fmt::format("{} {}", route, params.at("id"));
        return nav::result::failed;
    }));

    const auto result = route(
        nav::url("https://example.com/users/5"),
        {{"id", "5"}}
    );

    EXPECT_EQ(nav::result::failed, result);
    EXPECT_EQ("/users/{id} 5", seen);
}

TEST(Route, Format) {
    const auto route = nav::route("/users/{id}", nav::make_handler(noop));

    EXPECT_EQ("/users/{id}", fmt::to_string(route));
    EXPECT_EQ("succeeded", fmt::to_string(nav::result::succeeded));
    EXPECT_EQ("failed", fmt::to_string(nav::result::failed));
}
