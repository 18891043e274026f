#include "route_facade.hpp"
#include "narration.hpp"
#include "gtest/gtest.h"
#include <string>

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}


TEST(RouteFacade, result_route) {
    RouteResponse r = handle_route("GET", "/inverse-mod-z?x=3&y=7");
    EXPECT_EQ(200, r.status);
    EXPECT_EQ("Inverse of 3 mod 7 = 5\n", r.body);

    r = handle_route("GET", "/inverse-mod-z?y=12&x=4");
    EXPECT_EQ(200, r.status);
    EXPECT_TRUE(contains(r.body, "not coprime (GCD = 4)"));
}

TEST(RouteFacade, steps_route) {
    RouteResponse r = handle_route("GET", "/inverse-mod?x=5&y=12");
    EXPECT_EQ(200, r.status);
    EXPECT_EQ(format_steps(compute_inverse(5, 12, InverseMode::Guaranteed)), r.body);
}

TEST(RouteFacade, explanation_route) {
    RouteResponse r = handle_route("GET", "/inverse-mod-explanation");
    EXPECT_EQ(200, r.status);
    EXPECT_EQ(algorithm_explanation(), r.body);
}

TEST(RouteFacade, missing_parameters) {
    RouteResponse r = handle_route("GET", "/inverse-mod?x=3");
    EXPECT_EQ(400, r.status);
    EXPECT_TRUE(contains(r.body, "To use this"));
    EXPECT_TRUE(contains(r.body, algorithm_explanation()));

    r = handle_route("GET", "/inverse-mod-z");
    EXPECT_EQ(400, r.status);
}

TEST(RouteFacade, malformed_parameters) {
    const char* targets[] = {
        "/inverse-mod?x=0&y=7",
        "/inverse-mod?x=abc&y=7",
        "/inverse-mod-z?x=3&y=-7",
        "/inverse-mod-z?x=3&y=",
        "/inverse-mod-z?x=3&y",
    };
    for (const char* t : targets) {
        RouteResponse r = handle_route("GET", t);
        EXPECT_EQ(400, r.status) << t;
        EXPECT_TRUE(contains(r.body, "not a positive integer")) << t;
    }

    RouteResponse r = handle_route("GET", "/inverse-mod-z?x=3&y=99999999999999999999999");
    EXPECT_EQ(400, r.status);
    EXPECT_TRUE(contains(r.body, "64 bits"));
}

TEST(RouteFacade, unknown_path_and_method) {
    EXPECT_EQ(404, handle_route("GET", "/inverse").status);
    EXPECT_EQ(404, handle_route("GET", "/").status);
    EXPECT_EQ(405, handle_route("POST", "/inverse-mod?x=3&y=7").status);
}

TEST(RouteFacade, query_value) {
    std::string v;
    EXPECT_TRUE(query_value("x=3&y=7", "y", v));
    EXPECT_EQ("7", v);
    EXPECT_TRUE(query_value("x=3&x=9", "x", v));
    EXPECT_EQ("3", v);
    EXPECT_TRUE(query_value("flag", "flag", v));
    EXPECT_EQ("", v);
    EXPECT_FALSE(query_value("", "x", v));
    EXPECT_FALSE(query_value("xx=3", "x", v));
}


}  // end unnamed namespace
