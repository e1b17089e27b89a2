// Headlamp String Utilities Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/string_utils.hpp"

using namespace headlamp::core;

TEST_CASE("Levenshtein distance", "[core][string_utils]") {
    REQUIRE(levenshtein_distance("", "") == 0);
    REQUIRE(levenshtein_distance("port", "") == 4);
    REQUIRE(levenshtein_distance("", "port") == 4);
    REQUIRE(levenshtein_distance("port", "port") == 0);
    REQUIRE(levenshtein_distance("prot", "port") == 2);
    REQUIRE(levenshtein_distance("kitten", "sitting") == 3);
    REQUIRE(levenshtein_distance("in-clster", "in-cluster") == 1);
}

TEST_CASE("Similar option names", "[core][string_utils]") {
    std::vector<std::string> names = {"in-cluster", "insecure-ssl", "port", "base-url"};

    SECTION("closest first") {
        auto matches = find_similar_strings("in-clustr", names, 3);
        REQUIRE_FALSE(matches.empty());
        REQUIRE(matches.front() == "in-cluster");
    }

    SECTION("exact match is not a suggestion") {
        auto matches = find_similar_strings("port", names, 2);
        REQUIRE(matches.empty());
    }

    SECTION("nothing within distance") {
        auto matches = find_similar_strings("completely-different", names, 2);
        REQUIRE(matches.empty());
    }
}

TEST_CASE("Comma separated lists", "[core][string_utils]") {
    REQUIRE(split_list("").empty());
    REQUIRE(split_list(" , ,").empty());
    REQUIRE(split_list("profile,email") == std::vector<std::string>{"profile", "email"});
    REQUIRE(split_list(" a , b,,c ") == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Environment suffix mapping", "[core][string_utils]") {
    REQUIRE(env_suffix_to_option_name("OIDC_CLIENT_ID") == "oidc-client-id");
    REQUIRE(env_suffix_to_option_name("PORT") == "port");
    REQUIRE(env_suffix_to_option_name("In_Cluster") == "in-cluster");

    REQUIRE(option_name_to_env_suffix("oidc-client-id") == "OIDC_CLIENT_ID");
    REQUIRE(option_name_to_env_suffix("html-static-dir") == "HTML_STATIC_DIR");
}

TEST_CASE("Trim and lower", "[core][string_utils]") {
    REQUIRE(trim("  x y \t\n") == "x y");
    REQUIRE(trim("   ").empty());
    REQUIRE(to_lower("HeadLamp") == "headlamp");
}
