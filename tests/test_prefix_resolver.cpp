#include <catch2/catch_test_macros.hpp>
#include "schema/prefix_resolver.hpp"

using namespace wpdb;

TEST_CASE("resolve_prefix: main site keeps the base prefix", "[prefix]") {
    CHECK(prefix::resolve_prefix("wp_", std::nullopt) == "wp_");
    CHECK(prefix::resolve_prefix("wp_", 1) == "wp_");
    CHECK(prefix::resolve_prefix("wp_", 0) == "wp_");
    CHECK(prefix::resolve_prefix("wp_", -4) == "wp_");
}

TEST_CASE("resolve_prefix: sub-sites get the numbered prefix", "[prefix]") {
    CHECK(prefix::resolve_prefix("wp_", 2) == "wp_2_");
    CHECK(prefix::resolve_prefix("wp_", 3) == "wp_3_");
    CHECK(prefix::resolve_prefix("blog_", 117) == "blog_117_");
}

TEST_CASE("resolve_table: bare names are prefixed", "[prefix]") {
    CHECK(prefix::resolve_table("wp_", "posts") == "wp_posts");
    CHECK(prefix::resolve_table("wp_3_", "options") == "wp_3_options");
}

TEST_CASE("resolve_table: qualified names pass through", "[prefix]") {
    CHECK(prefix::resolve_table("wp_", "wp_posts") == "wp_posts");
    CHECK(prefix::resolve_table("wp_3_", "wp_3_postmeta") == "wp_3_postmeta");
}

TEST_CASE("resolve_table: sub-site prefix does not treat main-site names as qualified", "[prefix]") {
    CHECK(prefix::resolve_table("wp_3_", "wp_posts") == "wp_3_wp_posts");
}

TEST_CASE("detect_site_prefixes: finds every numbered site", "[prefix]") {
    const std::vector<std::string> tables = {
        "wp_options", "wp_posts", "wp_2_options", "wp_2_posts",
        "wp_10_options", "wp_3_posts", "wp_users"};

    const auto prefixes = prefix::detect_site_prefixes("wp_", tables);
    const std::vector<std::string> expected = {"wp_", "wp_10_", "wp_2_", "wp_3_"};
    CHECK(prefixes == expected);
}

TEST_CASE("detect_site_prefixes: base is always present", "[prefix]") {
    CHECK(prefix::detect_site_prefixes("wp_", {}) == std::vector<std::string>{"wp_"});
    CHECK(prefix::detect_site_prefixes("wp_", {"other_table"}) == std::vector<std::string>{"wp_"});
}

TEST_CASE("detect_site_prefixes: ignores non-numeric and unterminated segments", "[prefix]") {
    const std::vector<std::string> tables = {
        "wp_2fa_tokens",    // digits not followed by '_'
        "wp_12",            // no trailing '_'
        "wp_x_options",     // no digits
        "wpx_2_options",    // different base
        "wp_5_"};           // prefix only

    const auto prefixes = prefix::detect_site_prefixes("wp_", tables);
    const std::vector<std::string> expected = {"wp_", "wp_5_"};
    CHECK(prefixes == expected);
}

TEST_CASE("like_pattern: wildcards in the prefix are escaped", "[prefix]") {
    CHECK(prefix::like_pattern("wp_") == "wp\\_%");
    CHECK(prefix::like_pattern("wp_3_") == "wp\\_3\\_%");
    CHECK(prefix::like_pattern("a%b") == "a\\%b%");
    CHECK(prefix::like_pattern("a\\b") == "a\\\\b%");
    CHECK(prefix::like_pattern("") == "%");
}
