#include <doctest/doctest.h>
#include <sweep/matcher.hpp>

#include "../test_helpers.hpp"

using namespace sweep;
using sweep::test::item;

TEST_CASE("normalize_identifier strips separators and case") {
    CHECK(normalize_identifier("Google.Chrome") == "googlechrome");
    CHECK(normalize_identifier("Google Chrome") == "googlechrome");
    CHECK(normalize_identifier("Adobe.Acrobat.Reader.64-bit") == "adobeacrobatreader64bit");
    CHECK(normalize_identifier("some_app - beta") == "someappbeta");
    CHECK(normalize_identifier("").empty());
}

TEST_CASE("glob_match") {
    CHECK(glob_match("xbox*", "XboxApp"));
    CHECK(glob_match("*overlay", "Microsoft.XboxGameOverlay"));
    CHECK(glob_match("micro?oft.*", "Microsoft.People"));
    CHECK(glob_match("*", ""));
    CHECK_FALSE(glob_match("xbox*", "MyXboxApp"));
    CHECK_FALSE(glob_match("a?c", "ac"));
    CHECK(is_wildcard_pattern("McAfee*"));
    CHECK_FALSE(is_wildcard_pattern("Google.Chrome"));
}

TEST_CASE("split_publisher") {
    std::string publisher, app;
    REQUIRE(split_publisher("Mozilla.Firefox", publisher, app));
    CHECK(publisher == "Mozilla");
    CHECK(app == "Firefox");

    CHECK_FALSE(split_publisher("XboxApp", publisher, app));
    CHECK_FALSE(split_publisher(".Firefox", publisher, app));
}

TEST_CASE("exact match takes precedence") {
    std::vector<InventoryItem> items = {item("Google.Chrome", Origin::PackageManagerA)};
    auto matches = match(items, {"Google.Chrome"});

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].strategy == MatchStrategy::Exact);
    CHECK(matches[0].pattern == "Google.Chrome");
    CHECK(matches[0].matched_identifier == "Google.Chrome");
}

TEST_CASE("exact match is case-insensitive and uses alternates") {
    std::vector<InventoryItem> items = {item("Google Chrome", Origin::PackageManagerA, {"Google.Chrome"})};
    auto matches = match(items, {"GOOGLE.CHROME"});

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].strategy == MatchStrategy::Exact);
    CHECK(matches[0].matched_identifier == "Google.Chrome");
}

TEST_CASE("normalized match ignores separators") {
    std::vector<InventoryItem> items = {item("Google Chrome", Origin::RegistryUninstall)};
    auto matches = match(items, {"Google.Chrome"});

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].strategy == MatchStrategy::Normalized);
}

TEST_CASE("partial publisher match") {
    std::vector<InventoryItem> items = {item("Mozilla Firefox ESR", Origin::RegistryUninstall)};
    auto matches = match(items, {"Mozilla.Firefox"});

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].strategy == MatchStrategy::PartialPublisher);
    CHECK(matches[0].matched_identifier == "Mozilla Firefox ESR");
}

TEST_CASE("partial publisher needs both parts") {
    std::vector<InventoryItem> items = {item("Firefox Portable", Origin::RegistryUninstall),
                                        item("Mozilla Thunderbird", Origin::RegistryUninstall)};
    CHECK(match(items, {"Mozilla.Firefox"}).empty());
}

TEST_CASE("best strategy wins within one pattern") {
    // The normalized hit on the name must not shadow the exact hit on the id
    std::vector<InventoryItem> items = {item("Google Chrome", Origin::PackageManagerA, {"Google.Chrome"})};
    auto matches = match(items, {"google.chrome"});
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].strategy == MatchStrategy::Exact);
}

TEST_CASE("first matching pattern wins") {
    std::vector<InventoryItem> items = {item("Microsoft.XboxApp")};
    auto matches = match(items, {"Xbox*", "Microsoft.XboxApp"});

    // "Xbox*" does not match "Microsoft.XboxApp" (anchored glob), so the
    // exact pattern claims the item
    REQUIRE(matches.size() == 1);
    CHECK(matches[0].pattern == "Microsoft.XboxApp");

    auto wildcard_first = match(items, {"Microsoft.Xbox*", "Microsoft.XboxApp"});
    REQUIRE(wildcard_first.size() == 1);
    CHECK(wildcard_first[0].pattern == "Microsoft.Xbox*");
    CHECK(wildcard_first[0].strategy == MatchStrategy::Exact);
}

TEST_CASE("wildcard patterns match many items") {
    std::vector<InventoryItem> items = {
        item("McAfee LiveSafe", Origin::RegistryUninstall),
        item("Google Chrome", Origin::PackageManagerA),
        item("McAfee WebAdvisor", Origin::RegistryUninstall),
    };
    auto matches = match(items, {"McAfee*"});

    REQUIRE(matches.size() == 2);
    CHECK(matches[0].item.primary_name == "McAfee LiveSafe");
    CHECK(matches[1].item.primary_name == "McAfee WebAdvisor");
}

TEST_CASE("wildcard on normalized form") {
    std::vector<InventoryItem> items = {item("Candy Crush Saga", Origin::OSPackage)};
    auto matches = match(items, {"CandyCrush*"});

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].strategy == MatchStrategy::Normalized);
}

TEST_CASE("results follow inventory order and each item appears once") {
    std::vector<InventoryItem> items = {
        item("Microsoft.ZuneMusic"),
        item("Microsoft.BingNews"),
        item("Microsoft.ZuneVideo"),
    };
    auto matches = match(items, {"Microsoft.BingNews", "Microsoft.Zune*", "Microsoft.ZuneMusic"});

    REQUIRE(matches.size() == 3);
    CHECK(matches[0].item.primary_name == "Microsoft.ZuneMusic");
    CHECK(matches[0].pattern == "Microsoft.Zune*");
    CHECK(matches[1].item.primary_name == "Microsoft.BingNews");
    CHECK(matches[2].item.primary_name == "Microsoft.ZuneVideo");
}

TEST_CASE("protected patterns exclude items") {
    std::vector<InventoryItem> items = {
        item("Microsoft.WindowsStore"),
        item("Microsoft.XboxApp"),
    };
    auto matches = match(items, {"Microsoft.*"}, {"Microsoft.WindowsStore"});

    REQUIRE(matches.size() == 1);
    CHECK(matches[0].item.primary_name == "Microsoft.XboxApp");
}

TEST_CASE("empty inputs") {
    std::vector<InventoryItem> items = {item("XboxApp")};
    CHECK(match({}, {"XboxApp"}).empty());
    CHECK(match(items, {}).empty());
    CHECK(match(items, {"", "   "}).empty());
}

TEST_CASE("find_unmatched_patterns") {
    std::vector<InventoryItem> items = {
        item("Google Chrome", Origin::RegistryUninstall),
        item("Mozilla Firefox (x64 en-US)", Origin::RegistryUninstall),
    };
    auto missing = find_unmatched_patterns(items, {"Google.Chrome", "Mozilla.Firefox", "VideoLAN.VLC"});

    REQUIRE(missing.size() == 1);
    CHECK(missing[0] == "VideoLAN.VLC");
}
