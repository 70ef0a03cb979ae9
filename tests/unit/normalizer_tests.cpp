#include <doctest/doctest.h>
#include <sweep/inventory.hpp>
#include <sweep/warnings.hpp>

#include "../test_helpers.hpp"

using namespace sweep;
using sweep::test::record;

TEST_CASE("parse_origin accepts enum names and aliases") {
    CHECK(parse_origin("PackageManagerA") == Origin::PackageManagerA);
    CHECK(parse_origin("winget") == Origin::PackageManagerA);
    CHECK(parse_origin("Chocolatey") == Origin::PackageManagerB);
    CHECK(parse_origin("appx") == Origin::OSPackage);
    CHECK(parse_origin("startup") == Origin::StartupEntry);
    CHECK_FALSE(parse_origin("snap").has_value());

    for (Origin o : all_origins()) {
        CHECK(parse_origin(origin_to_string(o)) == o);
    }
}

TEST_CASE("InventoryItem identifiers and key") {
    InventoryItem i = test::item("Microsoft.XboxApp", Origin::OSPackage, {"Microsoft.XboxApp_8wekyb3d8bbwe"});

    auto ids = i.identifiers();
    REQUIRE(ids.size() == 2);
    CHECK(ids[0] == "Microsoft.XboxApp");
    CHECK(i.has_identity());
    CHECK(i.key() == "OSPackage:microsoft.xboxapp|microsoft.xboxapp_8wekyb3d8bbwe");

    // Same display name, different location: two entities
    auto programdata = test::item("Candy Crush", Origin::StartMenuShortcut, {"C:/ProgramData/Candy Crush.lnk"});
    auto appdata = test::item("Candy Crush", Origin::StartMenuShortcut, {"C:/Users/a/AppData/Candy Crush.lnk"});
    CHECK(programdata.key() != appdata.key());

    InventoryItem empty;
    CHECK_FALSE(empty.has_identity());
    CHECK(empty.identifiers().empty());
}

TEST_CASE("normalize_record uses origin-specific fields") {
    SUBCASE("winget package") {
        auto item = normalize_record(record(Origin::PackageManagerA,
            {{"Name", "Google Chrome"}, {"Id", "Google.Chrome"}, {"InstalledVersion", "120.0"}}));
        REQUIRE(item.has_value());
        CHECK(item->primary_name == "Google Chrome");
        CHECK(item->alternate_identifiers == std::set<std::string>{"Google.Chrome"});
        CHECK(item->origin == Origin::PackageManagerA);
        CHECK(item->metadata("InstalledVersion") == "120.0");
    }

    SUBCASE("appx package") {
        auto item = normalize_record(record(Origin::OSPackage,
            {{"Name", "Microsoft.XboxApp"},
             {"PackageFamilyName", "Microsoft.XboxApp_8wekyb3d8bbwe"},
             {"PackageFullName", "Microsoft.XboxApp_48.1.2.0_x64__8wekyb3d8bbwe"}}));
        REQUIRE(item.has_value());
        CHECK(item->primary_name == "Microsoft.XboxApp");
        CHECK(item->alternate_identifiers.size() == 2);
        CHECK(item->alternate_identifiers.count("Microsoft.XboxApp_8wekyb3d8bbwe") == 1);
    }

    SUBCASE("service uses display name first") {
        auto item = normalize_record(record(Origin::Service,
            {{"Name", "XblAuthManager"}, {"DisplayName", "Xbox Live Auth Manager"}}));
        REQUIRE(item.has_value());
        CHECK(item->primary_name == "Xbox Live Auth Manager");
        CHECK(item->alternate_identifiers.count("XblAuthManager") == 1);
    }

    SUBCASE("field names are matched case-insensitively") {
        auto item = normalize_record(record(Origin::RegistryUninstall,
            {{"displayname", "7-Zip 23.01"}, {"pschildname", "7-Zip"}}));
        REQUIRE(item.has_value());
        CHECK(item->primary_name == "7-Zip 23.01");
        CHECK(item->alternate_identifiers.count("7-Zip") == 1);
    }

    SUBCASE("id-only record gets no primary name") {
        auto item = normalize_record(record(Origin::PackageManagerB, {{"Id", "vlc"}, {"Version", "3.0"}}));
        REQUIRE(item.has_value());
        CHECK(item->primary_name.empty());
        CHECK(item->has_identity());
        CHECK(item->identifiers() == std::vector<std::string>{"vlc"});
    }
}

TEST_CASE("normalize_record drops alternates equal to the primary name") {
    auto item = normalize_record(record(Origin::PackageManagerA, {{"Name", "7zip.7zip"}, {"Id", "7ZIP.7ZIP"}}));
    REQUIRE(item.has_value());
    CHECK(item->alternate_identifiers.empty());
}

TEST_CASE("normalize_record rejects records without identity") {
    CHECK_FALSE(normalize_record(record(Origin::Service, {})).has_value());
    CHECK_FALSE(normalize_record(record(Origin::Service, {{"Status", "Running"}})).has_value());
    CHECK_FALSE(normalize_record(record(Origin::Service, {{"Name", "   "}})).has_value());
}

TEST_CASE("normalize skips bad records and keeps sources separate") {
    std::vector<std::vector<RawRecord>> raw = {
        {record(Origin::PackageManagerA, {{"Name", "VLC media player"}, {"Id", "VideoLAN.VLC"}}),
         record(Origin::PackageManagerA, {{"Version", "1.0"}})},
        {record(Origin::RegistryUninstall, {{"DisplayName", "VLC media player"}, {"PSChildName", "VLC"}})},
    };

    WarningCollector warnings;
    auto result = normalize(raw, &warnings);

    REQUIRE(result.items.size() == 2);
    CHECK(result.skipped == 1);
    CHECK(warnings.count(Warning::record_skipped) == 1);

    // Same entity seen by two origins stays two items
    CHECK(result.items[0].origin == Origin::PackageManagerA);
    CHECK(result.items[1].origin == Origin::RegistryUninstall);
    CHECK(result.items[0].key() != result.items[1].key());
}

TEST_CASE("normalize without a collector") {
    std::vector<std::vector<RawRecord>> raw(1);
    raw[0].push_back(record(Origin::Service, {}));

    auto result = normalize(raw);
    CHECK(result.items.empty());
    CHECK(result.skipped == 1);
}
