#include <doctest/doctest.h>
#include <sweep/snapshot.hpp>
#include <sweep/platform.hpp>

#include "../test_helpers.hpp"

#include <filesystem>
#include <fstream>

using namespace sweep;
using sweep::test::TempTestDir;

namespace {

void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

size_t count_files(const std::string& dir) {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("snapshot round-trips as a set") {
    TempTestDir dir;
    SnapshotStore store(dir.file("removal.snapshot.json"), SnapshotPurpose::Removal);

    SUBCASE("non-empty set") {
        auto set = CanonicalIdentifierSet::from_strings({"Microsoft.XboxApp", "Google.Chrome", "7-Zip 23.01"});
        REQUIRE(store.save(set).isOk());

        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        CHECK(*loaded == set);
    }

    SUBCASE("empty set") {
        REQUIRE(store.save(CanonicalIdentifierSet()).isOk());

        auto detailed = store.load_detailed();
        CHECK(detailed.state == SnapshotLoadResult::State::Loaded);
        REQUIRE(detailed.identifiers.has_value());
        CHECK(detailed.identifiers->empty());
        CHECK_FALSE(detailed.captured_at.empty());
    }

    SUBCASE("save replaces previous content") {
        REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"A", "B"})).isOk());
        REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"C"})).isOk());

        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        CHECK(*loaded == CanonicalIdentifierSet::from_strings({"C"}));
    }
}

TEST_CASE("snapshot save leaves no temporary files") {
    TempTestDir dir;
    SnapshotStore store(dir.file("removal.snapshot.json"), SnapshotPurpose::Removal);

    REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"A"})).isOk());
    REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"B"})).isOk());
    CHECK(count_files(dir.path) == 1);
}

TEST_CASE("snapshot save creates the state directory") {
    TempTestDir dir;
    SnapshotStore store(dir.file("state/nested/requirement.snapshot.json"), SnapshotPurpose::Requirement);

    REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"VideoLAN.VLC"})).isOk());
    CHECK(store.load().has_value());
}

TEST_CASE("missing snapshot behaves as first run") {
    TempTestDir dir;
    SnapshotStore store(dir.file("absent.json"), SnapshotPurpose::Removal);

    CHECK(store.load_detailed().state == SnapshotLoadResult::State::Missing);
    CHECK_FALSE(store.load().has_value());
}

TEST_CASE("corrupt snapshot fails open") {
    TempTestDir dir;
    std::string path = dir.file("removal.snapshot.json");
    SnapshotStore store(path, SnapshotPurpose::Removal);

    SUBCASE("truncated JSON") {
        write_text(path, "{\"$schema\": \"sweep.snapshot.v1\", \"identif");
    }
    SUBCASE("wrong schema") {
        write_text(path, R"({"$schema": "other", "purpose": "removal", "identifiers": []})");
    }
    SUBCASE("non-string identifier") {
        write_text(path, R"({"$schema": "sweep.snapshot.v1", "purpose": "removal", "identifiers": [1]})");
    }
    SUBCASE("array instead of object") {
        write_text(path, R"(["XboxApp"])");
    }

    auto detailed = store.load_detailed();
    CHECK(detailed.state == SnapshotLoadResult::State::Corrupt);
    CHECK_FALSE(detailed.error.empty());
    CHECK_FALSE(store.load().has_value());
}

TEST_CASE("snapshot purposes are not interchangeable") {
    TempTestDir dir;
    std::string path = dir.file("shared.json");

    SnapshotStore removal(path, SnapshotPurpose::Removal);
    REQUIRE(removal.save(CanonicalIdentifierSet::from_strings({"A"})).isOk());

    SnapshotStore requirement(path, SnapshotPurpose::Requirement);
    CHECK(requirement.load_detailed().state == SnapshotLoadResult::State::Corrupt);
}

TEST_CASE("serialize_snapshot writes sorted identifiers") {
    auto text = serialize_snapshot(CanonicalIdentifierSet::from_strings({"b", "A"}),
                                   SnapshotPurpose::Requirement, "2024-01-01T00:00:00Z");
    CHECK(text.find("sweep.snapshot.v1") != std::string::npos);
    CHECK(text.find("\"requirement\"") != std::string::npos);
    CHECK(text.find("\"A\"") < text.find("\"b\""));

    auto parsed = parse_snapshot(text, SnapshotPurpose::Requirement);
    CHECK(parsed.state == SnapshotLoadResult::State::Loaded);
    CHECK(parsed.captured_at == "2024-01-01T00:00:00Z");
}

#ifndef _WIN32
TEST_CASE("failed save keeps the previous snapshot") {
    TempTestDir dir;
    std::string state = dir.file("state");
    std::filesystem::create_directories(state);
    std::string path = state + "/removal.snapshot.json";

    SnapshotStore store(path, SnapshotPurpose::Removal);
    REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"Keep"})).isOk());

    // A read-only directory makes the temp-file write fail
    std::filesystem::permissions(state, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec);
    auto result = store.save(CanonicalIdentifierSet::from_strings({"Lost"}));
    std::filesystem::permissions(state, std::filesystem::perms::owner_all);

    if (result.isErr()) {
        CHECK(result.error().code() == ErrorCode::SNAPSHOT_WRITE_FAILED);
        auto loaded = store.load();
        REQUIRE(loaded.has_value());
        CHECK(*loaded == CanonicalIdentifierSet::from_strings({"Keep"}));
    }
}
#endif

TEST_CASE("clear removes the snapshot") {
    TempTestDir dir;
    SnapshotStore store(dir.file("removal.snapshot.json"), SnapshotPurpose::Removal);

    CHECK(store.clear().isOk());  // nothing to clear
    REQUIRE(store.save(CanonicalIdentifierSet::from_strings({"A"})).isOk());
    CHECK(store.clear().isOk());
    CHECK(store.load_detailed().state == SnapshotLoadResult::State::Missing);
}

TEST_CASE("parse_snapshot_purpose") {
    CHECK(parse_snapshot_purpose("removal") == SnapshotPurpose::Removal);
    CHECK(parse_snapshot_purpose("Requirement") == SnapshotPurpose::Requirement);
    CHECK_FALSE(parse_snapshot_purpose("other").has_value());
}

TEST_CASE("save tolerates identifiers that are not valid UTF-8") {
    TempTestDir dir;
    SnapshotStore store(dir.file("removal.snapshot.json"), SnapshotPurpose::Removal);

    auto set = CanonicalIdentifierSet::from_strings({"Caf\xe9-tools", "Google.Chrome"});
    auto saved = store.save(set);
    REQUIRE(saved.isOk());

    auto loaded = store.load();
    REQUIRE(loaded.has_value());
    CHECK(loaded->size() == 2);
    CHECK(loaded->contains("Google.Chrome"));
}
