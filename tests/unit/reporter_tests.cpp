#include <doctest/doctest.h>
#include <sweep/reporter.hpp>
#include <sweep/platform.hpp>
#include <sweep/warnings.hpp>

#include "../test_helpers.hpp"

#include <fstream>

using namespace sweep;
using sweep::test::TempTestDir;
using sweep::test::item;

namespace {

ActionOutcome outcome(const std::string& name, OutcomeStatus status, const std::string& method = "") {
    ActionOutcome o;
    o.item = item(name);
    o.status = status;
    o.method_used = method;
    return o;
}

} // namespace

TEST_CASE("summarize counts each status") {
    std::vector<ActionOutcome> outcomes = {
        outcome("A", OutcomeStatus::Success, "remove-appx-package"),
        outcome("B", OutcomeStatus::Success, "remove-appx-package"),
        outcome("C", OutcomeStatus::Success, "dism-remove-provisioned"),
        outcome("D", OutcomeStatus::Partial, "remove-appx-package"),
        outcome("E", OutcomeStatus::Failed),
        outcome("F", OutcomeStatus::Skipped, "dry-run"),
    };

    auto summary = summarize(outcomes);
    CHECK(summary.succeeded == 3);
    CHECK(summary.partial == 1);
    CHECK(summary.failed == 1);
    CHECK(summary.skipped == 1);
    CHECK(summary.total() == outcomes.size());
    CHECK(summary.by_method.at("remove-appx-package") == 2);
    CHECK(summary.by_method.at("dism-remove-provisioned") == 1);
    CHECK(summary.by_method.count("dry-run") == 0);
}

TEST_CASE("pass status") {
    PassReport pass;
    CHECK(pass.status() == "success");
    pass.summary.partial = 1;
    CHECK(pass.status() == "warning");
    pass.summary.failed = 1;
    CHECK(pass.status() == "error");
}

TEST_CASE("diff_stats") {
    auto current = CanonicalIdentifierSet::from_strings({"A", "B"});
    auto delta = diff(current, CanonicalIdentifierSet::from_strings({"B", "C", "D"}));
    auto stats = diff_stats(current, delta);

    CHECK(stats.current == 2);
    CHECK(stats.newly_observed == 1);
    CHECK(stats.previously_observed == 2);
    CHECK(stats.unchanged == 1);
    CHECK_FALSE(stats.first_run);
}

TEST_CASE("report_to_json") {
    RunReport report;
    report.started_at = "2024-05-01T10:00:00Z";
    report.finished_at = "2024-05-01T10:02:00Z";
    report.sources_total = 10;
    report.sources_available = 7;

    PassReport removal;
    removal.name = "bloatware_removal";
    removal.mode = ActionMode::Remove;
    removal.matches.push_back(test::match_for(item("Microsoft.XboxApp"), "Microsoft.XboxApp"));
    auto done = outcome("Microsoft.XboxApp", OutcomeStatus::Success, "remove-appx-package");
    done.attempts.push_back({"remove-appx-package", true, true, ""});
    removal.outcomes.push_back(done);
    removal.summary = summarize(removal.outcomes);
    removal.persisted = true;

    PassReport install;
    install.name = "essential_apps";
    install.mode = ActionMode::Install;
    install.missing = {"VideoLAN.VLC"};
    auto failed = outcome("VideoLAN.VLC", OutcomeStatus::Failed);
    failed.error = "exit code 1";
    install.outcomes.push_back(failed);
    install.summary = summarize(install.outcomes);

    report.passes = {removal, install};
    report.warnings.push_back({"source_unavailable", "warn", {{"source", "choco"}}});

    auto j = report_to_json(report);
    CHECK(j["sources"]["total"] == 10);
    CHECK(j["sources"]["available"] == 7);
    REQUIRE(j["modules"].size() == 2);

    const auto& r = j["modules"][0];
    CHECK(r["module"] == "bloatware_removal");
    CHECK(r["status"] == "success");
    CHECK(r["matches"][0]["strategy"] == "exact");
    CHECK(r["items"][0]["method"] == "remove-appx-package");
    CHECK(r["items"][0]["attempts"][0]["verified"] == true);
    CHECK(r["persisted"] == true);
    CHECK_FALSE(r.contains("missing"));

    const auto& i = j["modules"][1];
    CHECK(i["status"] == "error");
    CHECK(i["missing"][0] == "VideoLAN.VLC");
    CHECK(i["items"][0]["error"] == "exit code 1");

    CHECK(j["summary"]["total"] == 2);
    CHECK(j["summary"]["succeeded"] == 1);
    CHECK(j["summary"]["failed"] == 1);
    REQUIRE(j["warnings"].size() == 1);
    CHECK(j["warnings"][0]["fields"]["source"] == "choco");
}

TEST_CASE("write_audit") {
    TempTestDir dir;
    RunReport report;
    report.started_at = "2024-05-01T10:00:00Z";

    std::string path = dir.file("logs/audit.json");
    REQUIRE(write_audit(report, path).isOk());

    auto content = read_file(path);
    REQUIRE(content.has_value());
    auto j = nlohmann::json::parse(*content);
    CHECK(j["started_at"] == "2024-05-01T10:00:00Z");
}

TEST_CASE("ConvergenceReporter persists the current set") {
    TempTestDir dir;
    SnapshotStore store(dir.file("removal.snapshot.json"), SnapshotPurpose::Removal);
    WarningCollector warnings;
    ConvergenceReporter reporter(store, warnings);

    auto current = CanonicalIdentifierSet::from_strings({"Microsoft.XboxApp", "Google.Chrome"});
    CHECK(reporter.persist(current));
    CHECK(warnings.count(Warning::persistence_failed) == 0);

    auto loaded = store.load();
    REQUIRE(loaded.has_value());
    CHECK(*loaded == current);
}

TEST_CASE("ConvergenceReporter reports a failed save") {
    TempTestDir dir;
    // A regular file where the state directory should be
    std::string blocker = dir.file("state");
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    SnapshotStore store(blocker + "/removal.snapshot.json", SnapshotPurpose::Removal);
    WarningCollector warnings;
    ConvergenceReporter reporter(store, warnings);

    CHECK_FALSE(reporter.persist(CanonicalIdentifierSet::from_strings({"A"})));
    CHECK(warnings.count(Warning::persistence_failed) == 1);
}

TEST_CASE("write_audit tolerates identifiers that are not valid UTF-8") {
    TempTestDir dir;
    RunReport report;
    PassReport removal;
    removal.name = "bloatware_removal";
    removal.outcomes.push_back(outcome("Caf\xe9-tools", OutcomeStatus::Failed));
    removal.summary = summarize(removal.outcomes);
    report.passes.push_back(removal);

    std::string path = dir.file("audit.json");
    REQUIRE(write_audit(report, path).isOk());

    auto content = read_file(path);
    REQUIRE(content.has_value());
    auto j = nlohmann::json::parse(*content);
    CHECK(j["modules"][0]["items"].size() == 1);
}
