#include <doctest/doctest.h>
#include <sweep/methods.hpp>

#include "../test_helpers.hpp"

#include <fstream>

using namespace sweep;
using sweep::test::FakeSource;
using sweep::test::ScriptedRunner;
using sweep::test::TempTestDir;
using sweep::test::item;

namespace {

std::vector<std::string> method_names(const MethodTable& table, Origin origin, ActionMode mode) {
    std::vector<std::string> names;
    for (const auto& m : table.methods(origin, mode)) {
        names.push_back(m.name);
    }
    return names;
}

InventoryItem with_metadata(InventoryItem i, std::map<std::string, std::string> metadata) {
    i.origin_metadata = std::move(metadata);
    return i;
}

} // namespace

TEST_CASE("powershell_quote") {
    CHECK(powershell_quote("Microsoft.XboxApp") == "'Microsoft.XboxApp'");
    CHECK(powershell_quote("O'Reilly Reader") == "'O''Reilly Reader'");
    CHECK(powershell_quote("") == "''");
}

TEST_CASE("silent_uninstall_command") {
    CHECK(silent_uninstall_command("MsiExec.exe /I{1234-ABCD}") == "MsiExec.exe /X{1234-ABCD} /qn /norestart");
    CHECK(silent_uninstall_command("msiexec /x{1234} /qn") == "msiexec /x{1234} /qn /norestart");
    CHECK(silent_uninstall_command("\"C:\\Program Files\\App\\uninst.exe\" /S") ==
          "\"C:\\Program Files\\App\\uninst.exe\" /S");
}

TEST_CASE("registry_key_from_ps_path") {
    CHECK(registry_key_from_ps_path(
              "Microsoft.PowerShell.Core\\Registry::HKEY_LOCAL_MACHINE\\Software\\Uninstall\\App") ==
          "HKEY_LOCAL_MACHINE\\Software\\Uninstall\\App");
    CHECK(registry_key_from_ps_path("HKEY_CURRENT_USER\\X") == "HKEY_CURRENT_USER\\X");
}

TEST_CASE("default method table order") {
    ScriptedRunner runner;
    auto table = default_method_table(runner, Timeouts{});

    CHECK(method_names(table, Origin::PackageManagerA, ActionMode::Remove) ==
          std::vector<std::string>{"winget-uninstall", "registry-uninstall-string"});
    CHECK(method_names(table, Origin::OSPackage, ActionMode::Remove) ==
          std::vector<std::string>{"remove-appx-package", "remove-provisioned-package", "dism-remove-provisioned"});
    CHECK(method_names(table, Origin::RegistryUninstall, ActionMode::Remove) ==
          std::vector<std::string>{"quiet-uninstall-string", "uninstall-string", "registry-key-delete"});
    CHECK(method_names(table, Origin::Service, ActionMode::Remove) ==
          std::vector<std::string>{"stop-and-disable", "delete-service"});
    CHECK(method_names(table, Origin::PackageManagerA, ActionMode::Install) ==
          std::vector<std::string>{"winget-install", "choco-install"});

    for (Origin o : all_origins()) {
        CHECK_MESSAGE(!table.methods(o, ActionMode::Remove).empty(), origin_to_string(o));
    }
    CHECK(table.methods(Origin::Service, ActionMode::Install).empty());

    auto groups = table.lock_groups();
    CHECK(groups.count("winget") == 1);
    CHECK(groups.count("choco") == 1);
    CHECK(groups.count("dism") == 1);
}

TEST_CASE("winget uninstall command") {
    ScriptedRunner runner;
    Timeouts timeouts;
    timeouts.package = std::chrono::seconds(90);
    auto table = default_method_table(runner, timeouts);

    auto chrome = with_metadata(item("Google Chrome", Origin::PackageManagerA), {{"Id", "Google.Chrome"}});
    auto result = table.methods(Origin::PackageManagerA, ActionMode::Remove)[0].run(chrome);
    CHECK(result.ok);

    auto calls = runner.calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].program == "winget");
    REQUIRE(calls[0].args.size() >= 3);
    CHECK(calls[0].args[0] == "uninstall");
    CHECK(calls[0].args[1] == "--id");
    CHECK(calls[0].args[2] == "Google.Chrome");
    CHECK(calls[0].timeout.count() == 90);
}

TEST_CASE("DISM methods use the servicing timeout and accept reboot-required") {
    ScriptedRunner runner([](const CommandSpec&) { return ScriptedRunner::exit_with(3010); });
    Timeouts timeouts;
    timeouts.servicing = std::chrono::seconds(1200);
    auto table = default_method_table(runner, timeouts);

    auto feature = with_metadata(item("Internet Explorer", Origin::WindowsFeature),
                                 {{"FeatureName", "Internet-Explorer-Optional-amd64"}});
    auto result = table.methods(Origin::WindowsFeature, ActionMode::Remove)[0].run(feature);
    CHECK(result.ok);

    auto calls = runner.calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].program == "dism.exe");
    CHECK(calls[0].timeout.count() == 1200);
    CHECK(calls[0].args[2] == "/FeatureName:Internet-Explorer-Optional-amd64");
}

TEST_CASE("command failures are described") {
    SUBCASE("exit code with stderr") {
        ScriptedRunner runner([](const CommandSpec&) {
            return ScriptedRunner::exit_with(1603, "", "Fatal error during installation.\nmore");
        });
        auto table = default_method_table(runner, Timeouts{});
        auto result = table.methods(Origin::Service, ActionMode::Remove)[1].run(item("XblGameSave", Origin::Service));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "exit code 1603: Fatal error during installation.");
    }

    SUBCASE("timeout") {
        ScriptedRunner runner([](const CommandSpec&) {
            CommandResult r;
            r.timed_out = true;
            return r;
        });
        auto table = default_method_table(runner, Timeouts{});
        auto result = table.methods(Origin::Service, ActionMode::Remove)[1].run(item("XblGameSave", Origin::Service));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "timed out after 300s");
    }

    SUBCASE("missing metadata skips the command") {
        ScriptedRunner runner;
        auto table = default_method_table(runner, Timeouts{});
        auto result = table.methods(Origin::RegistryUninstall, ActionMode::Remove)[0].run(
            item("Contoso Toolbar", Origin::RegistryUninstall));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "no QuietUninstallString");
        CHECK(runner.calls().empty());
    }
}

TEST_CASE("uninstall string is made silent") {
    ScriptedRunner runner;
    auto table = default_method_table(runner, Timeouts{});
    auto entry = with_metadata(item("Contoso Toolbar", Origin::RegistryUninstall),
                               {{"UninstallString", "MsiExec.exe /I{AAAA}"}});

    auto result = table.methods(Origin::RegistryUninstall, ActionMode::Remove)[1].run(entry);
    CHECK(result.ok);
    auto calls = runner.calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].program == "cmd.exe");
    CHECK(calls[0].args[1] == "MsiExec.exe /X{AAAA} /qn /norestart");
}

TEST_CASE("shortcut deletion removes the file") {
    TempTestDir dir;
    std::string path = dir.file("Candy Crush.lnk");
    {
        std::ofstream out(path);
        out << "lnk";
    }

    ScriptedRunner runner;
    auto table = default_method_table(runner, Timeouts{});
    auto shortcut = with_metadata(item("Candy Crush", Origin::StartMenuShortcut), {{"FullName", path}});

    auto result = table.methods(Origin::StartMenuShortcut, ActionMode::Remove)[0].run(shortcut);
    CHECK(result.ok);
    CHECK_FALSE(std::filesystem::exists(path));
    CHECK(runner.calls().empty());
}

TEST_CASE("SourceVerifier for removal") {
    std::vector<std::unique_ptr<InventorySource>> sources;
    auto appx = std::make_unique<FakeSource>(
        "appx", Origin::OSPackage,
        std::vector<RawRecord>{test::record(Origin::OSPackage, {{"Name", "Microsoft.XboxApp"}})});
    FakeSource* appx_ptr = appx.get();
    sources.push_back(std::move(appx));

    SourceVerifier verifier(sources);
    auto xbox = item("Microsoft.XboxApp");

    CHECK(verifier.is_present(xbox, ActionMode::Remove) == std::optional<bool>(true));

    appx_ptr->remove_where("Name", "Microsoft.XboxApp");
    CHECK(verifier.is_present(xbox, ActionMode::Remove) == std::optional<bool>(false));

    appx_ptr->set_available(false);
    CHECK_FALSE(verifier.is_present(xbox, ActionMode::Remove).has_value());

    // No source for the origin at all
    CHECK_FALSE(verifier.is_present(item("XblAuthManager", Origin::Service), ActionMode::Remove).has_value());
}

TEST_CASE("SourceVerifier for installation") {
    std::vector<std::unique_ptr<InventorySource>> sources;
    auto registry = std::make_unique<FakeSource>("uninstall-registry", Origin::RegistryUninstall);
    FakeSource* registry_ptr = registry.get();
    sources.push_back(std::move(registry));

    SourceVerifier verifier(sources);
    auto vlc = item("VideoLAN.VLC", Origin::PackageManagerA);

    CHECK(verifier.is_present(vlc, ActionMode::Install) == std::optional<bool>(false));

    registry_ptr->add({{"DisplayName", "VLC media player"}});
    // "VLC media player" does not carry the publisher
    CHECK(verifier.is_present(vlc, ActionMode::Install) == std::optional<bool>(false));

    registry_ptr->add({{"DisplayName", "VideoLAN VLC 3.0.20"}});
    CHECK(verifier.is_present(vlc, ActionMode::Install) == std::optional<bool>(true));
}

TEST_CASE("SourceVerifier does not trust a partial listing") {
    std::vector<std::unique_ptr<InventorySource>> sources;
    auto hklm = std::make_unique<FakeSource>("hklm-uninstall", Origin::RegistryUninstall);
    auto hkcu = std::make_unique<FakeSource>(
        "hkcu-uninstall", Origin::RegistryUninstall,
        std::vector<RawRecord>{test::record(Origin::RegistryUninstall, {{"DisplayName", "Unrelated"}})});
    hklm->set_available(false);
    FakeSource* hkcu_ptr = hkcu.get();
    sources.push_back(std::move(hklm));
    sources.push_back(std::move(hkcu));

    SourceVerifier verifier(sources);

    SUBCASE("removal") {
        auto mcafee = item("McAfee Security", Origin::RegistryUninstall);
        CHECK_FALSE(verifier.is_present(mcafee, ActionMode::Remove).has_value());
    }

    SUBCASE("installation") {
        auto vlc = item("VideoLAN.VLC", Origin::PackageManagerA);
        CHECK_FALSE(verifier.is_present(vlc, ActionMode::Install).has_value());

        hkcu_ptr->add({{"DisplayName", "VideoLAN VLC 3.0.20"}});
        CHECK(verifier.is_present(vlc, ActionMode::Install) == std::optional<bool>(true));
    }
}

TEST_CASE("SourceVerifier checks removal by origin-specific id") {
    std::vector<std::unique_ptr<InventorySource>> sources;
    auto shortcuts = std::make_unique<FakeSource>(
        "start-menu", Origin::StartMenuShortcut,
        std::vector<RawRecord>{test::record(Origin::StartMenuShortcut,
                                            {{"BaseName", "Candy Crush"}, {"FullName", "C:/Users/a/Candy Crush.lnk"}})});
    sources.push_back(std::move(shortcuts));
    SourceVerifier verifier(sources);

    // The twin under ProgramData is gone; the one under the profile remains
    auto removed = with_metadata(item("Candy Crush", Origin::StartMenuShortcut, {"C:/ProgramData/Candy Crush.lnk"}),
                                 {{"BaseName", "Candy Crush"}, {"FullName", "C:/ProgramData/Candy Crush.lnk"}});
    CHECK(verifier.is_present(removed, ActionMode::Remove) == std::optional<bool>(false));

    auto remaining = with_metadata(item("Candy Crush", Origin::StartMenuShortcut, {"C:/Users/a/Candy Crush.lnk"}),
                                   {{"BaseName", "Candy Crush"}, {"FullName", "C:/Users/a/Candy Crush.lnk"}});
    CHECK(verifier.is_present(remaining, ActionMode::Remove) == std::optional<bool>(true));
}
