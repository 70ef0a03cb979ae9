/**
 * sweep CLI - snapshot command
 *
 * Show or clear the removal / requirement snapshots.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace sweep::cli::commands {

namespace {

struct SnapshotOptions {
    std::string purpose;
};

std::optional<SnapshotStore> open_store(const GlobalOptions& opts, const std::string& purpose_name,
                                        WarningCollector& warnings) {
    auto purpose = parse_snapshot_purpose(purpose_name);
    if (!purpose) {
        print_error("unknown snapshot: " + purpose_name + " (expected removal or requirement)", opts.json);
        return std::nullopt;
    }

    auto loaded = load_config(opts, warnings);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return std::nullopt;
    }

    const auto& paths = loaded.config.paths;
    return SnapshotStore(*purpose == SnapshotPurpose::Removal ? paths.removal_snapshot
                                                              : paths.requirement_snapshot,
                         *purpose);
}

int cmd_snapshot_show(const GlobalOptions& opts, const SnapshotOptions& snap_opts) {
    setup_logging(opts, "warn");

    WarningCollector warnings;
    auto store = open_store(opts, snap_opts.purpose, warnings);
    if (!store) {
        return 1;
    }

    auto loaded = store->load_detailed();
    const char* state = "missing";
    if (loaded.state == SnapshotLoadResult::State::Loaded) state = "loaded";
    if (loaded.state == SnapshotLoadResult::State::Corrupt) state = "corrupt";

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["purpose"] = snapshot_purpose_to_string(store->purpose());
        j["path"] = store->path();
        j["state"] = state;
        if (!loaded.error.empty()) {
            j["error"] = loaded.error;
        }
        if (loaded.identifiers) {
            j["captured_at"] = loaded.captured_at;
            j["identifiers"] = loaded.identifiers->sorted();
        }
        output_json(j);
        return 0;
    }

    std::cout << "Snapshot: " << snapshot_purpose_to_string(store->purpose()) << std::endl;
    std::cout << "Path:     " << store->path() << std::endl;
    std::cout << "State:    " << state << std::endl;
    if (!loaded.error.empty()) {
        std::cout << "Error:    " << loaded.error << std::endl;
    }
    if (loaded.identifiers) {
        std::cout << "Captured: " << loaded.captured_at << std::endl;
        std::cout << "Identifiers (" << loaded.identifiers->size() << "):" << std::endl;
        for (const auto& id : loaded.identifiers->sorted()) {
            std::cout << "  " << id << std::endl;
        }
    }
    return 0;
}

int cmd_snapshot_clear(const GlobalOptions& opts, const SnapshotOptions& snap_opts) {
    setup_logging(opts, "warn");

    WarningCollector warnings;
    auto store = open_store(opts, snap_opts.purpose, warnings);
    if (!store) {
        return 1;
    }

    auto cleared = store->clear();
    if (cleared.isErr()) {
        print_error(cleared.error().toString(), opts.json);
        return 1;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"cleared", store->path()}});
    } else if (!opts.quiet) {
        std::cout << "Cleared " << snapshot_purpose_to_string(store->purpose())
                  << " snapshot; the next run processes every item" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_snapshot(CLI::App* app, GlobalOptions& opts) {
    static SnapshotOptions show_opts;
    static SnapshotOptions clear_opts;

    app->require_subcommand(1);

    auto* show = app->add_subcommand("show", "Print a snapshot");
    show->add_option("purpose", show_opts.purpose, "removal | requirement")->required();
    show->callback([&opts]() {
        std::exit(cmd_snapshot_show(opts, show_opts));
    });

    auto* clear = app->add_subcommand("clear", "Delete a snapshot so the next run reprocesses everything");
    clear->add_option("purpose", clear_opts.purpose, "removal | requirement")->required();
    clear->callback([&opts]() {
        std::exit(cmd_snapshot_clear(opts, clear_opts));
    });
}

} // namespace sweep::cli::commands
