/**
 * sweep CLI - inventory command
 *
 * Print the normalized inventory as the matcher would see it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <map>

namespace sweep::cli::commands {

namespace {

struct InventoryOptions {
    std::string origin;
};

int cmd_inventory(const GlobalOptions& opts, const InventoryOptions& inv_opts) {
    setup_logging(opts, "info");

    WarningCollector warnings;
    auto loaded = load_config(opts, warnings);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return 1;
    }
    setup_logging(opts, loaded.config.log_level);

    std::optional<Origin> filter;
    if (!inv_opts.origin.empty()) {
        filter = parse_origin(inv_opts.origin);
        if (!filter) {
            print_error("unknown origin: " + inv_opts.origin, opts.json);
            return 1;
        }
    }

    Session session(loaded.config);
    RunContext ctx{loaded.config, session.sources, session.methods, *session.verifier, warnings};
    auto inventory = collect_inventory(ctx);
    if (inventory.isErr()) {
        print_error(inventory.error().toString(), opts.json);
        return 1;
    }

    std::vector<const InventoryItem*> items;
    for (const auto& item : inventory.value().items) {
        if (!filter || item.origin == *filter) {
            items.push_back(&item);
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["sources"] = {
            {"total", inventory.value().sources_total},
            {"available", inventory.value().sources_available},
        };
        nlohmann::json list = nlohmann::json::array();
        for (const auto* item : items) {
            nlohmann::json ij;
            ij["name"] = item->primary_name;
            ij["origin"] = origin_to_string(item->origin);
            ij["alternate_identifiers"] = item->alternate_identifiers;
            ij["metadata"] = item->origin_metadata;
            list.push_back(ij);
        }
        j["items"] = list;
        j["warnings"] = warnings_to_json(warnings);
        output_json(j);
        return 0;
    }

    std::map<std::string, size_t> per_origin;
    for (const auto* item : items) {
        std::cout << origin_to_string(item->origin) << "  " << item->primary_name;
        if (!item->alternate_identifiers.empty()) {
            std::cout << "  [";
            bool first = true;
            for (const auto& alt : item->alternate_identifiers) {
                if (!first) std::cout << ", ";
                std::cout << alt;
                first = false;
            }
            std::cout << "]";
        }
        std::cout << std::endl;
        per_origin[origin_to_string(item->origin)]++;
    }

    if (!opts.quiet) {
        std::cout << std::endl << items.size() << " items";
        for (const auto& [origin, count] : per_origin) {
            std::cout << ", " << origin << ": " << count;
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_inventory(CLI::App* app, GlobalOptions& opts) {
    static InventoryOptions inv_opts;

    app->add_option("--origin", inv_opts.origin, "Only show items of this origin (e.g. winget, appx)");

    app->callback([&opts]() {
        std::exit(cmd_inventory(opts, inv_opts));
    });
}

} // namespace sweep::cli::commands
