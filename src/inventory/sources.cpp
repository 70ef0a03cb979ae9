#include "sweep/inventory.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/platform.hpp"
#include "sweep/warnings.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace sweep {

namespace {

RawRecord record_from_object(const nlohmann::json& obj, Origin origin) {
    RawRecord record;
    record.origin = origin;
    for (auto& [key, val] : obj.items()) {
        if (val.is_string()) {
            record.fields[key] = val.get<std::string>();
        } else if (val.is_boolean()) {
            record.fields[key] = val.get<bool>() ? "true" : "false";
        } else if (val.is_number()) {
            record.fields[key] = val.dump();
        }
    }
    return record;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace

CollectResult parse_json_records(const std::string& text, Origin origin) {
    CollectResult result;

    // Tools print nothing at all when the listing is empty
    if (trim(text).empty()) {
        result.ok = true;
        return result;
    }

    try {
        auto j = nlohmann::json::parse(text);

        if (j.is_object()) {
            result.records.push_back(record_from_object(j, origin));
        } else if (j.is_array()) {
            for (const auto& elem : j) {
                if (elem.is_object()) {
                    result.records.push_back(record_from_object(elem, origin));
                }
            }
        } else {
            result.error = "expected a JSON array or object";
            return result;
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

CollectResult parse_pipe_records(const std::string& text, Origin origin,
                                 const std::vector<std::string>& columns) {
    CollectResult result;
    std::vector<std::string> names = columns.empty() ? std::vector<std::string>{"Name"} : columns;

    // Console output arrives in the active code page, not necessarily UTF-8
    std::istringstream stream(repair_utf8(text));
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) continue;

        auto parts = split(line, '|');
        RawRecord record;
        record.origin = origin;
        for (size_t i = 0; i < parts.size() && i < names.size(); ++i) {
            std::string value = trim(parts[i]);
            if (!value.empty()) {
                record.fields[names[i]] = value;
            }
        }
        result.records.push_back(std::move(record));
    }

    result.ok = true;
    return result;
}

CommandInventorySource::CommandInventorySource(SourceDefinition definition,
                                               CommandRunner& runner,
                                               std::chrono::seconds timeout)
    : definition_(std::move(definition)), runner_(runner), timeout_(timeout) {}

CollectResult CommandInventorySource::collect() {
    CommandSpec spec;
    spec.program = definition_.program;
    spec.args = definition_.args;
    spec.timeout = timeout_;

    spdlog::debug("Collecting inventory from {}: {}", definition_.name, describe_command(spec));

    auto run = runner_.run(spec);
    if (!run.succeeded()) {
        CollectResult result;
        if (run.timed_out) {
            result.error = "timed out";
        } else if (!run.error.empty()) {
            result.error = run.error;
        } else {
            result.error = "exit code " + std::to_string(run.exit_code);
        }
        return result;
    }

    if (definition_.format == SourceFormat::Pipe) {
        return parse_pipe_records(run.stdout_text, definition_.origin, definition_.columns);
    }
    return parse_json_records(run.stdout_text, definition_.origin);
}

JsonFileInventorySource::JsonFileInventorySource(SourceDefinition definition)
    : definition_(std::move(definition)) {}

CollectResult JsonFileInventorySource::collect() {
    auto content = read_file(definition_.path);
    if (!content) {
        CollectResult result;
        result.error = "cannot read " + definition_.path;
        return result;
    }

    if (definition_.format == SourceFormat::Pipe) {
        return parse_pipe_records(*content, definition_.origin, definition_.columns);
    }
    return parse_json_records(*content, definition_.origin);
}

std::vector<std::unique_ptr<InventorySource>> make_sources(const Config& config,
                                                           CommandRunner& runner) {
    std::vector<std::unique_ptr<InventorySource>> sources;
    for (const auto& def : config.sources) {
        if (!def.enabled) continue;
        if (!def.program.empty()) {
            sources.push_back(std::make_unique<CommandInventorySource>(def, runner, config.timeouts.query));
        } else {
            sources.push_back(std::make_unique<JsonFileInventorySource>(def));
        }
    }
    return sources;
}

CollectionSummary collect_all(const std::vector<std::unique_ptr<InventorySource>>& sources,
                              WarningCollector& warnings) {
    CollectionSummary summary;
    summary.sources_total = sources.size();

    for (const auto& source : sources) {
        auto result = source->collect();
        if (!result.ok) {
            warnings.emit(Warning::source_unavailable,
                          warnings::source_unavailable(source->name(), result.error));
            summary.per_source.emplace_back();
            continue;
        }

        spdlog::info("Source {} reported {} records", source->name(), result.records.size());
        ++summary.sources_available;
        summary.per_source.push_back(std::move(result.records));
    }

    return summary;
}

} // namespace sweep
