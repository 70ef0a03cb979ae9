#include "sweep/snapshot.hpp"
#include "sweep/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sweep {

std::optional<SnapshotPurpose> parse_snapshot_purpose(const std::string& s) {
    std::string lower = fold_case(s);
    if (lower == "removal") return SnapshotPurpose::Removal;
    if (lower == "requirement") return SnapshotPurpose::Requirement;
    return std::nullopt;
}

std::string serialize_snapshot(const CanonicalIdentifierSet& set,
                               SnapshotPurpose purpose,
                               const std::string& captured_at) {
    nlohmann::json j;
    j["$schema"] = kSnapshotSchema;
    j["purpose"] = snapshot_purpose_to_string(purpose);
    j["captured_at"] = captured_at;
    j["identifiers"] = set.sorted();
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

SnapshotLoadResult parse_snapshot(const std::string& json_str, SnapshotPurpose purpose) {
    SnapshotLoadResult result;
    result.state = SnapshotLoadResult::State::Corrupt;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (!j.contains("$schema") || !j["$schema"].is_string() ||
            j["$schema"].get<std::string>() != kSnapshotSchema) {
            result.error = std::string("$schema mismatch: expected ") + kSnapshotSchema;
            return result;
        }

        if (!j.contains("purpose") || !j["purpose"].is_string() ||
            parse_snapshot_purpose(j["purpose"].get<std::string>()) != purpose) {
            result.error = std::string("purpose mismatch: expected ") + snapshot_purpose_to_string(purpose);
            return result;
        }

        if (!j.contains("identifiers") || !j["identifiers"].is_array()) {
            result.error = "identifiers missing";
            return result;
        }

        CanonicalIdentifierSet set;
        for (const auto& elem : j["identifiers"]) {
            if (!elem.is_string()) {
                result.error = "identifiers must be strings";
                return result;
            }
            set.insert(elem.get<std::string>());
        }

        if (j.contains("captured_at") && j["captured_at"].is_string()) {
            result.captured_at = j["captured_at"].get<std::string>();
        }

        result.state = SnapshotLoadResult::State::Loaded;
        result.identifiers = std::move(set);
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

SnapshotLoadResult SnapshotStore::load_detailed() const {
    if (!path_exists(path_)) {
        SnapshotLoadResult result;
        result.state = SnapshotLoadResult::State::Missing;
        return result;
    }

    auto content = read_file(path_);
    if (!content) {
        SnapshotLoadResult result;
        result.state = SnapshotLoadResult::State::Corrupt;
        result.error = "cannot read " + path_;
        return result;
    }

    return parse_snapshot(*content, purpose_);
}

std::optional<CanonicalIdentifierSet> SnapshotStore::load() const {
    auto result = load_detailed();
    switch (result.state) {
        case SnapshotLoadResult::State::Loaded:
            spdlog::debug("Loaded {} snapshot with {} identifiers from {}",
                          snapshot_purpose_to_string(purpose_), result.identifiers->size(), path_);
            return result.identifiers;
        case SnapshotLoadResult::State::Corrupt:
            spdlog::warn("Ignoring unreadable {} snapshot {}: {}",
                         snapshot_purpose_to_string(purpose_), path_, result.error);
            return std::nullopt;
        case SnapshotLoadResult::State::Missing:
            break;
    }
    return std::nullopt;
}

Result<void> SnapshotStore::save(const CanonicalIdentifierSet& set) const {
    std::string content = serialize_snapshot(set, purpose_, get_current_timestamp());

    auto written = atomic_write_file(path_, content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::SNAPSHOT_WRITE_FAILED, written.error)
                                     .withContext(path_));
    }

    spdlog::debug("Saved {} snapshot with {} identifiers to {}",
                  snapshot_purpose_to_string(purpose_), set.size(), path_);
    return Result<void>::ok();
}

Result<void> SnapshotStore::clear() const {
    if (!path_exists(path_)) {
        return Result<void>::ok();
    }
    if (!remove_file(path_)) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to remove " + path_));
    }
    return Result<void>::ok();
}

} // namespace sweep
