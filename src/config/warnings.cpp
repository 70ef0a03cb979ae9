#include "sweep/warnings.hpp"
#include "sweep/identifier_set.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sweep {

namespace {

std::string format_fields(const WarningFields& fields) {
    std::vector<std::string> parts;
    parts.reserve(fields.size());
    for (const auto& [key, value] : fields) {
        parts.push_back(key + "=" + value);
    }
    std::sort(parts.begin(), parts.end());

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

} // namespace

void WarningCollector::set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
    policy_ = policy;
    for (auto& w : warnings_) {
        w.effective_action = get_effective_action(w.key);
    }
}

void WarningCollector::emit(Warning warning, const WarningFields& fields) {
    std::string key = warning_to_string(warning);
    WarningAction action = get_effective_action(key);

    switch (action) {
        case WarningAction::Error:
            spdlog::error("{}: {}", key, format_fields(fields));
            break;
        case WarningAction::Warn:
            spdlog::warn("{}: {}", key, format_fields(fields));
            break;
        case WarningAction::Ignore:
            spdlog::debug("{} (ignored): {}", key, format_fields(fields));
            break;
    }

    // Warnings with action "ignore" are still collected but marked
    warnings_.push_back({key, fields, action});
}

void WarningCollector::emit(Warning warning) {
    emit(warning, WarningFields{});
}

void WarningCollector::apply_override(const std::string& warning_key, WarningAction action) {
    overrides_[fold_case(warning_key)] = action;
    for (auto& w : warnings_) {
        w.effective_action = get_effective_action(w.key);
    }
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

size_t WarningCollector::count(Warning warning) const {
    std::string key = warning_to_string(warning);
    return static_cast<size_t>(std::count_if(warnings_.begin(), warnings_.end(),
                                             [&key](const CollectedWarning& w) { return w.key == key; }));
}

bool WarningCollector::has_errors() const {
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    std::string lower_key = fold_case(key);

    // Overrides take precedence over the configured policy
    auto override_it = overrides_.find(lower_key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(lower_key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    return WarningAction::Warn;
}

std::optional<std::pair<Warning, WarningAction>> parse_warning_override(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos) {
        return std::nullopt;
    }
    auto warning = parse_warning_key(trim(text.substr(0, eq)));
    auto action = parse_warning_action(trim(text.substr(eq + 1)));
    if (!warning || !action) {
        return std::nullopt;
    }
    return std::make_pair(*warning, *action);
}

} // namespace sweep
