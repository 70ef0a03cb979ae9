#include "sweep/matcher.hpp"
#include "sweep/identifier_set.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>

namespace sweep {

namespace {

struct IndexedIdentifier {
    size_t item;
    std::string original;
    std::string folded;
    std::string normalized;
};

struct Hit {
    size_t item;
    MatchStrategy strategy;
    std::string identifier;
};

/**
 * Identifier indexes built once per matching pass.
 *
 * Exact and Normalized lookups are hash probes; wildcard and
 * PartialPublisher patterns scan the identifier list.
 */
class PatternIndex {
public:
    explicit PatternIndex(const std::vector<InventoryItem>& items) {
        for (size_t i = 0; i < items.size(); ++i) {
            for (const auto& id : items[i].identifiers()) {
                IndexedIdentifier entry{i, id, fold_case(id), normalize_identifier(id)};
                size_t pos = identifiers_.size();
                by_folded_[entry.folded].push_back(pos);
                if (!entry.normalized.empty()) {
                    by_normalized_[entry.normalized].push_back(pos);
                }
                identifiers_.push_back(std::move(entry));
            }
        }
    }

    // Best strategy per item for one pattern, in ascending item order
    std::vector<Hit> hits(const std::string& pattern) const {
        std::unordered_map<size_t, Hit> best;

        auto record = [&best](size_t item, MatchStrategy strategy, const std::string& id) {
            auto it = best.find(item);
            if (it == best.end()) {
                best.emplace(item, Hit{item, strategy, id});
            } else if (static_cast<int>(strategy) < static_cast<int>(it->second.strategy)) {
                it->second = Hit{item, strategy, id};
            }
        };

        std::string folded = fold_case(trim(pattern));
        std::string normalized = normalize_identifier(pattern);
        if (folded.empty()) {
            return {};
        }

        if (is_wildcard_pattern(folded)) {
            for (const auto& entry : identifiers_) {
                if (glob_match(folded, entry.folded)) {
                    record(entry.item, MatchStrategy::Exact, entry.original);
                } else if (!normalized.empty() && glob_match(normalized, entry.normalized)) {
                    record(entry.item, MatchStrategy::Normalized, entry.original);
                }
            }
        } else {
            auto exact = by_folded_.find(folded);
            if (exact != by_folded_.end()) {
                for (size_t pos : exact->second) {
                    record(identifiers_[pos].item, MatchStrategy::Exact, identifiers_[pos].original);
                }
            }

            auto norm = by_normalized_.find(normalized);
            if (norm != by_normalized_.end()) {
                for (size_t pos : norm->second) {
                    record(identifiers_[pos].item, MatchStrategy::Normalized, identifiers_[pos].original);
                }
            }

            std::string publisher, app;
            if (split_publisher(folded, publisher, app)) {
                std::string norm_publisher = normalize_identifier(publisher);
                std::string norm_app = normalize_identifier(app);
                if (!norm_publisher.empty() && !norm_app.empty()) {
                    for (const auto& entry : identifiers_) {
                        if (entry.normalized.find(norm_publisher) != std::string::npos &&
                            entry.normalized.find(norm_app) != std::string::npos) {
                            record(entry.item, MatchStrategy::PartialPublisher, entry.original);
                        }
                    }
                }
            }
        }

        std::vector<Hit> result;
        result.reserve(best.size());
        for (auto& [item, hit] : best) {
            result.push_back(std::move(hit));
        }
        std::sort(result.begin(), result.end(),
                  [](const Hit& a, const Hit& b) { return a.item < b.item; });
        return result;
    }

private:
    std::vector<IndexedIdentifier> identifiers_;
    std::unordered_map<std::string, std::vector<size_t>> by_folded_;
    std::unordered_map<std::string, std::vector<size_t>> by_normalized_;
};

} // namespace

std::string normalize_identifier(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (unsigned char c : s) {
        if (c == '.' || c == '-' || c == '_' || std::isspace(c)) continue;
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

bool is_wildcard_pattern(const std::string& pattern) {
    return pattern.find_first_of("*?") != std::string::npos;
}

bool glob_match(const std::string& pattern, const std::string& text) {
    std::string p = fold_case(pattern);
    std::string t = fold_case(text);

    size_t pi = 0, ti = 0;
    size_t star = std::string::npos, mark = 0;

    while (ti < t.size()) {
        if (pi < p.size() && (p[pi] == '?' || p[pi] == t[ti])) {
            ++pi;
            ++ti;
        } else if (pi < p.size() && p[pi] == '*') {
            star = pi++;
            mark = ti;
        } else if (star != std::string::npos) {
            pi = star + 1;
            ti = ++mark;
        } else {
            return false;
        }
    }

    while (pi < p.size() && p[pi] == '*') ++pi;
    return pi == p.size();
}

bool split_publisher(const std::string& pattern, std::string& publisher, std::string& app) {
    auto dot = pattern.find('.');
    if (dot == std::string::npos) return false;
    publisher = pattern.substr(0, dot);
    app = pattern.substr(dot + 1);
    return !publisher.empty() && !app.empty();
}

std::vector<MatchRecord> match(const std::vector<InventoryItem>& items,
                               const PatternList& patterns,
                               const PatternList& excluded) {
    std::vector<MatchRecord> records;
    if (items.empty() || patterns.empty()) {
        return records;
    }

    PatternIndex index(items);

    // Items claimed by a protected pattern are never matched
    std::vector<bool> settled(items.size(), false);
    for (const auto& pattern : excluded) {
        for (const auto& hit : index.hits(pattern)) {
            if (!settled[hit.item]) {
                spdlog::debug("{} is protected by pattern {}", hit.identifier, pattern);
                settled[hit.item] = true;
            }
        }
    }

    std::vector<std::optional<MatchRecord>> per_item(items.size());
    for (const auto& pattern : patterns) {
        for (auto& hit : index.hits(pattern)) {
            if (settled[hit.item]) continue;
            settled[hit.item] = true;

            MatchRecord record;
            record.pattern = pattern;
            record.item = items[hit.item];
            record.strategy = hit.strategy;
            record.matched_identifier = std::move(hit.identifier);
            per_item[hit.item] = std::move(record);
        }
    }

    // Report in inventory order
    for (auto& record : per_item) {
        if (record) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

PatternList find_unmatched_patterns(const std::vector<InventoryItem>& items,
                                    const PatternList& patterns) {
    PatternIndex index(items);

    PatternList unmatched;
    for (const auto& pattern : patterns) {
        if (index.hits(pattern).empty()) {
            unmatched.push_back(pattern);
        }
    }
    return unmatched;
}

} // namespace sweep
