#include "sweep/identifier_set.hpp"

#include <algorithm>
#include <cctype>

namespace sweep {

std::string fold_case(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

namespace {

// Length of the well-formed UTF-8 sequence starting at s[i]; 0 if malformed
size_t utf8_sequence_length(const std::string& s, size_t i) {
    auto byte = [&s](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char lead = byte(i);

    size_t len = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) min_second = 0xA0;
        if (lead == 0xED) max_second = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) min_second = 0x90;
        if (lead == 0xF4) max_second = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < min_second || byte(i + 1) > max_second) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (byte(i + k) < 0x80 || byte(i + k) > 0xBF) return 0;
    }
    return len;
}

} // namespace

std::string repair_utf8(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        size_t len = utf8_sequence_length(s, i);
        if (len > 0) {
            result.append(s, i, len);
            i += len;
            continue;
        }
        unsigned char c = static_cast<unsigned char>(s[i]);
        result.push_back(static_cast<char>(0xC0 | (c >> 6)));
        result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        ++i;
    }
    return result;
}

CanonicalIdentifierSet CanonicalIdentifierSet::from_items(const std::vector<InventoryItem>& items) {
    CanonicalIdentifierSet set;
    for (const auto& item : items) {
        for (const auto& id : item.identifiers()) {
            set.insert(id);
        }
    }
    return set;
}

CanonicalIdentifierSet CanonicalIdentifierSet::from_strings(const std::vector<std::string>& values) {
    CanonicalIdentifierSet set;
    for (const auto& v : values) {
        set.insert(v);
    }
    return set;
}

bool CanonicalIdentifierSet::insert(const std::string& identifier) {
    std::string value = trim(identifier);
    if (value.empty()) return false;
    return entries_.emplace(fold_case(value), value).second;
}

bool CanonicalIdentifierSet::contains(const std::string& identifier) const {
    return contains_folded(fold_case(trim(identifier)));
}

std::vector<std::string> CanonicalIdentifierSet::sorted() const {
    std::vector<std::pair<std::string, std::string>> pairs(entries_.begin(), entries_.end());
    std::sort(pairs.begin(), pairs.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> result;
    result.reserve(pairs.size());
    for (auto& p : pairs) {
        result.push_back(std::move(p.second));
    }
    return result;
}

bool CanonicalIdentifierSet::operator==(const CanonicalIdentifierSet& other) const {
    if (entries_.size() != other.entries_.size()) return false;
    for (const auto& entry : entries_) {
        if (!other.contains_folded(entry.first)) return false;
    }
    return true;
}

} // namespace sweep
