#include "anonymizer/entity_mapper.hpp"
#include "core/category.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace promptguard {

std::optional<std::string> EntityMap::lookup_placeholder(std::string_view value) const {
    const auto it = by_value_.find(std::string(value));
    if (it == by_value_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].placeholder;
}

const EntityMap::Entry* EntityMap::find(std::string_view placeholder) const {
    const auto it = by_placeholder_.find(std::string(placeholder));
    return it == by_placeholder_.end() ? nullptr : &entries_[it->second];
}

const std::string& EntityMap::add(std::string_view value, Category category) {
    const std::string key(value);
    if (const auto it = by_value_.find(key); it != by_value_.end()) {
        return entries_[it->second].placeholder;
    }

    const std::string prefix(category_info(category).entity_prefix);
    const size_t n = ++counters_[prefix];

    const size_t index = entries_.size();
    entries_.push_back(Entry{std::format("{}_{}", prefix, n), key, category});
    by_value_.emplace(key, index);
    by_placeholder_.emplace(entries_.back().placeholder, index);
    return entries_.back().placeholder;
}

bool EntityMap::restore(const Entry& entry) {
    if (by_placeholder_.contains(entry.placeholder) || by_value_.contains(entry.original_value)) {
        return false;
    }

    const size_t sep = entry.placeholder.rfind('_');
    if (sep != std::string::npos) {
        const std::string prefix = entry.placeholder.substr(0, sep);
        size_t n = 0;
        const auto* first = entry.placeholder.data() + sep + 1;
        const auto* last = entry.placeholder.data() + entry.placeholder.size();
        if (const auto [ptr, ec] = std::from_chars(first, last, n); ec == std::errc{} && ptr == last) {
            auto& counter = counters_[prefix];
            counter = std::max(counter, n);
        }
    }

    const size_t index = entries_.size();
    entries_.push_back(entry);
    by_value_.emplace(entry.original_value, index);
    by_placeholder_.emplace(entry.placeholder, index);
    return true;
}

std::string EntityMap::rehydrate(std::string_view text) const {
    std::vector<const Entry*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& e : entries_) ordered.push_back(&e);
    std::stable_sort(ordered.begin(), ordered.end(), [](const Entry* a, const Entry* b) {
        return a->placeholder.size() > b->placeholder.size();
    });

    std::string result(text);
    for (const Entry* e : ordered) {
        size_t pos = 0;
        while ((pos = result.find(e->placeholder, pos)) != std::string::npos) {
            result.replace(pos, e->placeholder.size(), e->original_value);
            pos += e->original_value.size();
        }
    }
    return result;
}

void extend(EntityMap& map, const std::vector<Finding>& findings) {
    for (const auto& finding : findings) {
        if (!finding.value || finding.value->empty()) continue;
        if (category_info(finding.category).report_only) continue;
        map.add(*finding.value, finding.category);
    }
}

EntityMap build_entity_map(const std::vector<Finding>& findings) {
    EntityMap map;
    extend(map, findings);
    return map;
}

} // namespace promptguard
