#include "core/category.hpp"

#include <format>

namespace promptguard {

namespace {

constexpr bool table_follows_enum_order() {
    for (size_t i = 0; i < kCategoryTable.size(); ++i) {
        if (static_cast<size_t>(kCategoryTable[i].category) != i) return false;
    }
    return true;
}

static_assert(table_follows_enum_order(), "kCategoryTable rows must follow Category order");

} // anonymous namespace

std::string category_name(const Finding& finding) {
    if (finding.category == Category::CUSTOM && !finding.custom_category.empty()) {
        return finding.custom_category;
    }
    return std::string(category_info(finding.category).name);
}

std::string category_placeholder(const Finding& finding) {
    const auto& info = category_info(finding.category);
    if (!info.placeholder.empty()) {
        return std::string(info.placeholder);
    }
    return std::format("[{}]", category_name(finding));
}

std::optional<Category> parse_category(std::string_view name) {
    for (const auto& info : kCategoryTable) {
        if (info.name == name) return info.category;
    }
    return std::nullopt;
}

} // namespace promptguard
