#include "anonymizer/anonymizer.hpp"
#include "core/category.hpp"

#include <algorithm>
#include <cctype>

namespace promptguard {

const char* minimize_method_to_string(Anonymizer::MinimizeMethod method) {
    switch (method) {
        case Anonymizer::MinimizeMethod::NONE:  return "NONE";
        case Anonymizer::MinimizeMethod::BLOCK: return "BLOCK";
    }
    return "UNKNOWN";
}

void Anonymizer::replace_span(std::string& buffer, size_t start, size_t end,
                              std::string_view replacement) {
    start = std::min(start, buffer.size());
    end = std::clamp(end, start, buffer.size());

    const bool needs_space = end < buffer.size() &&
        !std::isspace(static_cast<unsigned char>(buffer[end]));

    std::string rewritten(replacement);
    if (needs_space) rewritten += ' ';
    buffer.replace(start, end - start, rewritten);
}

AnonymizationResult Anonymizer::anonymize(std::string_view text,
                                          const std::vector<Finding>& findings) {
    AnonymizationResult result;
    result.sanitized_text = std::string(text);

    std::vector<const Finding*> ordered;
    ordered.reserve(findings.size());
    for (const auto& f : findings) ordered.push_back(&f);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const Finding* a, const Finding* b) { return a->offset_start > b->offset_start; });

    for (const Finding* finding : ordered) {
        const auto& info = category_info(finding->category);

        if (info.report_only) {
            continue;
        }

        replace_span(result.sanitized_text, finding->offset_start, finding->offset_end,
                     category_placeholder(*finding));

        if (finding->category == Category::CUSTOM) {
            result.summary.removed_categories.insert(category_name(*finding));
        } else {
            result.summary.removed_categories.emplace(info.removed_tag);
        }
        result.changed = true;
    }

    // Large dumps are blocked upstream; nothing is partially redacted here.
    for (const auto& f : findings) {
        if (f.category == Category::BULK_DATA && f.details.row_count.value_or(0) > kBulkRowThreshold) {
            result.summary.bulk_data_handled = true;
            break;
        }
    }

    return result;
}

Anonymizer::MinimizeResult Anonymizer::minimize_bulk_data(std::string_view text,
                                                          size_t row_count) {
    if (row_count > kBulkRowThreshold) {
        return {std::string(kBulkBlockedNotice), true, MinimizeMethod::BLOCK};
    }
    return {std::string(text), false, MinimizeMethod::NONE};
}

} // namespace promptguard
