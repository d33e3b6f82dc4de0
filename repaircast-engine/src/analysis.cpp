#include "analysis.hpp"
#include <algorithm>
#include <cctype>

namespace repaircast {

std::string normalize_label(const std::string& label) {
    auto is_space = [](unsigned char c) { return std::isspace(c); };
    auto start = std::find_if_not(label.begin(), label.end(), is_space);
    auto end = std::find_if_not(label.rbegin(), label.rend(), is_space).base();
    if (start >= end) {
        return std::string();
    }

    std::string key(start, end);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return key;
}

AnalysisIndex::AnalysisIndex(const std::vector<AuthoritativeAnalysis>& analyses) {
    by_label_.reserve(analyses.size());
    for (const auto& analysis : analyses) {
        std::string key = normalize_label(analysis.damage_item);
        if (key.empty()) {
            continue;
        }
        by_label_.emplace(std::move(key), &analysis);  // emplace keeps the first entry
    }
}

const AuthoritativeAnalysis* AnalysisIndex::find(const std::string& label) const {
    auto it = by_label_.find(normalize_label(label));
    return it != by_label_.end() ? it->second : nullptr;
}

} // namespace repaircast
