#include "aggregator.hpp"
#include <algorithm>
#include <map>

Aggregator::Aggregator(double minConfidence) : minConfidence(minConfidence) {}

void Aggregator::add(Finding finding) {
    if (finding.confidence < minConfidence)
        return;
    findings.push_back(std::move(finding));
}

bool Aggregator::overlaps(const Finding& a, const Finding& b) {
    return a.start < b.end && b.start < a.end;
}

bool Aggregator::preferred(const Finding& a, const Finding& b) {
    if (a.confidence != b.confidence)
        return a.confidence > b.confidence;
    if (a.length() != b.length())
        return a.length() > b.length();
    if (a.start != b.start)
        return a.start < b.start;
    return a.end < b.end;
}

ScanReport Aggregator::finish(const std::string& source) const {
    std::map<Category, std::vector<Finding>> byCategory;
    for (const auto& f : findings)
        byCategory[f.category].push_back(f);

    ScanReport report;
    report.source = source;
    for (auto& entry : byCategory) {
        auto& group = entry.second;
        std::stable_sort(group.begin(), group.end(), preferred);

        std::vector<Finding> kept;
        for (auto& f : group) {
            bool clash = std::any_of(kept.begin(), kept.end(),
                                     [&f](const Finding& k) { return overlaps(k, f); });
            if (!clash)
                kept.push_back(std::move(f));
        }
        report.findings.insert(report.findings.end(),
                               std::make_move_iterator(kept.begin()),
                               std::make_move_iterator(kept.end()));
    }

    std::stable_sort(report.findings.begin(), report.findings.end(),
                     [](const Finding& a, const Finding& b) {
                         if (a.start != b.start)
                             return a.start < b.start;
                         if (a.category != b.category)
                             return a.category < b.category;
                         return a.end < b.end;
                     });
    return report;
}
