#pragma once
#include <string>
#include <vector>
#include "scanresult.hpp"
#include "detector_config.hpp"

// Collects the findings of one source and turns them into a ScanReport.
// Same-category overlaps keep the higher confidence, then the longer span,
// then the earlier start. Findings of different categories may overlap.
class Aggregator {
public:
    explicit Aggregator(double minConfidence = 0.0);

    void add(Finding finding);
    ScanReport finish(const std::string& source) const;

    static bool overlaps(const Finding& a, const Finding& b);
    // True if `a` beats `b` when both claim the same text.
    static bool preferred(const Finding& a, const Finding& b);

private:
    double minConfidence;
    std::vector<Finding> findings;
};
