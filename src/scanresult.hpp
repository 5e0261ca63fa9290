#pragma once
#include <string>
#include <vector>
#include "category.hpp"

// Raw pattern hit. Offsets are byte offsets into the UTF-8 source text.
// [start, end) is the reported value, [matchStart, matchEnd) is what the
// matcher consumed (wider than the value for labelled fields like passwords).
struct Candidate {
    Category category;
    std::string value;
    size_t start = 0;
    size_t end = 0;
    size_t matchStart = 0;
    size_t matchEnd = 0;
    std::string contextBefore;
    std::string contextAfter;
    bool isValid = false;
};

struct Finding {
    Category category;
    std::string value;
    std::string display;
    std::string context;   // before【value】after
    size_t start = 0;
    size_t end = 0;
    double confidence = 0.0;

    size_t length() const { return end - start; }
};

enum class ScanStatus {
    OK,
    FAILED
};

struct ScanReport {
    std::string source;
    std::vector<Finding> findings;  // ordered by start offset
    ScanStatus status = ScanStatus::OK;
    std::string error;

    bool failed() const { return status == ScanStatus::FAILED; }
};

struct BatchReport {
    std::vector<ScanReport> reports;  // submission order
    bool cancelled = false;
};
