#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "category.hpp"

// Heuristic constants used by the validators. None of them has a derivation
// beyond "worked on real OCR dumps", so all are overridable.
struct DetectorConfig {
    size_t contextWindow = 20;  // code points either side of a match

    double shapeConfidence = 0.7;
    double labelConfidence = 0.9;
    double idCardConfidence = 0.9;
    double creditCardConfidence = 0.85;
    double passwordConfidence = 0.6;
    double addressKeywordConfidence = 0.5;
    double addressMaxConfidence = 0.9;
    size_t addressMinChars = 4;

    double minConfidence = 0.5;
    bool maskPasswords = true;
    size_t maxWorkers = 4;

    std::map<Category, std::vector<std::string>> labels = defaultLabels();

    const std::vector<std::string>& labelsFor(Category category) const;

    static std::map<Category, std::vector<std::string>> defaultLabels();
};
