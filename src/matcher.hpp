#pragma once
#include <string>
#include <vector>
#include "patterns/base_pattern.hpp"

// Runs one pattern over a text, leftmost-first. A consumed span is never
// revisited by the same pattern, so candidates never overlap each other.
class Matcher {
public:
    Matcher(const BasePattern& pattern, size_t contextWindow);
    std::vector<Candidate> findAll(const std::string& text) const;

private:
    const BasePattern& pattern;
    size_t contextWindow;
};
