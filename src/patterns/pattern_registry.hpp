// pattern_registry.hpp
#pragma once
#include "base_pattern.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <vector>

using PatternPtr = std::shared_ptr<const BasePattern>;

// Filled during static initialization by REGISTER_PATTERN, read-only after.
class PatternRegistry {
public:
    using Creator = std::function<std::unique_ptr<BasePattern>()>;

    static PatternRegistry& instance() {
        static PatternRegistry registry;
        return registry;
    }

    void registerPattern(Creator creator);

    // Specs for the requested categories, in Category order. Throws
    // UnknownCategory if a requested category has no registered pattern.
    std::vector<PatternPtr> activeSpecs(const std::set<Category>& requested) const;
    std::vector<PatternPtr> allSpecs() const;

private:
    std::map<Category, PatternPtr> patterns;
};
