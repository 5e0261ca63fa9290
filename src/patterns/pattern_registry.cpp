#include "pattern_registry.hpp"
#include "logger.hpp"

void PatternRegistry::registerPattern(Creator creator) {
    PatternPtr pattern(creator());
    Category category = pattern->category();
    if (patterns.count(category)) {
        Logger::error("Duplicate pattern for category " + categoryTag(category) + ", keeping " + patterns[category]->name());
        return;
    }
    patterns.emplace(category, std::move(pattern));
}

std::vector<PatternPtr> PatternRegistry::activeSpecs(const std::set<Category>& requested) const {
    std::vector<PatternPtr> result;
    for (Category category : requested) {
        auto it = patterns.find(category);
        if (it == patterns.end())
            throw UnknownCategory(std::to_string(static_cast<int>(category)));
        result.push_back(it->second);
    }
    return result;
}

std::vector<PatternPtr> PatternRegistry::allSpecs() const {
    std::vector<PatternPtr> result;
    for (const auto& entry : patterns)
        result.push_back(entry.second);
    return result;
}
