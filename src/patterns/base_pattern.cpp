#include "base_pattern.hpp"
#include "helpers.hpp"
#include <stdexcept>

std::optional<Finding> BasePattern::validate(const Candidate& candidate, const DetectorConfig& config) const {
    if (candidate.category != category())
        throw std::logic_error(name() + ": candidate of category " + categoryTag(candidate.category));
    if (candidate.start > candidate.end || candidate.matchStart > candidate.start || candidate.end > candidate.matchEnd)
        throw std::logic_error(name() + ": inconsistent candidate offsets");
    if (candidate.value.size() != candidate.end - candidate.start)
        throw std::logic_error(name() + ": candidate value does not match its offsets");
    if (!candidate.isValid || candidate.value.empty())
        return std::nullopt;
    return score(candidate, config);
}

Candidate BasePattern::makeCandidate(const std::string& text, size_t matchStart, size_t matchEnd) const {
    return makeCandidate(text, matchStart, matchEnd, matchStart, matchEnd);
}

Candidate BasePattern::makeCandidate(const std::string& text, size_t matchStart, size_t matchEnd,
                                     size_t valueStart, size_t valueEnd) const {
    Candidate c;
    c.category = category();
    c.matchStart = matchStart;
    c.matchEnd = matchEnd;
    c.start = valueStart;
    c.end = valueEnd;
    c.value = text.substr(valueStart, valueEnd - valueStart);
    c.isValid = true;
    return c;
}

Finding BasePattern::makeFinding(const Candidate& candidate, double confidence, const std::string& display) const {
    Finding f;
    f.category = candidate.category;
    f.value = candidate.value;
    f.display = display;
    f.context = candidate.contextBefore + "【" + candidate.value + "】" + candidate.contextAfter;
    f.start = candidate.start;
    f.end = candidate.end;
    f.confidence = confidence;
    return f;
}

double BasePattern::labelledConfidence(const Candidate& candidate, const DetectorConfig& config) const {
    for (const auto& label : config.labelsFor(category())) {
        if (containsLabel(candidate.contextBefore, label) || containsLabel(candidate.contextAfter, label))
            return config.labelConfidence;
    }
    return config.shapeConfidence;
}
