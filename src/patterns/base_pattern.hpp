#pragma once
#include <optional>
#include <string>
#include "scanresult.hpp"
#include "detector_config.hpp"

// One PatternSpec per Category: a shape matcher (match/parse) and the
// validator that scores what the shape produced. Implementations are
// stateless and shared read-only between scanning threads.
class BasePattern {
public:
    virtual ~BasePattern() = default;
    virtual std::string name() const = 0;
    virtual Category category() const = 0;

    // Cheap anchor test: can a match start at this offset?
    virtual bool match(const std::string& text, size_t offset) const = 0;

    // Full shape extraction at `offset`. Returns a candidate with
    // isValid == false when the shape does not hold.
    virtual Candidate parse(const std::string& text, size_t offset) const = 0;

    // Checks the candidate contract, then scores it. std::nullopt means
    // rejected. Throws std::logic_error on a malformed candidate.
    std::optional<Finding> validate(const Candidate& candidate, const DetectorConfig& config) const;

protected:
    virtual std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const = 0;

    Candidate makeCandidate(const std::string& text, size_t matchStart, size_t matchEnd) const;
    Candidate makeCandidate(const std::string& text, size_t matchStart, size_t matchEnd,
                            size_t valueStart, size_t valueEnd) const;

    Finding makeFinding(const Candidate& candidate, double confidence, const std::string& display) const;

    // shapeConfidence, raised to labelConfidence when a configured label for
    // this category appears in the context window.
    double labelledConfidence(const Candidate& candidate, const DetectorConfig& config) const;
};
