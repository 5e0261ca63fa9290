#include "pattern_registration.hpp"
#include "checksums.hpp"
#include "helpers.hpp"
#include <string>

class IdCardPattern : public BasePattern {
public:
    std::string name() const override { return "ID_CARD"; }
    Category category() const override { return Category::ID_CARD; }

    bool match(const std::string& text, size_t offset) const override {
        return isAsciiDigit(text[offset]) && !digitBefore(text, offset);
    }

    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;
};

Candidate IdCardPattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t run = digitRunLength(text, offset);
    if (run == 18)
        return makeCandidate(text, offset, offset + 18);

    if (run == 17) {
        size_t check = offset + 17;
        if (check < text.size() && (text[check] == 'X' || text[check] == 'x')) {
            // "...X" must not be the start of a longer alphanumeric token
            if (check + 1 >= text.size() || !isAsciiAlnum(text[check + 1]))
                return makeCandidate(text, offset, offset + 18);
        }
    }
    return invalid;
}

std::optional<Finding> IdCardPattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    if (!gb11643Valid(candidate.value))
        return std::nullopt;

    std::string display = candidate.value;
    if (display.back() == 'x')
        display.back() = 'X';
    return makeFinding(candidate, config.idCardConfidence, display);
}

REGISTER_PATTERN(IdCardPattern);
