#include "pattern_registration.hpp"
#include "checksums.hpp"
#include "helpers.hpp"
#include <string>

// Card number: 16-19 contiguous digits, or blocks of 4 separated by a
// single space or hyphen with a shorter final block ("6222 0200 1234 5678 901").
class CreditCardPattern : public BasePattern {
public:
    std::string name() const override { return "CREDIT_CARD"; }
    Category category() const override { return Category::CREDIT_CARD; }

    bool match(const std::string& text, size_t offset) const override {
        return isAsciiDigit(text[offset]) && !digitBefore(text, offset);
    }

    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;

private:
    static bool isSeparator(char c) { return c == ' ' || c == '-'; }
};

Candidate CreditCardPattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t run = digitRunLength(text, offset);
    if (run >= 16 && run <= 19)
        return makeCandidate(text, offset, offset + run);
    if (run != 4)
        return invalid;

    size_t pos = offset + 4;
    size_t total = 4;
    while (total < 19 && pos + 1 < text.size() && isSeparator(text[pos]) && isAsciiDigit(text[pos + 1])) {
        size_t group = digitRunLength(text, pos + 1);
        if (group > 4)
            return invalid;
        pos += 1 + group;
        total += group;
        if (group < 4)
            break;
    }

    if (total < 16 || total > 19)
        return invalid;
    return makeCandidate(text, offset, pos);
}

std::optional<Finding> CreditCardPattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    std::string digits = digitsOnly(candidate.value);
    if (digits.size() < 16 || digits.size() > 19 || !luhnValid(digits))
        return std::nullopt;
    return makeFinding(candidate, config.creditCardConfidence, digits);
}

REGISTER_PATTERN(CreditCardPattern);
