#include "pattern_registration.hpp"
#include "helpers.hpp"
#include <string>

// Fixed-line number: optional area code written as "(0xx)", "0xx-" or
// "0xx " (3-4 digits, leading zero), then a 7-8 digit local number that
// does not start with 0 or 1.
class LandlinePattern : public BasePattern {
public:
    std::string name() const override { return "LANDLINE"; }
    Category category() const override { return Category::LANDLINE; }
    bool match(const std::string& text, size_t offset) const override;
    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;

private:
    static bool isAreaCode(const std::string& text, size_t offset, size_t runLength);
    static bool isLocalNumber(const std::string& text, size_t offset, size_t runLength);
};

bool LandlinePattern::isAreaCode(const std::string& text, size_t offset, size_t runLength) {
    return (runLength == 3 || runLength == 4) && text[offset] == '0';
}

bool LandlinePattern::isLocalNumber(const std::string& text, size_t offset, size_t runLength) {
    return (runLength == 7 || runLength == 8) && text[offset] >= '2' && text[offset] <= '9';
}

bool LandlinePattern::match(const std::string& text, size_t offset) const {
    char c = text[offset];
    if (c == '(')
        return offset + 1 < text.size() && text[offset + 1] == '0';
    return isAsciiDigit(c) && !digitBefore(text, offset);
}

Candidate LandlinePattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t pos = offset;
    bool parenthesized = text[pos] == '(';
    if (parenthesized)
        ++pos;

    size_t run = digitRunLength(text, pos);
    if (!parenthesized && isLocalNumber(text, pos, run))
        return makeCandidate(text, offset, pos + run);
    if (!isAreaCode(text, pos, run))
        return invalid;
    pos += run;

    if (parenthesized) {
        if (pos >= text.size() || text[pos] != ')')
            return invalid;
        ++pos;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == ' '))
            ++pos;
    } else {
        if (pos >= text.size() || (text[pos] != '-' && text[pos] != ' '))
            return invalid;
        ++pos;
    }

    if (pos >= text.size())
        return invalid;
    size_t local = digitRunLength(text, pos);
    if (!isLocalNumber(text, pos, local))
        return invalid;
    return makeCandidate(text, offset, pos + local);
}

std::optional<Finding> LandlinePattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    // Area code and local number are the first and last digit groups.
    const std::string& v = candidate.value;
    size_t first = 0;
    while (first < v.size() && !isAsciiDigit(v[first]))
        ++first;
    size_t areaLen = digitRunLength(v, first);
    size_t last = v.size();
    while (last > 0 && isAsciiDigit(v[last - 1]))
        --last;

    std::string display;
    if (last > first) {
        display = v.substr(first, areaLen) + "-" + v.substr(last);
    } else {
        display = v;
    }
    return makeFinding(candidate, labelledConfidence(candidate, config), display);
}

REGISTER_PATTERN(LandlinePattern);
