#include "pattern_registration.hpp"
#include "helpers.hpp"
#include <string>

// Mainland mobile number: optional +86 / 86 prefix, then 1[3-9] and nine
// more digits. The digit run must end right after the number.
class PhonePattern : public BasePattern {
public:
    std::string name() const override { return "PHONE"; }
    Category category() const override { return Category::PHONE; }
    bool match(const std::string& text, size_t offset) const override;
    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;

private:
    static bool isMobile(const std::string& text, size_t offset, size_t runLength);
    static std::string significantDigits(const std::string& value);
};

bool PhonePattern::isMobile(const std::string& text, size_t offset, size_t runLength) {
    return runLength == 11 && text[offset] == '1' && text[offset + 1] >= '3' && text[offset + 1] <= '9';
}

std::string PhonePattern::significantDigits(const std::string& value) {
    std::string digits = digitsOnly(value);
    if (digits.size() == 13 && digits.compare(0, 2, "86") == 0)
        digits.erase(0, 2);
    return digits;
}

bool PhonePattern::match(const std::string& text, size_t offset) const {
    char c = text[offset];
    if (c == '+')
        return matchesAt(text, offset + 1, "86");
    return isAsciiDigit(c) && !digitBefore(text, offset);
}

Candidate PhonePattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t pos = offset;
    if (text[pos] == '+') {
        pos += 3;
    } else {
        size_t run = digitRunLength(text, pos);
        if (isMobile(text, pos, run))
            return makeCandidate(text, offset, pos + run);
        if (run == 13 && matchesAt(text, pos, "86") && isMobile(text, pos + 2, 11))
            return makeCandidate(text, offset, pos + run);
        if (run != 2 || !matchesAt(text, pos, "86"))
            return invalid;
        pos += 2;
    }

    // "+86 138..." / "86-138..." / "+8613812345678"
    if (pos < text.size() && (text[pos] == ' ' || text[pos] == '-'))
        ++pos;
    if (pos >= text.size())
        return invalid;

    size_t run = digitRunLength(text, pos);
    if (!isMobile(text, pos, run))
        return invalid;
    return makeCandidate(text, offset, pos + run);
}

std::optional<Finding> PhonePattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    std::string digits = significantDigits(candidate.value);
    if (digits.size() != 11 || digits[0] != '1' || digits[1] < '3' || digits[1] > '9')
        return std::nullopt;
    return makeFinding(candidate, labelledConfidence(candidate, config), digits);
}

REGISTER_PATTERN(PhonePattern);
