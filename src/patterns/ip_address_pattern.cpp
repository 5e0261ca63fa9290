#include "pattern_registration.hpp"
#include "helpers.hpp"
#include <string>

// Dotted IPv4 address, octets 0-255 without leading zeros.
class IpAddressPattern : public BasePattern {
public:
    std::string name() const override { return "IP_ADDRESS"; }
    Category category() const override { return Category::IP_ADDRESS; }
    bool match(const std::string& text, size_t offset) const override;
    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;

private:
    static bool isOctet(const std::string& text, size_t offset, size_t length);
};

bool IpAddressPattern::isOctet(const std::string& text, size_t offset, size_t length) {
    if (length == 0 || length > 3)
        return false;
    if (length > 1 && text[offset] == '0')
        return false;
    int value = 0;
    for (size_t i = 0; i < length; ++i)
        value = value * 10 + (text[offset + i] - '0');
    return value <= 255;
}

bool IpAddressPattern::match(const std::string& text, size_t offset) const {
    if (!isAsciiDigit(text[offset]))
        return false;
    if (offset == 0)
        return true;
    char prev = text[offset - 1];
    return !isAsciiAlnum(prev) && prev != '.';
}

Candidate IpAddressPattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t pos = offset;
    for (int octet = 0; octet < 4; ++octet) {
        if (octet > 0) {
            if (pos + 1 >= text.size() || text[pos] != '.' || !isAsciiDigit(text[pos + 1]))
                return invalid;
            ++pos;
        }
        size_t run = digitRunLength(text, pos);
        if (!isOctet(text, pos, run))
            return invalid;
        pos += run;
    }

    // 1.2.3.4.5 and 1.2.3.4a are not addresses
    if (pos < text.size()) {
        if (isAsciiAlpha(text[pos]))
            return invalid;
        if (text[pos] == '.' && pos + 1 < text.size() && isAsciiDigit(text[pos + 1]))
            return invalid;
    }
    return makeCandidate(text, offset, pos);
}

std::optional<Finding> IpAddressPattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    const std::string& v = candidate.value;
    size_t pos = 0;
    for (int octet = 0; octet < 4; ++octet) {
        if (octet > 0) {
            if (pos >= v.size() || v[pos] != '.')
                return std::nullopt;
            ++pos;
        }
        size_t run = digitRunLength(v, pos);
        if (!isOctet(v, pos, run))
            return std::nullopt;
        pos += run;
    }
    if (pos != v.size())
        return std::nullopt;
    return makeFinding(candidate, labelledConfidence(candidate, config), v);
}

REGISTER_PATTERN(IpAddressPattern);
