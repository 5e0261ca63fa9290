#include "pattern_registration.hpp"
#include "helpers.hpp"
#include <string>

class EmailPattern : public BasePattern {
public:
    std::string name() const override { return "EMAIL"; }
    Category category() const override { return Category::EMAIL; }
    bool match(const std::string& text, size_t offset) const override;
    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;

private:
    static bool isLocalChar(char c) {
        return isAsciiAlnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
    }
    static bool isDomainChar(char c) {
        return isAsciiAlnum(c) || c == '.' || c == '-';
    }
    // End of the domain starting at `offset`, or 0 if there is none. The
    // domain ends after the last ".tld" whose tld has two or more letters.
    static size_t domainEnd(const std::string& text, size_t offset);
};

size_t EmailPattern::domainEnd(const std::string& text, size_t offset) {
    size_t runEnd = offset;
    while (runEnd < text.size() && isDomainChar(text[runEnd]))
        ++runEnd;

    for (size_t dot = runEnd; dot-- > offset + 1;) {
        if (text[dot] != '.')
            continue;
        size_t tld = dot + 1;
        while (tld < runEnd && isAsciiAlpha(text[tld]))
            ++tld;
        if (tld - (dot + 1) >= 2)
            return tld;
    }
    return 0;
}

bool EmailPattern::match(const std::string& text, size_t offset) const {
    return isLocalChar(text[offset]) && (offset == 0 || !isLocalChar(text[offset - 1]));
}

Candidate EmailPattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t at = offset;
    while (at < text.size() && isLocalChar(text[at]))
        ++at;
    if (at == offset || at >= text.size() || text[at] != '@')
        return invalid;

    size_t end = domainEnd(text, at + 1);
    if (end == 0)
        return invalid;
    return makeCandidate(text, offset, end);
}

std::optional<Finding> EmailPattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    size_t at = candidate.value.find('@');
    if (at == std::string::npos || at == 0 || candidate.value.find('.', at) == std::string::npos)
        return std::nullopt;
    return makeFinding(candidate, labelledConfidence(candidate, config), toLowerAscii(candidate.value));
}

REGISTER_PATTERN(EmailPattern);
