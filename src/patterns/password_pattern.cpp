#include "pattern_registration.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <string>
#include <vector>

// Labelled field: "password: xxx", "pwd=xxx", "密码：xxx". Only the token
// after the separator is reported.
class PasswordPattern : public BasePattern {
public:
    std::string name() const override { return "PASSWORD"; }
    Category category() const override { return Category::PASSWORD; }
    bool match(const std::string& text, size_t offset) const override;
    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;

private:
    static const std::vector<std::string>& labels();
    // Length of the label at offset, 0 if none.
    static size_t labelAt(const std::string& text, size_t offset);
    static bool isTokenChar(char c);

    static constexpr size_t kMinToken = 6;
    static constexpr size_t kMaxToken = 64;
};

const std::vector<std::string>& PasswordPattern::labels() {
    // longest first so "password" wins over "pass"
    static const std::vector<std::string> all = {
        "password", "passwd", "pass", "pwd", "密码", "口令"
    };
    return all;
}

size_t PasswordPattern::labelAt(const std::string& text, size_t offset) {
    bool letterBefore = offset > 0 && isAsciiAlpha(text[offset - 1]);
    for (const auto& label : labels()) {
        if (!matchesAtIgnoreCase(text, offset, label))
            continue;
        if (!isAsciiAlpha(label.front()))
            return label.size();
        size_t after = offset + label.size();
        // "mypassword", "passport", "passing"
        if (letterBefore || (after < text.size() && isAsciiAlpha(text[after])))
            continue;
        return label.size();
    }
    return 0;
}

bool PasswordPattern::isTokenChar(char c) {
    return c > 0x20 && c < 0x7F && c != ',' && c != ';' && c != '"' && c != '\'';
}

bool PasswordPattern::match(const std::string& text, size_t offset) const {
    return labelAt(text, offset) > 0;
}

Candidate PasswordPattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t pos = offset + labelAt(text, offset);
    size_t sepStart = pos;
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t'))
        ++pos;
    if (pos < text.size() && (text[pos] == ':' || text[pos] == '=')) {
        ++pos;
    } else if (matchesAt(text, pos, "：")) {
        pos += std::string("：").size();
    }
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t'))
        ++pos;
    if (pos == sepStart)
        return invalid;

    size_t tokenStart = pos;
    bool hasAlnum = false;
    while (pos < text.size() && isTokenChar(text[pos])) {
        hasAlnum = hasAlnum || isAsciiAlnum(text[pos]);
        ++pos;
    }
    size_t length = pos - tokenStart;
    if (length < kMinToken || length > kMaxToken || !hasAlnum)
        return invalid;
    return makeCandidate(text, offset, pos, tokenStart, pos);
}

std::optional<Finding> PasswordPattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    std::string display = candidate.value;
    if (config.maskPasswords && display.size() > 2)
        std::fill(display.begin() + 1, display.end() - 1, '*');
    return makeFinding(candidate, config.passwordConfidence, display);
}

REGISTER_PATTERN(PasswordPattern);
