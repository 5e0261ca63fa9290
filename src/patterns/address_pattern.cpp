#include "pattern_registration.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <vector>

// Address-shaped text: a run of CJK ideographs and digits on one line that
// contains administrative-unit markers. This recognizes the shape only; an
// ordinary sentence containing 市 or 路 can and will match.
namespace {

enum class AddressUnit {
    PROVINCE,
    CITY,
    DISTRICT,
    TOWN,
    ROAD,
    NUMBER
};

struct UnitKeyword {
    std::string text;
    AddressUnit unit;
    bool needsNumeral;  // "5号" counts, "号码" does not
};

// Longer keywords first, so 街道 is a town before 街 is a road.
const std::vector<UnitKeyword>& unitKeywords() {
    static const std::vector<UnitKeyword> keywords = {
        {"特别行政区", AddressUnit::PROVINCE, false},
        {"自治区", AddressUnit::PROVINCE, false},
        {"省", AddressUnit::PROVINCE, false},
        {"市", AddressUnit::CITY, false},
        {"区", AddressUnit::DISTRICT, false},
        {"县", AddressUnit::DISTRICT, false},
        {"旗", AddressUnit::DISTRICT, false},
        {"街道", AddressUnit::TOWN, false},
        {"镇", AddressUnit::TOWN, false},
        {"乡", AddressUnit::TOWN, false},
        {"胡同", AddressUnit::ROAD, false},
        {"大道", AddressUnit::ROAD, false},
        {"路", AddressUnit::ROAD, false},
        {"街", AddressUnit::ROAD, false},
        {"道", AddressUnit::ROAD, false},
        {"巷", AddressUnit::ROAD, false},
        {"弄", AddressUnit::ROAD, false},
        {"号楼", AddressUnit::NUMBER, true},
        {"单元", AddressUnit::NUMBER, true},
        {"号", AddressUnit::NUMBER, true},
        {"栋", AddressUnit::NUMBER, true},
        {"室", AddressUnit::NUMBER, true},
    };
    return keywords;
}

// Labels that often precede an address inside the same run ("家庭住址北京市...").
const std::vector<std::string>& leadingLabels() {
    static const std::vector<std::string> labels = {"地址", "住址", "位于", "住在"};
    return labels;
}

bool isChineseNumeral(uint32_t cp) {
    static const std::u32string numerals = U"零一二三四五六七八九十百";
    return numerals.find(static_cast<char32_t>(cp)) != std::u32string::npos;
}

bool isAddressChar(const std::string& text, size_t offset) {
    char c = text[offset];
    if (isAsciiDigit(c) || c == '-' || c == '#')
        return true;
    return isCjkIdeograph(decodeUtf8(text, offset));
}

struct KeywordHit {
    size_t start;
    size_t end;
    AddressUnit unit;
};

// Keyword occurrences in [from, to), left to right, without overlaps.
std::vector<KeywordHit> findKeywords(const std::string& text, size_t from, size_t to) {
    std::vector<KeywordHit> hits;
    size_t pos = from;
    while (pos < to) {
        bool found = false;
        for (const auto& kw : unitKeywords()) {
            if (pos + kw.text.size() > to || !matchesAt(text, pos, kw.text))
                continue;
            if (kw.needsNumeral) {
                if (pos == from)
                    continue;
                size_t prev = prevCodepoint(text, pos);
                if (!isAsciiDigit(text[prev]) && !isChineseNumeral(decodeUtf8(text, prev)))
                    continue;
            }
            hits.push_back({pos, pos + kw.text.size(), kw.unit});
            pos += kw.text.size();
            found = true;
            break;
        }
        if (!found)
            pos = nextCodepoint(text, pos);
    }
    return hits;
}

size_t codepointCount(const std::string& s) {
    size_t count = 0;
    for (size_t pos = 0; pos < s.size(); pos = nextCodepoint(s, pos))
        ++count;
    return count;
}

}

class AddressPattern : public BasePattern {
public:
    std::string name() const override { return "ADDRESS"; }
    Category category() const override { return Category::ADDRESS; }
    bool match(const std::string& text, size_t offset) const override;
    Candidate parse(const std::string& text, size_t offset) const override;

protected:
    std::optional<Finding> score(const Candidate& candidate, const DetectorConfig& config) const override;
};

bool AddressPattern::match(const std::string& text, size_t offset) const {
    if (!isCjkIdeograph(decodeUtf8(text, offset)))
        return false;
    return offset == 0 || !isAddressChar(text, prevCodepoint(text, offset));
}

Candidate AddressPattern::parse(const std::string& text, size_t offset) const {
    Candidate invalid;
    invalid.category = category();

    size_t runEnd = offset;
    while (runEnd < text.size() && isAddressChar(text, runEnd))
        runEnd = nextCodepoint(text, runEnd);

    std::vector<KeywordHit> hits = findKeywords(text, offset, runEnd);
    if (hits.empty())
        return invalid;

    // Labels are only looked for ahead of the first keyword.
    size_t start = offset;
    size_t labelLimit = hits.front().start;
    for (size_t pos = offset; pos < labelLimit; pos = nextCodepoint(text, pos)) {
        for (const auto& label : leadingLabels()) {
            if (pos + label.size() <= labelLimit && matchesAt(text, pos, label))
                start = std::max(start, pos + label.size());
        }
    }
    size_t end = hits.back().end;
    if (start >= hits.front().start)
        return invalid;

    return makeCandidate(text, offset, end, start, end);
}

std::optional<Finding> AddressPattern::score(const Candidate& candidate, const DetectorConfig& config) const {
    if (codepointCount(candidate.value) < config.addressMinChars)
        return std::nullopt;

    std::set<AddressUnit> units;
    for (const auto& hit : findKeywords(candidate.value, 0, candidate.value.size()))
        units.insert(hit.unit);
    if (units.empty())
        return std::nullopt;

    double confidence = std::min(config.addressMaxConfidence,
                                 config.addressKeywordConfidence * static_cast<double>(units.size()));
    return makeFinding(candidate, confidence, candidate.value);
}

REGISTER_PATTERN(AddressPattern);
