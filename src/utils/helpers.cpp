#include "helpers.hpp"
#include <array>
#include <charconv>
#include <cstdio>

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAsciiAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAsciiAlnum(char c) {
    return isAsciiDigit(c) || isAsciiAlpha(c);
}

std::string toLowerAscii(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

size_t utf8SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

uint32_t decodeUtf8(const std::string& s, size_t offset, size_t* length) {
    unsigned char lead = static_cast<unsigned char>(s[offset]);
    size_t len = utf8SequenceLength(lead);
    if (offset + len > s.size())
        len = 1;

    uint32_t cp = lead;
    if (len == 2) cp = lead & 0x1F;
    else if (len == 3) cp = lead & 0x0F;
    else if (len == 4) cp = lead & 0x07;

    for (size_t i = 1; i < len; ++i) {
        unsigned char c = static_cast<unsigned char>(s[offset + i]);
        if ((c & 0xC0) != 0x80) {
            // broken continuation, fall back to the raw lead byte
            len = 1;
            cp = lead;
            break;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    if (length)
        *length = len;
    return cp;
}

size_t nextCodepoint(const std::string& s, size_t offset) {
    if (offset >= s.size())
        return s.size();
    size_t len = 1;
    decodeUtf8(s, offset, &len);
    return offset + len;
}

size_t prevCodepoint(const std::string& s, size_t offset) {
    if (offset == 0)
        return 0;
    size_t pos = offset - 1;
    // walk back over at most three continuation bytes
    for (int i = 0; i < 3 && pos > 0; ++i) {
        unsigned char c = static_cast<unsigned char>(s[pos]);
        if ((c & 0xC0) != 0x80)
            break;
        --pos;
    }
    if (nextCodepoint(s, pos) != offset)
        return offset - 1;
    return pos;
}

bool isValidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char lead = static_cast<unsigned char>(s[i]);
        size_t len = utf8SequenceLength(lead);
        if (len == 1 && lead >= 0x80)
            return false;
        if (i + len > s.size())
            return false;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
                return false;
        }
        i += len;
    }
    return true;
}

bool isCjkIdeograph(uint32_t cp) {
    return cp >= 0x4E00 && cp <= 0x9FFF;
}

size_t digitRunLength(const std::string& s, size_t offset) {
    size_t i = offset;
    while (i < s.size() && isAsciiDigit(s[i]))
        ++i;
    return i - offset;
}

bool digitBefore(const std::string& s, size_t offset) {
    return offset > 0 && offset <= s.size() && isAsciiDigit(s[offset - 1]);
}

bool matchesAt(const std::string& s, size_t offset, const std::string& literal) {
    return offset <= s.size() && s.compare(offset, literal.size(), literal) == 0;
}

bool matchesAtIgnoreCase(const std::string& s, size_t offset, const std::string& literal) {
    if (offset + literal.size() > s.size())
        return false;
    for (size_t i = 0; i < literal.size(); ++i) {
        char a = s[offset + i];
        char b = literal[i];
        if (a >= 'A' && a <= 'Z') a = static_cast<char>(a - 'A' + 'a');
        if (b >= 'A' && b <= 'Z') b = static_cast<char>(b - 'A' + 'a');
        if (a != b)
            return false;
    }
    return true;
}

std::string digitsOnly(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (isAsciiDigit(c))
            out.push_back(c);
    }
    return out;
}

bool containsLabel(const std::string& haystack, const std::string& label) {
    if (label.empty() || label.size() > haystack.size())
        return false;

    std::string hay = toLowerAscii(haystack);
    std::string needle = toLowerAscii(label);
    bool asciiWord = isAsciiAlpha(needle.front()) && isAsciiAlpha(needle.back());

    size_t pos = hay.find(needle);
    while (pos != std::string::npos) {
        if (!asciiWord)
            return true;
        bool leftOk = pos == 0 || !isAsciiAlpha(hay[pos - 1]);
        size_t after = pos + needle.size();
        bool rightOk = after >= hay.size() || !isAsciiAlpha(hay[after]);
        if (leftOk && rightOk)
            return true;
        pos = hay.find(needle, pos + 1);
    }
    return false;
}

std::string contextBefore(const std::string& text, size_t start, size_t width) {
    if (start > text.size())
        start = text.size();
    size_t from = start;
    for (size_t i = 0; i < width && from > 0; ++i)
        from = prevCodepoint(text, from);
    return text.substr(from, start - from);
}

std::string contextAfter(const std::string& text, size_t end, size_t width) {
    if (end > text.size())
        end = text.size();
    size_t to = end;
    for (size_t i = 0; i < width && to < text.size(); ++i)
        to = nextCodepoint(text, to);
    return text.substr(end, to - end);
}

std::string formatConfidence(double confidence) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.2f", confidence);
    return buffer;
}

std::string to_hex(size_t value)
{
   std::array<char, 24> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}
