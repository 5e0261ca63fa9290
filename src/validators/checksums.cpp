#include "checksums.hpp"
#include "helpers.hpp"

namespace {
    const int kIdWeights[17] = {7, 9, 10, 5, 8, 4, 2, 1, 6, 3, 7, 9, 10, 5, 8, 4, 2};
    // indexed by weighted sum mod 11
    const char kIdCheckTable[] = "10X98765432";
}

char gb11643CheckChar(const std::string& first17) {
    if (first17.size() != 17)
        return '\0';

    int sum = 0;
    for (size_t i = 0; i < 17; ++i) {
        if (!isAsciiDigit(first17[i]))
            return '\0';
        sum += (first17[i] - '0') * kIdWeights[i];
    }
    return kIdCheckTable[sum % 11];
}

bool gb11643Valid(const std::string& id) {
    if (id.size() != 18)
        return false;
    char expected = gb11643CheckChar(id.substr(0, 17));
    if (expected == '\0')
        return false;
    char actual = id[17] == 'x' ? 'X' : id[17];
    return actual == expected;
}

bool luhnValid(const std::string& digits) {
    if (digits.empty())
        return false;

    int sum = 0;
    bool doubleIt = false;
    for (size_t i = digits.size(); i-- > 0;) {
        if (!isAsciiDigit(digits[i]))
            return false;
        int d = digits[i] - '0';
        if (doubleIt) {
            d *= 2;
            if (d > 9)
                d -= 9;
        }
        sum += d;
        doubleIt = !doubleIt;
    }
    return sum % 10 == 0;
}
