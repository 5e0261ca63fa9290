#pragma once
#include <string>

// GB 11643 check character for the first 17 digits of an 18-character
// resident ID number. Returns '\0' if `first17` is not 17 ASCII digits.
char gb11643CheckChar(const std::string& first17);

// True if `id` is 17 digits plus a matching check character ('x' accepted).
bool gb11643Valid(const std::string& id);

// Luhn mod-10 check over a string of ASCII digits. Non-digit input fails.
bool luhnValid(const std::string& digits);
