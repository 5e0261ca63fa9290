#pragma once
#include <cstdint>
#include <string>

// Upper bound on a single source text handed to the engine.
#define MAX_SOURCE_TEXT_SIZE (64ULL*1024*1024)

//
// ASCII classification
//
bool isAsciiDigit(char c);
bool isAsciiAlpha(char c);
bool isAsciiAlnum(char c);
std::string toLowerAscii(std::string s);

//
// UTF-8 stepping. Malformed bytes are treated as one-byte code points.
//
size_t utf8SequenceLength(unsigned char lead);
uint32_t decodeUtf8(const std::string& s, size_t offset, size_t* length = nullptr);
size_t nextCodepoint(const std::string& s, size_t offset);
size_t prevCodepoint(const std::string& s, size_t offset);
bool isValidUtf8(const std::string& s);
bool isCjkIdeograph(uint32_t cp);

//
// Matching primitives
//
size_t digitRunLength(const std::string& s, size_t offset);
bool digitBefore(const std::string& s, size_t offset);
bool matchesAt(const std::string& s, size_t offset, const std::string& literal);
bool matchesAtIgnoreCase(const std::string& s, size_t offset, const std::string& literal);
std::string digitsOnly(const std::string& s);

// Case-insensitive search for a corroborating label. ASCII labels must not be
// glued to other ASCII letters ("ip" does not match inside "ship").
bool containsLabel(const std::string& haystack, const std::string& label);

// Up to `width` code points before `start` / after `end`, clipped to the text.
std::string contextBefore(const std::string& text, size_t start, size_t width);
std::string contextAfter(const std::string& text, size_t end, size_t width);

std::string formatConfidence(double confidence);
std::string to_hex(size_t value);
