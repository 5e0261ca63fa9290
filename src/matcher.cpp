#include "matcher.hpp"
#include "helpers.hpp"
#include "logger.hpp"

Matcher::Matcher(const BasePattern& pattern, size_t contextWindow)
    : pattern(pattern), contextWindow(contextWindow) {}

std::vector<Candidate> Matcher::findAll(const std::string& text) const {
    std::vector<Candidate> candidates;
    size_t offset = 0;
    while (offset < text.size()) {
        if (pattern.match(text, offset)) {
            Candidate c = pattern.parse(text, offset);
            if (c.isValid && c.matchEnd > offset && c.matchEnd <= text.size()) {
                c.contextBefore = contextBefore(text, c.start, contextWindow);
                c.contextAfter = contextAfter(text, c.end, contextWindow);
                Logger::debug(pattern.name() + " candidate at 0x" + to_hex(c.start) + ": " + c.value);
                offset = c.matchEnd;
                candidates.push_back(std::move(c));
                continue;
            }
        }
        offset = nextCodepoint(text, offset);
    }
    return candidates;
}
