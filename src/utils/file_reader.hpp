#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Text for one source could not be obtained.
class SourceReadFailure : public std::runtime_error {
public:
    SourceReadFailure(const std::string& source, const std::string& reason)
        : std::runtime_error(reason), source(source) {}
    std::string source;
};

// Upstream side of the engine: turns a source id into extracted text.
class SourceReader {
public:
    virtual ~SourceReader() = default;
    // Throws SourceReadFailure.
    virtual std::string read(const std::string& sourceId) const = 0;
};

// Reads OCR text dumps from disk. Rejects non-regular files, files over
// MAX_SOURCE_TEXT_SIZE and content that is not UTF-8.
class TextFileReader : public SourceReader {
public:
    std::string read(const std::string& sourceId) const override;
};

// Expands directories (recursively, files with one of `extensions`) and
// keeps plain file arguments as given. Output is sorted per directory so
// batches are reproducible.
std::vector<std::string> collectSourceFiles(const std::vector<std::string>& inputs,
                                            const std::vector<std::string>& extensions = {".txt"});
