#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

std::string TextFileReader::read(const std::string& sourceId) const {
    fs::path path(sourceId);
    std::error_code ec;
    if (!fs::exists(path, ec))
        throw SourceReadFailure(sourceId, "file does not exist");
    if (!fs::is_regular_file(path, ec))
        throw SourceReadFailure(sourceId, "not a regular file");

    auto size = fs::file_size(path, ec);
    if (ec)
        throw SourceReadFailure(sourceId, "cannot stat file: " + ec.message());
    if (size > MAX_SOURCE_TEXT_SIZE)
        throw SourceReadFailure(sourceId, "file too large (" + std::to_string(size) + " bytes)");

    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw SourceReadFailure(sourceId, "cannot open file");

    std::string text((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
    if (file.bad())
        throw SourceReadFailure(sourceId, "read error");

    // strip a UTF-8 BOM left by some OCR exporters
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);
    if (!isValidUtf8(text))
        throw SourceReadFailure(sourceId, "content is not valid UTF-8");
    return text;
}

std::vector<std::string> collectSourceFiles(const std::vector<std::string>& inputs,
                                            const std::vector<std::string>& extensions) {
    std::vector<std::string> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (!fs::is_directory(input, ec)) {
            files.push_back(input);
            continue;
        }

        std::vector<std::string> found;
        for (fs::recursive_directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec))
                continue;
            std::string ext = toLowerAscii(it->path().extension().string());
            if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end())
                found.push_back(it->path().string());
        }
        if (ec)
            Logger::error("Error walking " + input + ": " + ec.message());
        std::sort(found.begin(), found.end());
        Logger::debug("Found " + std::to_string(found.size()) + " text files in " + input);
        files.insert(files.end(), found.begin(), found.end());
    }
    return files;
}
