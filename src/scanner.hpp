#pragma once
#include <atomic>
#include <functional>
#include <set>
#include <string>
#include <vector>
#include "scanresult.hpp"
#include "detector_config.hpp"
#include "patterns/pattern_registry.hpp"
#include "utils/file_reader.hpp"

struct Source {
    std::string id;
    std::string text;
};

class Scanner {
public:
    DetectorConfig config;

    explicit Scanner(DetectorConfig config = DetectorConfig());

    // Single source. Throws UnknownCategory.
    ScanReport scanText(const std::string& sourceId, const std::string& text,
                        const std::set<Category>& categories) const;

    // Single source against an explicit pattern list. A pattern that emits a
    // malformed candidate loses that candidate only.
    ScanReport scanText(const std::string& sourceId, const std::string& text,
                        const std::vector<PatternPtr>& patterns) const;

    // Batch over already extracted texts, reports in submission order.
    BatchReport scan(const std::vector<Source>& sources, const std::set<Category>& categories);

    // Batch where text is pulled from `reader` on the worker thread. A
    // SourceReadFailure marks that source failed and the batch goes on.
    BatchReport scan(const std::vector<std::string>& sourceIds, const SourceReader& reader,
                     const std::set<Category>& categories);

    // Sources not yet started are abandoned; finished ones are kept. The
    // request is consumed by the first source that observes it, so a request
    // made after a batch has started its last source carries over to the
    // next batch.
    void cancel() { cancelRequested.store(true); }

private:
    using TextLoader = std::function<std::string(size_t)>;

    BatchReport runBatch(const std::vector<std::string>& ids, const TextLoader& load,
                         const std::set<Category>& categories);

    std::atomic<bool> cancelRequested{false};
};
