#include "scanner.hpp"
#include "aggregator.hpp"
#include "matcher.hpp"
#include "logger.hpp"
#include "helpers.hpp"
#include "thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>

Scanner::Scanner(DetectorConfig config) : config(std::move(config)) {}

ScanReport Scanner::scanText(const std::string& sourceId, const std::string& text,
                             const std::set<Category>& categories) const {
    auto specs = PatternRegistry::instance().activeSpecs(categories);
    return scanText(sourceId, text, specs);
}

BatchReport Scanner::scan(const std::vector<Source>& sources, const std::set<Category>& categories) {
    std::vector<std::string> ids;
    ids.reserve(sources.size());
    for (const auto& s : sources)
        ids.push_back(s.id);
    return runBatch(ids, [&sources](size_t i) { return sources[i].text; }, categories);
}

BatchReport Scanner::scan(const std::vector<std::string>& sourceIds, const SourceReader& reader,
                          const std::set<Category>& categories) {
    return runBatch(sourceIds, [&sourceIds, &reader](size_t i) { return reader.read(sourceIds[i]); }, categories);
}

BatchReport Scanner::runBatch(const std::vector<std::string>& ids, const TextLoader& load,
                              const std::set<Category>& categories) {
    // Resolve categories up front: an unknown one fails the whole call.
    auto specs = PatternRegistry::instance().activeSpecs(categories);

    // One slot per source, each written by exactly one task.
    std::vector<std::optional<ScanReport>> slots(ids.size());
    // Set by the first task that takes a cancel request.
    std::atomic<bool> abandoned{false};
    {
        ThreadPool pool(std::max<size_t>(1, std::min(config.maxWorkers, ids.size())));
        std::vector<std::future<void>> pending;
        pending.reserve(ids.size());
        for (size_t i = 0; i < ids.size(); ++i) {
            pending.push_back(pool.submit([this, i, &ids, &load, &specs, &slots, &abandoned]() {
                if (abandoned.load() || cancelRequested.exchange(false)) {
                    abandoned.store(true);
                    Logger::debug("Skipping " + ids[i] + " (cancelled)");
                    return;
                }
                std::string text;
                try {
                    text = load(i);
                } catch (const std::exception& e) {
                    Logger::error("Cannot read " + ids[i] + ": " + e.what());
                    ScanReport failed;
                    failed.source = ids[i];
                    failed.status = ScanStatus::FAILED;
                    failed.error = e.what();
                    slots[i] = std::move(failed);
                    return;
                }
                slots[i] = scanText(ids[i], text, specs);
            }));
        }
        for (auto& f : pending)
            f.get();
    }

    BatchReport batch;
    for (auto& slot : slots) {
        if (slot)
            batch.reports.push_back(std::move(*slot));
        else
            batch.cancelled = true;
    }
    return batch;
}

ScanReport Scanner::scanText(const std::string& sourceId, const std::string& text,
                             const std::vector<PatternPtr>& specs) const {
    Logger::debug("Scanner::scan " + sourceId + " (" + std::to_string(text.size()) + " bytes)");
    auto start = std::chrono::high_resolution_clock::now();

    Aggregator aggregator(config.minConfidence);
    for (const auto& spec : specs) {
        Matcher matcher(*spec, config.contextWindow);
        for (const auto& candidate : matcher.findAll(text)) {
            try {
                auto finding = spec->validate(candidate, config);
                if (!finding) {
                    Logger::debug(spec->name() + " rejected " + candidate.value);
                    continue;
                }
                aggregator.add(std::move(*finding));
            } catch (const std::logic_error& e) {
                Logger::warn(spec->name() + " dropped candidate at 0x" + to_hex(candidate.start) + ": " + e.what());
            }
        }
    }

    ScanReport report = aggregator.finish(sourceId);
    auto end = std::chrono::high_resolution_clock::now();
    auto diff = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    Logger::debug(sourceId + ": " + std::to_string(report.findings.size()) + " findings in "
                  + std::to_string(diff) + "us");
    return report;
}
