#include "printer.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "cJSON.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

struct BatchSummary {
    size_t sources = 0;
    size_t failed = 0;
    size_t withFindings = 0;
    size_t findings = 0;
};

BatchSummary summarize(const BatchReport& batch) {
    BatchSummary s;
    s.sources = batch.reports.size();
    for (const auto& r : batch.reports) {
        if (r.failed()) {
            ++s.failed;
        } else if (!r.findings.empty()) {
            ++s.withFindings;
            s.findings += r.findings.size();
        }
    }
    return s;
}

std::string summaryLine(const BatchSummary& s) {
    return std::to_string(s.findings) + " findings in " + std::to_string(s.withFindings) + "/"
           + std::to_string(s.sources - s.failed) + " sources, " + std::to_string(s.failed) + " failed";
}

cJSON* buildJsonFinding(const Finding& f) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "category", categoryTag(f.category).c_str());
    cJSON_AddStringToObject(item, "value", f.value.c_str());
    cJSON_AddStringToObject(item, "display", f.display.c_str());
    cJSON_AddNumberToObject(item, "start", static_cast<double>(f.start));
    cJSON_AddNumberToObject(item, "end", static_cast<double>(f.end));
    cJSON_AddNumberToObject(item, "confidence", f.confidence);
    cJSON_AddStringToObject(item, "context", f.context.c_str());
    return item;
}

cJSON* buildJsonReport(const ScanReport& r) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "source", r.source.c_str());
    cJSON_AddStringToObject(item, "status", r.failed() ? "failed" : "ok");
    if (r.failed())
        cJSON_AddStringToObject(item, "error", r.error.c_str());

    cJSON* findings = cJSON_CreateArray();
    for (const auto& f : r.findings)
        cJSON_AddItemToArray(findings, buildJsonFinding(f));
    cJSON_AddItemToObject(item, "findings", findings);
    return item;
}

}

std::string formatBatchReport(const BatchReport& batch, bool withContext) {
    std::ostringstream out;
    for (const auto& r : batch.reports) {
        out << "* " << r.source << "\n";
        if (r.failed()) {
            out << "FAILED: " << r.error << "\n";
        } else if (r.findings.empty()) {
            out << "no sensitive information found\n";
        }
        for (const auto& f : r.findings) {
            out << categoryTag(f.category) << ": " << f.display << " (" << formatConfidence(f.confidence) << ")\n";
            if (withContext)
                out << "    " << f.context << "\n";
        }
        out << "\n";
    }
    if (batch.cancelled)
        out << "scan cancelled before all sources were processed\n";
    out << summaryLine(summarize(batch)) << "\n";
    return out.str();
}

static void printScanReport(const ScanReport& r, bool last, bool verbose) {
    std::cout << (last ? "└── " : "├── ") << ansi::bold << r.source << ansi::reset << "\n";
    std::string childPrefix = last ? "    " : "│   ";

    if (r.failed()) {
        std::cout << childPrefix << ansi::red << "FAILED: " << r.error << ansi::reset << "\n";
        return;
    }

    for (size_t i = 0; i < r.findings.size(); ++i) {
        const Finding& f = r.findings[i];
        bool lastFinding = i == r.findings.size() - 1;
        std::cout << childPrefix << (lastFinding ? "└── " : "├── ")
                  << ansi::cyan << "[0x" << to_hex(f.start) << "]" << ansi::reset
                  << " " << ansi::yellow << categoryTag(f.category) << ansi::reset
                  << " " << f.display
                  << " (" << ansi::green << formatConfidence(f.confidence) << ansi::reset << ")\n";
        if (verbose) {
            std::cout << childPrefix << (lastFinding ? "    " : "│   ")
                      << ansi::gray << "Context: " << f.context << ansi::reset << "\n";
        }
    }
}

void printBatchReport(const BatchReport& batch, bool verbose) {
    for (size_t i = 0; i < batch.reports.size(); ++i)
        printScanReport(batch.reports[i], i == batch.reports.size() - 1, verbose);
    if (batch.cancelled)
        std::cout << ansi::yellow << "scan cancelled before all sources were processed" << ansi::reset << "\n";
    std::cout << ansi::magenta << summaryLine(summarize(batch)) << ansi::reset << "\n";
}

std::string batchReportJson(const BatchReport& batch) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddBoolToObject(root, "cancelled", batch.cancelled);
    cJSON* reports = cJSON_CreateArray();
    for (const auto& r : batch.reports)
        cJSON_AddItemToArray(reports, buildJsonReport(r));
    cJSON_AddItemToObject(root, "sources", reports);

    char* jsonStr = cJSON_Print(root);
    std::string json = jsonStr ? jsonStr : "";
    free(jsonStr);
    cJSON_Delete(root);
    return json;
}

void dumpJson(const BatchReport& batch, const std::string& filename) {
    std::ofstream outFile(filename, std::ios::binary);
    if (!outFile.is_open())
        throw std::runtime_error("Cannot open " + filename + " for writing");
    outFile << batchReportJson(batch);
    if (!outFile)
        throw std::runtime_error("Error writing " + filename);
    Logger::debug("JSON report written to " + filename);
}
