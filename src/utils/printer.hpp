#pragma once
#include <string>
#include "scanresult.hpp"

// Plain text report: one block per source, "category: value (0.90)" lines.
std::string formatBatchReport(const BatchReport& batch, bool withContext = false);

// Colored tree on stdout, for the terminal.
void printBatchReport(const BatchReport& batch, bool verbose = false);

std::string batchReportJson(const BatchReport& batch);
// Throws std::runtime_error if the file cannot be written.
void dumpJson(const BatchReport& batch, const std::string& filename);
