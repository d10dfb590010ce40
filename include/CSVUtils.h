#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Record-level CSV tokenization and header normalization.
// Type inference lives in TypedDataset.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
    size_t maxColumns = 20000;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record, following quoted newlines.
 * @post Returns an empty vector at EOF or for a blank line.
 * @post *malformed is set when a quoted field is never closed or a limit is exceeded.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      const ParseLimits& limits = ParseLimits{});
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
