#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int ch = is.peek();
        if (ch == EOF || static_cast<unsigned char>(ch) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    bool broken = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) broken = true;
    };

    while (!broken && is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    field += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                field += '\n';
            } else {
                field += c;
            }
        } else if (c == '"' && CSVUtils::trimUnquotedField(field).empty()) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            field += c;
        }

        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) broken = true;
    }

    if (inQuotes) broken = true;
    if (malformed) *malformed = broken;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(field).empty() && row.empty()) {
        return {};
    }
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.count(out[i]) > 0) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix)) > 0) {
                ++suffix;
            }
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }

    return out;
}
} // namespace CSVUtils
