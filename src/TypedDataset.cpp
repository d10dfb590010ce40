#include "TypedDataset.h"
#include "AugurExceptions.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace DatasetParsing {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool parseDouble(const std::string& raw, double& out) {
    std::string cleaned = CommonUtils::trim(raw);
    if (cleaned.empty() || isMissingToken(cleaned)) return false;
    if (cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

std::string formatNumber(double value) {
    if (std::isfinite(value) && std::abs(value) < 1e15 && value == std::floor(value)) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream os;
    os << std::setprecision(15) << value;
    return os.str();
}
} // namespace DatasetParsing

std::string TypedColumn::textAt(size_t row) const {
    if (type == ColumnType::NUMERIC) {
        return DatasetParsing::formatNumber(std::get<std::vector<double>>(values)[row]);
    }
    return std::get<std::vector<std::string>>(values)[row];
}

TypedDataset::TypedDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

void TypedDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Augur::DatasetException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
    if (malformed || header.empty()) throw Augur::DatasetException("Malformed or empty CSV header in " + filename_);
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> rows;
    rows.reserve(1024);
    while (in.peek() != EOF) {
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
        if (row.empty() || malformed) continue;
        row.resize(header.size());
        rows.push_back(std::move(row));
    }
    if (in.bad()) throw Augur::DatasetException("Read failure while loading " + filename_);
    if (rows.empty()) throw Augur::DatasetException("Dataset has no data rows: " + filename_);

    buildColumns(header, rows);
}

TypedDataset TypedDataset::fromRows(const std::vector<std::string>& header,
                                    const std::vector<std::vector<std::string>>& rows) {
    if (header.empty()) throw Augur::DatasetException("Header must name at least one column");
    TypedDataset out("<memory>");
    const auto names = CSVUtils::normalizeHeader(header);
    std::vector<std::vector<std::string>> padded = rows;
    for (auto& row : padded) row.resize(names.size());
    out.buildColumns(names, padded);
    return out;
}

void TypedDataset::buildColumns(const std::vector<std::string>& header,
                                const std::vector<std::vector<std::string>>& rows) {
    rowCount_ = rows.size();
    columns_.clear();
    columns_.reserve(header.size());

    for (size_t c = 0; c < header.size(); ++c) {
        bool allNumeric = true;
        for (const auto& row : rows) {
            const std::string& cell = row[c];
            if (DatasetParsing::isMissingToken(cell)) continue;
            double dv = 0.0;
            if (!DatasetParsing::parseDouble(cell, dv)) {
                allNumeric = false;
                break;
            }
        }

        TypedColumn col;
        col.name = header[c];
        col.missing.assign(rowCount_, static_cast<uint8_t>(0));
        if (allNumeric) {
            col.type = ColumnType::NUMERIC;
            std::vector<double> values(rowCount_, std::numeric_limits<double>::quiet_NaN());
            for (size_t r = 0; r < rowCount_; ++r) {
                if (!DatasetParsing::parseDouble(rows[r][c], values[r])) {
                    values[r] = std::numeric_limits<double>::quiet_NaN();
                    col.missing[r] = static_cast<uint8_t>(1);
                }
            }
            col.values = std::move(values);
        } else {
            col.type = ColumnType::CATEGORICAL;
            std::vector<std::string> values(rowCount_);
            for (size_t r = 0; r < rowCount_; ++r) {
                if (DatasetParsing::isMissingToken(rows[r][c])) {
                    col.missing[r] = static_cast<uint8_t>(1);
                    continue;
                }
                values[r] = CommonUtils::trim(rows[r][c]);
            }
            col.values = std::move(values);
        }
        columns_.push_back(std::move(col));
    }
}

std::vector<std::string> TypedDataset::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& col : columns_) out.push_back(col.name);
    return out;
}

std::vector<size_t> TypedDataset::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    return out;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

size_t TypedDataset::distinctCount(size_t columnIndex) const {
    const auto& col = columns_.at(columnIndex);
    if (col.type == ColumnType::NUMERIC) {
        const auto& values = std::get<std::vector<double>>(col.values);
        std::unordered_set<double> seen;
        for (size_t r = 0; r < rowCount_; ++r) {
            if (!col.missing[r]) seen.insert(values[r]);
        }
        return seen.size();
    }
    const auto& values = std::get<std::vector<std::string>>(col.values);
    std::unordered_set<std::string> seen;
    for (size_t r = 0; r < rowCount_; ++r) {
        if (!col.missing[r]) seen.insert(values[r]);
    }
    return seen.size();
}
