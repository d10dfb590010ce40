#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    /**
     * @brief Cell rendered as text; numeric cells print integral values without decimals.
     * @pre row < missing.size() and the cell is not missing.
     */
    std::string textAt(size_t row) const;
};

class TypedDataset {
public:
    explicit TypedDataset(std::string filename, char delimiter = ',');

    /**
     * @brief Loads CSV content and infers per-column types.
     * @details Tokenization is delegated to CSVUtils; this class owns type inference and typed storage.
     * @pre file exists and is readable.
     * @post columns() is populated with aligned typed vectors and missing masks.
     * @throws Augur::DatasetException when the file cannot be opened, has no header or no data rows.
     */
    void load();

    /**
     * @brief Builds a dataset directly from a header and raw rows (no file IO).
     * @throws Augur::DatasetException on an empty header.
     */
    static TypedDataset fromRows(const std::vector<std::string>& header,
                                 const std::vector<std::vector<std::string>>& rows);

    const std::string& filename() const noexcept { return filename_; }
    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<std::string> columnNames() const;

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Number of distinct non-missing values in a column.
     */
    size_t distinctCount(size_t columnIndex) const;

private:
    std::string filename_;
    char delimiter_;
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;

    void buildColumns(const std::vector<std::string>& header,
                      const std::vector<std::vector<std::string>>& rows);
};

namespace DatasetParsing {
bool isMissingToken(const std::string& raw);
bool parseDouble(const std::string& raw, double& out);
std::string formatNumber(double value);
}
