#pragma once
#include "TypedDataset.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct DatasetShape {
    size_t rows = 0;
    size_t cols = 0;

    bool operator==(const DatasetShape& other) const { return rows == other.rows && cols == other.cols; }
    bool operator!=(const DatasetShape& other) const { return !(*this == other); }
};

struct FeatureTypes {
    std::vector<std::string> numeric;
    std::vector<std::string> categorical;
};

/**
 * Structural snapshot of one dataset for one resolved target.
 * Invariant: numeric and categorical are disjoint and together cover every non-target column.
 */
struct DatasetProfile {
    DatasetShape shape;
    std::vector<std::string> columns;
    std::map<std::string, double> missingPct;
    std::string target;
    std::string targetDtype;
    bool isClassification = false;
    FeatureTypes featureTypes;
    std::map<std::string, size_t> uniqueByColumn;
    std::vector<std::string> notes;
    std::optional<std::map<std::string, size_t>> classCounts;
    double imbalanceRatio = 1.0;

    /**
     * @brief Checks the feature partition invariant.
     * @throws Augur::DatasetException when the partition is not disjoint and exhaustive.
     */
    void validate() const;
};

namespace DatasetProfiler {

constexpr double kImbalanceThreshold = 3.0;
constexpr size_t kClassificationMaxDistinct = 50;

/**
 * @brief Picks a likely target column or returns std::nullopt.
 * @details Prefers conventional target names, otherwise the last column when it is low-cardinality.
 */
std::optional<std::string> inferTargetColumn(const TypedDataset& data);

/**
 * @brief Builds the structural profile for a dataset and target.
 * @throws Augur::DatasetException when the target column does not exist.
 */
DatasetProfile profileDataset(const TypedDataset& data, const std::string& target);

/**
 * @brief Deterministic key derived from shape, target and ordered column names.
 */
std::string datasetFingerprint(const TypedDataset& data, const std::string& target);

} // namespace DatasetProfiler
