#include "DatasetProfiler.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"

#include <algorithm>
#include <array>
#include <limits>
#include <set>

void DatasetProfile::validate() const {
    std::set<std::string> seen;
    for (const auto& name : featureTypes.numeric) {
        if (!seen.insert(name).second) throw Augur::DatasetException("Feature listed twice: " + name);
    }
    for (const auto& name : featureTypes.categorical) {
        if (!seen.insert(name).second) throw Augur::DatasetException("Feature is both numeric and categorical: " + name);
    }
    if (seen.count(target) > 0) {
        throw Augur::DatasetException("Target column listed as a feature: " + target);
    }
    for (const auto& name : columns) {
        if (name == target) continue;
        if (seen.count(name) == 0) throw Augur::DatasetException("Column missing from feature partition: " + name);
    }
    const size_t nonTarget = static_cast<size_t>(std::count_if(columns.begin(), columns.end(),
        [&](const std::string& c) { return c != target; }));
    if (seen.size() != nonTarget) {
        throw Augur::DatasetException("Feature partition names columns that do not exist");
    }
}

namespace DatasetProfiler {

std::optional<std::string> inferTargetColumn(const TypedDataset& data) {
    if (data.colCount() == 0) return std::nullopt;

    static const std::array<const char*, 5> kPreferred = {"target", "label", "class", "y", "outcome"};
    for (const char* preferred : kPreferred) {
        for (const auto& col : data.columns()) {
            if (CommonUtils::toLower(col.name) == preferred) return col.name;
        }
    }

    const size_t last = data.colCount() - 1;
    const size_t uniq = data.distinctCount(last);
    const size_t n = data.rowCount();
    if (n > 0 && (uniq <= kClassificationMaxDistinct ||
                  static_cast<double>(uniq) / static_cast<double>(std::max<size_t>(n, 1)) < 0.05)) {
        return data.columns()[last].name;
    }
    return std::nullopt;
}

DatasetProfile profileDataset(const TypedDataset& data, const std::string& target) {
    const int targetIdx = data.findColumnIndex(target);
    if (targetIdx < 0) {
        throw Augur::DatasetException("Target column '" + target + "' not found in dataset columns.");
    }

    const TypedColumn& y = data.columns()[static_cast<size_t>(targetIdx)];
    DatasetProfile profile;
    profile.shape = {data.rowCount(), data.colCount()};
    profile.columns = data.columnNames();
    profile.target = target;
    profile.targetDtype = (y.type == ColumnType::NUMERIC) ? "numeric" : "categorical";

    for (size_t c = 0; c < data.colCount(); ++c) {
        const auto& col = data.columns()[c];
        const size_t missing = static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(1)));
        const double pct = data.rowCount() == 0
            ? 0.0
            : 100.0 * static_cast<double>(missing) / static_cast<double>(data.rowCount());
        profile.missingPct[col.name] = CommonUtils::roundTo(pct, 2);
        profile.uniqueByColumn[col.name] = data.distinctCount(c);
        if (static_cast<int>(c) == targetIdx) continue;
        if (col.type == ColumnType::NUMERIC) {
            profile.featureTypes.numeric.push_back(col.name);
        } else {
            profile.featureTypes.categorical.push_back(col.name);
        }
    }

    profile.isClassification = (y.type == ColumnType::CATEGORICAL) ||
                               profile.uniqueByColumn[target] <= kClassificationMaxDistinct;

    if (profile.shape.rows < 1000) {
        profile.notes.push_back("Small dataset (<1000 rows): prefer simpler models / guard against overfitting.");
    }
    if (profile.shape.cols > 100) {
        profile.notes.push_back("High dimensionality (>100 columns): watch one-hot expansion and overfitting.");
    }

    if (profile.isClassification) {
        std::map<std::string, size_t> counts;
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (y.missing[r]) continue;
            counts[y.textAt(r)]++;
        }
        double ratio = 1.0;
        if (counts.size() >= 2) {
            size_t maxCount = 0;
            size_t minCount = std::numeric_limits<size_t>::max();
            for (const auto& kv : counts) {
                maxCount = std::max(maxCount, kv.second);
                minCount = std::min(minCount, kv.second);
            }
            ratio = static_cast<double>(maxCount) / static_cast<double>(std::max<size_t>(minCount, 1));
        }
        profile.classCounts = std::move(counts);
        profile.imbalanceRatio = CommonUtils::roundTo(ratio, 3);
        if (profile.imbalanceRatio >= kImbalanceThreshold) {
            profile.notes.push_back("Imbalance detected (ratio >= 3.0): prioritise macro metrics / balanced accuracy.");
        }
    } else {
        profile.imbalanceRatio = 1.0;
        profile.notes.push_back("Non-classification target detected: this template focuses on classification.");
    }

    profile.validate();
    return profile;
}

std::string datasetFingerprint(const TypedDataset& data, const std::string& target) {
    const std::string base = std::to_string(data.rowCount()) + "x" + std::to_string(data.colCount()) +
                             "|" + target + "|" + CommonUtils::join(data.columnNames(), ",");
    const uint64_t h = CommonUtils::fnv1a64(base) % 1000000000000ULL;
    return "fp_" + std::to_string(h);
}

} // namespace DatasetProfiler
