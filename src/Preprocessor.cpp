#include "Preprocessor.h"
#include "AugurExceptions.h"
#include "CommonUtils.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace {
constexpr double kNumericEpsilon = 1e-12;

size_t requireColumn(const TypedDataset& data, const std::string& name, ColumnType expected) {
    const int idx = data.findColumnIndex(name);
    if (idx < 0) throw Augur::DatasetException("Preprocessing column not found: " + name);
    if (data.columns()[static_cast<size_t>(idx)].type != expected) {
        throw Augur::DatasetException("Preprocessing column has unexpected type: " + name);
    }
    return static_cast<size_t>(idx);
}
} // namespace

PreprocessingSpec Preprocessor::buildSpec(const DatasetProfile& profile) {
    PreprocessingSpec spec;
    spec.numericColumns = profile.featureTypes.numeric;
    spec.categoricalColumns = profile.featureTypes.categorical;
    return spec;
}

Preprocessor::Preprocessor(PreprocessingSpec spec) : spec_(std::move(spec)) {}

void Preprocessor::fit(const TypedDataset& data, const std::vector<size_t>& rows) {
    numericIdx_.clear();
    categoricalIdx_.clear();
    scaling_.clear();
    encodings_.clear();
    categoryOffsets_.clear();

    for (const auto& name : spec_.numericColumns) {
        const size_t idx = requireColumn(data, name, ColumnType::NUMERIC);
        numericIdx_.push_back(idx);

        const auto& col = data.columns()[idx];
        const auto& values = std::get<std::vector<double>>(col.values);
        std::vector<double> observed;
        observed.reserve(rows.size());
        for (size_t r : rows) {
            if (!col.missing[r]) observed.push_back(values[r]);
        }

        ScalingParams params;
        params.median = CommonUtils::medianByNth(observed);
        // Mean and stddev are over the imputed column.
        double sum = 0.0;
        for (size_t r : rows) sum += col.missing[r] ? params.median : values[r];
        params.mean = rows.empty() ? 0.0 : sum / static_cast<double>(rows.size());
        double ss = 0.0;
        for (size_t r : rows) {
            const double d = (col.missing[r] ? params.median : values[r]) - params.mean;
            ss += d * d;
        }
        params.stddev = rows.empty() ? 1.0 : std::sqrt(ss / static_cast<double>(rows.size()));
        if (params.stddev < kNumericEpsilon) params.stddev = 1.0;
        scaling_.push_back(params);
    }

    size_t offset = numericIdx_.size();
    for (const auto& name : spec_.categoricalColumns) {
        const size_t idx = requireColumn(data, name, ColumnType::CATEGORICAL);
        categoricalIdx_.push_back(idx);

        const auto& col = data.columns()[idx];
        const auto& values = std::get<std::vector<std::string>>(col.values);
        std::map<std::string, size_t> freq;
        for (size_t r : rows) {
            if (!col.missing[r]) freq[values[r]]++;
        }

        CategoryEncoding enc;
        size_t best = 0;
        for (const auto& kv : freq) {
            if (kv.second > best) {
                best = kv.second;
                enc.mostFrequent = kv.first;
            }
        }
        for (const auto& kv : freq) enc.categories.push_back(kv.first);
        if (enc.categories.empty()) {
            enc.mostFrequent = "missing";
            enc.categories.push_back(enc.mostFrequent);
        }

        std::unordered_map<std::string, size_t> offsets;
        for (size_t i = 0; i < enc.categories.size(); ++i) offsets[enc.categories[i]] = offset + i;
        offset += enc.categories.size();
        encodings_.push_back(std::move(enc));
        categoryOffsets_.push_back(std::move(offsets));
    }

    outputWidth_ = offset;
    fitted_ = true;
}

Matrix Preprocessor::transform(const TypedDataset& data, const std::vector<size_t>& rows) const {
    if (!fitted_) throw Augur::ModelException("Preprocessor used before fit");

    Matrix X(rows.size(), std::vector<double>(outputWidth_, 0.0));
    for (size_t j = 0; j < numericIdx_.size(); ++j) {
        const auto& col = data.columns()[numericIdx_[j]];
        const auto& values = std::get<std::vector<double>>(col.values);
        const ScalingParams& p = scaling_[j];
        for (size_t i = 0; i < rows.size(); ++i) {
            const double raw = col.missing[rows[i]] ? p.median : values[rows[i]];
            X[i][j] = (raw - p.mean) / p.stddev;
        }
    }

    for (size_t j = 0; j < categoricalIdx_.size(); ++j) {
        const auto& col = data.columns()[categoricalIdx_[j]];
        const auto& values = std::get<std::vector<std::string>>(col.values);
        const auto& offsets = categoryOffsets_[j];
        for (size_t i = 0; i < rows.size(); ++i) {
            const std::string& raw = col.missing[rows[i]] ? encodings_[j].mostFrequent : values[rows[i]];
            auto it = offsets.find(raw);
            if (it != offsets.end()) X[i][it->second] = 1.0;
        }
    }
    return X;
}
