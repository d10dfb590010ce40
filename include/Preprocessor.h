#pragma once
#include "DatasetProfiler.h"
#include "TypedDataset.h"
#include <string>
#include <unordered_map>
#include <vector>

using Matrix = std::vector<std::vector<double>>;

struct ScalingParams {
    double median = 0.0;
    double mean = 0.0;
    double stddev = 1.0;
};

struct CategoryEncoding {
    std::string mostFrequent;
    std::vector<std::string> categories;
};

/**
 * Which columns feed the model and how. Built from the profile's feature partition.
 */
struct PreprocessingSpec {
    std::vector<std::string> numericColumns;
    std::vector<std::string> categoricalColumns;
};

class Preprocessor {
public:
    static PreprocessingSpec buildSpec(const DatasetProfile& profile);

    explicit Preprocessor(PreprocessingSpec spec);

    /**
     * @brief Learns medians, scaling and category vocabularies from the given rows.
     * @throws Augur::DatasetException when a configured column is absent or has the wrong type.
     */
    void fit(const TypedDataset& data, const std::vector<size_t>& rows);

    /**
     * @brief Encodes rows into a dense design matrix.
     * @pre fit() has been called.
     * @post Unseen categories encode as all-zero indicator blocks.
     */
    Matrix transform(const TypedDataset& data, const std::vector<size_t>& rows) const;

    size_t outputWidth() const noexcept { return outputWidth_; }
    const PreprocessingSpec& spec() const noexcept { return spec_; }

private:
    PreprocessingSpec spec_;
    std::vector<size_t> numericIdx_;
    std::vector<size_t> categoricalIdx_;
    std::vector<ScalingParams> scaling_;
    std::vector<CategoryEncoding> encodings_;
    std::vector<std::unordered_map<std::string, size_t>> categoryOffsets_;
    size_t outputWidth_ = 0;
    bool fitted_ = false;
};
