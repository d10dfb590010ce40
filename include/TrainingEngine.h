#pragma once
#include "Classifier.h"
#include "ClassificationMetrics.h"
#include "DatasetProfiler.h"
#include "Preprocessor.h"
#include "TypedDataset.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct CandidateSpec {
    std::string name;
    std::function<std::unique_ptr<Classifier>()> make;
};

struct CandidateResult {
    ModelMetrics metrics;
    std::vector<std::string> yTrue;
    std::vector<std::string> yPred;
};

struct TrainTestSplit {
    std::vector<size_t> train;
    std::vector<size_t> test;
    bool stratified = false;
};

/**
 * Candidates ordered best first by (balanced accuracy, macro F1) descending;
 * exact ties keep declaration order.
 */
struct RankedResults {
    std::vector<CandidateResult> ranked;
    size_t trainRows = 0;
    size_t testRows = 0;
    bool stratified = false;
};

class TrainingEngine {
public:
    /**
     * @brief Candidate list for a profile, in declaration order.
     * @post The majority-class baseline is always first.
     */
    static std::vector<CandidateSpec> selectCandidates(const DatasetProfile& profile, uint32_t seed);

    /**
     * @brief Splits row ids into train/test sets.
     * @details Stratified when there are at least two classes and each has two or more rows;
     *          otherwise a shuffled non-stratified split. Never throws for a valid fraction.
     * @pre labels.size() == rows.size() >= 2 and 0 < testFraction < 1.
     */
    static TrainTestSplit splitRows(const std::vector<size_t>& rows,
                                    const std::vector<std::string>& labels,
                                    double testFraction,
                                    uint32_t seed);

    /**
     * @brief Fits every candidate on one split and ranks their test metrics.
     * @throws Augur::DatasetException when the target is absent or fewer than two rows are labelled.
     * @throws Augur::ModelException naming the first failing candidate in declaration order.
     */
    static RankedResults train(const TypedDataset& data,
                               const std::string& target,
                               const PreprocessingSpec& spec,
                               const std::vector<CandidateSpec>& candidates,
                               uint32_t seed,
                               double testFraction,
                               bool verbose = false);

    static void rank(std::vector<CandidateResult>& results);
};
