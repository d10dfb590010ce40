#pragma once
#include "AgentConfig.h"
#include "ClassificationMetrics.h"
#include <string>

class GnuplotEngine {
public:
    /**
     * @brief Binds the engine to an existing output directory.
     */
    GnuplotEngine(std::string assetsDir, PlotConfig cfg);

    /**
     * @brief Checks whether gnuplot executable is available in PATH.
     */
    bool isAvailable() const;

    /**
     * @brief Renders a confusion matrix as an annotated heatmap (rows true, columns predicted).
     * @post Returns output image path, or empty string on generation failure.
     */
    std::string confusionMatrix(const std::string& id, const ConfusionMatrix& cm, const std::string& title);

    /**
     * @brief Self-contained gnuplot script for the heatmap; counts travel in a `$counts` datablock.
     * @pre cm.labels is non-empty.
     */
    static std::string heatmapScript(const ConfusionMatrix& cm,
                                     const std::string& title,
                                     const std::string& outputPath,
                                     const PlotConfig& cfg);

private:
    std::string assetsDir_;
    PlotConfig cfg_;
};
