#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief Seeded isolation forest with automatic contamination (score > 0.5 is anomalous).
 * @details Each tree draws min(maxSamples, n) rows without replacement and grows to depth
 *          ceil(log2(samples)). Per-tree seeds are drawn from the forest seed before the
 *          parallel build, so scores do not depend on the OpenMP thread count.
 */
class IsolationForest {
public:
    static constexpr double kAnomalyScoreThreshold = 0.5;

    IsolationForest(size_t trees = 100, size_t maxSamples = 256, uint32_t seed = 42);

    /**
     * @brief Builds the ensemble over row-major samples.
     * @throws Nika::ModelingException on empty input, ragged rows, zero features or non-finite values.
     */
    void fit(const std::vector<std::vector<double>>& rows);

    /**
     * @brief Anomaly score 2^(-E[h(x)]/c(samples)) per row, in (0, 1].
     * @throws Nika::ModelingException when called before fit() or on a feature-count mismatch.
     */
    std::vector<double> scoreSamples(const std::vector<std::vector<double>>& rows) const;

    /**
     * @brief Positions (into rows) whose score exceeds kAnomalyScoreThreshold, ascending.
     */
    std::vector<size_t> detect(const std::vector<std::vector<double>>& rows) const;

    /**
     * @brief Average unsuccessful-search path length in a BST of n nodes: c(n).
     */
    static double averagePathLength(size_t n);

    size_t treeCount() const noexcept { return trees_.size(); }
    size_t samplesPerTree() const noexcept { return samplesPerTree_; }

private:
    struct Node {
        int feature = -1;        // -1 marks a leaf
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0;
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    size_t requestedTrees_;
    size_t maxSamples_;
    uint32_t seed_;
    size_t features_ = 0;
    size_t samplesPerTree_ = 0;
    std::vector<Tree> trees_;

    static Tree buildTree(const std::vector<std::vector<double>>& rows,
                          std::vector<size_t> sample,
                          size_t maxDepth,
                          uint32_t treeSeed);
    static double pathLength(const Tree& tree, const std::vector<double>& row);
};
