#include "IsolationForest.h"
#include "NikaExceptions.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <random>
#include <string>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kEulerGamma = 0.5772156649015329;

struct PendingNode {
    int node;
    size_t begin;
    size_t end;
    size_t depth;
};
} // namespace

IsolationForest::IsolationForest(size_t trees, size_t maxSamples, uint32_t seed)
    : requestedTrees_(trees), maxSamples_(maxSamples), seed_(seed) {
    if (requestedTrees_ == 0) throw Nika::ModelingException("isolation forest needs at least one tree");
    if (maxSamples_ < 2) throw Nika::ModelingException("isolation forest needs at least two samples per tree");
}

double IsolationForest::averagePathLength(size_t n) {
    if (n <= 1) return 0.0;
    if (n == 2) return 1.0;
    const double nd = static_cast<double>(n);
    return 2.0 * (std::log(nd - 1.0) + kEulerGamma) - 2.0 * (nd - 1.0) / nd;
}

IsolationForest::Tree IsolationForest::buildTree(const std::vector<std::vector<double>>& rows,
                                                 std::vector<size_t> sample,
                                                 size_t maxDepth,
                                                 uint32_t treeSeed) {
    std::mt19937 rng(treeSeed);
    const size_t features = rows.front().size();

    Tree tree;
    tree.nodes.push_back(Node{});
    std::vector<PendingNode> stack{{0, 0, sample.size(), 0}};
    std::vector<size_t> candidates;
    candidates.reserve(features);

    while (!stack.empty()) {
        const PendingNode item = stack.back();
        stack.pop_back();
        tree.nodes[static_cast<size_t>(item.node)].size = item.end - item.begin;

        if (item.depth >= maxDepth || item.end - item.begin <= 1) continue;

        // Only features that still vary inside this node can split it.
        candidates.clear();
        std::vector<std::pair<double, double>> ranges(features);
        for (size_t f = 0; f < features; ++f) {
            double lo = rows[sample[item.begin]][f];
            double hi = lo;
            for (size_t i = item.begin + 1; i < item.end; ++i) {
                const double v = rows[sample[i]][f];
                lo = std::min(lo, v);
                hi = std::max(hi, v);
            }
            ranges[f] = {lo, hi};
            if (hi > lo) candidates.push_back(f);
        }
        if (candidates.empty()) continue;

        std::uniform_int_distribution<size_t> pickFeature(0, candidates.size() - 1);
        const size_t feature = candidates[pickFeature(rng)];
        std::uniform_real_distribution<double> pickThreshold(ranges[feature].first, ranges[feature].second);
        const double threshold = pickThreshold(rng);

        auto first = sample.begin() + static_cast<std::ptrdiff_t>(item.begin);
        auto last = sample.begin() + static_cast<std::ptrdiff_t>(item.end);
        auto mid = std::partition(first, last, [&](size_t r) { return rows[r][feature] < threshold; });
        const size_t split = static_cast<size_t>(std::distance(sample.begin(), mid));
        if (split == item.begin || split == item.end) continue;

        const int left = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(Node{});
        const int right = static_cast<int>(tree.nodes.size());
        tree.nodes.push_back(Node{});

        Node& node = tree.nodes[static_cast<size_t>(item.node)];
        node.feature = static_cast<int>(feature);
        node.threshold = threshold;
        node.left = left;
        node.right = right;

        stack.push_back({right, split, item.end, item.depth + 1});
        stack.push_back({left, item.begin, split, item.depth + 1});
    }
    return tree;
}

double IsolationForest::pathLength(const Tree& tree, const std::vector<double>& row) {
    size_t depth = 0;
    const Node* node = &tree.nodes.front();
    while (node->feature >= 0) {
        const int next = row[static_cast<size_t>(node->feature)] < node->threshold ? node->left : node->right;
        node = &tree.nodes[static_cast<size_t>(next)];
        ++depth;
    }
    return static_cast<double>(depth) + averagePathLength(node->size);
}

void IsolationForest::fit(const std::vector<std::vector<double>>& rows) {
    trees_.clear();
    if (rows.empty()) throw Nika::ModelingException("isolation forest cannot fit an empty sample");
    features_ = rows.front().size();
    if (features_ == 0) throw Nika::ModelingException("isolation forest needs at least one feature");
    for (const auto& row : rows) {
        if (row.size() != features_) throw Nika::ModelingException("ragged feature rows");
        for (double v : row) {
            if (!std::isfinite(v)) throw Nika::ModelingException("feature rows contain non-finite values");
        }
    }

    samplesPerTree_ = std::min(maxSamples_, rows.size());
    const size_t maxDepth = static_cast<size_t>(std::ceil(std::log2(std::max<double>(2.0, static_cast<double>(samplesPerTree_)))));

    std::mt19937 master(seed_);
    std::vector<uint32_t> treeSeeds(requestedTrees_);
    for (auto& s : treeSeeds) s = static_cast<uint32_t>(master());

    std::vector<size_t> all(rows.size());
    std::iota(all.begin(), all.end(), 0);

    trees_.resize(requestedTrees_);
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long t = 0; t < static_cast<long long>(requestedTrees_); ++t) {
        const size_t idx = static_cast<size_t>(t);
        std::vector<size_t> sample;
        if (samplesPerTree_ < rows.size()) {
            std::mt19937 sampler(treeSeeds[idx] ^ 0x9E3779B9u);
            sample.reserve(samplesPerTree_);
            std::sample(all.begin(), all.end(), std::back_inserter(sample), samplesPerTree_, sampler);
        } else {
            sample = all;
        }
        trees_[idx] = buildTree(rows, std::move(sample), maxDepth, treeSeeds[idx]);
    }
}

std::vector<double> IsolationForest::scoreSamples(const std::vector<std::vector<double>>& rows) const {
    if (trees_.empty()) throw Nika::ModelingException("isolation forest scored before fit");

    const double norm = averagePathLength(samplesPerTree_);
    std::vector<double> scores(rows.size(), 0.0);
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != features_) {
            throw Nika::ModelingException("row " + std::to_string(i) + " has " + std::to_string(rows[i].size()) +
                                          " features, expected " + std::to_string(features_));
        }
        double total = 0.0;
        for (const auto& tree : trees_) total += pathLength(tree, rows[i]);
        const double meanPath = total / static_cast<double>(trees_.size());
        // A single-row sample has no reference path length and is never anomalous.
        scores[i] = (norm > 0.0) ? std::pow(2.0, -meanPath / norm) : kAnomalyScoreThreshold;
    }
    return scores;
}

std::vector<size_t> IsolationForest::detect(const std::vector<std::vector<double>>& rows) const {
    const std::vector<double> scores = scoreSamples(rows);
    std::vector<size_t> out;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (scores[i] > kAnomalyScoreThreshold) out.push_back(i);
    }
    return out;
}
