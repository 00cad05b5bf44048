#include "fusionml/ensemble.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace fusionml {

namespace {

constexpr double kEulerGamma = 0.5772156649;

double quantile(std::vector<double> values, double q) {
    std::sort(values.begin(), values.end());
    const double position = q * static_cast<double>(values.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(position));
    const auto upper = std::min(lower + 1, values.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return values[lower] + fraction * (values[upper] - values[lower]);
}

bool well_formed(const std::vector<FeatureVector>& samples) {
    const std::size_t dims = samples.front().size();
    if (dims == 0) {
        return false;
    }
    for (const auto& sample : samples) {
        if (sample.size() != dims) {
            return false;
        }
        for (double value : sample) {
            if (!std::isfinite(value)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace

double average_path_length(std::size_t n) {
    if (n <= 1) {
        return 0.0;
    }
    if (n == 2) {
        return 1.0;
    }
    const double size = static_cast<double>(n);
    return 2.0 * (std::log(size - 1.0) + kEulerGamma) - 2.0 * (size - 1.0) / size;
}

IsolationTree IsolationTree::build(const std::vector<FeatureVector>& data, std::vector<std::size_t> indices,
                                   int max_depth, std::mt19937& rng) {
    IsolationTree tree;
    tree.grow(data, indices, 0, max_depth, rng);
    return tree;
}

int IsolationTree::grow(const std::vector<FeatureVector>& data, const std::vector<std::size_t>& indices,
                        int depth, int max_depth, std::mt19937& rng) {
    const int index = static_cast<int>(nodes_.size());
    IsolationNode node;
    node.depth = depth;
    node.size = indices.size();
    nodes_.push_back(node);

    if (indices.size() <= 1 || depth >= max_depth) {
        return index;
    }

    // Only features that still vary inside this node can separate anything.
    const std::size_t dims = data[indices.front()].size();
    std::vector<std::pair<std::size_t, std::pair<double, double>>> candidates;
    for (std::size_t feature = 0; feature < dims; ++feature) {
        double lo = data[indices.front()][feature];
        double hi = lo;
        for (std::size_t idx : indices) {
            lo = std::min(lo, data[idx][feature]);
            hi = std::max(hi, data[idx][feature]);
        }
        if (hi > lo) {
            candidates.push_back({feature, {lo, hi}});
        }
    }
    if (candidates.empty()) {
        return index;
    }

    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    const auto& [feature, range] = candidates[pick(rng)];
    std::uniform_real_distribution<double> split(range.first, range.second);
    const double threshold = split(rng);

    std::vector<std::size_t> left;
    std::vector<std::size_t> right;
    for (std::size_t idx : indices) {
        if (data[idx][feature] < threshold) {
            left.push_back(idx);
        } else {
            right.push_back(idx);
        }
    }

    const int left_index = grow(data, left, depth + 1, max_depth, rng);
    const int right_index = grow(data, right, depth + 1, max_depth, rng);

    nodes_[index].feature = static_cast<int>(feature);
    nodes_[index].threshold = threshold;
    nodes_[index].left = left_index;
    nodes_[index].right = right_index;
    return index;
}

double IsolationTree::path_length(const FeatureVector& sample) const {
    if (nodes_.empty()) {
        throw std::logic_error("path_length on an empty tree");
    }
    int index = 0;
    while (!nodes_[index].leaf()) {
        const auto& node = nodes_[index];
        index = sample[static_cast<std::size_t>(node.feature)] < node.threshold ? node.left : node.right;
    }
    const auto& leaf = nodes_[index];
    return static_cast<double>(leaf.depth) + average_path_length(leaf.size);
}

std::size_t IsolationTree::node_count() const {
    return nodes_.size();
}

int IsolationTree::height() const {
    int height = 0;
    for (const auto& node : nodes_) {
        height = std::max(height, node.depth);
    }
    return height;
}

PartitioningEnsemble::PartitioningEnsemble(EnsembleParams params) : params_(std::move(params)) {}

bool PartitioningEnsemble::fit(const std::vector<FeatureVector>& samples) {
    trained_ = false;
    trees_.clear();
    if (samples.size() < static_cast<std::size_t>(std::max(params_.min_training_samples, 2))) {
        return false;
    }
    if (!well_formed(samples)) {
        return false;
    }
    try {
        trained_ = build(samples);
    } catch (const std::exception&) {
        trained_ = false;
    }
    if (!trained_) {
        trees_.clear();
    }
    return trained_;
}

bool PartitioningEnsemble::build(const std::vector<FeatureVector>& samples) {
    if (params_.n_estimators <= 0) {
        return false;
    }
    const std::size_t total = samples.size();
    std::size_t psi = total;
    if (params_.max_samples.has_value() && params_.max_samples.value() > 1) {
        psi = std::min(total, static_cast<std::size_t>(params_.max_samples.value()));
    }
    const int max_depth = static_cast<int>(std::ceil(std::log2(static_cast<double>(psi))));

    std::mt19937 rng(params_.random_seed);
    std::vector<std::size_t> order(total);
    std::iota(order.begin(), order.end(), 0);

    std::vector<IsolationTree> trees;
    trees.reserve(static_cast<std::size_t>(params_.n_estimators));
    for (int t = 0; t < params_.n_estimators; ++t) {
        std::vector<std::size_t> subsample;
        subsample.reserve(psi);
        if (params_.bootstrap) {
            std::uniform_int_distribution<std::size_t> draw(0, total - 1);
            for (std::size_t i = 0; i < psi; ++i) {
                subsample.push_back(draw(rng));
            }
        } else {
            // Partial Fisher-Yates: the first psi slots become a uniform sample.
            for (std::size_t i = 0; i < psi; ++i) {
                std::uniform_int_distribution<std::size_t> draw(i, total - 1);
                std::swap(order[i], order[draw(rng)]);
            }
            subsample.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(psi));
        }
        trees.push_back(IsolationTree::build(samples, std::move(subsample), max_depth, rng));
    }

    trees_ = std::move(trees);
    training_size_ = total;
    subsample_size_ = psi;
    feature_count_ = samples.front().size();
    normalizer_ = average_path_length(psi);
    if (!(normalizer_ > 0.0)) {
        return false;
    }

    offset_ = 0.5;
    if (params_.contamination.has_value()) {
        std::vector<double> training_scores;
        training_scores.reserve(total);
        for (const auto& sample : samples) {
            training_scores.push_back(std::pow(2.0, -mean_path_length(sample) / normalizer_));
        }
        offset_ = quantile(std::move(training_scores), 1.0 - params_.contamination.value());
    }
    return std::isfinite(offset_);
}

double PartitioningEnsemble::mean_path_length(const FeatureVector& sample) const {
    double total = 0.0;
    for (const auto& tree : trees_) {
        total += tree.path_length(sample);
    }
    return total / static_cast<double>(trees_.size());
}

bool PartitioningEnsemble::trained() const {
    return trained_;
}

double PartitioningEnsemble::score(const FeatureVector& sample) const {
    if (!trained_) {
        throw std::logic_error("ensemble scored before a successful fit");
    }
    if (sample.size() != feature_count_) {
        throw std::invalid_argument("sample dimension " + std::to_string(sample.size()) +
                                    " does not match ensemble dimension " + std::to_string(feature_count_));
    }
    return std::pow(2.0, -mean_path_length(sample) / normalizer_);
}

double PartitioningEnsemble::decision_value(const FeatureVector& sample) const {
    return offset_ - score(sample);
}

double PartitioningEnsemble::offset() const {
    return offset_;
}

std::size_t PartitioningEnsemble::training_size() const {
    return training_size_;
}

std::size_t PartitioningEnsemble::subsample_size() const {
    return subsample_size_;
}

std::size_t PartitioningEnsemble::feature_count() const {
    return feature_count_;
}

std::size_t PartitioningEnsemble::tree_count() const {
    return trees_.size();
}

const EnsembleParams& PartitioningEnsemble::params() const {
    return params_;
}

EnsembleTrainer::EnsembleTrainer(EnsembleParams params) : params_(std::move(params)) {}

std::shared_ptr<const PartitioningEnsemble> EnsembleTrainer::train(const std::vector<FeatureVector>& scaled) const {
    auto ensemble = std::make_shared<PartitioningEnsemble>(params_);
    if (!ensemble->fit(scaled)) {
        return nullptr;
    }
    return ensemble;
}

const EnsembleParams& EnsembleTrainer::params() const {
    return params_;
}

}  // namespace fusionml
