#ifndef FUSIONML_ENSEMBLE_HPP
#define FUSIONML_ENSEMBLE_HPP

#include <cstddef>
#include <memory>
#include <random>
#include <vector>

#include "fusionml/config.hpp"
#include "fusionml/sample_buffer.hpp"

namespace fusionml {

struct IsolationNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    int depth = 0;
    std::size_t size = 0;

    bool leaf() const { return feature < 0; }
};

double average_path_length(std::size_t n);

class IsolationTree {
public:
    static IsolationTree build(const std::vector<FeatureVector>& data, std::vector<std::size_t> indices,
                               int max_depth, std::mt19937& rng);

    double path_length(const FeatureVector& sample) const;

    std::size_t node_count() const;
    int height() const;

private:
    int grow(const std::vector<FeatureVector>& data, const std::vector<std::size_t>& indices, int depth,
             int max_depth, std::mt19937& rng);

    std::vector<IsolationNode> nodes_;
};

class PartitioningEnsemble {
public:
    explicit PartitioningEnsemble(EnsembleParams params = {});

    bool fit(const std::vector<FeatureVector>& samples);
    bool trained() const;
    double score(const FeatureVector& sample) const;
    double decision_value(const FeatureVector& sample) const;

    double offset() const;
    std::size_t training_size() const;
    std::size_t subsample_size() const;
    std::size_t feature_count() const;
    std::size_t tree_count() const;
    const EnsembleParams& params() const;

private:
    bool build(const std::vector<FeatureVector>& samples);
    double mean_path_length(const FeatureVector& sample) const;

    EnsembleParams params_;
    std::vector<IsolationTree> trees_;
    std::size_t training_size_ = 0;
    std::size_t subsample_size_ = 0;
    std::size_t feature_count_ = 0;
    double normalizer_ = 1.0;
    double offset_ = 0.5;
    bool trained_ = false;
};

class EnsembleTrainer {
public:
    explicit EnsembleTrainer(EnsembleParams params = {});
    virtual ~EnsembleTrainer() = default;

    virtual std::shared_ptr<const PartitioningEnsemble> train(const std::vector<FeatureVector>& scaled) const;

    const EnsembleParams& params() const;

protected:
    EnsembleParams params_;
};

}  // namespace fusionml

#endif  // FUSIONML_ENSEMBLE_HPP
