#include "fusionml/feature_scaler.hpp"

#include <cmath>
#include <stdexcept>

namespace fusionml {

void FeatureScaler::fit(const std::vector<FeatureVector>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("cannot fit scaler on an empty snapshot");
    }
    const std::size_t dims = samples.front().size();
    if (dims == 0) {
        throw std::invalid_argument("cannot fit scaler on zero-dimensional samples");
    }

    std::vector<double> means(dims, 0.0);
    for (const auto& sample : samples) {
        if (sample.size() != dims) {
            throw std::invalid_argument("ragged snapshot passed to scaler");
        }
        for (std::size_t i = 0; i < dims; ++i) {
            means[i] += sample[i];
        }
    }
    const double count = static_cast<double>(samples.size());
    for (double& mean : means) {
        mean /= count;
    }

    std::vector<double> stddevs(dims, 0.0);
    for (const auto& sample : samples) {
        for (std::size_t i = 0; i < dims; ++i) {
            const double diff = sample[i] - means[i];
            stddevs[i] += diff * diff;
        }
    }
    for (double& stddev : stddevs) {
        stddev = std::sqrt(stddev / count);
        if (!(stddev >= kMinStddev)) {
            stddev = kMinStddev;
        }
    }

    means_ = std::move(means);
    stddevs_ = std::move(stddevs);
}

FeatureVector FeatureScaler::transform(const FeatureVector& sample) const {
    if (!fitted()) {
        throw std::logic_error("scaler used before fit");
    }
    if (sample.size() != means_.size()) {
        throw std::invalid_argument("sample dimension " + std::to_string(sample.size()) +
                                    " does not match scaler dimension " + std::to_string(means_.size()));
    }
    FeatureVector scaled(sample.size());
    for (std::size_t i = 0; i < sample.size(); ++i) {
        scaled[i] = (sample[i] - means_[i]) / stddevs_[i];
    }
    return scaled;
}

std::vector<FeatureVector> FeatureScaler::transform_all(const std::vector<FeatureVector>& samples) const {
    std::vector<FeatureVector> scaled;
    scaled.reserve(samples.size());
    for (const auto& sample : samples) {
        scaled.push_back(transform(sample));
    }
    return scaled;
}

bool FeatureScaler::fitted() const {
    return !means_.empty();
}

std::size_t FeatureScaler::feature_count() const {
    return means_.size();
}

const std::vector<double>& FeatureScaler::means() const {
    return means_;
}

const std::vector<double>& FeatureScaler::stddevs() const {
    return stddevs_;
}

}  // namespace fusionml
