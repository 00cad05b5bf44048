#include "fusionml/statistical_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fusionml {

StatisticalScorer::StatisticalScorer(std::size_t min_history, double epsilon, double saturation_z)
    : min_history_(min_history), epsilon_(epsilon), saturation_z_(saturation_z) {
    if (saturation_z_ <= 0.0) {
        throw std::invalid_argument("saturation_z must be positive");
    }
}

std::size_t StatisticalScorer::min_history() const {
    return min_history_;
}

double StatisticalScorer::score(const FeatureVector& query, const std::vector<FeatureVector>& history) const {
    if (history.empty() || history.size() < min_history_) {
        return 0.0;
    }

    const std::size_t dims = query.size();
    const double count = static_cast<double>(history.size());
    double max_z = 0.0;

    for (std::size_t feature = 0; feature < dims; ++feature) {
        double sum = 0.0;
        for (const auto& sample : history) {
            if (sample.size() != dims) {
                throw std::invalid_argument("history sample dimension differs from query");
            }
            sum += sample[feature];
        }
        const double mean = sum / count;

        double sum_sq = 0.0;
        for (const auto& sample : history) {
            const double diff = sample[feature] - mean;
            sum_sq += diff * diff;
        }
        const double stddev = std::sqrt(sum_sq / count) + epsilon_;
        const double z = std::fabs((query[feature] - mean) / stddev);
        if (std::isnan(z)) {
            continue;
        }
        max_z = std::max(max_z, z);
    }

    return std::min(max_z / saturation_z_, 1.0);
}

}  // namespace fusionml
