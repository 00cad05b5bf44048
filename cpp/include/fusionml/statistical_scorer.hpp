#ifndef FUSIONML_STATISTICAL_SCORER_HPP
#define FUSIONML_STATISTICAL_SCORER_HPP

#include <cstddef>
#include <vector>

#include "fusionml/sample_buffer.hpp"

namespace fusionml {

class StatisticalScorer {
public:
    explicit StatisticalScorer(std::size_t min_history = 5, double epsilon = 1e-6, double saturation_z = 3.0);

    double score(const FeatureVector& query, const std::vector<FeatureVector>& history) const;

    std::size_t min_history() const;

private:
    std::size_t min_history_ = 5;
    double epsilon_ = 1e-6;
    double saturation_z_ = 3.0;
};

}  // namespace fusionml

#endif  // FUSIONML_STATISTICAL_SCORER_HPP
