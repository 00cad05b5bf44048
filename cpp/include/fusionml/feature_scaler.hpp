#ifndef FUSIONML_FEATURE_SCALER_HPP
#define FUSIONML_FEATURE_SCALER_HPP

#include <cstddef>
#include <vector>

#include "fusionml/sample_buffer.hpp"

namespace fusionml {

class FeatureScaler {
public:
    static constexpr double kMinStddev = 1e-12;

    void fit(const std::vector<FeatureVector>& samples);
    FeatureVector transform(const FeatureVector& sample) const;
    std::vector<FeatureVector> transform_all(const std::vector<FeatureVector>& samples) const;

    bool fitted() const;
    std::size_t feature_count() const;
    const std::vector<double>& means() const;
    const std::vector<double>& stddevs() const;

private:
    std::vector<double> means_;
    std::vector<double> stddevs_;
};

}  // namespace fusionml

#endif  // FUSIONML_FEATURE_SCALER_HPP
