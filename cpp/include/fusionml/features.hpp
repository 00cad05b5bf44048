#ifndef FUSIONML_FEATURES_HPP
#define FUSIONML_FEATURES_HPP

#include <array>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "fusionml/sample_buffer.hpp"

namespace fusionml {

constexpr std::size_t kSensorFeatureCount = 14;

extern const std::array<const char*, kSensorFeatureCount> kSensorFeatureNames;

FeatureVector extract_features(const nlohmann::json& payload);

FeatureVector extract_features_from_text(const std::string& payload);

}  // namespace fusionml

#endif  // FUSIONML_FEATURES_HPP
