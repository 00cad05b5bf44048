#include "fusionml/features.hpp"

#include <cmath>
#include <stdexcept>

#include "fusionml/logging.hpp"

namespace fusionml {

const std::array<const char*, kSensorFeatureCount> kSensorFeatureNames = {
    "accel_x",   "accel_y",       "accel_z",   "gyro_x",     "gyro_y",    "gyro_z",     "roll_deg",
    "pitch_deg", "yaw_deg",       "velocity",  "gps_speed",  "gps_heading", "confidence", "system_health",
};

namespace {

double number_field(const nlohmann::json& object, const char* key, double fallback) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("field ") + key + " is not numeric");
    }
    return it->get<double>();
}

const nlohmann::json& object_field(const nlohmann::json& object, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("field ") + key + " is not an object");
    }
    return *it;
}

void append_vector3(FeatureVector& features, const nlohmann::json& vector) {
    features.push_back(number_field(vector, "x", 0.0));
    features.push_back(number_field(vector, "y", 0.0));
    features.push_back(number_field(vector, "z", 0.0));
}

}  // namespace

FeatureVector extract_features(const nlohmann::json& payload) {
    FeatureVector features;
    features.reserve(kSensorFeatureCount);
    try {
        if (!payload.is_object()) {
            throw std::invalid_argument("sensor payload is not an object");
        }
        append_vector3(features, object_field(payload, "raw_acceleration"));
        append_vector3(features, object_field(payload, "raw_gyroscope"));

        const auto euler = payload.find("euler_degrees");
        if (euler != payload.end() && euler->is_array() && euler->size() >= 3) {
            for (std::size_t i = 0; i < 3; ++i) {
                const auto& angle = (*euler)[i];
                if (!angle.is_number()) {
                    throw std::invalid_argument("euler_degrees holds a non-numeric angle");
                }
                features.push_back(angle.get<double>());
            }
        } else {
            features.insert(features.end(), {0.0, 0.0, 0.0});
        }

        const auto& velocity = object_field(payload, "velocity");
        const double vx = number_field(velocity, "x", 0.0);
        const double vy = number_field(velocity, "y", 0.0);
        const double vz = number_field(velocity, "z", 0.0);
        features.push_back(std::sqrt(vx * vx + vy * vy + vz * vz));

        features.push_back(number_field(payload, "gps_speed", 0.0));
        features.push_back(number_field(payload, "gps_heading", 0.0));
        features.push_back(number_field(payload, "confidence", 1.0));
        features.push_back(number_field(payload, "system_health", 1.0));
    } catch (const std::exception& exc) {
        get_logger("FeatureExtraction").error("feature_extraction_failed", {{"error", exc.what()}});
        return FeatureVector(kSensorFeatureCount, 0.0);
    }
    return features;
}

FeatureVector extract_features_from_text(const std::string& payload) {
    try {
        return extract_features(nlohmann::json::parse(payload));
    } catch (const nlohmann::json::parse_error& exc) {
        get_logger("FeatureExtraction").error("feature_payload_decode_failed", {{"error", exc.what()}});
        return FeatureVector(kSensorFeatureCount, 0.0);
    }
}

}  // namespace fusionml
