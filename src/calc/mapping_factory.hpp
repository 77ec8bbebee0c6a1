#pragma once
#include "../core/errors.hpp"
#include "mapping_strategy.hpp"
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace detail {

template<std::size_t N>
std::array<double, N> coefficients_from_json(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_array() || j[key].size() != N) {
        throw ConfigError("mapping." + key, "expected an array of " + std::to_string(N) + " numbers");
    }
    std::array<double, N> c{};
    for (std::size_t i = 0; i < N; ++i) {
        if (!j[key][i].is_number()) {
            throw ConfigError("mapping." + key, "coefficient " + std::to_string(i) + " is not a number");
        }
        c[i] = j[key][i].get<double>();
    }
    return c;
}

} // namespace detail

/**
 * @brief Build a mapping strategy from its JSON description
 *
 * {"kind": "nearest_neighbor"}
 * {"kind": "linear_interpolation"}
 * {"kind": "linear_calibration", "x": [c0,c1,c2,c3], "y": [...]}
 * {"kind": "quadratic_calibration", "x": [10 coefficients], "y": [...]}
 *
 * A null document selects linear interpolation. Custom strategies cannot be
 * configured and must be constructed in code.
 *
 * @throws ConfigError on unknown kinds or wrong coefficient counts
 */
inline std::unique_ptr<IMappingStrategy> make_mapping_strategy(const nlohmann::json& j) {
    if (j.is_null()) {
        return std::make_unique<LinearInterpolationStrategy>();
    }
    if (!j.is_object() || !j.contains("kind") || !j["kind"].is_string()) {
        throw ConfigError("mapping", "expected an object with a string 'kind'");
    }
    const std::string kind = j["kind"].get<std::string>();
    using Kind = IMappingStrategy::Kind;

    if (kind == IMappingStrategy::kind_to_string(Kind::NEAREST_NEIGHBOR)) {
        return std::make_unique<NearestNeighborStrategy>();
    }
    if (kind == IMappingStrategy::kind_to_string(Kind::LINEAR_INTERPOLATION)) {
        return std::make_unique<LinearInterpolationStrategy>();
    }
    if (kind == IMappingStrategy::kind_to_string(Kind::LINEAR_CALIBRATION)) {
        return std::make_unique<LinearCalibrationStrategy>(
            detail::coefficients_from_json<4>(j, "x"),
            detail::coefficients_from_json<4>(j, "y"));
    }
    if (kind == IMappingStrategy::kind_to_string(Kind::QUADRATIC_CALIBRATION)) {
        return std::make_unique<QuadraticCalibrationStrategy>(
            detail::coefficients_from_json<10>(j, "x"),
            detail::coefficients_from_json<10>(j, "y"));
    }
    if (kind == IMappingStrategy::kind_to_string(Kind::CUSTOM)) {
        throw ConfigError("mapping.kind", "custom strategies must be supplied in code");
    }
    throw ConfigError("mapping.kind", "unknown mapping kind '" + kind + "'");
}
