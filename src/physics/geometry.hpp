#pragma once

/// @file geometry.hpp
/// @brief Elementary solid geometry and unit conversions for spherical bodies.

#include "core/types.hpp"

#include <optional>

namespace orrery::physics
{
    /// @brief Static utility class for sphere volume, density, and weight conversions.
    ///
    /// Every function rejects non-positive inputs by returning std::nullopt.
    class Geometry
    {
    public:
        Geometry() = delete;

        /// @brief Volume of a sphere, 4/3 π r³.
        /// @param radius Sphere radius (any length unit).
        /// @return Volume in the cube of the radius unit.
        [[nodiscard]] static std::optional<f64> sphere_volume(f64 radius);

        /// @brief Mean density, mass / volume.
        [[nodiscard]] static std::optional<f64> density(f64 mass, f64 volume);

        /// @brief Mass a scale shows for a weight under a given gravity.
        /// @param weight_n Weight in newtons.
        /// @param gravity_ms2 Gravitational acceleration the scale assumes (m/s²).
        /// @return Mass in kilograms.
        [[nodiscard]] static std::optional<f64> newtons_to_kilograms(f64 weight_n, f64 gravity_ms2);

        [[nodiscard]] static f64 kilograms_to_pounds(f64 kg);
    };

} // namespace orrery::physics
