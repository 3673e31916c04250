#pragma once

/// @file ellipse.hpp
/// @brief Geometry of elliptical orbits: axes, apsides, period, Hill radius.

#include "core/types.hpp"

#include <optional>

namespace orrery::physics
{
    /// @brief Static utility class for closed Keplerian ellipses.
    ///
    /// Shape inputs must satisfy a > 0 and 0 <= e < 1; anything else yields
    /// std::nullopt. Lengths come back in the unit of the semi-major axis,
    /// except where a function converts to SI.
    class Ellipse
    {
    public:
        Ellipse() = delete;

        /// @brief b = a sqrt(1 - e²)
        [[nodiscard]] static std::optional<f64> semiminor_axis(f64 semimajor_axis, f64 eccentricity);

        /// @brief Closest approach to the focus, r_p = a (1 - e).
        [[nodiscard]] static std::optional<f64> periapsis(f64 semimajor_axis, f64 eccentricity);

        /// @brief Farthest distance from the focus, r_a = a (1 + e).
        [[nodiscard]] static std::optional<f64> apoapsis(f64 semimajor_axis, f64 eccentricity);

        /// @brief Kepler's third law, T = 2π sqrt(a³ / G(M₁ + M₂)).
        /// @param semimajor_axis_km Semi-major axis (km).
        /// @param primary_mass Mass of the primary body (kg).
        /// @param orbiting_mass Mass of the orbiting body (kg).
        /// @return Period in seconds.
        [[nodiscard]] static std::optional<f64> orbital_period(
            f64 semimajor_axis_km,
            f64 primary_mass,
            f64 orbiting_mass
        );

        /// @brief Focal distance at a true anomaly, r = a (1 - e²) / (1 + e cos ν).
        /// @param true_anomaly_rad Angle from periapsis (radians).
        [[nodiscard]] static std::optional<f64> radius_at_true_anomaly(
            f64 semimajor_axis,
            f64 eccentricity,
            f64 true_anomaly_rad
        );

        /// @brief Perifocal position at a true anomaly (x towards periapsis).
        [[nodiscard]] static std::optional<Vec2d> position_at_true_anomaly(
            f64 semimajor_axis,
            f64 eccentricity,
            f64 true_anomaly_rad
        );

        /// @brief Radius of the Hill sphere of a body orbiting a much heavier primary.
        ///
        /// r_H = a (1 - e) cbrt(m / 3M), evaluated at periapsis where the
        /// sphere is smallest.
        [[nodiscard]] static std::optional<f64> hill_radius(
            f64 semimajor_axis,
            f64 eccentricity,
            f64 orbiting_mass,
            f64 primary_mass
        );

        [[nodiscard]] static bool is_closed_orbit(f64 semimajor_axis, f64 eccentricity);
    };

} // namespace orrery::physics
