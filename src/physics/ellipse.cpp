/// @file ellipse.cpp
/// @brief Implementation of elliptical orbit geometry.

#include "physics/ellipse.hpp"

#include <cmath>

namespace orrery::physics
{

using namespace physical_constants;

bool Ellipse::is_closed_orbit(f64 semimajor_axis, f64 eccentricity)
{
    return semimajor_axis > 0.0 && eccentricity >= 0.0 && eccentricity < 1.0;
}

std::optional<f64> Ellipse::semiminor_axis(f64 semimajor_axis, f64 eccentricity)
{
    if (!is_closed_orbit(semimajor_axis, eccentricity))
    {
        return std::nullopt;
    }

    return semimajor_axis * std::sqrt(1.0 - eccentricity * eccentricity);
}

std::optional<f64> Ellipse::periapsis(f64 semimajor_axis, f64 eccentricity)
{
    if (!is_closed_orbit(semimajor_axis, eccentricity))
    {
        return std::nullopt;
    }

    return semimajor_axis * (1.0 - eccentricity);
}

std::optional<f64> Ellipse::apoapsis(f64 semimajor_axis, f64 eccentricity)
{
    if (!is_closed_orbit(semimajor_axis, eccentricity))
    {
        return std::nullopt;
    }

    return semimajor_axis * (1.0 + eccentricity);
}

// -----------------------------------------------------------------
// T = 2π sqrt(a³ / G(M₁ + M₂))  (a converted km → m)
// -----------------------------------------------------------------

std::optional<f64> Ellipse::orbital_period(
    f64 semimajor_axis_km,
    f64 primary_mass,
    f64 orbiting_mass)
{
    if (!(semimajor_axis_km > 0.0) || !(primary_mass > 0.0) || !(orbiting_mass > 0.0))
    {
        return std::nullopt;
    }

    const f64 a_m = semimajor_axis_km * kMetresPerKilometre;
    return kTwoPi * std::sqrt(a_m * a_m * a_m / (kGravitational * (primary_mass + orbiting_mass)));
}

// -----------------------------------------------------------------
// Conic in polar form about the occupied focus
// -----------------------------------------------------------------

std::optional<f64> Ellipse::radius_at_true_anomaly(
    f64 semimajor_axis,
    f64 eccentricity,
    f64 true_anomaly_rad)
{
    if (!is_closed_orbit(semimajor_axis, eccentricity))
    {
        return std::nullopt;
    }

    const f64 semi_latus_rectum = semimajor_axis * (1.0 - eccentricity * eccentricity);
    return semi_latus_rectum / (1.0 + eccentricity * std::cos(true_anomaly_rad));
}

std::optional<Vec2d> Ellipse::position_at_true_anomaly(
    f64 semimajor_axis,
    f64 eccentricity,
    f64 true_anomaly_rad)
{
    const auto r = radius_at_true_anomaly(semimajor_axis, eccentricity, true_anomaly_rad);
    if (!r)
    {
        return std::nullopt;
    }

    return Vec2d{*r * std::cos(true_anomaly_rad), *r * std::sin(true_anomaly_rad)};
}

std::optional<f64> Ellipse::hill_radius(
    f64 semimajor_axis,
    f64 eccentricity,
    f64 orbiting_mass,
    f64 primary_mass)
{
    if (!is_closed_orbit(semimajor_axis, eccentricity) ||
        !(orbiting_mass > 0.0) || !(primary_mass > 0.0))
    {
        return std::nullopt;
    }

    return semimajor_axis * (1.0 - eccentricity) * std::cbrt(orbiting_mass / (3.0 * primary_mass));
}

} // namespace orrery::physics
