/// @file orbit.cpp
/// @brief Implementation of orbit validation and derived orbital elements.

#include "universe/orbit.hpp"

#include "core/logger.hpp"
#include "physics/ellipse.hpp"

#include <spdlog/fmt/fmt.h>

namespace orrery::universe
{

using physics::Ellipse;

const char* orbit_status_name(OrbitStatus status)
{
    switch (status)
    {
        case OrbitStatus::Valid:                return "valid";
        case OrbitStatus::InvalidSemimajorAxis: return "invalid semi-major axis";
        case OrbitStatus::InvalidEccentricity:  return "invalid eccentricity";
        case OrbitStatus::SameBody:             return "body cannot orbit itself";
        case OrbitStatus::Collision:            return "collision";
        case OrbitStatus::UnknownBody:          return "unknown body";
        case OrbitStatus::AlreadyOrbiting:      return "already orbiting";
        case OrbitStatus::CircularHierarchy:    return "circular hierarchy";
        case OrbitStatus::Unstable:             return "unstable";
        default:                                return "unknown";
    }
}

Orbit::Orbit(const CelestialBody& primary, const CelestialBody& orbiting,
             f64 semimajor_axis_km, f64 eccentricity)
    : m_primary{&primary}
    , m_orbiting{&orbiting}
    , m_semimajor_axis{semimajor_axis_km}
    , m_eccentricity{eccentricity}
{
}

// -----------------------------------------------------------------
// Near-term collision detection
//
// An orbit cannot be so flat that the orbiting body cannot pass its
// primary (semi-minor axis), and its periapsis must clear the
// combined radii of the two bodies.
// -----------------------------------------------------------------

OrbitStatus Orbit::check(
    const CelestialBody& primary,
    const CelestialBody& orbiting,
    f64 semimajor_axis_km,
    f64 eccentricity)
{
    if (!(semimajor_axis_km > 0.0))
    {
        return OrbitStatus::InvalidSemimajorAxis;
    }

    if (!(eccentricity >= 0.0 && eccentricity < 1.0))
    {
        return OrbitStatus::InvalidEccentricity;
    }

    if (&primary == &orbiting)
    {
        return OrbitStatus::SameBody;
    }

    const f64 combined_radii = primary.radius() + orbiting.radius();

    if (combined_radii >= *Ellipse::semiminor_axis(semimajor_axis_km, eccentricity))
    {
        return OrbitStatus::Collision;
    }

    if (combined_radii >= *Ellipse::periapsis(semimajor_axis_km, eccentricity))
    {
        return OrbitStatus::Collision;
    }

    return OrbitStatus::Valid;
}

std::optional<Orbit> Orbit::create(
    const CelestialBody& primary,
    const CelestialBody& orbiting,
    f64 semimajor_axis_km,
    f64 eccentricity)
{
    const OrbitStatus status = check(primary, orbiting, semimajor_axis_km, eccentricity);
    if (status != OrbitStatus::Valid)
    {
        ORR_CORE_ERROR("Orbit of '{}' around '{}' (a = {} km, e = {}) rejected: {}",
                       orbiting.name(), primary.name(), semimajor_axis_km, eccentricity,
                       orbit_status_name(status));
        return std::nullopt;
    }

    return Orbit(primary, orbiting, semimajor_axis_km, eccentricity);
}

// Shape parameters are validated by create(), so the Ellipse helpers
// always produce a value here.

f64 Orbit::semiminor_axis() const
{
    return *Ellipse::semiminor_axis(m_semimajor_axis, m_eccentricity);
}

f64 Orbit::periapsis() const
{
    return *Ellipse::periapsis(m_semimajor_axis, m_eccentricity);
}

f64 Orbit::apoapsis() const
{
    return *Ellipse::apoapsis(m_semimajor_axis, m_eccentricity);
}

f64 Orbit::period() const
{
    return *Ellipse::orbital_period(m_semimajor_axis, m_primary->mass(), m_orbiting->mass());
}

f64 Orbit::period_days() const
{
    return period() / physical_constants::kSecondsPerDay;
}

f64 Orbit::distance_at(f64 true_anomaly_rad) const
{
    return *Ellipse::radius_at_true_anomaly(m_semimajor_axis, m_eccentricity, true_anomaly_rad);
}

Vec2d Orbit::position_at(f64 true_anomaly_rad) const
{
    return *Ellipse::position_at_true_anomaly(m_semimajor_axis, m_eccentricity, true_anomaly_rad);
}

f64 Orbit::hill_radius() const
{
    return *Ellipse::hill_radius(m_semimajor_axis, m_eccentricity, m_orbiting->mass(), m_primary->mass());
}

std::string Orbit::repr() const
{
    return fmt::format("Orbit({}, {}, {:g}, {:g})",
                       m_primary->repr(), m_orbiting->repr(), m_semimajor_axis, m_eccentricity);
}

} // namespace orrery::universe
