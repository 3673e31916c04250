#pragma once

/// @file orbit.hpp
/// @brief Elliptical orbit of one celestial body around another.

#include "core/types.hpp"
#include "universe/celestial_body.hpp"

#include <optional>
#include <string>

namespace orrery::universe
{
    /// @brief Outcome of validating or registering an orbit.
    enum class OrbitStatus : u8
    {
        Valid,
        InvalidSemimajorAxis,   ///< a <= 0
        InvalidEccentricity,    ///< e outside [0, 1)
        SameBody,               ///< A body cannot orbit itself
        Collision,              ///< Bodies would touch on the first pass
        UnknownBody,            ///< A body is not registered in the universe
        AlreadyOrbiting,        ///< The orbiting body already has a primary
        CircularHierarchy,      ///< The primary (indirectly) orbits the orbiting body
        Unstable,               ///< The orbit leaves the primary's Hill sphere
    };

    [[nodiscard]] const char* orbit_status_name(OrbitStatus status);

    /// @brief Keplerian ellipse of an orbiting body around a primary body.
    ///
    /// Holds non-owning pointers; both bodies must outlive the orbit (the
    /// owning Universe guarantees this). Distances are in kilometres.
    ///
    /// Construction goes through create(), which rejects orbits that are
    /// impossible in the near term: a degenerate ellipse, or one so flat or
    /// so close that the bodies would collide on the first pass.
    class Orbit
    {
    public:
        /// @brief Validate orbit parameters without building an orbit.
        ///
        /// Checks, in order: semi-major axis, eccentricity, distinct bodies,
        /// then that the combined radii stay below both the semi-minor axis
        /// and the periapsis.
        [[nodiscard]] static OrbitStatus check(
            const CelestialBody& primary,
            const CelestialBody& orbiting,
            f64 semimajor_axis_km,
            f64 eccentricity
        );

        /// @brief Build an orbit, logging the reason and returning std::nullopt
        /// when check() fails.
        [[nodiscard]] static std::optional<Orbit> create(
            const CelestialBody& primary,
            const CelestialBody& orbiting,
            f64 semimajor_axis_km,
            f64 eccentricity
        );

        [[nodiscard]] const CelestialBody& primary() const { return *m_primary; }
        [[nodiscard]] const CelestialBody& orbiting() const { return *m_orbiting; }

        [[nodiscard]] f64 semimajor_axis() const { return m_semimajor_axis; }
        [[nodiscard]] f64 eccentricity() const { return m_eccentricity; }

        [[nodiscard]] f64 semiminor_axis() const;
        [[nodiscard]] f64 periapsis() const;
        [[nodiscard]] f64 apoapsis() const;

        /// @brief Orbital period (s).
        [[nodiscard]] f64 period() const;

        /// @brief Orbital period (days).
        [[nodiscard]] f64 period_days() const;

        /// @brief Distance between the bodies at a true anomaly (km).
        [[nodiscard]] f64 distance_at(f64 true_anomaly_rad) const;

        /// @brief Perifocal position of the orbiting body relative to the primary (km).
        [[nodiscard]] Vec2d position_at(f64 true_anomaly_rad) const;

        /// @brief Hill-sphere radius of the orbiting body along this orbit (km).
        [[nodiscard]] f64 hill_radius() const;

        [[nodiscard]] std::string repr() const;

    private:
        Orbit(const CelestialBody& primary, const CelestialBody& orbiting,
              f64 semimajor_axis_km, f64 eccentricity);

        const CelestialBody* m_primary;
        const CelestialBody* m_orbiting;
        f64 m_semimajor_axis;
        f64 m_eccentricity;
    };

} // namespace orrery::universe
