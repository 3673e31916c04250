#pragma once

/// @file universe.hpp
/// @brief Container for celestial bodies and the orbits that link them.

#include "core/types.hpp"
#include "universe/celestial_body.hpp"
#include "universe/orbit.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orrery::universe
{
    /// @brief Outcome of Universe::add_body().
    enum class AddBodyStatus : u8
    {
        Added,
        NullBody,        ///< Nothing to add (a factory rejected the body)
        DuplicateName,   ///< Another body already uses this name
    };

    /// @brief One line of the orbital hierarchy, in depth-first order.
    struct HierarchyEntry
    {
        const CelestialBody* body;
        u32 depth;   ///< 0 for bodies that orbit nothing
    };

    /// @brief The star that illuminates a body and the orbit carrying the
    /// body's branch of the hierarchy around it.
    ///
    /// For a planet this is its own orbit; for a moon it is the orbit of
    /// the moon's planet.
    struct HostStar
    {
        const SolarBody* star;
        const Orbit* orbit;
    };

    /// @brief Approximate temperatures of a planetary body heated by its host star.
    struct TemperatureEstimate
    {
        const SolarBody* star;
        f64 distance_km;     ///< Semi-major axis of the orbit around the star
        f64 equilibrium_k;   ///< Equilibrium temperature at the semi-major axis
        f64 periapsis_k;     ///< Equilibrium temperature at closest approach (warmest)
        f64 apoapsis_k;      ///< Equilibrium temperature at farthest distance (coldest)
        f64 surface_k;       ///< Equilibrium temperature plus greenhouse offset
        f64 flux_w_m2;       ///< Mean irradiance at the semi-major axis
    };

    /// @brief A named collection of celestial bodies and their orbits.
    ///
    /// The universe owns its bodies. Body names are unique; bodies added
    /// without a name receive "Unnamed Celestial Body N". Orbits form an
    /// acyclic hierarchy: every body orbits at most one primary.
    ///
    /// Pointers returned by the query functions stay valid until the next
    /// add_orbit() call (orbits) or for the universe's lifetime (bodies).
    class Universe
    {
    public:
        static constexpr std::string_view kUnnamed = "Unnamed Universe";

        explicit Universe(std::string name = std::string{kUnnamed});

        Universe(const Universe&) = delete;
        Universe& operator=(const Universe&) = delete;
        Universe(Universe&&) = default;
        Universe& operator=(Universe&&) = default;

        [[nodiscard]] const std::string& name() const { return m_name; }

        /// @brief Take ownership of a body and register it under its name.
        AddBodyStatus add_body(std::unique_ptr<CelestialBody> body);

        /// @brief Put one registered body in orbit around another.
        ///
        /// Checks that both bodies exist, that the orbiting body has no
        /// primary yet, that no cycle is formed, that the ellipse passes
        /// Orbit::check(), and that the orbit stays inside the relevant
        /// Hill spheres. Unstable orbits are accepted with a warning when
        /// allow_unstable is set.
        ///
        /// @param primary_name Name of the body being orbited.
        /// @param orbiting_name Name of the body in orbit.
        /// @param semimajor_axis_km Semi-major axis (km).
        /// @param eccentricity Eccentricity in [0, 1).
        /// @param allow_unstable Accept orbits that escape a Hill sphere.
        /// @return OrbitStatus::Valid when the orbit was added.
        OrbitStatus add_orbit(
            std::string_view primary_name,
            std::string_view orbiting_name,
            f64 semimajor_axis_km,
            f64 eccentricity,
            bool allow_unstable = false
        );

        [[nodiscard]] const CelestialBody* find_body(std::string_view name) const;

        /// @brief The orbit in which the named body is the orbiting body, or nullptr.
        [[nodiscard]] const Orbit* orbit_of(std::string_view name) const;

        /// @brief Orbits around the named body, nearest (smallest semi-major axis) first.
        [[nodiscard]] std::vector<const Orbit*> satellites_of(std::string_view name) const;

        /// @brief Depth-first walk of the orbital hierarchy.
        ///
        /// Roots are bodies that are orbited but orbit nothing, in the order
        /// they were added. Satellites follow their primary, nearest first.
        /// Bodies without any orbit do not appear.
        [[nodiscard]] std::vector<HierarchyEntry> hierarchy() const;

        /// @brief Tab-indented text rendering of hierarchy().
        ///
        /// Example:
        ///     Solar System:
        ///         -Sun
        ///             -Earth
        ///                 -Moon
        [[nodiscard]] std::string render_hierarchy() const;

        [[nodiscard]] std::optional<HostStar> host_star(std::string_view name) const;

        /// @brief Stefan-Boltzmann temperature estimate for a planetary body.
        /// @return std::nullopt if the body is not planetary or has no host star.
        [[nodiscard]] std::optional<TemperatureEstimate> estimate_temperature(std::string_view name) const;

        /// @brief Planetary bodies that orbit nothing.
        [[nodiscard]] std::vector<const PlanetaryBody*> untethered_planets() const;

        /// @brief Pairs of orbits around the same primary whose
        /// periapsis-apoapsis bands overlap.
        [[nodiscard]] std::vector<std::pair<const Orbit*, const Orbit*>> crossing_orbits() const;

        [[nodiscard]] std::size_t body_count() const { return m_bodies.size(); }
        [[nodiscard]] const std::vector<std::unique_ptr<CelestialBody>>& bodies() const { return m_bodies; }
        [[nodiscard]] const std::vector<Orbit>& orbits() const { return m_orbits; }

    private:
        [[nodiscard]] const Orbit* orbit_of(const CelestialBody& body) const;
        [[nodiscard]] std::vector<const Orbit*> satellites_of(const CelestialBody& body) const;

        /// @brief True if body sits anywhere above descendant in the hierarchy.
        [[nodiscard]] bool is_ancestor(const CelestialBody& body, const CelestialBody& descendant) const;

        /// @brief Hill-sphere checks for a candidate orbit against its
        /// neighbours in the hierarchy.
        [[nodiscard]] bool is_stable(const Orbit& candidate) const;

        void append_subtree(const CelestialBody& body, u32 depth, std::vector<HierarchyEntry>& out) const;

        std::string m_name;
        std::vector<std::unique_ptr<CelestialBody>> m_bodies;
        std::unordered_map<std::string, std::size_t> m_body_index;
        std::vector<Orbit> m_orbits;
        u32 m_unnamed_id = 1;
    };

} // namespace orrery::universe
