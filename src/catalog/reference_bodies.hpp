#pragma once

/// @file reference_bodies.hpp
/// @brief Built-in Solar System fact sheet.

#include "core/types.hpp"
#include "universe/celestial_body.hpp"
#include "universe/universe.hpp"

#include <span>
#include <string_view>

namespace orrery::catalog
{
    /// @brief Published physical and orbital data for one body.
    ///
    /// surface_gravity and mean_temperature are reference values for
    /// comparison with the computed estimates; they are not fed into the
    /// model. For the Sun, mean_temperature is the effective temperature.
    struct ReferenceBody
    {
        const char* name;
        universe::BodyKind kind;
        f64 mass_kg;
        f64 radius_km;
        f64 surface_gravity;     ///< m/s²
        f64 mean_temperature;    ///< K
        f64 albedo;              ///< Bond albedo
        f64 greenhouse_k;
        const char* primary;     ///< nullptr for bodies that orbit nothing
        f64 semimajor_axis_km;
        f64 eccentricity;
    };

    /// @brief Static access to the built-in Solar System.
    class ReferenceBodies
    {
    public:
        ReferenceBodies() = delete;

        /// Nominal solar luminosity (IAU 2015 Resolution B3), W.
        static constexpr f64 kSolarLuminosity = 3.828e26;

        /// @brief Sun, planets, the Moon, Pluto, and Sagittarius A*.
        [[nodiscard]] static std::span<const ReferenceBody> solar_system_facts();

        /// @brief Look up a fact sheet entry by exact name (nullptr if absent).
        [[nodiscard]] static const ReferenceBody* find(std::string_view name);

        /// @brief Universe named "Solar System" populated from solar_system_facts().
        [[nodiscard]] static universe::Universe solar_system();
    };

} // namespace orrery::catalog
