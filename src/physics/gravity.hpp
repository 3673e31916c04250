#pragma once

/// @file gravity.hpp
/// @brief Newtonian gravitation and the Schwarzschild radius.

#include "core/types.hpp"

#include <optional>

namespace orrery::physics
{
    /// @brief Static utility class for gravitational quantities.
    ///
    /// Distances and radii are taken in kilometres and converted to metres
    /// internally. Non-positive inputs yield std::nullopt.
    class Gravity
    {
    public:
        Gravity() = delete;

        /// @brief Law of Gravitation, F = G m₁ m₂ / d².
        /// @param mass_one First mass (kg).
        /// @param mass_two Second mass (kg).
        /// @param distance_km Centre-to-centre distance (km).
        /// @return Force in newtons.
        [[nodiscard]] static std::optional<f64> force_between(f64 mass_one, f64 mass_two, f64 distance_km);

        /// @brief Gravitational acceleration at the surface of a spherical body.
        /// @param mass Body mass (kg).
        /// @param radius_km Body radius (km).
        /// @return Acceleration in m/s².
        [[nodiscard]] static std::optional<f64> surface_acceleration(f64 mass, f64 radius_km);

        /// @brief Schwarzschild radius (event horizon), r = 2GM / c².
        /// @param mass Mass (kg).
        /// @return Radius in metres.
        [[nodiscard]] static std::optional<f64> schwarzschild_radius(f64 mass);
    };

} // namespace orrery::physics
