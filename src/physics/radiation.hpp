#pragma once

/// @file radiation.hpp
/// @brief Black-body radiation: stellar luminosity and planetary equilibrium temperature.

#include "core/types.hpp"

#include <optional>

namespace orrery::physics
{
    /// @brief Orbital distance band with liquid-water equilibrium temperatures.
    struct TemperateZone
    {
        f64 inner_km;   ///< Distance where the equilibrium temperature is 373.15 K
        f64 outer_km;   ///< Distance where the equilibrium temperature is 273.15 K
    };

    /// @brief Static utility class built on the Stefan-Boltzmann law.
    ///
    /// Stars are treated as black bodies, L = 4π R² σ T⁴. A planet at
    /// distance d that absorbs a fraction (1 - A) of the incident light and
    /// re-radiates it from its whole surface settles at
    ///
    ///     T_eq = T* · sqrt(R* / 2d) · (1 - A)^¼
    ///
    /// Radii and distances are in kilometres; the ratio R*/d is unit-free,
    /// but luminosity and flux are converted to SI.
    class Radiation
    {
    public:
        Radiation() = delete;

        /// @brief Stefan-Boltzmann luminosity of a black body.
        /// @param radius_km Radius of the body (km).
        /// @param temperature_k Effective surface temperature (K).
        /// @return Luminosity in watts.
        [[nodiscard]] static std::optional<f64> luminosity(f64 radius_km, f64 temperature_k);

        /// @brief Irradiance at a distance from an isotropic source.
        /// @return Flux in W/m².
        [[nodiscard]] static std::optional<f64> flux_at(f64 luminosity_w, f64 distance_km);

        /// @brief Equilibrium temperature of a planet from stellar radius and temperature.
        /// @param star_temperature_k Stellar effective temperature (K).
        /// @param star_radius_km Stellar radius (km).
        /// @param distance_km Star-planet distance (km), must exceed the stellar radius.
        /// @param albedo Bond albedo in [0, 1).
        /// @return Temperature in kelvin.
        [[nodiscard]] static std::optional<f64> equilibrium_temperature(
            f64 star_temperature_k,
            f64 star_radius_km,
            f64 distance_km,
            f64 albedo
        );

        /// @brief Equilibrium temperature from the stellar luminosity instead of T* and R*.
        ///
        /// T_eq = (L (1 - A) / (16 π σ d²))^¼
        [[nodiscard]] static std::optional<f64> equilibrium_temperature_from_luminosity(
            f64 luminosity_w,
            f64 distance_km,
            f64 albedo
        );

        /// @brief Distance at which a planet reaches a target equilibrium temperature.
        ///
        /// Inverse of equilibrium_temperature(): d = (R*/2) (T*/T)² sqrt(1 - A).
        /// @return Distance in kilometres.
        [[nodiscard]] static std::optional<f64> distance_for_temperature(
            f64 star_temperature_k,
            f64 star_radius_km,
            f64 target_temperature_k,
            f64 albedo
        );

        /// @brief Liquid-water band around a star for planets of the given albedo.
        [[nodiscard]] static std::optional<TemperateZone> temperate_zone(
            f64 star_temperature_k,
            f64 star_radius_km,
            f64 albedo
        );

    private:
        [[nodiscard]] static bool is_valid_albedo(f64 albedo);
    };

} // namespace orrery::physics
