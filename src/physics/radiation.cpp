/// @file radiation.cpp
/// @brief Implementation of Stefan-Boltzmann luminosity and equilibrium temperature.

#include "physics/radiation.hpp"

#include <cmath>

namespace orrery::physics
{

using namespace physical_constants;

// -----------------------------------------------------------------
// L = 4π R² σ T⁴
// -----------------------------------------------------------------

std::optional<f64> Radiation::luminosity(f64 radius_km, f64 temperature_k)
{
    if (!(radius_km > 0.0) || !(temperature_k > 0.0))
    {
        return std::nullopt;
    }

    const f64 radius_m = radius_km * kMetresPerKilometre;
    return 4.0 * kPi * radius_m * radius_m * kStefanBoltzmann * std::pow(temperature_k, 4.0);
}

// -----------------------------------------------------------------
// F = L / 4π d²
// -----------------------------------------------------------------

std::optional<f64> Radiation::flux_at(f64 luminosity_w, f64 distance_km)
{
    if (!(luminosity_w > 0.0) || !(distance_km > 0.0))
    {
        return std::nullopt;
    }

    const f64 distance_m = distance_km * kMetresPerKilometre;
    return luminosity_w / (4.0 * kPi * distance_m * distance_m);
}

// -----------------------------------------------------------------
// T_eq = T* · sqrt(R* / 2d) · (1 - A)^¼
// -----------------------------------------------------------------

std::optional<f64> Radiation::equilibrium_temperature(
    f64 star_temperature_k,
    f64 star_radius_km,
    f64 distance_km,
    f64 albedo)
{
    if (!(star_temperature_k > 0.0) || !(star_radius_km > 0.0) || !is_valid_albedo(albedo))
    {
        return std::nullopt;
    }

    // A planet inside its star has no meaningful equilibrium
    if (!(distance_km > star_radius_km))
    {
        return std::nullopt;
    }

    return star_temperature_k
         * std::sqrt(star_radius_km / (2.0 * distance_km))
         * std::pow(1.0 - albedo, 0.25);
}

// -----------------------------------------------------------------
// T_eq = (L (1 - A) / 16π σ d²)^¼
// -----------------------------------------------------------------

std::optional<f64> Radiation::equilibrium_temperature_from_luminosity(
    f64 luminosity_w,
    f64 distance_km,
    f64 albedo)
{
    if (!(luminosity_w > 0.0) || !(distance_km > 0.0) || !is_valid_albedo(albedo))
    {
        return std::nullopt;
    }

    const f64 distance_m = distance_km * kMetresPerKilometre;
    const f64 absorbed = luminosity_w * (1.0 - albedo);
    return std::pow(absorbed / (16.0 * kPi * kStefanBoltzmann * distance_m * distance_m), 0.25);
}

// -----------------------------------------------------------------
// d = (R* / 2) (T* / T)² sqrt(1 - A)
// -----------------------------------------------------------------

std::optional<f64> Radiation::distance_for_temperature(
    f64 star_temperature_k,
    f64 star_radius_km,
    f64 target_temperature_k,
    f64 albedo)
{
    if (!(star_temperature_k > 0.0) || !(star_radius_km > 0.0) ||
        !(target_temperature_k > 0.0) || !is_valid_albedo(albedo))
    {
        return std::nullopt;
    }

    const f64 ratio = star_temperature_k / target_temperature_k;
    const f64 distance_km = 0.5 * star_radius_km * ratio * ratio * std::sqrt(1.0 - albedo);

    // Targets hotter than the photosphere allows would put the planet inside the star
    if (!(distance_km > star_radius_km))
    {
        return std::nullopt;
    }

    return distance_km;
}

std::optional<TemperateZone> Radiation::temperate_zone(
    f64 star_temperature_k,
    f64 star_radius_km,
    f64 albedo)
{
    const auto inner = distance_for_temperature(star_temperature_k, star_radius_km, kWaterBoilingK, albedo);
    const auto outer = distance_for_temperature(star_temperature_k, star_radius_km, kWaterFreezingK, albedo);

    if (!inner || !outer)
    {
        return std::nullopt;
    }

    return TemperateZone{
        .inner_km = *inner,
        .outer_km = *outer,
    };
}

bool Radiation::is_valid_albedo(f64 albedo)
{
    return albedo >= 0.0 && albedo < 1.0;
}

} // namespace orrery::physics
