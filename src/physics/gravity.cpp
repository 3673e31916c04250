/// @file gravity.cpp
/// @brief Implementation of Newtonian gravitation helpers.

#include "physics/gravity.hpp"

namespace orrery::physics
{

using namespace physical_constants;

// -----------------------------------------------------------------
// F = G m₁ m₂ / d²  (d converted km → m)
// -----------------------------------------------------------------

std::optional<f64> Gravity::force_between(f64 mass_one, f64 mass_two, f64 distance_km)
{
    if (!(mass_one > 0.0) || !(mass_two > 0.0) || !(distance_km > 0.0))
    {
        return std::nullopt;
    }

    const f64 distance_m = distance_km * kMetresPerKilometre;
    return kGravitational * mass_one * mass_two / (distance_m * distance_m);
}

// -----------------------------------------------------------------
// g = G M / r²
// -----------------------------------------------------------------

std::optional<f64> Gravity::surface_acceleration(f64 mass, f64 radius_km)
{
    if (!(mass > 0.0) || !(radius_km > 0.0))
    {
        return std::nullopt;
    }

    const f64 radius_m = radius_km * kMetresPerKilometre;
    return kGravitational * mass / (radius_m * radius_m);
}

// -----------------------------------------------------------------
// r_s = 2 G M / c²
// -----------------------------------------------------------------

std::optional<f64> Gravity::schwarzschild_radius(f64 mass)
{
    if (!(mass > 0.0))
    {
        return std::nullopt;
    }

    return 2.0 * kGravitational * mass / (kSpeedOfLight * kSpeedOfLight);
}

} // namespace orrery::physics
