/// @file geometry.cpp
/// @brief Implementation of sphere geometry and weight conversions.

#include "physics/geometry.hpp"

#include <cmath>

namespace orrery::physics
{

std::optional<f64> Geometry::sphere_volume(f64 radius)
{
    if (!(radius > 0.0))
    {
        return std::nullopt;
    }

    return (4.0 / 3.0) * physical_constants::kPi * radius * radius * radius;
}

std::optional<f64> Geometry::density(f64 mass, f64 volume)
{
    if (!(mass > 0.0) || !(volume > 0.0))
    {
        return std::nullopt;
    }

    return mass / volume;
}

std::optional<f64> Geometry::newtons_to_kilograms(f64 weight_n, f64 gravity_ms2)
{
    if (!(weight_n > 0.0) || !(gravity_ms2 > 0.0))
    {
        return std::nullopt;
    }

    return weight_n / gravity_ms2;
}

f64 Geometry::kilograms_to_pounds(f64 kg)
{
    return kg * physical_constants::kPoundsPerKilogram;
}

} // namespace orrery::physics
