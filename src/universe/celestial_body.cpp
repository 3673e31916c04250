/// @file celestial_body.cpp
/// @brief Implementation of the celestial body hierarchy.

#include "universe/celestial_body.hpp"

#include "core/logger.hpp"
#include "physics/geometry.hpp"
#include "physics/gravity.hpp"
#include "physics/radiation.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace orrery::universe
{

using physics::Geometry;
using physics::Gravity;
using physics::Radiation;

const char* body_kind_name(BodyKind kind)
{
    switch (kind)
    {
        case BodyKind::Generic:   return "CelestialBody";
        case BodyKind::BlackHole: return "BlackHole";
        case BodyKind::Star:      return "SolarBody";
        case BodyKind::Planet:    return "PlanetaryBody";
        default:                  return "Unknown";
    }
}

// =================================================================
// CelestialBody
// =================================================================

CelestialBody::CelestialBody(Passkey, std::string name, f64 mass_kg, f64 radius_km)
    : m_name{name.empty() ? std::string{kUnnamed} : std::move(name)}
    , m_mass{mass_kg}
    , m_radius{radius_km}
{
}

std::unique_ptr<CelestialBody> CelestialBody::create(std::string name, f64 mass_kg, f64 radius_km)
{
    if (!validate(name, mass_kg, radius_km))
    {
        return nullptr;
    }

    return std::make_unique<CelestialBody>(Passkey{}, std::move(name), mass_kg, radius_km);
}

bool CelestialBody::validate(std::string_view name, f64 mass_kg, f64 radius_km)
{
    if (!(mass_kg > 0.0))
    {
        ORR_CORE_ERROR("CelestialBody '{}': mass ({}) must be greater than 0", name, mass_kg);
        return false;
    }

    if (!(radius_km > 0.0))
    {
        ORR_CORE_ERROR("CelestialBody '{}': radius ({}) must be greater than 0", name, radius_km);
        return false;
    }

    // Radii near the limits of f64 overflow or underflow once cubed
    const auto volume = Geometry::sphere_volume(radius_km);
    if (!volume || !(*volume > 0.0) || !std::isfinite(*volume))
    {
        ORR_CORE_ERROR("CelestialBody '{}': radius ({} km) gives no representable volume", name, radius_km);
        return false;
    }

    return true;
}

// validate() guarantees a positive mass and a finite positive volume, so
// the physics helpers below always produce a value.

f64 CelestialBody::volume() const
{
    return *Geometry::sphere_volume(m_radius);
}

f64 CelestialBody::density() const
{
    constexpr f64 kCubicMetresPerCubicKm = 1.0e9;
    return *Geometry::density(m_mass, volume() * kCubicMetresPerCubicKm);
}

f64 CelestialBody::surface_gravity() const
{
    return *Gravity::surface_acceleration(m_mass, m_radius);
}

std::string CelestialBody::describe() const
{
    std::string stats = fmt::format(
        "{} \"{}\":\n"
        "    mass: {:.6g} kilograms\n"
        "    radius: {:.6g} kilometers\n"
        "    volume: {:.6g} cubic kilometers\n"
        "    density: {:.6g} kilograms per cubic meter\n"
        "    gravitational_acceleration: {:.6g} meters / second squared",
        body_kind_name(kind()), m_name, m_mass, m_radius, volume(), density(), surface_gravity());

    return stats + additional_stats();
}

std::string CelestialBody::repr() const
{
    return fmt::format("{}({:g}, {:g})", body_kind_name(kind()), m_mass, m_radius);
}

// =================================================================
// BlackHole
// =================================================================

BlackHole::BlackHole(Passkey key, std::string name, f64 mass_kg, f64 event_horizon_km)
    : CelestialBody(key, std::move(name), mass_kg, event_horizon_km)
{
}

std::unique_ptr<BlackHole> BlackHole::create(std::string name, f64 mass_kg)
{
    const auto horizon_m = Gravity::schwarzschild_radius(mass_kg);
    if (!horizon_m)
    {
        ORR_CORE_ERROR("BlackHole '{}': mass ({}) must be greater than 0", name, mass_kg);
        return nullptr;
    }

    const f64 horizon_km = *horizon_m / physical_constants::kMetresPerKilometre;
    if (!validate(name, mass_kg, horizon_km))
    {
        return nullptr;
    }

    return std::make_unique<BlackHole>(Passkey{}, std::move(name), mass_kg, horizon_km);
}

std::string BlackHole::repr() const
{
    return fmt::format("BlackHole({:g})", mass());
}

// =================================================================
// SolarBody
// =================================================================

SolarBody::SolarBody(Passkey key, std::string name, f64 mass_kg, f64 radius_km, f64 temperature_k)
    : CelestialBody(key, std::move(name), mass_kg, radius_km)
    , m_temperature{temperature_k}
{
}

std::unique_ptr<SolarBody> SolarBody::create(
    std::string name,
    f64 mass_kg,
    f64 radius_km,
    f64 temperature_k)
{
    if (!validate(name, mass_kg, radius_km))
    {
        return nullptr;
    }

    if (!(temperature_k > 0.0))
    {
        ORR_CORE_ERROR("SolarBody '{}': temperature ({}) must be greater than 0", name, temperature_k);
        return nullptr;
    }

    return std::make_unique<SolarBody>(Passkey{}, std::move(name), mass_kg, radius_km, temperature_k);
}

f64 SolarBody::luminosity() const
{
    return *Radiation::luminosity(radius(), m_temperature);
}

std::string SolarBody::repr() const
{
    return fmt::format("SolarBody({:g}, {:g}, {:g})", mass(), radius(), m_temperature);
}

std::string SolarBody::additional_stats() const
{
    return fmt::format(
        "\n    temperature: {:.6g} Kelvin"
        "\n    luminosity: {:.6g} Joules / second",
        m_temperature, luminosity());
}

// =================================================================
// PlanetaryBody
// =================================================================

PlanetaryBody::PlanetaryBody(
    Passkey key,
    std::string name,
    f64 mass_kg,
    f64 radius_km,
    f64 albedo,
    f64 greenhouse_offset_k)
    : CelestialBody(key, std::move(name), mass_kg, radius_km)
    , m_albedo{albedo}
    , m_greenhouse_offset{greenhouse_offset_k}
{
}

std::unique_ptr<PlanetaryBody> PlanetaryBody::create(
    std::string name,
    f64 mass_kg,
    f64 radius_km,
    f64 albedo,
    f64 greenhouse_offset_k)
{
    if (!validate(name, mass_kg, radius_km))
    {
        return nullptr;
    }

    if (!(albedo >= 0.0 && albedo < 1.0))
    {
        ORR_CORE_ERROR("PlanetaryBody '{}': albedo ({}) must lie in [0, 1)", name, albedo);
        return nullptr;
    }

    if (!(greenhouse_offset_k >= 0.0))
    {
        ORR_CORE_ERROR("PlanetaryBody '{}': greenhouse offset ({}) must not be negative",
                       name, greenhouse_offset_k);
        return nullptr;
    }

    return std::make_unique<PlanetaryBody>(
        Passkey{}, std::move(name), mass_kg, radius_km, albedo, greenhouse_offset_k);
}

std::optional<f64> PlanetaryBody::weight_on_surface(f64 object_mass_kg) const
{
    return Gravity::force_between(mass(), object_mass_kg, radius());
}

std::optional<f64> PlanetaryBody::scale_reading_kg(f64 object_mass_kg) const
{
    const auto weight_n = weight_on_surface(object_mass_kg);
    if (!weight_n)
    {
        return std::nullopt;
    }

    return Geometry::newtons_to_kilograms(*weight_n, physical_constants::kStandardGravity);
}

std::optional<f64> PlanetaryBody::scale_reading_lb(f64 object_mass_kg) const
{
    const auto reading_kg = scale_reading_kg(object_mass_kg);
    if (!reading_kg)
    {
        return std::nullopt;
    }

    return Geometry::kilograms_to_pounds(*reading_kg);
}

std::string PlanetaryBody::repr() const
{
    return fmt::format("PlanetaryBody({:g}, {:g}, {:g}, {:g})",
                       mass(), radius(), m_albedo, m_greenhouse_offset);
}

std::string PlanetaryBody::additional_stats() const
{
    std::string stats = fmt::format(
        "\n    albedo: {:.3f}"
        "\n    greenhouse_offset: {:.6g} Kelvin",
        m_albedo, m_greenhouse_offset);

    if (const auto reading = scale_reading_kg())
    {
        stats += fmt::format("\n    scale_reading_of_{:g}_kg: {:.6g} kilograms",
                             kDefaultTestMassKg, *reading);
    }

    return stats;
}

} // namespace orrery::universe
