/// @file reference_bodies.cpp
/// @brief Solar System fact sheet (NASA planetary fact sheets, IAU nominal values).

#include "catalog/reference_bodies.hpp"

#include "core/logger.hpp"

#include <array>
#include <memory>

namespace orrery::catalog
{

using universe::BodyKind;

namespace
{

constexpr f64 kSagittariusAMass = 4.154e6 * physical_constants::kSolarMass;

// Format: {name, kind, mass_kg, radius_km, g, mean_T, albedo, greenhouse_k, primary, a_km, e}
constexpr std::array<ReferenceBody, 12> kSolarSystem{{
    {"Sun",            BodyKind::Star,      1.989e30,   696340.0, 274.0,   5772.0, 0.0,   0.0,   nullptr,   0.0,           0.0},
    {"Mercury",        BodyKind::Planet,    3.3011e23,    2439.7,   3.70,   440.0, 0.088, 0.0,   "Sun",     5.7909227e7,   0.2056},
    {"Venus",          BodyKind::Planet,    4.8675e24,    6051.8,   8.87,   737.0, 0.76,  507.0, "Sun",     1.08209475e8,  0.0068},
    {"Earth",          BodyKind::Planet,    5.9724e24,    6371.0,   9.81,   288.0, 0.306, 33.0,  "Sun",     1.49598023e8,  0.0167},
    {"Moon",           BodyKind::Planet,    7.342e22,     1737.4,   1.62,   250.0, 0.11,  0.0,   "Earth",   3.844e5,       0.0549},
    {"Mars",           BodyKind::Planet,    6.4171e23,    3389.5,   3.72,   210.0, 0.25,  0.0,   "Sun",     2.27956e8,     0.0935},
    {"Jupiter",        BodyKind::Planet,    1.8982e27,   69911.0,  24.79,   165.0, 0.343, 0.0,   "Sun",     7.78479e8,     0.0487},
    {"Saturn",         BodyKind::Planet,    5.6834e26,   58232.0,  10.44,   134.0, 0.342, 0.0,   "Sun",     1.432041e9,    0.0520},
    {"Uranus",         BodyKind::Planet,    8.6810e25,   25362.0,   8.69,    76.0, 0.300, 0.0,   "Sun",     2.867043e9,    0.0469},
    {"Neptune",        BodyKind::Planet,    1.02413e26,  24622.0,  11.15,    72.0, 0.290, 0.0,   "Sun",     4.514953e9,    0.0097},
    {"Pluto",          BodyKind::Planet,    1.303e22,     1188.3,   0.62,    44.0, 0.72,  0.0,   "Sun",     5.906376e9,    0.2488},
    {"Sagittarius A*", BodyKind::BlackHole, kSagittariusAMass, 0.0, 0.0,    0.0, 0.0,   0.0,   nullptr,   0.0,           0.0},
}};

std::unique_ptr<universe::CelestialBody> make_body(const ReferenceBody& facts)
{
    using namespace universe;

    switch (facts.kind)
    {
        case BodyKind::Star:
            return SolarBody::create(facts.name, facts.mass_kg, facts.radius_km, facts.mean_temperature);
        case BodyKind::Planet:
            return PlanetaryBody::create(facts.name, facts.mass_kg, facts.radius_km,
                                         facts.albedo, facts.greenhouse_k);
        case BodyKind::BlackHole:
            return BlackHole::create(facts.name, facts.mass_kg);
        case BodyKind::Generic:
        default:
            return CelestialBody::create(facts.name, facts.mass_kg, facts.radius_km);
    }
}

} // anonymous namespace

std::span<const ReferenceBody> ReferenceBodies::solar_system_facts()
{
    return kSolarSystem;
}

const ReferenceBody* ReferenceBodies::find(std::string_view name)
{
    for (const auto& facts : kSolarSystem)
    {
        if (name == facts.name)
        {
            return &facts;
        }
    }
    return nullptr;
}

universe::Universe ReferenceBodies::solar_system()
{
    universe::Universe result{"Solar System"};

    for (const auto& facts : kSolarSystem)
    {
        if (result.add_body(make_body(facts)) != universe::AddBodyStatus::Added)
        {
            ORR_CORE_ERROR("ReferenceBodies: failed to add '{}'", facts.name);
        }
    }

    for (const auto& facts : kSolarSystem)
    {
        if (facts.primary == nullptr)
        {
            continue;
        }

        const auto status = result.add_orbit(facts.primary, facts.name, facts.semimajor_axis_km, facts.eccentricity);
        if (status != universe::OrbitStatus::Valid)
        {
            ORR_CORE_ERROR("ReferenceBodies: orbit of '{}' rejected: {}",
                           facts.name, universe::orbit_status_name(status));
        }
    }

    ORR_CORE_INFO("ReferenceBodies: built '{}' with {} bodies and {} orbits",
                  result.name(), result.body_count(), result.orbits().size());

    return result;
}

} // namespace orrery::catalog
