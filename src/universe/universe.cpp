/// @file universe.cpp
/// @brief Implementation of the body registry, orbital hierarchy, and temperature estimates.

#include "universe/universe.hpp"

#include "core/logger.hpp"
#include "physics/radiation.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace orrery::universe
{

using physics::Radiation;

Universe::Universe(std::string name)
    : m_name{name.empty() ? std::string{kUnnamed} : std::move(name)}
{
}

// =================================================================
// Registration
// =================================================================

AddBodyStatus Universe::add_body(std::unique_ptr<CelestialBody> body)
{
    if (!body)
    {
        ORR_CORE_WARN("Universe '{}': ignoring null body", m_name);
        return AddBodyStatus::NullBody;
    }

    if (body->name() == CelestialBody::kUnnamed)
    {
        std::string generated;
        do
        {
            generated = fmt::format("{} {}", CelestialBody::kUnnamed, m_unnamed_id++);
        } while (m_body_index.contains(generated));

        body->set_name(std::move(generated));
    }

    if (m_body_index.contains(body->name()))
    {
        ORR_CORE_ERROR("Universe '{}': a celestial body named '{}' already exists",
                       m_name, body->name());
        return AddBodyStatus::DuplicateName;
    }

    ORR_CORE_TRACE("Universe '{}': added {} '{}'", m_name, body_kind_name(body->kind()), body->name());

    m_body_index.emplace(body->name(), m_bodies.size());
    m_bodies.push_back(std::move(body));
    return AddBodyStatus::Added;
}

OrbitStatus Universe::add_orbit(
    std::string_view primary_name,
    std::string_view orbiting_name,
    f64 semimajor_axis_km,
    f64 eccentricity,
    bool allow_unstable)
{
    const CelestialBody* primary = find_body(primary_name);
    const CelestialBody* orbiting = find_body(orbiting_name);

    if (primary == nullptr || orbiting == nullptr)
    {
        ORR_CORE_ERROR("Universe '{}': cannot add orbit of '{}' around '{}': '{}' does not exist. "
                       "Add it with add_body() first.",
                       m_name, orbiting_name, primary_name,
                       primary == nullptr ? primary_name : orbiting_name);
        return OrbitStatus::UnknownBody;
    }

    const OrbitStatus shape = Orbit::check(*primary, *orbiting, semimajor_axis_km, eccentricity);
    if (shape != OrbitStatus::Valid)
    {
        ORR_CORE_ERROR("Universe '{}': orbit of '{}' around '{}' rejected: {}",
                       m_name, orbiting_name, primary_name, orbit_status_name(shape));
        return shape;
    }

    if (const Orbit* existing = orbit_of(*orbiting))
    {
        ORR_CORE_ERROR("Universe '{}': '{}' already orbits '{}'",
                       m_name, orbiting_name, existing->primary().name());
        return OrbitStatus::AlreadyOrbiting;
    }

    if (is_ancestor(*orbiting, *primary))
    {
        ORR_CORE_ERROR("Universe '{}': '{}' already (indirectly) orbits '{}'",
                       m_name, primary_name, orbiting_name);
        return OrbitStatus::CircularHierarchy;
    }

    auto orbit = Orbit::create(*primary, *orbiting, semimajor_axis_km, eccentricity);
    if (!orbit)
    {
        return OrbitStatus::Collision;
    }

    if (!is_stable(*orbit))
    {
        if (!allow_unstable)
        {
            ORR_CORE_ERROR("Universe '{}': orbit of '{}' around '{}' leaves a Hill sphere and is unstable",
                           m_name, orbiting_name, primary_name);
            return OrbitStatus::Unstable;
        }

        ORR_CORE_WARN("Universe '{}': accepting unstable orbit of '{}' around '{}'",
                      m_name, orbiting_name, primary_name);
    }

    ORR_CORE_TRACE("Universe '{}': '{}' orbits '{}' (a = {:.6g} km, e = {:.4f}, T = {:.2f} d)",
                   m_name, orbiting_name, primary_name,
                   orbit->semimajor_axis(), orbit->eccentricity(), orbit->period_days());

    m_orbits.push_back(*orbit);
    return OrbitStatus::Valid;
}

// =================================================================
// Lookups
// =================================================================

const CelestialBody* Universe::find_body(std::string_view name) const
{
    const auto it = m_body_index.find(std::string{name});
    if (it == m_body_index.end())
    {
        return nullptr;
    }

    return m_bodies[it->second].get();
}

const Orbit* Universe::orbit_of(std::string_view name) const
{
    const CelestialBody* body = find_body(name);
    return body != nullptr ? orbit_of(*body) : nullptr;
}

const Orbit* Universe::orbit_of(const CelestialBody& body) const
{
    for (const auto& orbit : m_orbits)
    {
        if (&orbit.orbiting() == &body)
        {
            return &orbit;
        }
    }
    return nullptr;
}

std::vector<const Orbit*> Universe::satellites_of(std::string_view name) const
{
    const CelestialBody* body = find_body(name);
    if (body == nullptr)
    {
        return {};
    }
    return satellites_of(*body);
}

std::vector<const Orbit*> Universe::satellites_of(const CelestialBody& body) const
{
    std::vector<const Orbit*> result;
    for (const auto& orbit : m_orbits)
    {
        if (&orbit.primary() == &body)
        {
            result.push_back(&orbit);
        }
    }

    // Nearest first; ties broken by name so the order is reproducible
    std::sort(result.begin(), result.end(), [](const Orbit* a, const Orbit* b) {
        if (a->semimajor_axis() != b->semimajor_axis())
        {
            return a->semimajor_axis() < b->semimajor_axis();
        }
        return a->orbiting().name() < b->orbiting().name();
    });
    return result;
}

bool Universe::is_ancestor(const CelestialBody& body, const CelestialBody& descendant) const
{
    const CelestialBody* current = &descendant;
    while (const Orbit* orbit = orbit_of(*current))
    {
        if (&orbit->primary() == &body)
        {
            return true;
        }
        current = &orbit->primary();
    }
    return false;
}

// -----------------------------------------------------------------
// Hill-sphere stability
//
// A satellite whose apoapsis lies outside the Hill sphere of its primary
// will eventually be captured by the primary's own primary. Both
// directions are checked because orbits may be added in any order:
//   1. the candidate against the Hill sphere of its primary
//   2. existing satellites of the orbiting body against the candidate's
//      Hill sphere
// -----------------------------------------------------------------

bool Universe::is_stable(const Orbit& candidate) const
{
    if (const Orbit* primary_orbit = orbit_of(candidate.primary()))
    {
        if (candidate.apoapsis() > primary_orbit->hill_radius())
        {
            return false;
        }
    }

    const f64 hill = candidate.hill_radius();
    for (const Orbit* satellite : satellites_of(candidate.orbiting()))
    {
        if (satellite->apoapsis() > hill)
        {
            return false;
        }
    }

    return true;
}

// =================================================================
// Hierarchy
// =================================================================

std::vector<HierarchyEntry> Universe::hierarchy() const
{
    std::vector<HierarchyEntry> entries;
    for (const auto& body : m_bodies)
    {
        if (orbit_of(*body) != nullptr || satellites_of(*body).empty())
        {
            continue;
        }
        append_subtree(*body, 0, entries);
    }
    return entries;
}

void Universe::append_subtree(const CelestialBody& body, u32 depth, std::vector<HierarchyEntry>& out) const
{
    out.push_back(HierarchyEntry{.body = &body, .depth = depth});
    for (const Orbit* satellite : satellites_of(body))
    {
        append_subtree(satellite->orbiting(), depth + 1, out);
    }
}

std::string Universe::render_hierarchy() const
{
    if (m_orbits.empty())
    {
        return fmt::format("No orbits detected in {}", m_name);
    }

    std::string text = fmt::format("{}:", m_name);
    for (const auto& entry : hierarchy())
    {
        text += '\n';
        text.append(entry.depth + 1, '\t');
        text += '-';
        text += entry.body->name();
    }
    return text;
}

std::vector<const PlanetaryBody*> Universe::untethered_planets() const
{
    std::vector<const PlanetaryBody*> result;
    for (const auto& body : m_bodies)
    {
        if (body->kind() == BodyKind::Planet && orbit_of(*body) == nullptr)
        {
            result.push_back(static_cast<const PlanetaryBody*>(body.get()));
        }
    }
    return result;
}

std::vector<std::pair<const Orbit*, const Orbit*>> Universe::crossing_orbits() const
{
    std::vector<std::pair<const Orbit*, const Orbit*>> result;
    for (std::size_t i = 0; i < m_orbits.size(); ++i)
    {
        for (std::size_t j = i + 1; j < m_orbits.size(); ++j)
        {
            const Orbit& a = m_orbits[i];
            const Orbit& b = m_orbits[j];
            if (&a.primary() != &b.primary())
            {
                continue;
            }

            if (a.periapsis() <= b.apoapsis() && b.periapsis() <= a.apoapsis())
            {
                result.emplace_back(&a, &b);
            }
        }
    }
    return result;
}

// =================================================================
// Temperature
// =================================================================

std::optional<HostStar> Universe::host_star(std::string_view name) const
{
    const CelestialBody* current = find_body(name);
    if (current == nullptr)
    {
        return std::nullopt;
    }

    while (const Orbit* orbit = orbit_of(*current))
    {
        if (orbit->primary().kind() == BodyKind::Star)
        {
            return HostStar{
                .star  = static_cast<const SolarBody*>(&orbit->primary()),
                .orbit = orbit,
            };
        }
        current = &orbit->primary();
    }

    return std::nullopt;
}

std::optional<TemperatureEstimate> Universe::estimate_temperature(std::string_view name) const
{
    const CelestialBody* body = find_body(name);
    if (body == nullptr)
    {
        ORR_CORE_WARN("Universe '{}': no body named '{}'", m_name, name);
        return std::nullopt;
    }

    if (body->kind() != BodyKind::Planet)
    {
        ORR_CORE_WARN("Universe '{}': '{}' is a {}, temperature estimates need a PlanetaryBody",
                      m_name, name, body_kind_name(body->kind()));
        return std::nullopt;
    }

    const auto host = host_star(name);
    if (!host)
    {
        ORR_CORE_WARN("Universe '{}': '{}' does not orbit a star", m_name, name);
        return std::nullopt;
    }

    const auto& planet = static_cast<const PlanetaryBody&>(*body);
    const SolarBody& star = *host->star;
    const Orbit& orbit = *host->orbit;

    const auto mean = Radiation::equilibrium_temperature(
        star.temperature(), star.radius(), orbit.semimajor_axis(), planet.albedo());
    const auto warmest = Radiation::equilibrium_temperature(
        star.temperature(), star.radius(), orbit.periapsis(), planet.albedo());
    const auto coldest = Radiation::equilibrium_temperature(
        star.temperature(), star.radius(), orbit.apoapsis(), planet.albedo());
    const auto flux = Radiation::flux_at(star.luminosity(), orbit.semimajor_axis());

    if (!mean || !warmest || !coldest || !flux)
    {
        ORR_CORE_ERROR("Universe '{}': temperature of '{}' is undefined at {:.6g} km from '{}'",
                       m_name, name, orbit.periapsis(), star.name());
        return std::nullopt;
    }

    return TemperatureEstimate{
        .star          = &star,
        .distance_km   = orbit.semimajor_axis(),
        .equilibrium_k = *mean,
        .periapsis_k   = *warmest,
        .apoapsis_k    = *coldest,
        .surface_k     = *mean + planet.greenhouse_offset(),
        .flux_w_m2     = *flux,
    };
}

} // namespace orrery::universe
