/// @file application.cpp
/// @brief Application implementation: system loading and report sections.

#include "core/application.hpp"

#include "catalog/reference_bodies.hpp"
#include "catalog/system_loader.hpp"
#include "physics/radiation.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdlib>
#include <utility>

namespace orrery::core
{

using universe::BodyKind;

namespace
{

constexpr const char* kRule = "================================================================\n";

void print_section(std::ostream& out, std::string_view title)
{
    out << '\n' << "--- " << title << " ---\n";
}

} // anonymous namespace

Application::Application(SimulationConfig config)
    : m_config{std::move(config)}
{
}

int Application::run(std::ostream& out)
{
    if (!load())
    {
        return EXIT_FAILURE;
    }

    out << kRule
        << "  ORRERY - star system approximations\n"
        << kRule;
    out << fmt::format("System: {} ({} bodies, {} orbits)\n",
                       m_universe->name(), m_universe->body_count(), m_universe->orbits().size());

    print_bodies(out);
    print_hierarchy(out);
    print_temperatures(out);
    print_temperate_zones(out);
    print_surface_weights(out);
    print_untethered(out);
    print_crossings(out);

    out << '\n' << kRule;
    return EXIT_SUCCESS;
}

// =================================================================
// Loading
// =================================================================

bool Application::load()
{
    if (m_config.system_file.empty())
    {
        ORR_INFO("Using the built-in Solar System");
        m_universe.emplace(catalog::ReferenceBodies::solar_system());
        return true;
    }

    ORR_INFO("Loading system file {}", m_config.system_file.string());
    const auto description = catalog::SystemLoader::load_csv(m_config.system_file);
    if (!description)
    {
        ORR_ERROR("Could not load a star system from {}", m_config.system_file.string());
        return false;
    }

    m_universe.emplace(catalog::SystemLoader::build_universe(*description, m_config.allow_unstable));
    return true;
}

// =================================================================
// Report sections
// =================================================================

void Application::print_bodies(std::ostream& out) const
{
    print_section(out, "Bodies");
    for (const auto& body : m_universe->bodies())
    {
        out << body->describe() << '\n';
    }
}

void Application::print_hierarchy(std::ostream& out) const
{
    print_section(out, "Orbital hierarchy");
    out << m_universe->render_hierarchy() << '\n';

    for (const auto& orbit : m_universe->orbits())
    {
        out << fmt::format("  {:<16} around {:<16} a = {:>12.6g} km  e = {:.4f}  T = {:>10.2f} d\n",
                           orbit.orbiting().name(), orbit.primary().name(),
                           orbit.semimajor_axis(), orbit.eccentricity(), orbit.period_days());
    }
}

void Application::print_temperatures(std::ostream& out) const
{
    print_section(out, "Equilibrium temperatures");
    out << fmt::format("  {:<16} {:<12} {:>10} {:>10} {:>12} {:>11} {:>12}\n",
                       "Body", "Star", "T_eq [K]", "T_surf [K]", "Perihelion", "Aphelion", "Flux [W/m2]");

    u32 rows = 0;
    for (const auto& body : m_universe->bodies())
    {
        if (body->kind() != BodyKind::Planet)
        {
            continue;
        }

        const auto estimate = m_universe->estimate_temperature(body->name());
        if (!estimate)
        {
            continue;
        }

        out << fmt::format("  {:<16} {:<12} {:>10.1f} {:>10.1f} {:>12.1f} {:>11.1f} {:>12.5g}\n",
                           body->name(), estimate->star->name(), estimate->equilibrium_k,
                           estimate->surface_k, estimate->periapsis_k, estimate->apoapsis_k,
                           estimate->flux_w_m2);
        ++rows;
    }

    if (rows == 0)
    {
        out << "  No planetary body orbits a star.\n";
    }
}

void Application::print_temperate_zones(std::ostream& out) const
{
    print_section(out, "Temperate zones");

    u32 rows = 0;
    for (const auto& body : m_universe->bodies())
    {
        if (body->kind() != BodyKind::Star)
        {
            continue;
        }

        const auto& star = static_cast<const universe::SolarBody&>(*body);
        const auto zone = physics::Radiation::temperate_zone(
            star.temperature(), star.radius(), catalog::SystemLoader::kDefaultAlbedo);
        if (!zone)
        {
            out << fmt::format("  {}: liquid water is impossible outside the star\n", star.name());
            continue;
        }

        out << fmt::format("  {}: {:.4g} - {:.4g} km ({:.3f} - {:.3f} AU, albedo {:.2f})\n",
                           star.name(), zone->inner_km, zone->outer_km,
                           zone->inner_km / physical_constants::kAstronomicalUnitKm,
                           zone->outer_km / physical_constants::kAstronomicalUnitKm,
                           catalog::SystemLoader::kDefaultAlbedo);
        ++rows;
    }

    if (rows == 0)
    {
        out << "  No stars.\n";
    }
}

void Application::print_surface_weights(std::ostream& out) const
{
    print_section(out, fmt::format("Surface weight of a {:g} kg object", m_config.test_mass_kg));

    for (const auto& body : m_universe->bodies())
    {
        if (body->kind() != BodyKind::Planet)
        {
            continue;
        }

        const auto& planet = static_cast<const universe::PlanetaryBody&>(*body);
        const auto weight = planet.weight_on_surface(m_config.test_mass_kg);
        const auto kg = planet.scale_reading_kg(m_config.test_mass_kg);
        const auto lb = planet.scale_reading_lb(m_config.test_mass_kg);
        if (!weight || !kg || !lb)
        {
            ORR_WARN("No surface weight for '{}'", planet.name());
            continue;
        }

        out << fmt::format("  {:<16} {:>10.2f} N {:>10.2f} kg {:>10.2f} lb\n",
                           planet.name(), *weight, *kg, *lb);
    }
}

void Application::print_untethered(std::ostream& out) const
{
    print_section(out, "Untethered planets");

    const auto planets = m_universe->untethered_planets();
    if (planets.empty())
    {
        out << "  None.\n";
        return;
    }

    for (const auto* planet : planets)
    {
        out << "  " << planet->name() << '\n';
    }
}

void Application::print_crossings(std::ostream& out) const
{
    print_section(out, "Crossing orbits");

    const auto crossings = m_universe->crossing_orbits();
    if (crossings.empty())
    {
        out << "  None.\n";
        return;
    }

    for (const auto& [first, second] : crossings)
    {
        out << fmt::format("  {} ({:.4g} - {:.4g} km) and {} ({:.4g} - {:.4g} km) around {}\n",
                           first->orbiting().name(), first->periapsis(), first->apoapsis(),
                           second->orbiting().name(), second->periapsis(), second->apoapsis(),
                           first->primary().name());
    }
}

} // namespace orrery::core
