/// @file test_universe.cpp
/// @brief Unit tests for orrery::universe::Universe.
///
/// Covers body registration, orbit validation (including cycles and
/// Hill-sphere stability), the hierarchy rendering and temperature estimates.

#include <doctest/doctest.h>

#include "universe/universe.hpp"
#include "test_main.hpp"

#include <string>

using namespace orrery;
using namespace orrery::universe;

// =================================================================
// Helper: Sun, Earth, Moon and Mars without any orbits
// =================================================================

static Universe make_inner_system(std::string name = "Inner System")
{
    Universe universe{std::move(name)};
    universe.add_body(SolarBody::create("Sun", 1.989e30, 696340.0, 5772.0));
    universe.add_body(PlanetaryBody::create("Earth", 5.9724e24, 6371.0, 0.306, 33.0));
    universe.add_body(PlanetaryBody::create("Moon", 7.342e22, 1737.4, 0.11));
    universe.add_body(PlanetaryBody::create("Mars", 6.4171e23, 3389.5, 0.25));
    return universe;
}

static constexpr f64 kEarthOrbitKm = 1.49598023e8;
static constexpr f64 kMarsOrbitKm  = 2.27956e8;
static constexpr f64 kMoonOrbitKm  = 3.844e5;

// =================================================================
// Registration
// =================================================================

TEST_CASE("Bodies are registered under unique names")
{
    Universe universe{"Test"};
    CHECK(universe.name() == "Test");

    CHECK(universe.add_body(CelestialBody::create("Rock", 1.0e20, 100.0)) == AddBodyStatus::Added);
    CHECK(universe.add_body(CelestialBody::create("Rock", 2.0e20, 200.0)) == AddBodyStatus::DuplicateName);
    CHECK(universe.add_body(nullptr) == AddBodyStatus::NullBody);
    CHECK(universe.body_count() == 1);

    const CelestialBody* rock = universe.find_body("Rock");
    REQUIRE(rock != nullptr);
    CHECK(rock->mass() == doctest::Approx(1.0e20));
    CHECK(universe.find_body("Pebble") == nullptr);
}

TEST_CASE("Unnamed bodies receive numbered names")
{
    Universe universe;
    CHECK(universe.name() == Universe::kUnnamed);

    REQUIRE(universe.add_body(CelestialBody::create("Unnamed Celestial Body 1", 1.0, 1.0)) == AddBodyStatus::Added);
    REQUIRE(universe.add_body(CelestialBody::create("", 1.0, 1.0)) == AddBodyStatus::Added);
    REQUIRE(universe.add_body(CelestialBody::create("", 1.0, 1.0)) == AddBodyStatus::Added);

    CHECK(universe.find_body("Unnamed Celestial Body 2") != nullptr);
    CHECK(universe.find_body("Unnamed Celestial Body 3") != nullptr);
    CHECK(universe.body_count() == 3);
}

TEST_CASE("Universes are independent of each other")
{
    Universe first = make_inner_system("First");
    Universe second{"Second"};

    CHECK(first.body_count() == 4);
    CHECK(second.body_count() == 0);
    CHECK(second.find_body("Earth") == nullptr);
}

// =================================================================
// Orbits
// =================================================================

TEST_CASE("Orbits need registered bodies")
{
    Universe universe = make_inner_system();
    CHECK(universe.add_orbit("Sun", "Venus", 1.08e8, 0.0) == OrbitStatus::UnknownBody);
    CHECK(universe.add_orbit("Vulcan", "Earth", 1.08e8, 0.0) == OrbitStatus::UnknownBody);
    CHECK(universe.orbits().empty());
}

TEST_CASE("Orbit shape errors are passed through")
{
    Universe universe = make_inner_system();
    CHECK(universe.add_orbit("Sun", "Earth", -1.0, 0.0) == OrbitStatus::InvalidSemimajorAxis);
    CHECK(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 1.2) == OrbitStatus::InvalidEccentricity);
    CHECK(universe.add_orbit("Earth", "Earth", kEarthOrbitKm, 0.0) == OrbitStatus::SameBody);
    CHECK(universe.add_orbit("Sun", "Earth", 7.0e5, 0.0) == OrbitStatus::Collision);
    CHECK(universe.orbit_of("Earth") == nullptr);
}

TEST_CASE("A body orbits at most one primary")
{
    Universe universe = make_inner_system();
    REQUIRE(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 0.0167) == OrbitStatus::Valid);
    CHECK(universe.add_orbit("Mars", "Earth", 1.0e7, 0.0) == OrbitStatus::AlreadyOrbiting);

    const Orbit* orbit = universe.orbit_of("Earth");
    REQUIRE(orbit != nullptr);
    CHECK(orbit->primary().name() == "Sun");
}

TEST_CASE("Circular hierarchies are rejected")
{
    Universe universe{"Loop"};
    universe.add_body(CelestialBody::create("A", 1.0e20, 10.0));
    universe.add_body(CelestialBody::create("B", 1.0e20, 10.0));
    universe.add_body(CelestialBody::create("C", 1.0e20, 10.0));

    REQUIRE(universe.add_orbit("B", "A", 1.0e4, 0.0) == OrbitStatus::Valid);
    REQUIRE(universe.add_orbit("C", "B", 1.0e6, 0.0) == OrbitStatus::Valid);

    CHECK(universe.add_orbit("A", "B", 1.0e4, 0.0) == OrbitStatus::AlreadyOrbiting);
    CHECK(universe.add_orbit("A", "C", 1.0e8, 0.0) == OrbitStatus::CircularHierarchy);
    CHECK(universe.orbits().size() == 2);
}

TEST_CASE("Moons outside their planet's Hill sphere are unstable")
{
    SUBCASE("Planet orbit added first")
    {
        Universe universe = make_inner_system();
        REQUIRE(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 0.0167) == OrbitStatus::Valid);
        CHECK(universe.add_orbit("Earth", "Moon", 2.0e6, 0.0) == OrbitStatus::Unstable);
        CHECK(universe.add_orbit("Earth", "Moon", kMoonOrbitKm, 0.0549) == OrbitStatus::Valid);
    }

    SUBCASE("Moon orbit added first")
    {
        Universe universe = make_inner_system();
        REQUIRE(universe.add_orbit("Earth", "Moon", 2.0e6, 0.0) == OrbitStatus::Valid);
        CHECK(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 0.0167) == OrbitStatus::Unstable);
        CHECK(universe.orbit_of("Earth") == nullptr);
    }

    SUBCASE("Accepted on request")
    {
        Universe universe = make_inner_system();
        REQUIRE(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 0.0167) == OrbitStatus::Valid);
        CHECK(universe.add_orbit("Earth", "Moon", 2.0e6, 0.0, true) == OrbitStatus::Valid);
    }
}

// =================================================================
// Hierarchy
// =================================================================

TEST_CASE("Hierarchy lists satellites nearest first")
{
    Universe universe = make_inner_system("Solar System");
    REQUIRE(universe.add_orbit("Sun", "Mars", kMarsOrbitKm, 0.0935) == OrbitStatus::Valid);
    REQUIRE(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 0.0167) == OrbitStatus::Valid);
    REQUIRE(universe.add_orbit("Earth", "Moon", kMoonOrbitKm, 0.0549) == OrbitStatus::Valid);

    const auto satellites = universe.satellites_of("Sun");
    REQUIRE(satellites.size() == 2);
    CHECK(satellites[0]->orbiting().name() == "Earth");
    CHECK(satellites[1]->orbiting().name() == "Mars");

    const auto entries = universe.hierarchy();
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].body->name() == "Sun");
    CHECK(entries[0].depth == 0);
    CHECK(entries[2].body->name() == "Moon");
    CHECK(entries[2].depth == 2);

    CHECK(universe.render_hierarchy() == "Solar System:\n\t-Sun\n\t\t-Earth\n\t\t\t-Moon\n\t\t-Mars");
}

TEST_CASE("Hierarchy of a universe without orbits")
{
    Universe universe = make_inner_system("Empty Sky");
    CHECK(universe.hierarchy().empty());
    CHECK(universe.render_hierarchy() == "No orbits detected in Empty Sky");
}

TEST_CASE("Untethered planets and crossing orbits")
{
    Universe universe{"Crowded"};
    universe.add_body(SolarBody::create("Star", 1.989e30, 696340.0, 5772.0));
    universe.add_body(PlanetaryBody::create("Eccentric", 1.0e24, 5000.0));
    universe.add_body(PlanetaryBody::create("Circular", 1.0e24, 5000.0));
    universe.add_body(PlanetaryBody::create("Distant", 1.0e24, 5000.0));
    universe.add_body(PlanetaryBody::create("Rogue", 1.0e24, 5000.0));
    universe.add_body(CelestialBody::create("Asteroid", 1.0e15, 1.0));

    REQUIRE(universe.add_orbit("Star", "Eccentric", 1.0e8, 0.5) == OrbitStatus::Valid);
    REQUIRE(universe.add_orbit("Star", "Circular", 1.2e8, 0.0) == OrbitStatus::Valid);
    REQUIRE(universe.add_orbit("Star", "Distant", 5.0e8, 0.0) == OrbitStatus::Valid);

    const auto rogues = universe.untethered_planets();
    REQUIRE(rogues.size() == 1);
    CHECK(rogues[0]->name() == "Rogue");

    const auto crossings = universe.crossing_orbits();
    REQUIRE(crossings.size() == 1);
    CHECK(crossings[0].first->orbiting().name() == "Eccentric");
    CHECK(crossings[0].second->orbiting().name() == "Circular");
}

// =================================================================
// Temperature estimates
// =================================================================

TEST_CASE("Temperature of the Earth and its Moon")
{
    Universe universe = make_inner_system();
    REQUIRE(universe.add_orbit("Sun", "Earth", kEarthOrbitKm, 0.0167) == OrbitStatus::Valid);
    REQUIRE(universe.add_orbit("Earth", "Moon", kMoonOrbitKm, 0.0549) == OrbitStatus::Valid);

    SUBCASE("Earth")
    {
        const auto estimate = universe.estimate_temperature("Earth");
        REQUIRE(estimate.has_value());
        CHECK(estimate->star->name() == "Sun");
        CHECK(estimate->equilibrium_k == doctest::Approx(254.0).epsilon(test::kFactTol));
        CHECK(estimate->surface_k == doctest::Approx(estimate->equilibrium_k + 33.0));
        CHECK(estimate->periapsis_k > estimate->equilibrium_k);
        CHECK(estimate->apoapsis_k < estimate->equilibrium_k);
        CHECK(estimate->flux_w_m2 == doctest::Approx(1361.0).epsilon(test::kFactTol));
    }

    SUBCASE("Moon is heated at the Earth's distance")
    {
        const auto host = universe.host_star("Moon");
        REQUIRE(host.has_value());
        CHECK(host->star->name() == "Sun");
        CHECK(host->orbit->orbiting().name() == "Earth");

        const auto estimate = universe.estimate_temperature("Moon");
        REQUIRE(estimate.has_value());
        CHECK(estimate->distance_km == doctest::Approx(kEarthOrbitKm));
        CHECK(estimate->equilibrium_k == doctest::Approx(270.0).epsilon(test::kFactTol));
    }

    SUBCASE("Only orbiting planetary bodies have estimates")
    {
        CHECK_FALSE(universe.estimate_temperature("Sun").has_value());
        CHECK_FALSE(universe.estimate_temperature("Mars").has_value());
        CHECK_FALSE(universe.estimate_temperature("Pluto").has_value());
        CHECK_FALSE(universe.host_star("Mars").has_value());
    }
}

TEST_CASE("Planets around a black hole have no host star")
{
    Universe universe{"Dark"};
    universe.add_body(BlackHole::create("Hole", 1.0e31));
    universe.add_body(PlanetaryBody::create("Cinder", 1.0e24, 5000.0));
    REQUIRE(universe.add_orbit("Hole", "Cinder", 1.0e8, 0.0) == OrbitStatus::Valid);

    CHECK_FALSE(universe.host_star("Cinder").has_value());
    CHECK_FALSE(universe.estimate_temperature("Cinder").has_value());
}
