/// @file test_celestial_body.cpp
/// @brief Unit tests for the orrery::universe celestial body hierarchy.

#include <doctest/doctest.h>

#include "universe/celestial_body.hpp"
#include "test_main.hpp"

#include <string>

using namespace orrery;
using namespace orrery::universe;

// =================================================================
// CelestialBody
// =================================================================

TEST_CASE("Generic body derives volume, density and gravity")
{
    const auto earth = CelestialBody::create("Earth", 5.9724e24, 6371.0);
    REQUIRE(earth != nullptr);

    CHECK(earth->name() == "Earth");
    CHECK(earth->kind() == BodyKind::Generic);
    CHECK(earth->volume() == doctest::Approx(1.0832e12).epsilon(1e-3));
    CHECK(earth->density() == doctest::Approx(5514.0).epsilon(1e-3));
    CHECK(earth->surface_gravity() == doctest::Approx(9.82).epsilon(1e-3));
}

TEST_CASE("Factories reject unphysical parameters")
{
    CHECK(CelestialBody::create("Zero mass", 0.0, 1.0) == nullptr);
    CHECK(CelestialBody::create("Negative radius", 1.0, -1.0) == nullptr);
    CHECK(SolarBody::create("Cold star", 1.0e30, 1.0e5, 0.0) == nullptr);
    CHECK(BlackHole::create("Massless", 0.0) == nullptr);

    SUBCASE("Planet albedo and greenhouse offset")
    {
        CHECK(PlanetaryBody::create("Mirror", 1.0e24, 1000.0, 1.0) == nullptr);
        CHECK(PlanetaryBody::create("Glowing", 1.0e24, 1000.0, -0.1) == nullptr);
        CHECK(PlanetaryBody::create("Icebox", 1.0e24, 1000.0, 0.3, -5.0) == nullptr);
        CHECK(PlanetaryBody::create("Coal", 1.0e24, 1000.0, 0.0) != nullptr);
    }
}

TEST_CASE("Radii whose volume cannot be represented are rejected")
{
    SUBCASE("Primordial black hole with a vanishing horizon")
    {
        CHECK(BlackHole::create("Primordial", 1e-100) == nullptr);
    }

    SUBCASE("Radius that underflows when cubed")
    {
        CHECK(CelestialBody::create("Speck", 1.0, 1e-120) == nullptr);
        CHECK(PlanetaryBody::create("Speck", 1.0, 1e-120) == nullptr);
    }

    SUBCASE("Radius that overflows when cubed")
    {
        CHECK(SolarBody::create("Colossus", 1.0e30, 1e200, 5000.0) == nullptr);
    }

    SUBCASE("Smallest accepted black hole still describes itself")
    {
        const auto hole = BlackHole::create("Micro", 1.0e12);
        REQUIRE(hole != nullptr);
        CHECK(hole->volume() > 0.0);
        CHECK(hole->describe().rfind("BlackHole \"Micro\":", 0) == 0);
    }
}

TEST_CASE("Empty names become the unnamed placeholder")
{
    const auto body = CelestialBody::create("", 1.0, 1.0);
    REQUIRE(body != nullptr);
    CHECK(body->name() == CelestialBody::kUnnamed);
}

TEST_CASE("describe() lists the shared stats under a kind header")
{
    const auto body = CelestialBody::create("Rock", 1.0e20, 100.0);
    REQUIRE(body != nullptr);

    const std::string text = body->describe();
    CHECK(text.rfind("CelestialBody \"Rock\":", 0) == 0);
    CHECK(text.find("    mass: 1e+20 kilograms") != std::string::npos);
    CHECK(text.find("    radius: 100 kilometers") != std::string::npos);
    CHECK(text.find("gravitational_acceleration") != std::string::npos);
}

// =================================================================
// BlackHole
// =================================================================

TEST_CASE("Black hole radius is its event horizon")
{
    const auto hole = BlackHole::create("Sagittarius A*", 4.154e6 * physical_constants::kSolarMass);
    REQUIRE(hole != nullptr);

    CHECK(hole->kind() == BodyKind::BlackHole);
    CHECK(hole->event_horizon() == doctest::Approx(hole->radius()));
    CHECK(hole->radius() == doctest::Approx(1.2271e7).epsilon(1e-3));
    CHECK(hole->repr().rfind("BlackHole(", 0) == 0);
}

// =================================================================
// SolarBody
// =================================================================

TEST_CASE("Star luminosity and stats")
{
    const auto sun = SolarBody::create("Sun", 1.989e30, 696340.0, 5772.0);
    REQUIRE(sun != nullptr);

    CHECK(sun->kind() == BodyKind::Star);
    CHECK(sun->temperature() == doctest::Approx(5772.0));
    CHECK(sun->luminosity() == doctest::Approx(3.828e26).epsilon(test::kFactTol));

    const std::string text = sun->describe();
    CHECK(text.rfind("SolarBody \"Sun\":", 0) == 0);
    CHECK(text.find("temperature: 5772 Kelvin") != std::string::npos);
    CHECK(text.find("luminosity:") != std::string::npos);
}

// =================================================================
// PlanetaryBody
// =================================================================

TEST_CASE("Surface weight of a person on Earth")
{
    const auto earth = PlanetaryBody::create("Earth", 5.9724e24, 6371.0, 0.306, 33.0);
    REQUIRE(earth != nullptr);

    CHECK(earth->albedo() == doctest::Approx(0.306));
    CHECK(earth->greenhouse_offset() == doctest::Approx(33.0));

    const auto weight = earth->weight_on_surface();
    const auto kg = earth->scale_reading_kg();
    const auto lb = earth->scale_reading_lb();
    REQUIRE(weight.has_value());
    REQUIRE(kg.has_value());
    REQUIRE(lb.has_value());

    CHECK(*weight == doctest::Approx(687.41).epsilon(1e-4));
    CHECK(*kg == doctest::Approx(70.0).epsilon(test::kFactTol));
    CHECK(*lb == doctest::Approx(154.5).epsilon(test::kFactTol));
}

TEST_CASE("Scale reading on the Moon is about a sixth of Earth's")
{
    const auto moon = PlanetaryBody::create("Moon", 7.342e22, 1737.4, 0.11);
    REQUIRE(moon != nullptr);

    const auto kg = moon->scale_reading_kg(60.0);
    REQUIRE(kg.has_value());
    CHECK(*kg == doctest::Approx(10.0).epsilon(0.05));

    CHECK_FALSE(moon->weight_on_surface(0.0).has_value());
    CHECK_FALSE(moon->scale_reading_lb(-1.0).has_value());
}

TEST_CASE("Planet defaults and description")
{
    const auto planet = PlanetaryBody::create("Default", 1.0e24, 5000.0);
    REQUIRE(planet != nullptr);

    CHECK(planet->kind() == BodyKind::Planet);
    CHECK(planet->albedo() == doctest::Approx(0.3));
    CHECK(planet->greenhouse_offset() == doctest::Approx(0.0));

    const std::string text = planet->describe();
    CHECK(text.rfind("PlanetaryBody \"Default\":", 0) == 0);
    CHECK(text.find("albedo: 0.300") != std::string::npos);
    CHECK(text.find("scale_reading_of_70_kg") != std::string::npos);
}

TEST_CASE("Kind names")
{
    CHECK(std::string{body_kind_name(BodyKind::Generic)} == "CelestialBody");
    CHECK(std::string{body_kind_name(BodyKind::BlackHole)} == "BlackHole");
    CHECK(std::string{body_kind_name(BodyKind::Star)} == "SolarBody");
    CHECK(std::string{body_kind_name(BodyKind::Planet)} == "PlanetaryBody");
}
