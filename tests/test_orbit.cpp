/// @file test_orbit.cpp
/// @brief Unit tests for orrery::universe::Orbit.

#include <doctest/doctest.h>

#include "universe/orbit.hpp"
#include "test_main.hpp"

#include <string>

using namespace orrery;
using namespace orrery::universe;

TEST_CASE("Earth around the Sun")
{
    const auto sun = SolarBody::create("Sun", 1.989e30, 696340.0, 5772.0);
    const auto earth = PlanetaryBody::create("Earth", 5.9724e24, 6371.0, 0.306, 33.0);
    REQUIRE(sun != nullptr);
    REQUIRE(earth != nullptr);

    const auto orbit = Orbit::create(*sun, *earth, 1.49598023e8, 0.0167);
    REQUIRE(orbit.has_value());

    CHECK(&orbit->primary() == sun.get());
    CHECK(&orbit->orbiting() == earth.get());
    CHECK(orbit->periapsis() == doctest::Approx(1.49598023e8 * (1.0 - 0.0167)));
    CHECK(orbit->apoapsis() == doctest::Approx(1.49598023e8 * (1.0 + 0.0167)));
    CHECK(orbit->semiminor_axis() < orbit->semimajor_axis());
    CHECK(orbit->period_days() == doctest::Approx(365.25).epsilon(1e-3));
    CHECK(orbit->period() == doctest::Approx(orbit->period_days() * physical_constants::kSecondsPerDay));

    SUBCASE("Distance and position along the orbit")
    {
        CHECK(orbit->distance_at(0.0) == doctest::Approx(orbit->periapsis()));
        CHECK(orbit->distance_at(physical_constants::kPi) == doctest::Approx(orbit->apoapsis()));
        CHECK(orbit->position_at(0.0).x == doctest::Approx(orbit->periapsis()));
    }

    SUBCASE("Hill radius")
    {
        CHECK(orbit->hill_radius() == doctest::Approx(1.4714e6).epsilon(1e-3));
    }

    SUBCASE("repr nests the bodies")
    {
        CHECK(orbit->repr().rfind("Orbit(SolarBody(", 0) == 0);
    }
}

TEST_CASE("Orbit::check reports why an orbit is impossible")
{
    const auto star = SolarBody::create("Star", 1.0e30, 5.0e5, 5000.0);
    const auto planet = PlanetaryBody::create("Planet", 1.0e24, 6000.0);
    REQUIRE(star != nullptr);
    REQUIRE(planet != nullptr);

    SUBCASE("Semi-major axis must be positive")
    {
        CHECK(Orbit::check(*star, *planet, 0.0, 0.1) == OrbitStatus::InvalidSemimajorAxis);
        CHECK(Orbit::check(*star, *planet, -1.0e8, 0.1) == OrbitStatus::InvalidSemimajorAxis);
    }

    SUBCASE("Eccentricity must lie in [0, 1)")
    {
        CHECK(Orbit::check(*star, *planet, 1.0e8, 1.0) == OrbitStatus::InvalidEccentricity);
        CHECK(Orbit::check(*star, *planet, 1.0e8, -0.2) == OrbitStatus::InvalidEccentricity);
    }

    SUBCASE("A body cannot orbit itself")
    {
        CHECK(Orbit::check(*planet, *planet, 1.0e8, 0.1) == OrbitStatus::SameBody);
    }

    SUBCASE("Periapsis inside the combined radii collides")
    {
        // a = 1e6 km, e = 0.6: periapsis 4e5 km < 5.06e5 km
        CHECK(Orbit::check(*star, *planet, 1.0e6, 0.6) == OrbitStatus::Collision);
        CHECK_FALSE(Orbit::create(*star, *planet, 1.0e6, 0.6).has_value());
    }

    SUBCASE("Orbit that grazes the primary collides")
    {
        CHECK(Orbit::check(*star, *planet, 5.06e5, 0.0) == OrbitStatus::Collision);
        CHECK(Orbit::check(*star, *planet, 5.07e5, 0.0) == OrbitStatus::Valid);
    }

    SUBCASE("Well separated orbit is valid")
    {
        CHECK(Orbit::check(*star, *planet, 1.0e8, 0.3) == OrbitStatus::Valid);
    }
}

TEST_CASE("Status names are readable")
{
    CHECK(std::string{orbit_status_name(OrbitStatus::Valid)} == "valid");
    CHECK(std::string{orbit_status_name(OrbitStatus::Collision)} == "collision");
    CHECK(std::string{orbit_status_name(OrbitStatus::CircularHierarchy)} == "circular hierarchy");
}
