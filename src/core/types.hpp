#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace orrery
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for orbital geometry)
    using Vec2d = glm::dvec2;

    // Physical constants (SI unless the name says otherwise)
    namespace physical_constants
    {
        constexpr f64 kPi                  = glm::pi<f64>();
        constexpr f64 kTwoPi               = 2.0 * kPi;
        constexpr f64 kSpeedOfLight        = 299792458.0;      // m/s
        constexpr f64 kGravitational       = 6.674e-11;        // m^3 kg^-1 s^-2
        constexpr f64 kStefanBoltzmann     = 5.670374419e-8;   // W m^-2 K^-4
        constexpr f64 kSolarMass           = 1.989e30;         // kg
        constexpr f64 kAstronomicalUnitKm  = 1.495978707e8;    // km
        constexpr f64 kStandardGravity     = 9.80665;          // m/s^2
        constexpr f64 kPoundsPerKilogram   = 2.20462;
        constexpr f64 kMetresPerKilometre  = 1000.0;
        constexpr f64 kSecondsPerDay       = 86400.0;
        constexpr f64 kWaterFreezingK      = 273.15;
        constexpr f64 kWaterBoilingK       = 373.15;
    }
}
