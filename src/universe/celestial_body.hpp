#pragma once

/// @file celestial_body.hpp
/// @brief Celestial body hierarchy: generic bodies, black holes, stars, planets.

#include "core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace orrery::universe
{
    /// @brief Concrete type of a CelestialBody.
    enum class BodyKind : u8
    {
        Generic,
        BlackHole,
        Star,
        Planet,
    };

    [[nodiscard]] const char* body_kind_name(BodyKind kind);

    /// @brief A roughly spherical body with a mass and a radius.
    ///
    /// Units used throughout:
    /// - mass: kilograms
    /// - radius: kilometres
    /// - volume: cubic kilometres
    /// - density: kilograms per cubic metre
    /// - surface gravity: metres per second squared
    ///
    /// Bodies are created through the static create() factories, which
    /// validate their parameters and return nullptr when they are not
    /// physical. Bodies know nothing about each other; orbital relations
    /// live in Universe.
    class CelestialBody
    {
    protected:
        /// @brief Restricts construction to the create() factories.
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        static constexpr std::string_view kUnnamed = "Unnamed Celestial Body";

        CelestialBody(Passkey, std::string name, f64 mass_kg, f64 radius_km);

        /// @brief Create a generic body.
        /// @param name Display name; an empty name means kUnnamed.
        /// @param mass_kg Mass, must be > 0.
        /// @param radius_km Radius, must be > 0.
        /// @return The body, or nullptr if a parameter is out of range.
        [[nodiscard]] static std::unique_ptr<CelestialBody> create(
            std::string name,
            f64 mass_kg,
            f64 radius_km
        );

        virtual ~CelestialBody() = default;

        CelestialBody(const CelestialBody&) = delete;
        CelestialBody& operator=(const CelestialBody&) = delete;

        [[nodiscard]] const std::string& name() const { return m_name; }
        void set_name(std::string name) { m_name = std::move(name); }

        [[nodiscard]] f64 mass() const { return m_mass; }
        [[nodiscard]] f64 radius() const { return m_radius; }

        /// @brief Volume of the body as a sphere (km³).
        [[nodiscard]] f64 volume() const;

        /// @brief Mean density (kg/m³); the volume is converted from km³.
        [[nodiscard]] f64 density() const;

        /// @brief Gravitational acceleration at the surface (m/s²).
        [[nodiscard]] f64 surface_gravity() const;

        [[nodiscard]] virtual BodyKind kind() const { return BodyKind::Generic; }

        /// @brief Multi-line statistics: the shared basic stats followed by
        /// kind-specific additional stats.
        [[nodiscard]] std::string describe() const;

        /// @brief Constructor-style one-line representation, e.g. "CelestialBody(5.97e+24, 6371)".
        [[nodiscard]] virtual std::string repr() const;

    protected:
        /// @brief Subclass-specific lines appended by describe().
        [[nodiscard]] virtual std::string additional_stats() const { return {}; }

        /// @brief Log and reject non-positive mass or radius, and radii whose
        /// volume is not a finite positive number of cubic kilometres.
        [[nodiscard]] static bool validate(std::string_view name, f64 mass_kg, f64 radius_km);

    private:
        std::string m_name;
        f64 m_mass;
        f64 m_radius;
    };

    /// @brief A black hole, sized by its event horizon.
    class BlackHole final : public CelestialBody
    {
    public:
        /// @brief Only the mass is requested; the radius is the Schwarzschild radius.
        [[nodiscard]] static std::unique_ptr<BlackHole> create(std::string name, f64 mass_kg);

        BlackHole(Passkey, std::string name, f64 mass_kg, f64 event_horizon_km);

        /// @brief Radius of the event horizon (km).
        [[nodiscard]] f64 event_horizon() const { return radius(); }

        [[nodiscard]] BodyKind kind() const override { return BodyKind::BlackHole; }
        [[nodiscard]] std::string repr() const override;
    };

    /// @brief A star radiating as a black body at its effective temperature.
    class SolarBody final : public CelestialBody
    {
    public:
        /// @param temperature_k Effective surface temperature, must be > 0.
        [[nodiscard]] static std::unique_ptr<SolarBody> create(
            std::string name,
            f64 mass_kg,
            f64 radius_km,
            f64 temperature_k
        );

        SolarBody(Passkey, std::string name, f64 mass_kg, f64 radius_km, f64 temperature_k);

        [[nodiscard]] f64 temperature() const { return m_temperature; }

        /// @brief Stefan-Boltzmann luminosity (W).
        [[nodiscard]] f64 luminosity() const;

        [[nodiscard]] BodyKind kind() const override { return BodyKind::Star; }
        [[nodiscard]] std::string repr() const override;

    protected:
        [[nodiscard]] std::string additional_stats() const override;

    private:
        f64 m_temperature;
    };

    /// @brief A planet or moon: something one could stand on.
    class PlanetaryBody final : public CelestialBody
    {
    public:
        /// Mass of an average person, used when no test mass is given.
        static constexpr f64 kDefaultTestMassKg = 70.0;

        /// @param albedo Bond albedo in [0, 1).
        /// @param greenhouse_offset_k Warming of the surface above the
        ///        equilibrium temperature (K), must be >= 0.
        [[nodiscard]] static std::unique_ptr<PlanetaryBody> create(
            std::string name,
            f64 mass_kg,
            f64 radius_km,
            f64 albedo = 0.3,
            f64 greenhouse_offset_k = 0.0
        );

        PlanetaryBody(Passkey, std::string name, f64 mass_kg, f64 radius_km, f64 albedo, f64 greenhouse_offset_k);

        [[nodiscard]] f64 albedo() const { return m_albedo; }
        [[nodiscard]] f64 greenhouse_offset() const { return m_greenhouse_offset; }

        /// @brief Gravitational force on an object resting on the surface (N).
        ///
        /// Gravity is assumed to be the only force acting on the object.
        /// A non-positive object mass yields std::nullopt.
        [[nodiscard]] std::optional<f64> weight_on_surface(f64 object_mass_kg = kDefaultTestMassKg) const;

        /// @brief What a bathroom scale calibrated for Earth would read (kg).
        [[nodiscard]] std::optional<f64> scale_reading_kg(f64 object_mass_kg = kDefaultTestMassKg) const;

        /// @brief Same as scale_reading_kg(), in pounds.
        [[nodiscard]] std::optional<f64> scale_reading_lb(f64 object_mass_kg = kDefaultTestMassKg) const;

        [[nodiscard]] BodyKind kind() const override { return BodyKind::Planet; }
        [[nodiscard]] std::string repr() const override;

    protected:
        [[nodiscard]] std::string additional_stats() const override;

    private:
        f64 m_albedo;
        f64 m_greenhouse_offset;
    };

} // namespace orrery::universe
