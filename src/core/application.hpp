#pragma once

/// @file application.hpp
/// @brief Command-line application: load a star system and print its report.

#include "core/config.hpp"
#include "universe/universe.hpp"

#include <optional>
#include <ostream>

namespace orrery::core
{
    /// @brief Owns the universe for one run and writes the text report.
    ///
    /// Lifecycle: construct with a config, then run() loads the system
    /// (a CSV file or the built-in Solar System) and prints every section.
    class Application
    {
    public:
        explicit Application(SimulationConfig config);

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Load the configured system and write the report.
        /// @return EXIT_SUCCESS, or EXIT_FAILURE if the system could not be loaded.
        [[nodiscard]] int run(std::ostream& out);

        /// @brief The loaded universe (empty until run() succeeds).
        [[nodiscard]] const std::optional<universe::Universe>& loaded_universe() const { return m_universe; }

    private:
        [[nodiscard]] bool load();

        void print_bodies(std::ostream& out) const;
        void print_hierarchy(std::ostream& out) const;
        void print_temperatures(std::ostream& out) const;
        void print_temperate_zones(std::ostream& out) const;
        void print_surface_weights(std::ostream& out) const;
        void print_untethered(std::ostream& out) const;
        void print_crossings(std::ostream& out) const;

        SimulationConfig m_config;
        std::optional<universe::Universe> m_universe;
    };

} // namespace orrery::core
