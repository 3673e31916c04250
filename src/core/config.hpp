#pragma once

/// @file config.hpp
/// @brief Run configuration for the orrery command-line tool.

#include "core/logger.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace orrery::core
{
    /// @brief Settings for one run of the orrery report.
    /// Use designated initializers: SimulationConfig{.system_file = "data/systems/trappist.csv"};
    struct SimulationConfig
    {
        std::filesystem::path system_file;   ///< Empty selects the built-in Solar System
        LoggerConfig logging;
        f64 test_mass_kg = 70.0;             ///< Object weighed on every planetary surface
        bool allow_unstable = false;         ///< Accept orbits that leave a Hill sphere
        bool show_help = false;
    };

    /// @brief Parse command-line options into a SimulationConfig.
    ///
    /// Recognised options:
    ///   --system <csv>          load bodies and orbits from a system file
    ///   --log-file <path>       rotating log file (default orrery.log)
    ///   --log-level <level>     trace, debug, info, warn or error
    ///   --test-mass <kg>        mass used for surface weights (> 0)
    ///   --allow-unstable        keep orbits that fail the Hill-sphere check
    ///   --help                  print usage and exit
    ///
    /// @return The configuration, or std::nullopt (with the reason logged)
    ///         on an unknown option, a missing value or an invalid value.
    [[nodiscard]] std::optional<SimulationConfig> parse_command_line(int argc, const char* const* argv);

    /// @brief Multi-line usage text for --help.
    [[nodiscard]] std::string usage(std::string_view program);

} // namespace orrery::core
