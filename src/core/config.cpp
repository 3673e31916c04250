/// @file config.cpp
/// @brief Command-line parsing for SimulationConfig.

#include "core/config.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>

namespace orrery::core
{

namespace
{

std::optional<spdlog::level::level_enum> parse_level(std::string_view text)
{
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info")  return spdlog::level::info;
    if (text == "warn")  return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    return std::nullopt;
}

std::optional<f64> parse_positive(std::string_view text)
{
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || !(value > 0.0))
    {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

std::optional<SimulationConfig> parse_command_line(int argc, const char* const* argv)
{
    SimulationConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view option = argv[i];

        if (option == "--help" || option == "-h")
        {
            config.show_help = true;
            continue;
        }

        if (option == "--allow-unstable")
        {
            config.allow_unstable = true;
            continue;
        }

        if (option != "--system" && option != "--log-file" &&
            option != "--log-level" && option != "--test-mass")
        {
            ORR_CORE_ERROR("Config: unknown option '{}'", option);
            return std::nullopt;
        }

        if (i + 1 >= argc)
        {
            ORR_CORE_ERROR("Config: option '{}' expects a value", option);
            return std::nullopt;
        }

        const std::string_view value = argv[++i];

        if (option == "--system")
        {
            config.system_file = std::filesystem::path{value};
        }
        else if (option == "--log-file")
        {
            if (value.empty())
            {
                ORR_CORE_ERROR("Config: --log-file expects a non-empty path");
                return std::nullopt;
            }
            config.logging.file_name = std::string{value};
        }
        else if (option == "--log-level")
        {
            const auto level = parse_level(value);
            if (!level)
            {
                ORR_CORE_ERROR("Config: unknown log level '{}' (expected trace, debug, info, warn or error)",
                               value);
                return std::nullopt;
            }
            config.logging.level = *level;
        }
        else
        {
            const auto mass = parse_positive(value);
            if (!mass)
            {
                ORR_CORE_ERROR("Config: test mass '{}' must be a number greater than 0", value);
                return std::nullopt;
            }
            config.test_mass_kg = *mass;
        }
    }

    return config;
}

std::string usage(std::string_view program)
{
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Options:\n"
        "  --system <csv>        load a star system from a CSV file (default: built-in Solar System)\n"
        "  --log-file <path>     log file (default: orrery.log)\n"
        "  --log-level <level>   trace, debug, info, warn or error (default: info)\n"
        "  --test-mass <kg>      mass weighed on each planetary surface (default: 70)\n"
        "  --allow-unstable      keep orbits that leave their primary's Hill sphere\n"
        "  --help                show this message\n",
        program);
}

} // namespace orrery::core
