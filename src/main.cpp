/// @file main.cpp
/// @brief Orrery entry point.

#include "core/application.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char* argv[])
{
    // Console only until the command line names the log file
    orrery::core::Logger::init({.file_name = ""});

    const auto config = orrery::core::parse_command_line(argc, argv);
    if (!config)
    {
        std::cerr << orrery::core::usage(argv[0]);
        orrery::core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    if (config->show_help)
    {
        std::cout << orrery::core::usage(argv[0]);
        orrery::core::Logger::shutdown();
        return EXIT_SUCCESS;
    }

    orrery::core::Logger::init(config->logging);
    ORR_INFO("Orrery starting");

    int result = EXIT_FAILURE;
    {
        orrery::core::Application app(*config);
        result = app.run(std::cout);
    }

    ORR_INFO("Orrery finished");
    orrery::core::Logger::shutdown();
    return result;
}
