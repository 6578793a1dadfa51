// =================================================================
// include/Census/Core.hpp
// =================================================================
// Defines the application orchestrator behind the census command.

#pragma once

#include "Census/CliParser.hpp"

namespace Census {

struct ScanConfig;

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Loads configuration, runs the scan and prints the report.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    /**
     * @brief Apply logging settings from config and command line
     */
    void configureLogging(const ScanConfig& config) const;

    const Commands& m_commands;
};

} // namespace Census
