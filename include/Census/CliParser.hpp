// =================================================================
// include/Census/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>

namespace Census {

// Parsed command-line options.
struct Commands {
    std::string project_path;   // Defaults to the current directory
    bool verbose = false;
    bool json = false;
    size_t batch_size = 0;      // 0 means "use the configured value"
    std::string config_path;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Census
