// =================================================================
// src/Census/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Census/CliParser.hpp"
#include "Census/ScanConfig.hpp"
#include <filesystem>

namespace Census {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>(
        "Census: counts React component declarations in a project.", "census");

    m_commands.project_path = std::filesystem::current_path().string();
    m_commands.config_path = ScanConfig::DEFAULT_CONFIG_PATH;

    m_app->add_option("path", m_commands.project_path,
                      "Path to the React project (defaults to current directory)");
    m_app->add_flag("-v,--verbose", m_commands.verbose,
                    "Show detailed output with all components by file");
    m_app->add_flag("--json", m_commands.json,
                    "Print the report as JSON");
    m_app->add_option("-b,--batch-size", m_commands.batch_size,
                      "Number of files read concurrently (default: 50, max: 1024)")->check(CLI::PositiveNumber);
    m_app->add_option("-c,--config", m_commands.config_path,
                      "Configuration file (default: .census/config.yml)");

    m_app->footer("Examples:\n"
                  "  census\n"
                  "  census ./my-react-app\n"
                  "  census -v /path/to/project\n"
                  "  census --verbose ./src");

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

} // namespace Census
