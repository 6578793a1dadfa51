// =================================================================
// src/Census/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Census/Core.hpp"
#include "Census/Logger.hpp"
#include "Census/ReportPrinter.hpp"
#include "Census/ScanConfig.hpp"
#include "Census/ScanPipeline.hpp"
#include <iostream>

namespace Census {

Core::Core(const Commands& commands)
    : m_commands(commands)
{
}

int Core::run() {
    ScanConfig config;
    try {
        config = ScanConfig::loadFromFile(m_commands.config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    configureLogging(config);

    ScanOptions options = config.scanOptions();
    if (m_commands.batch_size > 0) {
        options.batch_size = m_commands.batch_size;
    }

    if (!m_commands.json) {
        std::cout << "Scanning " << m_commands.project_path << " for React components..."
                  << std::endl << std::endl;
    }

    ScanPipeline pipeline(options);
    try {
        Report report = pipeline.scan(m_commands.project_path);

        ReportPrinter printer(m_commands.verbose);
        if (m_commands.json) {
            printer.printJson(report, std::cout);
        } else {
            printer.printText(report, std::cout);
        }
    } catch (const InvalidRootError& e) {
        LOG_ERROR("Core", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().flush();
    return 0;
}

void Core::configureLogging(const ScanConfig& config) const {
    Logger& logger = Logger::getInstance();

    if (config.log_level_set) {
        logger.setConsoleLogLevel(config.log_level);
    } else if (m_commands.verbose) {
        logger.setConsoleLogLevel(LogLevel::INFO);
    }

    if (!config.log_directory.empty()) {
        logger.enableFileLogging(config.log_directory);
    }
}

} // namespace Census
