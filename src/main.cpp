#include "Census/CliParser.hpp"
#include "Census/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    Census::CliParser parser;

    try {
        auto app = parser.setupCli();
        try {
            app->parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Also covers --help, which CLI11 reports through an exception
            return app->exit(e);
        }
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    Census::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
