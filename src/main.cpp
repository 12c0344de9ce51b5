#include "Jetpilot/CliParser.hpp"
#include "Jetpilot/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Jetpilot::CliParser parser;
    auto app = parser.setupCli();

    // CLI11 reports --help and parse failures through exceptions; app->exit
    // prints the message and yields the matching exit code.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Core loads the configuration and dispatches the selected subcommand.
    Jetpilot::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
