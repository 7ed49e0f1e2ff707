#include "DevSync/CliParser.hpp"
#include "DevSync/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    DevSync::CliParser parser;
    auto app = parser.setupCli();

    // CLI11's exit exceptions (help, version, usage errors) are turned into
    // its own exit codes.
    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Domain errors are mapped to category exit codes inside Core::run();
    // anything else is unexpected.
    DevSync::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
