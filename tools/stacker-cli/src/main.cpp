#include "commands.hpp"
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

using namespace stacker::cli;

void print_version() {
    std::cout << "Stacker CLI v0.1.0\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    if (command == "run") {
        RunOptions options;

        for (int i = 2; i < argc; ++i) {
            const bool has_value = i + 1 < argc;
            if (std::strcmp(argv[i], "--scenario") == 0 && has_value) {
                options.scenario = argv[++i];
            } else if (std::strcmp(argv[i], "--config") == 0 && has_value) {
                options.config_path = argv[++i];
            } else if (std::strcmp(argv[i], "--oracle") == 0 && has_value) {
                options.oracle = argv[++i];
            } else if (std::strcmp(argv[i], "--max-iterations") == 0 && has_value) {
                try {
                    options.max_iterations = std::stoi(argv[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Error: --max-iterations expects a number, got '" << argv[i] << "'\n";
                    return static_cast<int>(Result::InvalidArgs);
                }
            } else if (std::strcmp(argv[i], "--output") == 0 && has_value) {
                options.output_path = argv[++i];
            } else if (std::strcmp(argv[i], "--lookahead") == 0) {
                options.lookahead = true;
            } else if (std::strcmp(argv[i], "--carrying") == 0) {
                options.carrying = true;
            } else if (std::strcmp(argv[i], "--verbose") == 0) {
                options.verbose = true;
            } else {
                std::cerr << "Error: Unknown or incomplete option '" << argv[i] << "'\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        return static_cast<int>(cmd_run(options));
    }

    if (command == "scenarios") {
        return static_cast<int>(cmd_scenarios());
    }

    if (command == "dump-config") {
        std::string scenario = "default";
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--scenario") == 0 && i + 1 < argc) {
                scenario = argv[++i];
            }
        }
        return static_cast<int>(cmd_dump_config(scenario));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'stacker-cli help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
