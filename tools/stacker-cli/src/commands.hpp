#pragma once

#include <optional>
#include <string>

namespace stacker::cli {

// Command result codes, returned as the process exit code
enum class Result {
    Success = 0,
    GoalNotReached = 1,
    InvalidArgs = 2,
    FileError = 3
};

struct RunOptions {
    std::string scenario = "default";
    std::string config_path;        // Applied on top of the scenario
    std::string oracle = "recast";  // recast | grid
    std::optional<int> max_iterations;
    bool lookahead = false;
    bool carrying = false;
    std::string output_path;        // Result JSON
    bool verbose = false;
};

// stacker-cli run [--scenario <id>] [--config <file>] [--oracle recast|grid]
//                 [--max-iterations N] [--lookahead] [--carrying]
//                 [--output <file>] [--verbose]
// Runs the headless replanner and prints the committed actions
Result cmd_run(const RunOptions& options);

// stacker-cli scenarios
Result cmd_scenarios();

// stacker-cli dump-config [--scenario <id>]
// Prints a scenario's configuration as JSON
Result cmd_dump_config(const std::string& scenario);

// stacker-cli help
void cmd_help();

} // namespace stacker::cli
