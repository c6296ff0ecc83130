#include "commands.hpp"
#include <stacker/core/filesystem.hpp>
#include <stacker/core/log.hpp>
#include <stacker/planning/replanner.hpp>
#include <stacker/world/grid_oracle.hpp>
#include <stacker/world/recast_oracle.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace stacker::cli {

using json = nlohmann::json;
using namespace stacker::planning;

namespace {

std::unique_ptr<world::NavOracle> make_oracle(const std::string& name, const StackerConfig& config) {
    if (name == "recast") {
        return std::make_unique<world::RecastNavOracle>(config.navmesh);
    }
    if (name == "grid") {
        return std::make_unique<world::GridNavOracle>(
            world::GridNavOracle::from_max_climb(config.navmesh.agent_max_climb));
    }
    return nullptr;
}

void print_actions(const HeadlessRunResult& result) {
    for (size_t i = 0; i < result.actions.size(); ++i) {
        const auto& action = result.actions[i];
        std::cout << "  " << (i + 1) << ". [" << world::to_string(action.type) << "] "
                  << action.description << " -> " << core::to_string(action.destination()) << "\n";
    }
}

void print_grid(const HeightGrid& grid) {
    // Rows are z, highest first, so the printout matches a top-down view
    for (int z = grid.depth() - 1; z >= 0; --z) {
        std::cout << "  ";
        for (int x = 0; x < grid.width(); ++x) {
            const int h = grid.height({x, z});
            if (h == 0) {
                std::cout << " .";
            } else {
                std::cout << " " << h;
            }
        }
        std::cout << "\n";
    }
}

} // namespace

Result cmd_run(const RunOptions& options) {
    const Scenario* scenario = find_scenario(options.scenario);
    if (!scenario) {
        std::cerr << "Error: Unknown scenario '" << options.scenario << "'\n";
        std::cerr << "Run 'stacker-cli scenarios' to list them.\n";
        return Result::InvalidArgs;
    }

    StackerConfig config = scenario->config;
    if (!options.config_path.empty() && !config.load(options.config_path)) {
        std::cerr << "Error: Could not load config: " << options.config_path << "\n";
        return Result::FileError;
    }

    if (options.max_iterations) config.max_iterations = options.max_iterations;
    if (options.lookahead) config.lookahead = true;
    if (options.carrying) config.start_carrying = true;

    auto oracle = make_oracle(options.oracle, config);
    if (!oracle) {
        std::cerr << "Error: Unknown oracle '" << options.oracle << "' (expected recast or grid)\n";
        return Result::InvalidArgs;
    }

    if (options.verbose) {
        core::set_log_level(core::LogLevel::Debug);
    }

    std::cout << "Scenario: " << scenario->name << " (" << scenario->id << ")\n";
    std::cout << "  " << scenario->description << "\n";
    std::cout << "  Oracle: " << oracle->name() << ", max iterations: "
              << config.effective_max_iterations() << "\n\n";

    HeadlessRunResult result = run_headless(config, *oracle);

    if (result.termination == RunTermination::InvalidConfig) {
        std::cerr << "Error: Invalid config: " << result.error_message << "\n";
        return Result::FileError;
    }

    std::cout << "Actions (" << result.actions.size() << "):\n";
    print_actions(result);

    std::cout << "\nFinal grid:\n";
    print_grid(result.final_grid);

    std::cout << "\nResult: " << to_string(result.termination)
              << " after " << result.iterations << " iterations\n";
    std::cout << "  Agent: " << core::to_string(result.final_agent_position)
              << (result.final_carrying ? " (carrying)" : "") << "\n";
    if (!result.error_message.empty()) {
        std::cout << "  " << result.error_message << "\n";
    }

    if (!options.output_path.empty()) {
        json j = result;
        if (!core::FileSystem::write_text(options.output_path, j.dump(2))) {
            std::cerr << "Error: Could not write result to " << options.output_path << "\n";
            return Result::FileError;
        }
        std::cout << "  Wrote " << options.output_path << "\n";
    }

    return result.reached_goal ? Result::Success : Result::GoalNotReached;
}

Result cmd_scenarios() {
    for (const auto& scenario : get_scenarios()) {
        std::cout << "  " << scenario.id << "\n";
        std::cout << "      " << scenario.name << ": " << scenario.description << "\n";
    }
    return Result::Success;
}

Result cmd_dump_config(const std::string& scenario_id) {
    const Scenario* scenario = find_scenario(scenario_id);
    if (!scenario) {
        std::cerr << "Error: Unknown scenario '" << scenario_id << "'\n";
        return Result::InvalidArgs;
    }

    std::cout << scenario->config.dump() << "\n";
    return Result::Success;
}

void cmd_help() {
    std::cout << R"(Stacker CLI - HTN block-stacking planner

Usage: stacker-cli <command> [options]

Commands:
  run          Plan and execute a scenario headlessly
  scenarios    List the built-in scenarios
  dump-config  Print a scenario's configuration as JSON
  help         Show this help message

Run Options:
  --scenario <id>        Scenario to start from (default: default)
  --config <file>        JSON config applied on top of the scenario
  --oracle recast|grid   Pathfinding oracle (default: recast)
  --max-iterations <n>   Replanning iteration limit
  --lookahead            Try to plan the whole staircase in one pass
  --carrying             Start the agent holding a block
  --output <file>        Write the run result as JSON
  --verbose              Debug logging

Dump-config Options:
  --scenario <id>        Scenario to print (default: default)

Exit codes:
  0  goal reached
  1  goal not reached
  2  invalid arguments
  3  file or config error

Examples:
  stacker-cli run --scenario buildTwoSteps --oracle grid
  stacker-cli dump-config --scenario pickPlaceOne > my_config.json
  stacker-cli run --config my_config.json --output result.json
)";
}

} // namespace stacker::cli
