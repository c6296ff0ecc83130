#pragma once

#include <stacker/planning/stacker_config.hpp>
#include <stacker/world/nav_oracle.hpp>
#include <stacker/world/planned_action.hpp>
#include <stacker/world/world_state.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace stacker::planning {

enum class RunTermination : uint8_t {
    GoalReached,
    PlannerStuck,       // A planning pass produced no usable plan
    IterationLimit,
    Aborted,            // Abort flag raised between iterations
    ExecutionFailed,    // A planned action was refused by the live world
    InvalidConfig
};

const char* to_string(RunTermination termination);

struct HeadlessRunResult {
    bool reached_goal = false;
    RunTermination termination = RunTermination::InvalidConfig;
    std::string error_message;

    // Every committed action, in execution order
    std::vector<world::PlannedAction> actions;

    HeightGrid final_grid;
    Vec3 final_agent_position{0.0f};
    bool final_carrying = false;
    int iterations = 0;
};

void to_json(nlohmann::json& j, const HeadlessRunResult& result);

// Replay one committed action on the live world. A block placed on the goal
// cell also puts the agent on the new goal top.
bool commit_action(world::WorldState& live, const world::NavOracle& oracle,
                   const world::PlannedAction& action, Cell goal_cell);

// Plan on a snapshot, commit the whole plan, repeat until the goal is
// reached or the run cannot make progress. The live world only changes by
// atomically adopting a fully replayed plan. `abort` is polled once per
// iteration and may be raised from another thread.
HeadlessRunResult run_headless(const StackerConfig& config, const world::NavOracle& oracle,
                               const std::atomic<bool>* abort = nullptr);

} // namespace stacker::planning
