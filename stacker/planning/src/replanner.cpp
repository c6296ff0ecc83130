#include <stacker/planning/replanner.hpp>
#include <stacker/planning/block_domain.hpp>
#include <stacker/core/log.hpp>
#include <nlohmann/json.hpp>

#include <format>
#include <variant>

namespace stacker::planning {

using json = nlohmann::json;

const char* to_string(RunTermination termination) {
    switch (termination) {
        case RunTermination::GoalReached:     return "goal_reached";
        case RunTermination::PlannerStuck:    return "planner_stuck";
        case RunTermination::IterationLimit:  return "iteration_limit";
        case RunTermination::Aborted:         return "aborted";
        case RunTermination::ExecutionFailed: return "execution_failed";
        case RunTermination::InvalidConfig:   return "invalid_config";
        default: return "unknown";
    }
}

void to_json(json& j, const HeadlessRunResult& result) {
    j = json{
        {"reached_goal", result.reached_goal},
        {"termination", to_string(result.termination)},
        {"iterations", result.iterations},
        {"final_carrying", result.final_carrying},
        {"final_agent_position", json::array({result.final_agent_position.x,
                                              result.final_agent_position.y,
                                              result.final_agent_position.z})}
    };
    if (!result.error_message.empty()) {
        j["error"] = result.error_message;
    }

    j["actions"] = result.actions;

    json rows = json::array();
    for (int x = 0; x < result.final_grid.width(); ++x) {
        json row = json::array();
        for (int z = 0; z < result.final_grid.depth(); ++z) {
            row.push_back(result.final_grid.height({x, z}));
        }
        rows.push_back(std::move(row));
    }
    j["final_grid"] = std::move(rows);
}

bool commit_action(WorldState& live, const world::NavOracle& oracle,
                   const world::PlannedAction& action, Cell goal_cell) {
    if (!world::apply_action(live, oracle, action)) {
        return false;
    }

    if (action.type == world::ActionType::Place) {
        const auto& block = std::get<world::BlockData>(action.data);
        if (block.cell == goal_cell) {
            live.agent_position = live.grid.cell_top(goal_cell);
            core::log(core::LogLevel::Debug, "[Replanner] goal raised to {}, agent moved to {}",
                      live.grid.height(goal_cell), core::to_string(live.agent_position));
        }
    }
    return true;
}

namespace {

void finish(HeadlessRunResult& result, const WorldState& live, RunTermination termination,
            std::string error = {}) {
    result.termination = termination;
    result.reached_goal = termination == RunTermination::GoalReached;
    result.error_message = std::move(error);
    result.final_grid = live.grid;
    result.final_agent_position = live.agent_position;
    result.final_carrying = live.carrying;
}

} // namespace

HeadlessRunResult run_headless(const StackerConfig& config, const world::NavOracle& oracle,
                               const std::atomic<bool>* abort) {
    HeadlessRunResult result;

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::string message;
        for (const auto& error : errors) {
            if (!message.empty()) message += "; ";
            message += error;
        }
        core::log(core::LogLevel::Error, "[Replanner] invalid config: {}", message);
        result.termination = RunTermination::InvalidConfig;
        result.error_message = std::move(message);
        return result;
    }

    HeightGrid grid = config.create_initial_grid();
    const Vec3 start = grid.cell_top(config.start_cell);
    WorldState live = world::make_world_state(std::move(grid), start, config.start_carrying, oracle);

    const auto domain = build_block_domain(config.lookahead, config.rollback_on_failure);
    const int max_iterations = config.effective_max_iterations();

    core::log(core::LogLevel::Info, "[Replanner] start {} -> goal {} (height {}), {} steps, oracle '{}'",
              world::to_string(config.start_cell), world::to_string(config.goal_cell),
              config.goal_height, config.steps.size(), oracle.name());

    while (result.iterations < max_iterations) {
        if (abort && abort->load()) {
            core::log(core::LogLevel::Warn, "[Replanner] aborted after {} iterations", result.iterations);
            finish(result, live, RunTermination::Aborted);
            return result;
        }

        ++result.iterations;

        if (!find_frontier(live.grid, config.steps) &&
            has_agent_reached_goal(live.grid, live.agent_position, config.goal_cell)) {
            core::log(core::LogLevel::Info, "[Replanner] goal reached in {} iterations, {} actions",
                      result.iterations, result.actions.size());
            finish(result, live, RunTermination::GoalReached);
            return result;
        }

        BlockWorldContext ctx = make_block_context(live, config, oracle);
        DecomposeResult plan = domain.find_plan(ctx);

        if (plan.status == TaskStatus::Failure || ctx.action_queue.empty()) {
            core::log(core::LogLevel::Warn, "[Replanner] planner stuck at iteration {} ({} queued actions)",
                      result.iterations, ctx.action_queue.size());
            finish(result, live, RunTermination::PlannerStuck,
                   std::format("no plan found at iteration {}", result.iterations));
            return result;
        }

        // Replay into a copy; the live world only moves once every action succeeds
        WorldState next = live;
        for (size_t i = 0; i < ctx.action_queue.size(); ++i) {
            const auto& action = ctx.action_queue[i];
            if (!commit_action(next, oracle, action, config.goal_cell)) {
                core::log(core::LogLevel::Error, "[Replanner] action {} '{}' failed on the live world",
                          i, action.description);
                finish(result, live, RunTermination::ExecutionFailed,
                       std::format("action '{}' could not be executed", action.description));
                return result;
            }
        }

        core::log(core::LogLevel::Debug, "[Replanner] iteration {}: committed {} actions ({})",
                  result.iterations, ctx.action_queue.size(), plan.plan.size());
        live = std::move(next);
        for (auto& action : ctx.action_queue) {
            result.actions.push_back(std::move(action));
        }
    }

    core::log(core::LogLevel::Warn, "[Replanner] iteration limit {} reached", max_iterations);
    finish(result, live, RunTermination::IterationLimit,
           std::format("iteration limit {} reached", max_iterations));
    return result;
}

} // namespace stacker::planning
