#include <catch2/catch_test_macros.hpp>
#include <stacker/planning/replanner.hpp>
#include <stacker/planning/block_domain.hpp>
#include <stacker/world/grid_oracle.hpp>
#include <stacker/world/recast_oracle.hpp>
#include <stacker/world/world_state.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <variant>

using namespace stacker::planning;
using stacker::world::ActionType;
using stacker::world::BlockData;
using stacker::world::GridNavOracle;
using stacker::world::NavSurface;
using stacker::world::PathQuery;
using stacker::world::RecastNavOracle;

namespace {

GridNavOracle grid_oracle_for(const StackerConfig& config) {
    return GridNavOracle::from_max_climb(config.navmesh.agent_max_climb);
}

HeadlessRunResult run_config(const StackerConfig& config) {
    GridNavOracle oracle = grid_oracle_for(config);
    return run_headless(config, oracle);
}

HeadlessRunResult run_scenario(const std::string& id) {
    const Scenario* scenario = find_scenario(id);
    REQUIRE(scenario != nullptr);
    return run_config(scenario->config);
}

size_t count_actions(const HeadlessRunResult& result, ActionType type) {
    return static_cast<size_t>(std::count_if(result.actions.begin(), result.actions.end(),
        [type](const PlannedAction& action) { return action.type == type; }));
}

void require_steps_built(const StackerConfig& config, const HeadlessRunResult& result) {
    for (const auto& step : config.steps) {
        INFO(step.label);
        REQUIRE(result.final_grid.height(step.cell) >= step.target_height);
    }
}

// Surfaces that only connect points at most one cell apart
class ShortHopSurface : public NavSurface {
public:
    PathQuery find_path(const Vec3& start, const Vec3& goal, const Vec3&) const override {
        PathQuery query;
        if (horizontal_distance(start, goal) <= 1.01f) {
            query.success = true;
            query.waypoints = {start, goal};
        }
        return query;
    }
};

class ShortHopOracle : public NavOracle {
public:
    std::shared_ptr<const NavSurface> build_surface(const HeightGrid&) const override {
        return std::make_shared<ShortHopSurface>();
    }

    const char* name() const override { return "short-hop"; }
};

} // namespace

TEST_CASE("Default scenario builds the staircase and reaches the goal", "[planning][replanner]") {
    StackerConfig config;
    const int initial_blocks = config.create_initial_grid().total_blocks();

    HeadlessRunResult result = run_config(config);

    REQUIRE(result.reached_goal);
    REQUIRE(result.termination == RunTermination::GoalReached);
    REQUIRE(result.iterations <= config.effective_max_iterations());
    require_steps_built(config, result);

    REQUIRE(count_actions(result, ActionType::Pick) == 10);
    REQUIRE(count_actions(result, ActionType::Place) == 10);
    REQUIRE_FALSE(result.final_carrying);
    REQUIRE(result.final_grid.total_blocks() == initial_blocks);
    REQUIRE(has_agent_reached_goal(result.final_grid, result.final_agent_position, config.goal_cell));
    REQUIRE(result.actions.back().type == ActionType::Navigate);
}

TEST_CASE("Committed actions conserve blocks one at a time", "[planning][replanner]") {
    StackerConfig config;
    GridNavOracle oracle = grid_oracle_for(config);
    HeadlessRunResult result = run_headless(config, oracle);
    REQUIRE(result.reached_goal);

    HeightGrid grid = config.create_initial_grid();
    auto state = stacker::world::make_world_state(grid, grid.cell_top(config.start_cell), false, oracle);
    const int total = state.total_blocks();

    for (const auto& action : result.actions) {
        HeightGrid before = state.grid;
        REQUIRE(commit_action(state, oracle, action, config.goal_cell));
        REQUIRE(state.total_blocks() == total);

        if (action.type == ActionType::Navigate) {
            REQUIRE(state.grid == before);
            continue;
        }

        const auto* block = std::get_if<BlockData>(&action.data);
        REQUIRE(block != nullptr);
        const int delta = action.type == ActionType::Pick ? -1 : 1;
        REQUIRE(state.grid.height(block->cell) == before.height(block->cell) + delta);
        REQUIRE(state.carrying == (action.type == ActionType::Pick));
        REQUIRE(state.grid.total_blocks() == before.total_blocks() + delta);

        // Both report the top face of the moved block
        const Vec3 moved_top = action.type == ActionType::Pick
            ? before.cell_top(block->cell)
            : state.grid.cell_top(block->cell);
        INFO(action.description);
        REQUIRE(block->world_position == moved_top);
    }

    REQUIRE(state.grid == result.final_grid);
    REQUIRE(state.agent_position == result.final_agent_position);
}

TEST_CASE("Block actions report the top face of the moved block", "[planning][replanner]") {
    HeadlessRunResult result = run_scenario("pickPlaceOne");
    REQUIRE(result.reached_goal);

    auto pick = std::find_if(result.actions.begin(), result.actions.end(),
        [](const PlannedAction& action) { return action.type == ActionType::Pick; });
    auto place = std::find_if(result.actions.begin(), result.actions.end(),
        [](const PlannedAction& action) { return action.type == ActionType::Place; });
    REQUIRE(pick != result.actions.end());
    REQUIRE(place != result.actions.end());

    // Supply (0, 1) goes from 1 to 0, step (2, 1) from 0 to 1
    const auto& taken = std::get<BlockData>(pick->data);
    REQUIRE(taken.cell == Cell{0, 1});
    REQUIRE(taken.world_position == Vec3{0.5f, 1.0f, 1.5f});

    const auto& placed = std::get<BlockData>(place->data);
    REQUIRE(placed.cell == Cell{2, 1});
    REQUIRE(placed.world_position == Vec3{2.5f, 1.0f, 1.5f});
}

TEST_CASE("Raising the goal column lifts the agent onto it", "[planning][replanner]") {
    StackerConfig config;
    config.start_cell = {0, 0};
    config.goal_cell = {2, 2};
    config.goal_height = 1;
    config.steps = {{{2, 2}, 2, "Raise goal"}};
    config.supplies = {{{0, 1}, 1}};

    SECTION("Replay of a single place") {
        GridNavOracle oracle = grid_oracle_for(config);
        HeightGrid grid = config.create_initial_grid();
        auto state = stacker::world::make_world_state(grid, grid.cell_top({0, 0}), true, oracle);

        REQUIRE(commit_action(state, oracle,
                              stacker::world::make_place({1, 0}, Vec3{1.5f, 1.0f, 0.5f}, "elsewhere"),
                              config.goal_cell));
        REQUIRE(state.agent_position == grid.cell_top({0, 0}));

        REQUIRE(apply_pick(state, oracle, {1, 0}));
        REQUIRE(commit_action(state, oracle,
                              stacker::world::make_place({2, 2}, Vec3{2.5f, 2.0f, 2.5f}, "goal"),
                              config.goal_cell));
        REQUIRE(state.agent_position == Vec3{2.5f, 2.0f, 2.5f});
    }

    SECTION("Full run") {
        // The goal column cannot be climbed after the place, so only the lift finishes the run
        HeadlessRunResult result = run_config(config);
        REQUIRE(result.reached_goal);
        REQUIRE(result.iterations == 2);
        REQUIRE(result.final_grid.height({2, 2}) == 2);
        REQUIRE(result.final_agent_position == Vec3{2.5f, 2.0f, 2.5f});
        REQUIRE(result.actions.back().type == ActionType::Place);
    }
}

TEST_CASE("Agent already at the goal needs no actions", "[planning][replanner]") {
    HeadlessRunResult result = run_scenario("atGoal");
    REQUIRE(result.reached_goal);
    REQUIRE(result.iterations == 1);
    REQUIRE(result.actions.empty());
}

TEST_CASE("Low goal is a single navigation", "[planning][replanner]") {
    HeadlessRunResult result = run_scenario("simpleNavigate");
    REQUIRE(result.reached_goal);
    REQUIRE(result.actions.size() == 1);
    REQUIRE(result.actions[0].type == ActionType::Navigate);
    REQUIRE(result.actions[0].description == "Climb to the tower top");
    REQUIRE(result.iterations == 2);

    HeadlessRunResult walk = run_scenario("walkStep");
    REQUIRE(walk.reached_goal);
    REQUIRE(walk.actions.size() == 1);
}

TEST_CASE("Existing staircase is walked without building", "[planning][replanner]") {
    HeadlessRunResult result = run_scenario("walkExistingStairs");
    REQUIRE(result.reached_goal);
    REQUIRE(count_actions(result, ActionType::Pick) == 0);
    REQUIRE(count_actions(result, ActionType::Place) == 0);
    REQUIRE(result.final_grid.height({3, 3}) == 2);
}

TEST_CASE("Small build scenarios", "[planning][replanner]") {
    SECTION("One block") {
        HeadlessRunResult result = run_scenario("pickPlaceOne");
        REQUIRE(result.reached_goal);
        REQUIRE(count_actions(result, ActionType::Pick) == 1);
        REQUIRE(count_actions(result, ActionType::Place) == 1);
        REQUIRE(result.final_grid.height({2, 1}) == 1);
        REQUIRE(result.final_grid.height({0, 1}) == 0);
    }

    SECTION("Two steps") {
        const Scenario* scenario = find_scenario("buildTwoSteps");
        HeadlessRunResult result = run_scenario("buildTwoSteps");
        REQUIRE(result.reached_goal);
        require_steps_built(scenario->config, result);
        REQUIRE(result.final_grid.height({3, 3}) == 2);
    }

    SECTION("Standing on the supply") {
        HeadlessRunResult result = run_scenario("directPlaceAdjacent");
        REQUIRE(result.reached_goal);
        REQUIRE(result.iterations == 3);
        REQUIRE(result.final_grid.height({3, 2}) == 1);
    }
}

TEST_CASE("Carrying next to the frontier places without an anchor trip", "[planning][replanner]") {
    StackerConfig config;
    config.start_cell = {2, 2};
    config.goal_cell = {3, 3};
    config.goal_height = 2;
    config.steps = {{{3, 2}, 1, "Step 1"}};
    config.supplies.clear();
    config.start_carrying = true;

    HeadlessRunResult result = run_config(config);

    REQUIRE(result.reached_goal);
    REQUIRE_FALSE(result.actions.empty());
    REQUIRE(result.actions[0].type == ActionType::Place);
    REQUIRE(result.actions[0].description == "Place block on top of Step 1");
    for (const auto& action : result.actions) {
        REQUIRE(action.description.find("staging") == std::string::npos);
    }
    REQUIRE(result.final_grid.height({3, 2}) == 1);
    REQUIRE_FALSE(result.final_carrying);
}

TEST_CASE("Depleted supplies stop the run", "[planning][replanner]") {
    StackerConfig config;
    config.goal_cell = {3, 4};
    config.goal_height = 3;
    config.steps = {{{3, 2}, 1, "Step 1"}, {{3, 3}, 2, "Step 2"}};
    config.supplies = {{{1, 1}, 1}};

    SECTION("With rollback") {
        HeadlessRunResult result = run_config(config);
        REQUIRE_FALSE(result.reached_goal);
        REQUIRE(result.termination == RunTermination::PlannerStuck);
        REQUIRE(result.iterations == 2);
        REQUIRE(result.final_grid.height({3, 2}) == 1);
        REQUIRE(result.final_grid.height({1, 1}) == 0);
        REQUIRE_FALSE(result.error_message.empty());
    }

    SECTION("Without rollback") {
        config.rollback_on_failure = false;
        HeadlessRunResult result = run_config(config);
        REQUIRE_FALSE(result.reached_goal);
        REQUIRE(result.termination == RunTermination::PlannerStuck);
        REQUIRE(result.iterations <= config.effective_max_iterations());
    }
}

TEST_CASE("Iteration limit ends the run", "[planning][replanner]") {
    StackerConfig config;
    config.max_iterations = 3;

    HeadlessRunResult result = run_config(config);
    REQUIRE_FALSE(result.reached_goal);
    REQUIRE(result.termination == RunTermination::IterationLimit);
    REQUIRE(result.iterations == 3);
    REQUIRE(count_actions(result, ActionType::Place) == 3);
}

TEST_CASE("Abort flag is honoured before planning", "[planning][replanner]") {
    StackerConfig config;
    GridNavOracle oracle = grid_oracle_for(config);
    std::atomic<bool> abort{true};

    HeadlessRunResult result = run_headless(config, oracle, &abort);
    REQUIRE(result.termination == RunTermination::Aborted);
    REQUIRE(result.iterations == 0);
    REQUIRE(result.actions.empty());
    REQUIRE(result.final_grid == config.create_initial_grid());
}

TEST_CASE("Invalid config never plans", "[planning][replanner]") {
    StackerConfig config;
    config.start_cell = {20, 20};

    HeadlessRunResult result = run_config(config);
    REQUIRE(result.termination == RunTermination::InvalidConfig);
    REQUIRE_FALSE(result.reached_goal);
    REQUIRE(result.iterations == 0);
    REQUIRE(result.error_message.find("start cell") != std::string::npos);
}

TEST_CASE("Lookahead plans the whole staircase in one pass", "[planning][replanner][lookahead]") {
    StackerConfig config;
    config.lookahead = true;

    HeadlessRunResult result = run_config(config);
    REQUIRE(result.reached_goal);
    REQUIRE(result.iterations == 2);
    require_steps_built(config, result);
    REQUIRE(count_actions(result, ActionType::Place) == 10);
}

TEST_CASE("Rollback off still builds the default staircase", "[planning][replanner]") {
    StackerConfig config;
    config.rollback_on_failure = false;

    HeadlessRunResult result = run_config(config);
    REQUIRE(result.reached_goal);
    require_steps_built(config, result);
}

TEST_CASE("Completed steps are climbed one by one when the goal is out of reach", "[planning][replanner]") {
    const Scenario* scenario = find_scenario("walkExistingStairs");
    REQUIRE(scenario != nullptr);

    ShortHopOracle oracle;
    HeadlessRunResult result = run_headless(scenario->config, oracle);

    REQUIRE(result.reached_goal);
    REQUIRE(result.actions.size() == 3);
    REQUIRE(result.actions[0].description == "Walk existing Step 1");
    REQUIRE(result.actions[1].description == "Walk existing Goal column");
    REQUIRE(result.actions[2].description == "Climb to goal top");
}

TEST_CASE("Domain plans a single build cycle on a snapshot", "[planning][domain]") {
    StackerConfig config;
    GridNavOracle oracle = grid_oracle_for(config);
    HeightGrid grid = config.create_initial_grid();
    auto live = stacker::world::make_world_state(grid, grid.cell_top(config.start_cell), false, oracle);

    auto domain = build_block_domain(false);
    BlockWorldContext ctx = make_block_context(live, config, oracle);
    DecomposeResult plan = domain.find_plan(ctx);

    REQUIRE(plan.status == TaskStatus::Success);
    REQUIRE(ctx.action_queue.size() == 4);
    REQUIRE(ctx.action_queue[0].description == "Walk to supply crate at (1, 1)");
    REQUIRE(ctx.action_queue[1].description == "Pick block at (1, 1)");
    REQUIRE(ctx.action_queue[2].description == "Move to position adjacent to Step 1");
    REQUIRE(ctx.action_queue[3].description == "Place block on top of Step 1");

    // The live world is untouched by planning
    REQUIRE(live.grid.height({3, 2}) == 0);
    REQUIRE(live.grid.height({1, 1}) == 3);
    REQUIRE(ctx.world.grid.height({3, 2}) == 1);
    REQUIRE(ctx.world.grid.height({1, 1}) == 2);
}

TEST_CASE("Run result serializes to JSON", "[planning][replanner]") {
    HeadlessRunResult result = run_scenario("simpleNavigate");
    nlohmann::json j = result;

    REQUIRE(j["reached_goal"] == true);
    REQUIRE(j["termination"] == "goal_reached");
    REQUIRE(j["iterations"] == 2);
    REQUIRE(j["actions"].size() == 1);
    REQUIRE(j["actions"][0]["type"] == "navigate");
    REQUIRE(j["final_grid"].size() == 8);
    REQUIRE(j["final_grid"][3][3] == 1);
    REQUIRE_FALSE(j.contains("error"));
}

TEST_CASE("Navmesh oracle carries the planner to the goal", "[planning][replanner][recast]") {
    for (const char* id : {"pickPlaceOne", "default"}) {
        const Scenario* scenario = find_scenario(id);
        REQUIRE(scenario != nullptr);

        INFO(id);
        RecastNavOracle oracle(scenario->config.navmesh);
        HeadlessRunResult result = run_headless(scenario->config, oracle);

        REQUIRE(result.reached_goal);
        REQUIRE(result.termination == RunTermination::GoalReached);
        require_steps_built(scenario->config, result);
        REQUIRE(has_agent_reached_goal(result.final_grid, result.final_agent_position,
                                       scenario->config.goal_cell));
    }
}
