#pragma once

#include <stacker/world/grid.hpp>
#include <stacker/navigation/navmesh.hpp>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stacker::planning {

using namespace stacker::core;
using world::Cell;
using world::HeightGrid;

// One staircase step: `cell` must reach `target_height`
struct StepDefinition {
    Cell cell;
    int target_height = 0;
    std::string label;
};

// Column holding stackable blocks; remaining stock is the grid height
struct SupplySource {
    Cell cell;
    int height = 0;
};

// Pre-seeded column height
struct CellHeight {
    Cell cell;
    int height = 0;
};

constexpr int GLOBAL_PLAN_ITERATIONS_BASE = 16;
constexpr int GLOBAL_PLAN_ITERATIONS_PER_STEP = 8;

// max(16, 16 + 8 * steps)
int iteration_budget_for(size_t step_count);

struct StackerConfig {
    // World
    int grid_width = 8;
    int grid_depth = 8;
    Cell start_cell{3, 1};
    Cell goal_cell{3, 6};
    int goal_height = 5;
    std::vector<StepDefinition> steps{
        {{3, 2}, 1, "Step 1"},
        {{3, 3}, 2, "Step 2"},
        {{3, 4}, 3, "Step 3"},
        {{3, 5}, 4, "Step 4"},
    };
    std::vector<SupplySource> supplies{
        {{1, 1}, 3},
        {{5, 2}, 2},
        {{6, 4}, 2},
        {{2, 6}, 2},
        {{4, 4}, 3},
    };
    std::vector<CellHeight> initial_heights;

    // Agent
    bool start_carrying = false;
    Vec3 half_extents{0.3f, 0.6f, 0.3f};

    // Planner
    std::optional<int> max_iterations;  // Unset: iteration_budget_for(steps)
    bool lookahead = false;
    bool rollback_on_failure = true;

    navigation::NavMeshSettings navmesh;

    int effective_max_iterations() const;

    // Zeros, then the goal column, then supplies, then initial heights (later wins)
    HeightGrid create_initial_grid() const;

    // Appends one message per problem; true when none were found
    bool validate(std::vector<std::string>& errors) const;

    // JSON; every key is optional and only overrides its own field
    bool parse(const std::string& text);
    std::string dump(int indent = 2) const;

    bool load(const std::string& path);
    bool save(const std::string& path) const;
};

void to_json(nlohmann::json& j, const StackerConfig& config);
void from_json(const nlohmann::json& j, StackerConfig& config);

// ============================================================================
// Scenario Catalog
// ============================================================================

struct Scenario {
    std::string id;
    std::string name;
    std::string description;
    StackerConfig config;
};

const std::vector<Scenario>& get_scenarios();

// nullptr when no scenario has this id
const Scenario* find_scenario(const std::string& id);

} // namespace stacker::planning
