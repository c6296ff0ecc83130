#pragma once

#include <stacker/planning/stacker_config.hpp>
#include <stacker/world/world_state.hpp>
#include <optional>
#include <vector>

namespace stacker::planning {

using world::WorldState;

constexpr float GOAL_HORIZONTAL_TOLERANCE = world::BLOCK_SIZE * 0.25f;
constexpr float GOAL_VERTICAL_TOLERANCE = world::BLOCK_SIZE * 0.25f;

// Positions closer than this count as "already there"
constexpr float SAME_POSITION_EPSILON = 1e-3f;

// Supply trip chosen for the current frontier; lives for one planning pass
struct PlannedStep {
    Cell supply;
    Vec3 supply_top{0.0f};
    Cell stand;
    Vec3 stand_top{0.0f};
    size_t frontier_index = 0;
    Cell anchor;
    std::vector<Vec3> path_to_stand;
};

// Reachable neighbour of the frontier from which a block can be placed directly
struct AdjacentMove {
    std::vector<Vec3> path;
    Vec3 target{0.0f};
    Cell adjacent_cell;
    int target_height = 0;
};

// Index of the first step (declaration order) still below its target
std::optional<size_t> find_frontier(const HeightGrid& grid, const std::vector<StepDefinition>& steps);

// Staging cell for a step: the previous step's cell, or the start for the first step
Cell anchor_for(const std::vector<StepDefinition>& steps, size_t frontier_index, Cell start_cell);

// Nearest reachable stand next to a supply with stock, by path length.
// Ties keep the earlier supply and the earlier neighbour.
std::optional<PlannedStep> choose_supply(const WorldState& state,
                                         const std::vector<StepDefinition>& steps,
                                         const std::vector<SupplySource>& supplies,
                                         Cell start_cell,
                                         const Vec3& half_extents);

// Carrying, standing orthogonally next to the frontier, and at most one
// block above its top
bool can_place_directly_on_adjacent(const HeightGrid& grid, const Vec3& agent_position,
                                    bool carrying, Cell frontier_cell);

std::optional<AdjacentMove> find_adjacent_placement_move(const WorldState& state,
                                                         Cell frontier_cell,
                                                         const Vec3& half_extents);

bool has_agent_reached_goal(const HeightGrid& grid, const Vec3& agent_position, Cell goal_cell);

} // namespace stacker::planning
