#include <stacker/planning/selectors.hpp>
#include <stacker/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace stacker::planning {

using world::ADJACENT_OFFSETS;
using world::BLOCK_SIZE;

std::optional<size_t> find_frontier(const HeightGrid& grid, const std::vector<StepDefinition>& steps) {
    for (size_t i = 0; i < steps.size(); ++i) {
        if (grid.height(steps[i].cell) < steps[i].target_height) {
            return i;
        }
    }
    return std::nullopt;
}

Cell anchor_for(const std::vector<StepDefinition>& steps, size_t frontier_index, Cell start_cell) {
    if (frontier_index == 0 || frontier_index > steps.size()) {
        return start_cell;
    }
    return steps[frontier_index - 1].cell;
}

std::optional<PlannedStep> choose_supply(const WorldState& state,
                                         const std::vector<StepDefinition>& steps,
                                         const std::vector<SupplySource>& supplies,
                                         Cell start_cell,
                                         const Vec3& half_extents) {
    auto frontier = find_frontier(state.grid, steps);
    if (!frontier) {
        core::log(core::LogLevel::Debug, "[BlockStacker] choose_supply: no frontier steps remaining");
        return std::nullopt;
    }

    const StepDefinition& step = steps[*frontier];
    core::log(core::LogLevel::Debug, "[BlockStacker] choose_supply: frontier '{}' at {}/{}",
              step.label, state.grid.height(step.cell), step.target_height);

    std::optional<PlannedStep> best;
    float best_length = std::numeric_limits<float>::infinity();

    for (const auto& supply : supplies) {
        if (state.grid.height(supply.cell) <= 0) {
            core::log(core::LogLevel::Debug, "[BlockStacker] choose_supply: skipping empty supply {}",
                      world::to_string(supply.cell));
            continue;
        }

        // Shortest approach to this supply
        std::optional<world::PathQuery> approach;
        Cell approach_stand;
        for (const Cell& delta : ADJACENT_OFFSETS) {
            const Cell stand = world::offset(supply.cell, delta);
            if (!state.grid.in_bounds(stand)) continue;

            auto path = state.find_path(state.grid.cell_top(stand), half_extents);
            if (!path.success) {
                core::log(core::LogLevel::Debug, "[BlockStacker] choose_supply: stand {} unreachable",
                          world::to_string(stand));
                continue;
            }
            if (!approach || path.length() < approach->length()) {
                approach = std::move(path);
                approach_stand = stand;
            }
        }

        if (!approach) {
            core::log(core::LogLevel::Debug, "[BlockStacker] choose_supply: no reachable stand for {}",
                      world::to_string(supply.cell));
            continue;
        }

        const float length = approach->length();
        if (length < best_length) {
            best_length = length;
            PlannedStep planned;
            planned.supply = supply.cell;
            planned.supply_top = state.grid.cell_top(supply.cell);
            planned.stand = approach_stand;
            planned.stand_top = state.grid.cell_top(approach_stand);
            planned.frontier_index = *frontier;
            planned.anchor = anchor_for(steps, *frontier, start_cell);
            planned.path_to_stand = std::move(approach->waypoints);
            best = std::move(planned);
        }
    }

    if (!best) {
        core::log(core::LogLevel::Warn, "[BlockStacker] choose_supply: no reachable supplies for '{}'",
                  step.label);
    } else {
        core::log(core::LogLevel::Debug, "[BlockStacker] choose_supply: supply {} via {} ({:.2f})",
                  world::to_string(best->supply), world::to_string(best->stand), best_length);
    }
    return best;
}

bool can_place_directly_on_adjacent(const HeightGrid& grid, const Vec3& agent_position,
                                    bool carrying, Cell frontier_cell) {
    if (!carrying) return false;
    if (!world::is_adjacent(world::pos_to_cell(agent_position), frontier_cell)) return false;

    const int agent_h = world::agent_height(agent_position);
    const int frontier_h = grid.height(frontier_cell);
    return agent_h >= frontier_h && agent_h <= frontier_h + 1;
}

std::optional<AdjacentMove> find_adjacent_placement_move(const WorldState& state,
                                                         Cell frontier_cell,
                                                         const Vec3& half_extents) {
    const int frontier_h = state.grid.height(frontier_cell);

    for (const Cell& delta : ADJACENT_OFFSETS) {
        const Cell adjacent = world::offset(frontier_cell, delta);
        if (!state.grid.in_bounds(adjacent)) continue;

        const int adjacent_h = state.grid.height(adjacent);
        const int target_h = std::max(adjacent_h, frontier_h);
        if (target_h > adjacent_h + 1) continue;
        if (target_h < frontier_h || target_h > frontier_h + 1) continue;

        Vec3 target = state.grid.cell_top(adjacent);
        target.y = target_h * BLOCK_SIZE;

        auto path = state.find_path(target, half_extents);
        if (!path.success) continue;

        return AdjacentMove{std::move(path.waypoints), target, adjacent, target_h};
    }
    return std::nullopt;
}

bool has_agent_reached_goal(const HeightGrid& grid, const Vec3& agent_position, Cell goal_cell) {
    const Vec3 goal_top = grid.cell_top(goal_cell);
    return horizontal_distance(agent_position, goal_top) <= GOAL_HORIZONTAL_TOLERANCE &&
           std::abs(agent_position.y - goal_top.y) <= GOAL_VERTICAL_TOLERANCE;
}

} // namespace stacker::planning
