#pragma once

#include <stacker/world/grid.hpp>
#include <stacker/world/nav_oracle.hpp>
#include <stacker/world/planned_action.hpp>
#include <memory>

namespace stacker::world {

// Height grid, agent and the walkable surface built from that grid.
// Copying is the snapshot operation: the grid is copied and the immutable
// surface is shared until the copy mutates its own grid.
struct WorldState {
    HeightGrid grid;
    Vec3 agent_position{0.0f};
    bool carrying = false;
    std::shared_ptr<const NavSurface> surface;

    // Blocks in the grid plus the one being carried
    int total_blocks() const { return grid.total_blocks() + (carrying ? 1 : 0); }

    Cell agent_cell() const { return pos_to_cell(agent_position); }

    PathQuery find_path(const Vec3& goal, const Vec3& half_extents) const;
};

WorldState make_world_state(HeightGrid grid, const Vec3& agent_position, bool carrying,
                            const NavOracle& oracle);

// Take the top block of `cell`. Refuses when already carrying or the column
// is empty; the state is untouched on refusal.
bool apply_pick(WorldState& state, const NavOracle& oracle, Cell cell);

// Put the carried block on `cell`. Refuses when not carrying or out of bounds.
bool apply_place(WorldState& state, const NavOracle& oracle, Cell cell);

// Replay one committed action
bool apply_action(WorldState& state, const NavOracle& oracle, const PlannedAction& action);

} // namespace stacker::world
