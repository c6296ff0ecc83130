#include <stacker/world/world_state.hpp>
#include <stacker/core/log.hpp>

namespace stacker::world {

PathQuery WorldState::find_path(const Vec3& goal, const Vec3& half_extents) const {
    if (!surface) return {};
    return surface->find_path(agent_position, goal, half_extents);
}

WorldState make_world_state(HeightGrid grid, const Vec3& agent_position, bool carrying,
                            const NavOracle& oracle) {
    WorldState state;
    state.grid = std::move(grid);
    state.agent_position = agent_position;
    state.carrying = carrying;
    state.surface = oracle.build_surface(state.grid);
    return state;
}

bool apply_pick(WorldState& state, const NavOracle& oracle, Cell cell) {
    if (state.carrying) {
        core::log(core::LogLevel::Warn, "[BlockStacker] pick at {} refused: already carrying", to_string(cell));
        return false;
    }
    if (!state.grid.remove_block(cell)) {
        core::log(core::LogLevel::Warn, "[BlockStacker] pick at {} refused: no block", to_string(cell));
        return false;
    }

    state.carrying = true;
    state.surface = oracle.build_surface(state.grid);
    return true;
}

bool apply_place(WorldState& state, const NavOracle& oracle, Cell cell) {
    if (!state.carrying) {
        core::log(core::LogLevel::Warn, "[BlockStacker] place at {} refused: not carrying", to_string(cell));
        return false;
    }
    if (!state.grid.add_block(cell)) {
        core::log(core::LogLevel::Warn, "[BlockStacker] place at {} refused: out of bounds", to_string(cell));
        return false;
    }

    state.carrying = false;
    state.surface = oracle.build_surface(state.grid);
    return true;
}

bool apply_action(WorldState& state, const NavOracle& oracle, const PlannedAction& action) {
    if (action.type == ActionType::Navigate) {
        state.agent_position = action.destination();
        return true;
    }

    auto* block = std::get_if<BlockData>(&action.data);
    if (!block) {
        core::log(core::LogLevel::Error, "[BlockStacker] {} action without a cell", to_string(action.type));
        return false;
    }

    if (action.type == ActionType::Pick) {
        return apply_pick(state, oracle, block->cell);
    }
    return apply_place(state, oracle, block->cell);
}

} // namespace stacker::world
