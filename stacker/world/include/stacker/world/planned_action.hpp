#pragma once

#include <stacker/world/grid.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <vector>

namespace stacker::world {

// ============================================================================
// Action Types
// ============================================================================

enum class ActionType {
    Navigate,   // Walk along a waypoint path
    Pick,       // Take the top block of a supply column
    Place       // Put the carried block on top of a column
};

const char* to_string(ActionType type);

// ============================================================================
// Action Data
// ============================================================================

struct NavigateData {
    std::vector<Vec3> path;     // Waypoints from the oracle
    Vec3 target{0.0f};          // Where the agent stands afterwards
};

struct BlockData {
    Cell cell;
    Vec3 world_position{0.0f};  // Top face of the moved block: before a pick, after a place
};

// One step of a plan. Immutable once emitted.
struct PlannedAction {
    ActionType type = ActionType::Navigate;
    std::string description;
    std::variant<NavigateData, BlockData> data;

    // Final agent position for Navigate; world_position for Pick/Place
    Vec3 destination() const;
};

PlannedAction make_navigate(std::vector<Vec3> path, const Vec3& target, std::string description);
PlannedAction make_pick(Cell cell, const Vec3& world_position, std::string description);
PlannedAction make_place(Cell cell, const Vec3& world_position, std::string description);

void to_json(nlohmann::json& j, const PlannedAction& action);

} // namespace stacker::world
