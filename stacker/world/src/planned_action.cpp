#include <stacker/world/planned_action.hpp>
#include <nlohmann/json.hpp>

namespace stacker::world {

using json = nlohmann::json;

namespace {

json vec_to_json(const Vec3& v) {
    return json::array({v.x, v.y, v.z});
}

} // namespace

const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::Navigate: return "navigate";
        case ActionType::Pick:     return "pick";
        case ActionType::Place:    return "place";
        default: return "unknown";
    }
}

Vec3 PlannedAction::destination() const {
    if (auto* nav = std::get_if<NavigateData>(&data)) {
        return nav->target;
    }
    return std::get<BlockData>(data).world_position;
}

PlannedAction make_navigate(std::vector<Vec3> path, const Vec3& target, std::string description) {
    PlannedAction action;
    action.type = ActionType::Navigate;
    action.description = std::move(description);
    action.data = NavigateData{std::move(path), target};
    return action;
}

PlannedAction make_pick(Cell cell, const Vec3& world_position, std::string description) {
    PlannedAction action;
    action.type = ActionType::Pick;
    action.description = std::move(description);
    action.data = BlockData{cell, world_position};
    return action;
}

PlannedAction make_place(Cell cell, const Vec3& world_position, std::string description) {
    PlannedAction action;
    action.type = ActionType::Place;
    action.description = std::move(description);
    action.data = BlockData{cell, world_position};
    return action;
}

void to_json(json& j, const PlannedAction& action) {
    j = json{
        {"type", to_string(action.type)},
        {"description", action.description}
    };

    if (auto* nav = std::get_if<NavigateData>(&action.data)) {
        json path = json::array();
        for (const auto& p : nav->path) {
            path.push_back(vec_to_json(p));
        }
        j["path"] = std::move(path);
        j["target"] = vec_to_json(nav->target);
    } else if (auto* block = std::get_if<BlockData>(&action.data)) {
        j["cell"] = {{"x", block->cell.x}, {"z", block->cell.z}};
        j["world_position"] = vec_to_json(block->world_position);
    }
}

} // namespace stacker::world
