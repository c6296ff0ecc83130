#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <stacker/world/world_state.hpp>
#include <stacker/world/grid_oracle.hpp>
#include <nlohmann/json.hpp>

using namespace stacker::world;
using Catch::Matchers::WithinAbs;

namespace {

WorldState make_state(const GridNavOracle& oracle) {
    HeightGrid grid(8, 8);
    REQUIRE(grid.set_height({1, 1}, 2));
    return make_world_state(grid, grid.cell_top({3, 1}), false, oracle);
}

} // namespace

TEST_CASE("WorldState construction builds a surface", "[world][state]") {
    GridNavOracle oracle;
    WorldState state = make_state(oracle);

    REQUIRE(state.surface != nullptr);
    REQUIRE(state.agent_cell() == Cell{3, 1});
    REQUIRE(state.total_blocks() == 2);
    REQUIRE(state.find_path(state.grid.cell_top({0, 1}), DEFAULT_HALF_EXTENTS).success);
}

TEST_CASE("Pick and place conserve blocks", "[world][state]") {
    GridNavOracle oracle;
    WorldState state = make_state(oracle);
    const int total = state.total_blocks();

    REQUIRE(apply_pick(state, oracle, {1, 1}));
    REQUIRE(state.carrying);
    REQUIRE(state.grid.height({1, 1}) == 1);
    REQUIRE(state.total_blocks() == total);

    SECTION("Second pick while carrying is refused") {
        REQUIRE_FALSE(apply_pick(state, oracle, {1, 1}));
        REQUIRE(state.grid.height({1, 1}) == 1);
        REQUIRE(state.total_blocks() == total);
    }

    SECTION("Place clears carrying") {
        REQUIRE(apply_place(state, oracle, {3, 2}));
        REQUIRE_FALSE(state.carrying);
        REQUIRE(state.grid.height({3, 2}) == 1);
        REQUIRE(state.total_blocks() == total);

        REQUIRE_FALSE(apply_place(state, oracle, {3, 2}));
        REQUIRE(state.grid.height({3, 2}) == 1);
    }

    SECTION("Out of bounds place is refused") {
        REQUIRE_FALSE(apply_place(state, oracle, {8, 8}));
        REQUIRE(state.carrying);
    }
}

TEST_CASE("Pick from an empty column is refused", "[world][state]") {
    GridNavOracle oracle;
    WorldState state = make_state(oracle);

    REQUIRE_FALSE(apply_pick(state, oracle, {5, 5}));
    REQUIRE_FALSE(state.carrying);
    REQUIRE(state.total_blocks() == 2);
}

TEST_CASE("Snapshot copies do not disturb the original", "[world][state]") {
    GridNavOracle oracle;
    WorldState live = make_state(oracle);

    WorldState snapshot = live;
    REQUIRE(snapshot.surface == live.surface);

    REQUIRE(apply_pick(snapshot, oracle, {1, 1}));
    REQUIRE(apply_place(snapshot, oracle, {3, 2}));

    REQUIRE(live.grid.height({1, 1}) == 2);
    REQUIRE(live.grid.height({3, 2}) == 0);
    REQUIRE_FALSE(live.carrying);
    REQUIRE(snapshot.surface != live.surface);
}

TEST_CASE("apply_action replays committed actions", "[world][state]") {
    GridNavOracle oracle;
    WorldState state = make_state(oracle);

    Vec3 stand = state.grid.cell_top({1, 2});
    REQUIRE(apply_action(state, oracle, make_navigate({state.agent_position, stand}, stand, "walk")));
    REQUIRE(state.agent_position == stand);

    REQUIRE(apply_action(state, oracle, make_pick({1, 1}, state.grid.cell_top({1, 1}), "pick")));
    REQUIRE(state.carrying);

    REQUIRE(apply_action(state, oracle, make_place({1, 3}, Vec3{1.5f, 1.0f, 3.5f}, "place")));
    REQUIRE_FALSE(state.carrying);
    REQUIRE(state.grid.height({1, 3}) == 1);

    REQUIRE_FALSE(apply_action(state, oracle, make_place({1, 3}, Vec3{1.5f, 2.0f, 3.5f}, "place")));
}

TEST_CASE("PlannedAction serialization", "[world][action]") {
    SECTION("Navigate") {
        auto action = make_navigate({Vec3{0.5f, 0.0f, 0.5f}, Vec3{1.5f, 0.0f, 0.5f}},
                                    Vec3{1.5f, 0.0f, 0.5f}, "Walk to supply crate at (1, 1)");
        REQUIRE(action.type == ActionType::Navigate);
        REQUIRE_THAT(action.destination().x, WithinAbs(1.5f, 0.0001f));

        nlohmann::json j = action;
        REQUIRE(j["type"] == "navigate");
        REQUIRE(j["description"] == "Walk to supply crate at (1, 1)");
        REQUIRE(j["path"].size() == 2);
        REQUIRE(j["target"][0].get<float>() == 1.5f);
    }

    SECTION("Place") {
        auto action = make_place({3, 2}, Vec3{3.5f, 1.0f, 2.5f}, "Stack block for Step 1");
        REQUIRE(action.type == ActionType::Place);
        REQUIRE_THAT(action.destination().y, WithinAbs(1.0f, 0.0001f));

        nlohmann::json j = action;
        REQUIRE(j["type"] == "place");
        REQUIRE(j["cell"]["x"] == 3);
        REQUIRE(j["cell"]["z"] == 2);
        REQUIRE_FALSE(j.contains("path"));
    }
}
