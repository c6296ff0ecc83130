#include <stacker/planning/stacker_config.hpp>
#include <stacker/core/filesystem.hpp>
#include <stacker/core/log.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>

namespace stacker::planning {

using json = nlohmann::json;

namespace {

json cell_to_json(Cell cell) {
    return {{"x", cell.x}, {"z", cell.z}};
}

Cell cell_from_json(const json& j, Cell fallback = {}) {
    return {j.value("x", fallback.x), j.value("z", fallback.z)};
}

json vec_to_json(const Vec3& v) {
    return json::array({v.x, v.y, v.z});
}

void vec_from_json(const json& j, Vec3& v) {
    if (j.is_array() && j.size() >= 3) {
        v.x = j[0].get<float>();
        v.y = j[1].get<float>();
        v.z = j[2].get<float>();
    }
}

json navmesh_to_json(const navigation::NavMeshSettings& s) {
    return {
        {"cell_size", s.cell_size},
        {"cell_height", s.cell_height},
        {"agent_height", s.agent_height},
        {"agent_radius", s.agent_radius},
        {"agent_max_climb", s.agent_max_climb},
        {"agent_max_slope", s.agent_max_slope},
        {"min_region_area", s.min_region_area},
        {"merge_region_area", s.merge_region_area},
        {"max_edge_length", s.max_edge_length},
        {"max_edge_error", s.max_edge_error},
        {"detail_sample_distance", s.detail_sample_distance},
        {"detail_sample_max_error", s.detail_sample_max_error},
        {"max_verts_per_poly", s.max_verts_per_poly}
    };
}

void navmesh_from_json(const json& j, navigation::NavMeshSettings& s) {
    s.cell_size = j.value("cell_size", s.cell_size);
    s.cell_height = j.value("cell_height", s.cell_height);
    s.agent_height = j.value("agent_height", s.agent_height);
    s.agent_radius = j.value("agent_radius", s.agent_radius);
    s.agent_max_climb = j.value("agent_max_climb", s.agent_max_climb);
    s.agent_max_slope = j.value("agent_max_slope", s.agent_max_slope);
    s.min_region_area = j.value("min_region_area", s.min_region_area);
    s.merge_region_area = j.value("merge_region_area", s.merge_region_area);
    s.max_edge_length = j.value("max_edge_length", s.max_edge_length);
    s.max_edge_error = j.value("max_edge_error", s.max_edge_error);
    s.detail_sample_distance = j.value("detail_sample_distance", s.detail_sample_distance);
    s.detail_sample_max_error = j.value("detail_sample_max_error", s.detail_sample_max_error);
    s.max_verts_per_poly = j.value("max_verts_per_poly", s.max_verts_per_poly);
}

} // namespace

int iteration_budget_for(size_t step_count) {
    return std::max(GLOBAL_PLAN_ITERATIONS_BASE,
                    GLOBAL_PLAN_ITERATIONS_BASE + static_cast<int>(step_count) * GLOBAL_PLAN_ITERATIONS_PER_STEP);
}

int StackerConfig::effective_max_iterations() const {
    return max_iterations.value_or(iteration_budget_for(steps.size()));
}

HeightGrid StackerConfig::create_initial_grid() const {
    HeightGrid grid(grid_width, grid_depth);

    auto seed = [&grid](Cell cell, int height) {
        if (!grid.set_height(cell, height)) {
            core::log(core::LogLevel::Warn, "[BlockStacker] ignoring height {} at {}",
                      height, world::to_string(cell));
        }
    };

    seed(goal_cell, goal_height);
    for (const auto& supply : supplies) {
        seed(supply.cell, supply.height);
    }
    for (const auto& entry : initial_heights) {
        seed(entry.cell, entry.height);
    }
    return grid;
}

bool StackerConfig::validate(std::vector<std::string>& errors) const {
    const size_t initial_errors = errors.size();

    if (grid_width <= 0 || grid_depth <= 0) {
        errors.push_back(std::format("grid must be at least 1x1 (got {}x{})", grid_width, grid_depth));
    }

    HeightGrid bounds(grid_width, grid_depth);
    auto check_cell = [&](Cell cell, const std::string& what) {
        if (!bounds.in_bounds(cell)) {
            errors.push_back(std::format("{} {} is outside the {}x{} grid",
                                         what, world::to_string(cell), grid_width, grid_depth));
        }
    };
    auto check_height = [&](int height, const std::string& what) {
        if (height < 0) {
            errors.push_back(std::format("{} has negative height {}", what, height));
        }
    };

    check_cell(start_cell, "start cell");
    check_cell(goal_cell, "goal cell");
    check_height(goal_height, "goal");

    for (const auto& step : steps) {
        check_cell(step.cell, std::format("step '{}'", step.label));
        check_height(step.target_height, std::format("step '{}'", step.label));
    }
    for (const auto& supply : supplies) {
        check_cell(supply.cell, "supply");
        check_height(supply.height, std::format("supply {}", world::to_string(supply.cell)));
    }
    for (const auto& entry : initial_heights) {
        check_cell(entry.cell, "initial height");
        check_height(entry.height, std::format("initial height {}", world::to_string(entry.cell)));
    }

    if (max_iterations && *max_iterations <= 0) {
        errors.push_back(std::format("max_iterations must be positive (got {})", *max_iterations));
    }
    if (half_extents.x <= 0.0f || half_extents.y <= 0.0f || half_extents.z <= 0.0f) {
        errors.push_back("half_extents must be positive");
    }
    if (navmesh.cell_size <= 0.0f || navmesh.cell_height <= 0.0f) {
        errors.push_back("navmesh cell size and height must be positive");
    }

    return errors.size() == initial_errors;
}

bool StackerConfig::parse(const std::string& text) {
    try {
        json j = json::parse(text);
        StackerConfig parsed = *this;
        from_json(j, parsed);
        *this = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Error, "[BlockStacker] config parse error: {}", e.what());
        return false;
    }
}

std::string StackerConfig::dump(int indent) const {
    json j = *this;
    return j.dump(indent);
}

bool StackerConfig::load(const std::string& path) {
    if (!FileSystem::exists(path)) {
        core::log(core::LogLevel::Error, "[BlockStacker] config not found: {}", path);
        return false;
    }

    std::string content = FileSystem::read_text(path);
    if (content.empty()) {
        core::log(core::LogLevel::Error, "[BlockStacker] config is empty: {}", path);
        return false;
    }

    return parse(content);
}

bool StackerConfig::save(const std::string& path) const {
    if (!FileSystem::write_text(path, dump())) {
        core::log(core::LogLevel::Error, "[BlockStacker] failed to write config: {}", path);
        return false;
    }
    return true;
}

void to_json(json& j, const StackerConfig& config) {
    j["grid"] = {{"width", config.grid_width}, {"depth", config.grid_depth}};
    j["start_cell"] = cell_to_json(config.start_cell);
    j["goal_cell"] = cell_to_json(config.goal_cell);
    j["goal_height"] = config.goal_height;

    j["steps"] = json::array();
    for (const auto& step : config.steps) {
        j["steps"].push_back({
            {"cell", cell_to_json(step.cell)},
            {"target_height", step.target_height},
            {"label", step.label}
        });
    }

    j["supplies"] = json::array();
    for (const auto& supply : config.supplies) {
        j["supplies"].push_back({{"cell", cell_to_json(supply.cell)}, {"height", supply.height}});
    }

    j["initial_heights"] = json::array();
    for (const auto& entry : config.initial_heights) {
        j["initial_heights"].push_back({{"cell", cell_to_json(entry.cell)}, {"height", entry.height}});
    }

    j["start_carrying"] = config.start_carrying;
    j["half_extents"] = vec_to_json(config.half_extents);
    if (config.max_iterations) {
        j["max_iterations"] = *config.max_iterations;
    }
    j["lookahead"] = config.lookahead;
    j["rollback_on_failure"] = config.rollback_on_failure;
    j["navmesh"] = navmesh_to_json(config.navmesh);
}

void from_json(const json& j, StackerConfig& config) {
    if (j.contains("grid")) {
        auto& g = j["grid"];
        config.grid_width = g.value("width", config.grid_width);
        config.grid_depth = g.value("depth", config.grid_depth);
    }

    if (j.contains("start_cell")) config.start_cell = cell_from_json(j["start_cell"], config.start_cell);
    if (j.contains("goal_cell")) config.goal_cell = cell_from_json(j["goal_cell"], config.goal_cell);
    config.goal_height = j.value("goal_height", config.goal_height);

    if (j.contains("steps")) {
        config.steps.clear();
        for (const auto& s : j["steps"]) {
            StepDefinition step;
            step.cell = cell_from_json(s.at("cell"));
            step.target_height = s.value("target_height", 0);
            step.label = s.value("label", std::format("Step {}", config.steps.size() + 1));
            config.steps.push_back(std::move(step));
        }
    }

    if (j.contains("supplies")) {
        config.supplies.clear();
        for (const auto& s : j["supplies"]) {
            config.supplies.push_back({cell_from_json(s.at("cell")), s.value("height", 0)});
        }
    }

    if (j.contains("initial_heights")) {
        config.initial_heights.clear();
        for (const auto& e : j["initial_heights"]) {
            config.initial_heights.push_back({cell_from_json(e.at("cell")), e.value("height", 0)});
        }
    }

    config.start_carrying = j.value("start_carrying", config.start_carrying);
    if (j.contains("half_extents")) vec_from_json(j["half_extents"], config.half_extents);

    if (j.contains("max_iterations")) {
        if (j["max_iterations"].is_null()) {
            config.max_iterations.reset();
        } else {
            config.max_iterations = j["max_iterations"].get<int>();
        }
    }
    config.lookahead = j.value("lookahead", config.lookahead);
    config.rollback_on_failure = j.value("rollback_on_failure", config.rollback_on_failure);

    if (j.contains("navmesh")) navmesh_from_json(j["navmesh"], config.navmesh);
}

// ============================================================================
// Scenario Catalog
// ============================================================================

namespace {

std::vector<Scenario> make_scenarios() {
    std::vector<Scenario> scenarios;

    scenarios.push_back({"default", "Default (Full Staircase)",
                         "Build a 4-step staircase to reach the goal tower", StackerConfig{}});

    {
        Scenario s{"atGoal", "Already at Goal", "Agent starts at goal position", {}};
        s.config.start_cell = {3, 3};
        s.config.goal_cell = {3, 3};
        s.config.goal_height = 1;
        s.config.steps.clear();
        s.config.supplies.clear();
        scenarios.push_back(std::move(s));
    }

    {
        Scenario s{"simpleNavigate", "Simple Navigation",
                   "Navigate to goal when goal height is 1 (no pick/place needed)", {}};
        s.config.start_cell = {1, 1};
        s.config.goal_cell = {3, 3};
        s.config.goal_height = 1;
        s.config.steps.clear();
        s.config.supplies.clear();
        scenarios.push_back(std::move(s));
    }

    {
        Scenario s{"walkStep", "Walk Existing Step", "Walk an existing single step to the goal", {}};
        s.config.start_cell = {3, 1};
        s.config.goal_cell = {3, 2};
        s.config.goal_height = 1;
        s.config.steps.clear();
        s.config.supplies.clear();
        s.config.initial_heights = {{{3, 2}, 1}};
        s.config.max_iterations = 10;
        scenarios.push_back(std::move(s));
    }

    {
        Scenario s{"pickPlaceOne", "Pick and Place One Block",
                   "Goal height is 2, requires one block to be placed", {}};
        s.config.start_cell = {0, 0};
        s.config.goal_cell = {2, 2};
        s.config.goal_height = 2;
        s.config.steps = {{{2, 1}, 1, "Step to goal"}};
        s.config.supplies = {{{0, 1}, 1}};
        s.config.max_iterations = 20;
        scenarios.push_back(std::move(s));
    }

    {
        Scenario s{"walkExistingStairs", "Walk Existing Two-Step Staircase",
                   "Walk an existing two-step staircase to the goal", {}};
        s.config.start_cell = {3, 1};
        s.config.goal_cell = {3, 3};
        s.config.goal_height = 0;
        s.config.steps = {{{3, 2}, 1, "Step 1"}, {{3, 3}, 2, "Goal column"}};
        s.config.supplies.clear();
        s.config.initial_heights = {{{3, 2}, 1}, {{3, 3}, 2}};
        s.config.max_iterations = 20;
        scenarios.push_back(std::move(s));
    }

    {
        Scenario s{"buildTwoSteps", "Build Two-Step Staircase",
                   "Build a two-step staircase and reach goal", {}};
        s.config.start_cell = {3, 1};
        s.config.goal_cell = {3, 3};
        s.config.goal_height = 0;
        s.config.steps = {{{3, 2}, 1, "Step 1"}, {{3, 3}, 2, "Goal column"}};
        s.config.supplies = {{{1, 1}, 2}, {{5, 2}, 2}};
        s.config.max_iterations = 200;
        scenarios.push_back(std::move(s));
    }

    {
        Scenario s{"directPlaceAdjacent", "Direct Place on Adjacent",
                   "Place block directly on adjacent cell when at same height", {}};
        s.config.start_cell = {2, 2};
        s.config.goal_cell = {3, 3};
        s.config.goal_height = 2;
        s.config.steps = {{{3, 2}, 1, "Step to goal"}};
        s.config.supplies = {{{2, 2}, 2}};
        s.config.initial_heights = {{{2, 2}, 1}};
        s.config.max_iterations = 50;
        scenarios.push_back(std::move(s));
    }

    return scenarios;
}

} // namespace

const std::vector<Scenario>& get_scenarios() {
    static const std::vector<Scenario> scenarios = make_scenarios();
    return scenarios;
}

const Scenario* find_scenario(const std::string& id) {
    for (const auto& scenario : get_scenarios()) {
        if (scenario.id == id) return &scenario;
    }
    return nullptr;
}

} // namespace stacker::planning
