#include <stacker/world/grid_oracle.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <optional>
#include <queue>
#include <tuple>

namespace stacker::world {

namespace {

class GridNavSurface : public NavSurface {
public:
    GridNavSurface(HeightGrid grid, int max_step)
        : m_grid(std::move(grid))
        , m_max_step(max_step) {
    }

    PathQuery find_path(const Vec3& start, const Vec3& goal,
                        const Vec3& half_extents) const override {
        PathQuery query;

        auto start_cell = snap(start, half_extents);
        auto goal_cell = snap(goal, half_extents);
        if (!start_cell || !goal_cell) {
            return query;
        }

        std::vector<Cell> cells;
        if (!search(*start_cell, *goal_cell, cells)) {
            return query;
        }

        query.success = true;
        query.waypoints.push_back(start);
        for (size_t i = 1; i + 1 < cells.size(); ++i) {
            query.waypoints.push_back(m_grid.cell_top(cells[i]));
        }
        query.waypoints.push_back(goal);
        return query;
    }

private:
    std::optional<Cell> snap(const Vec3& point, const Vec3& half_extents) const {
        Cell cell = pos_to_cell(point);
        if (!m_grid.in_bounds(cell)) return std::nullopt;

        const float top = m_grid.height(cell) * BLOCK_SIZE;
        if (std::abs(point.y - top) > half_extents.y) return std::nullopt;
        return cell;
    }

    int index(Cell cell) const { return cell.x * m_grid.depth() + cell.z; }

    Cell cell_at(int idx) const { return {idx / m_grid.depth(), idx % m_grid.depth()}; }

    // A* with a Manhattan heuristic; equal f-scores expand in insertion order
    bool search(Cell start, Cell goal, std::vector<Cell>& out_cells) const {
        const int count = m_grid.width() * m_grid.depth();
        std::vector<int> g_score(count, -1);
        std::vector<int> came_from(count, -1);
        std::vector<bool> closed(count, false);

        // (f, insertion order, cell index), smallest first
        using Entry = std::tuple<int, int, int>;
        std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;

        auto heuristic = [&](Cell c) {
            return std::abs(c.x - goal.x) + std::abs(c.z - goal.z);
        };

        int counter = 0;
        g_score[index(start)] = 0;
        open.emplace(heuristic(start), counter++, index(start));

        while (!open.empty()) {
            const int current = std::get<2>(open.top());
            open.pop();

            if (closed[current]) continue;
            closed[current] = true;

            const Cell cell = cell_at(current);
            if (cell == goal) {
                out_cells.clear();
                for (int idx = current; idx != -1; idx = came_from[idx]) {
                    out_cells.push_back(cell_at(idx));
                }
                std::reverse(out_cells.begin(), out_cells.end());
                return true;
            }

            const int height = m_grid.height(cell);
            for (const Cell& delta : ADJACENT_OFFSETS) {
                const Cell next = offset(cell, delta);
                if (!m_grid.in_bounds(next)) continue;
                if (std::abs(m_grid.height(next) - height) > m_max_step) continue;

                const int next_idx = index(next);
                if (closed[next_idx]) continue;

                const int tentative = g_score[current] + 1;
                if (g_score[next_idx] != -1 && tentative >= g_score[next_idx]) continue;

                g_score[next_idx] = tentative;
                came_from[next_idx] = current;
                open.emplace(tentative + heuristic(next), counter++, next_idx);
            }
        }

        return false;
    }

    HeightGrid m_grid;
    int m_max_step;
};

} // namespace

GridNavOracle::GridNavOracle(int max_step)
    : m_max_step(max_step < 0 ? 0 : max_step) {
}

GridNavOracle GridNavOracle::from_max_climb(float max_climb) {
    return GridNavOracle(static_cast<int>(std::floor(max_climb / BLOCK_SIZE)));
}

std::shared_ptr<const NavSurface> GridNavOracle::build_surface(const HeightGrid& grid) const {
    return std::make_shared<GridNavSurface>(grid, m_max_step);
}

} // namespace stacker::world
