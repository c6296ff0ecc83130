#include <stacker/world/grid.hpp>

#include <cmath>
#include <cstdlib>
#include <format>
#include <numeric>

namespace stacker::world {

bool is_adjacent(Cell a, Cell b) {
    for (const Cell& delta : ADJACENT_OFFSETS) {
        if (offset(a, delta) == b) return true;
    }
    return false;
}

std::string to_string(Cell cell) {
    return std::format("({}, {})", cell.x, cell.z);
}

Cell pos_to_cell(const Vec3& pos) {
    return {
        static_cast<int>(std::floor(pos.x / BLOCK_SIZE)),
        static_cast<int>(std::floor(pos.z / BLOCK_SIZE))
    };
}

int agent_height(const Vec3& pos) {
    return static_cast<int>(std::floor(pos.y / BLOCK_SIZE));
}

HeightGrid::HeightGrid(int width, int depth)
    : m_width(width > 0 ? width : 0)
    , m_depth(depth > 0 ? depth : 0)
    , m_heights(static_cast<size_t>(m_width) * m_depth, 0) {
}

int HeightGrid::height(Cell cell) const {
    if (!in_bounds(cell)) return 0;
    return m_heights[index(cell)];
}

bool HeightGrid::set_height(Cell cell, int height) {
    if (!in_bounds(cell) || height < 0) return false;
    m_heights[index(cell)] = height;
    return true;
}

bool HeightGrid::remove_block(Cell cell) {
    if (!in_bounds(cell)) return false;
    int& h = m_heights[index(cell)];
    if (h <= 0) return false;
    --h;
    return true;
}

bool HeightGrid::add_block(Cell cell) {
    if (!in_bounds(cell)) return false;
    ++m_heights[index(cell)];
    return true;
}

int HeightGrid::total_blocks() const {
    return std::accumulate(m_heights.begin(), m_heights.end(), 0);
}

Vec3 HeightGrid::cell_top(Cell cell) const {
    return {
        cell.x * BLOCK_SIZE + BLOCK_SIZE * 0.5f,
        height(cell) * BLOCK_SIZE,
        cell.z * BLOCK_SIZE + BLOCK_SIZE * 0.5f
    };
}

} // namespace stacker::world
