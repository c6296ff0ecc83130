#pragma once

#include <stacker/core/math.hpp>
#include <string>
#include <vector>

namespace stacker::world {

using namespace stacker::core;

// Edge length of one block (and one grid cell) in world units
constexpr float BLOCK_SIZE = 1.0f;

// Integer lattice coordinate on the ground plane
struct Cell {
    int x = 0;
    int z = 0;

    bool operator==(const Cell&) const = default;
};

// Orthogonal neighbour offsets, in the order every neighbour scan uses
constexpr Cell ADJACENT_OFFSETS[4] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

inline Cell offset(Cell cell, Cell delta) { return {cell.x + delta.x, cell.z + delta.z}; }

// True when b is one of a's four orthogonal neighbours
bool is_adjacent(Cell a, Cell b);

std::string to_string(Cell cell);

// Column containing a world position
Cell pos_to_cell(const Vec3& pos);

// Standing height of a world position, in whole blocks
int agent_height(const Vec3& pos);

// Width x depth matrix of stacked block counts. Heights never go negative.
class HeightGrid {
public:
    HeightGrid() = default;
    HeightGrid(int width, int depth);

    int width() const { return m_width; }
    int depth() const { return m_depth; }

    bool in_bounds(Cell cell) const {
        return cell.x >= 0 && cell.x < m_width && cell.z >= 0 && cell.z < m_depth;
    }

    // Height of a column; 0 outside the grid
    int height(Cell cell) const;

    // Overwrite a column. Refuses out-of-bounds cells and negative heights.
    bool set_height(Cell cell, int height);

    // Remove the top block of a column. Refuses empty or out-of-bounds columns.
    bool remove_block(Cell cell);

    // Add a block on top of a column. Refuses out-of-bounds cells.
    bool add_block(Cell cell);

    int total_blocks() const;

    // World position of the centre of a column's top face
    Vec3 cell_top(Cell cell) const;

    bool operator==(const HeightGrid&) const = default;

private:
    size_t index(Cell cell) const { return static_cast<size_t>(cell.x) * m_depth + cell.z; }

    int m_width = 0;
    int m_depth = 0;
    std::vector<int> m_heights;  // x-major
};

} // namespace stacker::world
