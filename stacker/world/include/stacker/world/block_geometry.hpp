#pragma once

#include <stacker/world/grid.hpp>
#include <stacker/navigation/navmesh_builder.hpp>

namespace stacker::world {

// Thickness of the ground slab laid under the whole grid
constexpr float GROUND_THICKNESS = 0.2f;

// Triangle soup for a height grid: a ground slab whose top sits at y = 0,
// plus one unit cube per stacked block. Pure function of the grid.
navigation::NavMeshInputGeometry build_block_geometry(const HeightGrid& grid);

} // namespace stacker::world
