#include <stacker/world/block_geometry.hpp>

namespace stacker::world {

navigation::NavMeshInputGeometry build_block_geometry(const HeightGrid& grid) {
    navigation::NavMeshInputGeometry geometry;

    geometry.add_box(
        Vec3{0.0f, -GROUND_THICKNESS, 0.0f},
        Vec3{grid.width() * BLOCK_SIZE, 0.0f, grid.depth() * BLOCK_SIZE});

    for (int x = 0; x < grid.width(); ++x) {
        for (int z = 0; z < grid.depth(); ++z) {
            const int height = grid.height({x, z});
            for (int h = 0; h < height; ++h) {
                Vec3 min{x * BLOCK_SIZE, h * BLOCK_SIZE, z * BLOCK_SIZE};
                geometry.add_box(min, min + Vec3{BLOCK_SIZE});
            }
        }
    }

    return geometry;
}

} // namespace stacker::world
