#include <stacker/navigation/navmesh.hpp>

namespace stacker::navigation {

NavMesh::NavMesh(dtNavMesh* mesh, const NavMeshSettings& settings)
    : m_mesh(mesh)
    , m_settings(settings) {
}

int NavMesh::polygon_count() const {
    if (!m_mesh) return 0;

    // Single tile, but walk them all so a tiled mesh still reports correctly
    const dtNavMesh* mesh = m_mesh.get();
    int polys = 0;
    for (int i = 0; i < mesh->getMaxTiles(); ++i) {
        const dtMeshTile* tile = mesh->getTile(i);
        if (tile && tile->header) {
            polys += tile->header->polyCount;
        }
    }
    return polys;
}

} // namespace stacker::navigation
