#pragma once

#include <stacker/core/math.hpp>
#include <memory>
#include <DetourNavMesh.h>

namespace stacker::navigation {

using namespace stacker::core;

// Recast tuning for unit blocks. At 0.2 cells a block top is 5x5 cells and
// keeps a 3x3 walkable patch after agent-radius erosion.
struct NavMeshSettings {
    // Rasterization
    float cell_size = 0.2f;
    float cell_height = 0.2f;

    // Agent
    float agent_height = 1.8f;
    float agent_radius = 0.2f;
    float agent_max_climb = 1.6f;    // One block plus margin, never two
    float agent_max_slope = 45.0f;   // Degrees

    // Regions, in cells
    int min_region_area = 8;
    int merge_region_area = 20;

    // Contours
    float max_edge_length = 16.0f;
    float max_edge_error = 1.3f;

    // Detail mesh, in cells
    float detail_sample_distance = 6.0f;
    float detail_sample_max_error = 1.0f;

    int max_verts_per_poly = 6;
};

// Owns one single-tile Detour navmesh. Movable, not copyable.
class NavMesh {
public:
    // Takes ownership of an initialized mesh
    NavMesh(dtNavMesh* mesh, const NavMeshSettings& settings);

    bool is_valid() const { return m_mesh != nullptr; }

    const dtNavMesh* detour() const { return m_mesh.get(); }
    const NavMeshSettings& settings() const { return m_settings; }

    int polygon_count() const;

private:
    struct Release {
        void operator()(dtNavMesh* mesh) const { dtFreeNavMesh(mesh); }
    };

    std::unique_ptr<dtNavMesh, Release> m_mesh;
    NavMeshSettings m_settings;
};

} // namespace stacker::navigation
