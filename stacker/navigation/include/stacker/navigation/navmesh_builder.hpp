#pragma once

#include <stacker/navigation/navmesh.hpp>
#include <stacker/core/math.hpp>
#include <memory>
#include <string>
#include <vector>

namespace stacker::navigation {

using namespace stacker::core;

// Triangle soup handed to Recast. Flat float/int arrays so the buffers go to
// Recast as they are.
struct NavMeshInputGeometry {
    std::vector<float> vertices;   // x, y, z per vertex
    std::vector<int> indices;      // 3 per triangle

    // Axis-aligned box as 12 triangles, top face wound upward
    void add_box(const Vec3& min, const Vec3& max);

    int vertex_count() const { return static_cast<int>(vertices.size() / 3); }
    int triangle_count() const { return static_cast<int>(indices.size() / 3); }

    // Tight bounds of all vertices, zero box when empty
    AABB bounds() const;
};

struct NavMeshBuildResult {
    std::unique_ptr<NavMesh> navmesh;   // Null on failure
    std::string error_message;

    bool ok() const { return navmesh != nullptr; }
};

// Runs the single-tile Recast pipeline and wraps the output in a Detour navmesh
NavMeshBuildResult build_navmesh(const NavMeshInputGeometry& geometry,
                                 const NavMeshSettings& settings);

} // namespace stacker::navigation
