#include <stacker/navigation/navmesh_builder.hpp>

#include <Recast.h>
#include <DetourNavMesh.h>
#include <DetourNavMeshBuilder.h>

#include <cmath>
#include <cstring>

namespace stacker::navigation {

// ============================================================================
// Input geometry
// ============================================================================

void NavMeshInputGeometry::add_box(const Vec3& min, const Vec3& max) {
    const int base = vertex_count();

    // Corner i takes x from bit 0, y from bit 1, z from bit 2
    for (int i = 0; i < 8; ++i) {
        vertices.push_back((i & 1) ? max.x : min.x);
        vertices.push_back((i & 2) ? max.y : min.y);
        vertices.push_back((i & 4) ? max.z : min.z);
    }

    // Only the top needs an upward normal, Recast marks nothing else walkable
    static constexpr int FACES[36] = {
        2, 6, 7,  2, 7, 3,   // +y
        0, 5, 4,  0, 1, 5,   // -y
        0, 2, 3,  0, 3, 1,   // -z
        4, 5, 7,  4, 7, 6,   // +z
        0, 4, 6,  0, 6, 2,   // -x
        1, 3, 7,  1, 7, 5,   // +x
    };

    for (int corner : FACES) {
        indices.push_back(base + corner);
    }
}

AABB NavMeshInputGeometry::bounds() const {
    if (vertices.empty()) {
        return AABB();
    }

    AABB box(Vec3(vertices[0], vertices[1], vertices[2]),
             Vec3(vertices[0], vertices[1], vertices[2]));
    for (size_t i = 3; i + 2 < vertices.size(); i += 3) {
        box.expand(Vec3(vertices[i], vertices[i + 1], vertices[i + 2]));
    }
    return box;
}

// ============================================================================
// Recast pipeline
// ============================================================================

namespace {

struct RecastRelease {
    void operator()(rcHeightfield* p) const { rcFreeHeightField(p); }
    void operator()(rcCompactHeightfield* p) const { rcFreeCompactHeightfield(p); }
    void operator()(rcContourSet* p) const { rcFreeContourSet(p); }
    void operator()(rcPolyMesh* p) const { rcFreePolyMesh(p); }
    void operator()(rcPolyMeshDetail* p) const { rcFreePolyMeshDetail(p); }
};

template<typename T>
using RecastPtr = std::unique_ptr<T, RecastRelease>;

// Settings converted to voxel units
struct VoxelAgent {
    int height;
    int climb;
    int radius;

    explicit VoxelAgent(const NavMeshSettings& s)
        : height(static_cast<int>(std::ceil(s.agent_height / s.cell_height)))
        , climb(static_cast<int>(std::floor(s.agent_max_climb / s.cell_height)))
        , radius(static_cast<int>(std::ceil(s.agent_radius / s.cell_size))) {}
};

// Solid heightfield with ledges and low ceilings already filtered out
RecastPtr<rcHeightfield> rasterize(rcContext& ctx, const NavMeshInputGeometry& geometry,
                                   const NavMeshSettings& settings, const VoxelAgent& agent,
                                   std::string& error) {
    const AABB box = geometry.bounds();

    RecastPtr<rcHeightfield> solid(rcAllocHeightfield());
    int columns = 0;
    int rows = 0;
    rcCalcGridSize(&box.min[0], &box.max[0], settings.cell_size, &columns, &rows);

    if (!solid || !rcCreateHeightfield(&ctx, *solid, columns, rows, &box.min[0], &box.max[0],
                                       settings.cell_size, settings.cell_height)) {
        error = "Failed to create heightfield";
        return nullptr;
    }

    std::vector<unsigned char> areas(geometry.triangle_count(), RC_NULL_AREA);
    rcMarkWalkableTriangles(&ctx, settings.agent_max_slope,
                            geometry.vertices.data(), geometry.vertex_count(),
                            geometry.indices.data(), geometry.triangle_count(), areas.data());

    if (!rcRasterizeTriangles(&ctx, geometry.vertices.data(), geometry.vertex_count(),
                              geometry.indices.data(), areas.data(), geometry.triangle_count(),
                              *solid, agent.climb)) {
        error = "Failed to rasterize triangles";
        return nullptr;
    }

    rcFilterLowHangingWalkableObstacles(&ctx, agent.climb, *solid);
    rcFilterLedgeSpans(&ctx, agent.height, agent.climb, *solid);
    rcFilterWalkableLowHeightSpans(&ctx, agent.height, *solid);
    return solid;
}

// Open space eroded by the agent radius and split into regions
RecastPtr<rcCompactHeightfield> partition(rcContext& ctx, rcHeightfield& solid,
                                          const NavMeshSettings& settings, const VoxelAgent& agent,
                                          std::string& error) {
    RecastPtr<rcCompactHeightfield> open(rcAllocCompactHeightfield());
    if (!open || !rcBuildCompactHeightfield(&ctx, agent.height, agent.climb, solid, *open)) {
        error = "Failed to build compact heightfield";
        return nullptr;
    }

    if (!rcErodeWalkableArea(&ctx, agent.radius, *open)) {
        error = "Failed to erode walkable area";
        return nullptr;
    }

    if (!rcBuildDistanceField(&ctx, *open) ||
        !rcBuildRegions(&ctx, *open, 0, settings.min_region_area, settings.merge_region_area)) {
        error = "Failed to build regions";
        return nullptr;
    }
    return open;
}

struct Polygons {
    RecastPtr<rcPolyMesh> mesh;
    RecastPtr<rcPolyMeshDetail> detail;
};

bool triangulate(rcContext& ctx, rcCompactHeightfield& open, const NavMeshSettings& settings,
                 Polygons& out, std::string& error) {
    RecastPtr<rcContourSet> contours(rcAllocContourSet());
    const int max_edge_cells = static_cast<int>(settings.max_edge_length / settings.cell_size);
    if (!contours || !rcBuildContours(&ctx, open, settings.max_edge_error, max_edge_cells, *contours)) {
        error = "Failed to build contours";
        return false;
    }

    out.mesh.reset(rcAllocPolyMesh());
    if (!out.mesh || !rcBuildPolyMesh(&ctx, *contours, settings.max_verts_per_poly, *out.mesh)) {
        error = "Failed to build poly mesh";
        return false;
    }

    out.detail.reset(rcAllocPolyMeshDetail());
    if (!out.detail || !rcBuildPolyMeshDetail(&ctx, *out.mesh, open,
                                              settings.cell_size * settings.detail_sample_distance,
                                              settings.cell_height * settings.detail_sample_max_error,
                                              *out.detail)) {
        error = "Failed to build detail mesh";
        return false;
    }

    if (out.mesh->npolys == 0) {
        error = "No walkable polygons";
        return false;
    }
    return true;
}

dtNavMesh* to_detour(const Polygons& polys, const NavMeshSettings& settings, std::string& error) {
    rcPolyMesh& mesh = *polys.mesh;
    const rcPolyMeshDetail& detail = *polys.detail;

    // One walkable flag for every polygon; the query filter includes it
    for (int i = 0; i < mesh.npolys; ++i) {
        mesh.flags[i] = 1;
    }

    dtNavMeshCreateParams params;
    std::memset(&params, 0, sizeof(params));
    params.verts = mesh.verts;
    params.vertCount = mesh.nverts;
    params.polys = mesh.polys;
    params.polyAreas = mesh.areas;
    params.polyFlags = mesh.flags;
    params.polyCount = mesh.npolys;
    params.nvp = mesh.nvp;
    params.detailMeshes = detail.meshes;
    params.detailVerts = detail.verts;
    params.detailVertsCount = detail.nverts;
    params.detailTris = detail.tris;
    params.detailTriCount = detail.ntris;
    params.walkableHeight = settings.agent_height;
    params.walkableRadius = settings.agent_radius;
    params.walkableClimb = settings.agent_max_climb;
    params.cs = settings.cell_size;
    params.ch = settings.cell_height;
    params.buildBvTree = true;
    rcVcopy(params.bmin, mesh.bmin);
    rcVcopy(params.bmax, mesh.bmax);

    unsigned char* data = nullptr;
    int data_size = 0;
    if (!dtCreateNavMeshData(&params, &data, &data_size)) {
        error = "Failed to create Detour navmesh data";
        return nullptr;
    }

    dtNavMesh* navmesh = dtAllocNavMesh();
    if (!navmesh) {
        dtFree(data);
        error = "Failed to allocate Detour navmesh";
        return nullptr;
    }

    // With DT_TILE_FREE_DATA the mesh owns the data only once init succeeds
    if (dtStatusFailed(navmesh->init(data, data_size, DT_TILE_FREE_DATA))) {
        dtFree(data);
        dtFreeNavMesh(navmesh);
        error = "Failed to initialize Detour navmesh";
        return nullptr;
    }
    return navmesh;
}

} // namespace

NavMeshBuildResult build_navmesh(const NavMeshInputGeometry& geometry,
                                 const NavMeshSettings& settings) {
    NavMeshBuildResult result;
    if (geometry.vertices.empty() || geometry.indices.empty()) {
        result.error_message = "Empty geometry";
        return result;
    }

    rcContext ctx(false);
    const VoxelAgent agent(settings);

    auto solid = rasterize(ctx, geometry, settings, agent, result.error_message);
    if (!solid) return result;

    auto open = partition(ctx, *solid, settings, agent, result.error_message);
    if (!open) return result;
    solid.reset();

    Polygons polys;
    if (!triangulate(ctx, *open, settings, polys, result.error_message)) return result;
    open.reset();

    dtNavMesh* navmesh = to_detour(polys, settings, result.error_message);
    if (!navmesh) return result;

    result.navmesh = std::make_unique<NavMesh>(navmesh, settings);
    return result;
}

} // namespace stacker::navigation
