#pragma once

#include <stacker/navigation/navmesh.hpp>
#include <stacker/core/math.hpp>
#include <memory>
#include <optional>
#include <vector>
#include <DetourNavMeshQuery.h>

namespace stacker::navigation {

using namespace stacker::core;

// Detour query bound to one navmesh
class Pathfinder {
public:
    Pathfinder();

    // The navmesh must outlive the pathfinder
    bool init(const NavMesh& navmesh, int max_nodes = 2048);

    bool is_ready() const { return m_query != nullptr; }

    // Straight-path waypoints from start to goal, both snapped to polygons
    // within half_extents. No value when either end misses the mesh or the
    // corridor ends short of the goal polygon.
    std::optional<std::vector<Vec3>> find_complete_path(const Vec3& start, const Vec3& goal,
                                                        const Vec3& half_extents) const;

private:
    struct Snap {
        dtPolyRef poly = 0;
        Vec3 point{0.0f};
    };

    std::optional<Snap> snap(const Vec3& point, const Vec3& half_extents) const;

    struct QueryRelease {
        void operator()(dtNavMeshQuery* query) const { dtFreeNavMeshQuery(query); }
    };

    std::unique_ptr<dtNavMeshQuery, QueryRelease> m_query;
    dtQueryFilter m_filter;

    static constexpr int MAX_CORRIDOR = 256;
};

} // namespace stacker::navigation
