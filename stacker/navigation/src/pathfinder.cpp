#include <stacker/navigation/pathfinder.hpp>

namespace stacker::navigation {

Pathfinder::Pathfinder() {
    m_filter.setIncludeFlags(0xFFFF);
    m_filter.setExcludeFlags(0);
}

bool Pathfinder::init(const NavMesh& navmesh, int max_nodes) {
    m_query.reset();
    if (!navmesh.is_valid()) {
        return false;
    }

    std::unique_ptr<dtNavMeshQuery, QueryRelease> query(dtAllocNavMeshQuery());
    if (!query || dtStatusFailed(query->init(navmesh.detour(), max_nodes))) {
        return false;
    }

    m_query = std::move(query);
    return true;
}

std::optional<Pathfinder::Snap> Pathfinder::snap(const Vec3& point, const Vec3& half_extents) const {
    Snap result;
    dtStatus status = m_query->findNearestPoly(&point[0], &half_extents[0], &m_filter,
                                               &result.poly, &result.point[0]);
    if (dtStatusFailed(status) || result.poly == 0) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::vector<Vec3>> Pathfinder::find_complete_path(
    const Vec3& start, const Vec3& goal, const Vec3& half_extents) const {
    if (!m_query) {
        return std::nullopt;
    }

    auto from = snap(start, half_extents);
    auto to = snap(goal, half_extents);
    if (!from || !to) {
        return std::nullopt;
    }

    dtPolyRef corridor[MAX_CORRIDOR];
    int corridor_size = 0;
    dtStatus status = m_query->findPath(from->poly, to->poly, &from->point[0], &to->point[0],
                                        &m_filter, corridor, &corridor_size, MAX_CORRIDOR);

    // A corridor that stops elsewhere is Detour's best effort, not a route
    if (dtStatusFailed(status) || corridor_size == 0 || corridor[corridor_size - 1] != to->poly) {
        return std::nullopt;
    }

    float straight[MAX_CORRIDOR * 3];
    int straight_size = 0;
    status = m_query->findStraightPath(&from->point[0], &to->point[0], corridor, corridor_size,
                                       straight, nullptr, nullptr, &straight_size, MAX_CORRIDOR,
                                       DT_STRAIGHTPATH_ALL_CROSSINGS);
    if (dtStatusFailed(status) || straight_size == 0) {
        return std::nullopt;
    }

    std::vector<Vec3> waypoints;
    waypoints.reserve(straight_size);
    for (int i = 0; i < straight_size; ++i) {
        waypoints.emplace_back(straight[i * 3], straight[i * 3 + 1], straight[i * 3 + 2]);
    }
    return waypoints;
}

} // namespace stacker::navigation
