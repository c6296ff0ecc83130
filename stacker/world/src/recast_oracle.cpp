#include <stacker/world/recast_oracle.hpp>
#include <stacker/world/block_geometry.hpp>
#include <stacker/navigation/navmesh_builder.hpp>
#include <stacker/navigation/pathfinder.hpp>
#include <stacker/core/log.hpp>

#include <chrono>

namespace stacker::world {

namespace {

// Navmesh plus its query. Without a navmesh every query is unreachable.
class RecastNavSurface : public NavSurface {
public:
    explicit RecastNavSurface(std::unique_ptr<navigation::NavMesh> navmesh)
        : m_navmesh(std::move(navmesh)) {
        if (m_navmesh && !m_pathfinder.init(*m_navmesh)) {
            core::log(core::LogLevel::Error, "[NavMesh] query init failed, surface is unreachable");
        }
    }

    PathQuery find_path(const Vec3& start, const Vec3& goal,
                        const Vec3& half_extents) const override {
        PathQuery query;
        if (!m_pathfinder.is_ready()) {
            return query;
        }

        auto waypoints = m_pathfinder.find_complete_path(start, goal, half_extents);
        if (!waypoints) {
            core::log(core::LogLevel::Debug, "[NavMesh] no path {} -> {}",
                      core::to_string(start), core::to_string(goal));
            return query;
        }

        query.success = true;
        query.waypoints = std::move(*waypoints);
        return query;
    }

private:
    std::unique_ptr<navigation::NavMesh> m_navmesh;
    navigation::Pathfinder m_pathfinder;
};

} // namespace

RecastNavOracle::RecastNavOracle(const navigation::NavMeshSettings& settings)
    : m_settings(settings) {
}

std::shared_ptr<const NavSurface> RecastNavOracle::build_surface(const HeightGrid& grid) const {
    const auto started = std::chrono::steady_clock::now();
    const auto geometry = build_block_geometry(grid);
    auto result = navigation::build_navmesh(geometry, m_settings);

    if (!result.ok()) {
        core::log(core::LogLevel::Error, "[NavMesh] build failed: {}", result.error_message);
        return std::make_shared<RecastNavSurface>(nullptr);
    }

    const std::chrono::duration<float, std::milli> elapsed = std::chrono::steady_clock::now() - started;
    core::log(core::LogLevel::Debug, "[NavMesh] {} triangles -> {} polygons in {:.1f}ms",
              geometry.triangle_count(), result.navmesh->polygon_count(), elapsed.count());

    return std::make_shared<RecastNavSurface>(std::move(result.navmesh));
}

} // namespace stacker::world
