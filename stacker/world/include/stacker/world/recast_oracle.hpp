#pragma once

#include <stacker/world/nav_oracle.hpp>
#include <stacker/navigation/navmesh.hpp>

namespace stacker::world {

// Navmesh oracle: block geometry -> Recast -> Detour queries.
// A partial Detour corridor is reported as unreachable.
class RecastNavOracle : public NavOracle {
public:
    explicit RecastNavOracle(const navigation::NavMeshSettings& settings = {});

    std::shared_ptr<const NavSurface> build_surface(const HeightGrid& grid) const override;

    const char* name() const override { return "recast"; }

    const navigation::NavMeshSettings& settings() const { return m_settings; }

private:
    navigation::NavMeshSettings m_settings;
};

} // namespace stacker::world
