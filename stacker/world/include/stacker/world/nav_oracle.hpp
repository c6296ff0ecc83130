#pragma once

#include <stacker/world/grid.hpp>
#include <memory>
#include <vector>

namespace stacker::world {

// Default agent footprint half extents used for every path query
const Vec3 DEFAULT_HALF_EXTENTS{0.3f, 0.6f, 0.3f};

// Oracle answer. An unsuccessful query means "unreachable", never an error.
struct PathQuery {
    bool success = false;
    std::vector<Vec3> waypoints;

    // Sum of 3D segment lengths
    float length() const;
};

// Walkable surface built from one height grid. Immutable once built, so
// planning snapshots can share it.
class NavSurface {
public:
    virtual ~NavSurface() = default;

    virtual PathQuery find_path(const Vec3& start, const Vec3& goal,
                                const Vec3& half_extents) const = 0;
};

// Builds walkable surfaces. Deterministic for a fixed grid.
class NavOracle {
public:
    virtual ~NavOracle() = default;

    virtual std::shared_ptr<const NavSurface> build_surface(const HeightGrid& grid) const = 0;

    virtual const char* name() const = 0;
};

// Sum of 3D segment lengths of a polyline
float path_length(const std::vector<Vec3>& points);

} // namespace stacker::world
