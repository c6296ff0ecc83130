#pragma once

#include <stacker/world/nav_oracle.hpp>

namespace stacker::world {

// Lattice oracle over column tops. A point belongs to the column under it
// when it lies within the footprint's vertical extent of that column's top.
// The agent may step between orthogonal neighbours whose heights differ by
// at most max_step blocks. Deterministic A*, no navmesh involved.
class GridNavOracle : public NavOracle {
public:
    explicit GridNavOracle(int max_step = 1);

    // max_step derived from a climb height in world units
    static GridNavOracle from_max_climb(float max_climb);

    std::shared_ptr<const NavSurface> build_surface(const HeightGrid& grid) const override;

    const char* name() const override { return "grid"; }

    int max_step() const { return m_max_step; }

private:
    int m_max_step;
};

} // namespace stacker::world
