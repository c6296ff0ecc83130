#include <stacker/world/nav_oracle.hpp>

namespace stacker::world {

float path_length(const std::vector<Vec3>& points) {
    if (points.size() < 2) return 0.0f;

    float length = 0.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        length += glm::length(points[i] - points[i - 1]);
    }
    return length;
}

float PathQuery::length() const {
    return path_length(waypoints);
}

} // namespace stacker::world
