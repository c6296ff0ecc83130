#pragma once

#include <glm/glm.hpp>
#include <string>

namespace stacker::core {

using Vec3 = glm::vec3;

// Axis-aligned bounding box
struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}

    void expand(const Vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }
};

// Distance ignoring the vertical axis
inline float horizontal_distance(const Vec3& a, const Vec3& b) {
    return glm::length(glm::vec2(a.x - b.x, a.z - b.z));
}

// "(x, y, z)" with two decimals, for log output
std::string to_string(const Vec3& v);

} // namespace stacker::core
