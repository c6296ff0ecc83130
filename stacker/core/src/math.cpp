#include <stacker/core/math.hpp>
#include <format>

namespace stacker::core {

std::string to_string(const Vec3& v) {
    return std::format("({:.2f}, {:.2f}, {:.2f})", v.x, v.y, v.z);
}

} // namespace stacker::core
