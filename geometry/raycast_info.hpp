/*
 * raycast_info.hpp - Raycast result and builder
 */

#ifndef PORTMATH_GEOMETRY_RAYCAST_INFO_HPP
#define PORTMATH_GEOMETRY_RAYCAST_INFO_HPP

#include "../vector/vector3.hpp"

namespace portmath {
namespace geometry {

// Fields not set through the builder default to zero
struct RaycastInfo {
    math::Vector3 point;
    math::Vector3 normal;
    math::Vector2 uv;
    float distance = 0.0f;
    bool is_hit = false;

    static RaycastInfo empty() { return RaycastInfo(); }
};

class RaycastInfoBuilder {
public:
    RaycastInfoBuilder& set_point(const math::Vector3& value)  { info_.point = value; return *this; }
    RaycastInfoBuilder& set_normal(const math::Vector3& value) { info_.normal = value; return *this; }
    RaycastInfoBuilder& set_uv(const math::Vector2& value)     { info_.uv = value; return *this; }
    RaycastInfoBuilder& set_distance(float value)              { info_.distance = value; return *this; }
    RaycastInfoBuilder& set_hit(bool value)                    { info_.is_hit = value; return *this; }

    RaycastInfo build() const { return info_; }

private:
    RaycastInfo info_;
};

} // namespace geometry
} // namespace portmath

#endif // PORTMATH_GEOMETRY_RAYCAST_INFO_HPP
