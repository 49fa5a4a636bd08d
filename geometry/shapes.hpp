/*
 * shapes.hpp - Boost.Geometry adapters for the vector types
 *
 * Registers Vector2 and Vector3 as Boost.Geometry cartesian points so the
 * library's models and algorithms work on them directly, and wraps the
 * handful of algorithms the rest of the library uses.
 */

#ifndef PORTMATH_GEOMETRY_SHAPES_HPP
#define PORTMATH_GEOMETRY_SHAPES_HPP

#include "../vector/vector3.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/segment.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/algorithms/distance.hpp>
#include <boost/geometry/algorithms/within.hpp>
#include <boost/geometry/algorithms/area.hpp>
#include <boost/geometry/algorithms/centroid.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/correct.hpp>

#include <cstddef>
#include <initializer_list>

BOOST_GEOMETRY_REGISTER_POINT_2D(portmath::math::Vector2, float, boost::geometry::cs::cartesian, x, y)
BOOST_GEOMETRY_REGISTER_POINT_3D(portmath::math::Vector3, float, boost::geometry::cs::cartesian, x, y, z)

namespace portmath {
namespace geometry {

namespace bg = boost::geometry;

// ============================================================================
// Core Types
// ============================================================================

using Box2 = bg::model::box<math::Vector2>;
using Segment2 = bg::model::segment<math::Vector2>;
// Clockwise, closed
using Polygon2 = bg::model::polygon<math::Vector2>;

using Box3 = bg::model::box<math::Vector3>;

// ============================================================================
// Distance
// ============================================================================

inline float distance_to_segment(const math::Vector2& point, const math::Vector2& start, const math::Vector2& end) {
    Segment2 seg(start, end);
    return static_cast<float>(bg::distance(point, seg));
}

inline float distance_to_box(const math::Vector2& point, const Box2& box) {
    return static_cast<float>(bg::distance(point, box));
}

// ============================================================================
// Boxes
// ============================================================================

inline bool box_contains(const Box2& box, const math::Vector2& point) {
    return bg::within(point, box);
}

inline bool box_contains(const Box3& box, const math::Vector3& point) {
    return bg::within(point, box);
}

// ============================================================================
// Polygons
// ============================================================================

// Winding and closure are corrected after the points are appended
inline Polygon2 make_polygon(std::initializer_list<math::Vector2> points) {
    Polygon2 poly;
    for (const auto& p : points) {
        bg::append(poly.outer(), p);
    }
    bg::correct(poly);
    return poly;
}

inline float polygon_area(const Polygon2& poly) {
    return static_cast<float>(bg::area(poly));
}

inline math::Vector2 polygon_centroid(const Polygon2& poly) {
    math::Vector2 result;
    bg::centroid(poly, result);
    return result;
}

inline bool polygon_contains(const Polygon2& poly, const math::Vector2& point) {
    return bg::within(point, poly);
}

inline Box2 polygon_envelope(const Polygon2& poly) {
    return bg::return_envelope<Box2>(poly);
}

inline std::size_t polygon_num_points(const Polygon2& poly) {
    return bg::num_points(poly);
}

} // namespace geometry
} // namespace portmath

#endif // PORTMATH_GEOMETRY_SHAPES_HPP
