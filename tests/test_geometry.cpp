/*
 * test_geometry.cpp - Unit tests for rays, planes, raycasts and the
 * Boost.Geometry adapters
 */

#include "geometry/plane.hpp"
#include "geometry/shapes.hpp"
#include "test_common.hpp"

using namespace portmath::geometry;
using portmath::math::Vector2;
using portmath::math::Vector3;

//=============================================================================
// Rays
//=============================================================================

TEST(ray2_points) {
    Ray2 ray(Vector2::one(), Vector2::up());
    ASSERT_VEC2_NEAR(ray.get_point(4.3f), 1.0f, 5.3f, 1e-6f);
    ASSERT_EQ(ray.closest_point(Vector2::down()), Vector2(1.0f, -1.0f));
    ASSERT_NEAR(ray.distance(Vector2::down()), 1.0f, 1e-6f);

    Ray2 sideways(Vector2::one(), Vector2::left());
    ASSERT_NEAR(sideways.distance(Vector2::down()), 2.0f, 1e-6f);
}

TEST(ray3_points) {
    Ray3 ray(Vector3::one(), Vector3::forward());
    ASSERT_VEC3_NEAR(ray.get_point(2.0f), 1.0f, 1.0f, 3.0f, 1e-6f);
    ASSERT_EQ(ray.closest_point(Vector3::down()), Vector3(1.0f, 1.0f, 0.0f));
    ASSERT_NEAR(ray.distance(Vector3::down()), 2.236068f, 1e-5f);

    Ray3 axis(Vector3::forward(), Vector3::forward());
    ASSERT_NEAR(axis.distance(Vector3::down()), 1.0f, 1e-6f);
}

TEST(ray_scaling) {
    Ray3 ray(Vector3::one(), Vector3(0.0f, 2.0f, 0.0f));
    Ray3 doubled = ray * 2.0f;
    ASSERT_EQ(doubled.origin, Vector3::one());
    ASSERT_EQ(doubled.direction, Vector3(0.0f, 4.0f, 0.0f));
    ASSERT_EQ((ray / 2.0f).direction, Vector3::up());
    ASSERT_EQ((-ray).direction, Vector3(0.0f, -2.0f, 0.0f));

    Ray2 flat(Vector2::zero(), Vector2(3.0f, 0.0f));
    flat /= 3.0f;
    ASSERT_EQ(flat.direction, Vector2::right());
    flat *= 0.5f;
    ASSERT_EQ(flat.direction, Vector2(0.5f, 0.0f));
}

TEST(ray_conversions) {
    Ray3 ray(Vector3(1.0f, 2.0f, 3.0f), Vector3(4.0f, 5.0f, 6.0f));
    Ray2 flat(ray);
    ASSERT_EQ(flat.origin, Vector2(1.0f, 2.0f));
    ASSERT_EQ(flat.direction, Vector2(4.0f, 5.0f));

    Ray3 lifted(flat);
    ASSERT_EQ(lifted, Ray3(Vector3(1.0f, 2.0f, 0.0f), Vector3(4.0f, 5.0f, 0.0f)));
    ASSERT(lifted != ray);
}

//=============================================================================
// Planes
//=============================================================================

TEST(plane_construction) {
    Plane plane(Vector3::one(), 1.0f);
    ASSERT_VEC3_NEAR(plane.normal(), 0.57735026f, 0.57735026f, 0.57735026f, 1e-6f);
    ASSERT_EQ(plane.distance(), 1.0f);

    Plane through = Plane::from_point(Vector3::one(), Vector3(-1.0f, 0.5f, 2.5f));
    ASSERT_NEAR(through.distance(), -1.1547005f, 1e-5f);
    ASSERT(through.is_on_plane(Vector3(-1.0f, 0.5f, 2.5f)));

    Plane tri = Plane::from_triangle(Vector3(0.0f, 0.2f, 0.4f),
                                     Vector3(0.6f, 0.8f, 1.0f),
                                     Vector3(0.3f, 0.6f, -0.9f));
    ASSERT_VEC3_NEAR(tri.normal(), -0.7275328f, 0.6847368f, 0.04279606f, 1e-5f);
    ASSERT_NEAR(tri.distance(), -0.1540658f, 1e-5f);
    ASSERT(tri.is_on_plane(Vector3(0.6f, 0.8f, 1.0f)));
}

TEST(plane_axis_planes) {
    ASSERT(Plane::xy_plane().is_on_plane(Vector3(100.0f, -100.0f, 0.0f)));
    ASSERT(Plane::xz_plane().is_on_plane(Vector3(1.0f, 0.0f, 2.0f)));
    ASSERT(Plane::yz_plane().is_on_plane(Vector3(0.0f, -10.0f, 10.0f)));
    ASSERT(!Plane::yz_plane().is_on_plane(Vector3(0.1f, -10.0f, 10.0f)));
}

TEST(plane_setters_and_flip) {
    Plane plane(Vector3::down(), 1.0f);
    plane.set_normal(Vector3(0.0f, 0.0f, 5.0f));
    ASSERT_EQ(plane.normal(), Vector3::forward());
    plane.set_distance(-2.0f);
    ASSERT_EQ(plane.distance(), -2.0f);

    Plane flipped = Plane(Vector3::one(), 1.0f).flipped();
    ASSERT_VEC3_NEAR(flipped.normal(), -0.57735026f, -0.57735026f, -0.57735026f, 1e-6f);
    ASSERT_EQ(flipped.distance(), -1.0f);
    ASSERT(-Plane(Vector3::one(), 1.0f) == flipped);
    ASSERT(flipped != Plane(Vector3::one(), 1.0f));
}

TEST(plane_point_queries) {
    Plane plane(Vector3(1.0f, -2.0f, 3.0f), 3.0f);

    ASSERT_VEC3_NEAR(plane.closest_point(Vector3::one()), 0.05535913f, 2.889282f, -1.833922f, 1e-5f);
    ASSERT_NEAR(plane.distance_to_point(Vector3::one()), 3.534523f, 1e-5f);
    ASSERT(plane.is_on_plane(plane.closest_point(Vector3::one())));

    ASSERT(plane.is_on_positive_side(Vector3::one()));
    ASSERT(plane.is_on_same_side(Vector3::one(), Vector3::right()));
    ASSERT(!plane.is_on_same_side(Vector3::one(), Vector3(-10.0f, -20.0f, -30.0f)));
}

//=============================================================================
// Raycasts
//=============================================================================

TEST(raycast_builder) {
    RaycastInfo empty = RaycastInfo::empty();
    ASSERT(!empty.is_hit);
    ASSERT_EQ(empty.point, Vector3::zero());
    ASSERT_EQ(empty.normal, Vector3::zero());
    ASSERT_EQ(empty.uv, Vector2::zero());
    ASSERT_EQ(empty.distance, 0.0f);

    RaycastInfo info = RaycastInfoBuilder()
        .set_hit(true)
        .set_distance(2.5f)
        .set_point(Vector3::one())
        .set_uv(Vector2(0.25f, 0.75f))
        .build();
    ASSERT(info.is_hit);
    ASSERT_EQ(info.distance, 2.5f);
    ASSERT_EQ(info.point, Vector3::one());
    ASSERT_EQ(info.normal, Vector3::zero());
    ASSERT_EQ(info.uv, Vector2(0.25f, 0.75f));
}

TEST(plane_raycast) {
    Plane ground = Plane::xz_plane();

    RaycastInfo hit = ground.raycast(Ray3(Vector3(2.0f, 5.0f, -1.0f), Vector3::down()));
    ASSERT(hit.is_hit);
    ASSERT_NEAR(hit.distance, 5.0f, 1e-6f);
    ASSERT_EQ(hit.point, Vector3(2.0f, 0.0f, -1.0f));
    ASSERT_EQ(hit.normal, Vector3::up());

    // Behind the origin: reported, but not a hit
    RaycastInfo behind = ground.raycast(Ray3(Vector3(0.0f, 5.0f, 0.0f), Vector3::up()));
    ASSERT(!behind.is_hit);
    ASSERT_NEAR(behind.distance, -5.0f, 1e-6f);

    RaycastInfo parallel = ground.raycast(Ray3(Vector3(0.0f, 5.0f, 0.0f), Vector3::right()));
    ASSERT(!parallel.is_hit);
    ASSERT_EQ(parallel.distance, 0.0f);
    ASSERT_EQ(parallel.point, Vector3::zero());

    // Slanted ray against a tilted plane lands on the plane
    Plane tilted(Vector3(1.0f, -2.0f, 3.0f), 3.0f);
    RaycastInfo slanted = tilted.raycast(Ray3(Vector3::one(), Vector3(-1.0f, 0.5f, -2.0f)));
    ASSERT(slanted.is_hit);
    ASSERT(tilted.is_on_plane(slanted.point));
}

//=============================================================================
// Boost.Geometry adapters
//=============================================================================

TEST(boost_point_distance) {
    ASSERT_NEAR(boost::geometry::distance(Vector2(0.0f, 0.0f), Vector2(3.0f, 4.0f)), 5.0, 1e-6);
    ASSERT_NEAR(boost::geometry::distance(Vector3(0.25f, -0.5f, 1.25f), Vector3(2.0f, 0.5f, -1.0f)),
                portmath::math::distance(Vector3(0.25f, -0.5f, 1.25f), Vector3(2.0f, 0.5f, -1.0f)), 1e-5);

    ASSERT_NEAR(distance_to_segment(Vector2(0.0f, 1.0f), Vector2(-1.0f, 0.0f), Vector2(1.0f, 0.0f)), 1.0f, 1e-6f);
    ASSERT_NEAR(distance_to_segment(Vector2(3.0f, 4.0f), Vector2(-1.0f, 0.0f), Vector2(0.0f, 0.0f)), 5.0f, 1e-5f);
}

TEST(boost_boxes) {
    Box2 box(Vector2(0.0f, 0.0f), Vector2(2.0f, 2.0f));
    ASSERT(box_contains(box, Vector2(1.0f, 1.5f)));
    ASSERT(!box_contains(box, Vector2(3.0f, 1.0f)));
    ASSERT_NEAR(distance_to_box(Vector2(5.0f, 1.0f), box), 3.0f, 1e-6f);

    Box3 cube(Vector3::zero(), Vector3::one());
    ASSERT(box_contains(cube, Vector3(0.5f, 0.5f, 0.5f)));
    ASSERT(!box_contains(cube, Vector3(0.5f, 1.5f, 0.5f)));
}

TEST(boost_polygons) {
    // Counter-clockwise input; make_polygon corrects the winding
    Polygon2 square = make_polygon({
        Vector2(0.0f, 0.0f), Vector2(2.0f, 0.0f), Vector2(2.0f, 2.0f), Vector2(0.0f, 2.0f)
    });

    ASSERT_NEAR(polygon_area(square), 4.0f, 1e-5f);
    ASSERT_EQ(polygon_num_points(square), static_cast<std::size_t>(5));
    ASSERT_VEC2_NEAR(polygon_centroid(square), 1.0f, 1.0f, 1e-5f);
    ASSERT(polygon_contains(square, Vector2(1.0f, 1.0f)));
    ASSERT(!polygon_contains(square, Vector2(3.0f, 1.0f)));

    Box2 bounds = polygon_envelope(square);
    ASSERT_EQ(bounds.min_corner(), Vector2(0.0f, 0.0f));
    ASSERT_EQ(bounds.max_corner(), Vector2(2.0f, 2.0f));
}

int main() {
    printf("=== Geometry Unit Tests ===\n\n");

    // Rays
    RUN_TEST(ray2_points);
    RUN_TEST(ray3_points);
    RUN_TEST(ray_scaling);
    RUN_TEST(ray_conversions);

    // Planes
    RUN_TEST(plane_construction);
    RUN_TEST(plane_axis_planes);
    RUN_TEST(plane_setters_and_flip);
    RUN_TEST(plane_point_queries);

    // Raycasts
    RUN_TEST(raycast_builder);
    RUN_TEST(plane_raycast);

    // Boost.Geometry
    RUN_TEST(boost_point_distance);
    RUN_TEST(boost_boxes);
    RUN_TEST(boost_polygons);

    TEST_SUMMARY();
    return g_tests_failed > 0 ? 1 : 0;
}
