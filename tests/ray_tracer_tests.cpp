#include <boost/test/unit_test.hpp>

#include <limits>
#include <stdexcept>
#include <utility>

#include "ray_tracer.h"
#include "test_geometry.h"

BOOST_AUTO_TEST_SUITE(ray_tracer)

BOOST_AUTO_TEST_CASE(triangle_hit_and_miss) {
    Vector3 a{ 0, 0, 0 }, b{ 1, 0, 0 }, c{ 0, 1, 0 };
    Ray down{ { 0.25, 0.25, 2 }, { 0, 0, -1 } };
    BOOST_CHECK_CLOSE(intersectTriangle(down, a, b, c), 2.0, 1e-9);

    Ray outside{ { 0.9, 0.9, 2 }, { 0, 0, -1 } };
    BOOST_CHECK_LT(intersectTriangle(outside, a, b, c), 0.0);

    Ray parallel{ { 0.25, 0.25, 2 }, { 1, 0, 0 } };
    BOOST_CHECK_LT(intersectTriangle(parallel, a, b, c), 0.0);
}

BOOST_AUTO_TEST_CASE(hits_are_two_sided) {
    Vector3 a{ 0, 0, 0 }, b{ 1, 0, 0 }, c{ 0, 1, 0 };
    Ray up{ { 0.25, 0.25, -3 }, { 0, 0, 1 } };
    BOOST_CHECK_CLOSE(intersectTriangle(up, a, b, c), 3.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(closest_of_two_planes) {
    Mesh m = makeQuad({ -1, 5, -1 }, { 1, 5, -1 }, { 1, 5, 1 }, { -1, 5, 1 });
    Mesh far = makeQuad({ -1, 9, -1 }, { 1, 9, -1 }, { 1, 9, 1 }, { -1, 9, 1 });
    int base = static_cast<int>(m.vertices.size());
    for (const auto &v : far.vertices) m.addVertex(v);
    for (const auto &f : far.faces) m.addTriangle(f.v1 + base, f.v2 + base, f.v3 + base);

    MeshIntersector isect(m);
    BOOST_CHECK_EQUAL(isect.triangleCount(), 4);
    BOOST_CHECK_CLOSE(isect.closestHit({ { 0.3, 0, -0.2 }, { 0, 1, 0 } }), 5.0, 1e-9);
    BOOST_CHECK_LT(isect.closestHit({ { 0.3, 0, -0.2 }, { 0, -1, 0 } }), 0.0);
    BOOST_CHECK_LT(isect.closestHit({ { 0.3, 0, -0.2 }, { 0, 1, 0 } }, 4.0), 0.0);
}

BOOST_AUTO_TEST_CASE(flat_horizontal_mesh_is_hit) {
    MeshIntersector isect(makeSouthOverhang());
    // straight up through the overhang: the BVH box has zero thickness in z
    double t = isect.closestHit({ { 0.2, -0.3, 0 }, { 0, 0, 1 } });
    BOOST_CHECK_CLOSE(t, 2.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(box_mesh_builds_deep_hierarchy) {
    Mesh grid;
    const int n = 20;
    for (int i = 0; i <= n; i++)
        for (int j = 0; j <= n; j++)
            grid.addVertex({ static_cast<double>(i), static_cast<double>(j), 0.0 });
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            int a = i * (n + 1) + j;
            grid.addQuad(a, a + n + 1, a + n + 2, a + 1);
        }
    }
    MeshIntersector isect(grid);
    BOOST_CHECK_EQUAL(isect.triangleCount(), 2 * n * n);
    for (double x = 0.35; x < n; x += 1.3) {
        for (double y = 0.42; y < n; y += 1.9) {
            BOOST_CHECK_CLOSE(isect.closestHit({ { x, y, 4 }, { 0, 0, -1 } }), 4.0, 1e-9);
        }
    }
    BOOST_CHECK_LT(isect.closestHit({ { n + 1.0, 1, 4 }, { 0, 0, -1 } }), 0.0);
}

BOOST_AUTO_TEST_CASE(closed_box_from_inside) {
    MeshIntersector isect(makeBox({ -1, -2, -3 }, { 1, 2, 3 }));
    Vector3 inside{ 0.1, 0.3, -0.2 };
    BOOST_CHECK_CLOSE(isect.closestHit({ inside, { 1, 0, 0 } }), 0.9, 1e-9);
    BOOST_CHECK_CLOSE(isect.closestHit({ inside, { 0, -1, 0 } }), 2.3, 1e-9);
    BOOST_CHECK_CLOSE(isect.closestHit({ inside, { 0, 0, 1 } }), 3.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(empty_mesh_never_hits) {
    Mesh empty;
    MeshIntersector isect(empty);
    BOOST_CHECK_EQUAL(isect.triangleCount(), 0);
    BOOST_CHECK_LT(isect.closestHit({ { 0, 0, 0 }, { 0, 0, 1 } }), 0.0);
}

BOOST_AUTO_TEST_CASE(invalid_meshes_are_rejected) {
    Mesh dangling = makeSouthOverhang();
    dangling.addTriangle(0, 1, 99);
    BOOST_CHECK_THROW(MeshIntersector{ dangling }, std::invalid_argument);

    Mesh nan = makeSouthOverhang();
    nan.vertices[2].z = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK_THROW(MeshIntersector{ nan }, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(intersector_owns_its_geometry) {
    Mesh m = makeSouthOverhang();
    MeshIntersector isect(m);
    m.vertices.clear();
    m.faces.clear();
    BOOST_CHECK_CLOSE(isect.closestHit({ { 0.2, -0.3, 0 }, { 0, 0, 1 } }), 2.0, 1e-9);

    MeshIntersector moved(std::move(isect));
    BOOST_CHECK_CLOSE(moved.closestHit({ { 0.2, -0.3, 0 }, { 0, 0, 1 } }), 2.0, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
