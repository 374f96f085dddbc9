#include <boost/test/unit_test.hpp>

#include <limits>

#include "surface_properties.h"
#include "test_geometry.h"

BOOST_AUTO_TEST_SUITE(surface_properties)

BOOST_AUTO_TEST_CASE(quad_is_split_into_two_triangles) {
    Mesh m = makeSouthWindow();
    BOOST_CHECK_EQUAL(m.vertices.size(), 4u);
    BOOST_REQUIRE_EQUAL(m.faces.size(), 2u);
    BOOST_CHECK_EQUAL(m.faces[0].v1, 0);
    BOOST_CHECK_EQUAL(m.faces[0].v2, 1);
    BOOST_CHECK_EQUAL(m.faces[0].v3, 2);
    BOOST_CHECK_EQUAL(m.faces[1].v1, 0);
    BOOST_CHECK_EQUAL(m.faces[1].v2, 2);
    BOOST_CHECK_EQUAL(m.faces[1].v3, 3);
}

BOOST_AUTO_TEST_CASE(window_properties) {
    MeshProperties p = computeMeshProperties(makeSouthWindow());
    BOOST_REQUIRE(p.valid);
    BOOST_CHECK_SMALL(p.normal.x, 1e-12);
    BOOST_CHECK_CLOSE(p.normal.y, -1.0, 1e-9);
    BOOST_CHECK_SMALL(p.normal.z, 1e-12);
    BOOST_CHECK_CLOSE(p.totalArea, 3.0, 1e-9);
    BOOST_CHECK_SMALL(p.center.x, 1e-12);
    BOOST_CHECK_SMALL(p.center.y, 1e-12);
    BOOST_CHECK_CLOSE(p.center.z, 1.0, 1e-9);
    BOOST_CHECK_CLOSE(p.bbox.height(), 2.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(empty_mesh_is_invalid) {
    Mesh m;
    BOOST_CHECK(m.empty());
    BOOST_CHECK(!computeMeshProperties(m).valid);

    m.addVertex({ 0, 0, 0 });
    BOOST_CHECK(m.empty());
    BOOST_CHECK(!computeMeshProperties(m).valid);
}

BOOST_AUTO_TEST_CASE(cancelling_normals_are_invalid) {
    Mesh m;
    int a = m.addVertex({ 0, 0, 0 });
    int b = m.addVertex({ 1, 0, 0 });
    int c = m.addVertex({ 0, 0, 1 });
    m.addTriangle(a, b, c);
    m.addTriangle(a, c, b);
    BOOST_CHECK(!computeMeshProperties(m).valid);
}

BOOST_AUTO_TEST_CASE(collinear_triangle_is_invalid) {
    Mesh m;
    int a = m.addVertex({ 0, 0, 0 });
    int b = m.addVertex({ 1, 0, 0 });
    int c = m.addVertex({ 2, 0, 0 });
    m.addTriangle(a, b, c);
    BOOST_CHECK(!computeMeshProperties(m).valid);
}

BOOST_AUTO_TEST_CASE(unresolvable_faces_are_ignored) {
    Mesh m = makeSouthWindow();
    m.addTriangle(0, 1, 42);
    BOOST_CHECK(!faceIsResolvable(m, m.faces.back()));
    MeshProperties p = computeMeshProperties(m);
    BOOST_REQUIRE(p.valid);
    BOOST_CHECK_CLOSE(p.totalArea, 3.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(non_finite_vertex_check) {
    BOOST_CHECK(isFinite(Vector3{ 1, 2, 3 }));
    BOOST_CHECK(!isFinite(Vector3{ std::numeric_limits<double>::quiet_NaN(), 0, 0 }));
    BOOST_CHECK(!isFinite(Vector3{ 0, std::numeric_limits<double>::infinity(), 0 }));
}

BOOST_AUTO_TEST_CASE(translate_moves_every_vertex) {
    Mesh m = makeSouthWindow();
    translateMesh(m, { 10, -5, 3 });
    BoundingBox box = computeBoundingBox(m);
    BOOST_CHECK_CLOSE(box.min.x, 9.25, 1e-9);
    BOOST_CHECK_CLOSE(box.max.x, 10.75, 1e-9);
    BOOST_CHECK_CLOSE(box.min.y, -5.0, 1e-9);
    BOOST_CHECK_CLOSE(box.min.z, 3.0, 1e-9);
    BOOST_CHECK_CLOSE(box.max.z, 5.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(normalize_zero_vector) {
    Vector3 n = normalize(Vector3{ 0, 0, 0 });
    BOOST_CHECK_EQUAL(length(n), 0.0);
}

BOOST_AUTO_TEST_SUITE_END()
