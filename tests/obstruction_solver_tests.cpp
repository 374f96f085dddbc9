#define _USE_MATH_DEFINES

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>

#include "obstruction_solver.h"
#include "test_geometry.h"

namespace {

struct SouthWindowFixture {
    ClassifierSettings settings;
    MeshProperties     window;
    std::vector<SamplePoint> samples;
    RayDirectionSet    directions;

    SouthWindowFixture() {
        window     = computeMeshProperties(makeSouthWindow());
        samples    = generateSamplePoints(window.bbox, window.normal, settings);
        directions = generateRayDirections(window.normal, settings);
    }

    std::vector<const ContextItem*> relevant(const ContextSet &set) const {
        return filterContextForWindow(set.items, window.center, window.normal, window.bbox, settings);
    }
};

}

BOOST_AUTO_TEST_SUITE(obstruction_solver)

BOOST_AUTO_TEST_CASE(context_set_skips_unusable_items) {
    std::vector<Mesh> raw;
    raw.push_back(makeBox({ -5, -20, 0 }, { 5, -10, 10 }));

    raw.push_back(Mesh());

    Mesh noFaces;
    noFaces.addVertex({ 0, 0, 0 });
    raw.push_back(noFaces);

    Mesh nan = makeWallInFront(5, 2, 3);
    nan.vertices[0].x = std::numeric_limits<double>::quiet_NaN();
    raw.push_back(nan);

    Mesh dangling = makeWallInFront(5, 2, 3);
    dangling.addTriangle(0, 1, 7);
    raw.push_back(dangling);

    Mesh flat;
    flat.addVertex({ 0, -5, 0 });
    flat.addVertex({ 1, -5, 0 });
    flat.addVertex({ 2, -5, 0 });
    flat.addTriangle(0, 1, 2);
    raw.push_back(flat);

    ContextSet set = buildContextSet(raw);
    BOOST_REQUIRE_EQUAL(set.items.size(), 1u);
    BOOST_CHECK_EQUAL(set.skipped, 5);
    BOOST_CHECK_EQUAL(set.items[0].sourceIndex, 0);
    BOOST_CHECK_EQUAL(set.items[0].intersector->triangleCount(), 12);
}

BOOST_FIXTURE_TEST_CASE(prefilter_drops_items_behind_window, SouthWindowFixture) {
    std::vector<Mesh> raw;
    raw.push_back(makeBox({ -5, -20, 0 }, { 5, -10, 10 }));
    raw.push_back(makeBox({ -5, 10, 0 }, { 5, 20, 10 }));
    ContextSet set = buildContextSet(raw);
    std::vector<const ContextItem*> kept = relevant(set);
    BOOST_REQUIRE_EQUAL(kept.size(), 1u);
    BOOST_CHECK_EQUAL(kept[0]->sourceIndex, 0);
}

BOOST_FIXTURE_TEST_CASE(prefilter_keeps_large_item_straddling_window_plane, SouthWindowFixture) {
    std::vector<Mesh> raw;
    // centre slightly behind the facade, but the block reaches far in front
    raw.push_back(makeBox({ -10, -20, 0 }, { 10, 22, 10 }));
    ContextSet set = buildContextSet(raw);
    BOOST_CHECK_EQUAL(relevant(set).size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(prefilter_drops_items_below_window, SouthWindowFixture) {
    Mesh high = makeSouthWindow();
    translateMesh(high, { 0, 0, 10 });
    MeshProperties p = computeMeshProperties(high);

    std::vector<Mesh> raw;
    raw.push_back(makeBox({ -5, -20, 0 }, { 5, -10, 5 }));
    raw.push_back(makeBox({ -5, -20, 0 }, { 5, -10, 15 }));
    ContextSet set = buildContextSet(raw);
    std::vector<const ContextItem*> kept =
        filterContextForWindow(set.items, p.center, p.normal, p.bbox, settings);
    BOOST_REQUIRE_EQUAL(kept.size(), 1u);
    BOOST_CHECK_EQUAL(kept[0]->sourceIndex, 1);
}

BOOST_FIXTURE_TEST_CASE(prefilter_distance_limit, SouthWindowFixture) {
    std::vector<Mesh> raw;
    raw.push_back(makeBox({ -20, -500, 0 }, { 20, -498, 50 }));   // centre 499 away
    raw.push_back(makeBox({ -20, -502, 0 }, { 20, -500, 50 }));   // centre 501 away
    ContextSet set = buildContextSet(raw);
    std::vector<const ContextItem*> kept = relevant(set);
    BOOST_REQUIRE_EQUAL(kept.size(), 1u);
    BOOST_CHECK_EQUAL(kept[0]->sourceIndex, 0);
}

BOOST_FIXTURE_TEST_CASE(no_context_gives_zero_angle, SouthWindowFixture) {
    std::vector<const ContextItem*> none;
    ContextCastStats stats;
    BOOST_CHECK_EQUAL(castContextRays(samples, directions, none, settings, &stats), 0.0);
}

BOOST_FIXTURE_TEST_CASE(high_wall_blocks_up_to_top_elevation, SouthWindowFixture) {
    std::vector<Mesh> raw;
    raw.push_back(makeWallInFront(5, 50, 40));
    ContextSet set = buildContextSet(raw);
    ContextCastStats stats;
    double angle = castContextRays(samples, directions, relevant(set), settings, &stats);
    BOOST_CHECK_CLOSE(angle, 80.0, 1e-9);
    BOOST_CHECK_EQUAL(stats.raysCast, 5 * 144);
    BOOST_CHECK_GT(stats.raysBlocked, 0);
    BOOST_REQUIRE_EQUAL(stats.sampleMaxima.size(), 5u);
    for (double m : stats.sampleMaxima)
        BOOST_CHECK_EQUAL(m, 80.0);
}

BOOST_FIXTURE_TEST_CASE(low_wall_blends_sample_maxima, SouthWindowFixture) {
    // 2 m high wall 10 m away: only the lowest elevations are blocked
    std::vector<Mesh> raw;
    raw.push_back(makeWallInFront(10, 50, 2));
    ContextSet set = buildContextSet(raw);
    ContextCastStats stats;
    double angle = castContextRays(samples, directions, relevant(set), settings, &stats);
    BOOST_CHECK_GT(angle, 0.0);
    BOOST_CHECK_LE(angle, 20.0);
    BOOST_CHECK_CLOSE(angle, 0.7 * stats.weightedAverage + 0.3 * stats.absoluteMaximum, 1e-9);
    // the top sample (z 1.9) sees over a 2 m wall sooner than the sill samples
    BOOST_CHECK_LE(stats.sampleMaxima[4], stats.sampleMaxima[1]);
}

BOOST_FIXTURE_TEST_CASE(context_hits_beyond_limit_are_ignored, SouthWindowFixture) {
    ClassifierSettings shortRange = settings;
    shortRange.maxContextDistance = 4.0;
    std::vector<Mesh> raw;
    raw.push_back(makeWallInFront(5, 50, 40));
    ContextSet set = buildContextSet(raw);
    std::vector<const ContextItem*> kept = relevant(set);
    BOOST_CHECK_EQUAL(castContextRays(samples, directions, kept, shortRange), 0.0);
}

BOOST_FIXTURE_TEST_CASE(overhang_shading_profile, SouthWindowFixture) {
    MeshIntersector overhang(makeSouthOverhang());
    ShadingCastResult r = castShadingRays(window.bbox, window.normal, &overhang, settings);
    // rays from z 0.1 reach the 1 m deep overhang at z 2 once tan(e) >= 1.9
    BOOST_CHECK_EQUAL(r.elevation, 65.0);
    BOOST_CHECK_EQUAL(r.hits, 5);
    double t = 1.9 / std::sin(65.0 * M_PI / 180.0);
    BOOST_CHECK_CLOSE(r.hitDistance, t, 1e-6);
    BOOST_CHECK_CLOSE(r.projectionDepth, t * std::cos(65.0 * M_PI / 180.0), 1e-6);
    BOOST_CHECK_CLOSE(r.hoRatio, r.projectionDepth / 2.0, 1e-9);
    BOOST_CHECK_LT(r.hoRatio, 0.5);
}

BOOST_FIXTURE_TEST_CASE(no_shading_device, SouthWindowFixture) {
    ShadingCastResult r = castShadingRays(window.bbox, window.normal, nullptr, settings);
    BOOST_CHECK_EQUAL(r.elevation, 90.0);
    BOOST_CHECK_EQUAL(r.hoRatio, 0.0);
    BOOST_CHECK_EQUAL(r.hits, 0);
}

BOOST_FIXTURE_TEST_CASE(distant_shading_is_not_a_hit, SouthWindowFixture) {
    // wide canopy 60 m up: every profile ray hits it, all beyond 50 m
    MeshIntersector isect(makeQuad({ -1000, 0, 60 }, { 1000, 0, 60 },
                                   { 1000, -1000, 60 }, { -1000, -1000, 60 }));
    ShadingCastResult r = castShadingRays(window.bbox, window.normal, &isect, settings);
    BOOST_CHECK_EQUAL(r.elevation, 90.0);
    BOOST_CHECK_EQUAL(r.hits, 0);
}

BOOST_AUTO_TEST_SUITE_END()
