#ifndef OBSTRUCTION_SOLVER_H
#define OBSTRUCTION_SOLVER_H

#include <memory>
#include <string>
#include <vector>

#include "surface_properties.h"
#include "ray_tracer.h"
#include "sky_sampling.h"
#include "classifier_settings.h"

struct ContextItem {
    BoundingBox                            bbox;
    int                                    sourceIndex;
    std::shared_ptr<const MeshIntersector> intersector;
};

struct ContextSet {
    std::vector<ContextItem> items;
    int                      skipped = 0;
};

// Built once per batch; read-only afterwards. Items without vertices or
// triangles, with dangling indices, non-finite coordinates or zero area are
// skipped and counted.
ContextSet buildContextSet(const std::vector<Mesh> &rawMeshes, bool verbose = false);

// Coarse visibility filter: drops items behind the window plane (with a
// half-diagonal tolerance), beyond the horizontal distance limit, or
// entirely below the window bottom.
std::vector<const ContextItem*> filterContextForWindow(const std::vector<ContextItem> &items,
                                                       const Point3 &windowCenter,
                                                       const Vector3 &windowNormal,
                                                       const BoundingBox &windowBox,
                                                       const ClassifierSettings &settings);

struct ContextCastStats {
    int raysCast    = 0;
    int raysBlocked = 0;
    std::vector<double> sampleMaxima;
    double weightedAverage = 0.0;
    double absoluteMaximum = 0.0;
};

// Aggregated elevation (degrees) up to which context blocks the sky:
// 0.7 * weighted average + 0.3 * maximum of the per-sample highest blocked
// elevations. 0 without context or without valid hits.
double castContextRays(const std::vector<SamplePoint> &samples,
                       const RayDirectionSet &directions,
                       const std::vector<const ContextItem*> &context,
                       const ClassifierSettings &settings,
                       ContextCastStats *stats = nullptr);

struct ShadingCastResult {
    double elevation = 90.0;
    double hoRatio   = 0.0;
    double hitDistance = 0.0;
    double projectionDepth = 0.0;
    int    hits = 0;
};

// Lowest elevation along the window normal at which the shading device is
// hit from the reference point. Elevation stays 90 without a device or
// without a valid hit.
ShadingCastResult castShadingRays(const BoundingBox &windowBox,
                                  const Vector3 &windowNormal,
                                  const MeshIntersector *shading,
                                  const ClassifierSettings &settings);

#endif
