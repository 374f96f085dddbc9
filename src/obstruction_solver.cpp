#define _USE_MATH_DEFINES

#include "obstruction_solver.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

static const Vector3 WORLD_UP = { 0.0, 0.0, 1.0 };

static bool contextMeshUsable(const Mesh &mesh, std::string &reason) {
    if (mesh.vertices.empty()) { reason = "no vertices"; return false; }
    if (mesh.faces.empty())    { reason = "no triangles"; return false; }
    for (const auto &v : mesh.vertices) {
        if (!isFinite(v)) { reason = "non-finite coordinate"; return false; }
    }
    double area = 0.0;
    for (const auto &fc : mesh.faces) {
        if (!faceIsResolvable(mesh, fc)) { reason = "triangle index out of range"; return false; }
        area += triangleArea(mesh.vertices[fc.v1], mesh.vertices[fc.v2], mesh.vertices[fc.v3]);
    }
    if (area <= 0.0) { reason = "zero surface area"; return false; }
    return true;
}

ContextSet buildContextSet(const std::vector<Mesh> &rawMeshes, bool verbose) {
    ContextSet set;
    set.items.reserve(rawMeshes.size());
    for (int i = 0; i < static_cast<int>(rawMeshes.size()); i++) {
        const Mesh &mesh = rawMeshes[i];
        std::string reason;
        if (!contextMeshUsable(mesh, reason)) {
            std::cerr << "[Context] Warning: skipping context item " << i << " (" << reason << ")\n";
            set.skipped++;
            continue;
        }
        ContextItem item;
        item.bbox        = computeBoundingBox(mesh);
        item.sourceIndex = i;
        item.intersector = std::make_shared<const MeshIntersector>(mesh);
        set.items.push_back(std::move(item));
    }
    if (verbose || set.skipped > 0) {
        std::cout << "[Context] " << set.items.size() << "/" << rawMeshes.size()
                  << " context items prepared (" << set.skipped << " skipped).\n";
    }
    return set;
}

std::vector<const ContextItem*> filterContextForWindow(const std::vector<ContextItem> &items,
                                                       const Point3 &windowCenter,
                                                       const Vector3 &windowNormal,
                                                       const BoundingBox &windowBox,
                                                       const ClassifierSettings &settings)
{
    std::vector<const ContextItem*> relevant;
    const double windowBottom = windowBox.min.z;
    const double maxDistSq = settings.maxContextDistance * settings.maxContextDistance;

    for (const auto &item : items) {
        Vector3 c = item.bbox.center();
        double toX = c.x - windowCenter.x;
        double toY = c.y - windowCenter.y;

        // horizontal plane only
        double facing = toX * windowNormal.x + toY * windowNormal.y;
        double halfDiagonal = length(item.bbox.diagonal()) * 0.5;
        if (facing < -halfDiagonal)
            continue;

        if (toX * toX + toY * toY > maxDistSq)
            continue;

        if (item.bbox.max.z < windowBottom)
            continue;

        relevant.push_back(&item);
    }
    return relevant;
}

static double nearestContextHit(const Ray &ray, const std::vector<const ContextItem*> &context) {
    double best = -1.0;
    double limit = 1e30;
    for (const ContextItem *item : context) {
        double t = item->intersector->closestHit(ray, limit);
        if (t > 0.0) {
            best = t;
            limit = t;
        }
    }
    return best;
}

double castContextRays(const std::vector<SamplePoint> &samples,
                       const RayDirectionSet &directions,
                       const std::vector<const ContextItem*> &context,
                       const ClassifierSettings &settings,
                       ContextCastStats *stats)
{
    if (context.empty() || samples.empty())
        return 0.0;

    std::vector<double> sampleMaxima;
    sampleMaxima.reserve(samples.size());
    int raysCast = 0, raysBlocked = 0;

    for (const auto &sample : samples) {
        double sampleMax = 0.0;
        for (const auto &rd : directions) {
            Ray ray{ sample.position, rd.dir };
            double t = nearestContextHit(ray, context);
            raysCast++;
            if (t >= settings.minRayDistance && t < settings.maxContextDistance) {
                raysBlocked++;
                if (rd.elevation > sampleMax)
                    sampleMax = rd.elevation;
            }
        }
        sampleMaxima.push_back(sampleMax);
    }

    double totalWeight = 0.0, weightedSum = 0.0, absoluteMax = 0.0;
    for (size_t i = 0; i < samples.size(); i++) {
        totalWeight += samples[i].weight;
        weightedSum += samples[i].weight * sampleMaxima[i];
        absoluteMax = std::max(absoluteMax, sampleMaxima[i]);
    }

    double finalAngle = 0.0;
    double weightedAvg = 0.0;
    if (totalWeight > 0.0) {
        weightedAvg = weightedSum / totalWeight;
        finalAngle = settings.weightedAverageShare * weightedAvg +
                     settings.absoluteMaximumShare * absoluteMax;
    }

    if (stats) {
        stats->raysCast        = raysCast;
        stats->raysBlocked     = raysBlocked;
        stats->sampleMaxima    = sampleMaxima;
        stats->weightedAverage = weightedAvg;
        stats->absoluteMaximum = absoluteMax;
    }
    return finalAngle;
}

ShadingCastResult castShadingRays(const BoundingBox &windowBox,
                                  const Vector3 &windowNormal,
                                  const MeshIntersector *shading,
                                  const ClassifierSettings &settings)
{
    ShadingCastResult result;
    if (!shading)
        return result;

    const double windowHeight = windowBox.height();
    const Point3 ref = referencePoint(windowBox, settings);
    const Vector3 forward = normalize(windowNormal);

    for (double elevation : settings.shadingElevations) {
        double vRad = elevation * M_PI / 180.0;
        Vector3 dir = normalize(forward * std::cos(vRad) + WORLD_UP * std::sin(vRad));
        double t = shading->closestHit(Ray{ ref, dir });
        if (!std::isfinite(t))
            throw std::runtime_error("non-finite shading intersection distance");
        if (t >= settings.minRayDistance && t < settings.maxShadingDistance) {
            result.hits++;
            if (elevation < result.elevation) {
                result.elevation = elevation;
                result.hitDistance = t;
            }
        }
    }

    if (result.elevation < 90.0) {
        result.projectionDepth = result.hitDistance * std::cos(result.elevation * M_PI / 180.0);
        result.hoRatio = windowHeight > 0.0 ? result.projectionDepth / windowHeight : 0.0;
    }
    return result;
}
