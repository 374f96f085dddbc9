#ifndef SKY_SAMPLING_H
#define SKY_SAMPLING_H

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "surface_properties.h"
#include "classifier_settings.h"

struct SamplePoint {
    Point3 position;
    double weight;
};

struct RayDirection {
    Vector3 dir;
    double  elevation;
    double  azimuth;
};

typedef std::vector<RayDirection> RayDirectionSet;

// In-plane horizontal axis normal x up, unitized; falls back to `fallback`
// when the normal is (nearly) vertical.
Vector3 horizontalRight(const Vector3 &normal, const Vector3 &fallback);

// Five weighted points: bottom-left, bottom-centre, bottom-right, middle, top.
// The bottom-centre point is the reference point of the standard.
std::vector<SamplePoint> generateSamplePoints(const BoundingBox &bbox,
                                              const Vector3 &normal,
                                              const ClassifierSettings &settings);

Point3 referencePoint(const BoundingBox &bbox, const ClassifierSettings &settings);

std::vector<double> azimuthOffsets(const ClassifierSettings &settings);

// elevation-major fan: for every elevation, every azimuth offset
RayDirectionSet generateRayDirections(const Vector3 &normal, const ClassifierSettings &settings);

// Memoizes ray fans per quantized normal. Each set is built from the
// de-quantized key itself, so the cached value does not depend on which
// window asked first.
class RayDirectionCache {
public:
    typedef std::array<std::int64_t, 3> Key;

    explicit RayDirectionCache(const ClassifierSettings &settings);

    std::shared_ptr<const RayDirectionSet> get(const Vector3 &normal);
    void prewarm(const std::vector<Vector3> &normals);

    Key    keyFor(const Vector3 &normal) const;
    size_t size() const;
    void   clear();

private:
    ClassifierSettings settings_;
    double             scale_;
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<const RayDirectionSet>> sets_;
};

#endif
