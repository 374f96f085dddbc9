#define _USE_MATH_DEFINES

#include "sky_sampling.h"

#include <algorithm>
#include <cmath>

static const Vector3 WORLD_UP = { 0.0, 0.0, 1.0 };

static double toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

Vector3 horizontalRight(const Vector3 &normal, const Vector3 &fallback) {
    Vector3 right = cross(normal, WORLD_UP);
    if (length(right) < 1e-3)
        right = fallback;
    return normalize(right);
}

std::vector<SamplePoint> generateSamplePoints(const BoundingBox &bbox,
                                              const Vector3 &normal,
                                              const ClassifierSettings &settings)
{
    const double cx = (bbox.min.x + bbox.max.x) / 2.0;
    const double cy = (bbox.min.y + bbox.max.y) / 2.0;

    Vector3 right = horizontalRight(normal, Vector3{1, 0, 0});

    double width = std::max(bbox.max.x - bbox.min.x, bbox.max.y - bbox.min.y);
    double offset = width * settings.lateralOffsetFraction;

    double zBottom = bbox.min.z + settings.sampleInset;
    double zMid    = (bbox.min.z + bbox.max.z) / 2.0;
    double zTop    = bbox.max.z - settings.sampleInset;

    return {
        { { cx - right.x * offset, cy - right.y * offset, zBottom }, 1.5 },
        { { cx, cy, zBottom }, 2.0 },
        { { cx + right.x * offset, cy + right.y * offset, zBottom }, 1.5 },
        { { cx, cy, zMid }, 1.0 },
        { { cx, cy, zTop }, 0.5 },
    };
}

Point3 referencePoint(const BoundingBox &bbox, const ClassifierSettings &settings) {
    return { (bbox.min.x + bbox.max.x) / 2.0,
             (bbox.min.y + bbox.max.y) / 2.0,
             bbox.min.z + settings.sampleInset };
}

std::vector<double> azimuthOffsets(const ClassifierSettings &settings) {
    std::vector<double> offsets;
    if (settings.azimuthSteps <= 1) {
        offsets.push_back(0.0);
        return offsets;
    }
    const double spread = settings.azimuthSpread;
    for (int i = 0; i < settings.azimuthSteps; i++)
        offsets.push_back(-spread + 2.0 * spread * i / (settings.azimuthSteps - 1));
    return offsets;
}

RayDirectionSet generateRayDirections(const Vector3 &normal, const ClassifierSettings &settings) {
    Vector3 forward = normalize(normal);
    Vector3 right = horizontalRight(forward, Vector3{0, 1, 0});
    std::vector<double> hAngles = azimuthOffsets(settings);

    RayDirectionSet directions;
    directions.reserve(settings.elevationAngles.size() * hAngles.size());
    for (double vAngle : settings.elevationAngles) {
        double vRad = toRadians(vAngle);
        for (double hAngle : hAngles) {
            double hRad = toRadians(hAngle);
            Vector3 hDir = normalize(forward * std::cos(hRad) + right * std::sin(hRad));
            Vector3 dir  = normalize(hDir * std::cos(vRad) + WORLD_UP * std::sin(vRad));
            directions.push_back({ dir, vAngle, hAngle });
        }
    }
    return directions;
}

RayDirectionCache::RayDirectionCache(const ClassifierSettings &settings)
    : settings_(settings),
      scale_(std::pow(10.0, settings.normalKeyDecimals))
{
}

RayDirectionCache::Key RayDirectionCache::keyFor(const Vector3 &normal) const {
    return { static_cast<std::int64_t>(std::llround(normal.x * scale_)),
             static_cast<std::int64_t>(std::llround(normal.y * scale_)),
             static_cast<std::int64_t>(std::llround(normal.z * scale_)) };
}

std::shared_ptr<const RayDirectionSet> RayDirectionCache::get(const Vector3 &normal) {
    Key key = keyFor(normal);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sets_.find(key);
    if (it != sets_.end())
        return it->second;

    Vector3 representative = normalize(Vector3{ key[0] / scale_, key[1] / scale_, key[2] / scale_ });
    if (length(representative) < 0.5)
        representative = normalize(normal);
    auto set = std::make_shared<const RayDirectionSet>(generateRayDirections(representative, settings_));
    sets_.emplace(key, set);
    return set;
}

void RayDirectionCache::prewarm(const std::vector<Vector3> &normals) {
    for (const auto &n : normals)
        get(n);
}

size_t RayDirectionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sets_.size();
}

void RayDirectionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sets_.clear();
}
