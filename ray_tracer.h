#ifndef RAY_TRACER_H
#define RAY_TRACER_H

#include <vector>

#include "surface_properties.h"

struct Ray {
    Vector3 origin;
    Vector3 dir;
};

struct AABB {
    Vector3 min;
    Vector3 max;
    AABB() {
        min = { 1e30, 1e30, 1e30 };
        max = { -1e30, -1e30, -1e30 };
    }
    void expand(const Vector3 &p);
    bool intersect(const Ray &ray, double t_min, double t_max) const;
};

struct BVHNode {
    AABB box;
    BVHNode *left = nullptr;
    BVHNode *right = nullptr;
    std::vector<int> faceIndices;
};

// Bounding volume hierarchy over the triangles of one mesh. Owns a copy of the
// mesh so it can outlive the caller's geometry.
class MeshIntersector {
public:
    // Throws std::invalid_argument for out-of-range indices or non-finite
    // vertex coordinates.
    explicit MeshIntersector(const Mesh &mesh);
    ~MeshIntersector();

    MeshIntersector(const MeshIntersector&) = delete;
    MeshIntersector& operator=(const MeshIntersector&) = delete;
    MeshIntersector(MeshIntersector &&other) noexcept;
    MeshIntersector& operator=(MeshIntersector &&other) noexcept;

    // Distance to the nearest hit in (1e-9, maxDistance), or -1.0 when the ray
    // misses. ray.dir must be unit length for the result to be a distance.
    double closestHit(const Ray &ray, double maxDistance = 1e30) const;

    int triangleCount() const { return static_cast<int>(mesh_.faces.size()); }
    const AABB& bounds() const;

private:
    void     traverse(const BVHNode *node, const Ray &ray, double &closest_t) const;

    Mesh     mesh_;
    BVHNode *root_ = nullptr;
};

BVHNode* buildBVH(const Mesh &mesh, std::vector<int> &indices, int start, int end);
void deleteBVH(BVHNode* node);

// Moller-Trumbore. Returns the ray parameter of the hit or -1.0.
double intersectTriangle(const Ray &ray, const Vector3 &v1, const Vector3 &v2, const Vector3 &v3);

#endif
