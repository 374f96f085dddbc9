#include "ray_tracer.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

void AABB::expand(const Vector3 &p) {
    min.x = std::min(min.x, p.x);
    min.y = std::min(min.y, p.y);
    min.z = std::min(min.z, p.z);
    max.x = std::max(max.x, p.x);
    max.y = std::max(max.y, p.y);
    max.z = std::max(max.z, p.z);
}

bool AABB::intersect(const Ray &ray, double t_min, double t_max) const {
    const double eps = 1e-9;
    for (int i = 0; i < 3; i++) {
        double origin, dir, minVal, maxVal;
        if(i == 0){ origin = ray.origin.x; dir = ray.dir.x; minVal = min.x; maxVal = max.x; }
        else if(i == 1){ origin = ray.origin.y; dir = ray.dir.y; minVal = min.y; maxVal = max.y; }
        else { origin = ray.origin.z; dir = ray.dir.z; minVal = min.z; maxVal = max.z; }
        minVal -= eps;
        maxVal += eps;
        // parallel to this slab: inside or never
        if (std::fabs(dir) < 1e-14) {
            if (origin < minVal || origin > maxVal)
                return false;
            continue;
        }
        double invD = 1.0 / dir;
        double t0 = (minVal - origin) * invD;
        double t1 = (maxVal - origin) * invD;
        if(invD < 0) std::swap(t0, t1);
        t_min = std::max(t0, t_min);
        t_max = std::min(t1, t_max);
        // flat boxes (planar overhangs) give t_min == t_max
        if(t_max < t_min)
            return false;
    }
    return true;
}

double intersectTriangle(const Ray &ray, const Vector3 &v1, const Vector3 &v2, const Vector3 &v3) {
    Vector3 e1 = v2 - v1;
    Vector3 e2 = v3 - v1;
    Vector3 pvec = cross(ray.dir, e2);
    double det = dot(e1, pvec);
    if (std::fabs(det) < 1e-14) return -1.0;
    double invDet = 1.0 / det;
    Vector3 tvec = ray.origin - v1;
    double u = dot(tvec, pvec) * invDet;
    if (u < 0.0 || u > 1.0) return -1.0;
    Vector3 qvec = cross(tvec, e1);
    double v = dot(ray.dir, qvec) * invDet;
    if (v < 0.0 || (u+v) > 1.0) return -1.0;
    return dot(e2, qvec) * invDet;
}

static Vector3 faceCentroid(const Mesh &mesh, int faceIndex) {
    const Face &fc = mesh.faces[faceIndex];
    return (mesh.vertices[fc.v1] + mesh.vertices[fc.v2] + mesh.vertices[fc.v3]) * (1.0 / 3.0);
}

BVHNode* buildBVH(const Mesh &mesh, std::vector<int> &indices, int start, int end) {
    BVHNode* node = new BVHNode();
    int count = end - start;
    AABB box;
    for (int i = start; i < end; i++){
        const Face &fc = mesh.faces[indices[i]];
        box.expand(mesh.vertices[fc.v1]);
        box.expand(mesh.vertices[fc.v2]);
        box.expand(mesh.vertices[fc.v3]);
    }
    node->box = box;
    const int threshold = 4;
    if(count <= threshold) {
        node->faceIndices.assign(indices.begin() + start, indices.begin() + end);
        return node;
    }

    AABB centroidBox;
    for (int i = start; i < end; i++)
        centroidBox.expand(faceCentroid(mesh, indices[i]));
    Vector3 extent = centroidBox.max - centroidBox.min;
    int axis = (extent.y > extent.x && extent.y > extent.z) ? 1 : (extent.z > extent.x ? 2 : 0);
    auto key = [&mesh, axis](int faceIndex) {
        Vector3 c = faceCentroid(mesh, faceIndex);
        if(axis == 0) return c.x;
        if(axis == 1) return c.y;
        return c.z;
    };
    std::sort(indices.begin() + start, indices.begin() + end,
              [&key](int a, int b) { return key(a) < key(b); });
    int mid = start + count / 2;
    node->left = buildBVH(mesh, indices, start, mid);
    node->right = buildBVH(mesh, indices, mid, end);
    return node;
}

void deleteBVH(BVHNode* node) {
    if (!node) return;
    deleteBVH(node->left);
    deleteBVH(node->right);
    delete node;
}

MeshIntersector::MeshIntersector(const Mesh &mesh) : mesh_(mesh) {
    for (const auto &v : mesh_.vertices) {
        if (!isFinite(v))
            throw std::invalid_argument("mesh has a non-finite vertex coordinate");
    }
    for (size_t i = 0; i < mesh_.faces.size(); i++) {
        if (!faceIsResolvable(mesh_, mesh_.faces[i]))
            throw std::invalid_argument("mesh face " + std::to_string(i) + " references a missing vertex");
    }
    if (mesh_.faces.empty())
        return;
    std::vector<int> faceIndices(mesh_.faces.size());
    for (int i = 0; i < static_cast<int>(faceIndices.size()); i++)
        faceIndices[i] = i;
    root_ = buildBVH(mesh_, faceIndices, 0, static_cast<int>(faceIndices.size()));
}

MeshIntersector::~MeshIntersector() {
    deleteBVH(root_);
}

MeshIntersector::MeshIntersector(MeshIntersector &&other) noexcept
    : mesh_(std::move(other.mesh_)), root_(other.root_) {
    other.root_ = nullptr;
}

MeshIntersector& MeshIntersector::operator=(MeshIntersector &&other) noexcept {
    if (this != &other) {
        deleteBVH(root_);
        mesh_ = std::move(other.mesh_);
        root_ = other.root_;
        other.root_ = nullptr;
    }
    return *this;
}

const AABB& MeshIntersector::bounds() const {
    static const AABB emptyBox;
    return root_ ? root_->box : emptyBox;
}

void MeshIntersector::traverse(const BVHNode *node, const Ray &ray, double &closest_t) const {
    if (!node) return;
    if (!node->box.intersect(ray, 0.0, closest_t))
        return;
    if (node->left == nullptr && node->right == nullptr) {
        for (int idx : node->faceIndices) {
            const Face &fc = mesh_.faces[idx];
            double t = intersectTriangle(ray, mesh_.vertices[fc.v1], mesh_.vertices[fc.v2], mesh_.vertices[fc.v3]);
            if (t > 1e-9 && t < closest_t)
                closest_t = t;
        }
        return;
    }
    traverse(node->left, ray, closest_t);
    traverse(node->right, ray, closest_t);
}

double MeshIntersector::closestHit(const Ray &ray, double maxDistance) const {
    double closest_t = maxDistance;
    traverse(root_, ray, closest_t);
    return (closest_t < maxDistance) ? closest_t : -1.0;
}
