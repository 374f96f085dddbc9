#include "surface_properties.h"

#include <cmath>
#include <algorithm>
#include <limits>

int Mesh::addVertex(const Vector3 &v) {
    vertices.push_back(v);
    return static_cast<int>(vertices.size()) - 1;
}

void Mesh::addTriangle(int a, int b, int c) {
    faces.push_back({a, b, c});
}

void Mesh::addQuad(int a, int b, int c, int d) {
    faces.push_back({a, b, c});
    faces.push_back({a, c, d});
}

bool faceIsResolvable(const Mesh &mesh, const Face &fc) {
    const int n = static_cast<int>(mesh.vertices.size());
    return fc.v1 >= 0 && fc.v1 < n &&
           fc.v2 >= 0 && fc.v2 < n &&
           fc.v3 >= 0 && fc.v3 < n;
}

double triangleArea(const Vector3 &a, const Vector3 &b, const Vector3 &c) {
    return 0.5 * length(cross(b - a, c - a));
}

BoundingBox computeBoundingBox(const Mesh &mesh) {
    BoundingBox box;
    if (mesh.vertices.empty())
        return box;
    const double inf = std::numeric_limits<double>::infinity();
    box.min = { inf, inf, inf };
    box.max = { -inf, -inf, -inf };
    for (const auto &v : mesh.vertices) {
        box.min.x = std::min(box.min.x, v.x);
        box.min.y = std::min(box.min.y, v.y);
        box.min.z = std::min(box.min.z, v.z);
        box.max.x = std::max(box.max.x, v.x);
        box.max.y = std::max(box.max.y, v.y);
        box.max.z = std::max(box.max.z, v.z);
    }
    return box;
}

MeshProperties computeMeshProperties(const Mesh &mesh) {
    MeshProperties props;
    if (mesh.vertices.empty() || mesh.faces.empty())
        return props;

    Vector3 accumulated{0, 0, 0};
    double totalArea = 0.0;
    int resolved = 0;

    for (const auto &fc : mesh.faces) {
        if (!faceIsResolvable(mesh, fc))
            continue;
        const Vector3 &A = mesh.vertices[fc.v1];
        const Vector3 &B = mesh.vertices[fc.v2];
        const Vector3 &C = mesh.vertices[fc.v3];
        if (!isFinite(A) || !isFinite(B) || !isFinite(C))
            continue;
        ++resolved;

        // |n| is twice the triangle area, so the unit face normal weighted by
        // area is n / 2.
        Vector3 n = cross(B - A, C - A);
        double ln = length(n);
        if (ln < 1e-14)
            continue;
        double area = 0.5 * ln;
        accumulated = accumulated + normalize(n) * area;
        totalArea += area;
    }

    if (resolved == 0 || totalArea <= 0.0)
        return props;

    accumulated = accumulated * (1.0 / totalArea);
    Vector3 unit = normalize(accumulated);
    if (length(unit) < 0.5)
        return props;

    props.bbox      = computeBoundingBox(mesh);
    props.center    = props.bbox.center();
    props.normal    = unit;
    props.totalArea = totalArea;
    props.valid     = isFinite(props.center);
    return props;
}

void translateMesh(Mesh &mesh, const Vector3 &offset) {
    for (auto &v : mesh.vertices) {
        v.x += offset.x;
        v.y += offset.y;
        v.z += offset.z;
    }
}
