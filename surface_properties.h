#ifndef SURFACE_PROPERTIES_H
#define SURFACE_PROPERTIES_H

#include <vector>
#include <string>
#include <cmath>

struct Vector3 {
    double x, y, z;
    Vector3(double x_ = 0.0, double y_ = 0.0, double z_ = 0.0) : x(x_), y(y_), z(z_) {}
};

inline Vector3 operator-(const Vector3& a, const Vector3& b){
    return { a.x - b.x, a.y - b.y, a.z - b.z };
}
inline Vector3 operator+(const Vector3& a, const Vector3& b){
    return { a.x + b.x, a.y + b.y, a.z + b.z };
}
inline Vector3 operator*(const Vector3& a, double s){
    return { a.x * s, a.y * s, a.z * s };
}
inline double dot(const Vector3& a, const Vector3& b){
    return a.x*b.x + a.y*b.y + a.z*b.z;
}
inline Vector3 cross(const Vector3& a, const Vector3& b){
    return { a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x };
}
inline double length(const Vector3& a){
    return std::sqrt(dot(a,a));
}
inline Vector3 normalize(const Vector3& a){
    double l = length(a);
    if(l < 1e-14) return {0,0,0};
    return { a.x/l, a.y/l, a.z/l };
}
inline bool isFinite(const Vector3& a){
    return std::isfinite(a.x) && std::isfinite(a.y) && std::isfinite(a.z);
}

typedef Vector3 Point3;

struct Face {
    int v1, v2, v3;
};

// Indexed triangle mesh. Windows, shading devices and context buildings
// all arrive in this form; the engine never modifies a caller's mesh.
struct Mesh {
    std::vector<Vector3> vertices;
    std::vector<Face>    faces;

    int  addVertex(const Vector3 &v);
    void addTriangle(int a, int b, int c);
    // split as (a,b,c) + (a,c,d)
    void addQuad(int a, int b, int c, int d);
    bool empty() const { return vertices.empty() || faces.empty(); }
};

struct BoundingBox {
    Vector3 min;
    Vector3 max;

    Vector3 center() const {
        return { (min.x + max.x) * 0.5, (min.y + max.y) * 0.5, (min.z + max.z) * 0.5 };
    }
    Vector3 diagonal() const { return max - min; }
    double  height()   const { return max.z - min.z; }
};

struct MeshProperties {
    bool        valid = false;
    Vector3     center;
    Vector3     normal;
    BoundingBox bbox;
    double      totalArea = 0.0;
};

bool faceIsResolvable(const Mesh &mesh, const Face &fc);
double triangleArea(const Vector3 &a, const Vector3 &b, const Vector3 &c);

BoundingBox computeBoundingBox(const Mesh &mesh);

// Center (bounding-box center), area-weighted unit normal and bounding box.
// Returns properties with valid == false for a mesh without vertices, without
// resolvable triangles, or whose face normals cancel out.
MeshProperties computeMeshProperties(const Mesh &mesh);

void translateMesh(Mesh &mesh, const Vector3 &offset);

#endif
