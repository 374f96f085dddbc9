#ifndef GEOMETRY_LOADER_H
#define GEOMETRY_LOADER_H

#include <cstdint>
#include <istream>
#include <string>

#include "surface_properties.h"

// ASCII or binary STL. Facet winding is kept as written; stored facet
// normals are ignored.
bool loadSTL(const std::string &filename, Mesh &mesh);

bool loadASCIISTL(std::istream &ifs, Mesh &mesh);
bool loadBinarySTL(std::istream &ifs, std::uint32_t triCount, Mesh &mesh);

#endif
