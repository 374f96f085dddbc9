#include "geometry_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <new>
#include <sstream>

bool loadASCIISTL(std::istream &ifs, Mesh &mesh)
{
    mesh.vertices.clear(); mesh.faces.clear();
    std::string line; bool inFacet = false;
    std::vector<Vector3> facetVerts;

    auto trim = [](std::string &s){
        while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
        while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.pop_back();
    };

    while (std::getline(ifs, line)) {
        std::string lower = line;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c){ return std::tolower(c); });
        trim(lower);

        if (lower.rfind("facet normal", 0) == 0) {
            inFacet = true; facetVerts.clear();
        }
        else if (lower.rfind("vertex", 0) == 0 && inFacet) {
            Vector3 v; std::istringstream iss(lower); std::string tmp;
            if (!(iss >> tmp >> v.x >> v.y >> v.z)) {
                std::cerr << "[Loader] Malformed vertex line: " << line << '\n';
                return false;
            }
            facetVerts.push_back(v);
        }
        else if (lower.rfind("endfacet", 0) == 0 && inFacet) {
            inFacet = false;
            if (facetVerts.size() == 3) {
                int a = mesh.addVertex(facetVerts[0]);
                int b = mesh.addVertex(facetVerts[1]);
                int c = mesh.addVertex(facetVerts[2]);
                mesh.addTriangle(a, b, c);
            }
        }
    }
    return !mesh.faces.empty();
}

static constexpr std::uint32_t MAX_TRIANGLES = 12'000'000;

static bool isBinarySTL(std::istream &ifs, std::uint64_t fileSize,
                        std::uint32_t &triCountOut)
{
    if (fileSize < 84) return false;

    ifs.seekg(80, std::ios::beg);
    std::uint32_t nHeader = 0;
    ifs.read(reinterpret_cast<char*>(&nHeader), 4);
    if (!ifs) { ifs.clear(); return false; }

    const std::uint64_t bytesAfter = fileSize - 84;
    const bool ok       = (bytesAfter % 50ull) == 0ull &&
                          (bytesAfter / 50ull) == nHeader;

    if (ok && nHeader != 0 && nHeader <= MAX_TRIANGLES) {
        triCountOut = nHeader;
        return true;
    }
    return false;
}

bool loadBinarySTL(std::istream &ifs, std::uint32_t triCount, Mesh &mesh)
{
    try {
        mesh.vertices.clear();  mesh.faces.clear();
        mesh.vertices.reserve(static_cast<std::size_t>(triCount) * 3u);
        mesh.faces.reserve   (static_cast<std::size_t>(triCount));
    } catch (const std::bad_alloc&) {
        std::cerr << "[Loader] File contains " << triCount
                  << " triangles, insufficient memory.\n";
        return false;
    }

    for (std::uint32_t i = 0; i < triCount; ++i)
    {
        float n[3], v[9];  std::uint16_t attr;
        ifs.read(reinterpret_cast<char*>(n), 12);
        ifs.read(reinterpret_cast<char*>(v), 36);
        ifs.read(reinterpret_cast<char*>(&attr), 2);
        if (!ifs) {
            std::cerr << "[Loader] Unexpected end of file at triangle "
                      << i << ".\n";
            return false;
        }

        int a = mesh.addVertex(Vector3{v[0], v[1], v[2]});
        int b = mesh.addVertex(Vector3{v[3], v[4], v[5]});
        int c = mesh.addVertex(Vector3{v[6], v[7], v[8]});
        mesh.addTriangle(a, b, c);
    }
    return true;
}

bool loadSTL(const std::string &filename, Mesh &mesh)
{
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs) {
        std::cerr << "[Loader] Cannot open file " << filename << '\n';
        return false;
    }

    ifs.seekg(0, std::ios::end);
    const std::uint64_t fileSize = static_cast<std::uint64_t>(ifs.tellg());
    ifs.seekg(0, std::ios::beg);

    std::uint32_t triCount = 0;
    const bool binary = isBinarySTL(ifs, fileSize, triCount);

    bool ok;
    if (binary) {
        ifs.seekg(84, std::ios::beg);
        ok = loadBinarySTL(ifs, triCount, mesh);
    } else {
        ifs.clear();
        ifs.seekg(0, std::ios::beg);
        ok = loadASCIISTL(ifs, mesh);
    }
    if (!ok)
        std::cerr << "[Loader] No usable facets in " << filename << '\n';
    return ok;
}
