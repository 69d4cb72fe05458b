#include "BoundaryIO.hxx"
#include "MeshGenerator.hxx"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

static std::string replaceExt(const std::string& path, const std::string& newExt) {
    auto slash = path.find_last_of('/');
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos || (slash != std::string::npos && pos < slash)) return path + newExt;
    return path.substr(0, pos) + newExt;
}

int main(int argc, char** argv) {
    if (argc < 2 || argc > 4) {
        std::fprintf(stderr, "Usage: %s <boundary.bnd> [target_h|auto] [out.vtk|out.msh]\n", argv[0]);
        return 2;
    }
    const std::string bndPath = argv[1];
    const std::string outPath = (argc >= 4) ? argv[3] : replaceExt(bndPath, ".vtk");

    Boundary boundary;
    MeshOptions options;
    std::string err;
    if (!BoundaryIO::readFile(bndPath, boundary, options, &err)) {
        std::fprintf(stderr, "Failed to read boundary %s: %s\n", bndPath.c_str(), err.c_str());
        return 1;
    }

    if (argc >= 3 && std::string(argv[2]) != "auto") {
        char* end = nullptr;
        const double h = std::strtod(argv[2], &end);
        if (end == argv[2] || *end != '\0' || !(h > 0.0)) {
            std::fprintf(stderr, "Invalid target size '%s'\n", argv[2]);
            return 2;
        }
        options.targetSize = h;
    }

    try {
        const double h = MeshGenerator::resolveTargetSize(boundary, options.targetSize);
        std::printf("Meshing %s: %zu points, %zu loops, %dD, h = %g (%s)\n",
                    bndPath.c_str(), boundary.numPoints(), boundary.numLoops(),
                    options.dimension, h, algorithm2DName(options.algorithm).c_str());
        Mesh M = MeshGenerator::generate(boundary, options, outPath);
        std::printf("Wrote mesh: %s (%zu points, %zu cells)\n", outPath.c_str(), M.numPoints(), M.numCells());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Mesh generation failed: %s\n", e.what());
        return 1;
    }
    return 0;
}
