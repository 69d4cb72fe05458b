#ifndef EDGEMESH_MESH_GENERATOR_HXX
#define EDGEMESH_MESH_GENERATOR_HXX

#include "Boundary.hxx"
#include "Mesh.hxx"
#include "MeshOptions.hxx"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when gmsh returns without producing elements of the requested dimension.
class MeshingError : public std::runtime_error {
public:
    explicit MeshingError(const std::string& what) : std::runtime_error(what) {}
};

// gmsh GEO entity tags created for one boundary
struct BoundaryEntities {
    std::vector<int> pointTags;       // one per boundary point, = index + 1
    std::vector<int> lineTags;        // unique lines, in creation order
    std::vector<std::vector<int>> loopCurves; // signed line tags per curve loop
    std::vector<int> curveLoopTags;
    std::vector<int> surfaceTags;
    std::vector<int> surfaceLoopTags;
    std::vector<int> volumeTags;
};

class MeshGenerator {
public:
    // Mesh the boundary with gmsh and return every generated cell (vertices, lines,
    // surface and, in 3D, volume elements) over all mesh nodes.
    // A GmshSession is held for the whole call and torn down on every exit path.
    // Throws std::invalid_argument for bad options, std::out_of_range for bad loop
    // indices, MeshingError for an empty result; gmsh errors propagate as raised.
    static Mesh generate(const Boundary& boundary, const MeshOptions& options = MeshOptions());

    // Same, and write the result to outPath (.msh through gmsh, .vtk through Mesh::writeVTK).
    static Mesh generate(const Boundary& boundary, const MeshOptions& options, const std::string& outPath);

    // 2D frontal-Delaunay triangulation of the boundary's loops.
    static Mesh frontalDelaunay2D(const Boundary& boundary, std::optional<double> targetSize = std::nullopt);

    // Given size, or the largest axis extent of the boundary. Throws if not > 0.
    static double resolveTargetSize(const Boundary& boundary, std::optional<double> targetSize);

    // Register points, lines, curve loops, surfaces (and for dimension 3 surface loops
    // and volumes) in the current gmsh model. Requires an open GmshSession; the caller
    // synchronizes.
    static BoundaryEntities addBoundaryEntities(const Boundary& boundary, double size, int dimension,
                                                const SolidTopology* solid = nullptr);

private:
    static Mesh run(const Boundary& boundary, const MeshOptions& options, const std::string* mshOut);
};

#endif // EDGEMESH_MESH_GENERATOR_HXX
