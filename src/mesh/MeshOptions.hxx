#ifndef EDGEMESH_MESH_OPTIONS_HXX
#define EDGEMESH_MESH_OPTIONS_HXX

#include "Boundary.hxx"
#include <optional>
#include <string>

// 2D strategies, values are gmsh "Mesh.Algorithm" codes
enum class Algorithm2D {
    MeshAdapt = 1,
    Automatic = 2,
    Delaunay = 5,
    FrontalDelaunay = 6,
    BAMG = 7,
    FrontalDelaunayQuads = 8,
    PackingParallelograms = 9
};

// 3D strategies, values are gmsh "Mesh.Algorithm3D" codes
enum class Algorithm3D {
    Delaunay = 1,
    Frontal = 4,
    HXT = 10
};

// How the generated mesh is read back from gmsh
enum class Extraction {
    InMemory,
    File
};

struct MeshOptions {
    std::optional<double> targetSize;       // default: largest bounding box extent
    Algorithm2D algorithm = Algorithm2D::FrontalDelaunay;
    Algorithm3D algorithm3D = Algorithm3D::Delaunay;
    int dimension = 2;
    Extraction extraction = Extraction::InMemory;
    int verbosity = 0;                      // gmsh General.Verbosity
    std::string modelName = "edgemesh";
    std::optional<SolidTopology> solid;     // 3D only; default: all loops bound one volume

    bool validate(std::string* errorMessage = nullptr) const;
};

bool algorithm2DFromName(const std::string& name, Algorithm2D& out);
bool algorithm3DFromName(const std::string& name, Algorithm3D& out);
bool extractionFromName(const std::string& name, Extraction& out);

std::string algorithm2DName(Algorithm2D a);
std::string algorithm3DName(Algorithm3D a);
std::string extractionName(Extraction e);

#endif // EDGEMESH_MESH_OPTIONS_HXX
