#ifndef EDGEMESH_MESH_HXX
#define EDGEMESH_MESH_HXX

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Unstructured grid container: points plus mixed cells tagged with VTK cell type codes.
// All members are public for direct access, cells are stored flat (connectivity + offsets).
class Mesh {
public:
    // VTK cell type codes used by this container
    enum CellType {
        VTK_VERTEX = 1,
        VTK_LINE = 3,
        VTK_TRIANGLE = 5,
        VTK_QUAD = 9,
        VTK_TETRA = 10,
        VTK_HEXAHEDRON = 12,
        VTK_WEDGE = 13,
        VTK_PYRAMID = 14
    };

    std::vector<std::array<double,3>> points;

    std::vector<std::size_t> connectivity;   // point indices of all cells, concatenated
    std::vector<std::size_t> offsets{0};     // cell i spans connectivity[offsets[i], offsets[i+1])
    std::vector<int>         cellTypes;      // VTK code per cell

    // Auxiliary per-point / per-cell arrays (not part of raw geometry)
    std::map<std::string, std::vector<double>> pointData;
    std::map<std::string, std::vector<double>> cellData;

    std::size_t numPoints() const { return points.size(); }
    std::size_t numCells() const { return cellTypes.size(); }

    std::vector<std::size_t> cell(std::size_t i) const;
    void addCell(int vtkType, const std::vector<std::size_t>& ids);
    std::size_t cellTypeCount(int vtkType) const;
    // number of cells whose topological dimension is dim
    std::size_t numCellsOfDimension(int dim) const;

    // xmin, xmax, ymin, ymax, zmin, zmax over all points
    std::array<double,6> bounds() const;

    // Build from the current gmsh model (model synchronized, mesh generated).
    // Elements of dimension dim are extracted (all dimensions if dim < 0); every node is kept.
    // Throws std::runtime_error on element types without a VTK counterpart.
    static Mesh buildFromGmshCurrent(int dim = -1);

    // Load a .msh file into the open gmsh session (replacing its model) and extract it.
    // Throws std::logic_error if no GmshSession is active.
    static Mesh buildFromMshFile(const std::string& path, int dim = -1);

    // gmsh element type -> VTK cell type, -1 if unsupported
    static int vtkCellTypeFromGmsh(int gmshType);
    // topological dimension of a VTK cell type, -1 if unknown
    static int cellDimension(int vtkType);

    // Write legacy ASCII VTK unstructured grid including data arrays.
    bool writeVTK(const std::string& path) const;

    // Drop point and cell data arrays, keep geometry
    void clearData();

    // Clear all data
    void clear();
};

#endif // EDGEMESH_MESH_HXX
