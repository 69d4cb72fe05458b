#include "Mesh.hxx"
#include "GmshSession.hxx"
#include <gmsh.h>

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_map>

std::vector<std::size_t> Mesh::cell(std::size_t i) const {
    if (i >= numCells()) throw std::out_of_range("Mesh::cell: index out of range");
    return std::vector<std::size_t>(connectivity.begin() + static_cast<std::ptrdiff_t>(offsets[i]),
                                    connectivity.begin() + static_cast<std::ptrdiff_t>(offsets[i+1]));
}

void Mesh::addCell(int vtkType, const std::vector<std::size_t>& ids) {
    connectivity.insert(connectivity.end(), ids.begin(), ids.end());
    offsets.push_back(connectivity.size());
    cellTypes.push_back(vtkType);
}

std::size_t Mesh::cellTypeCount(int vtkType) const {
    return static_cast<std::size_t>(std::count(cellTypes.begin(), cellTypes.end(), vtkType));
}

std::size_t Mesh::numCellsOfDimension(int dim) const {
    std::size_t n = 0;
    for (int t : cellTypes) if (cellDimension(t) == dim) ++n;
    return n;
}

std::array<double,6> Mesh::bounds() const {
    if (points.empty()) return {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    const double inf = std::numeric_limits<double>::infinity();
    std::array<double,6> b{inf, -inf, inf, -inf, inf, -inf};
    for (const auto& p : points) {
        for (std::size_t d = 0; d < 3; ++d) {
            b[2*d] = std::min(b[2*d], p[d]);
            b[2*d+1] = std::max(b[2*d+1], p[d]);
        }
    }
    return b;
}

int Mesh::vtkCellTypeFromGmsh(int gmshType) {
    switch (gmshType) {
        case 15: return VTK_VERTEX;     // 1-node point
        case 1:  return VTK_LINE;       // 2-node line
        case 2:  return VTK_TRIANGLE;   // 3-node triangle
        case 3:  return VTK_QUAD;       // 4-node quadrangle
        case 4:  return VTK_TETRA;      // 4-node tetrahedron
        case 5:  return VTK_HEXAHEDRON; // 8-node hexahedron
        case 6:  return VTK_WEDGE;      // 6-node prism
        case 7:  return VTK_PYRAMID;    // 5-node pyramid
        default: return -1;
    }
}

int Mesh::cellDimension(int vtkType) {
    switch (vtkType) {
        case VTK_VERTEX: return 0;
        case VTK_LINE: return 1;
        case VTK_TRIANGLE:
        case VTK_QUAD: return 2;
        case VTK_TETRA:
        case VTK_HEXAHEDRON:
        case VTK_WEDGE:
        case VTK_PYRAMID: return 3;
        default: return -1;
    }
}

void Mesh::clearData() {
    pointData.clear();
    cellData.clear();
}

void Mesh::clear() {
    points.clear(); connectivity.clear(); offsets.assign(1, 0); cellTypes.clear();
    clearData();
}

static Mesh buildFromGmshImpl(int dim) {
    Mesh M;

    // All nodes of the model, in gmsh order
    std::vector<std::size_t> nodeTags;
    std::vector<double> nodeCoord;        // xyz per node
    std::vector<double> nodeCoordParam;   // unused parametric coords
    gmsh::model::mesh::getNodes(nodeTags, nodeCoord, nodeCoordParam, -1, -1, false, false);
    std::unordered_map<std::size_t, std::size_t> nodeTagToIndex;
    nodeTagToIndex.reserve(nodeTags.size());
    M.points.resize(nodeTags.size());
    for (std::size_t i = 0; i < nodeTags.size(); ++i) {
        nodeTagToIndex[nodeTags[i]] = i;
        M.points[i] = {nodeCoord[3*i], nodeCoord[3*i+1], nodeCoord[3*i+2]};
    }

    // Elements, entity by entity so each cell keeps its geometrical tag
    std::vector<double>& geomTag = M.cellData["gmsh:geometrical"];
    gmsh::vectorpair entities;
    gmsh::model::getEntities(entities, dim);
    for (const auto& ent : entities) {
        std::vector<int> elementTypes;
        std::vector<std::vector<std::size_t>> elementTags;
        std::vector<std::vector<std::size_t>> elemNodeTags;
        gmsh::model::mesh::getElements(elementTypes, elementTags, elemNodeTags, ent.first, ent.second);
        for (std::size_t t = 0; t < elementTypes.size(); ++t) {
            const int vtkType = Mesh::vtkCellTypeFromGmsh(elementTypes[t]);
            if (vtkType < 0) {
                throw std::runtime_error("Unsupported gmsh element type " + std::to_string(elementTypes[t]));
            }
            const std::size_t nElem = elementTags[t].size();
            if (nElem == 0) continue;
            const std::size_t nPer = elemNodeTags[t].size() / nElem;
            std::vector<std::size_t> ids(nPer);
            for (std::size_t k = 0; k < nElem; ++k) {
                for (std::size_t j = 0; j < nPer; ++j) {
                    auto it = nodeTagToIndex.find(elemNodeTags[t][k*nPer + j]);
                    if (it == nodeTagToIndex.end()) throw std::runtime_error("Element references unknown node tag");
                    ids[j] = it->second;
                }
                M.addCell(vtkType, ids);
                geomTag.push_back(static_cast<double>(ent.second));
            }
        }
    }
    return M;
}

Mesh Mesh::buildFromGmshCurrent(int dim) {
    return buildFromGmshImpl(dim);
}

Mesh Mesh::buildFromMshFile(const std::string& path, int dim) {
    if (!GmshSession::active()) throw std::logic_error("Mesh::buildFromMshFile requires an open GmshSession");
    gmsh::clear();
    gmsh::open(path);
    return buildFromGmshImpl(dim);
}

bool Mesh::writeVTK(const std::string& path) const {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs.precision(17);
    ofs << "# vtk DataFile Version 2.0\n";
    ofs << "edgemesh\n";
    ofs << "ASCII\n";
    ofs << "DATASET UNSTRUCTURED_GRID\n";
    ofs << "POINTS " << numPoints() << " double\n";
    for (const auto& p : points) ofs << p[0] << ' ' << p[1] << ' ' << p[2] << "\n";
    // leading count per cell
    ofs << "CELLS " << numCells() << ' ' << connectivity.size() + numCells() << "\n";
    for (std::size_t c = 0; c < numCells(); ++c) {
        ofs << offsets[c+1] - offsets[c];
        for (std::size_t k = offsets[c]; k < offsets[c+1]; ++k) ofs << ' ' << connectivity[k];
        ofs << "\n";
    }
    ofs << "CELL_TYPES " << numCells() << "\n";
    for (int t : cellTypes) ofs << t << "\n";
    if (!pointData.empty()) {
        ofs << "POINT_DATA " << numPoints() << "\n";
        for (const auto& kv : pointData) {
            ofs << "SCALARS " << kv.first << " double 1\n";
            ofs << "LOOKUP_TABLE default\n";
            for (double v : kv.second) ofs << v << "\n";
        }
    }
    if (!cellData.empty()) {
        ofs << "CELL_DATA " << numCells() << "\n";
        for (const auto& kv : cellData) {
            ofs << "SCALARS " << kv.first << " double 1\n";
            ofs << "LOOKUP_TABLE default\n";
            for (double v : kv.second) ofs << v << "\n";
        }
    }
    return static_cast<bool>(ofs);
}
