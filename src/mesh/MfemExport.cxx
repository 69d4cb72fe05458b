#include "MfemExport.hxx"
#include <mfem.hpp>

#include <cmath>
#include <stdexcept>

namespace MfemExport {

std::unique_ptr<mfem::Mesh> toMfemMesh(const Mesh& M) {
    const std::size_t ntet = M.cellTypeCount(Mesh::VTK_TETRA);
    const std::size_t ntri = M.cellTypeCount(Mesh::VTK_TRIANGLE);
    const int dim = ntet > 0 ? 3 : 2;
    const int keep = dim == 3 ? Mesh::VTK_TETRA : Mesh::VTK_TRIANGLE;
    const int nelems = static_cast<int>(dim == 3 ? ntet : ntri);
    if (nelems == 0) throw std::invalid_argument("toMfemMesh: mesh has no triangles or tetrahedra");

    bool planar = true;
    for (const auto& p : M.points) if (p[2] != 0.0) { planar = false; break; }
    const int spaceDim = (dim == 2 && planar) ? 2 : 3;

    const int nv = static_cast<int>(M.numPoints());
    auto m = std::make_unique<mfem::Mesh>(dim, nv, nelems, /*NBdr*/0, spaceDim);
    for (const auto& p : M.points) m->AddVertex(p[0], p[1], p[2]);
    for (std::size_t c = 0; c < M.numCells(); ++c) {
        if (M.cellTypes[c] != keep) continue;
        int vi[4];
        for (std::size_t k = M.offsets[c]; k < M.offsets[c+1]; ++k) {
            vi[k - M.offsets[c]] = static_cast<int>(M.connectivity[k]);
        }
        if (dim == 3) m->AddTet(vi, /*attr*/1);
        else m->AddTriangle(vi, /*attr*/1);
    }
    if (dim == 3) m->FinalizeTetMesh(/*generate_edges*/1, /*refine*/0, /*fix_orientation*/true);
    else m->FinalizeTriMesh(/*generate_edges*/1, /*refine*/0, /*fix_orientation*/true);
    return m;
}

double measure(mfem::Mesh& m) {
    double total = 0.0;
    for (int e = 0; e < m.GetNE(); ++e) total += std::fabs(m.GetElementVolume(e));
    return total;
}

} // namespace MfemExport
