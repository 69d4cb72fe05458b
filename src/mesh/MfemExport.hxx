#ifndef EDGEMESH_MFEM_EXPORT_HXX
#define EDGEMESH_MFEM_EXPORT_HXX

#include "Mesh.hxx"
#include <memory>

namespace mfem { class Mesh; }

namespace MfemExport {

// Build an mfem::Mesh from the triangles (or, if present, tetrahedra) of M.
// Lower dimensional cells are skipped. Space dimension is 2 when every point has z == 0.
// Throws std::invalid_argument if M has neither triangles nor tetrahedra.
std::unique_ptr<mfem::Mesh> toMfemMesh(const Mesh& M);

// Sum of element areas (2D) or volumes (3D).
double measure(mfem::Mesh& m);

} // namespace MfemExport

#endif // EDGEMESH_MFEM_EXPORT_HXX
