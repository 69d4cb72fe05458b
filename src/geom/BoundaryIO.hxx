#ifndef EDGEMESH_BOUNDARY_IO_HXX
#define EDGEMESH_BOUNDARY_IO_HXX

#include "Boundary.hxx"
#include "MeshOptions.hxx"
#include <string>

namespace BoundaryIO {
// Boundary text format (.bnd, v1):
// * edgemesh boundary v1
// point <x> <y> <z>
// loop <i0> <i1> ... <ik>          # 0-based point indices, implicitly closed
// target_size <h>                  # optional, omitted -> largest extent
// algorithm <name>                 # optional, 2D algorithm (e.g. frontal-delaunay)
// algorithm3d <name>               # optional
// dimension <2|3>                  # optional
// extraction <memory|file>         # optional
// shell <loop> <loop> ...          # optional, 3D surface loop over loop indices
// volume <shell> <shell> ...       # optional, 3D volume over shell indices
// end
// Lines starting with '*' are comments; text after '#' is ignored.
bool readFile(const std::string& path,
              Boundary& outBoundary,
              MeshOptions& outOptions,
              std::string* errorMessage = nullptr);

bool writeFile(const std::string& path,
               const Boundary& boundary,
               const MeshOptions& options,
               std::string* errorMessage = nullptr);
}

#endif // EDGEMESH_BOUNDARY_IO_HXX
