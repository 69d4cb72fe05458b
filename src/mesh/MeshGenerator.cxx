#include "MeshGenerator.hxx"
#include "GmshSession.hxx"
#include "ScopedTempFile.hxx"
#include "TagMap.hxx"
#include <gmsh.h>

#include <map>
#include <utility>

namespace {

struct LineRecord {
    int tag;
    int startTag; // orientation the line was created with
};

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Signed line tag for edge (a -> b), creating the line on first use.
static int getOrCreateLine(int a, int b, int& nextLineTag,
                           std::map<std::pair<int,int>, LineRecord>& lines,
                           std::vector<int>& created) {
    const auto key = a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    auto it = lines.find(key);
    if (it != lines.end()) {
        return it->second.startTag == a ? it->second.tag : -it->second.tag;
    }
    const int tag = nextLineTag++;
    gmsh::model::geo::addLine(a, b, tag);
    lines.emplace(key, LineRecord{tag, a});
    created.push_back(tag);
    return tag;
}

} // namespace

double MeshGenerator::resolveTargetSize(const Boundary& boundary, std::optional<double> targetSize) {
    const double h = targetSize ? *targetSize : boundary.maxExtent();
    if (!(h > 0.0)) throw std::invalid_argument("Target size must be positive (got " + std::to_string(h) + ")");
    return h;
}

BoundaryEntities MeshGenerator::addBoundaryEntities(const Boundary& boundary, double size, int dimension,
                                                    const SolidTopology* solid) {
    BoundaryEntities E;
    const auto& pts = boundary.points();
    const std::size_t np = pts.size();

    for (std::size_t i = 0; i < np; ++i) {
        const int tag = TagMap::toEngineTag(i, np);
        gmsh::model::geo::addPoint(pts[i][0], pts[i][1], pts[i][2], size, tag);
        E.pointTags.push_back(tag);
    }

    // Lines in traversal order; an edge shared by two loops is created once
    int nextLineTag = 1;
    std::map<std::pair<int,int>, LineRecord> lines;
    const auto loops = boundary.loops();
    for (const auto& L : loops) {
        std::vector<int> wire;
        wire.reserve(L.size());
        for (std::size_t k = 0; k < L.size(); ++k) {
            const int a = TagMap::toEngineTag(L[k], np);
            const int b = TagMap::toEngineTag(L[(k + 1) % L.size()], np);
            wire.push_back(getOrCreateLine(a, b, nextLineTag, lines, E.lineTags));
        }
        const int loopTag = static_cast<int>(E.curveLoopTags.size()) + 1;
        gmsh::model::geo::addCurveLoop(wire, loopTag);
        E.curveLoopTags.push_back(loopTag);
        E.loopCurves.push_back(std::move(wire));
    }
    if (E.curveLoopTags.empty()) throw std::invalid_argument("Boundary has no loops");

    if (dimension == 2) {
        // first loop is the outer boundary, the rest are holes
        gmsh::model::geo::addPlaneSurface(E.curveLoopTags, 1);
        E.surfaceTags.push_back(1);
        return E;
    }

    for (int loopTag : E.curveLoopTags) {
        gmsh::model::geo::addPlaneSurface({loopTag}, loopTag);
        E.surfaceTags.push_back(loopTag);
    }
    SolidTopology topo = (solid && !solid->empty()) ? *solid : SolidTopology::singleVolume(loops.size());
    // shells without volumes: the first shell bounds the only volume
    if (topo.volumes.empty()) topo.volumes = {{0}};
    for (const auto& shell : topo.shells) {
        std::vector<int> faces;
        for (std::size_t li : shell) {
            if (li >= E.surfaceTags.size()) throw std::out_of_range("Shell references loop " + std::to_string(li));
            faces.push_back(E.surfaceTags[li]);
        }
        const int shellTag = static_cast<int>(E.surfaceLoopTags.size()) + 1;
        gmsh::model::geo::addSurfaceLoop(faces, shellTag);
        E.surfaceLoopTags.push_back(shellTag);
    }
    for (const auto& vol : topo.volumes) {
        std::vector<int> shells;
        for (std::size_t si : vol) {
            if (si >= E.surfaceLoopTags.size()) throw std::out_of_range("Volume references shell " + std::to_string(si));
            shells.push_back(E.surfaceLoopTags[si]);
        }
        const int volTag = static_cast<int>(E.volumeTags.size()) + 1;
        gmsh::model::geo::addVolume(shells, volTag);
        E.volumeTags.push_back(volTag);
    }
    return E;
}

Mesh MeshGenerator::run(const Boundary& boundary, const MeshOptions& options, const std::string* mshOut) {
    std::string err;
    if (!options.validate(&err)) throw std::invalid_argument("Invalid mesh options: " + err);

    GmshSession session(options.modelName, options.verbosity);
    gmsh::option::setNumber("Mesh.Algorithm", static_cast<int>(options.algorithm));
    gmsh::option::setNumber("Mesh.Algorithm3D", static_cast<int>(options.algorithm3D));

    const double h = resolveTargetSize(boundary, options.targetSize);
    addBoundaryEntities(boundary, h, options.dimension, options.solid ? &*options.solid : nullptr);
    gmsh::model::geo::synchronize();
    gmsh::model::mesh::generate(options.dimension);

    if (mshOut) gmsh::write(*mshOut);

    Mesh M;
    if (options.extraction == Extraction::File) {
        ScopedTempFile tmp(".msh");
        gmsh::write(tmp.path());
        M = Mesh::buildFromMshFile(tmp.path());
    } else {
        M = Mesh::buildFromGmshCurrent();
    }
    if (M.numCellsOfDimension(options.dimension) == 0) {
        throw MeshingError("gmsh produced no " + std::to_string(options.dimension) + "D elements");
    }
    M.clearData();
    return M;
}

Mesh MeshGenerator::generate(const Boundary& boundary, const MeshOptions& options) {
    return run(boundary, options, nullptr);
}

Mesh MeshGenerator::generate(const Boundary& boundary, const MeshOptions& options, const std::string& outPath) {
    if (endsWith(outPath, ".msh")) return run(boundary, options, &outPath);
    if (!endsWith(outPath, ".vtk")) throw std::invalid_argument("Unsupported output extension: " + outPath);
    Mesh M = run(boundary, options, nullptr);
    if (!M.writeVTK(outPath)) throw std::runtime_error("Could not write " + outPath);
    return M;
}

Mesh MeshGenerator::frontalDelaunay2D(const Boundary& boundary, std::optional<double> targetSize) {
    MeshOptions opt;
    opt.algorithm = Algorithm2D::FrontalDelaunay;
    opt.dimension = 2;
    opt.targetSize = targetSize;
    return generate(boundary, opt);
}
