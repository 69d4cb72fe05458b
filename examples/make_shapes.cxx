#include "Boundary.hxx"
#include "BoundaryIO.hxx"

#include <cstdio>
#include <string>
#include <vector>

static std::string joinPath(const std::string& a, const std::string& b) {
    if (a.empty() || a == ".") return b;
    if (a.back() == '/') return a + b;
    return a + "/" + b;
}

static bool writeShape(const std::string& path, const Boundary& B, const MeshOptions& opt) {
    std::string err;
    if (!BoundaryIO::writeFile(path, B, opt, &err)) {
        std::fprintf(stderr, "Failed to write %s: %s\n", path.c_str(), err.c_str());
        return false;
    }
    std::printf("Wrote %s\n", path.c_str());
    return true;
}

int main(int argc, char** argv) {
    const std::string outDir = argc >= 2 ? argv[1] : ".";
    bool ok = true;

    // Square of circumradius 8 turned 45 degrees, default target size
    {
        Boundary B = Boundary::polygon(4, 8.0);
        B.rotateZ(45.0);
        MeshOptions opt;
        ok = writeShape(joinPath(outDir, "square.bnd"), B, opt) && ok;
    }

    // Octagon with a square hole
    {
        Boundary B = Boundary::polygon(8, 2.0);
        std::vector<std::size_t> hole;
        hole.push_back(B.addPoint({-0.5, -0.5, 0.0}));
        hole.push_back(B.addPoint({ 0.5, -0.5, 0.0}));
        hole.push_back(B.addPoint({ 0.5,  0.5, 0.0}));
        hole.push_back(B.addPoint({-0.5,  0.5, 0.0}));
        B.addLoop(hole);
        MeshOptions opt;
        opt.targetSize = 0.2;
        ok = writeShape(joinPath(outDir, "octagon_hole.bnd"), B, opt) && ok;
    }

    // Unit cube, one shell and one volume given explicitly
    {
        Boundary B = Boundary::box(0, 1, 0, 1, 0, 1);
        MeshOptions opt;
        opt.dimension = 3;
        opt.targetSize = 0.5;
        opt.solid = SolidTopology::singleVolume(B.numLoops());
        ok = writeShape(joinPath(outDir, "cube.bnd"), B, opt) && ok;
    }

    return ok ? 0 : 1;
}
