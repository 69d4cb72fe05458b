#ifndef EDGEMESH_BOUNDARY_HXX
#define EDGEMESH_BOUNDARY_HXX

#include <array>
#include <cstddef>
#include <vector>

// Boundary description: an ordered point set plus closed loops over it.
// Loops are stored as a flat topology array of runs [count, i0, ..., i_{count-1}].
// Each loop is implicitly closed (last index connects back to first). A run whose
// last index repeats its first is accepted and the duplicate is dropped on decode.
class Boundary {
public:
    using Point = std::array<double, 3>;
    using Bounds = std::array<double, 6>; // xmin, xmax, ymin, ymax, zmin, zmax

    Boundary() = default;
    // Throws std::invalid_argument if a run's count overruns the topology array.
    Boundary(const std::vector<Point>& points, const std::vector<std::size_t>& topology);

    const std::vector<Point>& points() const { return points_; }
    const std::vector<std::size_t>& topology() const { return topology_; }
    std::size_t numPoints() const { return points_.size(); }

    // Decoded loops, one index list per run.
    std::vector<std::vector<std::size_t>> loops() const;
    std::size_t numLoops() const;
    std::size_t numEdges() const;

    std::size_t addPoint(const Point& p);
    void addLoop(const std::vector<std::size_t>& indices);

    Bounds bounds() const;
    // Largest of the x, y, z extents of bounds().
    double maxExtent() const;

    void rotateZ(double degrees);
    void translate(double dx, double dy, double dz);

    // Regular polygon in the plane z = center[2]; vertex k at angle 2*pi*k/nSides.
    static Boundary polygon(int nSides, double radius, const Point& center = Point{0.0, 0.0, 0.0});

    // Axis-aligned box: 8 corners, 6 quadrilateral face loops (-z, +z, -y, +x, +y, -x).
    static Boundary box(double xmin, double xmax, double ymin, double ymax, double zmin, double zmax);

private:
    static void checkTopology(const std::vector<std::size_t>& topology);

    std::vector<Point> points_;
    std::vector<std::size_t> topology_;
};

// Manually specified solid composition for 3D meshing.
// shells: each entry lists boundary loop indices whose surfaces close one surface loop.
// volumes: each entry lists shell indices; the first is the outer shell, the rest are cavities.
struct SolidTopology {
    std::vector<std::vector<std::size_t>> shells;
    std::vector<std::vector<std::size_t>> volumes;

    bool empty() const { return shells.empty(); }

    // One shell over every loop, one volume over that shell.
    static SolidTopology singleVolume(std::size_t numLoops);
};

#endif // EDGEMESH_BOUNDARY_HXX
