#include "Boundary.hxx"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
const double kPi = 3.14159265358979323846;
}

Boundary::Boundary(const std::vector<Point>& points, const std::vector<std::size_t>& topology)
    : points_(points), topology_(topology) {
    checkTopology(topology_);
}

void Boundary::checkTopology(const std::vector<std::size_t>& topology) {
    std::size_t pos = 0;
    while (pos < topology.size()) {
        const std::size_t count = topology[pos];
        if (count > topology.size() - pos - 1) {
            throw std::invalid_argument("Boundary: loop run overruns topology array");
        }
        pos += count + 1;
    }
}

std::vector<std::vector<std::size_t>> Boundary::loops() const {
    std::vector<std::vector<std::size_t>> out;
    std::size_t pos = 0;
    while (pos < topology_.size()) {
        const std::size_t count = topology_[pos];
        std::vector<std::size_t> L(topology_.begin() + static_cast<std::ptrdiff_t>(pos + 1),
                                   topology_.begin() + static_cast<std::ptrdiff_t>(pos + 1 + count));
        // explicitly closed run (first index repeated at the end)
        if (L.size() > 1 && L.front() == L.back()) L.pop_back();
        out.push_back(std::move(L));
        pos += count + 1;
    }
    return out;
}

std::size_t Boundary::numLoops() const {
    return loops().size();
}

std::size_t Boundary::numEdges() const {
    std::size_t n = 0;
    for (const auto& L : loops()) n += L.size();
    return n;
}

std::size_t Boundary::addPoint(const Point& p) {
    points_.push_back(p);
    return points_.size() - 1;
}

void Boundary::addLoop(const std::vector<std::size_t>& indices) {
    topology_.push_back(indices.size());
    topology_.insert(topology_.end(), indices.begin(), indices.end());
}

Boundary::Bounds Boundary::bounds() const {
    if (points_.empty()) return Bounds{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    const double inf = std::numeric_limits<double>::infinity();
    Bounds b{inf, -inf, inf, -inf, inf, -inf};
    for (const auto& p : points_) {
        for (int d = 0; d < 3; ++d) {
            b[static_cast<std::size_t>(2*d)] = std::min(b[static_cast<std::size_t>(2*d)], p[static_cast<std::size_t>(d)]);
            b[static_cast<std::size_t>(2*d+1)] = std::max(b[static_cast<std::size_t>(2*d+1)], p[static_cast<std::size_t>(d)]);
        }
    }
    return b;
}

double Boundary::maxExtent() const {
    const Bounds b = bounds();
    return std::max({std::fabs(b[1] - b[0]), std::fabs(b[3] - b[2]), std::fabs(b[5] - b[4])});
}

void Boundary::rotateZ(double degrees) {
    const double a = degrees * kPi / 180.0;
    const double c = std::cos(a), s = std::sin(a);
    for (auto& p : points_) {
        const double x = p[0], y = p[1];
        p[0] = c * x - s * y;
        p[1] = s * x + c * y;
    }
}

void Boundary::translate(double dx, double dy, double dz) {
    for (auto& p : points_) {
        p[0] += dx; p[1] += dy; p[2] += dz;
    }
}

Boundary Boundary::polygon(int nSides, double radius, const Point& center) {
    if (nSides < 3) throw std::invalid_argument("Boundary::polygon: need at least 3 sides");
    if (!(radius > 0.0)) throw std::invalid_argument("Boundary::polygon: radius must be positive");
    Boundary B;
    std::vector<std::size_t> loop;
    for (int k = 0; k < nSides; ++k) {
        const double ang = 2.0 * kPi * k / nSides;
        loop.push_back(B.addPoint({center[0] + radius * std::cos(ang),
                                   center[1] + radius * std::sin(ang),
                                   center[2]}));
    }
    B.addLoop(loop);
    return B;
}

Boundary Boundary::box(double xmin, double xmax, double ymin, double ymax, double zmin, double zmax) {
    if (!(xmax > xmin) || !(ymax > ymin) || !(zmax > zmin)) {
        throw std::invalid_argument("Boundary::box: empty extent");
    }
    Boundary B;
    B.addPoint({xmin, ymin, zmin}); // 0
    B.addPoint({xmax, ymin, zmin}); // 1
    B.addPoint({xmax, ymax, zmin}); // 2
    B.addPoint({xmin, ymax, zmin}); // 3
    B.addPoint({xmin, ymin, zmax}); // 4
    B.addPoint({xmax, ymin, zmax}); // 5
    B.addPoint({xmax, ymax, zmax}); // 6
    B.addPoint({xmin, ymax, zmax}); // 7
    B.addLoop({0, 3, 2, 1}); // -z
    B.addLoop({4, 5, 6, 7}); // +z
    B.addLoop({0, 1, 5, 4}); // -y
    B.addLoop({1, 2, 6, 5}); // +x
    B.addLoop({2, 3, 7, 6}); // +y
    B.addLoop({3, 0, 4, 7}); // -x
    return B;
}

SolidTopology SolidTopology::singleVolume(std::size_t numLoops) {
    SolidTopology T;
    std::vector<std::size_t> shell(numLoops);
    for (std::size_t i = 0; i < numLoops; ++i) shell[i] = i;
    T.shells.push_back(std::move(shell));
    T.volumes.push_back({0});
    return T;
}
