#include "MeshOptions.hxx"

#include <cmath>
#include <utility>

namespace {
const std::pair<const char*, Algorithm2D> kAlgorithms2D[] = {
    {"meshadapt", Algorithm2D::MeshAdapt},
    {"automatic", Algorithm2D::Automatic},
    {"delaunay", Algorithm2D::Delaunay},
    {"frontal-delaunay", Algorithm2D::FrontalDelaunay},
    {"bamg", Algorithm2D::BAMG},
    {"frontal-delaunay-quads", Algorithm2D::FrontalDelaunayQuads},
    {"packing-parallelograms", Algorithm2D::PackingParallelograms},
};

const std::pair<const char*, Algorithm3D> kAlgorithms3D[] = {
    {"delaunay", Algorithm3D::Delaunay},
    {"frontal", Algorithm3D::Frontal},
    {"hxt", Algorithm3D::HXT},
};
}

bool MeshOptions::validate(std::string* errorMessage) const {
    std::string err;
    if (dimension != 2 && dimension != 3) {
        err = "dimension must be 2 or 3";
    } else if (targetSize && !(std::isfinite(*targetSize) && *targetSize > 0.0)) {
        err = "target size must be a finite positive number";
    } else if (solid && dimension != 3) {
        err = "solid topology requires dimension 3";
    }
    if (err.empty()) return true;
    if (errorMessage) *errorMessage = err;
    return false;
}

bool algorithm2DFromName(const std::string& name, Algorithm2D& out) {
    for (const auto& kv : kAlgorithms2D) {
        if (name == kv.first) { out = kv.second; return true; }
    }
    return false;
}

bool algorithm3DFromName(const std::string& name, Algorithm3D& out) {
    for (const auto& kv : kAlgorithms3D) {
        if (name == kv.first) { out = kv.second; return true; }
    }
    return false;
}

bool extractionFromName(const std::string& name, Extraction& out) {
    if (name == "memory") { out = Extraction::InMemory; return true; }
    if (name == "file") { out = Extraction::File; return true; }
    return false;
}

std::string algorithm2DName(Algorithm2D a) {
    for (const auto& kv : kAlgorithms2D) {
        if (kv.second == a) return kv.first;
    }
    return "unknown";
}

std::string algorithm3DName(Algorithm3D a) {
    for (const auto& kv : kAlgorithms3D) {
        if (kv.second == a) return kv.first;
    }
    return "unknown";
}

std::string extractionName(Extraction e) {
    return e == Extraction::File ? "file" : "memory";
}
