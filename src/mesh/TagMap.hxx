#ifndef EDGEMESH_TAG_MAP_HXX
#define EDGEMESH_TAG_MAP_HXX

#include <cstddef>
#include <stdexcept>
#include <string>

// Translation between 0-based boundary point indices and 1-based gmsh entity tags.
namespace TagMap {

inline int toEngineTag(std::size_t index, std::size_t numPoints) {
    if (index >= numPoints) {
        throw std::out_of_range("Point index " + std::to_string(index) +
                                " out of range (" + std::to_string(numPoints) + " points)");
    }
    return static_cast<int>(index) + 1;
}

inline std::size_t toInputIndex(int tag) {
    if (tag < 1) throw std::out_of_range("Engine tag " + std::to_string(tag) + " is not positive");
    return static_cast<std::size_t>(tag - 1);
}

} // namespace TagMap

#endif // EDGEMESH_TAG_MAP_HXX
