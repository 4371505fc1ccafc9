#pragma once

/**
 * @file earcut.h
 * @brief Hole-aware ear-clipping triangulation
 *
 * Port of the earcut algorithm onto an index arena: polygon nodes live in a
 * flat vector and link to each other by 32-bit index, so the cyclic ring
 * needs no per-node ownership. Large inputs (> 80 vertices) are indexed
 * along a z-order curve; degenerate rings fall back to a local
 * self-intersection cure and finally to splitting the polygon in two.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace layershift {

/**
 * @brief Triangulate one outer ring plus optional holes
 * @param coords Flat x,y pairs: outer ring first, then each hole
 * @param holeStarts Vertex index (not float index) where each hole begins
 * @return Triangle vertex indices into coords, three per triangle
 */
std::vector<uint32_t> earcut(const std::vector<float>& coords,
                             const std::vector<uint32_t>& holeStarts = {});

/// @brief Shoelace sum over a flat x,y range (earcut sign convention)
double earcutSignedArea(const std::vector<float>& coords, size_t begin, size_t end);

} // namespace layershift
