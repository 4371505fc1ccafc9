#pragma once

/**
 * @file shape_mesh.h
 * @brief Logo outline to GPU mesh
 *
 * An SVG document is reduced to closed contours, normalized into clip space
 * ([-1, 1] on the longer side, Y up), classified into outers and holes by
 * geometric nesting, and triangulated group by group. The portal passes
 * consume three products of one ShapeMesh:
 * - the fill triangles (stencil and mask passes)
 * - the edge strip (boundary rim, 4 floats per vertex)
 * - the chamfer ring (bevel wall, 6 floats per vertex)
 */

#include <layershift/svg_path.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace layershift {

struct MeshBounds {
    float minX = 0.0f;
    float maxX = 0.0f;
    float minY = 0.0f;
    float maxY = 0.0f;
};

struct ShapeMesh {
    std::vector<float> vertices;        ///< x,y pairs in normalized space
    std::vector<uint16_t> indices;      ///< three per triangle
    std::vector<float> edgeVertices;    ///< every contour, closed by repeating its first point
    std::vector<size_t> contourOffsets; ///< float offset of each contour in edgeVertices
    std::vector<bool> contourIsHole;    ///< parallel to contourOffsets
    MeshBounds bounds;
    float aspect = 1.0f;                ///< source width / height

    size_t triangleCount() const { return indices.size() / 3; }
};

/// Interleaved triangle list for the rim and chamfer passes
struct StripMesh {
    std::vector<float> vertices;
    uint32_t count = 0;     ///< vertex count
    uint32_t stride = 0;    ///< floats per vertex
};

/// Fraction of the viewport's shorter axis covered by the portal mesh
constexpr float PORTAL_FILL_FACTOR = 0.65f;

/**
 * @brief Parse an SVG document and build its mesh
 *
 * Collects path, polygon, polyline (>= 3 points), rect, circle and ellipse
 * elements anywhere under the first <svg> element.
 *
 * @throws std::runtime_error on malformed XML, a missing <svg> element or an
 *         outline without any usable contour
 */
ShapeMesh generateMeshFromSvgString(const std::string& svgText);

/// @brief File variant of generateMeshFromSvgString
ShapeMesh generateMeshFromSvgFile(const std::string& path);

/// @brief Normalize, classify and triangulate contours in source coordinates
ShapeMesh buildShapeMesh(const std::vector<Contour>& contours);

/// @brief Shoelace area, positive for counter-clockwise in a Y-up frame
double contourSignedArea(const Contour& contour);

/// @brief Even-odd ray cast
bool pointInContour(double px, double py, const Contour& contour);

/**
 * @brief Mark each contour as hole or outer by nesting depth
 *
 * Depth counts the strictly larger contours containing the contour's first
 * point. Odd depth is a hole. Winding direction is ignored.
 */
std::vector<bool> classifyContoursByNesting(const std::vector<Contour>& contours);

/**
 * @brief Partition contours into [outer, holes...] groups
 *
 * Each hole joins the smallest outer that contains it. Holes with no
 * container, and every contour when there are no outers, stand alone.
 */
std::vector<std::vector<Contour>> groupContoursWithHoles(const std::vector<Contour>& contours);

/**
 * @brief Expand edge polylines into quads for the rim pass
 *
 * Six vertices per non-degenerate segment, each [x, y, nx, ny] with the
 * segment normal or its negation.
 */
StripMesh buildEdgeMesh(const std::vector<float>& edgeVertices);

/**
 * @brief Build the bevel ring around every contour
 * @param width Ring width in normalized mesh units (<= 0 yields an empty mesh)
 * @param angleDeg 0 faces the viewer, 90 faces outward
 *
 * Vertices are [x, y, nx, ny, nz, lerpT] with lerpT 0 on the silhouette and
 * 1 on the outer edge.
 */
StripMesh buildChamferMesh(const ShapeMesh& mesh, float width, float angleDeg);

/**
 * @brief Mesh scale that fits the outline at PORTAL_FILL_FACTOR
 *
 * Shrinks the axis along which the viewport is relatively wider than the
 * outline, keeping the outline's proportions on screen.
 */
glm::vec2 portalMeshScale(float meshAspect, float viewportAspect);

} // namespace layershift
