// Layershift - SVG outline to mesh

#include <layershift/shape_mesh.h>
#include <layershift/earcut.h>
#include <pugixml.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace layershift {

namespace {

constexpr double PI = 3.14159265358979323846;

void collectPathContours(const pugi::xml_node& svg, std::vector<Contour>& contours) {
    for (const pugi::xpath_node& node : svg.select_nodes("descendant::path")) {
        const char* d = node.node().attribute("d").value();
        if (!d || d[0] == '\0') continue;
        for (Contour& c : parseSvgPath(d)) {
            contours.push_back(std::move(c));
        }
    }
}

void collectPointContours(const pugi::xml_node& svg, const char* query, std::vector<Contour>& contours) {
    for (const pugi::xpath_node& node : svg.select_nodes(query)) {
        const char* points = node.node().attribute("points").value();
        if (!points || points[0] == '\0') continue;
        Contour coords = parseSvgPointsList(points);
        if (coords.size() >= 6) contours.push_back(std::move(coords));
    }
}

std::vector<Contour> extractContours(const pugi::xml_node& svg) {
    std::vector<Contour> contours;

    collectPathContours(svg, contours);
    collectPointContours(svg, "descendant::polygon", contours);
    collectPointContours(svg, "descendant::polyline", contours);

    for (const pugi::xpath_node& node : svg.select_nodes("descendant::rect")) {
        const pugi::xml_node rect = node.node();
        const double x = rect.attribute("x").as_double(0.0);
        const double y = rect.attribute("y").as_double(0.0);
        const double w = rect.attribute("width").as_double(0.0);
        const double h = rect.attribute("height").as_double(0.0);
        if (w > 0.0 && h > 0.0) {
            contours.push_back({x, y, x + w, y, x + w, y + h, x, y + h});
        }
    }

    for (const pugi::xpath_node& node : svg.select_nodes("descendant::circle")) {
        const pugi::xml_node circle = node.node();
        const double r = circle.attribute("r").as_double(0.0);
        if (r > 0.0) {
            contours.push_back(ellipseToPolygon(circle.attribute("cx").as_double(0.0),
                                                circle.attribute("cy").as_double(0.0), r, r));
        }
    }

    for (const pugi::xpath_node& node : svg.select_nodes("descendant::ellipse")) {
        const pugi::xml_node ellipse = node.node();
        const double rx = ellipse.attribute("rx").as_double(0.0);
        const double ry = ellipse.attribute("ry").as_double(0.0);
        if (rx > 0.0 && ry > 0.0) {
            contours.push_back(ellipseToPolygon(ellipse.attribute("cx").as_double(0.0),
                                                ellipse.attribute("cy").as_double(0.0), rx, ry));
        }
    }

    return contours;
}

} // namespace

ShapeMesh generateMeshFromSvgString(const std::string& svgText) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(svgText.c_str());
    if (!result) {
        throw std::runtime_error(std::string("Failed to parse SVG: ") + result.description());
    }

    pugi::xml_node svg = doc.find_node([](const pugi::xml_node& n) {
        return std::strcmp(n.name(), "svg") == 0;
    });
    if (!svg) {
        throw std::runtime_error("No <svg> element found in document.");
    }

    const std::vector<Contour> contours = extractContours(svg);
    if (contours.empty()) {
        throw std::runtime_error("No path data found in SVG.");
    }
    return buildShapeMesh(contours);
}

ShapeMesh generateMeshFromSvgFile(const std::string& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::runtime_error("Failed to load SVG '" + path + "': " + result.description());
    }

    pugi::xml_node svg = doc.find_node([](const pugi::xml_node& n) {
        return std::strcmp(n.name(), "svg") == 0;
    });
    if (!svg) {
        throw std::runtime_error("No <svg> element found in document.");
    }

    const std::vector<Contour> contours = extractContours(svg);
    if (contours.empty()) {
        throw std::runtime_error("No path data found in SVG.");
    }

    ShapeMesh mesh = buildShapeMesh(contours);
    std::cout << "[ShapeMesh] " << path << ": " << contours.size() << " contours, "
              << mesh.triangleCount() << " triangles" << std::endl;
    return mesh;
}

ShapeMesh buildShapeMesh(const std::vector<Contour>& contours) {
    double minX = std::numeric_limits<double>::infinity();
    double minY = minX;
    double maxX = -minX;
    double maxY = -minX;
    for (const Contour& c : contours) {
        for (size_t i = 0; i + 1 < c.size(); i += 2) {
            minX = std::min(minX, c[i]);
            maxX = std::max(maxX, c[i]);
            minY = std::min(minY, c[i + 1]);
            maxY = std::max(maxY, c[i + 1]);
        }
    }

    const double width = maxX - minX;
    const double height = maxY - minY;
    if (!(width > 0.0) || !(height > 0.0)) {
        throw std::runtime_error("SVG outline has zero width or height.");
    }

    const double cx = (minX + maxX) / 2.0;
    const double cy = (minY + maxY) / 2.0;
    const double scale = 2.0 / std::max(width, height);

    // SVG is Y-down, clip space is Y-up
    std::vector<Contour> normalized;
    normalized.reserve(contours.size());
    for (const Contour& c : contours) {
        Contour n;
        n.reserve(c.size());
        for (size_t i = 0; i + 1 < c.size(); i += 2) {
            n.push_back((c[i] - cx) * scale);
            n.push_back(-((c[i + 1] - cy) * scale));
        }
        normalized.push_back(std::move(n));
    }

    ShapeMesh mesh;
    mesh.aspect = static_cast<float>(width / height);

    for (const std::vector<Contour>& group : groupContoursWithHoles(normalized)) {
        std::vector<float> coords;
        std::vector<uint32_t> holeStarts;
        for (size_t k = 0; k < group.size(); ++k) {
            if (k > 0) holeStarts.push_back(static_cast<uint32_t>(coords.size() / 2));
            for (double v : group[k]) coords.push_back(static_cast<float>(v));
        }

        const size_t vertexOffset = mesh.vertices.size() / 2;
        if (vertexOffset + coords.size() / 2 > std::numeric_limits<uint16_t>::max()) {
            throw std::runtime_error("SVG outline exceeds 65535 vertices.");
        }

        for (uint32_t idx : earcut(coords, holeStarts)) {
            mesh.indices.push_back(static_cast<uint16_t>(idx + vertexOffset));
        }
        mesh.vertices.insert(mesh.vertices.end(), coords.begin(), coords.end());
    }

    const std::vector<bool> holes = classifyContoursByNesting(normalized);
    for (size_t ci = 0; ci < normalized.size(); ++ci) {
        const Contour& c = normalized[ci];
        mesh.contourOffsets.push_back(mesh.edgeVertices.size());
        mesh.contourIsHole.push_back(holes[ci]);
        for (double v : c) mesh.edgeVertices.push_back(static_cast<float>(v));
        if (c.size() >= 2) {
            mesh.edgeVertices.push_back(static_cast<float>(c[0]));
            mesh.edgeVertices.push_back(static_cast<float>(c[1]));
        }
    }

    MeshBounds& b = mesh.bounds;
    b.minX = b.minY = std::numeric_limits<float>::infinity();
    b.maxX = b.maxY = -std::numeric_limits<float>::infinity();
    for (size_t i = 0; i + 1 < mesh.vertices.size(); i += 2) {
        b.minX = std::min(b.minX, mesh.vertices[i]);
        b.maxX = std::max(b.maxX, mesh.vertices[i]);
        b.minY = std::min(b.minY, mesh.vertices[i + 1]);
        b.maxY = std::max(b.maxY, mesh.vertices[i + 1]);
    }
    return mesh;
}

double contourSignedArea(const Contour& contour) {
    double sum = 0.0;
    const size_t n = contour.size();
    if (n < 2) return 0.0;
    for (size_t i = 0; i + 1 < n; i += 2) {
        const double x0 = contour[i];
        const double y0 = contour[i + 1];
        const double x1 = contour[(i + 2) % n];
        const double y1 = contour[(i + 3) % n];
        sum += x0 * y1 - x1 * y0;
    }
    return sum / 2.0;
}

bool pointInContour(double px, double py, const Contour& contour) {
    bool inside = false;
    const size_t n = contour.size();
    if (n < 2) return false;
    for (size_t i = 0, j = n - 2; i + 1 < n; j = i, i += 2) {
        const double xi = contour[i], yi = contour[i + 1];
        const double xj = contour[j], yj = contour[j + 1];
        if ((yi > py) != (yj > py) && px < (xj - xi) * (py - yi) / (yj - yi) + xi) {
            inside = !inside;
        }
    }
    return inside;
}

std::vector<bool> classifyContoursByNesting(const std::vector<Contour>& contours) {
    const size_t n = contours.size();
    std::vector<double> absAreas(n);
    for (size_t i = 0; i < n; ++i) {
        absAreas[i] = std::abs(contourSignedArea(contours[i]));
    }

    std::vector<bool> isHole(n, false);
    for (size_t i = 0; i < n; ++i) {
        if (contours[i].size() < 2) continue;
        const double tx = contours[i][0];
        const double ty = contours[i][1];

        // Only strictly larger contours count, so near-equal pairs can't contain each other
        int depth = 0;
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            if (absAreas[j] > absAreas[i] && pointInContour(tx, ty, contours[j])) {
                ++depth;
            }
        }
        isHole[i] = (depth % 2) == 1;
    }
    return isHole;
}

std::vector<std::vector<Contour>> groupContoursWithHoles(const std::vector<Contour>& contours) {
    if (contours.size() <= 1) {
        return {contours};
    }

    const std::vector<bool> isHole = classifyContoursByNesting(contours);

    std::vector<size_t> outers;
    std::vector<size_t> holes;
    for (size_t i = 0; i < contours.size(); ++i) {
        (isHole[i] ? holes : outers).push_back(i);
    }

    std::vector<std::vector<Contour>> groups;
    if (outers.empty()) {
        for (const Contour& c : contours) groups.push_back({c});
        return groups;
    }

    for (size_t o : outers) groups.push_back({contours[o]});

    for (size_t h : holes) {
        const Contour& hole = contours[h];
        if (hole.size() < 2) continue;

        int best = -1;
        double bestArea = std::numeric_limits<double>::infinity();
        for (size_t g = 0; g < outers.size(); ++g) {
            const Contour& outer = contours[outers[g]];
            if (pointInContour(hole[0], hole[1], outer)) {
                const double a = std::abs(contourSignedArea(outer));
                if (a < bestArea) {
                    bestArea = a;
                    best = static_cast<int>(g);
                }
            }
        }

        if (best >= 0) {
            groups[static_cast<size_t>(best)].push_back(hole);
        } else {
            groups.push_back({hole});
        }
    }
    return groups;
}

StripMesh buildEdgeMesh(const std::vector<float>& edgeVertices) {
    StripMesh out;
    out.stride = 4;
    if (edgeVertices.size() < 4) return out;

    for (size_t i = 0; i + 3 < edgeVertices.size(); i += 2) {
        const float x0 = edgeVertices[i];
        const float y0 = edgeVertices[i + 1];
        const float x1 = edgeVertices[i + 2];
        const float y1 = edgeVertices[i + 3];

        const float dx = x1 - x0;
        const float dy = y1 - y0;
        const float len = std::sqrt(dx * dx + dy * dy);
        if (len < 1e-6f) continue;

        const float nx = -dy / len;
        const float ny = dx / len;

        const float quad[] = {
            x0, y0, nx, ny,
            x0, y0, -nx, -ny,
            x1, y1, nx, ny,
            x1, y1, nx, ny,
            x0, y0, -nx, -ny,
            x1, y1, -nx, -ny,
        };
        out.vertices.insert(out.vertices.end(), std::begin(quad), std::end(quad));
        out.count += 6;
    }
    return out;
}

StripMesh buildChamferMesh(const ShapeMesh& mesh, float width, float angleDeg) {
    StripMesh out;
    out.stride = 6;
    if (width <= 0.0f) return out;

    const float angle = angleDeg * static_cast<float>(PI) / 180.0f;
    const float nz = -std::cos(angle);  // viewer looks along -Z
    const float nxyScale = std::sin(angle);
    const std::vector<float>& ev = mesh.edgeVertices;

    for (size_t c = 0; c < mesh.contourOffsets.size(); ++c) {
        const size_t start = mesh.contourOffsets[c];
        const size_t end = c + 1 < mesh.contourOffsets.size() ? mesh.contourOffsets[c + 1] : ev.size();
        const size_t numPoints = (end - start) / 2;
        if (numPoints < 3) continue;

        // Last point repeats the first
        const size_t numSegments = numPoints - 1;

        double areaSum = 0.0;
        for (size_t s = 0; s < numSegments; ++s) {
            const size_t si = start + s * 2;
            areaSum += static_cast<double>(ev[si]) * ev[si + 3] - static_cast<double>(ev[si + 2]) * ev[si + 1];
        }
        const float flip = areaSum >= 0.0 ? 1.0f : -1.0f;

        std::vector<glm::vec2> segN(numSegments);
        for (size_t s = 0; s < numSegments; ++s) {
            const size_t i = start + s * 2;
            const float dx = ev[i + 2] - ev[i];
            const float dy = ev[i + 3] - ev[i + 1];
            const float len = std::sqrt(dx * dx + dy * dy);
            if (len < 1e-8f) {
                segN[s] = s > 0 ? segN[s - 1] : glm::vec2(0.0f);
            } else {
                segN[s] = glm::vec2(-dy / len, dx / len) * flip;
            }
        }

        std::vector<glm::vec2> vtxN(numSegments);
        for (size_t v = 0; v < numSegments; ++v) {
            const size_t prev = (v + numSegments - 1) % numSegments;
            const glm::vec2 sum = segN[prev] + segN[v];
            const float len = glm::length(sum);
            vtxN[v] = len > 1e-8f ? sum / len : segN[v];
        }

        for (size_t s = 0; s < numSegments; ++s) {
            const size_t v0 = s;
            const size_t v1 = (s + 1) % numSegments;
            const glm::vec2 p0(ev[start + v0 * 2], ev[start + v0 * 2 + 1]);
            const glm::vec2 p1(ev[start + v1 * 2], ev[start + v1 * 2 + 1]);

            const glm::vec3 n0(vtxN[v0] * nxyScale, nz);
            const glm::vec3 n1(vtxN[v1] * nxyScale, nz);
            const glm::vec2 o0 = p0 + vtxN[v0] * width;
            const glm::vec2 o1 = p1 + vtxN[v1] * width;

            const float tri[] = {
                p0.x, p0.y, n0.x, n0.y, n0.z, 0.0f,
                o0.x, o0.y, n0.x, n0.y, n0.z, 1.0f,
                p1.x, p1.y, n1.x, n1.y, n1.z, 0.0f,
                p1.x, p1.y, n1.x, n1.y, n1.z, 0.0f,
                o0.x, o0.y, n0.x, n0.y, n0.z, 1.0f,
                o1.x, o1.y, n1.x, n1.y, n1.z, 1.0f,
            };
            out.vertices.insert(out.vertices.end(), std::begin(tri), std::end(tri));
            out.count += 6;
        }
    }
    return out;
}

glm::vec2 portalMeshScale(float meshAspect, float viewportAspect) {
    glm::vec2 scale(PORTAL_FILL_FACTOR);
    if (viewportAspect > meshAspect) {
        scale.x = PORTAL_FILL_FACTOR * (meshAspect / viewportAspect);
    } else {
        scale.y = PORTAL_FILL_FACTOR * (viewportAspect / meshAspect);
    }
    return scale;
}

} // namespace layershift
