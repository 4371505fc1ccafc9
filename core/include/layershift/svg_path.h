#pragma once

/**
 * @file svg_path.h
 * @brief SVG path data parsing and curve flattening
 *
 * Turns a path `d` attribute into closed polylines. Curves are flattened
 * adaptively in source units, so the tolerance is relative to the SVG's own
 * coordinate system rather than the final normalized mesh.
 */

#include <string>
#include <vector>

namespace layershift {

/// Flat x,y pairs of one closed outline, in source coordinates
using Contour = std::vector<double>;

/// Maximum summed control-point distance from the chord for a flat cubic
constexpr double SVG_FLATNESS_TOLERANCE = 0.5;

/// Recursion limit for cubic subdivision
constexpr int SVG_MAX_SUBDIVISION_DEPTH = 12;

/// Segment count for circle and ellipse elements
constexpr int SVG_ELLIPSE_SEGMENTS = 64;

/**
 * @brief Split path data into command letters and numbers
 *
 * Numbers follow `[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?`; any other
 * character (whitespace, commas, stray symbols) separates tokens.
 */
std::vector<std::string> tokenizeSvgPath(const std::string& d);

/**
 * @brief Parse path data into contours
 *
 * Supports M L H V C S Q T A Z in absolute and relative form. Extra
 * coordinates after M/m repeat as L/l. Each Z closes a contour; an open
 * trailing subpath is kept only when it has at least three points.
 */
std::vector<Contour> parseSvgPath(const std::string& d);

/// @brief Parse a points attribute ("x1,y1 x2,y2 ...")
Contour parseSvgPointsList(const std::string& points);

/// @brief Approximate an ellipse with evenly spaced vertices
Contour ellipseToPolygon(double cx, double cy, double rx, double ry,
                         int segments = SVG_ELLIPSE_SEGMENTS);

/**
 * @brief Append a flattened cubic Bezier (excluding its start point)
 *
 * De Casteljau split at t = 0.5 until d1 + d2 < SVG_FLATNESS_TOLERANCE
 * or the depth limit is reached.
 */
void flattenCubicBezier(Contour& out,
                        double x0, double y0,
                        double cp1x, double cp1y,
                        double cp2x, double cp2y,
                        double x3, double y3,
                        int depth = 0);

/// @brief Append a flattened quadratic Bezier via its cubic equivalent
void flattenQuadraticBezier(Contour& out,
                            double x0, double y0,
                            double cpx, double cpy,
                            double x2, double y2);

/**
 * @brief Append a flattened elliptical arc (SVG endpoint parameterization)
 *
 * Radii too small to span the endpoints are scaled up. The sweep is sampled
 * in max(4, ceil(|dTheta| / (pi/16))) segments.
 */
void flattenSvgArc(Contour& out,
                   double x1, double y1,
                   double rx, double ry,
                   double xRotationDeg,
                   bool largeArc, bool sweep,
                   double x2, double y2);

} // namespace layershift
