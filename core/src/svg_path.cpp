// Layershift - SVG path parsing and flattening

#include <layershift/svg_path.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace layershift {

namespace {

constexpr double PI = 3.14159265358979323846;

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Length of the number starting at pos, or 0 if none matches there
size_t matchNumber(const std::string& s, size_t pos) {
    size_t i = pos;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

    const size_t mantissaStart = i;
    if (i < s.size() && isDigit(s[i])) {
        while (i < s.size() && isDigit(s[i])) ++i;
        if (i < s.size() && s[i] == '.') {
            ++i;
            while (i < s.size() && isDigit(s[i])) ++i;
        }
    } else if (i + 1 < s.size() && s[i] == '.' && isDigit(s[i + 1])) {
        ++i;
        while (i < s.size() && isDigit(s[i])) ++i;
    }
    if (i == mantissaStart) return 0;

    // Exponent only counts when it has digits
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        size_t e = i + 1;
        if (e < s.size() && (s[e] == '+' || s[e] == '-')) ++e;
        if (e < s.size() && isDigit(s[e])) {
            while (e < s.size() && isDigit(s[e])) ++e;
            i = e;
        }
    }
    return i - pos;
}

double vectorAngle(double ux, double uy, double vx, double vy) {
    const double sign = ux * vy - uy * vx < 0.0 ? -1.0 : 1.0;
    const double dot = ux * vx + uy * vy;
    const double uLen = std::sqrt(ux * ux + uy * uy);
    const double vLen = std::sqrt(vx * vx + vy * vy);
    const double d = dot / (uLen * vLen);
    return sign * std::acos(std::clamp(d, -1.0, 1.0));
}

} // namespace

std::vector<std::string> tokenizeSvgPath(const std::string& d) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < d.size()) {
        const char c = d[pos];
        if (isAlpha(c)) {
            tokens.emplace_back(1, c);
            ++pos;
            continue;
        }
        const size_t len = matchNumber(d, pos);
        if (len > 0) {
            tokens.push_back(d.substr(pos, len));
            pos += len;
        } else {
            ++pos;
        }
    }
    return tokens;
}

std::vector<Contour> parseSvgPath(const std::string& d) {
    std::vector<Contour> contours;
    Contour current;
    double x = 0.0, y = 0.0;
    double startX = 0.0, startY = 0.0;
    double lastCpX = 0.0, lastCpY = 0.0;
    char lastCmd = 0;

    const std::vector<std::string> tokens = tokenizeSvgPath(d);
    size_t i = 0;

    auto nextNum = [&]() -> double {
        if (i >= tokens.size()) return 0.0;
        return std::strtod(tokens[i++].c_str(), nullptr);
    };

    while (i < tokens.size()) {
        const std::string& token = tokens[i];
        char cmd;
        bool explicitCmd = false;

        if (token.size() == 1 && isAlpha(token[0])) {
            cmd = token[0];
            explicitCmd = true;
            ++i;
        } else {
            cmd = lastCmd == 'M' ? 'L' : lastCmd == 'm' ? 'l' : lastCmd;
        }

        const bool rel = std::islower(static_cast<unsigned char>(cmd)) != 0;
        const double ox = rel ? x : 0.0;
        const double oy = rel ? y : 0.0;

        switch (std::toupper(static_cast<unsigned char>(cmd))) {
            case 'M': {
                if (!current.empty()) contours.push_back(std::move(current));
                current.clear();
                x = nextNum() + ox;
                y = nextNum() + oy;
                startX = x;
                startY = y;
                current.push_back(x);
                current.push_back(y);
                lastCpX = x;
                lastCpY = y;
                break;
            }
            case 'L': {
                x = nextNum() + ox;
                y = nextNum() + oy;
                current.push_back(x);
                current.push_back(y);
                lastCpX = x;
                lastCpY = y;
                break;
            }
            case 'H': {
                x = nextNum() + ox;
                current.push_back(x);
                current.push_back(y);
                lastCpX = x;
                lastCpY = y;
                break;
            }
            case 'V': {
                y = nextNum() + oy;
                current.push_back(x);
                current.push_back(y);
                lastCpX = x;
                lastCpY = y;
                break;
            }
            case 'C': {
                const double c1x = nextNum() + ox, c1y = nextNum() + oy;
                const double c2x = nextNum() + ox, c2y = nextNum() + oy;
                const double ex = nextNum() + ox, ey = nextNum() + oy;
                flattenCubicBezier(current, x, y, c1x, c1y, c2x, c2y, ex, ey);
                x = ex;
                y = ey;
                lastCpX = c2x;
                lastCpY = c2y;
                break;
            }
            case 'S': {
                const double c1x = 2.0 * x - lastCpX, c1y = 2.0 * y - lastCpY;
                const double c2x = nextNum() + ox, c2y = nextNum() + oy;
                const double ex = nextNum() + ox, ey = nextNum() + oy;
                flattenCubicBezier(current, x, y, c1x, c1y, c2x, c2y, ex, ey);
                x = ex;
                y = ey;
                lastCpX = c2x;
                lastCpY = c2y;
                break;
            }
            case 'Q': {
                const double cx = nextNum() + ox, cy = nextNum() + oy;
                const double ex = nextNum() + ox, ey = nextNum() + oy;
                flattenQuadraticBezier(current, x, y, cx, cy, ex, ey);
                x = ex;
                y = ey;
                lastCpX = cx;
                lastCpY = cy;
                break;
            }
            case 'T': {
                const double cx = 2.0 * x - lastCpX, cy = 2.0 * y - lastCpY;
                const double ex = nextNum() + ox, ey = nextNum() + oy;
                flattenQuadraticBezier(current, x, y, cx, cy, ex, ey);
                x = ex;
                y = ey;
                lastCpX = cx;
                lastCpY = cy;
                break;
            }
            case 'A': {
                const double rx = nextNum();
                const double ry = nextNum();
                const double rotation = nextNum();
                const bool largeArc = nextNum() != 0.0;
                const bool sweep = nextNum() != 0.0;
                const double ex = nextNum() + ox, ey = nextNum() + oy;
                flattenSvgArc(current, x, y, rx, ry, rotation, largeArc, sweep, ex, ey);
                x = ex;
                y = ey;
                lastCpX = x;
                lastCpY = y;
                break;
            }
            case 'Z': {
                x = startX;
                y = startY;
                if (!current.empty()) contours.push_back(std::move(current));
                current.clear();
                lastCpX = x;
                lastCpY = y;
                // Z takes no arguments; a stray number after it is dropped
                if (!explicitCmd) ++i;
                break;
            }
            default:
                ++i;
                break;
        }

        lastCmd = cmd;
    }

    if (current.size() >= 6) contours.push_back(std::move(current));
    return contours;
}

Contour parseSvgPointsList(const std::string& points) {
    std::vector<std::string> parts;
    std::string part;
    for (char c : points) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!part.empty()) parts.push_back(std::move(part));
            part.clear();
        } else {
            part.push_back(c);
        }
    }
    if (!part.empty()) parts.push_back(std::move(part));

    Contour coords;
    for (size_t i = 0; i + 1 < parts.size(); i += 2) {
        char* endX = nullptr;
        char* endY = nullptr;
        const double px = std::strtod(parts[i].c_str(), &endX);
        const double py = std::strtod(parts[i + 1].c_str(), &endY);
        if (endX == parts[i].c_str() || endY == parts[i + 1].c_str()) continue;
        if (std::isfinite(px) && std::isfinite(py)) {
            coords.push_back(px);
            coords.push_back(py);
        }
    }
    return coords;
}

Contour ellipseToPolygon(double cx, double cy, double rx, double ry, int segments) {
    Contour coords;
    coords.reserve(static_cast<size_t>(segments) * 2);
    for (int i = 0; i < segments; ++i) {
        const double angle = 2.0 * PI * i / segments;
        coords.push_back(cx + rx * std::cos(angle));
        coords.push_back(cy + ry * std::sin(angle));
    }
    return coords;
}

void flattenCubicBezier(Contour& out,
                        double x0, double y0,
                        double cp1x, double cp1y,
                        double cp2x, double cp2y,
                        double x3, double y3,
                        int depth) {
    if (depth > SVG_MAX_SUBDIVISION_DEPTH) {
        out.push_back(x3);
        out.push_back(y3);
        return;
    }

    const double dx = x3 - x0;
    const double dy = y3 - y0;
    const double d = std::sqrt(dx * dx + dy * dy);
    if (d < 1e-6) {
        out.push_back(x3);
        out.push_back(y3);
        return;
    }

    const double d1 = std::abs((cp1x - x3) * dy - (cp1y - y3) * dx) / d;
    const double d2 = std::abs((cp2x - x3) * dy - (cp2y - y3) * dx) / d;
    if (d1 + d2 < SVG_FLATNESS_TOLERANCE) {
        out.push_back(x3);
        out.push_back(y3);
        return;
    }

    const double mx01 = (x0 + cp1x) / 2, my01 = (y0 + cp1y) / 2;
    const double mx12 = (cp1x + cp2x) / 2, my12 = (cp1y + cp2y) / 2;
    const double mx23 = (cp2x + x3) / 2, my23 = (cp2y + y3) / 2;
    const double mx012 = (mx01 + mx12) / 2, my012 = (my01 + my12) / 2;
    const double mx123 = (mx12 + mx23) / 2, my123 = (my12 + my23) / 2;
    const double mx = (mx012 + mx123) / 2, my = (my012 + my123) / 2;

    flattenCubicBezier(out, x0, y0, mx01, my01, mx012, my012, mx, my, depth + 1);
    flattenCubicBezier(out, mx, my, mx123, my123, mx23, my23, x3, y3, depth + 1);
}

void flattenQuadraticBezier(Contour& out,
                            double x0, double y0,
                            double cpx, double cpy,
                            double x2, double y2) {
    const double cp1x = x0 + (2.0 / 3.0) * (cpx - x0);
    const double cp1y = y0 + (2.0 / 3.0) * (cpy - y0);
    const double cp2x = x2 + (2.0 / 3.0) * (cpx - x2);
    const double cp2y = y2 + (2.0 / 3.0) * (cpy - y2);
    flattenCubicBezier(out, x0, y0, cp1x, cp1y, cp2x, cp2y, x2, y2);
}

void flattenSvgArc(Contour& out,
                   double x1, double y1,
                   double rxIn, double ryIn,
                   double xRotationDeg,
                   bool largeArc, bool sweep,
                   double x2, double y2) {
    if (rxIn == 0.0 || ryIn == 0.0) {
        out.push_back(x2);
        out.push_back(y2);
        return;
    }

    double rx = std::abs(rxIn);
    double ry = std::abs(ryIn);
    const double phi = xRotationDeg * PI / 180.0;
    const double cosPhi = std::cos(phi);
    const double sinPhi = std::sin(phi);

    // Endpoint to center parameterization (SVG 1.1 appendix F.6.5)
    const double dx2 = (x1 - x2) / 2;
    const double dy2 = (y1 - y2) / 2;
    const double x1p = cosPhi * dx2 + sinPhi * dy2;
    const double y1p = -sinPhi * dx2 + cosPhi * dy2;

    const double lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
    if (lambda > 1.0) {
        const double s = std::sqrt(lambda);
        rx *= s;
        ry *= s;
    }

    const double rxSq = rx * rx;
    const double rySq = ry * ry;
    const double x1pSq = x1p * x1p;
    const double y1pSq = y1p * y1p;

    const double denom = rxSq * y1pSq + rySq * x1pSq;
    double sq = denom > 0.0 ? std::max(0.0, (rxSq * rySq - rxSq * y1pSq - rySq * x1pSq) / denom) : 0.0;
    sq = std::sqrt(sq);
    if (largeArc == sweep) sq = -sq;

    const double cxp = sq * (rx * y1p) / ry;
    const double cyp = sq * -(ry * x1p) / rx;

    const double cx = cosPhi * cxp - sinPhi * cyp + (x1 + x2) / 2;
    const double cy = sinPhi * cxp + cosPhi * cyp + (y1 + y2) / 2;

    const double theta1 = vectorAngle(1.0, 0.0, (x1p - cxp) / rx, (y1p - cyp) / ry);
    double dtheta = vectorAngle((x1p - cxp) / rx, (y1p - cyp) / ry,
                                (-x1p - cxp) / rx, (-y1p - cyp) / ry);

    if (!sweep && dtheta > 0) dtheta -= 2.0 * PI;
    if (sweep && dtheta < 0) dtheta += 2.0 * PI;

    const int segments = std::max(4, static_cast<int>(std::ceil(std::abs(dtheta) / (PI / 16.0))));
    for (int i = 1; i <= segments; ++i) {
        const double t = theta1 + (static_cast<double>(i) / segments) * dtheta;
        const double cosT = std::cos(t);
        const double sinT = std::sin(t);
        out.push_back(cosPhi * rx * cosT - sinPhi * ry * sinT + cx);
        out.push_back(sinPhi * rx * cosT + cosPhi * ry * sinT + cy);
    }
}

} // namespace layershift
