// Layershift - Ear-clipping triangulation over an index arena

#include <layershift/earcut.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace layershift {

namespace {

constexpr uint32_t NIL = std::numeric_limits<uint32_t>::max();

struct Node {
    uint32_t i = 0;  // vertex index into the coordinate array
    double x = 0.0;
    double y = 0.0;
    uint32_t prev = NIL;
    uint32_t next = NIL;
    int32_t z = 0;
    uint32_t prevZ = NIL;
    uint32_t nextZ = NIL;
    bool steiner = false;
};

// Nodes are addressed by index only; never hold a Node& across createNode().
class Earcut {
public:
    explicit Earcut(const std::vector<float>& coords) : m_coords(coords) {}

    std::vector<uint32_t> run(const std::vector<uint32_t>& holeStarts) {
        const size_t total = m_coords.size() & ~static_cast<size_t>(1);
        const bool hasHoles = !holeStarts.empty();
        const size_t outerLen = hasHoles ? std::min<size_t>(holeStarts[0] * 2u, total) : total;

        m_nodes.reserve(total / 2 + holeStarts.size() * 2 + 8);

        uint32_t outer = linkedList(0, outerLen, true);
        if (outer == NIL || n(outer).next == n(outer).prev) {
            return {};
        }

        if (hasHoles) {
            outer = eliminateHoles(holeStarts, outer, total);
        }

        // z-order hashing for large shapes
        if (total > 80 * 2) {
            double minX = std::numeric_limits<double>::infinity();
            double minY = minX;
            double maxX = -minX;
            double maxY = -minX;
            for (size_t i = 0; i < outerLen; i += 2) {
                const double x = m_coords[i];
                const double y = m_coords[i + 1];
                minX = std::min(minX, x);
                minY = std::min(minY, y);
                maxX = std::max(maxX, x);
                maxY = std::max(maxY, y);
            }
            const double size = std::max(maxX - minX, maxY - minY);
            m_minX = minX;
            m_minY = minY;
            m_invSize = size != 0.0 ? 32767.0 / size : 0.0;
        }

        earcutLinked(outer, 0);
        return std::move(m_triangles);
    }

private:
    Node& n(uint32_t id) { return m_nodes[id]; }

    uint32_t createNode(uint32_t i, double x, double y) {
        Node node;
        node.i = i;
        node.x = x;
        node.y = y;
        m_nodes.push_back(node);
        return static_cast<uint32_t>(m_nodes.size() - 1);
    }

    uint32_t insertNode(uint32_t i, double x, double y, uint32_t last) {
        const uint32_t p = createNode(i, x, y);
        if (last == NIL) {
            n(p).prev = p;
            n(p).next = p;
        } else {
            const uint32_t lastNext = n(last).next;
            n(p).next = lastNext;
            n(p).prev = last;
            n(lastNext).prev = p;
            n(last).next = p;
        }
        return p;
    }

    void removeNode(uint32_t p) {
        const uint32_t next = n(p).next;
        const uint32_t prev = n(p).prev;
        n(next).prev = prev;
        n(prev).next = next;
        if (n(p).prevZ != NIL) n(n(p).prevZ).nextZ = n(p).nextZ;
        if (n(p).nextZ != NIL) n(n(p).nextZ).prevZ = n(p).prevZ;
    }

    void emit(uint32_t a, uint32_t b, uint32_t c) {
        m_triangles.push_back(n(a).i);
        m_triangles.push_back(n(b).i);
        m_triangles.push_back(n(c).i);
    }

    uint32_t linkedList(size_t start, size_t end, bool clockwise) {
        uint32_t last = NIL;
        if (clockwise == (earcutSignedArea(m_coords, start, end) > 0.0)) {
            for (size_t i = start; i < end; i += 2) {
                last = insertNode(static_cast<uint32_t>(i / 2), m_coords[i], m_coords[i + 1], last);
            }
        } else {
            for (size_t i = end; i >= start + 2; i -= 2) {
                const size_t k = i - 2;
                last = insertNode(static_cast<uint32_t>(k / 2), m_coords[k], m_coords[k + 1], last);
            }
        }

        if (last != NIL && equals(last, n(last).next)) {
            removeNode(last);
            last = n(last).next;
        }
        if (last == NIL) return NIL;
        return n(last).next;
    }

    uint32_t filterPoints(uint32_t start, uint32_t end = NIL) {
        if (end == NIL) end = start;
        uint32_t p = start;
        bool again;
        do {
            again = false;
            if (!n(p).steiner && (equals(p, n(p).next) || area(n(p).prev, p, n(p).next) == 0.0)) {
                removeNode(p);
                p = end = n(p).prev;
                if (p == n(p).next) break;
                again = true;
            } else {
                p = n(p).next;
            }
        } while (again || p != end);
        return end;
    }

    void earcutLinked(uint32_t ear, int pass) {
        if (ear == NIL) return;
        if (pass == 0 && m_invSize != 0.0) indexCurve(ear);

        uint32_t stop = ear;
        while (n(ear).prev != n(ear).next) {
            const uint32_t prev = n(ear).prev;
            const uint32_t next = n(ear).next;

            if (m_invSize != 0.0 ? isEarHashed(ear) : isEar(ear)) {
                emit(prev, ear, next);
                removeNode(ear);
                ear = n(next).next;
                stop = n(next).next;
                continue;
            }

            ear = next;
            if (ear == stop) {
                if (pass == 0) {
                    earcutLinked(filterPoints(ear), 1);
                } else if (pass == 1) {
                    ear = cureLocalIntersections(filterPoints(ear));
                    earcutLinked(ear, 2);
                } else if (pass == 2) {
                    splitEarcut(ear);
                }
                break;
            }
        }
    }

    bool inBox(uint32_t p, double x0, double y0, double x1, double y1) {
        return n(p).x >= x0 && n(p).x <= x1 && n(p).y >= y0 && n(p).y <= y1;
    }

    bool isEar(uint32_t ear) {
        const uint32_t a = n(ear).prev;
        const uint32_t b = ear;
        const uint32_t c = n(ear).next;
        if (area(a, b, c) >= 0.0) return false;  // reflex

        const double ax = n(a).x, bx = n(b).x, cx = n(c).x;
        const double ay = n(a).y, by = n(b).y, cy = n(c).y;
        const double x0 = std::min({ax, bx, cx}), y0 = std::min({ay, by, cy});
        const double x1 = std::max({ax, bx, cx}), y1 = std::max({ay, by, cy});

        uint32_t p = n(c).next;
        while (p != a) {
            if (inBox(p, x0, y0, x1, y1) &&
                pointInTriangle(ax, ay, bx, by, cx, cy, n(p).x, n(p).y) &&
                area(n(p).prev, p, n(p).next) >= 0.0) {
                return false;
            }
            p = n(p).next;
        }
        return true;
    }

    bool blocksEar(uint32_t p, uint32_t a, uint32_t c,
                   double ax, double ay, double bx, double by, double cx, double cy,
                   double x0, double y0, double x1, double y1) {
        return inBox(p, x0, y0, x1, y1) && p != a && p != c &&
               pointInTriangle(ax, ay, bx, by, cx, cy, n(p).x, n(p).y) &&
               area(n(p).prev, p, n(p).next) >= 0.0;
    }

    bool isEarHashed(uint32_t ear) {
        const uint32_t a = n(ear).prev;
        const uint32_t b = ear;
        const uint32_t c = n(ear).next;
        if (area(a, b, c) >= 0.0) return false;

        const double ax = n(a).x, bx = n(b).x, cx = n(c).x;
        const double ay = n(a).y, by = n(b).y, cy = n(c).y;
        const double x0 = std::min({ax, bx, cx}), y0 = std::min({ay, by, cy});
        const double x1 = std::max({ax, bx, cx}), y1 = std::max({ay, by, cy});

        const int32_t minZ = zOrder(x0, y0);
        const int32_t maxZ = zOrder(x1, y1);

        uint32_t p = n(ear).prevZ;
        uint32_t q = n(ear).nextZ;

        while (p != NIL && n(p).z >= minZ && q != NIL && n(q).z <= maxZ) {
            if (blocksEar(p, a, c, ax, ay, bx, by, cx, cy, x0, y0, x1, y1)) return false;
            p = n(p).prevZ;
            if (blocksEar(q, a, c, ax, ay, bx, by, cx, cy, x0, y0, x1, y1)) return false;
            q = n(q).nextZ;
        }
        while (p != NIL && n(p).z >= minZ) {
            if (blocksEar(p, a, c, ax, ay, bx, by, cx, cy, x0, y0, x1, y1)) return false;
            p = n(p).prevZ;
        }
        while (q != NIL && n(q).z <= maxZ) {
            if (blocksEar(q, a, c, ax, ay, bx, by, cx, cy, x0, y0, x1, y1)) return false;
            q = n(q).nextZ;
        }
        return true;
    }

    uint32_t cureLocalIntersections(uint32_t start) {
        uint32_t p = start;
        do {
            const uint32_t a = n(p).prev;
            const uint32_t b = n(n(p).next).next;

            if (!equals(a, b) && intersects(a, p, n(p).next, b) && locallyInside(a, b) && locallyInside(b, a)) {
                emit(a, p, b);
                removeNode(p);
                removeNode(n(p).next);
                p = start = b;
            }
            p = n(p).next;
        } while (p != start);
        return filterPoints(p);
    }

    void splitEarcut(uint32_t start) {
        uint32_t a = start;
        do {
            uint32_t b = n(n(a).next).next;
            while (b != n(a).prev) {
                if (n(a).i != n(b).i && isValidDiagonal(a, b)) {
                    uint32_t c = splitPolygon(a, b);
                    a = filterPoints(a, n(a).next);
                    c = filterPoints(c, n(c).next);
                    earcutLinked(a, 0);
                    earcutLinked(c, 0);
                    return;
                }
                b = n(b).next;
            }
            a = n(a).next;
        } while (a != start);
    }

    uint32_t eliminateHoles(const std::vector<uint32_t>& holeStarts, uint32_t outer, size_t total) {
        std::vector<uint32_t> queue;
        for (size_t k = 0; k < holeStarts.size(); ++k) {
            const size_t start = std::min<size_t>(holeStarts[k] * 2u, total);
            const size_t end = k + 1 < holeStarts.size() ? std::min<size_t>(holeStarts[k + 1] * 2u, total) : total;
            const uint32_t list = linkedList(start, end, false);
            if (list != NIL) {
                if (list == n(list).next) n(list).steiner = true;
                queue.push_back(getLeftmost(list));
            }
        }

        std::stable_sort(queue.begin(), queue.end(),
                         [this](uint32_t a, uint32_t b) { return n(a).x < n(b).x; });

        for (uint32_t hole : queue) {
            outer = eliminateHole(hole, outer);
        }
        return outer;
    }

    uint32_t eliminateHole(uint32_t hole, uint32_t outer) {
        const uint32_t bridge = findHoleBridge(hole, outer);
        if (bridge == NIL) return outer;

        const uint32_t bridgeReverse = splitPolygon(bridge, hole);
        filterPoints(bridgeReverse, n(bridgeReverse).next);
        return filterPoints(bridge, n(bridge).next);
    }

    uint32_t findHoleBridge(uint32_t hole, uint32_t outer) {
        uint32_t p = outer;
        const double hx = n(hole).x;
        const double hy = n(hole).y;
        double qx = -std::numeric_limits<double>::infinity();
        uint32_t m = NIL;

        // Segment of the outer ring left of the hole point, closest along the ray
        do {
            const uint32_t next = n(p).next;
            if (hy <= n(p).y && hy >= n(next).y && n(next).y != n(p).y) {
                const double x = n(p).x + (hy - n(p).y) / (n(next).y - n(p).y) * (n(next).x - n(p).x);
                if (x <= hx && x > qx) {
                    qx = x;
                    m = n(p).x < n(next).x ? p : next;
                    if (x == hx) return m;
                }
            }
            p = next;
        } while (p != outer);

        if (m == NIL) return NIL;

        // Prefer the visible vertex with the smallest angle to the ray
        const uint32_t stop = m;
        const double mx = n(m).x;
        const double my = n(m).y;
        double tanMin = std::numeric_limits<double>::infinity();

        p = m;
        do {
            if (hx >= n(p).x && n(p).x >= mx && hx != n(p).x &&
                pointInTriangle(hy < my ? hx : qx, hy, mx, my, hy < my ? qx : hx, hy, n(p).x, n(p).y)) {
                const double tan = std::abs(hy - n(p).y) / (hx - n(p).x);
                if (locallyInside(p, hole) &&
                    (tan < tanMin || (tan == tanMin && (n(p).x > n(m).x || sectorContainsSector(m, p))))) {
                    m = p;
                    tanMin = tan;
                }
            }
            p = n(p).next;
        } while (p != stop);

        return m;
    }

    bool sectorContainsSector(uint32_t m, uint32_t p) {
        return area(n(m).prev, m, n(p).prev) < 0.0 && area(n(p).next, m, n(m).next) < 0.0;
    }

    void indexCurve(uint32_t start) {
        uint32_t p = start;
        do {
            if (n(p).z == 0) n(p).z = zOrder(n(p).x, n(p).y);
            n(p).prevZ = n(p).prev;
            n(p).nextZ = n(p).next;
            p = n(p).next;
        } while (p != start);

        n(n(p).prevZ).nextZ = NIL;
        n(p).prevZ = NIL;
        sortLinked(p);
    }

    // Simon Tatham's linked-list merge sort on the z links
    uint32_t sortLinked(uint32_t list) {
        int inSize = 1;
        int numMerges;
        do {
            uint32_t p = list;
            list = NIL;
            uint32_t tail = NIL;
            numMerges = 0;

            while (p != NIL) {
                ++numMerges;
                uint32_t q = p;
                int pSize = 0;
                for (int i = 0; i < inSize; ++i) {
                    ++pSize;
                    q = n(q).nextZ;
                    if (q == NIL) break;
                }

                int qSize = inSize;
                while (pSize > 0 || (qSize > 0 && q != NIL)) {
                    uint32_t e;
                    if (pSize != 0 && (qSize == 0 || q == NIL || n(p).z <= n(q).z)) {
                        e = p;
                        p = n(p).nextZ;
                        --pSize;
                    } else {
                        e = q;
                        q = n(q).nextZ;
                        --qSize;
                    }

                    if (tail != NIL) {
                        n(tail).nextZ = e;
                    } else {
                        list = e;
                    }
                    n(e).prevZ = tail;
                    tail = e;
                }
                p = q;
            }
            n(tail).nextZ = NIL;
            inSize *= 2;
        } while (numMerges > 1);

        return list;
    }

    int32_t zOrder(double x, double y) const {
        uint32_t lx = static_cast<uint32_t>(static_cast<int32_t>((x - m_minX) * m_invSize));
        uint32_t ly = static_cast<uint32_t>(static_cast<int32_t>((y - m_minY) * m_invSize));

        lx = (lx | (lx << 8)) & 0x00FF00FFu;
        lx = (lx | (lx << 4)) & 0x0F0F0F0Fu;
        lx = (lx | (lx << 2)) & 0x33333333u;
        lx = (lx | (lx << 1)) & 0x55555555u;

        ly = (ly | (ly << 8)) & 0x00FF00FFu;
        ly = (ly | (ly << 4)) & 0x0F0F0F0Fu;
        ly = (ly | (ly << 2)) & 0x33333333u;
        ly = (ly | (ly << 1)) & 0x55555555u;

        return static_cast<int32_t>(lx | (ly << 1));
    }

    uint32_t getLeftmost(uint32_t start) {
        uint32_t p = start;
        uint32_t leftmost = start;
        do {
            if (n(p).x < n(leftmost).x || (n(p).x == n(leftmost).x && n(p).y < n(leftmost).y)) {
                leftmost = p;
            }
            p = n(p).next;
        } while (p != start);
        return leftmost;
    }

    static bool pointInTriangle(double ax, double ay, double bx, double by,
                                double cx, double cy, double px, double py) {
        return (cx - px) * (ay - py) - (ax - px) * (cy - py) >= 0.0 &&
               (ax - px) * (by - py) - (bx - px) * (ay - py) >= 0.0 &&
               (bx - px) * (cy - py) - (cx - px) * (by - py) >= 0.0;
    }

    bool isValidDiagonal(uint32_t a, uint32_t b) {
        return n(n(a).next).i != n(b).i && n(n(a).prev).i != n(b).i && !intersectsPolygon(a, b) &&
               ((locallyInside(a, b) && locallyInside(b, a) && middleInside(a, b) &&
                 (area(n(a).prev, a, n(b).prev) != 0.0 || area(a, n(b).prev, b) != 0.0)) ||
                (equals(a, b) && area(n(a).prev, a, n(a).next) > 0.0 && area(n(b).prev, b, n(b).next) > 0.0));
    }

    double area(uint32_t p, uint32_t q, uint32_t r) {
        return (n(q).y - n(p).y) * (n(r).x - n(q).x) - (n(q).x - n(p).x) * (n(r).y - n(q).y);
    }

    bool equals(uint32_t a, uint32_t b) {
        return n(a).x == n(b).x && n(a).y == n(b).y;
    }

    static int sign(double v) {
        return v > 0.0 ? 1 : (v < 0.0 ? -1 : 0);
    }

    bool intersects(uint32_t p1, uint32_t q1, uint32_t p2, uint32_t q2) {
        const int o1 = sign(area(p1, q1, p2));
        const int o2 = sign(area(p1, q1, q2));
        const int o3 = sign(area(p2, q2, p1));
        const int o4 = sign(area(p2, q2, q1));

        if (o1 != o2 && o3 != o4) return true;
        if (o1 == 0 && onSegment(p1, p2, q1)) return true;
        if (o2 == 0 && onSegment(p1, q2, q1)) return true;
        if (o3 == 0 && onSegment(p2, p1, q2)) return true;
        if (o4 == 0 && onSegment(p2, q1, q2)) return true;
        return false;
    }

    bool onSegment(uint32_t p, uint32_t q, uint32_t r) {
        return n(q).x <= std::max(n(p).x, n(r).x) && n(q).x >= std::min(n(p).x, n(r).x) &&
               n(q).y <= std::max(n(p).y, n(r).y) && n(q).y >= std::min(n(p).y, n(r).y);
    }

    bool intersectsPolygon(uint32_t a, uint32_t b) {
        uint32_t p = a;
        do {
            const uint32_t next = n(p).next;
            if (n(p).i != n(a).i && n(next).i != n(a).i && n(p).i != n(b).i && n(next).i != n(b).i &&
                intersects(p, next, a, b)) {
                return true;
            }
            p = next;
        } while (p != a);
        return false;
    }

    bool locallyInside(uint32_t a, uint32_t b) {
        return area(n(a).prev, a, n(a).next) < 0.0
            ? area(a, b, n(a).next) >= 0.0 && area(a, n(a).prev, b) >= 0.0
            : area(a, b, n(a).prev) < 0.0 || area(a, n(a).next, b) < 0.0;
    }

    bool middleInside(uint32_t a, uint32_t b) {
        uint32_t p = a;
        bool inside = false;
        const double px = (n(a).x + n(b).x) / 2.0;
        const double py = (n(a).y + n(b).y) / 2.0;
        do {
            const uint32_t next = n(p).next;
            if ((n(p).y > py) != (n(next).y > py) && n(next).y != n(p).y &&
                px < (n(next).x - n(p).x) * (py - n(p).y) / (n(next).y - n(p).y) + n(p).x) {
                inside = !inside;
            }
            p = next;
        } while (p != a);
        return inside;
    }

    // Link a to b, returning the duplicate of b on the split-off ring
    uint32_t splitPolygon(uint32_t a, uint32_t b) {
        const uint32_t a2 = createNode(n(a).i, n(a).x, n(a).y);
        const uint32_t b2 = createNode(n(b).i, n(b).x, n(b).y);
        const uint32_t an = n(a).next;
        const uint32_t bp = n(b).prev;

        n(a).next = b;
        n(b).prev = a;

        n(a2).next = an;
        n(an).prev = a2;

        n(b2).next = a2;
        n(a2).prev = b2;

        n(bp).next = b2;
        n(b2).prev = bp;

        return b2;
    }

    const std::vector<float>& m_coords;
    std::vector<Node> m_nodes;
    std::vector<uint32_t> m_triangles;
    double m_minX = 0.0;
    double m_minY = 0.0;
    double m_invSize = 0.0;
};

} // namespace

double earcutSignedArea(const std::vector<float>& coords, size_t begin, size_t end) {
    double sum = 0.0;
    if (end < begin + 2) return sum;
    for (size_t i = begin, j = end - 2; i < end; i += 2) {
        sum += (static_cast<double>(coords[j]) - coords[i]) * (static_cast<double>(coords[i + 1]) + coords[j + 1]);
        j = i;
    }
    return sum;
}

std::vector<uint32_t> earcut(const std::vector<float>& coords, const std::vector<uint32_t>& holeStarts) {
    if (coords.size() < 6) return {};
    Earcut cutter(coords);
    return cutter.run(holeStarts);
}

} // namespace layershift
