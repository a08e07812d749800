#include "geometry.h"
#include "utils.h"

#include <cmath>
#include <iostream>

namespace kicadfile {

Point rotate_point(const Point& pt, const Point& origin, double angle_deg) {
    double rad = deg_to_rad(angle_deg);
    double dx = pt.x - origin.x;
    double dy = pt.y - origin.y;
    double cos_a = std::cos(rad);
    double sin_a = std::sin(rad);
    return {
        origin.x + dx * cos_a - dy * sin_a,
        origin.y + dx * sin_a + dy * cos_a
    };
}

static double snap(double v) {
    double r = std::round(v / COORD_EPSILON) * COORD_EPSILON;
    return r == 0.0 ? 0.0 : r; // avoid -0
}

Point snap_point(const Point& pt) {
    return {snap(pt.x), snap(pt.y)};
}

bool point_on_segment(const Point& p, const Point& a, const Point& b, double tol) {
    double len = distance(a, b);
    if (len < tol) return distance(p, a) < tol;
    // Perpendicular distance, then projection within the segment
    double cross = (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
    if (std::abs(cross) / len > tol) return false;
    double dot = (p.x - a.x) * (b.x - a.x) + (p.y - a.y) * (b.y - a.y);
    return dot >= -tol * len && dot <= len * len + tol * len;
}

Mirror parse_mirror(const std::string& s) {
    if (s == "x") return Mirror::X;
    if (s == "y") return Mirror::Y;
    return Mirror::None;
}

const char* mirror_name(Mirror m) {
    switch (m) {
        case Mirror::X: return "x";
        case Mirror::Y: return "y";
        default:        return "";
    }
}

int quantize_rotation(double angle_deg) {
    long steps = std::lround(angle_deg / 90.0);
    int q = static_cast<int>(((steps % 4) + 4) % 4);
    return q * 90;
}

int quantize_rotation(double angle_deg, bool verbose) {
    int q = quantize_rotation(angle_deg);
    if (verbose && std::fmod(angle_deg, 90.0) != 0.0)
        std::cerr << "[geometry] rotation " << fmt(angle_deg) << " snapped to " << q << "\n";
    return q;
}

Point transform_pin(const Point& lib_pos, const SymbolTransform& t) {
    // Library Y-up -> sheet Y-down
    double x = lib_pos.x;
    double y = -lib_pos.y;

    if (t.mirror == Mirror::X) y = -y;      // flip about the horizontal axis
    else if (t.mirror == Mirror::Y) x = -x; // flip about the vertical axis

    // Counter-clockwise on screen with Y pointing down
    double rx = x, ry = y;
    switch (quantize_rotation(t.rotation)) {
        case 90:  rx = y;  ry = -x; break;
        case 180: rx = -x; ry = -y; break;
        case 270: rx = -y; ry = x;  break;
        default: break;
    }
    return snap_point({t.origin.x + rx, t.origin.y + ry});
}

int transform_pin_angle(int lib_angle, const SymbolTransform& t) {
    int a = quantize_rotation(lib_angle);
    if (t.mirror == Mirror::X) a = (360 - a) % 360;
    else if (t.mirror == Mirror::Y) a = (540 - a) % 360;
    return (a + quantize_rotation(t.rotation)) % 360;
}

} // namespace kicadfile
