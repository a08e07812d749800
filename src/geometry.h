#pragma once

#include <cmath>
#include <string>

namespace kicadfile {

constexpr double PI = 3.14159265358979323846;

// Coordinates closer than this (mm) are the same electrical point
constexpr double COORD_EPSILON = 1e-4;

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x, double y) : x(x), y(y) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    Point operator*(double s) const { return {x * s, y * s}; }
    bool operator==(const Point& o) const {
        return std::abs(x - o.x) < 1e-6 && std::abs(y - o.y) < 1e-6;
    }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

inline double distance(const Point& a, const Point& b) {
    double dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

inline double deg_to_rad(double deg) { return deg * PI / 180.0; }

// Rotate a point around an origin by angle_deg (counter-clockwise in Y-up
// math convention; board footprints use this with KiCad's sign)
Point rotate_point(const Point& pt, const Point& origin, double angle_deg);

// Round to the coordinate resolution used for comparisons
Point snap_point(const Point& pt);

// True when p lies on segment a-b (end points included)
bool point_on_segment(const Point& p, const Point& a, const Point& b,
                      double tol = COORD_EPSILON);

enum class Mirror { None, X, Y };

Mirror parse_mirror(const std::string& s);
const char* mirror_name(Mirror m);

// Reduce any angle to 0, 90, 180 or 270
int quantize_rotation(double angle_deg);
// Same, reporting an off-grid angle on std::cerr when verbose
int quantize_rotation(double angle_deg, bool verbose);

// Placement of a symbol instance on the sheet
struct SymbolTransform {
    Point origin;
    int rotation = 0;            // degrees, counter-clockwise on screen
    Mirror mirror = Mirror::None;
};

// Map a library pin position (Y-up, relative to the symbol anchor) to
// absolute schematic coordinates (Y-down). The mirror is applied to the
// local point first, then the rotation, then the translation.
Point transform_pin(const Point& lib_pos, const SymbolTransform& t);

// Rotate an angle-bearing pin direction the same way (for orientation)
int transform_pin_angle(int lib_angle, const SymbolTransform& t);

} // namespace kicadfile
