#ifndef BOWTIEMODEL_GEOMETRY_PRIMITIVES_HPP
#define BOWTIEMODEL_GEOMETRY_PRIMITIVES_HPP

#include "vec3.hpp"
#include <array>
#include <string>

namespace bowtiemodel {

// Simulation volume extent in meters, origin at (0, 0, 0)
struct Domain {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3 extent() const { return {x, y, z}; }
    Vec3 center() const { return extent() * 0.5; }
};

// Spatial discretisation step of the solver grid
struct GridSpacing {
    double dx = 0.0;
    double dy = 0.0;
    double dz = 0.0;

    Vec3 step() const { return {dx, dy, dz}; }
};

// Dimensions of one triangular wing
struct BowtieSpec {
    double length = 0.0;   // Feed-to-apex distance along the longitudinal axis
    double height = 0.0;   // Base width along the transverse axis
};

// Flat conductor sheet
struct Triangle {
    std::array<Vec3, 3> vertices;
    double thickness = 0.0;          // 0 = infinitely thin sheet
    std::string material = "pec";

    Vec3 min_corner() const {
        return vertices[0].min(vertices[1]).min(vertices[2]);
    }

    Vec3 max_corner() const {
        return vertices[0].max(vertices[1]).max(vertices[2]);
    }

    // Twice the area, as the length of the edge cross product
    double doubled_area() const {
        return (vertices[1] - vertices[0]).cross(vertices[2] - vertices[0]).length();
    }
};

enum class ViewMode {
    Fine,     // Per-edge sampling
    Coarse    // Per-cell sampling
};

// Axis-aligned volume exported for inspecting the generated geometry
struct GeometryView {
    Vec3 min_corner;
    Vec3 max_corner;
    Vec3 step;
    std::string id;
    ViewMode mode = ViewMode::Coarse;

    bool contains(const Vec3& p) const {
        return p.x >= min_corner.x && p.x <= max_corner.x &&
               p.y >= min_corner.y && p.y <= max_corner.y &&
               p.z >= min_corner.z && p.z <= max_corner.z;
    }
};

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_GEOMETRY_PRIMITIVES_HPP
