#ifndef BOWTIEMODEL_GEOMETRY_AXIS_HPP
#define BOWTIEMODEL_GEOMETRY_AXIS_HPP

#include "vec3.hpp"
#include <cstddef>
#include <string>

namespace bowtiemodel {

enum class Axis { X = 0, Y = 1, Z = 2 };

// Antenna frame: wings extend along x, base vertices spread along y,
// the wing sheets lie in a plane of constant z
constexpr Axis LONGITUDINAL_AXIS = Axis::X;
constexpr Axis TRANSVERSE_AXIS = Axis::Y;
constexpr Axis NORMAL_AXIS = Axis::Z;

constexpr size_t axis_index(Axis axis) {
    return static_cast<size_t>(axis);
}

constexpr char axis_name(Axis axis) {
    switch (axis) {
        case Axis::X: return 'x';
        case Axis::Y: return 'y';
        case Axis::Z: return 'z';
    }
    return '?';
}

constexpr Vec3 axis_unit(Axis axis) {
    switch (axis) {
        case Axis::X: return vec3::unit_x();
        case Axis::Y: return vec3::unit_y();
        case Axis::Z: return vec3::unit_z();
    }
    return vec3::zero();
}

// Parse "x", "y" or "z"; throws UnknownVariantError otherwise
Axis axis_from_string(const std::string& name);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_GEOMETRY_AXIS_HPP
