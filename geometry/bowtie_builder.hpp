#ifndef BOWTIEMODEL_GEOMETRY_BOWTIE_BUILDER_HPP
#define BOWTIEMODEL_GEOMETRY_BOWTIE_BUILDER_HPP

#include "placement.hpp"
#include "primitives.hpp"
#include "vec3.hpp"
#include <array>
#include <optional>

namespace bowtiemodel {

// Padding around the antenna extent for the detail view, in grid cells
constexpr double DETAIL_VIEW_PADDING_CELLS = 2.0;

// Everything the emitter needs to describe one antenna variant
struct BowtieGeometry {
    Vec3 feed_point;
    std::array<Triangle, 2> wings;        // [0] toward +x, [1] toward -x
    std::optional<Vec3> probe_point;
    GeometryView full_view;
    GeometryView detail_view;

    Vec3 antenna_min() const {
        return wings[0].min_corner().min(wings[1].min_corner());
    }

    Vec3 antenna_max() const {
        return wings[0].max_corner().max(wings[1].max_corner());
    }
};

// Immutable inputs of one build
struct BowtieContext {
    const Domain& domain;
    const GridSpacing& spacing;
    const BowtieSpec& bowtie;
    const Placement& placement;
};

class BowtieBuilder {
public:
    BowtieBuilder(const Domain& domain,
                  const GridSpacing& spacing,
                  const BowtieSpec& bowtie,
                  const Placement& placement);

    // Validate inputs and derive the complete geometry.
    // Throws InvalidGeometryError, DegenerateGeometryError or UnknownVariantError.
    BowtieGeometry build() const;

private:
    BowtieContext ctx_;

    void validate_inputs() const;
    Triangle build_wing(const Vec3& feed, int wing_index) const;
    Vec3 wing_shift(int wing_index) const;
    GeometryView make_full_view() const;
    GeometryView make_detail_view(const Vec3& antenna_min, const Vec3& antenna_max) const;
    void check_triangle(const Triangle& wing, int wing_index) const;
    void check_inside_domain(const Vec3& p, const char* what) const;
    void check_feed_clearance(const BowtieGeometry& geometry) const;
};

// Main entry point
BowtieGeometry build_bowtie(const Domain& domain,
                            const GridSpacing& spacing,
                            const BowtieSpec& bowtie,
                            const Placement& placement);

// Longitudinal direction of a wing: +1 for wing 0, -1 for wing 1
constexpr double wing_direction(int wing_index) {
    return wing_index == 0 ? 1.0 : -1.0;
}

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_GEOMETRY_BOWTIE_BUILDER_HPP
