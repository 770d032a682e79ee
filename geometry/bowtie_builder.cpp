#include "bowtie_builder.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace bowtiemodel {

namespace {

// Relative tolerance below which a triangle counts as collinear
constexpr double COLLINEAR_TOLERANCE = 1e-12;

bool positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

std::string format_vec(const Vec3& v) {
    return "(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " +
           std::to_string(v.z) + ")";
}

}  // namespace

BowtieBuilder::BowtieBuilder(
    const Domain& domain,
    const GridSpacing& spacing,
    const BowtieSpec& bowtie,
    const Placement& placement)
    : ctx_{domain, spacing, bowtie, placement} {}

BowtieGeometry BowtieBuilder::build() const {
    auto log = bowtiemodel::logging::get_logger();

    log->debug("BowtieBuilder: Phase 1 - validating inputs");
    validate_inputs();

    log->debug("BowtieBuilder: Phase 2 - locating reference point ({})",
               variant_name(ctx_.placement.variant));
    BowtieGeometry result;
    result.feed_point = reference_point(ctx_.domain, ctx_.placement);
    check_inside_domain(result.feed_point, "Feed point");
    log->debug("BowtieBuilder: feed at ({}, {}, {})",
               result.feed_point.x, result.feed_point.y, result.feed_point.z);

    log->debug("BowtieBuilder: Phase 3 - building wings");
    for (int i = 0; i < 2; ++i) {
        result.wings[i] = build_wing(result.feed_point, i);
        check_triangle(result.wings[i], i);
        for (const auto& v : result.wings[i].vertices) {
            check_inside_domain(v, "Wing vertex");
        }
    }
    check_feed_clearance(result);

    if (ctx_.placement.receiver) {
        log->debug("BowtieBuilder: Phase 4 - placing receiver probe");
        Vec3 probe = result.feed_point + ctx_.placement.probe_offset;
        check_inside_domain(probe, "Receiver probe");
        result.probe_point = probe;
    }

    log->debug("BowtieBuilder: Phase 5 - deriving geometry views");
    result.full_view = make_full_view();
    result.detail_view = make_detail_view(result.antenna_min(), result.antenna_max());

    log->debug("BowtieBuilder: build complete - extent {} to {}",
               format_vec(result.antenna_min()), format_vec(result.antenna_max()));
    return result;
}

void BowtieBuilder::validate_inputs() const {
    const Domain& d = ctx_.domain;
    if (!positive(d.x) || !positive(d.y) || !positive(d.z)) {
        throw InvalidGeometryError("Domain dimensions must be positive, got " +
                                   format_vec(d.extent()));
    }

    const GridSpacing& s = ctx_.spacing;
    if (!positive(s.dx) || !positive(s.dy) || !positive(s.dz)) {
        throw InvalidGeometryError("Grid spacing must be positive, got " +
                                   format_vec(s.step()));
    }

    if (!positive(ctx_.bowtie.length)) {
        throw InvalidGeometryError("Bowtie length must be positive, got " +
                                   std::to_string(ctx_.bowtie.length));
    }
    if (!positive(ctx_.bowtie.height)) {
        throw InvalidGeometryError("Bowtie height must be positive, got " +
                                   std::to_string(ctx_.bowtie.height));
    }

    validate_feed_offset(ctx_.placement.feed_offset);

    if (ctx_.placement.variant == PlacementVariant::GroundOffset) {
        double h = ctx_.placement.ground_height;
        if (!positive(h) || h >= d.z) {
            throw InvalidGeometryError("Ground offset height must lie inside (0, " +
                                       std::to_string(d.z) + "), got " + std::to_string(h));
        }
    }
}

Vec3 BowtieBuilder::wing_shift(int wing_index) const {
    const FeedOffset& offset = ctx_.placement.feed_offset;
    if (!offset.applies_to(wing_index)) {
        return vec3::zero();
    }

    double magnitude = offset.cells * ctx_.spacing.step()[axis_index(offset.axis)];
    Vec3 shift = axis_unit(offset.axis) * magnitude;
    if (offset.axis == LONGITUDINAL_AXIS) {
        shift = shift * wing_direction(wing_index);
    }
    return shift;
}

Triangle BowtieBuilder::build_wing(const Vec3& feed, int wing_index) const {
    const Vec3 along = axis_unit(LONGITUDINAL_AXIS) * wing_direction(wing_index);
    const Vec3 across = axis_unit(TRANSVERSE_AXIS);
    const Vec3 origin = feed + wing_shift(wing_index);
    const double half_height = ctx_.bowtie.height * 0.5;

    Triangle wing;
    wing.vertices[0] = origin - across * half_height;
    wing.vertices[1] = origin + across * half_height;
    wing.vertices[2] = origin + along * ctx_.bowtie.length;
    return wing;
}

void BowtieBuilder::check_triangle(const Triangle& wing, int wing_index) const {
    const size_t n = axis_index(NORMAL_AXIS);
    if (wing.vertices[0][n] != wing.vertices[1][n] ||
        wing.vertices[0][n] != wing.vertices[2][n]) {
        throw DegenerateGeometryError("Wing " + std::to_string(wing_index + 1) +
                                      " is not flat in the wing plane");
    }

    double scale = 0.0;
    for (size_t i = 0; i < 3; ++i) {
        scale = std::max(scale, wing.vertices[i].distance_to(wing.vertices[(i + 1) % 3]));
    }
    if (scale == 0.0 || wing.doubled_area() <= COLLINEAR_TOLERANCE * scale * scale) {
        throw DegenerateGeometryError("Wing " + std::to_string(wing_index + 1) +
                                      " has collinear vertices");
    }
}

void BowtieBuilder::check_inside_domain(const Vec3& p, const char* what) const {
    const Vec3 extent = ctx_.domain.extent();
    for (size_t i = 0; i < 3; ++i) {
        if (p[i] < 0.0 || p[i] > extent[i]) {
            throw InvalidGeometryError(std::string(what) + " " + format_vec(p) +
                                       " lies outside the domain " + format_vec(extent));
        }
    }
}

void BowtieBuilder::check_feed_clearance(const BowtieGeometry& geometry) const {
    const Vec3 step = ctx_.spacing.step();
    const double min_step = std::min({step.x, step.y, step.z});
    for (size_t w = 0; w < geometry.wings.size(); ++w) {
        for (const auto& v : geometry.wings[w].vertices) {
            if (v.distance_to(geometry.feed_point) < min_step) {
                throw InvalidGeometryError("Wing " + std::to_string(w + 1) + " vertex " +
                                           format_vec(v) + " lies within one cell of the feed");
            }
        }
    }
}

GeometryView BowtieBuilder::make_full_view() const {
    GeometryView view;
    view.min_corner = vec3::zero();
    view.max_corner = ctx_.domain.extent();
    view.step = ctx_.spacing.step();
    view.id = ctx_.placement.view_prefix + "_full";
    view.mode = ViewMode::Coarse;
    return view;
}

GeometryView BowtieBuilder::make_detail_view(const Vec3& antenna_min,
                                             const Vec3& antenna_max) const {
    const Vec3 padding = ctx_.spacing.step() * DETAIL_VIEW_PADDING_CELLS;

    GeometryView view;
    view.min_corner = antenna_min - padding;
    view.max_corner = antenna_max + padding;
    view.step = ctx_.spacing.step();
    view.id = ctx_.placement.view_prefix + "_detail";
    view.mode = ViewMode::Fine;
    return view;
}

BowtieGeometry build_bowtie(const Domain& domain,
                            const GridSpacing& spacing,
                            const BowtieSpec& bowtie,
                            const Placement& placement) {
    BowtieBuilder builder(domain, spacing, bowtie, placement);
    return builder.build();
}

}  // namespace bowtiemodel
