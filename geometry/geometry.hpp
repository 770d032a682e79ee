#ifndef BOWTIEMODEL_GEOMETRY_HPP
#define BOWTIEMODEL_GEOMETRY_HPP

// Geometry layer public API
// Derives the wings, feed, receiver and views of a bowtie antenna

#include "vec3.hpp"
#include "axis.hpp"
#include "primitives.hpp"
#include "placement.hpp"
#include "bowtie_builder.hpp"

namespace bowtiemodel {

// Main entry point: build_bowtie()
//
// Usage:
//   Domain domain{0.2, 0.2, 0.1};
//   GridSpacing spacing{0.001, 0.001, 0.001};
//   BowtieSpec bowtie{0.05, 0.1};
//
//   BowtieGeometry geometry = build_bowtie(
//       domain, spacing, bowtie, Placement::centered());
//
//   // Feed at the domain center, wings on either side
//   Vec3 feed = geometry.feed_point;

} // namespace bowtiemodel

#endif // BOWTIEMODEL_GEOMETRY_HPP
