#ifndef BOWTIEMODEL_GEOMETRY_PLACEMENT_HPP
#define BOWTIEMODEL_GEOMETRY_PLACEMENT_HPP

#include "axis.hpp"
#include "primitives.hpp"
#include "vec3.hpp"
#include <string>
#include <vector>

namespace bowtiemodel {

// Where the antenna reference point (and hence the feed) sits in the domain
enum class PlacementVariant {
    Centered,       // Domain midpoint in all three axes (free space)
    GroundOffset    // Domain midpoint in x/y, fixed height along z
};

// Which wings receive the feed offset
enum class OffsetWings {
    Both,
    First,     // Wing extending toward +x only
    Second     // Wing extending toward -x only
};

// Grid-cell gap between the feed and the wing vertices nearest to it.
// Along the longitudinal axis a shifted wing moves away from the feed;
// along the transverse axis it moves toward +y.
struct FeedOffset {
    Axis axis = LONGITUDINAL_AXIS;
    double cells = 1.0;
    OffsetWings wings = OffsetWings::Both;

    bool applies_to(int wing_index) const {
        switch (wings) {
            case OffsetWings::Both: return true;
            case OffsetWings::First: return wing_index == 0;
            case OffsetWings::Second: return wing_index == 1;
        }
        return false;
    }
};

struct Placement {
    PlacementVariant variant = PlacementVariant::Centered;
    double ground_height = 0.0;        // Reference z for GroundOffset
    FeedOffset feed_offset;
    bool receiver = false;
    Vec3 probe_offset;                 // Receiver position relative to the feed
    bool full_domain_view = true;      // Emit the whole-domain geometry view
    std::string view_prefix = "bowtie";

    // Free-space antenna in the middle of the domain
    static Placement centered() {
        return Placement{
            .variant = PlacementVariant::Centered,
            .ground_height = 0.0,
            .feed_offset = FeedOffset{},
            .receiver = false,
            .probe_offset = vec3::zero(),
            .full_domain_view = true,
            .view_prefix = "bowtie"
        };
    }

    // Antenna raised above the bottom of the domain, with a receiver
    // probe the same distance above the feed
    static Placement ground_offset(double height) {
        return Placement{
            .variant = PlacementVariant::GroundOffset,
            .ground_height = height,
            .feed_offset = FeedOffset{},
            .receiver = true,
            .probe_offset = vec3::unit_z() * height,
            .full_domain_view = false,
            .view_prefix = "bowtie"
        };
    }
};

std::string variant_name(PlacementVariant variant);
PlacementVariant variant_from_string(const std::string& name);

std::string offset_wings_name(OffsetWings wings);
OffsetWings offset_wings_from_string(const std::string& name);

// Built-in placements by variant name ("centered", "ground_offset")
Placement placement_preset(const std::string& name, const Domain& domain);
std::vector<std::string> preset_names();

// Reject offset configurations the builder does not support
void validate_feed_offset(const FeedOffset& offset);

// Antenna anchor for the given placement; the source is always located here
Vec3 reference_point(const Domain& domain, const Placement& placement);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_GEOMETRY_PLACEMENT_HPP
