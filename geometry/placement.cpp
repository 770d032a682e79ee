#include "placement.hpp"
#include <common/errors.hpp>
#include <cmath>

namespace bowtiemodel {

std::string variant_name(PlacementVariant variant) {
    switch (variant) {
        case PlacementVariant::Centered: return "centered";
        case PlacementVariant::GroundOffset: return "ground_offset";
    }
    return "unknown";
}

PlacementVariant variant_from_string(const std::string& name) {
    if (name == "centered") return PlacementVariant::Centered;
    if (name == "ground_offset") return PlacementVariant::GroundOffset;
    throw UnknownVariantError("Unknown placement variant: " + name);
}

std::string offset_wings_name(OffsetWings wings) {
    switch (wings) {
        case OffsetWings::Both: return "both";
        case OffsetWings::First: return "first";
        case OffsetWings::Second: return "second";
    }
    return "unknown";
}

OffsetWings offset_wings_from_string(const std::string& name) {
    if (name == "both") return OffsetWings::Both;
    if (name == "first") return OffsetWings::First;
    if (name == "second") return OffsetWings::Second;
    throw UnknownVariantError("Unknown feed offset wing selection: " + name);
}

Placement placement_preset(const std::string& name, const Domain& domain) {
    switch (variant_from_string(name)) {
        case PlacementVariant::Centered:
            return Placement::centered();
        case PlacementVariant::GroundOffset:
            // Default height: a sixth of the domain depth
            return Placement::ground_offset(domain.z / 6.0);
    }
    throw UnknownVariantError("Unknown placement variant: " + name);
}

std::vector<std::string> preset_names() {
    return {variant_name(PlacementVariant::Centered),
            variant_name(PlacementVariant::GroundOffset)};
}

void validate_feed_offset(const FeedOffset& offset) {
    if (offset.axis == NORMAL_AXIS) {
        throw UnknownVariantError(
            std::string("Feed offset along the wing normal axis '") +
            axis_name(offset.axis) + "' is not supported");
    }
    // Fewer than one cell would let a wing vertex fall inside the source cell
    if (!std::isfinite(offset.cells) || offset.cells < 1.0) {
        throw UnknownVariantError("Feed offset must be at least one grid cell, got " +
                                  std::to_string(offset.cells));
    }
}

Vec3 reference_point(const Domain& domain, const Placement& placement) {
    switch (placement.variant) {
        case PlacementVariant::Centered:
            return domain.center();
        case PlacementVariant::GroundOffset: {
            Vec3 ref = domain.center();
            ref[axis_index(NORMAL_AXIS)] = placement.ground_height;
            return ref;
        }
    }
    throw UnknownVariantError("Unsupported placement variant");
}

}  // namespace bowtiemodel
