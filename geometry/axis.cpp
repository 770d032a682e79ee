#include "axis.hpp"
#include <common/errors.hpp>

namespace bowtiemodel {

Axis axis_from_string(const std::string& name) {
    if (name == "x") return Axis::X;
    if (name == "y") return Axis::Y;
    if (name == "z") return Axis::Z;
    throw UnknownVariantError("Unknown axis: " + name);
}

}  // namespace bowtiemodel
