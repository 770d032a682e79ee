#ifndef BOWTIEMODEL_MODEL_COMMAND_HPP
#define BOWTIEMODEL_MODEL_COMMAND_HPP

#include <geometry/axis.hpp>
#include <geometry/primitives.hpp>
#include <math/vec3.hpp>
#include "simulation_settings.hpp"
#include <array>
#include <string>
#include <variant>
#include <vector>

namespace bowtiemodel {
namespace command {

// Model metadata
struct Title { std::string text; };
struct DomainSize { Vec3 extent; };
struct Discretisation { Vec3 step; };
struct TimeWindow { double seconds; };

// Excitation
struct Waveform {
    WaveformType type;
    double amplitude;
    double frequency;
    std::string id;
};

struct TransmissionLine {
    Axis polarisation;
    Vec3 position;
    double impedance;
    std::string waveform_id;
};

struct VoltageSource {
    Axis polarisation;
    Vec3 position;
    double resistance;
    std::string waveform_id;
};

struct HertzianDipole {
    Axis polarisation;
    Vec3 position;
    std::string waveform_id;
};

// Output
struct Receiver { Vec3 position; };

// Objects
struct Triangle {
    std::array<Vec3, 3> vertices;
    double thickness;
    std::string material;
};

struct Snapshot {
    Vec3 min_corner;
    Vec3 max_corner;
    Vec3 step;
    double time;
    std::string file;
};

struct GeometryView {
    Vec3 min_corner;
    Vec3 max_corner;
    Vec3 step;
    std::string id;
    ViewMode mode;
};

}  // namespace command

// One fully resolved line of the solver input file
using Command = std::variant<
    command::Title, command::DomainSize, command::Discretisation, command::TimeWindow,
    command::Waveform,
    command::TransmissionLine, command::VoltageSource, command::HertzianDipole,
    command::Receiver,
    command::Triangle,
    command::Snapshot,
    command::GeometryView
>;

// Dependent false for the final branch of exhaustive std::visit chains
template <class>
inline constexpr bool always_false_v = false;

// Keyword including the leading '#' and trailing ':', e.g. "#rx:"
std::string command_keyword(const Command& cmd);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_MODEL_COMMAND_HPP
