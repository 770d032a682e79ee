#ifndef BOWTIEMODEL_MODEL_SIMULATION_SETTINGS_HPP
#define BOWTIEMODEL_MODEL_SIMULATION_SETTINGS_HPP

#include <geometry/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bowtiemodel {

enum class WaveformType {
    Gaussian,
    GaussianDot,
    GaussianDotNorm,
    Ricker,
    Sine,
    ContSine
};

struct Waveform {
    WaveformType type = WaveformType::Gaussian;
    double amplitude = 1.0;
    double frequency = 1.5e9;      // Center frequency in Hz
    std::string id = "my_pulse";
};

enum class SourceType {
    TransmissionLine,   // One-dimensional line with a characteristic impedance
    VoltageSource,      // Voltage source with an internal resistance
    HertzianDipole      // Infinitesimal current element
};

// Excitation parameters; the position always comes from the feed point
struct SourceSettings {
    SourceType type = SourceType::TransmissionLine;
    double impedance = 50.0;       // Ohms; resistance for a voltage source
};

// Field snapshot at a given time. Without corners or step the snapshot
// covers the whole domain at the grid spacing.
struct SnapshotRequest {
    double time = 0.0;             // Seconds
    std::string file;
    std::optional<Vec3> min_corner;
    std::optional<Vec3> max_corner;
    std::optional<Vec3> step;

    Vec3 resolved_min() const { return min_corner.value_or(vec3::zero()); }
    Vec3 resolved_max(const Domain& domain) const {
        return max_corner.value_or(domain.extent());
    }
    Vec3 resolved_step(const GridSpacing& spacing) const {
        return step.value_or(spacing.step());
    }
};

struct SimulationSettings {
    std::string title = "Bowtie antenna";
    double time_window = 3e-9;     // Seconds
    Waveform waveform;
    SourceSettings source;
    std::vector<SnapshotRequest> snapshots;
};

std::string waveform_type_name(WaveformType type);
WaveformType waveform_type_from_string(const std::string& name);

std::string source_type_name(SourceType type);
SourceType source_type_from_string(const std::string& name);

// Throws ConfigError for an unusable time window, waveform or snapshot
void validate_settings(const SimulationSettings& settings);

// Throws ConfigError unless every snapshot volume lies inside the domain,
// has min < max on each axis and a positive sampling step
void validate_snapshot_volumes(const SimulationSettings& settings,
                               const Domain& domain,
                               const GridSpacing& spacing);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_MODEL_SIMULATION_SETTINGS_HPP
