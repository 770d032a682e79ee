#include "simulation_settings.hpp"
#include <common/errors.hpp>
#include <cmath>

namespace bowtiemodel {

std::string waveform_type_name(WaveformType type) {
    switch (type) {
        case WaveformType::Gaussian: return "gaussian";
        case WaveformType::GaussianDot: return "gaussiandot";
        case WaveformType::GaussianDotNorm: return "gaussiandotnorm";
        case WaveformType::Ricker: return "ricker";
        case WaveformType::Sine: return "sine";
        case WaveformType::ContSine: return "contsine";
    }
    return "unknown";
}

WaveformType waveform_type_from_string(const std::string& name) {
    if (name == "gaussian") return WaveformType::Gaussian;
    if (name == "gaussiandot") return WaveformType::GaussianDot;
    if (name == "gaussiandotnorm") return WaveformType::GaussianDotNorm;
    if (name == "ricker") return WaveformType::Ricker;
    if (name == "sine") return WaveformType::Sine;
    if (name == "contsine") return WaveformType::ContSine;
    throw ConfigError("Unknown waveform type: " + name);
}

std::string source_type_name(SourceType type) {
    switch (type) {
        case SourceType::TransmissionLine: return "transmission_line";
        case SourceType::VoltageSource: return "voltage_source";
        case SourceType::HertzianDipole: return "hertzian_dipole";
    }
    return "unknown";
}

SourceType source_type_from_string(const std::string& name) {
    if (name == "transmission_line") return SourceType::TransmissionLine;
    if (name == "voltage_source") return SourceType::VoltageSource;
    if (name == "hertzian_dipole") return SourceType::HertzianDipole;
    throw ConfigError("Unknown source type: " + name);
}

void validate_settings(const SimulationSettings& settings) {
    if (!std::isfinite(settings.time_window) || settings.time_window <= 0.0) {
        throw ConfigError("Time window must be positive, got " +
                          std::to_string(settings.time_window));
    }

    const Waveform& w = settings.waveform;
    if (!std::isfinite(w.frequency) || w.frequency <= 0.0) {
        throw ConfigError("Waveform frequency must be positive, got " +
                          std::to_string(w.frequency));
    }
    if (!std::isfinite(w.amplitude)) {
        throw ConfigError("Waveform amplitude must be finite");
    }
    if (w.id.empty() || w.id.find_first_of(" \t\n") != std::string::npos) {
        throw ConfigError("Waveform id must be a single non-empty word, got '" + w.id + "'");
    }

    if (settings.source.type != SourceType::HertzianDipole &&
        (!std::isfinite(settings.source.impedance) || settings.source.impedance <= 0.0)) {
        throw ConfigError("Source impedance must be positive, got " +
                          std::to_string(settings.source.impedance));
    }

    for (const auto& snap : settings.snapshots) {
        if (!(snap.time > 0.0) || snap.time > settings.time_window) {
            throw ConfigError("Snapshot time " + std::to_string(snap.time) +
                              " lies outside the time window");
        }
        if (snap.file.empty() || snap.file.find_first_of(" \t\n") != std::string::npos) {
            throw ConfigError("Snapshot file name must be a single non-empty word, got '" +
                              snap.file + "'");
        }
    }
}

void validate_snapshot_volumes(const SimulationSettings& settings,
                               const Domain& domain,
                               const GridSpacing& spacing) {
    const Vec3 extent = domain.extent();
    for (const auto& snap : settings.snapshots) {
        const Vec3 lo = snap.resolved_min();
        const Vec3 hi = snap.resolved_max(domain);
        const Vec3 step = snap.resolved_step(spacing);
        for (size_t i = 0; i < 3; ++i) {
            if (!std::isfinite(lo[i]) || !std::isfinite(hi[i]) ||
                lo[i] < 0.0 || hi[i] > extent[i]) {
                throw ConfigError("Snapshot '" + snap.file + "' volume lies outside the domain");
            }
            if (!(lo[i] < hi[i])) {
                throw ConfigError("Snapshot '" + snap.file +
                                  "' needs min < max on every axis");
            }
            if (!std::isfinite(step[i]) || step[i] <= 0.0) {
                throw ConfigError("Snapshot '" + snap.file + "' step must be positive");
            }
        }
    }
}

}  // namespace bowtiemodel
