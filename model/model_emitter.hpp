#ifndef BOWTIEMODEL_MODEL_MODEL_EMITTER_HPP
#define BOWTIEMODEL_MODEL_MODEL_EMITTER_HPP

#include "command.hpp"
#include "simulation_settings.hpp"
#include <geometry/bowtie_builder.hpp>
#include <geometry/placement.hpp>
#include <geometry/primitives.hpp>
#include <vector>

namespace bowtiemodel {

// Turns validated geometry and simulation metadata into the ordered
// command sequence. Performs no validation of its own.
class ModelEmitter {
public:
    std::vector<Command> emit(const SimulationSettings& settings,
                              const Domain& domain,
                              const GridSpacing& spacing,
                              const BowtieGeometry& geometry,
                              const Placement& placement) const;

private:
    void emit_header(std::vector<Command>& out,
                     const SimulationSettings& settings,
                     const Domain& domain,
                     const GridSpacing& spacing) const;

    Command make_source(const SourceSettings& source,
                        const Vec3& position,
                        const std::string& waveform_id) const;

    static command::Triangle make_triangle(const Triangle& wing);
    static command::GeometryView make_view(const GeometryView& view);
};

std::vector<Command> emit_model(const SimulationSettings& settings,
                                const Domain& domain,
                                const GridSpacing& spacing,
                                const BowtieGeometry& geometry,
                                const Placement& placement);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_MODEL_MODEL_EMITTER_HPP
