#include "model_emitter.hpp"
#include <common/logging.hpp>

namespace bowtiemodel {

std::vector<Command> ModelEmitter::emit(const SimulationSettings& settings,
                                        const Domain& domain,
                                        const GridSpacing& spacing,
                                        const BowtieGeometry& geometry,
                                        const Placement& placement) const {
    auto log = bowtiemodel::logging::get_logger();
    std::vector<Command> out;

    emit_header(out, settings, domain, spacing);

    const Waveform& w = settings.waveform;
    out.push_back(command::Waveform{w.type, w.amplitude, w.frequency, w.id});
    out.push_back(make_source(settings.source, geometry.feed_point, w.id));
    log->debug("Emitter: {} source at feed", source_type_name(settings.source.type));

    if (geometry.probe_point) {
        out.push_back(command::Receiver{*geometry.probe_point});
        log->debug("Emitter: receiver probe at ({}, {}, {})",
                   geometry.probe_point->x, geometry.probe_point->y, geometry.probe_point->z);
    }

    for (const auto& wing : geometry.wings) {
        out.push_back(make_triangle(wing));
    }

    for (const auto& snap : settings.snapshots) {
        out.push_back(command::Snapshot{snap.resolved_min(), snap.resolved_max(domain),
                                        snap.resolved_step(spacing), snap.time, snap.file});
    }

    if (placement.full_domain_view) {
        out.push_back(make_view(geometry.full_view));
    }
    // Detail view is always the final command
    out.push_back(make_view(geometry.detail_view));

    log->debug("Emitter: finished with {} commands", out.size());
    return out;
}

void ModelEmitter::emit_header(std::vector<Command>& out,
                               const SimulationSettings& settings,
                               const Domain& domain,
                               const GridSpacing& spacing) const {
    out.push_back(command::Title{settings.title});
    out.push_back(command::DomainSize{domain.extent()});
    out.push_back(command::Discretisation{spacing.step()});
    out.push_back(command::TimeWindow{settings.time_window});
}

Command ModelEmitter::make_source(const SourceSettings& source,
                                  const Vec3& position,
                                  const std::string& waveform_id) const {
    switch (source.type) {
        case SourceType::TransmissionLine:
            return command::TransmissionLine{LONGITUDINAL_AXIS, position, source.impedance, waveform_id};
        case SourceType::VoltageSource:
            return command::VoltageSource{LONGITUDINAL_AXIS, position, source.impedance, waveform_id};
        case SourceType::HertzianDipole:
            return command::HertzianDipole{LONGITUDINAL_AXIS, position, waveform_id};
    }
    return command::TransmissionLine{LONGITUDINAL_AXIS, position, source.impedance, waveform_id};
}

command::Triangle ModelEmitter::make_triangle(const Triangle& wing) {
    return command::Triangle{wing.vertices, wing.thickness, wing.material};
}

command::GeometryView ModelEmitter::make_view(const GeometryView& view) {
    return command::GeometryView{view.min_corner, view.max_corner, view.step, view.id, view.mode};
}

std::vector<Command> emit_model(const SimulationSettings& settings,
                                const Domain& domain,
                                const GridSpacing& spacing,
                                const BowtieGeometry& geometry,
                                const Placement& placement) {
    ModelEmitter emitter;
    return emitter.emit(settings, domain, spacing, geometry, placement);
}

}  // namespace bowtiemodel
