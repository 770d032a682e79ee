#include "command_formatter.hpp"
#include <spdlog/fmt/fmt.h>
#include <type_traits>

namespace bowtiemodel {

std::string view_mode_code(ViewMode mode) {
    switch (mode) {
        case ViewMode::Fine: return "f";
        case ViewMode::Coarse: return "n";
    }
    return "n";
}

std::string CommandFormatter::number(double value) const {
    // Avoid "-0" for coordinates computed as negated zero
    if (value == 0.0) {
        value = 0.0;
    }
    return fmt::format("{:.{}g}", value, precision_);
}

std::string CommandFormatter::vec(const Vec3& v) const {
    return number(v.x) + " " + number(v.y) + " " + number(v.z);
}

std::string CommandFormatter::format(const Command& cmd) const {
    std::string body = std::visit([this](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, command::Title>) {
            return arg.text;
        } else if constexpr (std::is_same_v<T, command::DomainSize>) {
            return vec(arg.extent);
        } else if constexpr (std::is_same_v<T, command::Discretisation>) {
            return vec(arg.step);
        } else if constexpr (std::is_same_v<T, command::TimeWindow>) {
            return number(arg.seconds);
        } else if constexpr (std::is_same_v<T, command::Waveform>) {
            return fmt::format("{} {} {} {}", waveform_type_name(arg.type),
                               number(arg.amplitude), number(arg.frequency), arg.id);
        } else if constexpr (std::is_same_v<T, command::TransmissionLine>) {
            return fmt::format("{} {} {} {}", axis_name(arg.polarisation),
                               vec(arg.position), number(arg.impedance), arg.waveform_id);
        } else if constexpr (std::is_same_v<T, command::VoltageSource>) {
            return fmt::format("{} {} {} {}", axis_name(arg.polarisation),
                               vec(arg.position), number(arg.resistance), arg.waveform_id);
        } else if constexpr (std::is_same_v<T, command::HertzianDipole>) {
            return fmt::format("{} {} {}", axis_name(arg.polarisation),
                               vec(arg.position), arg.waveform_id);
        } else if constexpr (std::is_same_v<T, command::Receiver>) {
            return vec(arg.position);
        } else if constexpr (std::is_same_v<T, command::Triangle>) {
            return fmt::format("{} {} {} {} {}", vec(arg.vertices[0]), vec(arg.vertices[1]),
                               vec(arg.vertices[2]), number(arg.thickness), arg.material);
        } else if constexpr (std::is_same_v<T, command::Snapshot>) {
            return fmt::format("{} {} {} {} {}", vec(arg.min_corner), vec(arg.max_corner),
                               vec(arg.step), number(arg.time), arg.file);
        } else if constexpr (std::is_same_v<T, command::GeometryView>) {
            return fmt::format("{} {} {} {} type={}", vec(arg.min_corner), vec(arg.max_corner),
                               vec(arg.step), arg.id, view_mode_code(arg.mode));
        } else {
            static_assert(always_false_v<T>, "command without a formatter");
        }
    }, cmd);

    return command_keyword(cmd) + " " + body;
}

std::string CommandFormatter::format_all(const std::vector<Command>& commands) const {
    std::string out;
    for (const auto& cmd : commands) {
        out += format(cmd);
        out += '\n';
    }
    return out;
}

}  // namespace bowtiemodel
