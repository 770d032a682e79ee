#include "command.hpp"
#include <type_traits>

namespace bowtiemodel {

std::string command_keyword(const Command& cmd) {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, command::Title>) return "#title:";
        else if constexpr (std::is_same_v<T, command::DomainSize>) return "#domain:";
        else if constexpr (std::is_same_v<T, command::Discretisation>) return "#dx_dy_dz:";
        else if constexpr (std::is_same_v<T, command::TimeWindow>) return "#time_window:";
        else if constexpr (std::is_same_v<T, command::Waveform>) return "#waveform:";
        else if constexpr (std::is_same_v<T, command::TransmissionLine>) return "#transmission_line:";
        else if constexpr (std::is_same_v<T, command::VoltageSource>) return "#voltage_source:";
        else if constexpr (std::is_same_v<T, command::HertzianDipole>) return "#hertzian_dipole:";
        else if constexpr (std::is_same_v<T, command::Receiver>) return "#rx:";
        else if constexpr (std::is_same_v<T, command::Triangle>) return "#triangle:";
        else if constexpr (std::is_same_v<T, command::Snapshot>) return "#snapshot:";
        else if constexpr (std::is_same_v<T, command::GeometryView>) return "#geometry_view:";
        else static_assert(always_false_v<T>, "command without a keyword");
    }, cmd);
}

}  // namespace bowtiemodel
