#ifndef BOWTIEMODEL_MODEL_COMMAND_FORMATTER_HPP
#define BOWTIEMODEL_MODEL_COMMAND_FORMATTER_HPP

#include "command.hpp"
#include <string>
#include <vector>

namespace bowtiemodel {

// Serializes typed commands into the solver's line-oriented input dialect.
// Every number is written in general format with the same precision.
class CommandFormatter {
public:
    explicit CommandFormatter(int precision = 6) : precision_(precision) {}

    // Single line, without trailing newline
    std::string format(const Command& cmd) const;

    // One command per line, each terminated by '\n'
    std::string format_all(const std::vector<Command>& commands) const;

    std::string number(double value) const;

    int precision() const { return precision_; }

private:
    int precision_;

    std::string vec(const Vec3& v) const;
};

std::string view_mode_code(ViewMode mode);

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_MODEL_COMMAND_FORMATTER_HPP
