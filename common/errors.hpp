#ifndef BOWTIEMODEL_COMMON_ERRORS_HPP
#define BOWTIEMODEL_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bowtiemodel {

// Base for every error raised while building a model
class BowtieError : public std::runtime_error {
public:
    explicit BowtieError(const std::string& what) : std::runtime_error(what) {}
};

// Non-positive dimensions or spacing, or geometry that leaves the domain
class InvalidGeometryError : public BowtieError {
public:
    explicit InvalidGeometryError(const std::string& what) : BowtieError(what) {}
};

// Collinear or zero-area triangle
class DegenerateGeometryError : public BowtieError {
public:
    explicit DegenerateGeometryError(const std::string& what) : BowtieError(what) {}
};

// Unsupported placement variant or feed offset configuration
class UnknownVariantError : public BowtieError {
public:
    explicit UnknownVariantError(const std::string& what) : BowtieError(what) {}
};

// Malformed or out-of-range configuration values
class ConfigError : public BowtieError {
public:
    explicit ConfigError(const std::string& what) : BowtieError(what) {}
};

}  // namespace bowtiemodel

#endif // BOWTIEMODEL_COMMON_ERRORS_HPP
