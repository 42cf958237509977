#pragma once

#include <Eigen/Dense>
#include <complex>
#include <vector>
#include <string>
#include <memory>
#include <cmath>
#include <stdexcept>

namespace multilayer {

using Complex = std::complex<double>;

// Spectral and per-layer arrays
using Vec = Eigen::VectorXd;
using CVec = Eigen::VectorXcd;
using CMat = Eigen::MatrixXcd;

// Constants (SI)
constexpr double PI = 3.14159265358979323846;
constexpr double SPEED_OF_LIGHT = 2.99792458e8;     // m/s
constexpr double VACUUM_PERMITTIVITY = 8.854e-12;   // F/m
constexpr double ELECTRON_CHARGE = 1.6022e-19;      // C
constexpr double ELECTRON_MASS = 9.109e-31;         // kg

// Per-instance overridable copy of the process-wide constants.
struct PhysicalConstants {
    double speed_of_light = SPEED_OF_LIGHT;
    double vacuum_permittivity = VACUUM_PERMITTIVITY;
    double electron_charge = ELECTRON_CHARGE;
    double electron_mass = ELECTRON_MASS;

    void validate() const;
};

// Polarization / anisotropy component of a refractive index query.
enum class Component { X = 1, Y = 2, Z = 3 };

Component component_from_int(int component);

// Rejected input: negative thickness, malformed index function, bad parameter.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Unusable configuration: unknown output selector, missing engine, ...
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raw solver output that does not match the layout a formatter expects.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace multilayer
