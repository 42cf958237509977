#pragma once

#include "multilayer/common.hpp"

namespace multilayer {

// Single Lorentz oscillator dielectric function.
// omega: angular frequency (rad/s), omega_0: resonance (rad/s),
// gamma: linewidth (rad/s), N: oscillator density (m^-3),
// chi: background susceptibility.

// omega = 2*pi*f
Vec frequency_to_angular(const Vec& frequencies);

// wp^2 = N*e^2 / (eps0*m0)
double plasma_frequency_squared(double N,
                                const PhysicalConstants& constants = PhysicalConstants());

// Static (omega -> 0) and high-frequency limits of the relative permittivity
double epsilon_static(double omega_0, double N, double chi,
                      const PhysicalConstants& constants = PhysicalConstants());
double epsilon_infinity(double chi);

// Relative permittivity eps = eps1 + i*eps2.
// approximate = true uses the near-resonance form in terms of (omega - omega_0).
Vec epsilon_real(const Vec& omega, double omega_0, double gamma, double N, double chi,
                 const PhysicalConstants& constants = PhysicalConstants(),
                 bool approximate = false);
Vec epsilon_imag(const Vec& omega, double omega_0, double gamma, double N, double chi,
                 const PhysicalConstants& constants = PhysicalConstants(),
                 bool approximate = false);

// n = sqrt((eps1 + |eps|)/2), k = sqrt((-eps1 + |eps|)/2)
Vec refractive_index_real(const Vec& epsilon1, const Vec& epsilon2);
Vec refractive_index_imag(const Vec& epsilon1, const Vec& epsilon2);

}  // namespace multilayer
