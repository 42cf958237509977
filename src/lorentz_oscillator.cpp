#include "multilayer/lorentz_oscillator.hpp"

namespace multilayer {

Vec frequency_to_angular(const Vec& frequencies) {
    return 2.0 * PI * frequencies;
}

double plasma_frequency_squared(double N, const PhysicalConstants& constants) {
    double e = constants.electron_charge;
    return (N * e * e) / (constants.vacuum_permittivity * constants.electron_mass);
}

double epsilon_static(double omega_0, double N, double chi,
                      const PhysicalConstants& constants) {
    return 1.0 + chi + plasma_frequency_squared(N, constants) / (omega_0 * omega_0);
}

double epsilon_infinity(double chi) {
    return 1.0 + chi;
}

Vec epsilon_real(const Vec& omega, double omega_0, double gamma, double N, double chi,
                 const PhysicalConstants& constants, bool approximate) {
    int n = static_cast<int>(omega.size());
    Vec eps1(n);

    if (!approximate) {
        double wp2 = plasma_frequency_squared(N, constants);
        for (int i = 0; i < n; i++) {
            double detuning = omega_0 * omega_0 - omega(i) * omega(i);
            double g = gamma * omega(i);
            eps1(i) = 1.0 + chi + wp2 * detuning / (detuning * detuning + g * g);
        }
    } else {
        double strength = epsilon_static(omega_0, N, chi, constants) - epsilon_infinity(chi);
        for (int i = 0; i < n; i++) {
            double d = omega(i) - omega_0;
            eps1(i) = epsilon_infinity(chi) -
                      strength * (2.0 * omega_0 * d) / (4.0 * d * d + gamma * gamma);
        }
    }
    return eps1;
}

Vec epsilon_imag(const Vec& omega, double omega_0, double gamma, double N, double chi,
                 const PhysicalConstants& constants, bool approximate) {
    int n = static_cast<int>(omega.size());
    Vec eps2(n);

    if (!approximate) {
        double wp2 = plasma_frequency_squared(N, constants);
        for (int i = 0; i < n; i++) {
            double detuning = omega_0 * omega_0 - omega(i) * omega(i);
            double g = gamma * omega(i);
            eps2(i) = wp2 * g / (detuning * detuning + g * g);
        }
    } else {
        double strength = epsilon_static(omega_0, N, chi, constants) - epsilon_infinity(chi);
        for (int i = 0; i < n; i++) {
            double d = omega(i) - omega_0;
            eps2(i) = strength * gamma * omega_0 / (4.0 * d * d + gamma * gamma);
        }
    }
    return eps2;
}

// Both branches clamp at zero: rounding can push the radicand slightly
// negative when eps2 ~ 0.
Vec refractive_index_real(const Vec& epsilon1, const Vec& epsilon2) {
    Vec modulus = (epsilon1.array().square() + epsilon2.array().square()).sqrt().matrix();
    return ((epsilon1.array() + modulus.array()) / 2.0).max(0.0).sqrt().matrix();
}

Vec refractive_index_imag(const Vec& epsilon1, const Vec& epsilon2) {
    Vec modulus = (epsilon1.array().square() + epsilon2.array().square()).sqrt().matrix();
    return ((modulus.array() - epsilon1.array()) / 2.0).max(0.0).sqrt().matrix();
}

}  // namespace multilayer
