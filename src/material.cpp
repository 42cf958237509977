#include "multilayer/material.hpp"
#include "multilayer/lorentz_oscillator.hpp"

namespace multilayer {

Material::Material(std::string name) : name_(std::move(name)) {}

Complex Material::index_at(double frequency, Component component) const {
    Vec f(1);
    f(0) = frequency;
    CVec n = index(f, component);
    if (n.size() != 1)
        throw ValidationError("Material '" + name_ + "' returned " +
                              std::to_string(n.size()) + " values for 1 frequency");
    return n(0);
}

// ---- ConstantIndex ----

ConstantIndex::ConstantIndex(Complex value, std::string name)
    : Material(std::move(name)) {
    set_value(value);
}

void ConstantIndex::set_value(Complex value) {
    if (!std::isfinite(value.real()) || !std::isfinite(value.imag()))
        throw ValidationError("Constant index must be finite");
    value_ = value;
}

CVec ConstantIndex::index(const Vec& frequencies, Component) const {
    return CVec::Constant(frequencies.size(), value_);
}

std::shared_ptr<Material> ConstantIndex::clone() const {
    return std::make_shared<ConstantIndex>(*this);
}

bool ConstantIndex::equals(const Material& other) const {
    auto* o = dynamic_cast<const ConstantIndex*>(&other);
    return o != nullptr && o->value_ == value_ && o->name_ == name_;
}

// ---- LorentzOscillator ----

void LorentzParameters::validate() const {
    if (!(resonance > 0.0))
        throw ValidationError("Lorentz resonance omega_0 must be positive");
    // gamma = 0 makes the exact form 0/0 at resonance
    if (!(linewidth > 0.0))
        throw ValidationError("Lorentz linewidth gamma must be positive");
    if (!(density >= 0.0))
        throw ValidationError("Oscillator density N must be non-negative");
    if (!std::isfinite(susceptibility))
        throw ValidationError("Background susceptibility chi must be finite");
}

LorentzOscillator::LorentzOscillator(const LorentzParameters& params,
                                     const PhysicalConstants& constants,
                                     std::string name)
    : Material(std::move(name)), params_(params), constants_(constants) {
    params_.validate();
    constants_.validate();
}

void LorentzOscillator::set_parameters(const LorentzParameters& params) {
    params.validate();
    params_ = params;
}

void LorentzOscillator::set_constants(const PhysicalConstants& constants) {
    constants.validate();
    constants_ = constants;
}

CVec LorentzOscillator::permittivity(const Vec& frequencies) const {
    Vec omega = frequency_to_angular(frequencies);
    Vec eps1 = epsilon_real(omega, params_.resonance, params_.linewidth,
                            params_.density, params_.susceptibility,
                            constants_, params_.approximate);
    Vec eps2 = epsilon_imag(omega, params_.resonance, params_.linewidth,
                            params_.density, params_.susceptibility,
                            constants_, params_.approximate);
    CVec eps(eps1.size());
    eps.real() = eps1;
    eps.imag() = eps2;
    return eps;
}

CVec LorentzOscillator::index(const Vec& frequencies, Component) const {
    CVec eps = permittivity(frequencies);
    Vec eps1 = eps.real();
    Vec eps2 = eps.imag();
    CVec n(frequencies.size());
    n.real() = refractive_index_real(eps1, eps2);
    n.imag() = refractive_index_imag(eps1, eps2);
    return n;
}

std::shared_ptr<Material> LorentzOscillator::clone() const {
    return std::make_shared<LorentzOscillator>(*this);
}

bool LorentzOscillator::equals(const Material& other) const {
    auto* o = dynamic_cast<const LorentzOscillator*>(&other);
    if (o == nullptr || o->name_ != name_) return false;
    const auto& a = params_;
    const auto& b = o->params_;
    const auto& ca = constants_;
    const auto& cb = o->constants_;
    return a.resonance == b.resonance && a.linewidth == b.linewidth &&
           a.density == b.density && a.susceptibility == b.susceptibility &&
           a.approximate == b.approximate &&
           ca.speed_of_light == cb.speed_of_light &&
           ca.vacuum_permittivity == cb.vacuum_permittivity &&
           ca.electron_charge == cb.electron_charge &&
           ca.electron_mass == cb.electron_mass;
}

}  // namespace multilayer
