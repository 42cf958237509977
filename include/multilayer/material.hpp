#pragma once

#include "multilayer/common.hpp"

namespace multilayer {

// Source of a complex refractive index as a function of frequency (Hz).
// Positive imaginary part = lossy. A Material may be shared by many layers.
class Material {
public:
    explicit Material(std::string name = "");
    virtual ~Material() = default;

    // Complex index at each frequency; same length as frequencies.
    virtual CVec index(const Vec& frequencies,
                       Component component = Component::X) const = 0;

    // Independent deep copy
    virtual std::shared_ptr<Material> clone() const = 0;

    // Value equality (same concrete type and parameters)
    virtual bool equals(const Material& other) const = 0;

    Complex index_at(double frequency, Component component = Component::X) const;

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    bool operator==(const Material& other) const { return equals(other); }
    bool operator!=(const Material& other) const { return !equals(other); }

protected:
    std::string name_;
};

// Frequency independent, isotropic index.
class ConstantIndex : public Material {
public:
    explicit ConstantIndex(Complex value = Complex(1.0, 0.0), std::string name = "");

    CVec index(const Vec& frequencies,
               Component component = Component::X) const override;
    std::shared_ptr<Material> clone() const override;
    bool equals(const Material& other) const override;

    Complex value() const { return value_; }
    void set_value(Complex value);

private:
    Complex value_;
};

// Single Lorentz oscillator on a background susceptibility chi.
struct LorentzParameters {
    double resonance = 0.0;      // omega_0 (rad/s)
    double linewidth = 0.0;      // gamma (rad/s)
    double density = 0.0;        // N (m^-3)
    double susceptibility = 0.0; // chi
    bool approximate = false;    // near-resonance form

    void validate() const;
};

class LorentzOscillator : public Material {
public:
    explicit LorentzOscillator(const LorentzParameters& params,
                               const PhysicalConstants& constants = PhysicalConstants(),
                               std::string name = "");

    CVec index(const Vec& frequencies,
               Component component = Component::X) const override;
    std::shared_ptr<Material> clone() const override;
    bool equals(const Material& other) const override;

    // Relative permittivity eps1 + i*eps2 at each frequency
    CVec permittivity(const Vec& frequencies) const;

    const LorentzParameters& parameters() const { return params_; }
    void set_parameters(const LorentzParameters& params);

    const PhysicalConstants& constants() const { return constants_; }
    void set_constants(const PhysicalConstants& constants);

private:
    LorentzParameters params_;
    PhysicalConstants constants_;
};

}  // namespace multilayer
