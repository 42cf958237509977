#include "multilayer/spectrum.hpp"

namespace multilayer {

Spectrum::Spectrum(Vec frequencies, double speed_of_light) {
    set_speed_of_light(speed_of_light);
    set_frequencies(std::move(frequencies));
}

Spectrum Spectrum::from_wavelengths(const Vec& wavelengths, double speed_of_light) {
    Spectrum s;
    s.set_speed_of_light(speed_of_light);
    s.set_wavelengths(wavelengths);
    return s;
}

void Spectrum::validate_positive(const Vec& values, const char* what) {
    for (int i = 0; i < values.size(); i++) {
        if (!(values(i) > 0.0) || !std::isfinite(values(i)))
            throw ValidationError(std::string(what) + " must be positive and finite, got " +
                                  std::to_string(values(i)) + " at index " +
                                  std::to_string(i));
    }
}

Vec Spectrum::convert(const Vec& values, double speed_of_light) {
    return (speed_of_light / values.array()).matrix();
}

void Spectrum::set_frequencies(Vec frequencies) {
    validate_positive(frequencies, "Frequencies");
    frequencies_ = std::move(frequencies);
    wavelengths_.reset();
}

const Vec& Spectrum::wavelengths() const {
    if (!wavelengths_) {
        wavelengths_ = convert(frequencies_, speed_of_light_);
    }
    return *wavelengths_;
}

void Spectrum::set_wavelengths(const Vec& wavelengths) {
    validate_positive(wavelengths, "Wavelengths");
    frequencies_ = convert(wavelengths, speed_of_light_);
    wavelengths_.reset();
}

void Spectrum::set_speed_of_light(double speed_of_light) {
    if (!(speed_of_light > 0.0) || !std::isfinite(speed_of_light))
        throw ValidationError("speed_of_light must be positive and finite");
    speed_of_light_ = speed_of_light;
    wavelengths_.reset();
}

}  // namespace multilayer
