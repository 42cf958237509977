#pragma once

#include "multilayer/common.hpp"
#include <optional>

namespace multilayer {

// Spectral axis with frequency as the single source of truth.
// Wavelength = c / frequency is derived on demand and cached; the cache is
// dropped whenever frequencies or c change. Writing wavelengths converts
// them into frequencies.
// An empty Spectrum is "unset" and has no wavelengths.
class Spectrum {
public:
    Spectrum() = default;
    explicit Spectrum(Vec frequencies, double speed_of_light = SPEED_OF_LIGHT);

    static Spectrum from_wavelengths(const Vec& wavelengths,
                                     double speed_of_light = SPEED_OF_LIGHT);

    // Returned references are invalidated by any setter; copy to keep them.
    const Vec& frequencies() const { return frequencies_; }
    void set_frequencies(Vec frequencies);

    const Vec& wavelengths() const;
    void set_wavelengths(const Vec& wavelengths);

    double speed_of_light() const { return speed_of_light_; }
    void set_speed_of_light(double speed_of_light);

    bool empty() const { return frequencies_.size() == 0; }
    int size() const { return static_cast<int>(frequencies_.size()); }
    bool wavelengths_cached() const { return wavelengths_.has_value(); }

    // c / values, elementwise (frequency <-> wavelength)
    static Vec convert(const Vec& values, double speed_of_light = SPEED_OF_LIGHT);

private:
    Vec frequencies_;
    double speed_of_light_ = SPEED_OF_LIGHT;
    mutable std::optional<Vec> wavelengths_;

    static void validate_positive(const Vec& values, const char* what);
};

}  // namespace multilayer
