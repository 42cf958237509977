#pragma once

#include "multilayer/common.hpp"

namespace multilayer {

// Anything an engine can propagate light through: per-layer complex index
// as a function of frequency, plus per-layer thickness.
class Structure {
public:
    virtual ~Structure() = default;

    // (num_layers x num_frequencies) complex refractive index
    virtual CMat index(const Vec& frequencies,
                       Component component = Component::X) const = 0;

    // Per-layer thickness (m), one entry per layer, all >= 0
    virtual Vec thickness() const = 0;

    virtual int num_layers() const = 0;
};

}  // namespace multilayer
