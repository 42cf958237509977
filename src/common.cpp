#include "multilayer/common.hpp"

namespace multilayer {

void PhysicalConstants::validate() const {
    if (!(speed_of_light > 0.0))
        throw ValidationError("speed_of_light must be positive");
    if (!(vacuum_permittivity > 0.0))
        throw ValidationError("vacuum_permittivity must be positive");
    if (!(electron_charge > 0.0))
        throw ValidationError("electron_charge must be positive");
    if (!(electron_mass > 0.0))
        throw ValidationError("electron_mass must be positive");
}

Component component_from_int(int component) {
    switch (component) {
        case 1: return Component::X;
        case 2: return Component::Y;
        case 3: return Component::Z;
    }
    throw ValidationError("component must be 1, 2 or 3, got " +
                          std::to_string(component));
}

}  // namespace multilayer
