#include "multilayer/simulation.hpp"

namespace multilayer {

Simulation::Simulation() : angles_(Vec::Zero(1)) {}

Simulation::Simulation(std::shared_ptr<Structure> structure,
                       std::shared_ptr<Engine> engine,
                       const Vec& frequencies,
                       const Vec& angles,
                       std::shared_ptr<DataFormatter> formatter)
    : structure_(std::move(structure)),
      engine_(std::move(engine)),
      formatter_(std::move(formatter)) {
    spectrum_.set_frequencies(frequencies);
    set_angles(angles);
}

void Simulation::validate_angles(const Vec& angles) {
    if (angles.size() == 0)
        throw ConfigurationError("Simulation needs at least one angle");
    for (int i = 0; i < angles.size(); i++) {
        if (!std::isfinite(angles(i)))
            throw ValidationError("Angles must be finite");
    }
}

void Simulation::set_angles(const Vec& angles) {
    validate_angles(angles);
    angles_ = angles;
}

bool Simulation::is_configured() const {
    return structure_ && engine_ && !spectrum_.empty() && angles_.size() > 0;
}

Simulation::State Simulation::state() const {
    if (data_) return State::RAN;
    return is_configured() ? State::CONFIGURED : State::UNCONFIGURED;
}

FormattedResult Simulation::simulate(const SimulationRequest& request) {
    const std::shared_ptr<Structure>& structure =
        request.structure ? request.structure : structure_;
    const std::shared_ptr<Engine>& engine =
        request.engine ? request.engine : engine_;
    const std::shared_ptr<DataFormatter>& formatter =
        request.formatter ? request.formatter : formatter_;

    if (!structure)
        throw ConfigurationError("Simulation has no structure");
    if (!engine)
        throw ConfigurationError("Simulation has no engine");

    Vec frequencies;
    if (request.frequencies) {
        frequencies = Spectrum(*request.frequencies, spectrum_.speed_of_light()).frequencies();
    } else {
        frequencies = spectrum_.frequencies();
    }
    if (frequencies.size() == 0)
        throw ConfigurationError("Simulation has no frequencies");

    const Vec& angles = request.angles ? *request.angles : angles_;
    validate_angles(angles);

    RawResult raw = multilayer::simulate(*structure, *engine, frequencies, angles,
                                         request.options);

    FormattedResult result = formatter ? formatter->format(raw)
                                       : FormattedResult(std::move(raw));

    if (request.save_data) {
        data_ = result;
    }
    return result;
}

std::string state_name(Simulation::State state) {
    switch (state) {
        case Simulation::State::UNCONFIGURED: return "unconfigured";
        case Simulation::State::CONFIGURED: return "configured";
        case Simulation::State::RAN: return "ran";
    }
    return "unknown";
}

}  // namespace multilayer
