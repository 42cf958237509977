#pragma once

#include "multilayer/common.hpp"
#include "multilayer/structure.hpp"
#include "multilayer/engine.hpp"
#include "multilayer/formatter.hpp"
#include "multilayer/spectrum.hpp"
#include <optional>

namespace multilayer {

// Per-call overrides for Simulation::simulate. Unset fields fall back to the
// values stored on the Simulation.
struct SimulationRequest {
    std::shared_ptr<Structure> structure;
    std::shared_ptr<Engine> engine;
    std::optional<Vec> frequencies;
    std::optional<Vec> angles;
    std::shared_ptr<DataFormatter> formatter;
    bool save_data = true;        // Overwrite Simulation::data() with the result
    EngineOptions options;        // Passed to the engine unchanged
};

// Runs a Structure through an Engine over a frequency/angle grid, optionally
// formats the raw output, and keeps the latest result.
class Simulation {
public:
    enum class State {
        UNCONFIGURED,  // Missing structure, engine or frequencies
        CONFIGURED,    // Ready, no result stored yet
        RAN,           // data() holds the last stored result
    };

    Simulation();
    Simulation(std::shared_ptr<Structure> structure,
               std::shared_ptr<Engine> engine,
               const Vec& frequencies = Vec(),
               const Vec& angles = Vec::Zero(1),
               std::shared_ptr<DataFormatter> formatter = nullptr);

    // Algorithm:
    //   1. resolve structure/engine/frequencies/angles/formatter
    //   2. raw = engine.simulate(structure, frequencies, angles, options)
    //   3. result = formatter ? formatter.format(raw) : raw
    //   4. data = result if save_data
    // Errors from the engine or formatter propagate and leave data() untouched.
    FormattedResult simulate(const SimulationRequest& request = SimulationRequest());

    State state() const;
    bool is_configured() const;

    const std::optional<FormattedResult>& data() const { return data_; }
    void clear_data() { data_.reset(); }

    const std::shared_ptr<Structure>& structure() const { return structure_; }
    void set_structure(std::shared_ptr<Structure> structure) { structure_ = std::move(structure); }

    const std::shared_ptr<Engine>& engine() const { return engine_; }
    void set_engine(std::shared_ptr<Engine> engine) { engine_ = std::move(engine); }

    const std::shared_ptr<DataFormatter>& formatter() const { return formatter_; }
    void set_formatter(std::shared_ptr<DataFormatter> formatter) { formatter_ = std::move(formatter); }

    // Spectrum: frequency is canonical, wavelength derived
    const Spectrum& spectrum() const { return spectrum_; }
    const Vec& frequencies() const { return spectrum_.frequencies(); }
    void set_frequencies(const Vec& frequencies) { spectrum_.set_frequencies(frequencies); }
    const Vec& wavelengths() const { return spectrum_.wavelengths(); }
    void set_wavelengths(const Vec& wavelengths) { spectrum_.set_wavelengths(wavelengths); }
    double speed_of_light() const { return spectrum_.speed_of_light(); }
    void set_speed_of_light(double c) { spectrum_.set_speed_of_light(c); }

    // Incidence angles; defaults to normal incidence {0}
    const Vec& angles() const { return angles_; }
    void set_angles(const Vec& angles);

private:
    std::shared_ptr<Structure> structure_;
    std::shared_ptr<Engine> engine_;
    std::shared_ptr<DataFormatter> formatter_;
    Spectrum spectrum_;
    Vec angles_;
    std::optional<FormattedResult> data_;

    static void validate_angles(const Vec& angles);
};

std::string state_name(Simulation::State state);

}  // namespace multilayer
