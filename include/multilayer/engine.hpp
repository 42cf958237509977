#pragma once

#include "multilayer/common.hpp"
#include "multilayer/structure.hpp"
#include "multilayer/dataset.hpp"
#include <functional>
#include <memory>

namespace multilayer {

// Optical physics backend. simulate() must be a pure function of its
// arguments; an engine may still hold an expensive session resource.
// Calls block the caller until the backend returns.
class Engine {
public:
    virtual ~Engine() = default;

    // Reads structure.index(frequencies) and structure.thickness().
    // The returned schema is backend-defined.
    virtual RawResult simulate(const Structure& structure,
                               const Vec& frequencies,
                               const Vec& angles,
                               const EngineOptions& options = EngineOptions()) const = 0;
};

// Backend call taking already-evaluated optical parameters:
// (index [layers x freqs], thickness [layers], frequencies, angles, options)
using BackendFunction = std::function<RawResult(const CMat&, const Vec&,
                                                const Vec&, const Vec&,
                                                const EngineOptions&)>;

// Adapts a plain backend call (e.g. a vendor session's stack solver) to the
// Engine interface.
class FunctionEngine : public Engine {
public:
    // allowed_options: option keys forwarded to the backend; empty = all
    explicit FunctionEngine(BackendFunction backend,
                            std::vector<std::string> allowed_options = {},
                            std::string name = "");

    RawResult simulate(const Structure& structure,
                       const Vec& frequencies,
                       const Vec& angles,
                       const EngineOptions& options = EngineOptions()) const override;

    // Options the backend would receive
    EngineOptions filter(const EngineOptions& options) const;

    const std::string& name() const { return name_; }
    const std::vector<std::string>& allowed_options() const { return allowed_options_; }

private:
    BackendFunction backend_;
    std::vector<std::string> allowed_options_;
    std::string name_;
};

// Runs several engines on the same inputs and returns their outputs in one
// RawResult, each key prefixed with "<part>/". Every part receives the full
// options; FunctionEngine parts filter them with their own allow-list.
class CompositeEngine : public Engine {
public:
    using Part = std::pair<std::string, std::shared_ptr<Engine>>;

    // Part names must be unique, non-empty and free of PART_SEPARATOR
    explicit CompositeEngine(std::vector<Part> parts);

    RawResult simulate(const Structure& structure,
                       const Vec& frequencies,
                       const Vec& angles,
                       const EngineOptions& options = EngineOptions()) const override;

    const std::vector<Part>& parts() const { return parts_; }

private:
    std::vector<Part> parts_;
};

// Reflection/transmission solve plus field solve in one call, as parts
// "rt" and "field". rt_backend receives every option; field_options is the
// field backend's allow-list (empty = all).
std::shared_ptr<CompositeEngine> make_stack_engine(
    BackendFunction rt_backend, BackendFunction field_backend,
    std::vector<std::string> field_options = {});

// engine.simulate(structure, frequencies, angles, options)
RawResult simulate(const Structure& structure, const Engine& engine,
                   const Vec& frequencies, const Vec& angles,
                   const EngineOptions& options = EngineOptions());

}  // namespace multilayer
