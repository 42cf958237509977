#include "multilayer/engine.hpp"
#include <set>

namespace multilayer {

FunctionEngine::FunctionEngine(BackendFunction backend,
                               std::vector<std::string> allowed_options,
                               std::string name)
    : backend_(std::move(backend)),
      allowed_options_(std::move(allowed_options)),
      name_(std::move(name)) {
    if (!backend_)
        throw std::invalid_argument("FunctionEngine backend is empty");
}

EngineOptions FunctionEngine::filter(const EngineOptions& options) const {
    if (allowed_options_.empty()) return options;
    return filter_options(options, allowed_options_);
}

RawResult FunctionEngine::simulate(const Structure& structure,
                                   const Vec& frequencies,
                                   const Vec& angles,
                                   const EngineOptions& options) const {
    CMat index = structure.index(frequencies);
    Vec thickness = structure.thickness();
    return backend_(index, thickness, frequencies, angles, filter(options));
}

// ---- CompositeEngine ----

CompositeEngine::CompositeEngine(std::vector<Part> parts) : parts_(std::move(parts)) {
    if (parts_.empty())
        throw std::invalid_argument("CompositeEngine needs at least one part");
    std::set<std::string> seen;
    for (const auto& [name, engine] : parts_) {
        if (name.empty() || name.find(PART_SEPARATOR) != std::string::npos)
            throw std::invalid_argument("CompositeEngine part name '" + name +
                                        "' must be non-empty and contain no '" +
                                        PART_SEPARATOR + "'");
        if (!engine)
            throw std::invalid_argument("CompositeEngine part '" + name + "' is null");
        if (!seen.insert(name).second)
            throw std::invalid_argument("CompositeEngine part '" + name + "' is repeated");
    }
}

RawResult CompositeEngine::simulate(const Structure& structure,
                                    const Vec& frequencies,
                                    const Vec& angles,
                                    const EngineOptions& options) const {
    RawResult combined;
    for (const auto& [name, engine] : parts_) {
        RawResult part = engine->simulate(structure, frequencies, angles, options);
        for (auto& [key, value] : part) {
            combined[name + PART_SEPARATOR + key] = std::move(value);
        }
    }
    return combined;
}

std::shared_ptr<CompositeEngine> make_stack_engine(
    BackendFunction rt_backend, BackendFunction field_backend,
    std::vector<std::string> field_options) {
    auto rt = std::make_shared<FunctionEngine>(std::move(rt_backend),
                                               std::vector<std::string>{}, "stackrt");
    auto field = std::make_shared<FunctionEngine>(std::move(field_backend),
                                                  std::move(field_options), "stackfield");
    return std::make_shared<CompositeEngine>(std::vector<CompositeEngine::Part>{
        {STACK_RT_PART, rt}, {STACK_FIELD_PART, field}});
}

RawResult simulate(const Structure& structure, const Engine& engine,
                   const Vec& frequencies, const Vec& angles,
                   const EngineOptions& options) {
    return engine.simulate(structure, frequencies, angles, options);
}

}  // namespace multilayer
