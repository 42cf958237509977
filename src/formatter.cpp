#include "multilayer/formatter.hpp"
#include <iostream>
#include <set>

namespace multilayer {

namespace {

const NdArray& lookup(const RawResult& raw, const std::string& key) {
    auto it = raw.find(key);
    if (it == raw.end())
        throw FormatError("Raw result has no key '" + key + "'");
    return it->second;
}

}  // namespace

void FormatterConfig::validate() const {
    switch (output_format) {
        case OutputFormat::NONE:
        case OutputFormat::DATASET:
        case OutputFormat::DATA_ARRAY:
            return;
    }
    throw ConfigurationError("Output format not recognised: " +
                             std::to_string(static_cast<int>(output_format)));
}

FormatterConfig::OutputFormat parse_output_format(const std::string& name) {
    if (name.empty() || name == "none")
        return FormatterConfig::OutputFormat::NONE;
    if (name == "dataset" || name == "xarray_dataset")
        return FormatterConfig::OutputFormat::DATASET;
    if (name == "data_array" || name == "xarray_dataarray")
        return FormatterConfig::OutputFormat::DATA_ARRAY;
    throw ConfigurationError("Output format not recognised: '" + name + "'");
}

std::string output_format_name(FormatterConfig::OutputFormat format) {
    switch (format) {
        case FormatterConfig::OutputFormat::NONE: return "none";
        case FormatterConfig::OutputFormat::DATASET: return "dataset";
        case FormatterConfig::OutputFormat::DATA_ARRAY: return "data_array";
    }
    throw ConfigurationError("Output format not recognised: " +
                             std::to_string(static_cast<int>(format)));
}

DatasetLayout stack_rt_layout() {
    DatasetLayout layout;
    layout.dims = {"frequency", "theta"};
    layout.non_dims = {{"lambda", "frequency"}};
    layout.variables = {"rs", "rp", "ts", "tp", "Rs", "Rp", "Ts", "Tp"};
    layout.relabeling = {{"lambda", "wavelength"}};
    layout.absorptance = {{"Rs", "Ts", "As"}, {"Rp", "Tp", "Ap"}};
    return layout;
}

DatasetLayout stack_field_layout() {
    DatasetLayout layout;
    layout.dims = {"x", "y", "z", "frequency", "theta"};
    layout.non_dims = {{"lambda", "frequency"}};
    layout.variables = {"Es", "Hs", "Ep", "Hp"};
    layout.relabeling = {{"lambda", "wavelength"}};
    layout.rectilinear_vector = true;
    layout.add_vector_norms = true;
    return layout;
}

// ---- LabeledFormatter ----

LabeledFormatter::LabeledFormatter(DatasetLayout layout, FormatterConfig config)
    : layout_(std::move(layout)), config_(std::move(config)) {
    config_.validate();
}

void LabeledFormatter::set_config(const FormatterConfig& config) {
    config.validate();
    config_ = config;
}

Dataset LabeledFormatter::load(const RawResult& raw, const DatasetLayout& layout) {
    Dataset dataset;
    std::vector<std::string> dims = layout.dims;
    std::vector<int> shape;

    for (const auto& dim : dims) {
        Coordinate coord;
        coord.dim = dim;
        coord.values = lookup(raw, dim).real();
        shape.push_back(coord.size());
        dataset.add_coordinate(dim, std::move(coord));
    }

    if (layout.rectilinear_vector) {
        Coordinate coord;
        coord.dim = VECTOR_DIM;
        coord.labels = {"i", "j", "k"};
        dims.push_back(VECTOR_DIM);
        shape.push_back(3);
        dataset.add_coordinate(VECTOR_DIM, std::move(coord));
    }

    for (const auto& [name, along] : layout.non_dims) {
        Coordinate coord;
        coord.dim = along;
        coord.values = lookup(raw, name).real();
        dataset.add_coordinate(name, std::move(coord));
    }

    int expected = 1;
    for (int n : shape) expected *= n;

    for (const auto& name : layout.variables) {
        const NdArray& source = lookup(raw, name);
        if (source.size() != expected)
            throw FormatError("Raw variable '" + name + "' has " +
                              std::to_string(source.size()) + " values, expected " +
                              std::to_string(expected) + " for its dimensions");
        DataArray var;
        var.name = name;
        var.dims = dims;
        var.data = NdArray(shape, source.values);
        dataset.add_variable(std::move(var));
    }
    return dataset;
}

void LabeledFormatter::derive(Dataset& dataset, bool strict) const {
    std::vector<DerivedQuantityStatus> statuses;
    for (const auto& term : layout_.absorptance) {
        statuses.push_back(add_absorptance(dataset, term.reflectance,
                                           term.transmittance, term.absorptance));
    }
    if (layout_.add_vector_norms) {
        std::string dim = VECTOR_DIM;
        auto it = layout_.relabeling.find(dim);
        if (it != layout_.relabeling.end()) dim = it->second;
        auto norms = add_vector_norms(dataset, dim);
        statuses.insert(statuses.end(), norms.begin(), norms.end());
    }

    for (const auto& status : statuses) {
        if (status.added) continue;
        if (strict) throw FormatError(status.message);
        std::cerr << "[LabeledFormatter] Warning: " << status.message << std::endl;
        dataset.warnings.push_back(status.message);
    }
}

Dataset LabeledFormatter::to_dataset(const RawResult& raw, bool strict) const {
    Dataset dataset = load(raw, layout_);
    dataset.rename(layout_.relabeling);
    derive(dataset, strict);
    return dataset;
}

DataArray LabeledFormatter::to_data_array(const RawResult& raw) const {
    return to_dataset(raw).to_array(config_.array_dim, config_.array_name);
}

FormattedResult LabeledFormatter::format(const RawResult& raw) const {
    return format(raw, config_);
}

FormattedResult LabeledFormatter::format(const RawResult& raw,
                                         const FormatterConfig& config) const {
    switch (config.output_format) {
        case FormatterConfig::OutputFormat::NONE:
            return raw;
        case FormatterConfig::OutputFormat::DATASET:
            return to_dataset(raw, config.strict);
        case FormatterConfig::OutputFormat::DATA_ARRAY:
            return to_dataset(raw, config.strict).to_array(config.array_dim,
                                                           config.array_name);
    }
    throw ConfigurationError("Output format not recognised: " +
                             std::to_string(static_cast<int>(config.output_format)));
}

// ---- CompositeFormatter ----

CompositeFormatter::CompositeFormatter(std::vector<Part> parts, FormatterConfig config)
    : parts_(std::move(parts)), config_(std::move(config)) {
    config_.validate();
    if (parts_.empty())
        throw std::invalid_argument("CompositeFormatter needs at least one part");
    std::set<std::string> seen;
    for (const auto& [name, formatter] : parts_) {
        if (!formatter)
            throw std::invalid_argument("CompositeFormatter part '" + name + "' is null");
        if (!seen.insert(name).second)
            throw std::invalid_argument("CompositeFormatter part '" + name + "' is repeated");
    }
}

void CompositeFormatter::set_config(const FormatterConfig& config) {
    config.validate();
    config_ = config;
}

std::vector<Dataset> CompositeFormatter::to_datasets(const RawResult& raw, bool strict) const {
    std::vector<Dataset> datasets;
    for (const auto& [name, formatter] : parts_) {
        datasets.push_back(formatter->to_dataset(extract_part(raw, name), strict));
    }
    return datasets;
}

Dataset CompositeFormatter::to_dataset(const RawResult& raw, bool strict) const {
    std::vector<Dataset> datasets = to_datasets(raw, strict);
    Dataset merged = std::move(datasets.front());
    for (size_t i = 1; i < datasets.size(); i++) {
        merged.merge(datasets[i]);
    }
    return merged;
}

std::vector<DataArray> CompositeFormatter::to_data_arrays(const RawResult& raw) const {
    std::vector<Dataset> datasets = to_datasets(raw);
    std::vector<DataArray> arrays;
    for (size_t i = 0; i < datasets.size(); i++) {
        arrays.push_back(datasets[i].to_array(config_.array_dim, parts_[i].first));
    }
    return arrays;
}

FormattedResult CompositeFormatter::format(const RawResult& raw) const {
    return format(raw, config_);
}

FormattedResult CompositeFormatter::format(const RawResult& raw,
                                           const FormatterConfig& config) const {
    switch (config.output_format) {
        case FormatterConfig::OutputFormat::NONE:
            return raw;
        case FormatterConfig::OutputFormat::DATASET:
            return to_dataset(raw, config.strict);
        case FormatterConfig::OutputFormat::DATA_ARRAY:
            return to_dataset(raw, config.strict).to_array(config.array_dim,
                                                           config.array_name);
    }
    throw ConfigurationError("Output format not recognised: " +
                             std::to_string(static_cast<int>(config.output_format)));
}

std::shared_ptr<CompositeFormatter> make_stack_formatter(FormatterConfig config) {
    return std::make_shared<CompositeFormatter>(
        std::vector<CompositeFormatter::Part>{
            {STACK_RT_PART, std::make_shared<LabeledFormatter>(stack_rt_layout())},
            {STACK_FIELD_PART, std::make_shared<LabeledFormatter>(stack_field_layout())}},
        std::move(config));
}

}  // namespace multilayer
