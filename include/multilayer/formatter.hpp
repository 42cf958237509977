#pragma once

#include "multilayer/common.hpp"
#include "multilayer/dataset.hpp"
#include <memory>

namespace multilayer {

struct FormatterConfig {
    enum class OutputFormat {
        NONE,        // Pass the raw engine output through
        DATASET,     // Labeled Dataset
        DATA_ARRAY,  // All variables stacked into one labeled DataArray
    };
    OutputFormat output_format = OutputFormat::NONE;

    // Throw FormatError instead of recording a warning when a derived
    // quantity cannot be computed
    bool strict = false;

    // DATA_ARRAY only: name of the stacking dimension and of the array
    std::string array_dim = "variable";
    std::string array_name;

    // Throws ConfigurationError for an unrecognised output_format
    void validate() const;
};

// "none"/"", "dataset"/"xarray_dataset", "data_array"/"xarray_dataarray"
FormatterConfig::OutputFormat parse_output_format(const std::string& name);
std::string output_format_name(FormatterConfig::OutputFormat format);

// Converts an engine's raw output into an analysable result.
class DataFormatter {
public:
    virtual ~DataFormatter() = default;
    virtual FormattedResult format(const RawResult& raw) const = 0;
};

struct AbsorptanceTerm {
    std::string reflectance;
    std::string transmittance;
    std::string absorptance;
};

// Maps raw result keys onto a labeled dataset.
struct DatasetLayout {
    std::vector<std::string> dims;                  // raw keys holding dimension coordinates
    std::map<std::string, std::string> non_dims;    // raw coordinate key -> dimension it runs along
    std::vector<std::string> variables;             // raw keys holding data variables
    std::map<std::string, std::string> relabeling;  // applied after loading

    // Variables carry a trailing Cartesian "vector" dimension labelled i, j, k
    bool rectilinear_vector = false;

    // Derived after relabeling
    std::vector<AbsorptanceTerm> absorptance;
    bool add_vector_norms = false;
};

constexpr const char* VECTOR_DIM = "vector";

// Reflection/transmission output: r/t amplitudes and R/T powers over
// (frequency, theta), with absorptance As = 1 - Rs - Ts and Ap = 1 - Rp - Tp.
DatasetLayout stack_rt_layout();

// Field profile output: E/H for s and p over (x, y, z, frequency, theta,
// vector), with |E| and |H| norms.
DatasetLayout stack_field_layout();

class LabeledFormatter : public DataFormatter {
public:
    explicit LabeledFormatter(DatasetLayout layout,
                              FormatterConfig config = FormatterConfig());

    FormattedResult format(const RawResult& raw) const override;
    // Per-call configuration override
    FormattedResult format(const RawResult& raw, const FormatterConfig& config) const;

    Dataset to_dataset(const RawResult& raw) const { return to_dataset(raw, config_.strict); }
    Dataset to_dataset(const RawResult& raw, bool strict) const;

    DataArray to_data_array(const RawResult& raw) const;

    // Coordinates and variables only, no relabeling or derived quantities
    static Dataset load(const RawResult& raw, const DatasetLayout& layout);

    const DatasetLayout& layout() const { return layout_; }
    const FormatterConfig& config() const { return config_; }
    void set_config(const FormatterConfig& config);

private:
    DatasetLayout layout_;
    FormatterConfig config_;

    void derive(Dataset& dataset, bool strict) const;
};

// Formats the output of a CompositeEngine: each "<part>/" slice of the raw
// result goes through its own LabeledFormatter, and the resulting datasets
// are merged. Only the parts' layouts are used; output format and strict
// mode come from this formatter's config.
class CompositeFormatter : public DataFormatter {
public:
    using Part = std::pair<std::string, std::shared_ptr<LabeledFormatter>>;

    explicit CompositeFormatter(std::vector<Part> parts,
                                FormatterConfig config = FormatterConfig());

    FormattedResult format(const RawResult& raw) const override;
    FormattedResult format(const RawResult& raw, const FormatterConfig& config) const;

    // One dataset per part, in part order
    std::vector<Dataset> to_datasets(const RawResult& raw, bool strict) const;
    std::vector<Dataset> to_datasets(const RawResult& raw) const {
        return to_datasets(raw, config_.strict);
    }

    // Parts merged into one dataset. Throws FormatError if shared
    // coordinates differ or a variable name appears in two parts.
    Dataset to_dataset(const RawResult& raw, bool strict) const;
    Dataset to_dataset(const RawResult& raw) const { return to_dataset(raw, config_.strict); }

    // One array per part, named after the part, stacked along config().array_dim
    std::vector<DataArray> to_data_arrays(const RawResult& raw) const;

    const std::vector<Part>& parts() const { return parts_; }
    const FormatterConfig& config() const { return config_; }
    void set_config(const FormatterConfig& config);

private:
    std::vector<Part> parts_;
    FormatterConfig config_;
};

// Parts "rt" (stack_rt_layout) and "field" (stack_field_layout), matching
// make_stack_engine
std::shared_ptr<CompositeFormatter> make_stack_formatter(
    FormatterConfig config = FormatterConfig());

}  // namespace multilayer
