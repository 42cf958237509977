#pragma once

#include "multilayer/common.hpp"
#include <map>
#include <variant>

namespace multilayer {

// Dense n-dimensional complex array, row-major (last axis fastest).
// Real-valued quantities are stored with zero imaginary part.
struct NdArray {
    std::vector<int> shape;
    CVec values;

    NdArray() = default;
    NdArray(std::vector<int> shape, CVec values);

    static NdArray from_vector(const CVec& v);
    static NdArray from_real(const Vec& v);
    // shape {rows, cols}, flattened row-major
    static NdArray from_matrix(const CMat& m);

    int ndim() const { return static_cast<int>(shape.size()); }
    int size() const { return static_cast<int>(values.size()); }

    // Copy with all length-1 axes dropped
    NdArray squeezed() const;
    // Flattened real part
    Vec real() const;

    // Row-major flat offset of a multi-index
    int offset(const std::vector<int>& index) const;
    Complex at(const std::vector<int>& index) const { return values(offset(index)); }
};

// Opaque solver output: named arrays, schema defined by the engine.
using RawResult = std::map<std::string, NdArray>;

// Outputs of several engines combined into one RawResult are keyed
// "<part>/<key>"; see CompositeEngine.
constexpr const char* PART_SEPARATOR = "/";
constexpr const char* STACK_RT_PART = "rt";
constexpr const char* STACK_FIELD_PART = "field";

// Entries of raw belonging to part, with the "<part>/" prefix removed.
// Throws FormatError if the part has no entries.
RawResult extract_part(const RawResult& raw, const std::string& part);

// Backend options passed through Engine::simulate
using EngineOptions = std::map<std::string, double>;

// Keep only the entries whose key is in allowed
EngineOptions filter_options(const EngineOptions& options,
                             const std::vector<std::string>& allowed);

// 1-D coordinate along dim: numeric values, or string labels
// (e.g. the i, j, k components of a vector dimension).
struct Coordinate {
    std::string dim;
    Vec values;
    std::vector<std::string> labels;

    int size() const {
        return labels.empty() ? static_cast<int>(values.size())
                              : static_cast<int>(labels.size());
    }
};

struct DataArray {
    std::string name;
    std::vector<std::string> dims;   // one per axis of data
    NdArray data;
    std::map<std::string, Coordinate> coords;

    // Carried over from the Dataset this array was stacked from
    std::vector<std::string> warnings;

    // Axis of dim, -1 if absent
    int axis(const std::string& dim) const;

    bool complete() const { return warnings.empty(); }
};

// Labeled collection of variables sharing named dimensions.
class Dataset {
public:
    std::map<std::string, Coordinate> coords;
    std::map<std::string, DataArray> data_vars;

    // Derived quantities that could not be produced, one message each
    std::vector<std::string> warnings;

    // Both validate lengths against the dimensions already present
    void add_coordinate(const std::string& name, Coordinate coord);
    void add_variable(DataArray variable);

    bool has_variable(const std::string& name) const;
    const DataArray& variable(const std::string& name) const;

    // Length of every dimension seen in coords and variables
    std::map<std::string, int> sizes() const;

    // Rename variables, coordinates and dimensions. Throws FormatError on a
    // name collision, leaving the dataset unchanged.
    void rename(const std::map<std::string, std::string>& mapping);

    // Add other's coordinates, variables and warnings. Shared coordinates
    // must be identical and variable names must not collide; on FormatError
    // this dataset is unchanged.
    void merge(const Dataset& other);

    // Stack all variables along a new leading dimension. Variables must share
    // the same dims. The new dimension is labelled with the variable names
    // (in name order) and the dataset coordinates and warnings are carried over.
    DataArray to_array(const std::string& dim = "variable",
                       const std::string& name = "") const;

    bool complete() const { return warnings.empty(); }
};

// Outcome of adding a derived quantity to a dataset
struct DerivedQuantityStatus {
    bool added = false;
    std::string variable;
    std::string message;    // why it was skipped (empty when added)
};

// A = 1 - R - T. Skips (added = false) if R or T is missing.
DerivedQuantityStatus add_absorptance(Dataset& dataset,
                                      const std::string& reflectance_key,
                                      const std::string& transmittance_key,
                                      const std::string& absorptance_key);

// Euclidean norm over dim; result drops that dimension
DataArray vector_norm(const DataArray& array, const std::string& dim);

// Adds "|name|" for every variable that has dim. One status per variable.
std::vector<DerivedQuantityStatus> add_vector_norms(Dataset& dataset,
                                                    const std::string& dim);

// What a Simulation hands back: raw engine output, or a formatted form.
using FormattedResult = std::variant<RawResult, Dataset, DataArray>;

}  // namespace multilayer
