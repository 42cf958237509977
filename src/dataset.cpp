#include "multilayer/dataset.hpp"
#include <algorithm>
#include <set>

namespace multilayer {

namespace {

int product(const std::vector<int>& shape, size_t begin, size_t end) {
    int p = 1;
    for (size_t i = begin; i < end; i++) p *= shape[i];
    return p;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

}  // namespace

// ---- NdArray ----

NdArray::NdArray(std::vector<int> shape_in, CVec values_in)
    : shape(std::move(shape_in)), values(std::move(values_in)) {
    for (int n : shape) {
        if (n < 0) throw FormatError("NdArray axis length must be non-negative");
    }
    int expected = product(shape, 0, shape.size());
    if (expected != values.size())
        throw FormatError("NdArray shape holds " + std::to_string(expected) +
                          " elements but " + std::to_string(values.size()) +
                          " values were given");
}

NdArray NdArray::from_vector(const CVec& v) {
    return NdArray({static_cast<int>(v.size())}, v);
}

NdArray NdArray::from_real(const Vec& v) {
    return NdArray({static_cast<int>(v.size())}, v.cast<Complex>());
}

NdArray NdArray::from_matrix(const CMat& m) {
    int rows = static_cast<int>(m.rows());
    int cols = static_cast<int>(m.cols());
    CVec flat(rows * cols);
    for (int r = 0; r < rows; r++) {
        for (int c = 0; c < cols; c++) {
            flat(r * cols + c) = m(r, c);
        }
    }
    return NdArray({rows, cols}, flat);
}

NdArray NdArray::squeezed() const {
    std::vector<int> new_shape;
    for (int n : shape) {
        if (n != 1) new_shape.push_back(n);
    }
    // Keep at least one axis
    if (new_shape.empty()) new_shape.push_back(size());
    return NdArray(new_shape, values);
}

Vec NdArray::real() const {
    return values.real();
}

int NdArray::offset(const std::vector<int>& index) const {
    if (index.size() != shape.size())
        throw std::out_of_range("NdArray index has " + std::to_string(index.size()) +
                                " entries for " + std::to_string(shape.size()) + " axes");
    int off = 0;
    for (size_t a = 0; a < shape.size(); a++) {
        if (index[a] < 0 || index[a] >= shape[a])
            throw std::out_of_range("NdArray index out of range on axis " +
                                    std::to_string(a));
        off = off * shape[a] + index[a];
    }
    return off;
}

// ---- options ----

EngineOptions filter_options(const EngineOptions& options,
                             const std::vector<std::string>& allowed) {
    EngineOptions filtered;
    for (const auto& key : allowed) {
        auto it = options.find(key);
        if (it != options.end()) filtered.insert(*it);
    }
    return filtered;
}

// ---- composite results ----

RawResult extract_part(const RawResult& raw, const std::string& part) {
    std::string prefix = part + PART_SEPARATOR;
    RawResult out;
    for (auto it = raw.lower_bound(prefix);
         it != raw.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        out[it->first.substr(prefix.size())] = it->second;
    }
    if (out.empty())
        throw FormatError("Raw result has no entries for part '" + part + "'");
    return out;
}

// ---- DataArray ----

int DataArray::axis(const std::string& dim) const {
    auto it = std::find(dims.begin(), dims.end(), dim);
    return it == dims.end() ? -1 : static_cast<int>(it - dims.begin());
}

// ---- Dataset ----

std::map<std::string, int> Dataset::sizes() const {
    std::map<std::string, int> out;
    for (const auto& [name, coord] : coords) {
        out[coord.dim] = coord.size();
    }
    for (const auto& [name, var] : data_vars) {
        for (size_t a = 0; a < var.dims.size(); a++) {
            out[var.dims[a]] = var.data.shape[a];
        }
    }
    return out;
}

void Dataset::add_coordinate(const std::string& name, Coordinate coord) {
    if (!coord.labels.empty() && coord.values.size() > 0)
        throw FormatError("Coordinate '" + name + "' has both values and labels");
    auto known = sizes();
    auto it = known.find(coord.dim);
    if (it != known.end() && it->second != coord.size())
        throw FormatError("Coordinate '" + name + "' has length " +
                          std::to_string(coord.size()) + " but dimension '" +
                          coord.dim + "' has length " + std::to_string(it->second));
    coords[name] = std::move(coord);
}

void Dataset::add_variable(DataArray variable) {
    if (static_cast<int>(variable.dims.size()) != variable.data.ndim())
        throw FormatError("Variable '" + variable.name + "' has " +
                          std::to_string(variable.data.ndim()) + " axes but dims [" +
                          join(variable.dims) + "]");
    std::set<std::string> unique(variable.dims.begin(), variable.dims.end());
    if (unique.size() != variable.dims.size())
        throw FormatError("Variable '" + variable.name + "' repeats a dimension");

    auto known = sizes();
    for (size_t a = 0; a < variable.dims.size(); a++) {
        auto it = known.find(variable.dims[a]);
        if (it != known.end() && it->second != variable.data.shape[a])
            throw FormatError("Variable '" + variable.name + "' has length " +
                              std::to_string(variable.data.shape[a]) +
                              " along '" + variable.dims[a] + "', expected " +
                              std::to_string(it->second));
    }
    std::string name = variable.name;
    data_vars[name] = std::move(variable);
}

bool Dataset::has_variable(const std::string& name) const {
    return data_vars.count(name) > 0;
}

const DataArray& Dataset::variable(const std::string& name) const {
    auto it = data_vars.find(name);
    if (it == data_vars.end())
        throw std::out_of_range("Dataset has no variable '" + name + "'");
    return it->second;
}

void Dataset::rename(const std::map<std::string, std::string>& mapping) {
    auto rn = [&](const std::string& s) {
        auto it = mapping.find(s);
        return it == mapping.end() ? s : it->second;
    };

    // Work on copies so a rejected mapping leaves the dataset untouched
    std::map<std::string, Coordinate> new_coords;
    for (const auto& [name, coord] : coords) {
        Coordinate c = coord;
        c.dim = rn(c.dim);
        if (!new_coords.emplace(rn(name), std::move(c)).second)
            throw FormatError("Renaming produces duplicate coordinate '" + rn(name) + "'");
    }

    std::map<std::string, DataArray> new_vars;
    for (const auto& [name, var] : data_vars) {
        DataArray v = var;
        v.name = rn(name);
        for (auto& d : v.dims) d = rn(d);
        if (new_vars.count(v.name) || new_coords.count(v.name))
            throw FormatError("Renaming produces duplicate name '" + v.name + "'");
        std::string key = v.name;
        new_vars.emplace(key, std::move(v));
    }

    coords = std::move(new_coords);
    data_vars = std::move(new_vars);
}

void Dataset::merge(const Dataset& other) {
    Dataset merged = *this;
    for (const auto& [name, coord] : other.coords) {
        auto it = merged.coords.find(name);
        if (it == merged.coords.end()) {
            merged.add_coordinate(name, coord);
            continue;
        }
        const Coordinate& mine = it->second;
        if (mine.dim != coord.dim || mine.labels != coord.labels ||
            mine.values.size() != coord.values.size() ||
            (mine.values.array() != coord.values.array()).any())
            throw FormatError("Cannot merge datasets: coordinate '" + name + "' differs");
    }
    for (const auto& [name, var] : other.data_vars) {
        if (merged.data_vars.count(name) || merged.coords.count(name))
            throw FormatError("Cannot merge datasets: '" + name + "' is defined in both");
        merged.add_variable(var);
    }
    merged.warnings.insert(merged.warnings.end(), other.warnings.begin(), other.warnings.end());
    *this = std::move(merged);
}

DataArray Dataset::to_array(const std::string& dim, const std::string& name) const {
    if (data_vars.empty())
        throw FormatError("Cannot convert an empty dataset to an array");

    const DataArray& first = data_vars.begin()->second;
    if (first.axis(dim) >= 0)
        throw FormatError("Dimension '" + dim + "' already exists");

    std::vector<std::string> labels;
    int block = first.data.size();
    for (const auto& [var_name, var] : data_vars) {
        if (var.dims != first.dims || var.data.shape != first.data.shape)
            throw FormatError("Variable '" + var_name + "' has dims [" + join(var.dims) +
                              "], cannot stack with [" + join(first.dims) + "]");
        labels.push_back(var_name);
    }

    int n_vars = static_cast<int>(labels.size());
    CVec values(n_vars * block);
    for (int v = 0; v < n_vars; v++) {
        values.segment(v * block, block) = data_vars.at(labels[v]).data.values;
    }

    std::vector<int> shape = {n_vars};
    shape.insert(shape.end(), first.data.shape.begin(), first.data.shape.end());

    DataArray out;
    out.name = name;
    out.dims = {dim};
    out.dims.insert(out.dims.end(), first.dims.begin(), first.dims.end());
    out.data = NdArray(shape, values);
    out.coords = coords;
    Coordinate label_coord;
    label_coord.dim = dim;
    label_coord.labels = labels;
    out.coords[dim] = label_coord;
    out.warnings = warnings;
    return out;
}

// ---- derived quantities ----

DerivedQuantityStatus add_absorptance(Dataset& dataset,
                                      const std::string& reflectance_key,
                                      const std::string& transmittance_key,
                                      const std::string& absorptance_key) {
    DerivedQuantityStatus status;
    status.variable = absorptance_key;

    std::vector<std::string> missing;
    if (!dataset.has_variable(reflectance_key)) missing.push_back(reflectance_key);
    if (!dataset.has_variable(transmittance_key)) missing.push_back(transmittance_key);
    if (!missing.empty()) {
        status.message = "cannot derive '" + absorptance_key + "': missing " + join(missing);
        return status;
    }

    const DataArray& R = dataset.variable(reflectance_key);
    const DataArray& T = dataset.variable(transmittance_key);
    if (R.dims != T.dims || R.data.shape != T.data.shape)
        throw FormatError("'" + reflectance_key + "' and '" + transmittance_key +
                          "' have different dimensions");

    DataArray A;
    A.name = absorptance_key;
    A.dims = R.dims;
    CVec values = (Complex(1.0, 0.0) - R.data.values.array() - T.data.values.array()).matrix();
    A.data = NdArray(R.data.shape, values);
    dataset.add_variable(std::move(A));

    status.added = true;
    return status;
}

DataArray vector_norm(const DataArray& array, const std::string& dim) {
    int axis = array.axis(dim);
    if (axis < 0)
        throw FormatError("Variable '" + array.name + "' has no dimension '" + dim + "'");

    const auto& shape = array.data.shape;
    int outer = product(shape, 0, axis);
    int n = shape[axis];
    int inner = product(shape, axis + 1, shape.size());

    CVec values(outer * inner);
    for (int o = 0; o < outer; o++) {
        for (int i = 0; i < inner; i++) {
            double sum = 0.0;
            for (int k = 0; k < n; k++) {
                sum += std::norm(array.data.values((o * n + k) * inner + i));
            }
            values(o * inner + i) = Complex(std::sqrt(sum), 0.0);
        }
    }

    DataArray out;
    out.name = "|" + array.name + "|";
    out.dims = array.dims;
    out.dims.erase(out.dims.begin() + axis);
    std::vector<int> new_shape = shape;
    new_shape.erase(new_shape.begin() + axis);
    out.data = NdArray(new_shape, values);
    for (const auto& [name, coord] : array.coords) {
        if (coord.dim != dim) out.coords[name] = coord;
    }
    return out;
}

std::vector<DerivedQuantityStatus> add_vector_norms(Dataset& dataset,
                                                    const std::string& dim) {
    std::vector<std::string> names;
    for (const auto& [name, var] : dataset.data_vars) names.push_back(name);

    std::vector<DerivedQuantityStatus> statuses;
    for (const auto& name : names) {
        const DataArray& var = dataset.variable(name);
        DerivedQuantityStatus status;
        status.variable = "|" + name + "|";
        if (var.axis(dim) < 0) {
            status.message = "cannot derive '" + status.variable +
                             "': no dimension '" + dim + "'";
        } else {
            dataset.add_variable(vector_norm(var, dim));
            status.added = true;
        }
        statuses.push_back(status);
    }
    return statuses;
}

}  // namespace multilayer
