#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <pybind11/complex.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>

#include <algorithm>

#include "multilayer/common.hpp"
#include "multilayer/lorentz_oscillator.hpp"
#include "multilayer/material.hpp"
#include "multilayer/structure.hpp"
#include "multilayer/layer.hpp"
#include "multilayer/multilayer.hpp"
#include "multilayer/spectrum.hpp"
#include "multilayer/dataset.hpp"
#include "multilayer/engine.hpp"
#include "multilayer/formatter.hpp"
#include "multilayer/simulation.hpp"

namespace py = pybind11;
using namespace multilayer;

// Trampolines so that Python classes can implement the capability interfaces.

class PyMaterial : public Material {
public:
    using Material::Material;

    CVec index(const Vec& frequencies, Component component) const override {
        PYBIND11_OVERRIDE_PURE(CVec, Material, index, frequencies, component);
    }

    // Python materials are deep-copied with copy.deepcopy; the copy's Python
    // object is kept alive by the returned pointer.
    std::shared_ptr<Material> clone() const override {
        py::gil_scoped_acquire gil;
        py::function override = py::get_override(static_cast<const Material*>(this), "clone");
        py::object copy;
        if (override) {
            copy = override();
        } else {
            py::object self = py::cast(static_cast<const Material*>(this),
                                       py::return_value_policy::reference);
            copy = py::module_::import("copy").attr("deepcopy")(self);
        }
        auto keep_alive = std::make_shared<py::object>(copy);
        return std::shared_ptr<Material>(keep_alive, copy.cast<Material*>());
    }

    // Without an override, Python materials compare by identity
    bool equals(const Material& other) const override {
        py::gil_scoped_acquire gil;
        py::function override = py::get_override(static_cast<const Material*>(this), "equals");
        if (override) return override(&other).cast<bool>();
        return this == &other;
    }
};

class PyEngine : public Engine {
public:
    using Engine::Engine;

    RawResult simulate(const Structure& structure, const Vec& frequencies,
                       const Vec& angles, const EngineOptions& options) const override {
        PYBIND11_OVERRIDE_PURE(RawResult, Engine, simulate,
                               structure, frequencies, angles, options);
    }
};

class PyDataFormatter : public DataFormatter {
public:
    using DataFormatter::DataFormatter;

    FormattedResult format(const RawResult& raw) const override {
        PYBIND11_OVERRIDE_PURE(FormattedResult, DataFormatter, format, raw);
    }
};

// Helper: copy an NdArray into a numpy array of its shape
static py::array_t<Complex> ndarray_to_numpy(const NdArray& a) {
    std::vector<py::ssize_t> shape(a.shape.begin(), a.shape.end());
    py::array_t<Complex> out(shape);
    std::copy(a.values.data(), a.values.data() + a.values.size(), out.mutable_data());
    return out;
}

static NdArray ndarray_from_numpy(
    const py::array_t<Complex, py::array::c_style | py::array::forcecast>& arr) {
    std::vector<int> shape(arr.shape(), arr.shape() + arr.ndim());
    CVec values(arr.size());
    std::copy(arr.data(), arr.data() + arr.size(), values.data());
    return NdArray(shape, values);
}

PYBIND11_MODULE(_core, m) {
    m.doc() = "Layered optical media and pluggable simulation engines";

    // --- Errors ---
    py::register_exception<ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_RuntimeError);
    py::register_exception<FormatError>(m, "FormatError", PyExc_RuntimeError);

    // --- Constants ---
    m.attr("SPEED_OF_LIGHT") = SPEED_OF_LIGHT;
    m.attr("VACUUM_PERMITTIVITY") = VACUUM_PERMITTIVITY;
    m.attr("ELECTRON_CHARGE") = ELECTRON_CHARGE;
    m.attr("ELECTRON_MASS") = ELECTRON_MASS;

    py::class_<PhysicalConstants>(m, "PhysicalConstants")
        .def(py::init<>())
        .def_readwrite("speed_of_light", &PhysicalConstants::speed_of_light, "m/s")
        .def_readwrite("vacuum_permittivity", &PhysicalConstants::vacuum_permittivity, "F/m")
        .def_readwrite("electron_charge", &PhysicalConstants::electron_charge, "C")
        .def_readwrite("electron_mass", &PhysicalConstants::electron_mass, "kg")
        .def("validate", &PhysicalConstants::validate);

    py::enum_<Component>(m, "Component")
        .value("X", Component::X)
        .value("Y", Component::Y)
        .value("Z", Component::Z);

    m.def("component_from_int", &component_from_int, py::arg("component"));

    // --- Lorentz oscillator functions ---
    m.def("frequency_to_angular", &frequency_to_angular, py::arg("frequencies"));
    m.def("plasma_frequency_squared", &plasma_frequency_squared,
          py::arg("N"), py::arg("constants") = PhysicalConstants());
    m.def("epsilon_static", &epsilon_static,
          py::arg("omega_0"), py::arg("N"), py::arg("chi"),
          py::arg("constants") = PhysicalConstants());
    m.def("epsilon_infinity", &epsilon_infinity, py::arg("chi"));
    m.def("epsilon_real", &epsilon_real,
          py::arg("omega"), py::arg("omega_0"), py::arg("gamma"), py::arg("N"),
          py::arg("chi"), py::arg("constants") = PhysicalConstants(),
          py::arg("approximate") = false);
    m.def("epsilon_imag", &epsilon_imag,
          py::arg("omega"), py::arg("omega_0"), py::arg("gamma"), py::arg("N"),
          py::arg("chi"), py::arg("constants") = PhysicalConstants(),
          py::arg("approximate") = false);
    m.def("refractive_index_real", &refractive_index_real,
          py::arg("epsilon1"), py::arg("epsilon2"));
    m.def("refractive_index_imag", &refractive_index_imag,
          py::arg("epsilon1"), py::arg("epsilon2"));

    // --- Materials ---
    py::class_<Material, PyMaterial, std::shared_ptr<Material>>(m, "Material")
        .def(py::init<std::string>(), py::arg("name") = "")
        .def("index", &Material::index,
             py::arg("frequencies"), py::arg("component") = Component::X,
             "Complex refractive index at each frequency (Hz)")
        .def("index_at", &Material::index_at,
             py::arg("frequency"), py::arg("component") = Component::X)
        .def("clone", &Material::clone)
        .def("equals", &Material::equals, py::arg("other"))
        .def("__eq__", [](const Material& a, const Material& b) { return a == b; })
        .def_property("name", &Material::name, &Material::set_name);

    py::class_<ConstantIndex, Material, std::shared_ptr<ConstantIndex>>(m, "ConstantIndex")
        .def(py::init<Complex, std::string>(),
             py::arg("value") = Complex(1.0, 0.0), py::arg("name") = "")
        .def_property("value", &ConstantIndex::value, &ConstantIndex::set_value)
        .def("__repr__", [](const ConstantIndex& c) {
            return "<ConstantIndex n=" + std::to_string(c.value().real()) +
                   (c.value().imag() >= 0 ? "+" : "") +
                   std::to_string(c.value().imag()) + "j>";
        });

    py::class_<LorentzParameters>(m, "LorentzParameters")
        .def(py::init<>())
        .def(py::init([](double resonance, double linewidth, double density,
                         double susceptibility, bool approximate) {
                 LorentzParameters p;
                 p.resonance = resonance;
                 p.linewidth = linewidth;
                 p.density = density;
                 p.susceptibility = susceptibility;
                 p.approximate = approximate;
                 return p;
             }),
             py::arg("resonance"), py::arg("linewidth"), py::arg("density"),
             py::arg("susceptibility") = 0.0, py::arg("approximate") = false)
        .def_readwrite("resonance", &LorentzParameters::resonance, "omega_0 (rad/s)")
        .def_readwrite("linewidth", &LorentzParameters::linewidth, "gamma (rad/s)")
        .def_readwrite("density", &LorentzParameters::density, "N (m^-3)")
        .def_readwrite("susceptibility", &LorentzParameters::susceptibility, "chi")
        .def_readwrite("approximate", &LorentzParameters::approximate)
        .def("validate", &LorentzParameters::validate);

    py::class_<LorentzOscillator, Material, std::shared_ptr<LorentzOscillator>>(m, "LorentzOscillator")
        .def(py::init<const LorentzParameters&, const PhysicalConstants&, std::string>(),
             py::arg("parameters"), py::arg("constants") = PhysicalConstants(),
             py::arg("name") = "")
        .def("permittivity", &LorentzOscillator::permittivity, py::arg("frequencies"))
        // Copies, so edits go back through the validating setters
        .def_property("parameters",
                      [](const LorentzOscillator& mat) { return mat.parameters(); },
                      &LorentzOscillator::set_parameters)
        .def_property("constants",
                      [](const LorentzOscillator& mat) { return mat.constants(); },
                      &LorentzOscillator::set_constants);

    // --- Structures ---
    py::class_<Structure, std::shared_ptr<Structure>>(m, "Structure")
        .def("index", &Structure::index,
             py::arg("frequencies"), py::arg("component") = Component::X,
             "(num_layers x num_frequencies) complex refractive index")
        .def_property_readonly("thickness", &Structure::thickness)
        .def("num_layers", &Structure::num_layers);

    py::class_<Layer, Structure, std::shared_ptr<Layer>>(m, "Layer")
        .def(py::init<>(), "Vacuum layer: index 1, thickness 0")
        .def(py::init<IndexFunction, double, std::string>(),
             py::arg("index_function"), py::arg("thickness") = 0.0,
             py::arg("name") = "")
        .def_static("from_material",
             py::overload_cast<std::shared_ptr<Material>, double, const std::string&>(
                 &Layer::from_material),
             py::arg("material") = nullptr, py::arg("thickness") = 0.0,
             py::arg("name") = "",
             py::keep_alive<0, 1>())
        .def_static("from_material",
             py::overload_cast<std::shared_ptr<Material>, double, const NamingFunction&>(
                 &Layer::from_material),
             py::arg("material"), py::arg("thickness"), py::arg("naming"),
             py::keep_alive<0, 1>())
        .def_property("thickness", &Layer::thickness_value, &Layer::set_thickness)
        .def_property("name", &Layer::name, &Layer::set_name)
        .def_property_readonly("material", &Layer::material)
        .def("set_material", &Layer::set_material, py::arg("material"),
             py::keep_alive<1, 2>())
        .def("set_index_function", &Layer::set_index_function, py::arg("index_function"))
        .def("deep_copy", &Layer::deep_copy)
        .def("__deepcopy__", [](const Layer& l, py::dict) { return l.deep_copy(); })
        .def("__copy__", [](const Layer& l) { return Layer(l); })
        .def("__eq__", [](const Layer& a, const Layer& b) { return a == b; })
        .def("__repr__", [](const Layer& l) {
            return "<Layer '" + l.name() + "' d=" + std::to_string(l.thickness_value()) + ">";
        });

    py::enum_<LayerSharing>(m, "LayerSharing")
        .value("COPY", LayerSharing::COPY)
        .value("ALIAS", LayerSharing::ALIAS);

    py::class_<Multilayer, Structure, std::shared_ptr<Multilayer>>(m, "Multilayer")
        .def(py::init<>())
        .def(py::init<std::vector<LayerPtr>>(), py::arg("layers"))
        .def_static("from_unit_cell",
             [](const std::vector<LayerPtr>& unit_cell, const LayerPtr& incident,
                const LayerPtr& exit, int num_periods, bool copy_layers) {
                 return Multilayer::from_unit_cell(
                     unit_cell, incident, exit, num_periods,
                     copy_layers ? LayerSharing::COPY : LayerSharing::ALIAS);
             },
             py::arg("unit_cell"), py::arg("incident_layer"), py::arg("exit_layer"),
             py::arg("num_periods") = 1, py::arg("copy_layers") = true,
             "Build [incident] + unit_cell * num_periods + [exit]. With copy_layers=False "
             "the same Layer objects are shared by every period and the boundaries.")
        .def("from_own_unit_cell",
             [](const Multilayer& self, std::optional<int> num_periods,
                std::optional<std::vector<LayerPtr>> unit_cell,
                LayerPtr incident, LayerPtr exit, bool copy_layers) {
                 return self.from_own_unit_cell(
                     num_periods, unit_cell, std::move(incident), std::move(exit),
                     copy_layers ? LayerSharing::COPY : LayerSharing::ALIAS);
             },
             py::arg("num_periods") = py::none(), py::arg("unit_cell") = py::none(),
             py::arg("incident_layer") = nullptr, py::arg("exit_layer") = nullptr,
             py::arg("copy_layers") = true)
        .def_property("layers",
             [](const Multilayer& ml) { return ml.layers(); },
             &Multilayer::set_layers)
        .def_property_readonly("stack_layers", &Multilayer::stack_layers)
        .def_property_readonly("unit_cell", &Multilayer::unit_cell)
        .def_property_readonly("num_periods", &Multilayer::num_periods)
        .def("append_layer", &Multilayer::append_layer, py::arg("layer"))
        .def("insert_layer", &Multilayer::insert_layer, py::arg("position"), py::arg("layer"))
        .def("remove_layer", &Multilayer::remove_layer, py::arg("position"))
        .def("__len__", &Multilayer::num_layers)
        .def("__getitem__", [](const Multilayer& ml, int i) {
            if (i < 0) i += ml.num_layers();
            if (i < 0 || i >= ml.num_layers()) throw py::index_error();
            return ml.layers()[i];
        })
        .def("__repr__", [](const Multilayer& ml) {
            return "<Multilayer " + std::to_string(ml.num_layers()) + " layers>";
        });

    // --- Spectrum ---
    py::class_<Spectrum>(m, "Spectrum")
        .def(py::init<>())
        .def(py::init<Vec, double>(),
             py::arg("frequencies"), py::arg("speed_of_light") = SPEED_OF_LIGHT)
        .def_static("from_wavelengths", &Spectrum::from_wavelengths,
             py::arg("wavelengths"), py::arg("speed_of_light") = SPEED_OF_LIGHT)
        // Getters return copies; a view would dangle once the grid is replaced
        .def_property("frequencies",
             [](const Spectrum& s) { return Vec(s.frequencies()); },
             &Spectrum::set_frequencies)
        .def_property("wavelengths",
             [](const Spectrum& s) { return Vec(s.wavelengths()); },
             &Spectrum::set_wavelengths)
        .def_property("speed_of_light", &Spectrum::speed_of_light,
                      &Spectrum::set_speed_of_light)
        .def("__len__", &Spectrum::size);

    // --- Labeled data ---
    py::class_<NdArray>(m, "NdArray")
        .def(py::init(&ndarray_from_numpy), py::arg("array"))
        .def_readonly("shape", &NdArray::shape)
        .def("to_numpy", &ndarray_to_numpy)
        .def("squeezed", &NdArray::squeezed)
        .def("__repr__", [](const NdArray& a) {
            std::string s = "<NdArray shape=(";
            for (size_t i = 0; i < a.shape.size(); i++) {
                if (i > 0) s += ", ";
                s += std::to_string(a.shape[i]);
            }
            return s + ")>";
        });
    py::implicitly_convertible<py::array, NdArray>();

    m.def("filter_options", &filter_options, py::arg("options"), py::arg("allowed"));

    py::class_<Coordinate>(m, "Coordinate")
        .def(py::init<>())
        .def_readwrite("dim", &Coordinate::dim)
        .def_property("values",
             [](const Coordinate& c) { return Vec(c.values); },
             [](Coordinate& c, const Vec& v) { c.values = v; })
        .def_readwrite("labels", &Coordinate::labels)
        .def("__len__", &Coordinate::size);

    py::class_<DataArray>(m, "DataArray")
        .def(py::init<>())
        .def_readwrite("name", &DataArray::name)
        .def_readwrite("dims", &DataArray::dims)
        .def_readwrite("data", &DataArray::data)
        .def_readwrite("coords", &DataArray::coords)
        .def_readonly("warnings", &DataArray::warnings)
        .def("complete", &DataArray::complete)
        .def("values", [](const DataArray& a) { return ndarray_to_numpy(a.data); });

    py::class_<Dataset>(m, "Dataset")
        .def(py::init<>())
        .def_readwrite("coords", &Dataset::coords)
        .def_readwrite("data_vars", &Dataset::data_vars)
        .def_readonly("warnings", &Dataset::warnings)
        .def("add_coordinate", &Dataset::add_coordinate, py::arg("name"), py::arg("coord"))
        .def("add_variable", &Dataset::add_variable, py::arg("variable"))
        .def("sizes", &Dataset::sizes)
        .def("rename", &Dataset::rename, py::arg("mapping"))
        .def("merge", &Dataset::merge, py::arg("other"))
        .def("to_array", &Dataset::to_array,
             py::arg("dim") = "variable", py::arg("name") = "")
        .def("complete", &Dataset::complete)
        .def("__contains__", &Dataset::has_variable)
        .def("__getitem__", &Dataset::variable, py::return_value_policy::copy);

    py::class_<DerivedQuantityStatus>(m, "DerivedQuantityStatus")
        .def_readonly("added", &DerivedQuantityStatus::added)
        .def_readonly("variable", &DerivedQuantityStatus::variable)
        .def_readonly("message", &DerivedQuantityStatus::message);

    m.def("add_absorptance", &add_absorptance,
          py::arg("dataset"), py::arg("reflectance_key"),
          py::arg("transmittance_key"), py::arg("absorptance_key"));
    m.def("vector_norm", &vector_norm, py::arg("array"), py::arg("dim"));
    m.def("add_vector_norms", &add_vector_norms, py::arg("dataset"), py::arg("dim"));

    // --- Engines ---
    py::class_<Engine, PyEngine, std::shared_ptr<Engine>>(m, "Engine")
        .def(py::init<>())
        .def("simulate", &Engine::simulate,
             py::arg("structure"), py::arg("frequencies"), py::arg("angles"),
             py::arg("options") = EngineOptions());

    py::class_<FunctionEngine, Engine, std::shared_ptr<FunctionEngine>>(m, "FunctionEngine")
        .def(py::init<BackendFunction, std::vector<std::string>, std::string>(),
             py::arg("backend"), py::arg("allowed_options") = std::vector<std::string>{},
             py::arg("name") = "",
             "Wrap backend(index, thickness, frequencies, angles, options) -> dict")
        .def("filter", &FunctionEngine::filter, py::arg("options"))
        .def_property_readonly("name", &FunctionEngine::name)
        .def_property_readonly("allowed_options", &FunctionEngine::allowed_options);

    py::class_<CompositeEngine, Engine, std::shared_ptr<CompositeEngine>>(m, "CompositeEngine")
        .def(py::init<std::vector<CompositeEngine::Part>>(), py::arg("parts"),
             "Run every (name, engine) part; output keys become 'name/key'")
        .def_property_readonly("parts", &CompositeEngine::parts);

    m.attr("PART_SEPARATOR") = PART_SEPARATOR;
    m.def("extract_part", &extract_part, py::arg("raw"), py::arg("part"));
    m.def("make_stack_engine", &make_stack_engine,
          py::arg("rt_backend"), py::arg("field_backend"),
          py::arg("field_options") = std::vector<std::string>{});

    m.def("simulate", &multilayer::simulate,
          py::arg("structure"), py::arg("engine"), py::arg("frequencies"),
          py::arg("angles"), py::arg("options") = EngineOptions());

    // --- Formatters ---
    py::enum_<FormatterConfig::OutputFormat>(m, "OutputFormat")
        .value("NONE", FormatterConfig::OutputFormat::NONE)
        .value("DATASET", FormatterConfig::OutputFormat::DATASET)
        .value("DATA_ARRAY", FormatterConfig::OutputFormat::DATA_ARRAY);

    m.def("parse_output_format", &parse_output_format, py::arg("name"));
    m.def("output_format_name", &output_format_name, py::arg("format"));

    py::class_<FormatterConfig>(m, "FormatterConfig")
        .def(py::init<>())
        .def_readwrite("output_format", &FormatterConfig::output_format)
        .def_readwrite("strict", &FormatterConfig::strict)
        .def_readwrite("array_dim", &FormatterConfig::array_dim)
        .def_readwrite("array_name", &FormatterConfig::array_name)
        .def("validate", &FormatterConfig::validate);

    py::class_<AbsorptanceTerm>(m, "AbsorptanceTerm")
        .def(py::init<>())
        .def_readwrite("reflectance", &AbsorptanceTerm::reflectance)
        .def_readwrite("transmittance", &AbsorptanceTerm::transmittance)
        .def_readwrite("absorptance", &AbsorptanceTerm::absorptance);

    py::class_<DatasetLayout>(m, "DatasetLayout")
        .def(py::init<>())
        .def_readwrite("dims", &DatasetLayout::dims)
        .def_readwrite("non_dims", &DatasetLayout::non_dims)
        .def_readwrite("variables", &DatasetLayout::variables)
        .def_readwrite("relabeling", &DatasetLayout::relabeling)
        .def_readwrite("rectilinear_vector", &DatasetLayout::rectilinear_vector)
        .def_readwrite("absorptance", &DatasetLayout::absorptance)
        .def_readwrite("add_vector_norms", &DatasetLayout::add_vector_norms);

    m.def("stack_rt_layout", &stack_rt_layout);
    m.def("stack_field_layout", &stack_field_layout);

    py::class_<DataFormatter, PyDataFormatter, std::shared_ptr<DataFormatter>>(m, "DataFormatter")
        .def(py::init<>())
        .def("format", &DataFormatter::format, py::arg("raw"));

    py::class_<LabeledFormatter, DataFormatter, std::shared_ptr<LabeledFormatter>>(m, "LabeledFormatter")
        .def(py::init<DatasetLayout, FormatterConfig>(),
             py::arg("layout"), py::arg("config") = FormatterConfig())
        .def("format",
             py::overload_cast<const RawResult&, const FormatterConfig&>(
                 &LabeledFormatter::format, py::const_),
             py::arg("raw"), py::arg("config"))
        .def("to_dataset",
             py::overload_cast<const RawResult&, bool>(&LabeledFormatter::to_dataset,
                                                      py::const_),
             py::arg("raw"), py::arg("strict") = false)
        .def("to_data_array", &LabeledFormatter::to_data_array, py::arg("raw"))
        .def_static("load", &LabeledFormatter::load, py::arg("raw"), py::arg("layout"))
        .def_property_readonly("layout", &LabeledFormatter::layout)
        .def_property("config",
                      [](const LabeledFormatter& f) { return f.config(); },
                      &LabeledFormatter::set_config);

    py::class_<CompositeFormatter, DataFormatter, std::shared_ptr<CompositeFormatter>>(
            m, "CompositeFormatter")
        .def(py::init<std::vector<CompositeFormatter::Part>, FormatterConfig>(),
             py::arg("parts"), py::arg("config") = FormatterConfig())
        .def("format",
             py::overload_cast<const RawResult&, const FormatterConfig&>(
                 &CompositeFormatter::format, py::const_),
             py::arg("raw"), py::arg("config"))
        .def("to_datasets",
             py::overload_cast<const RawResult&, bool>(&CompositeFormatter::to_datasets,
                                                      py::const_),
             py::arg("raw"), py::arg("strict") = false)
        .def("to_dataset",
             py::overload_cast<const RawResult&, bool>(&CompositeFormatter::to_dataset,
                                                      py::const_),
             py::arg("raw"), py::arg("strict") = false)
        .def("to_data_arrays", &CompositeFormatter::to_data_arrays, py::arg("raw"))
        .def_property_readonly("parts", &CompositeFormatter::parts)
        .def_property("config",
                      [](const CompositeFormatter& f) { return f.config(); },
                      &CompositeFormatter::set_config);

    m.def("make_stack_formatter", &make_stack_formatter,
          py::arg("config") = FormatterConfig());

    // --- Simulation ---
    py::enum_<Simulation::State>(m, "SimulationState")
        .value("UNCONFIGURED", Simulation::State::UNCONFIGURED)
        .value("CONFIGURED", Simulation::State::CONFIGURED)
        .value("RAN", Simulation::State::RAN);

    py::class_<Simulation>(m, "Simulation")
        .def(py::init<>())
        .def(py::init<std::shared_ptr<Structure>, std::shared_ptr<Engine>, const Vec&,
                      const Vec&, std::shared_ptr<DataFormatter>>(),
             py::arg("structure"), py::arg("engine"),
             py::arg("frequencies") = Vec(),
             py::arg("angles") = Vec(Vec::Zero(1)),
             py::arg("formatter") = nullptr,
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>(), py::keep_alive<1, 6>())
        .def("simulate",
             [](Simulation& sim, std::shared_ptr<Structure> structure,
                std::shared_ptr<Engine> engine, std::optional<Vec> frequencies,
                std::optional<Vec> angles, std::shared_ptr<DataFormatter> formatter,
                bool save_data, const EngineOptions& options) {
                 SimulationRequest request;
                 request.structure = std::move(structure);
                 request.engine = std::move(engine);
                 request.frequencies = std::move(frequencies);
                 request.angles = std::move(angles);
                 request.formatter = std::move(formatter);
                 request.save_data = save_data;
                 request.options = options;
                 return sim.simulate(request);
             },
             py::arg("structure") = nullptr, py::arg("engine") = nullptr,
             py::arg("frequencies") = py::none(), py::arg("angles") = py::none(),
             py::arg("formatter") = nullptr, py::arg("save_data") = true,
             py::arg("options") = EngineOptions(),
             "Run the engine (then the formatter, if any) and return the result")
        .def_property_readonly("state", &Simulation::state)
        .def("is_configured", &Simulation::is_configured)
        .def_property_readonly("data", &Simulation::data)
        .def("clear_data", &Simulation::clear_data)
        .def_property("structure", &Simulation::structure,
                      py::cpp_function(&Simulation::set_structure, py::keep_alive<1, 2>()))
        .def_property("engine", &Simulation::engine,
                      py::cpp_function(&Simulation::set_engine, py::keep_alive<1, 2>()))
        .def_property("formatter", &Simulation::formatter,
                      py::cpp_function(&Simulation::set_formatter, py::keep_alive<1, 2>()))
        .def_property("frequencies",
                      [](const Simulation& s) { return Vec(s.frequencies()); },
                      &Simulation::set_frequencies)
        .def_property("wavelengths",
                      [](const Simulation& s) { return Vec(s.wavelengths()); },
                      &Simulation::set_wavelengths)
        .def_property("speed_of_light", &Simulation::speed_of_light,
                      &Simulation::set_speed_of_light)
        .def_property("angles",
                      [](const Simulation& s) { return Vec(s.angles()); },
                      &Simulation::set_angles)
        .def("__repr__", [](const Simulation& s) {
            return "<Simulation " + state_name(s.state()) +
                   " n_freq=" + std::to_string(s.frequencies().size()) +
                   " n_angles=" + std::to_string(s.angles().size()) + ">";
        });
}
