#include <gtest/gtest.h>
#include "multilayer/simulation.hpp"
#include "multilayer/multilayer.hpp"
#include "multilayer/lorentz_oscillator.hpp"
#include <cmath>

using namespace multilayer;

// Normal-incidence characteristic-matrix solver producing the
// reflection/transmission keys of stack_rt_layout(). Every angle gets the
// normal-incidence result.
static RawResult characteristic_matrix_backend(const CMat& index, const Vec& thickness,
                                               const Vec& frequencies, const Vec& angles,
                                               const EngineOptions&) {
    int nf = static_cast<int>(frequencies.size());
    int nt = static_cast<int>(angles.size());
    int L = static_cast<int>(index.rows());

    CVec r(nf * nt), t(nf * nt), R(nf * nt), T(nf * nt);
    for (int i = 0; i < nf; i++) {
        Complex n0 = index(0, i);
        Complex ns = index(L - 1, i);
        Eigen::Matrix2cd M = Eigen::Matrix2cd::Identity();
        for (int j = 1; j < L - 1; j++) {
            Complex n = index(j, i);
            Complex delta = 2.0 * PI * n * thickness(j) * frequencies(i) / SPEED_OF_LIGHT;
            Eigen::Matrix2cd layer;
            layer << std::cos(delta), Complex(0.0, 1.0) * std::sin(delta) / n,
                     Complex(0.0, 1.0) * n * std::sin(delta), std::cos(delta);
            M = M * layer;
        }
        Complex num = n0 * M(0, 0) + n0 * ns * M(0, 1) - M(1, 0) - ns * M(1, 1);
        Complex den = n0 * M(0, 0) + n0 * ns * M(0, 1) + M(1, 0) + ns * M(1, 1);
        Complex ri = num / den;
        Complex ti = 2.0 * n0 / den;
        for (int a = 0; a < nt; a++) {
            int k = i * nt + a;
            r(k) = ri;
            t(k) = ti;
            R(k) = std::norm(ri);
            T(k) = ns.real() / n0.real() * std::norm(ti);
        }
    }

    RawResult out;
    out["frequency"] = NdArray::from_real(frequencies);
    out["theta"] = NdArray::from_real(angles);
    out["lambda"] = NdArray::from_real(Spectrum::convert(frequencies));
    for (const char* key : {"rs", "rp"}) out[key] = NdArray({nf, nt}, r);
    for (const char* key : {"ts", "tp"}) out[key] = NdArray({nf, nt}, t);
    for (const char* key : {"Rs", "Rp"}) out[key] = NdArray({nf, nt}, R);
    for (const char* key : {"Ts", "Tp"}) out[key] = NdArray({nf, nt}, T);
    return out;
}

static LayerPtr constant_layer(double n, double d, const std::string& name) {
    return std::make_shared<Layer>(
        Layer::from_material(std::make_shared<ConstantIndex>(n, name), d));
}

static std::shared_ptr<LabeledFormatter> dataset_formatter() {
    FormatterConfig cfg;
    cfg.output_format = FormatterConfig::OutputFormat::DATASET;
    return std::make_shared<LabeledFormatter>(stack_rt_layout(), cfg);
}

static double value_at(const Dataset& ds, const std::string& name, int f, int t) {
    return ds.variable(name).data.at({f, t}).real();
}

// ---- End-to-end: structure -> engine -> dataset ----

TEST(Integration, SingleInterfaceFresnel) {
    auto stack = std::make_shared<Multilayer>(std::vector<LayerPtr>{
        constant_layer(1.0, 0.0, "air"), constant_layer(1.5, 0.0, "glass")});
    auto engine = std::make_shared<FunctionEngine>(characteristic_matrix_backend);

    Simulation sim(stack, engine, Vec::LinSpaced(5, 2e14, 6e14), Vec::Zero(1),
                   dataset_formatter());
    sim.simulate();
    const Dataset& stored = std::get<Dataset>(*sim.data());

    for (int f = 0; f < 5; f++) {
        EXPECT_NEAR(value_at(stored, "Rs", f, 0), 0.04, 1e-12);
        EXPECT_NEAR(value_at(stored, "Ts", f, 0), 0.96, 1e-12);
        EXPECT_NEAR(value_at(stored, "As", f, 0), 0.0, 1e-12);
    }
    EXPECT_TRUE(stored.complete());
}

TEST(Integration, QuarterWaveAntireflection) {
    double lambda0 = 1e-6;
    double n1 = std::sqrt(1.5);
    auto stack = std::make_shared<Multilayer>(std::vector<LayerPtr>{
        constant_layer(1.0, 0.0, "air"),
        constant_layer(n1, lambda0 / (4.0 * n1), "coating"),
        constant_layer(1.5, 0.0, "glass")});
    auto engine = std::make_shared<FunctionEngine>(characteristic_matrix_backend);

    Simulation sim(stack, engine);
    sim.set_wavelengths(Vec::Constant(1, lambda0));
    sim.set_formatter(dataset_formatter());
    sim.simulate();
    const Dataset& ds = std::get<Dataset>(*sim.data());

    EXPECT_NEAR(value_at(ds, "Rs", 0, 0), 0.0, 1e-12);
    EXPECT_NEAR(value_at(ds, "Ts", 0, 0), 1.0, 1e-12);
    EXPECT_NEAR(ds.coords.at("wavelength").values(0), lambda0, 1e-20);
}

TEST(Integration, BraggMirrorFromUnitCell) {
    double lambda0 = 1e-6;
    double nh = 2.3, nl = 1.45;
    auto high = constant_layer(nh, lambda0 / (4.0 * nh), "TiO2");
    auto low = constant_layer(nl, lambda0 / (4.0 * nl), "SiO2");
    auto air = constant_layer(1.0, 0.0, "air");
    auto glass = constant_layer(1.5, 0.0, "glass");
    auto engine = std::make_shared<FunctionEngine>(characteristic_matrix_backend);

    auto mirror = std::make_shared<Multilayer>(
        Multilayer::from_unit_cell({high, low}, air, glass, 4));
    Simulation sim(mirror, engine, Vec::Constant(1, SPEED_OF_LIGHT / lambda0),
                   Vec::Zero(1), dataset_formatter());
    sim.simulate();
    double R4 = value_at(std::get<Dataset>(*sim.data()), "Rs", 0, 0);

    SimulationRequest more_periods;
    more_periods.structure = std::make_shared<Multilayer>(mirror->from_own_unit_cell(8));
    sim.simulate(more_periods);
    double R8 = value_at(std::get<Dataset>(*sim.data()), "Rs", 0, 0);

    EXPECT_GT(R4, 0.8);
    EXPECT_GT(R8, R4);
    EXPECT_LT(R8, 1.0);
}

TEST(Integration, AbsorbingLayerHasAbsorptance) {
    LorentzParameters p;
    p.resonance = 2.0 * PI * 3e14;
    p.linewidth = 5e13;
    p.density = 1e26;
    p.susceptibility = 1.0;
    auto dye = std::make_shared<LorentzOscillator>(p, PhysicalConstants(), "dye");
    auto film = std::make_shared<Layer>(Layer::from_material(dye, 200e-9));

    auto stack = std::make_shared<Multilayer>(std::vector<LayerPtr>{
        constant_layer(1.0, 0.0, "air"), film, constant_layer(1.0, 0.0, "air")});
    auto engine = std::make_shared<FunctionEngine>(characteristic_matrix_backend);

    Vec f(2);
    f << 3e14, 1e14;
    Simulation sim(stack, engine, f, Vec::Zero(1), dataset_formatter());
    sim.simulate();
    const Dataset& ds = std::get<Dataset>(*sim.data());

    double A_resonant = value_at(ds, "As", 0, 0);
    double A_off = value_at(ds, "As", 1, 0);
    EXPECT_GT(A_resonant, 0.01);
    EXPECT_GT(A_resonant, A_off);
    EXPECT_GE(A_off, -1e-12);

    // The layer follows its material
    p.density = 0.0;
    dye->set_parameters(p);
    sim.simulate();
    EXPECT_NEAR(value_at(std::get<Dataset>(*sim.data()), "As", 0, 0), 0.0, 1e-12);
}

TEST(Integration, DataArrayOutput) {
    auto stack = std::make_shared<Multilayer>(std::vector<LayerPtr>{
        constant_layer(1.0, 0.0, "air"), constant_layer(1.5, 0.0, "glass")});
    FormatterConfig cfg;
    cfg.output_format = parse_output_format("xarray_dataarray");
    auto formatter = std::make_shared<LabeledFormatter>(stack_rt_layout(), cfg);
    auto engine = std::make_shared<FunctionEngine>(characteristic_matrix_backend);

    Simulation sim(stack, engine, Vec::LinSpaced(3, 2e14, 4e14),
                   Vec::LinSpaced(2, 0.0, 0.2), formatter);
    FormattedResult result = sim.simulate();
    ASSERT_TRUE(std::holds_alternative<DataArray>(result));
    const DataArray& arr = std::get<DataArray>(result);
    EXPECT_EQ(arr.data.shape, (std::vector<int>{10, 3, 2}));
    EXPECT_EQ(arr.coords.at("variable").labels.front(), "Ap");
}

// Field backend sampling a unit s-polarized field along z. The number of z
// samples comes from the "resolution" option.
static RawResult uniform_field_backend(const CMat&, const Vec& thickness,
                                       const Vec& frequencies, const Vec& angles,
                                       const EngineOptions& options) {
    int nz = static_cast<int>(options.count("resolution") ? options.at("resolution") : 2.0);
    int nf = static_cast<int>(frequencies.size());
    int nt = static_cast<int>(angles.size());
    int n = nz * nf * nt * 3;
    CVec e = CVec::Zero(n);
    for (int i = 0; i < n; i += 3) e(i) = Complex(1.0, 0.0);

    RawResult out;
    out["x"] = NdArray::from_real(Vec::Zero(1));
    out["y"] = NdArray::from_real(Vec::Zero(1));
    out["z"] = NdArray::from_real(Vec::LinSpaced(nz, 0.0, thickness.sum()));
    out["frequency"] = NdArray::from_real(frequencies);
    out["theta"] = NdArray::from_real(angles);
    out["lambda"] = NdArray::from_real(Spectrum::convert(frequencies));
    for (const char* key : {"Es", "Hs", "Ep", "Hp"}) out[key] = NdArray({n}, e);
    return out;
}

TEST(Integration, ReflectionAndFieldInOneRun) {
    double n1 = std::sqrt(1.5);
    auto stack = std::make_shared<Multilayer>(std::vector<LayerPtr>{
        constant_layer(1.0, 0.0, "air"),
        constant_layer(n1, 1e-6 / (4.0 * n1), "coating"),
        constant_layer(1.5, 0.0, "glass")});
    auto engine = make_stack_engine(characteristic_matrix_backend, uniform_field_backend,
                                    {"resolution"});
    FormatterConfig cfg;
    cfg.output_format = FormatterConfig::OutputFormat::DATASET;

    Simulation sim(stack, engine, Vec::Constant(1, SPEED_OF_LIGHT / 1e-6), Vec::Zero(1),
                   make_stack_formatter(cfg));
    SimulationRequest request;
    request.options = {{"resolution", 5.0}};
    sim.simulate(request);
    const Dataset& ds = std::get<Dataset>(*sim.data());

    EXPECT_NEAR(value_at(ds, "Rs", 0, 0), 0.0, 1e-12);
    EXPECT_NEAR(value_at(ds, "As", 0, 0), 0.0, 1e-12);
    EXPECT_EQ(ds.sizes().at("z"), 5);
    EXPECT_DOUBLE_EQ(ds.variable("|Es|").data.at({0, 0, 4, 0, 0}).real(), 1.0);
    EXPECT_TRUE(ds.complete());
}
