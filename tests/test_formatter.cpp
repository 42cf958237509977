#include <gtest/gtest.h>
#include "multilayer/formatter.hpp"

using namespace multilayer;

// Raw output shaped like a reflection/transmission solver: (frequency, theta)
static RawResult make_rt_raw(int nf, int nt, double R = 0.3, double T = 0.6) {
    RawResult raw;
    Vec f = Vec::LinSpaced(nf, 1e14, 2e14);
    raw["frequency"] = NdArray::from_real(f);
    raw["theta"] = NdArray::from_real(Vec::LinSpaced(nt, 0.0, 0.4));
    raw["lambda"] = NdArray::from_real((SPEED_OF_LIGHT / f.array()).matrix());
    int n = nf * nt;
    for (const char* key : {"rs", "rp", "ts", "tp"}) {
        raw[key] = NdArray({nf, nt}, CVec::Constant(n, Complex(0.5, 0.1)));
    }
    raw["Rs"] = NdArray({nf, nt}, CVec::Constant(n, R));
    raw["Rp"] = NdArray({nf, nt}, CVec::Constant(n, R));
    raw["Ts"] = NdArray({nf, nt}, CVec::Constant(n, T));
    raw["Tp"] = NdArray({nf, nt}, CVec::Constant(n, T));
    return raw;
}

// Raw field output: (x, y, z, frequency, theta, vector)
static RawResult make_field_raw(int nz, int nf) {
    RawResult raw;
    raw["x"] = NdArray::from_real(Vec::Zero(1));
    raw["y"] = NdArray::from_real(Vec::Zero(1));
    raw["z"] = NdArray::from_real(Vec::LinSpaced(nz, 0.0, 1e-6));
    Vec f = Vec::LinSpaced(nf, 1e14, 2e14);
    raw["frequency"] = NdArray::from_real(f);
    raw["theta"] = NdArray::from_real(Vec::Zero(1));
    raw["lambda"] = NdArray::from_real((SPEED_OF_LIGHT / f.array()).matrix());
    int n = nz * nf * 3;
    CVec e(n);
    for (int i = 0; i < n; i++) {
        // (3, 4, 0) along the vector axis
        int k = i % 3;
        e(i) = k == 0 ? Complex(3.0, 0.0) : (k == 1 ? Complex(0.0, 4.0) : Complex(0.0, 0.0));
    }
    for (const char* key : {"Es", "Hs", "Ep", "Hp"}) {
        raw[key] = NdArray({n}, e);
    }
    return raw;
}

static FormatterConfig config_for(FormatterConfig::OutputFormat format) {
    FormatterConfig cfg;
    cfg.output_format = format;
    return cfg;
}

// ---- Config ----

TEST(Formatter, DefaultConfig) {
    FormatterConfig cfg;
    EXPECT_EQ(cfg.output_format, FormatterConfig::OutputFormat::NONE);
    EXPECT_FALSE(cfg.strict);
    EXPECT_EQ(cfg.array_dim, "variable");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(Formatter, ParseOutputFormat) {
    using F = FormatterConfig::OutputFormat;
    EXPECT_EQ(parse_output_format(""), F::NONE);
    EXPECT_EQ(parse_output_format("none"), F::NONE);
    EXPECT_EQ(parse_output_format("dataset"), F::DATASET);
    EXPECT_EQ(parse_output_format("xarray_dataset"), F::DATASET);
    EXPECT_EQ(parse_output_format("data_array"), F::DATA_ARRAY);
    EXPECT_EQ(parse_output_format("xarray_dataarray"), F::DATA_ARRAY);
    EXPECT_THROW(parse_output_format("pandas"), ConfigurationError);
    EXPECT_EQ(output_format_name(F::DATA_ARRAY), "data_array");
}

TEST(Formatter, UnknownFormatRejected) {
    auto cfg = config_for(static_cast<FormatterConfig::OutputFormat>(42));
    EXPECT_THROW(cfg.validate(), ConfigurationError);
    EXPECT_THROW(LabeledFormatter(stack_rt_layout(), cfg), ConfigurationError);

    LabeledFormatter fmt(stack_rt_layout());
    EXPECT_THROW(fmt.set_config(cfg), ConfigurationError);
    EXPECT_THROW(fmt.format(make_rt_raw(2, 1), cfg), ConfigurationError);
}

// ---- Dispatch ----

TEST(Formatter, NonePassesRawThrough) {
    LabeledFormatter fmt(stack_rt_layout());
    RawResult raw = make_rt_raw(3, 2);
    FormattedResult out = fmt.format(raw);
    ASSERT_TRUE(std::holds_alternative<RawResult>(out));
    EXPECT_EQ(std::get<RawResult>(out).size(), raw.size());
}

TEST(Formatter, StackRtDataset) {
    LabeledFormatter fmt(stack_rt_layout(), config_for(FormatterConfig::OutputFormat::DATASET));
    FormattedResult out = fmt.format(make_rt_raw(3, 2, 0.3, 0.6));
    ASSERT_TRUE(std::holds_alternative<Dataset>(out));
    const Dataset& ds = std::get<Dataset>(out);

    EXPECT_EQ(ds.coords.count("lambda"), 0u);
    ASSERT_EQ(ds.coords.count("wavelength"), 1u);
    EXPECT_EQ(ds.coords.at("wavelength").dim, "frequency");
    EXPECT_EQ(ds.sizes().at("frequency"), 3);
    EXPECT_EQ(ds.sizes().at("theta"), 2);

    const DataArray& rs = ds.variable("rs");
    EXPECT_EQ(rs.dims, (std::vector<std::string>{"frequency", "theta"}));

    ASSERT_TRUE(ds.has_variable("As"));
    ASSERT_TRUE(ds.has_variable("Ap"));
    EXPECT_NEAR(ds.variable("As").data.at({2, 1}).real(), 0.1, 1e-14);
    EXPECT_TRUE(ds.complete());
}

TEST(Formatter, StackRtDataArray) {
    FormatterConfig cfg = config_for(FormatterConfig::OutputFormat::DATA_ARRAY);
    cfg.array_name = "stackrt";
    LabeledFormatter fmt(stack_rt_layout(), cfg);
    FormattedResult out = fmt.format(make_rt_raw(3, 2));
    ASSERT_TRUE(std::holds_alternative<DataArray>(out));
    const DataArray& arr = std::get<DataArray>(out);

    EXPECT_EQ(arr.name, "stackrt");
    EXPECT_EQ(arr.dims, (std::vector<std::string>{"variable", "frequency", "theta"}));
    EXPECT_EQ(arr.data.shape, (std::vector<int>{10, 3, 2}));
    EXPECT_EQ(arr.coords.at("variable").labels.size(), 10u);
}

TEST(Formatter, PerCallConfigOverridesInstance) {
    LabeledFormatter fmt(stack_rt_layout());
    FormattedResult out = fmt.format(make_rt_raw(2, 1),
                                     config_for(FormatterConfig::OutputFormat::DATASET));
    EXPECT_TRUE(std::holds_alternative<Dataset>(out));
    EXPECT_EQ(fmt.config().output_format, FormatterConfig::OutputFormat::NONE);
}

TEST(Formatter, ToDataArrayUsesConfigNames) {
    FormatterConfig cfg;
    cfg.array_dim = "quantity";
    LabeledFormatter fmt(stack_rt_layout(), cfg);
    DataArray arr = fmt.to_data_array(make_rt_raw(2, 1));
    EXPECT_EQ(arr.dims.front(), "quantity");
}

// ---- Loading errors ----

TEST(Formatter, MissingRawKey) {
    RawResult raw = make_rt_raw(2, 2);
    raw.erase("theta");
    EXPECT_THROW(LabeledFormatter::load(raw, stack_rt_layout()), FormatError);

    raw = make_rt_raw(2, 2);
    raw.erase("tp");
    LabeledFormatter fmt(stack_rt_layout());
    EXPECT_THROW(fmt.to_dataset(raw), FormatError);
}

TEST(Formatter, VariableSizeMismatch) {
    RawResult raw = make_rt_raw(2, 2);
    raw["Rs"] = NdArray({3}, CVec::Zero(3));
    EXPECT_THROW(LabeledFormatter::load(raw, stack_rt_layout()), FormatError);
}

// ---- Derived quantity warnings ----

static DatasetLayout reflectance_only_layout() {
    DatasetLayout layout;
    layout.dims = {"frequency", "theta"};
    layout.variables = {"Rs"};
    layout.absorptance = {{"Rs", "Ts", "As"}};
    return layout;
}

TEST(Formatter, MissingAbsorptanceInputWarns) {
    LabeledFormatter fmt(reflectance_only_layout());
    Dataset ds = fmt.to_dataset(make_rt_raw(2, 1));
    EXPECT_FALSE(ds.has_variable("As"));
    ASSERT_EQ(ds.warnings.size(), 1u);
    EXPECT_NE(ds.warnings[0].find("As"), std::string::npos);
    EXPECT_FALSE(ds.complete());
}

TEST(Formatter, StrictModeThrows) {
    FormatterConfig cfg = config_for(FormatterConfig::OutputFormat::DATASET);
    cfg.strict = true;
    LabeledFormatter fmt(reflectance_only_layout(), cfg);
    EXPECT_THROW(fmt.format(make_rt_raw(2, 1)), FormatError);
    EXPECT_THROW(fmt.to_dataset(make_rt_raw(2, 1), true), FormatError);
}

// ---- Field layout ----

TEST(Formatter, StackFieldDataset) {
    LabeledFormatter fmt(stack_field_layout());
    Dataset ds = fmt.to_dataset(make_field_raw(4, 2));

    const DataArray& es = ds.variable("Es");
    EXPECT_EQ(es.dims, (std::vector<std::string>{"x", "y", "z", "frequency", "theta", "vector"}));
    EXPECT_EQ(es.data.shape, (std::vector<int>{1, 1, 4, 2, 1, 3}));
    EXPECT_EQ(ds.coords.at("vector").labels, (std::vector<std::string>{"i", "j", "k"}));

    for (const char* name : {"|Es|", "|Hs|", "|Ep|", "|Hp|"}) {
        ASSERT_TRUE(ds.has_variable(name));
    }
    const DataArray& norm = ds.variable("|Es|");
    EXPECT_EQ(norm.dims, (std::vector<std::string>{"x", "y", "z", "frequency", "theta"}));
    EXPECT_DOUBLE_EQ(norm.data.at({0, 0, 3, 1, 0}).real(), 5.0);
    EXPECT_TRUE(ds.complete());
}

TEST(Formatter, StackFieldDataArrayNeedsEqualDims) {
    FormatterConfig cfg = config_for(FormatterConfig::OutputFormat::DATA_ARRAY);
    LabeledFormatter fmt(stack_field_layout(), cfg);
    EXPECT_THROW(fmt.format(make_field_raw(2, 2)), FormatError);
}

TEST(Formatter, DataArrayKeepsWarnings) {
    LabeledFormatter fmt(reflectance_only_layout(),
                         config_for(FormatterConfig::OutputFormat::DATA_ARRAY));
    FormattedResult out = fmt.format(make_rt_raw(2, 1));
    ASSERT_TRUE(std::holds_alternative<DataArray>(out));
    const DataArray& arr = std::get<DataArray>(out);
    EXPECT_EQ(arr.coords.at("variable").labels, (std::vector<std::string>{"Rs"}));
    ASSERT_EQ(arr.warnings.size(), 1u);
    EXPECT_NE(arr.warnings[0].find("As"), std::string::npos);
    EXPECT_FALSE(arr.complete());

    LabeledFormatter full(stack_rt_layout());
    EXPECT_TRUE(full.to_data_array(make_rt_raw(2, 1)).complete());
}

// ---- Composite output ----

// Raw output of a CompositeEngine with an "rt" part and a "field" part
static RawResult make_stack_raw(int nz, int nf) {
    RawResult raw;
    for (auto& [key, value] : make_rt_raw(nf, 1)) raw[std::string("rt/") + key] = value;
    for (auto& [key, value] : make_field_raw(nz, nf)) raw[std::string("field/") + key] = value;
    // Both parts share the normal-incidence angle grid
    raw["rt/theta"] = NdArray::from_real(Vec::Zero(1));
    return raw;
}

TEST(Formatter, StackFormatterMergesParts) {
    auto fmt = make_stack_formatter(config_for(FormatterConfig::OutputFormat::DATASET));
    FormattedResult out = fmt->format(make_stack_raw(4, 2));
    ASSERT_TRUE(std::holds_alternative<Dataset>(out));
    const Dataset& ds = std::get<Dataset>(out);

    for (const char* name : {"Rs", "Tp", "As", "Ap", "Es", "Hp", "|Es|"}) {
        EXPECT_TRUE(ds.has_variable(name)) << name;
    }
    EXPECT_EQ(ds.variable("Rs").dims, (std::vector<std::string>{"frequency", "theta"}));
    EXPECT_EQ(ds.variable("Es").data.shape, (std::vector<int>{1, 1, 4, 2, 1, 3}));
    EXPECT_EQ(ds.sizes().at("frequency"), 2);
    EXPECT_EQ(ds.coords.at("wavelength").dim, "frequency");
    EXPECT_TRUE(ds.complete());
}

TEST(Formatter, StackFormatterPerPartDatasets) {
    auto fmt = make_stack_formatter();
    RawResult raw = make_stack_raw(3, 2);
    EXPECT_TRUE(std::holds_alternative<RawResult>(fmt->format(raw)));

    std::vector<Dataset> parts = fmt->to_datasets(raw);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_TRUE(parts[0].has_variable("As"));
    EXPECT_FALSE(parts[0].has_variable("Es"));
    EXPECT_TRUE(parts[1].has_variable("|Hs|"));
}

TEST(Formatter, CompositeDataArraysOnePerPart) {
    DatasetLayout field = stack_field_layout();
    field.add_vector_norms = false;
    CompositeFormatter fmt({{"rt", std::make_shared<LabeledFormatter>(stack_rt_layout())},
                            {"field", std::make_shared<LabeledFormatter>(field)}});

    std::vector<DataArray> arrays = fmt.to_data_arrays(make_stack_raw(3, 2));
    ASSERT_EQ(arrays.size(), 2u);
    EXPECT_EQ(arrays[0].name, "rt");
    EXPECT_EQ(arrays[0].data.shape, (std::vector<int>{10, 2, 1}));
    EXPECT_EQ(arrays[1].name, "field");
    EXPECT_EQ(arrays[1].data.shape, (std::vector<int>{4, 1, 1, 3, 2, 1, 3}));

    // Parts with different dims cannot be stacked into one array
    EXPECT_THROW(fmt.format(make_stack_raw(3, 2),
                            config_for(FormatterConfig::OutputFormat::DATA_ARRAY)),
                 FormatError);
}

TEST(Formatter, CompositeFormatterErrors) {
    auto fmt = make_stack_formatter(config_for(FormatterConfig::OutputFormat::DATASET));
    RawResult raw = make_stack_raw(2, 2);
    for (auto it = raw.begin(); it != raw.end();) {
        it = it->first.rfind("field/", 0) == 0 ? raw.erase(it) : std::next(it);
    }
    EXPECT_THROW(fmt->format(raw), FormatError);

    // Parts run on different frequency grids
    RawResult mismatched = make_stack_raw(2, 2);
    for (auto& [key, value] : make_rt_raw(3, 1)) mismatched[std::string("rt/") + key] = value;
    EXPECT_THROW(fmt->format(mismatched), FormatError);

    using Parts = std::vector<CompositeFormatter::Part>;
    EXPECT_THROW(CompositeFormatter{Parts{}}, std::invalid_argument);
    EXPECT_THROW((CompositeFormatter{Parts{{"rt", nullptr}}}), std::invalid_argument);
    EXPECT_THROW(fmt->set_config(config_for(static_cast<FormatterConfig::OutputFormat>(9))),
                 ConfigurationError);
}

TEST(Formatter, CompositeStrictModeThrows) {
    FormatterConfig cfg = config_for(FormatterConfig::OutputFormat::DATASET);
    CompositeFormatter lenient({{"rt", std::make_shared<LabeledFormatter>(reflectance_only_layout())}},
                               cfg);
    Dataset ds = std::get<Dataset>(lenient.format(make_stack_raw(2, 2)));
    EXPECT_EQ(ds.warnings.size(), 1u);

    cfg.strict = true;
    CompositeFormatter strict({{"rt", std::make_shared<LabeledFormatter>(reflectance_only_layout())}},
                              cfg);
    EXPECT_THROW(strict.format(make_stack_raw(2, 2)), FormatError);
}
