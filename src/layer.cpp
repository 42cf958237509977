#include "multilayer/layer.hpp"

namespace multilayer {

namespace {

// Frequency used to check the output shape of a bound index function
// (1 um free-space wavelength).
constexpr double SHAPE_CHECK_FREQUENCY = SPEED_OF_LIGHT / 1e-6;

}  // namespace

Layer::Layer() {
    set_material(std::make_shared<ConstantIndex>(Complex(1.0, 0.0)));
}

Layer::Layer(IndexFunction index_function, double thickness, std::string name)
    : index_function_(bind(std::move(index_function))),
      name_(std::move(name)) {
    set_thickness(thickness);
}

Layer Layer::from_material(std::shared_ptr<Material> material, double thickness,
                           const std::string& name) {
    Layer layer;
    if (material) layer.set_material(std::move(material));
    layer.set_thickness(thickness);
    layer.name_ = name.empty() ? layer.material_->name() : name;
    return layer;
}

Layer Layer::from_material(std::shared_ptr<Material> material, double thickness,
                           const NamingFunction& naming) {
    Layer layer = from_material(std::move(material), thickness);
    if (naming) layer.name_ = naming(*layer.material_);
    return layer;
}

void Layer::validate_thickness(double thickness) {
    if (!(thickness >= 0.0))
        throw ValidationError("Layer thickness must be non-negative, got " +
                              std::to_string(thickness));
}

void Layer::set_thickness(double thickness) {
    validate_thickness(thickness);
    thickness_ = thickness;
}

std::shared_ptr<const IndexFunction> Layer::bind(IndexFunction index_function) {
    if (!index_function)
        throw ValidationError("Layer index function is empty");

    Vec sample(1);
    sample(0) = SHAPE_CHECK_FREQUENCY;
    CVec n = index_function(sample, Component::X);
    if (n.size() != 1)
        throw ValidationError("Layer index function must return one value per "
                              "frequency, got " + std::to_string(n.size()) +
                              " for 1");
    return std::make_shared<const IndexFunction>(std::move(index_function));
}

IndexFunction Layer::material_index_function(const std::shared_ptr<Material>& material) {
    return [material](const Vec& frequencies, Component component) {
        return material->index(frequencies, component);
    };
}

void Layer::set_index_function(IndexFunction index_function) {
    index_function_ = bind(std::move(index_function));
    material_.reset();
}

void Layer::set_material(std::shared_ptr<Material> material) {
    if (!material)
        throw std::invalid_argument("Layer material must not be null");
    index_function_ = bind(material_index_function(material));
    material_ = std::move(material);
}

CMat Layer::index(const Vec& frequencies, Component component) const {
    CVec n = (*index_function_)(frequencies, component);
    if (n.size() != frequencies.size())
        throw ValidationError("Layer '" + name_ + "' index function returned " +
                              std::to_string(n.size()) + " values for " +
                              std::to_string(frequencies.size()) + " frequencies");
    return n.transpose();
}

Vec Layer::thickness() const {
    return Vec::Constant(1, thickness_);
}

Layer Layer::deep_copy() const {
    Layer copy(*this);
    if (material_) {
        auto cloned = material_->clone();
        copy.index_function_ = bind(material_index_function(cloned));
        copy.material_ = std::move(cloned);
    }
    return copy;
}

bool Layer::operator==(const Layer& other) const {
    if (thickness_ != other.thickness_ || name_ != other.name_) return false;
    if (material_ && other.material_) return *material_ == *other.material_;
    if (material_ || other.material_) return false;
    return index_function_ == other.index_function_;
}

}  // namespace multilayer
