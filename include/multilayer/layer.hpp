#pragma once

#include "multilayer/common.hpp"
#include "multilayer/material.hpp"
#include "multilayer/structure.hpp"
#include <functional>

namespace multilayer {

// Index-providing callable: (frequencies, component) -> index per frequency
using IndexFunction = std::function<CVec(const Vec&, Component)>;

// Derives a layer name from the material it is built from
using NamingFunction = std::function<std::string(const Material&)>;

// One optically distinct slab: an index function and a thickness.
//
// A layer built from a Material keeps a shared back-reference to it, so
// changing the material's parameters is seen by every layer using it.
// Copying a Layer shares the material; deep_copy() clones it.
class Layer : public Structure {
public:
    // Vacuum: ConstantIndex(1), zero thickness
    Layer();
    explicit Layer(IndexFunction index_function, double thickness = 0.0,
                   std::string name = "");

    // Null material means vacuum. Empty name defaults to the material's name.
    static Layer from_material(std::shared_ptr<Material> material = nullptr,
                               double thickness = 0.0,
                               const std::string& name = "");
    static Layer from_material(std::shared_ptr<Material> material,
                               double thickness,
                               const NamingFunction& naming);

    // (1 x num_frequencies)
    CMat index(const Vec& frequencies,
               Component component = Component::X) const override;
    // Length-1 vector
    Vec thickness() const override;
    int num_layers() const override { return 1; }

    double thickness_value() const { return thickness_; }
    void set_thickness(double thickness);

    // Bind a raw index function; clears the material back-reference.
    void set_index_function(IndexFunction index_function);
    // Bind index function and back-reference to a material.
    void set_material(std::shared_ptr<Material> material);

    const std::shared_ptr<Material>& material() const { return material_; }

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    // Independent copy: the material (if any) is cloned and rebound.
    Layer deep_copy() const;

    bool operator==(const Layer& other) const;
    bool operator!=(const Layer& other) const { return !(*this == other); }

private:
    std::shared_ptr<const IndexFunction> index_function_;
    std::shared_ptr<Material> material_;
    double thickness_ = 0.0;
    std::string name_;

    static void validate_thickness(double thickness);
    static std::shared_ptr<const IndexFunction> bind(IndexFunction index_function);
    static IndexFunction material_index_function(const std::shared_ptr<Material>& material);
};

}  // namespace multilayer
