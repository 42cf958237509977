#pragma once

#include "multilayer/common.hpp"
#include "multilayer/layer.hpp"
#include <optional>

namespace multilayer {

using LayerPtr = std::shared_ptr<Layer>;

// How periodic construction places layers into the new stack.
//   COPY:  every inserted layer (boundaries included) is an independent
//          deep copy; mutating one never affects another or the inputs.
//   ALIAS: the same Layer objects are referenced in every period and at the
//          boundaries. Mutating a shared layer, or a material it references,
//          is visible everywhere it is used, including other Multilayers
//          built from the same objects.
enum class LayerSharing { COPY, ALIAS };

// Ordered stack of layers. layers()[0] and layers().back() are by convention
// the incident and exit media.
//
// The stack exclusively owns its list (reorder/insert/remove), but the Layer
// objects themselves may be shared with other stacks.
class Multilayer : public Structure {
public:
    Multilayer() = default;
    explicit Multilayer(std::vector<LayerPtr> layers);

    // [incident] + unit_cell * num_periods + [exit]
    static Multilayer from_unit_cell(const std::vector<LayerPtr>& unit_cell,
                                     const LayerPtr& incident_layer,
                                     const LayerPtr& exit_layer,
                                     int num_periods = 1,
                                     LayerSharing sharing = LayerSharing::COPY);

    // Rebuild periodically from this stack. Defaults: the recorded unit cell
    // (else stack_layers()), the recorded period count (else 1), and this
    // stack's first/last layers as boundaries.
    Multilayer from_own_unit_cell(std::optional<int> num_periods = std::nullopt,
                                  const std::optional<std::vector<LayerPtr>>& unit_cell = std::nullopt,
                                  LayerPtr incident_layer = nullptr,
                                  LayerPtr exit_layer = nullptr,
                                  LayerSharing sharing = LayerSharing::COPY) const;

    // (num_layers x num_frequencies)
    CMat index(const Vec& frequencies,
               Component component = Component::X) const override;
    Vec thickness() const override;
    int num_layers() const override { return static_cast<int>(layers_.size()); }

    const std::vector<LayerPtr>& layers() const { return layers_; }

    // Replace the layer list. Null entries are rejected with
    // std::invalid_argument and leave the stack unchanged. The recorded unit
    // cell and period count are kept.
    void set_layers(std::vector<LayerPtr> layers);

    const LayerPtr& operator[](int i) const { return layers_.at(i); }

    // All layers except the first and last; empty for fewer than 2 layers
    std::vector<LayerPtr> stack_layers() const;

    void append_layer(LayerPtr layer);
    void insert_layer(int position, LayerPtr layer);
    void remove_layer(int position);

    // Unit cell this stack was last built from (the pointers passed in)
    const std::optional<std::vector<LayerPtr>>& unit_cell() const { return unit_cell_; }
    std::optional<int> num_periods() const { return num_periods_; }

private:
    std::vector<LayerPtr> layers_;
    std::optional<std::vector<LayerPtr>> unit_cell_;
    std::optional<int> num_periods_;

    static LayerPtr place(const LayerPtr& layer, LayerSharing sharing);
};

}  // namespace multilayer
