#include "multilayer/multilayer.hpp"

namespace multilayer {

namespace {

void check_not_null(const std::vector<LayerPtr>& layers) {
    for (size_t i = 0; i < layers.size(); i++) {
        if (!layers[i])
            throw std::invalid_argument("Multilayer layer " + std::to_string(i) +
                                        " is null");
    }
}

}  // namespace

Multilayer::Multilayer(std::vector<LayerPtr> layers) : layers_(std::move(layers)) {
    check_not_null(layers_);
}

void Multilayer::set_layers(std::vector<LayerPtr> layers) {
    check_not_null(layers);
    layers_ = std::move(layers);
}

LayerPtr Multilayer::place(const LayerPtr& layer, LayerSharing sharing) {
    switch (sharing) {
        case LayerSharing::COPY:
            return std::make_shared<Layer>(layer->deep_copy());
        case LayerSharing::ALIAS:
            return layer;
    }
    throw ConfigurationError("Unknown LayerSharing mode");
}

Multilayer Multilayer::from_unit_cell(const std::vector<LayerPtr>& unit_cell,
                                      const LayerPtr& incident_layer,
                                      const LayerPtr& exit_layer,
                                      int num_periods,
                                      LayerSharing sharing) {
    if (num_periods < 0)
        throw ValidationError("num_periods must be non-negative, got " +
                              std::to_string(num_periods));
    if (!incident_layer || !exit_layer)
        throw std::invalid_argument("Incident and exit layers must not be null");
    for (size_t i = 0; i < unit_cell.size(); i++) {
        if (!unit_cell[i])
            throw std::invalid_argument("Unit cell layer " + std::to_string(i) +
                                        " is null");
    }

    std::vector<LayerPtr> layers;
    layers.reserve(unit_cell.size() * num_periods + 2);

    layers.push_back(place(incident_layer, sharing));
    for (int p = 0; p < num_periods; p++) {
        for (const auto& layer : unit_cell) {
            layers.push_back(place(layer, sharing));
        }
    }
    layers.push_back(place(exit_layer, sharing));

    Multilayer result(std::move(layers));
    result.unit_cell_ = unit_cell;
    result.num_periods_ = num_periods;
    return result;
}

Multilayer Multilayer::from_own_unit_cell(std::optional<int> num_periods,
                                          const std::optional<std::vector<LayerPtr>>& unit_cell,
                                          LayerPtr incident_layer,
                                          LayerPtr exit_layer,
                                          LayerSharing sharing) const {
    if ((!incident_layer || !exit_layer) && layers_.size() < 2)
        throw std::invalid_argument(
            "Multilayer needs at least 2 layers to supply incident/exit media");

    std::vector<LayerPtr> cell;
    if (unit_cell) {
        cell = *unit_cell;
    } else if (unit_cell_) {
        cell = *unit_cell_;
    } else {
        cell = stack_layers();
    }

    int periods = num_periods.value_or(num_periods_.value_or(1));
    if (!incident_layer) incident_layer = layers_.front();
    if (!exit_layer) exit_layer = layers_.back();

    return from_unit_cell(cell, incident_layer, exit_layer, periods, sharing);
}

CMat Multilayer::index(const Vec& frequencies, Component component) const {
    int n_layers = num_layers();
    CMat n(n_layers, frequencies.size());
    for (int i = 0; i < n_layers; i++) {
        n.row(i) = layers_[i]->index(frequencies, component);
    }
    return n;
}

Vec Multilayer::thickness() const {
    int n_layers = num_layers();
    Vec d(n_layers);
    for (int i = 0; i < n_layers; i++) {
        d(i) = layers_[i]->thickness_value();
    }
    return d;
}

std::vector<LayerPtr> Multilayer::stack_layers() const {
    if (layers_.size() < 2) return {};
    return std::vector<LayerPtr>(layers_.begin() + 1, layers_.end() - 1);
}

void Multilayer::append_layer(LayerPtr layer) {
    if (!layer)
        throw std::invalid_argument("Cannot append a null layer");
    layers_.push_back(std::move(layer));
}

void Multilayer::insert_layer(int position, LayerPtr layer) {
    if (!layer)
        throw std::invalid_argument("Cannot insert a null layer");
    if (position < 0 || position > num_layers())
        throw std::out_of_range("Layer position " + std::to_string(position) +
                                " out of range [0, " + std::to_string(num_layers()) + "]");
    layers_.insert(layers_.begin() + position, std::move(layer));
}

void Multilayer::remove_layer(int position) {
    if (position < 0 || position >= num_layers())
        throw std::out_of_range("Layer position " + std::to_string(position) +
                                " out of range [0, " + std::to_string(num_layers()) + ")");
    layers_.erase(layers_.begin() + position);
}

}  // namespace multilayer
