// Layer factory
// Rebuild any layer variant from its JSON form, dispatching on "class"

#pragma once

#include <seqnet/nn/layer.hpp>
#include <seqnet/nn/linear.hpp>
#include <seqnet/nn/activations.hpp>
#include <seqnet/nn/dropout.hpp>
#include <seqnet/json_fields.hpp>
#include <memory>
#include <string>

namespace seqnet::nn {

enum class LayerKind {
    Linear,
    ReLU,
    Dropout
};

inline LayerKind parse_layer_kind(const std::string& name) {
    if (name == "Linear") return LayerKind::Linear;
    if (name == "ReLU") return LayerKind::ReLU;
    if (name == "Dropout") return LayerKind::Dropout;
    throw ValueError("Unknown layer class: " + name);
}

inline std::unique_ptr<Layer> layer_from_json(const nlohmann::json& j) {
    switch (parse_layer_kind(detail::json_string(j, "class"))) {
        case LayerKind::Linear:
            return std::make_unique<Linear>(Linear::from_json(j));
        case LayerKind::ReLU:
            return std::make_unique<ReLU>(ReLU::from_json(j));
        case LayerKind::Dropout:
            return std::make_unique<Dropout>(Dropout::from_json(j));
    }
    throw ValueError("Unknown layer kind");
}

}  // namespace seqnet::nn
