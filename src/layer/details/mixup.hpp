#ifndef MANIFOLD_LAYER_MIXUP_HPP
#define MANIFOLD_LAYER_MIXUP_HPP
/*
 * Explicit mixup point.
 * ---------------------------------------------------------------------------
 * Wrapping a layer marks its output as a place where manifold mixup may
 * happen. The wrapper computes exactly what the wrapped layer computes; its
 * site is tagged `MixupMarker` and keeps the wrapped layer's site as its only
 * child, so the wrapped layer stays visible to graph traversal.
 */

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../descriptor.hpp"
#include "../registry.hpp"

namespace Manifold::Layer::Details {

    struct MixupDescriptor {
        std::shared_ptr<const ::Manifold::Layer::Descriptor> layer{};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const MixupDescriptor& descriptor, std::size_t index);

    class MixupPointImpl : public torch::nn::Module {
    public:
        MixupPointImpl(const ::Manifold::Layer::Descriptor& layer, std::size_t index)
            : layer_(build_registered_layer(*this, layer, index)) {}

        torch::Tensor forward(torch::Tensor input)
        {
            return layer_(std::move(input));
        }

        [[nodiscard]] const RegisteredLayer& layer() const noexcept { return layer_; }

    private:
        RegisteredLayer layer_{};
    };

    TORCH_MODULE(MixupPoint);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const MixupDescriptor& descriptor, std::size_t index)
    {
        if (!descriptor.layer) {
            throw std::invalid_argument("Mixup marker requires a layer to wrap.");
        }

        auto module = owner.register_module("mixup_" + std::to_string(index), MixupPoint(*descriptor.layer, index));
        auto registered_layer = make_registered_layer(module, "mixup", index,
                                                      ::Manifold::Hook::Tag::MixupMarker,
                                                      ::Manifold::Activation::Type::Identity);
        registered_layer.site->add_child(module->layer().site);
        return registered_layer;
    }

}

#endif //MANIFOLD_LAYER_MIXUP_HPP
