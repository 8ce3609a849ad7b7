#ifndef MANIFOLD_FC_HPP
#define MANIFOLD_FC_HPP

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"


namespace Manifold::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
        ::Manifold::Initialization::Descriptor initialization{::Manifold::Initialization::Default};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, std::size_t index)
    {
        const auto& options = descriptor.options;
        if (options.in_features <= 0 || options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layers require positive in/out features.");
        }

        torch::nn::Linear linear(torch::nn::LinearOptions(options.in_features, options.out_features).bias(options.bias));
        ::Manifold::Initialization::Details::apply_module_initialization(linear, descriptor.initialization);

        return register_layer(owner, "fc", index, ::Manifold::Hook::Tag::Mixable, descriptor.activation.type, std::move(linear));
    }
}

#endif //MANIFOLD_FC_HPP
