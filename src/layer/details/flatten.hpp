#ifndef MANIFOLD_FLATTEN_HPP
#define MANIFOLD_FLATTEN_HPP
#include <cstdint>

#include <torch/torch.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Manifold::Layer::Details {

    // Defaults keep the batch axis and merge every feature axis.
    struct FlattenOptions {
        std::int64_t start_dim{1};
        std::int64_t end_dim{-1};
    };

    struct FlattenDescriptor {
        FlattenOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FlattenDescriptor& descriptor, std::size_t index)
    {
        torch::nn::Flatten flatten(torch::nn::FlattenOptions()
                                       .start_dim(descriptor.options.start_dim)
                                       .end_dim(descriptor.options.end_dim));
        return register_layer(owner, "flatten", index, ::Manifold::Hook::Tag::Mixable, descriptor.activation.type, std::move(flatten));
    }

}

#endif //MANIFOLD_FLATTEN_HPP
