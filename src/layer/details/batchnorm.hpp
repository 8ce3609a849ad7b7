#ifndef MANIFOLD_BATCHNORM_HPP
#define MANIFOLD_BATCHNORM_HPP
#include <cstdint>

#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"

namespace Manifold::Layer::Details {

    // Running statistics make normalization layers unsafe mixing points.
    struct BatchNormOptions {
        std::int64_t num_features{};
        double eps{1e-5};
        double momentum{0.1};
        bool affine{true};
        bool track_running_stats{true};
    };

    using BatchNorm1dOptions = BatchNormOptions;
    using BatchNorm2dOptions = BatchNormOptions;

    struct BatchNorm1dDescriptor {
        BatchNorm1dOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
        ::Manifold::Initialization::Descriptor initialization{::Manifold::Initialization::Default};
    };

    struct BatchNorm2dDescriptor {
        BatchNorm2dOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
        ::Manifold::Initialization::Descriptor initialization{::Manifold::Initialization::Default};
    };

    template <class TorchOptions>
    [[nodiscard]] TorchOptions to_torch_batchnorm_options(const BatchNormOptions& options)
    {
        if (options.num_features <= 0) {
            throw std::invalid_argument("BatchNorm requires a positive number of features.");
        }
        return TorchOptions(options.num_features)
            .eps(options.eps)
            .momentum(options.momentum)
            .affine(options.affine)
            .track_running_stats(options.track_running_stats);
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const BatchNorm1dDescriptor& descriptor, std::size_t index)
    {
        torch::nn::BatchNorm1d norm(to_torch_batchnorm_options<torch::nn::BatchNorm1dOptions>(descriptor.options));
        ::Manifold::Initialization::Details::apply_module_initialization(norm, descriptor.initialization);
        return register_layer(owner, "batchnorm1d", index, ::Manifold::Hook::Tag::NonMixable, descriptor.activation.type, std::move(norm));
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const BatchNorm2dDescriptor& descriptor, std::size_t index)
    {
        torch::nn::BatchNorm2d norm(to_torch_batchnorm_options<torch::nn::BatchNorm2dOptions>(descriptor.options));
        ::Manifold::Initialization::Details::apply_module_initialization(norm, descriptor.initialization);
        return register_layer(owner, "batchnorm2d", index, ::Manifold::Hook::Tag::NonMixable, descriptor.activation.type, std::move(norm));
    }

}

#endif //MANIFOLD_BATCHNORM_HPP
