#ifndef MANIFOLD_DROPOUT_HPP
#define MANIFOLD_DROPOUT_HPP
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Manifold::Layer::Details {

    struct DropoutOptions {
        enum class Variant {
            Standard,
            Channel2d,
            Alpha
        };
        double probability{0.5};
        Variant variant{Variant::Standard};
        bool inplace{false};
    };

    struct DropoutDescriptor {
        DropoutOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
    };

    // Mask draws differ between the batch pass and the companion pass.
    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const DropoutDescriptor& descriptor, std::size_t index)
    {
        const auto& options = descriptor.options;
        if (!(options.probability >= 0.0 && options.probability < 1.0)) {
            throw std::invalid_argument("Dropout probability must be in the range [0, 1).");
        }

        const auto tag = ::Manifold::Hook::Tag::NonMixable;
        const auto activation = descriptor.activation.type;
        switch (options.variant) {
            case DropoutOptions::Variant::Channel2d:
                return register_layer(owner, "dropout2d", index, tag, activation,
                                      torch::nn::Dropout2d(torch::nn::Dropout2dOptions(options.probability).inplace(options.inplace)));
            case DropoutOptions::Variant::Alpha:
                return register_layer(owner, "alpha_dropout", index, tag, activation,
                                      torch::nn::AlphaDropout(torch::nn::AlphaDropoutOptions(options.probability).inplace(options.inplace)));
            case DropoutOptions::Variant::Standard:
            default:
                return register_layer(owner, "dropout", index, tag, activation,
                                      torch::nn::Dropout(torch::nn::DropoutOptions(options.probability).inplace(options.inplace)));
        }
    }


    struct HardDropoutOptions {
        double probability{0.5};
        bool inplace{false};
    };

    struct HardDropoutDescriptor {
        HardDropoutOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
    };

    // Multiplicative gaussian noise with the variance of inverted dropout.
    class HardDropoutImpl : public torch::nn::Module {
    public:
        explicit HardDropoutImpl(HardDropoutOptions options = {})
            : options_(options)
        {
            TORCH_CHECK(options_.probability >= 0.0 && options_.probability < 1.0,
                        "HardDropout probability must be in the range [0, 1).");
        }

        torch::Tensor forward(torch::Tensor input)
        {
            if (!input.defined()) return input;
            TORCH_CHECK(input.is_floating_point(), "HardDropout expects floating point tensors.");
            if (!is_training() || options_.probability == 0.0) return input;

            const double p = options_.probability;
            const double std = std::sqrt(p / (1.0 - p));

            // mean=1 keeps E[output]=input
            auto eps = torch::empty_like(input).normal_(1.0, std);

            if (options_.inplace) { input.mul_(eps); return input; }
            return input * eps;
        }

    private:
        HardDropoutOptions options_{};
    };

    TORCH_MODULE(HardDropout);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const HardDropoutDescriptor& descriptor, std::size_t index)
    {
        return register_layer(owner, "hard_dropout", index, ::Manifold::Hook::Tag::NonMixable, descriptor.activation.type,
                              HardDropout(descriptor.options));
    }

}

#endif //MANIFOLD_DROPOUT_HPP
