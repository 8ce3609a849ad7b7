#ifndef MANIFOLD_ACTIVATION_APPLY_HPP
#define MANIFOLD_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"

namespace Manifold::Activation::Details {
    inline torch::Tensor apply(::Manifold::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Manifold::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Manifold::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Manifold::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Manifold::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Manifold::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Manifold::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // MANIFOLD_ACTIVATION_APPLY_HPP
