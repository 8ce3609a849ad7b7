#ifndef MANIFOLD_INITIALIZATION_APPLY_HPP
#define MANIFOLD_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Manifold::Initialization::Details {
    // Fan-based schemes need a weight of rank >= 2; normalization weights are left alone.
    inline void initialize_weight(Type type, torch::Tensor weight)
    {
        if (!weight.defined() || weight.dim() < 2) {
            return;
        }
        switch (type) {
            case Type::XavierNormal:
                torch::nn::init::xavier_normal_(weight);
                break;
            case Type::XavierUniform:
                torch::nn::init::xavier_uniform_(weight);
                break;
            case Type::KaimingNormal:
                torch::nn::init::kaiming_normal_(weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                break;
            case Type::KaimingUniform:
                torch::nn::init::kaiming_uniform_(weight, /*a=*/0.0, torch::kFanIn, torch::kReLU);
                break;
            case Type::ZeroBias:
            case Type::Default:
            default:
                break;
        }
    }

    template <class Holder>
    inline void apply_module_initialization(const Holder& module, ::Manifold::Initialization::Descriptor initialization)
    {
        if (initialization.type == Type::Default) {
            return;
        }
        torch::NoGradGuard no_grad;
        initialize_weight(initialization.type, module->weight);
        if constexpr (requires { module->bias; }) {
            // Every explicit scheme starts from a zero bias.
            if (module->bias.defined()) {
                torch::nn::init::zeros_(module->bias);
            }
        }
    }
}
#endif // MANIFOLD_INITIALIZATION_APPLY_HPP
