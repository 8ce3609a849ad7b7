#ifndef MANIFOLD_MIXUP_PLAN_HPP
#define MANIFOLD_MIXUP_PLAN_HPP

#include <cstddef>
#include <cstdint>

#include <torch/torch.h>

#include "../../common/hook.hpp"

namespace Manifold::Mixup::Details {
    // Activations captured while the interceptor is installed.
    struct InterceptionState {
        torch::Tensor first{};          // two-slot: the batch's own activation
        torch::Tensor second{};         // two-slot: the companion's activation
        torch::Tensor pending{};        // interleaved: the activation awaiting its partner
        torch::Tensor nested_output{};  // model output of the companion pass
        std::size_t firings{0};
    };

    // Decisions for one training batch. Lives from on_batch_begin to on_loss_begin.
    struct Plan {
        torch::Tensor lam{};
        torch::Tensor permutation{};
        bool input_mixup{false};
        std::int64_t module_index{-1};
        Hook::SitePtr module{};
        torch::Tensor companion_input{};
        InterceptionState interception{};
        Hook::Handle handle{};  // declared last so it is released first
    };
}

#endif //MANIFOLD_MIXUP_PLAN_HPP
