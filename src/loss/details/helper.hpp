#ifndef MANIFOLD_LOSS_HELPER_HPP
#define MANIFOLD_LOSS_HELPER_HPP

#include <vector>

#include <torch/torch.h>

#include "reduction.hpp"

namespace Manifold::Loss::Details {
    [[nodiscard]] inline torch::Tensor as_weight(const std::vector<double>& weight, const torch::Tensor& like)
    {
        return torch::tensor(weight, torch::TensorOptions().dtype(like.scalar_type()).device(like.device()));
    }

    // Reduces a per-element loss. Element weights are given as a flat list: one per
    // element reshapes onto the loss, anything shorter broadcasts from the right.
    // The weighted mean divides by the total weight.
    [[nodiscard]] inline torch::Tensor reduce(torch::Tensor per_element, const std::vector<double>& weight, Reduction reduction)
    {
        if (weight.empty()) {
            return apply_reduction(std::move(per_element), reduction);
        }
        auto w = as_weight(weight, per_element);
        if (w.numel() == per_element.numel()) {
            w = w.reshape(per_element.sizes());
        }
        w = w.expand_as(per_element);

        auto weighted = per_element * w;
        switch (reduction) {
            case Reduction::None:
                return weighted;
            case Reduction::Sum:
                return weighted.sum();
            case Reduction::Mean:
            default:
                return weighted.sum() / w.sum().clamp_min(1e-12);
        }
    }
}
#endif //MANIFOLD_LOSS_HELPER_HPP
