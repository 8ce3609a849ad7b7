#ifndef MANIFOLD_MIXUP_BROADCAST_HPP
#define MANIFOLD_MIXUP_BROADCAST_HPP

#include <cstdint>
#include <vector>

#include <torch/torch.h>

namespace Manifold::Mixup::Details {
    // Appends trailing singleton dimensions to `weight` until it has the rank of `target`.
    [[nodiscard]] inline torch::Tensor adapt_dim(const torch::Tensor& weight, const torch::Tensor& target)
    {
        TORCH_CHECK(target.dim() >= 1, "Cannot broadcast a per-sample weight onto a rank-0 tensor.");
        TORCH_CHECK(weight.dim() <= target.dim(),
                    "Weight of rank ", weight.dim(), " cannot broadcast onto a tensor of rank ", target.dim(), ".");
        std::vector<std::int64_t> shape(weight.sizes().begin(), weight.sizes().end());
        shape.resize(static_cast<std::size_t>(target.dim()), 1);
        return weight.reshape(shape);
    }

    // lam * own + (1 - lam) * companion, sample by sample.
    [[nodiscard]] inline torch::Tensor blend(const torch::Tensor& lam,
                                             const torch::Tensor& own,
                                             const torch::Tensor& companion)
    {
        TORCH_CHECK(own.sizes() == companion.sizes(),
                    "Mixed tensors must share a shape, got ", own.sizes(), " and ", companion.sizes(), ".");
        TORCH_CHECK(own.dim() >= 1 && own.size(0) == lam.size(0),
                    "Mixup weight covers ", lam.size(0), " samples but the tensor holds ",
                    own.dim() >= 1 ? own.size(0) : 0, ".");
        const auto weight = adapt_dim(lam.to(own.device(), own.scalar_type()), own);
        return weight * own + (1 - weight) * companion;
    }
}

#endif //MANIFOLD_MIXUP_BROADCAST_HPP
