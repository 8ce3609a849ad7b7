#ifndef MANIFOLD_MIXUP_SAMPLING_HPP
#define MANIFOLD_MIXUP_SAMPLING_HPP

#include <cstddef>
#include <cstdint>

#include <torch/torch.h>

// Draws come from libtorch's default generator, so torch::manual_seed fixes them.
namespace Manifold::Mixup::Details::Sampling {
    // Beta(alpha, alpha) as X / (X + Y) with X, Y ~ Gamma(alpha), folded onto [0.5, 1].
    [[nodiscard]] inline torch::Tensor lam(double alpha, std::int64_t count, const torch::Device& device)
    {
        torch::NoGradGuard no_grad{};
        const auto concentration = torch::full({count}, alpha, torch::TensorOptions().dtype(torch::kFloat64));
        const auto x = torch::_standard_gamma(concentration);
        const auto y = torch::_standard_gamma(concentration);
        const auto total = x + y;
        // Both draws underflow for tiny alpha.
        auto beta = torch::where(total > 0, x / total, torch::ones_like(total));
        beta = torch::max(beta, 1 - beta);
        return beta.to(device, torch::kFloat32);
    }

    [[nodiscard]] inline torch::Tensor permutation(std::int64_t count, const torch::Device& device)
    {
        return torch::randperm(count, torch::TensorOptions().dtype(torch::kLong)).to(device);
    }

    // Uniform over [-1, candidates) when the input may be mixed, else over [0, candidates).
    [[nodiscard]] inline std::int64_t module_index(std::size_t candidates, bool use_input_mixup)
    {
        const std::int64_t low = use_input_mixup ? -1 : 0;
        const auto high = static_cast<std::int64_t>(candidates);
        return torch::randint(low, high, {1}, torch::TensorOptions().dtype(torch::kLong)).item<std::int64_t>();
    }
}

#endif //MANIFOLD_MIXUP_SAMPLING_HPP
