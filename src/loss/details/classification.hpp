#ifndef MANIFOLD_LOSS_CLASSIFICATION_HPP
#define MANIFOLD_LOSS_CLASSIFICATION_HPP
/*
 * Criteria over logits or log-probabilities. Class weights go straight to the
 * libtorch functional, so Reduction::None yields one value per sample.
 */

#include <cstdint>
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "helper.hpp"

namespace Manifold::Loss::Details {
    namespace F = torch::nn::functional;

    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct BCEWithLogitsOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        std::vector<double> pos_weight{};
    };

    struct NegativeLogLikelihoodOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        std::optional<std::int64_t> ignore_index{};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    struct BCEWithLogitsDescriptor {
        BCEWithLogitsOptions options{};
    };

    struct NegativeLogLikelihoodDescriptor {
        NegativeLogLikelihoodOptions options{};
    };

    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 std::optional<Reduction> reduction = std::nullopt)
    {
        const auto& options = descriptor.options;
        auto torch_options = F::CrossEntropyFuncOptions{}
                                 .reduction(to_torch_reduction<F::CrossEntropyFuncOptions>(resolve_reduction(options.reduction, reduction)))
                                 .label_smoothing(options.label_smoothing);
        if (!options.weight.empty()) {
            torch_options.weight(as_weight(options.weight, prediction));
        }
        return F::cross_entropy(prediction, target, torch_options);
    }

    // Targets share the logits' shape; the float conversion accepts 0/1 integer labels.
    inline torch::Tensor compute(const BCEWithLogitsDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 std::optional<Reduction> reduction = std::nullopt)
    {
        using Options = F::BinaryCrossEntropyWithLogitsFuncOptions;
        const auto& options = descriptor.options;
        auto torch_options = Options{}.reduction(to_torch_reduction<Options>(resolve_reduction(options.reduction, reduction)));
        if (!options.weight.empty()) {
            torch_options.weight(as_weight(options.weight, prediction));
        }
        if (!options.pos_weight.empty()) {
            torch_options.pos_weight(as_weight(options.pos_weight, prediction));
        }
        return F::binary_cross_entropy_with_logits(prediction, target.to(prediction.scalar_type()), torch_options);
    }

    inline torch::Tensor compute(const NegativeLogLikelihoodDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 std::optional<Reduction> reduction = std::nullopt)
    {
        const auto& options = descriptor.options;
        auto torch_options = F::NLLLossFuncOptions{}
                                 .reduction(to_torch_reduction<F::NLLLossFuncOptions>(resolve_reduction(options.reduction, reduction)));
        if (!options.weight.empty()) {
            torch_options.weight(as_weight(options.weight, prediction));
        }
        if (options.ignore_index) {
            torch_options.ignore_index(*options.ignore_index);
        }
        return F::nll_loss(prediction, target, torch_options);
    }
}

#endif // MANIFOLD_LOSS_CLASSIFICATION_HPP
