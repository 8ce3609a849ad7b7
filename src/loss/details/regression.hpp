#ifndef MANIFOLD_LOSS_REGRESSION_HPP
#define MANIFOLD_LOSS_REGRESSION_HPP
/*
 * Pointwise regression criteria. Each is evaluated per element first and then
 * reduced, so Reduction::None always keeps the prediction's shape.
 */

#include <optional>
#include <vector>

#include <torch/torch.h>

#include "helper.hpp"

namespace Manifold::Loss::Details {
    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
    };

    struct MAEOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
    };

    struct SmoothL1Options {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double beta{1.0};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    struct MAEDescriptor {
        MAEOptions options{};
    };

    struct SmoothL1Descriptor {
        SmoothL1Options options{};
    };

    namespace Pointwise {
        inline torch::Tensor check(const torch::Tensor& prediction, const torch::Tensor& target, const char* name)
        {
            TORCH_CHECK(prediction.sizes() == target.sizes(),
                        name, " expects prediction and target of the same shape, got ",
                        prediction.sizes(), " and ", target.sizes(), ".");
            return prediction - target.to(prediction.scalar_type());
        }
    }

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 std::optional<Reduction> reduction = std::nullopt)
    {
        const auto error = Pointwise::check(prediction, target, "MSE");
        return reduce(error.pow(2), descriptor.options.weight, resolve_reduction(descriptor.options.reduction, reduction));
    }

    inline torch::Tensor compute(const MAEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 std::optional<Reduction> reduction = std::nullopt)
    {
        const auto error = Pointwise::check(prediction, target, "MAE");
        return reduce(error.abs(), descriptor.options.weight, resolve_reduction(descriptor.options.reduction, reduction));
    }

    // Quadratic below beta, linear above.
    inline torch::Tensor compute(const SmoothL1Descriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 std::optional<Reduction> reduction = std::nullopt)
    {
        TORCH_CHECK(descriptor.options.beta >= 0.0, "SmoothL1 beta must be non-negative.");
        Pointwise::check(prediction, target, "SmoothL1");
        auto per_element = torch::nn::functional::smooth_l1_loss(
            prediction,
            target.to(prediction.scalar_type()),
            torch::nn::functional::SmoothL1LossFuncOptions{}.reduction(torch::kNone).beta(descriptor.options.beta));
        return reduce(std::move(per_element), descriptor.options.weight,
                      resolve_reduction(descriptor.options.reduction, reduction));
    }
}

#endif // MANIFOLD_LOSS_REGRESSION_HPP
