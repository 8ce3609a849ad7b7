#ifndef MANIFOLD_MIXUP_LOSS_HPP
#define MANIFOLD_MIXUP_LOSS_HPP
/*
 * Loss adapter installed in the loss slot for the duration of training.
 * ---------------------------------------------------------------------------
 * The wrapped criterion is evaluated per sample. If it exposes a reduction
 * setting, that setting is forced to None and restored by `get_old()`;
 * otherwise every call asks for Reduction::None explicitly.
 *
 * With a plain target the adapter reduces the per-sample loss itself, so
 * batches without mixup still train normally. With a MixedTarget it returns
 * reduce(lam * loss(first) + (1 - lam) * loss(second)).
 */

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../../loss/loss.hpp"
#include "broadcast.hpp"

namespace Manifold::Mixup::Details {
    class MixupLoss final : public Loss::Function {
    public:
        MixupLoss(Loss::FunctionPtr criterion, Loss::Reduction reduction)
            : criterion_(std::move(criterion)), reduction_(reduction)
        {
            if (!criterion_) {
                throw std::logic_error("Mixup needs a loss in the slot before training starts.");
            }
            old_reduction_ = criterion_->reduction();
            if (old_reduction_.has_value()) {
                criterion_->set_reduction(Loss::Reduction::None);
            }
        }

        [[nodiscard]] torch::Tensor forward(const torch::Tensor& prediction, const Loss::Target& target) override
        {
            if (const auto* tensor = std::get_if<torch::Tensor>(&target)) {
                return compute(prediction, *tensor, reduction_);
            }
            const auto& mixed = std::get<Loss::MixedTarget>(target);
            const auto first = per_sample(prediction, mixed.first);
            const auto second = per_sample(prediction, mixed.second);
            TORCH_CHECK(first.dim() >= 1 && first.size(0) == mixed.lam.size(0),
                        "Mixed loss expects one weight per sample: ", mixed.lam.size(0),
                        " weights for a per-sample loss of shape ", first.sizes(), ".");
            const auto lam = adapt_dim(mixed.lam.to(first.device(), first.scalar_type()), first);
            return Loss::Details::apply_reduction(first * lam + second * (1 - lam), reduction_);
        }

        [[nodiscard]] torch::Tensor compute(const torch::Tensor& prediction,
                                            const torch::Tensor& target,
                                            Loss::Reduction reduction) override
        {
            return Loss::Details::apply_reduction(per_sample(prediction, target), reduction);
        }

        [[nodiscard]] std::optional<Loss::Reduction> reduction() const override { return reduction_; }
        void set_reduction(Loss::Reduction reduction) override { reduction_ = reduction; }

        // Original criterion with its reduction setting put back.
        [[nodiscard]] Loss::FunctionPtr get_old()
        {
            if (old_reduction_.has_value()) {
                criterion_->set_reduction(*old_reduction_);
                old_reduction_.reset();
            }
            return criterion_;
        }

    private:
        [[nodiscard]] torch::Tensor per_sample(const torch::Tensor& prediction, const torch::Tensor& target)
        {
            return criterion_->compute(prediction, target, Loss::Reduction::None);
        }

        Loss::FunctionPtr criterion_;
        Loss::Reduction reduction_;
        std::optional<Loss::Reduction> old_reduction_{};
    };
}

#endif //MANIFOLD_MIXUP_LOSS_HPP
