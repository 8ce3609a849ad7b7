#ifndef MANIFOLD_LOSS_FUNCTION_HPP
#define MANIFOLD_LOSS_FUNCTION_HPP
/*
 * Criterion seam of the training driver.
 * ---------------------------------------------------------------------------
 *  - `Function` is what the driver evaluates after each forward pass. It takes
 *    either a plain target tensor or a `MixedTarget` (two targets plus the
 *    per-sample weight that pairs them).
 *  - A criterion may expose a reduction setting. Descriptor-backed criteria
 *    do; user callables only honour the reduction passed on each call.
 *  - `Slot` holds the active criterion. Swapping it goes through `exchange`,
 *    which hands back the previous one.
 */

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../descriptor.hpp"

namespace Manifold::Loss {
    // (first, second, lam): weight lam goes to `first`, 1 - lam to `second`.
    struct MixedTarget {
        torch::Tensor first{};
        torch::Tensor second{};
        torch::Tensor lam{};
    };

    using Target = std::variant<torch::Tensor, MixedTarget>;

    using Callable = std::function<torch::Tensor(const torch::Tensor&, const torch::Tensor&, Reduction)>;

    class Function {
    public:
        virtual ~Function() = default;

        [[nodiscard]] virtual torch::Tensor forward(const torch::Tensor& prediction, const Target& target)
        {
            if (const auto* tensor = std::get_if<torch::Tensor>(&target)) {
                return compute(prediction, *tensor, reduction().value_or(Reduction::Mean));
            }
            throw std::invalid_argument(
                "Loss received a mixed target but is not mixup-aware. Attach a mixup callback before training.");
        }

        [[nodiscard]] virtual torch::Tensor compute(const torch::Tensor& prediction,
                                                    const torch::Tensor& target,
                                                    Reduction reduction) = 0;

        [[nodiscard]] virtual std::optional<Reduction> reduction() const { return std::nullopt; }

        virtual void set_reduction(Reduction)
        {
            throw std::logic_error("This loss does not expose a reduction setting.");
        }
    };

    using FunctionPtr = std::shared_ptr<Function>;

    namespace Details {
        class DescriptorFunction final : public Function {
        public:
            explicit DescriptorFunction(Descriptor descriptor) : descriptor_(std::move(descriptor)) {}

            [[nodiscard]] torch::Tensor compute(const torch::Tensor& prediction,
                                                const torch::Tensor& target,
                                                Reduction reduction) override
            {
                return std::visit(
                    [&](const auto& concrete) {
                        return Details::compute(concrete, prediction, target, reduction);
                    },
                    descriptor_);
            }

            [[nodiscard]] std::optional<Reduction> reduction() const override
            {
                return std::visit([](const auto& concrete) { return concrete.options.reduction; }, descriptor_);
            }

            void set_reduction(Reduction reduction) override
            {
                std::visit([reduction](auto& concrete) { concrete.options.reduction = reduction; }, descriptor_);
            }

            [[nodiscard]] const Descriptor& descriptor() const noexcept { return descriptor_; }

        private:
            Descriptor descriptor_;
        };

        class CallableFunction final : public Function {
        public:
            explicit CallableFunction(Callable callable) : callable_(std::move(callable))
            {
                if (!callable_) {
                    throw std::invalid_argument("Loss callable must not be empty.");
                }
            }

            [[nodiscard]] torch::Tensor compute(const torch::Tensor& prediction,
                                                const torch::Tensor& target,
                                                Reduction reduction) override
            {
                return callable_(prediction, target, reduction);
            }

        private:
            Callable callable_;
        };
    }

    class Slot {
    public:
        Slot() = default;
        explicit Slot(FunctionPtr function) : function_(std::move(function)) {}

        [[nodiscard]] const FunctionPtr& get() const noexcept { return function_; }

        FunctionPtr exchange(FunctionPtr function) noexcept
        {
            return std::exchange(function_, std::move(function));
        }

        [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(function_); }

    private:
        FunctionPtr function_{};
    };
}

#endif //MANIFOLD_LOSS_FUNCTION_HPP
