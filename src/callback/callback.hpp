#ifndef MANIFOLD_CALLBACK_HPP
#define MANIFOLD_CALLBACK_HPP
/*
 * Lifecycle hooks of the training driver.
 * ---------------------------------------------------------------------------
 * Called by `Model::train`, in registration order:
 *  - on_train_begin  once, before the first batch. Receives the loss slot.
 *  - on_batch_begin  before the forward pass of every batch (training and
 *                    validation). May replace the input and the target.
 *  - on_loss_begin   after the forward pass, before the loss. May replace
 *                    the output the loss will see.
 *  - on_train_end    once, after the last batch or when training unwinds on
 *                    an exception.
 */

#include <memory>
#include <optional>

#include <torch/torch.h>

#include "../loss/loss.hpp"

namespace Manifold::Callback {
    struct BatchUpdate {
        torch::Tensor input{};
        Loss::Target target{};
    };

    class Base {
    public:
        virtual ~Base() = default;

        virtual void on_train_begin(Loss::Slot&) {}

        [[nodiscard]] virtual std::optional<BatchUpdate> on_batch_begin(const torch::Tensor&, const Loss::Target&, bool)
        {
            return std::nullopt;
        }

        [[nodiscard]] virtual std::optional<torch::Tensor> on_loss_begin(const torch::Tensor&, bool)
        {
            return std::nullopt;
        }

        virtual void on_train_end(Loss::Slot&) {}
    };

    using Ptr = std::shared_ptr<Base>;
}

#endif //MANIFOLD_CALLBACK_HPP
