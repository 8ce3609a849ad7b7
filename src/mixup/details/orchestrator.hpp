#ifndef MANIFOLD_MIXUP_ORCHESTRATOR_HPP
#define MANIFOLD_MIXUP_ORCHESTRATOR_HPP
/*
 * Per-batch mixup state machine shared by both forward protocols.
 * ---------------------------------------------------------------------------
 *   Idle -> InputMixupApplied                      (k == -1)
 *   Idle -> ModuleInterceptorArmed -> InterceptorFired -> Idle   (k >= 0)
 *
 * on_batch_begin draws lam, a permutation and a mixing point. Input mixup is
 * applied on the spot. Otherwise an interceptor goes onto the chosen site;
 * derived protocols decide what it does when the site fires. on_loss_begin
 * tears the interceptor down and, in symmetric mode, appends the companion
 * pass output to the batch output.
 *
 * The plan is discarded at the start of every batch and at the end of
 * training, so an interceptor never outlives the batch that armed it.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../../callback/callback.hpp"
#include "../../common/hook.hpp"
#include "../../loss/loss.hpp"
#include "../../utils/terminal.hpp"
#include "broadcast.hpp"
#include "eligibility.hpp"
#include "loss.hpp"
#include "options.hpp"
#include "plan.hpp"
#include "sampling.hpp"

namespace Manifold::Mixup::Details {
    enum class State {
        Idle,
        InputMixupApplied,
        ModuleInterceptorArmed,
        InterceptorFired
    };

    class Orchestrator : public Callback::Base {
    public:
        Orchestrator(Hook::Host& host, MixupOptions options)
            : host_(&host), options_(std::move(options))
        {
            validate(options_);
            candidates_ = select(host_->sites(), options_.use_only_mixup_modules, options_.stream);
        }

        Orchestrator(const Orchestrator&) = delete;
        Orchestrator& operator=(const Orchestrator&) = delete;

        void on_train_begin(Loss::Slot& slot) override
        {
            reset_plan();
            if (loss_) {
                slot.exchange(loss_->get_old());
                loss_.reset();
            }
            loss_ = std::make_shared<MixupLoss>(slot.get(), options_.reduction);
            slot.exchange(loss_);
        }

        [[nodiscard]] std::optional<Callback::BatchUpdate> on_batch_begin(const torch::Tensor& input,
                                                                          const Loss::Target& target,
                                                                          bool train) override
        {
            reset_plan();
            if (!train) {
                return std::nullopt;
            }

            const auto* plain_target = std::get_if<torch::Tensor>(&target);
            TORCH_CHECK(plain_target != nullptr, "Mixup expects an unmixed target at the start of a batch.");
            TORCH_CHECK(plain_target->dim() >= 1, "Mixup needs a batched target.");
            TORCH_CHECK(input.dim() >= 1 && input.size(0) == plain_target->size(0),
                        "Input batch (", input.dim() >= 1 ? input.size(0) : 0,
                        ") and target batch (", plain_target->size(0), ") differ in size.");

            const auto batch_size = plain_target->size(0);
            const auto device = input.device();

            Plan plan{};
            plan.lam = Sampling::lam(options_.alpha, batch_size, device);
            plan.permutation = Sampling::permutation(batch_size, device);
            plan.module_index = Sampling::module_index(candidates_.size(), options_.use_input_mixup);

            auto first = *plain_target;
            auto second = plain_target->index_select(0, plan.permutation.to(plain_target->device()));
            auto output_lam = plan.lam;
            auto companion = input.index_select(0, plan.permutation);

            if (plan.module_index < 0) {
                TORCH_CHECK(input.is_floating_point(), "Input mixup requires a floating-point input, got ",
                            input.scalar_type(), ".");
                plan.input_mixup = true;
                auto mixed_input = blend(plan.lam, input, companion);
                plan_.emplace(std::move(plan));
                state_ = State::InputMixupApplied;
                return Callback::BatchUpdate{std::move(mixed_input),
                                             Loss::MixedTarget{std::move(first), std::move(second), std::move(output_lam)}};
            }

            plan.module = candidates_.at(static_cast<std::size_t>(plan.module_index));
            plan.companion_input = std::move(companion);
            if (options_.use_symmetric_batch) {
                auto doubled_first = torch::cat({first, second}, 0);
                auto doubled_second = torch::cat({second, first}, 0);
                first = std::move(doubled_first);
                second = std::move(doubled_second);
                output_lam = torch::cat({output_lam, output_lam}, 0);
            }

            plan_.emplace(std::move(plan));
            plan_->handle = plan_->module->register_forward_hook(
                [this](const torch::Tensor& output) { return intercept(output); });
            state_ = State::ModuleInterceptorArmed;
            TORCH_INTERNAL_ASSERT(!plan_->input_mixup && plan_->handle.active());

            return Callback::BatchUpdate{input,
                                         Loss::MixedTarget{std::move(first), std::move(second), std::move(output_lam)}};
        }

        [[nodiscard]] std::optional<torch::Tensor> on_loss_begin(const torch::Tensor& output, bool train) override
        {
            if (!train || !plan_ || plan_->input_mixup) {
                return std::nullopt;
            }

            const auto fired = plan_->interception.firings > 0;
            auto nested_output = std::move(plan_->interception.nested_output);
            reset_plan();

            // The targets are already mixed, so an unmixed output cannot be trained on.
            TORCH_CHECK(fired, "The layer selected for mixup never ran during the forward pass.");
            if (!options_.use_symmetric_batch) {
                return std::nullopt;
            }
            TORCH_CHECK(nested_output.defined(),
                        "The companion pass produced no output for the symmetric batch.");
            return torch::cat({output, nested_output}, 0);
        }

        void on_train_end(Loss::Slot& slot) override
        {
            reset_plan();
            if (loss_) {
                slot.exchange(loss_->get_old());
                loss_.reset();
            }
        }

        [[nodiscard]] const std::vector<Hook::SitePtr>& candidates() const noexcept { return candidates_; }
        [[nodiscard]] const Plan* plan() const noexcept { return plan_ ? &*plan_ : nullptr; }
        [[nodiscard]] State state() const noexcept { return state_; }
        [[nodiscard]] bool warning_raised() const noexcept { return warning_raised_; }
        [[nodiscard]] const std::shared_ptr<MixupLoss>& loss() const noexcept { return loss_; }

    protected:
        // Runs each time the selected site fires; returns the tensor the site emits.
        [[nodiscard]] virtual torch::Tensor intercept(const torch::Tensor& output) = 0;

        [[nodiscard]] Plan& active_plan()
        {
            TORCH_INTERNAL_ASSERT(plan_.has_value() && !plan_->input_mixup,
                                  "Interceptor fired without an armed module plan.");
            return *plan_;
        }

        // Re-runs the whole model on the permuted batch. Re-enters intercept().
        [[nodiscard]] torch::Tensor run_companion_pass(Plan& plan)
        {
            return host_->forward(plan.companion_input);
        }

        void mark_fired() noexcept { state_ = State::InterceptorFired; }

        void raise_reuse_warning()
        {
            if (warning_raised_) {
                return;
            }
            warning_raised_ = true;
            Utils::Terminal::Warn(options_.stream,
                                  "A layer selected for mixup ran more than twice in one batch. "
                                  "Mixup only applies to its first call.");
        }

    private:
        void reset_plan() noexcept
        {
            if (plan_) {
                plan_->handle.remove();
            }
            plan_.reset();
            state_ = State::Idle;
        }

        Hook::Host* host_;
        MixupOptions options_;
        std::vector<Hook::SitePtr> candidates_{};
        std::optional<Plan> plan_{};
        State state_{State::Idle};
        bool warning_raised_{false};
        std::shared_ptr<MixupLoss> loss_{};
    };
}

#endif //MANIFOLD_MIXUP_ORCHESTRATOR_HPP
