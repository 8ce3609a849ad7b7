#ifndef MANIFOLD_MIXUP_INTERLEAVED_HPP
#define MANIFOLD_MIXUP_INTERLEAVED_HPP

#include <utility>

#include <torch/torch.h>

#include "broadcast.hpp"
#include "orchestrator.hpp"

namespace Manifold::Mixup::Details {
    /*
     * Two-call protocol over a single pending slot.
     * The outer firing parks its activation and starts the companion pass. The
     * nested firing mixes against the parked activation and parks its own in
     * its place, which the outer firing then consumes once the pass returns.
     * The selected layer may run once per forward call; a third firing in one
     * batch is rejected.
     */
    class InterleavedManifoldMixup final : public Orchestrator {
    public:
        InterleavedManifoldMixup(Hook::Host& host, MixupOptions options) : Orchestrator(host, std::move(options)) {}

    protected:
        [[nodiscard]] torch::Tensor intercept(const torch::Tensor& output) override
        {
            auto& plan = active_plan();
            auto& state = plan.interception;
            ++state.firings;
            TORCH_CHECK(state.firings <= 2,
                        "The layer selected for interleaved mixup ran more than once per forward pass. "
                        "Use the two-slot protocol for layers that are reused.");

            if (!state.pending.defined()) {
                mark_fired();
                state.pending = output;
                state.nested_output = run_companion_pass(plan);
                TORCH_CHECK(state.firings == 2,
                            "The layer selected for mixup did not run during the companion pass.");
                auto mixed = blend(plan.lam, output, state.pending);
                state.pending = torch::Tensor{};
                return mixed;
            }

            auto mixed = blend(plan.lam, output, state.pending);
            state.pending = output;
            return mixed;
        }
    };
}

#endif //MANIFOLD_MIXUP_INTERLEAVED_HPP
