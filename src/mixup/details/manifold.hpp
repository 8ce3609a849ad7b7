#ifndef MANIFOLD_MIXUP_MANIFOLD_HPP
#define MANIFOLD_MIXUP_MANIFOLD_HPP

#include <utility>

#include <torch/torch.h>

#include "broadcast.hpp"
#include "orchestrator.hpp"

namespace Manifold::Mixup::Details {
    /*
     * Two-slot protocol.
     *   1st firing: keep the batch's activation, run the companion pass, then
     *               emit lam * own + (1 - lam) * companion.
     *   2nd firing: inside the companion pass. Keep its activation and emit
     *               lam * companion + (1 - lam) * own.
     *   later:      passthrough, with a single warning per run.
     */
    class ManifoldMixup final : public Orchestrator {
    public:
        ManifoldMixup(Hook::Host& host, MixupOptions options) : Orchestrator(host, std::move(options)) {}

    protected:
        [[nodiscard]] torch::Tensor intercept(const torch::Tensor& output) override
        {
            auto& plan = active_plan();
            auto& state = plan.interception;
            ++state.firings;

            if (state.firings == 1) {
                mark_fired();
                state.first = output;
                state.nested_output = run_companion_pass(plan);
                TORCH_CHECK(state.second.defined(),
                            "The layer selected for mixup did not run during the companion pass.");
                return blend(plan.lam, output, state.second);
            }
            if (state.firings == 2) {
                state.second = output;
                return blend(plan.lam, output, state.first);
            }

            raise_reuse_warning();
            return output;
        }
    };
}

#endif //MANIFOLD_MIXUP_MANIFOLD_HPP
