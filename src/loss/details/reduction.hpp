#ifndef MANIFOLD_LOSS_REDUCTION_HPP
#define MANIFOLD_LOSS_REDUCTION_HPP

#include <optional>
#include <type_traits>

#include <torch/torch.h>

namespace Manifold::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    // Use: to_torch_reduction<torch::nn::functional::MSELossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::None: return RT{torch::kNone};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

    // A per-call override wins over the reduction configured on the criterion.
    [[nodiscard]] inline Reduction resolve_reduction(Reduction configured, std::optional<Reduction> requested) noexcept {
        return requested.value_or(configured);
    }

}

#endif // MANIFOLD_LOSS_REDUCTION_HPP
