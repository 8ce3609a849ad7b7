#ifndef MANIFOLD_ADAM_HPP
#define MANIFOLD_ADAM_HPP

#include <stdexcept>
#include <string>
#include <tuple>
#include <torch/torch.h>

namespace Manifold::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    namespace Detail {
        // Adam and AdamW share every knob; only the torch options type and the decay default differ.
        template <class TorchOptions, class Options>
        TorchOptions adam_family_options(const Options& options, const char* name)
        {
            if (!(options.learning_rate > 0.0))
                throw std::invalid_argument(std::string(name) + " learning rate must be positive.");
            if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0)
                throw std::invalid_argument(std::string(name) + " betas must lie in [0, 1).");
            if (options.weight_decay < 0.0)
                throw std::invalid_argument(std::string(name) + " weight decay must be non-negative.");
            return TorchOptions(options.learning_rate)
                .betas(std::make_tuple(options.beta1, options.beta2))
                .eps(options.eps)
                .weight_decay(options.weight_decay)
                .amsgrad(options.amsgrad);
        }
    }

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        return Detail::adam_family_options<torch::optim::AdamOptions>(options, "Adam");
    }

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        return Detail::adam_family_options<torch::optim::AdamWOptions>(options, "AdamW");
    }
}

#endif //MANIFOLD_ADAM_HPP
