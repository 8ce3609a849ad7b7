#ifndef MANIFOLD_MIXUP_OPTIONS_HPP
#define MANIFOLD_MIXUP_OPTIONS_HPP

#include <cmath>
#include <iostream>
#include <ostream>
#include <stdexcept>

#include "../../loss/loss.hpp"

namespace Manifold::Mixup::Details {
    struct MixupOptions {
        double alpha{0.4};                   // concentration of Beta(alpha, alpha)
        bool use_input_mixup{true};          // the input itself may be the mixing point
        bool use_symmetric_batch{true};      // keep both mixed outputs, doubling the batch
        bool use_only_mixup_modules{false};  // restrict to layers wrapped with Layer::Mixup
        Loss::Reduction reduction{Loss::Reduction::Mean};
        std::ostream* stream{&std::cout};
    };

    inline void validate(const MixupOptions& options)
    {
        if (!std::isfinite(options.alpha) || options.alpha <= 0.0) {
            throw std::invalid_argument("Mixup alpha must be a finite value greater than zero.");
        }
        if (options.stream == nullptr) {
            throw std::invalid_argument("Mixup requires a diagnostic stream.");
        }
    }
}

#endif //MANIFOLD_MIXUP_OPTIONS_HPP
