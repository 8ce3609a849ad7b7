#ifndef MANIFOLD_LOSS_HPP
#define MANIFOLD_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include "descriptor.hpp"
#include "details/function.hpp"

namespace Manifold::Loss {
    using MSEOptions = Details::MSEOptions;
    using MAEOptions = Details::MAEOptions;
    using SmoothL1Options = Details::SmoothL1Options;
    using CrossEntropyOptions = Details::CrossEntropyOptions;
    using BCEWithLogitsOptions = Details::BCEWithLogitsOptions;
    using NegativeLogLikelihoodOptions = Details::NegativeLogLikelihoodOptions;

    [[nodiscard]] inline auto MSE(const MSEOptions& options = {}) -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto CrossEntropy(const CrossEntropyOptions& options = {}) -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto BCEWithLogits(const BCEWithLogitsOptions& options = {}) -> Details::BCEWithLogitsDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto NegativeLogLikelihood(const NegativeLogLikelihoodOptions& options = {}) -> Details::NegativeLogLikelihoodDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto MAE(const MAEOptions& options = {}) -> Details::MAEDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto SmoothL1(const SmoothL1Options& options = {}) -> Details::SmoothL1Descriptor {
        return {options};
    }

    [[nodiscard]] inline auto make(Descriptor descriptor) -> FunctionPtr {
        return std::make_shared<Details::DescriptorFunction>(std::move(descriptor));
    }

    [[nodiscard]] inline auto make(Callable callable) -> FunctionPtr {
        return std::make_shared<Details::CallableFunction>(std::move(callable));
    }
}

#endif //MANIFOLD_LOSS_HPP
