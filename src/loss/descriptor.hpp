#ifndef MANIFOLD_LOSS_DESCRIPTOR_HPP
#define MANIFOLD_LOSS_DESCRIPTOR_HPP

#include <variant>

#include "details/classification.hpp"
#include "details/reduction.hpp"
#include "details/regression.hpp"

namespace Manifold::Loss {
    using Reduction = Details::Reduction;

    using Descriptor = std::variant<
        Details::MSEDescriptor,
        Details::CrossEntropyDescriptor,
        Details::BCEWithLogitsDescriptor,
        Details::MAEDescriptor,
        Details::NegativeLogLikelihoodDescriptor,
        Details::SmoothL1Descriptor>;
}

#endif //MANIFOLD_LOSS_DESCRIPTOR_HPP
