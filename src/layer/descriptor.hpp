#ifndef MANIFOLD_LAYER_DESCRIPTOR_HPP
#define MANIFOLD_LAYER_DESCRIPTOR_HPP

#include <variant>

#include "details/batchnorm.hpp"
#include "details/conv.hpp"
#include "details/dropout.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/recurrent.hpp"

namespace Manifold::Layer {
    namespace Details {
        struct MixupDescriptor;
    }

    // MixupDescriptor wraps another descriptor, so it is completed in details/mixup.hpp.
    using Descriptor = std::variant<Details::FCDescriptor,
                                    Details::Conv2dDescriptor,
                                    Details::BatchNorm1dDescriptor,
                                    Details::BatchNorm2dDescriptor,
                                    Details::DropoutDescriptor,
                                    Details::HardDropoutDescriptor,
                                    Details::FlattenDescriptor,
                                    Details::RNNDescriptor,
                                    Details::LSTMDescriptor,
                                    Details::GRUDescriptor,
                                    Details::MixupDescriptor>;
}

#endif //MANIFOLD_LAYER_DESCRIPTOR_HPP
