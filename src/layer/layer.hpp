#ifndef MANIFOLD_LAYER_HPP
#define MANIFOLD_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include "descriptor.hpp"
#include "details/mixup.hpp"
#include "registry.hpp"

namespace Manifold::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using Conv2dDescriptor = Details::Conv2dDescriptor;

    using BatchNorm1dOptions = Details::BatchNorm1dOptions;
    using BatchNorm1dDescriptor = Details::BatchNorm1dDescriptor;
    using BatchNorm2dOptions = Details::BatchNorm2dOptions;
    using BatchNorm2dDescriptor = Details::BatchNorm2dDescriptor;

    using DropoutOptions = Details::DropoutOptions;
    using DropoutDescriptor = Details::DropoutDescriptor;
    using HardDropoutOptions = Details::HardDropoutOptions;
    using HardDropoutDescriptor = Details::HardDropoutDescriptor;

    using FlattenOptions = Details::FlattenOptions;
    using FlattenDescriptor = Details::FlattenDescriptor;

    using RNNOptions = Details::RNNOptions;
    using RNNDescriptor = Details::RNNDescriptor;

    using LSTMOptions = Details::LSTMOptions;
    using LSTMDescriptor = Details::LSTMDescriptor;

    using GRUOptions = Details::GRUOptions;
    using GRUDescriptor = Details::GRUDescriptor;

    //NB: this is a marker, not a computation
    using MixupDescriptor = Details::MixupDescriptor;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity,
                                 ::Manifold::Initialization::Descriptor initialization = ::Manifold::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Conv2d(const Conv2dOptions& options,
                                     ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity,
                                     ::Manifold::Initialization::Descriptor initialization = ::Manifold::Initialization::Default) -> Conv2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto BatchNorm1d(const BatchNorm1dOptions& options,
                                          ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity,
                                          ::Manifold::Initialization::Descriptor initialization = ::Manifold::Initialization::Default) -> BatchNorm1dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto BatchNorm2d(const BatchNorm2dOptions& options,
                                          ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity,
                                          ::Manifold::Initialization::Descriptor initialization = ::Manifold::Initialization::Default) -> BatchNorm2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options = {},
                                      ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity) -> DropoutDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto HardDropout(const HardDropoutOptions& options = {},
                                          ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity) -> HardDropoutDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto Flatten(const FlattenOptions& options = {},
                                      ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity) -> FlattenDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto RNN(const RNNOptions& options,
                                  ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity) -> RNNDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto LSTM(const LSTMOptions& options,
                                   ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity) -> LSTMDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto GRU(const GRUOptions& options,
                                  ::Manifold::Activation::Descriptor activation = ::Manifold::Activation::Identity) -> GRUDescriptor {
        return {options, activation};
    }

    [[nodiscard]] inline auto Mixup(Descriptor layer) -> MixupDescriptor {
        return {std::make_shared<const Descriptor>(std::move(layer))};
    }
}

#endif //MANIFOLD_LAYER_HPP
