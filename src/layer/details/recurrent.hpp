#ifndef MANIFOLD_RECURRENT_HPP
#define MANIFOLD_RECURRENT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Manifold::Layer::Details {

    // -------- Options --------
    struct RNNOptions {
        enum class Nonlinearity {
            Tanh,
            ReLU
        };
        std::int64_t input_size{};
        std::int64_t hidden_size{};
        std::int64_t num_layers{1};
        double dropout{0.0};
        bool batch_first{true};
        bool bidirectional{false};
        Nonlinearity nonlinearity{Nonlinearity::Tanh};
    };

    struct LSTMOptions {
        std::int64_t input_size{};
        std::int64_t hidden_size{};
        std::int64_t num_layers{1};
        double dropout{0.0};
        bool batch_first{true};
        bool bidirectional{false};
        bool bias{true};
    };

    using GRUOptions = LSTMOptions;

    // -------- Descriptors --------
    struct RNNDescriptor {
        RNNOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
    };

    struct LSTMDescriptor {
        LSTMOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
    };

    struct GRUDescriptor {
        GRUOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
    };

    namespace Detail {
        // Shape settings common to the three recurrent families.
        template <class TorchOptions, class Options>
        [[nodiscard]] TorchOptions recurrent_options(const Options& options, const char* name)
        {
            if (options.input_size <= 0 || options.hidden_size <= 0) {
                throw std::invalid_argument(std::string(name) + " requires positive input and hidden sizes.");
            }
            if (options.num_layers <= 0) {
                throw std::invalid_argument(std::string(name) + " requires at least one layer.");
            }
            if (options.dropout < 0.0 || options.dropout >= 1.0) {
                throw std::invalid_argument(std::string(name) + " dropout must lie in [0, 1).");
            }
            return TorchOptions(options.input_size, options.hidden_size)
                .num_layers(options.num_layers)
                .dropout(options.dropout)
                .batch_first(options.batch_first)
                .bidirectional(options.bidirectional);
        }

        [[nodiscard]] inline torch::nn::RNNOptions to_torch_options(const RNNOptions& options)
        {
            auto torch_options = recurrent_options<torch::nn::RNNOptions>(options, "RNN");
            if (options.nonlinearity == RNNOptions::Nonlinearity::ReLU) {
                torch_options.nonlinearity(torch::kReLU);
            } else {
                torch_options.nonlinearity(torch::kTanh);
            }
            return torch_options;
        }

        [[nodiscard]] inline torch::nn::LSTMOptions to_torch_lstm_options(const LSTMOptions& options)
        {
            return recurrent_options<torch::nn::LSTMOptions>(options, "LSTM").bias(options.bias);
        }

        [[nodiscard]] inline torch::nn::GRUOptions to_torch_gru_options(const GRUOptions& options)
        {
            return recurrent_options<torch::nn::GRUOptions>(options, "GRU").bias(options.bias);
        }
    }

    // Keeps the sequence output and drops the hidden state(s).
    template <class Recurrent>
    class SequenceOutputImpl : public torch::nn::Module {
    public:
        template <class Options>
        explicit SequenceOutputImpl(const Options& options)
            : recurrent_(register_module("recurrent", Recurrent(options))) {}

        torch::Tensor forward(torch::Tensor input)
        {
            TORCH_CHECK(input.dim() == 3, "Recurrent layers expect a 3D tensor [B,T,F] or [T,B,F], got ", input.sizes(), ".");
            return std::get<0>(recurrent_->forward(input));
        }

    private:
        Recurrent recurrent_{nullptr};
    };

    class RNNLayerImpl : public SequenceOutputImpl<torch::nn::RNN> {
    public:
        explicit RNNLayerImpl(const RNNOptions& options) : SequenceOutputImpl(Detail::to_torch_options(options)) {}
    };
    TORCH_MODULE(RNNLayer);

    class LSTMLayerImpl : public SequenceOutputImpl<torch::nn::LSTM> {
    public:
        explicit LSTMLayerImpl(const LSTMOptions& options) : SequenceOutputImpl(Detail::to_torch_lstm_options(options)) {}
    };
    TORCH_MODULE(LSTMLayer);

    class GRULayerImpl : public SequenceOutputImpl<torch::nn::GRU> {
    public:
        explicit GRULayerImpl(const GRUOptions& options) : SequenceOutputImpl(Detail::to_torch_gru_options(options)) {}
    };
    TORCH_MODULE(GRULayer);

    // Hidden state couples samples across time steps, so recurrent layers never host a mixup.
    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const RNNDescriptor& descriptor, std::size_t index)
    {
        return register_layer(owner, "rnn", index, ::Manifold::Hook::Tag::NonMixable, descriptor.activation.type,
                              RNNLayer(descriptor.options));
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const LSTMDescriptor& descriptor, std::size_t index)
    {
        return register_layer(owner, "lstm", index, ::Manifold::Hook::Tag::NonMixable, descriptor.activation.type,
                              LSTMLayer(descriptor.options));
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const GRUDescriptor& descriptor, std::size_t index)
    {
        return register_layer(owner, "gru", index, ::Manifold::Hook::Tag::NonMixable, descriptor.activation.type,
                              GRULayer(descriptor.options));
    }

}

#endif //MANIFOLD_RECURRENT_HPP
