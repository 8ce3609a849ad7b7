#ifndef MANIFOLD_CONV_HPP
#define MANIFOLD_CONV_HPP
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"

namespace Manifold::Layer::Details {

    struct Conv2dOptions {
        enum class Padding {
            Zeros,
            Reflect,
            Replicate,
            Circular
        };
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        std::int64_t groups{1};
        bool bias{true};
        Padding padding_mode{Padding::Zeros};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Manifold::Activation::Descriptor activation{::Manifold::Activation::Identity};
        ::Manifold::Initialization::Descriptor initialization{::Manifold::Initialization::Default};
    };

    namespace Detail {
        // A single value applies to both spatial axes.
        [[nodiscard]] inline torch::ExpandingArray<2> spatial_pair(const std::vector<std::int64_t>& values, const char* field)
        {
            if (values.size() == 1) {
                return torch::ExpandingArray<2>(values.front());
            }
            if (values.size() != 2) {
                throw std::invalid_argument(std::string("Conv2d ") + field + " expects one or two values.");
            }
            return torch::ExpandingArray<2>(values);
        }

        [[nodiscard]] inline torch::nn::detail::conv_padding_mode_t to_torch_padding(Conv2dOptions::Padding mode)
        {
            switch (mode) {
                case Conv2dOptions::Padding::Reflect:
                    return torch::kReflect;
                case Conv2dOptions::Padding::Replicate:
                    return torch::kReplicate;
                case Conv2dOptions::Padding::Circular:
                    return torch::kCircular;
                case Conv2dOptions::Padding::Zeros:
                default:
                    return torch::kZeros;
            }
        }
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const Conv2dDescriptor& descriptor, std::size_t index)
    {
        const auto& options = descriptor.options;
        if (options.in_channels <= 0 || options.out_channels <= 0) {
            throw std::invalid_argument("Conv2d layers require positive channel counts.");
        }
        if (options.groups <= 0 || options.in_channels % options.groups != 0 || options.out_channels % options.groups != 0) {
            throw std::invalid_argument("Conv2d groups must divide both channel counts.");
        }

        torch::nn::Conv2d conv(torch::nn::Conv2dOptions(options.in_channels,
                                                        options.out_channels,
                                                        Detail::spatial_pair(options.kernel_size, "kernel_size"))
                                   .stride(Detail::spatial_pair(options.stride, "stride"))
                                   .padding(Detail::spatial_pair(options.padding, "padding"))
                                   .dilation(Detail::spatial_pair(options.dilation, "dilation"))
                                   .groups(options.groups)
                                   .bias(options.bias)
                                   .padding_mode(Detail::to_torch_padding(options.padding_mode)));
        ::Manifold::Initialization::Details::apply_module_initialization(conv, descriptor.initialization);

        return register_layer(owner, "conv2d", index, ::Manifold::Hook::Tag::Mixable, descriptor.activation.type, std::move(conv));
    }

}

#endif //MANIFOLD_CONV_HPP
