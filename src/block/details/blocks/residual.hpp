#ifndef MANIFOLD_BLOCK_DETAILS_RESIDUAL_HPP
#define MANIFOLD_BLOCK_DETAILS_RESIDUAL_HPP

#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <torch/torch.h>

#include "../../../activation/activation.hpp"
#include "../../../activation/apply.hpp"
#include "../../../common/hook.hpp"
#include "../../../layer/layer.hpp"

namespace Manifold::Block::Details {
    struct ResidualSkipOptions {
        std::optional<::Manifold::Layer::Descriptor> projection{};
    };

    struct ResidualOutputOptions {
        ::Manifold::Activation::Descriptor final_activation{::Manifold::Activation::Identity};
        double dropout{0.0};
    };

    struct ResidualDescriptor {
        std::vector<::Manifold::Layer::Descriptor> layers{};
        std::size_t repeats{1};
        ResidualSkipOptions skip{};
        ResidualOutputOptions output{};
    };

    class ResidualBlockImpl : public torch::nn::Module {
    public:
        explicit ResidualBlockImpl(ResidualDescriptor descriptor, std::size_t index = 0)
            : final_activation_(descriptor.output.final_activation.type)
        {
            if (descriptor.layers.empty()) {
                throw std::invalid_argument("Residual blocks require at least one layer descriptor.");
            }
            if (descriptor.repeats == 0) {
                throw std::invalid_argument("Residual blocks require a positive repeat count.");
            }
            if (descriptor.output.dropout < 0.0 || descriptor.output.dropout >= 1.0) {
                throw std::invalid_argument("Residual block dropout must lie in [0, 1).");
            }

            std::size_t module_index = index;
            block_layers_.reserve(descriptor.repeats);
            for (std::size_t repeat = 0; repeat < descriptor.repeats; ++repeat) {
                std::vector<::Manifold::Layer::Details::RegisteredLayer> registered_layers{};
                registered_layers.reserve(descriptor.layers.size());
                for (const auto& layer_descriptor : descriptor.layers) {
                    registered_layers.push_back(::Manifold::Layer::Details::build_registered_layer(
                        *this, layer_descriptor, module_index++));
                }
                block_layers_.emplace_back(std::move(registered_layers));
            }

            if (descriptor.skip.projection.has_value()) {
                projection_layer_ = ::Manifold::Layer::Details::build_registered_layer(
                    *this, *descriptor.skip.projection, module_index++);
            }

            if (descriptor.output.dropout > 0.0) {
                dropout_ = register_module(
                    "dropout",
                    torch::nn::Dropout(torch::nn::DropoutOptions(descriptor.output.dropout)));
            }
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto output = std::move(input);
            for (const auto& layers : block_layers_) {
                auto branch = output;
                for (const auto& layer : layers) {
                    branch = layer(std::move(branch));
                }

                // The projection runs once per repeat, so its site fires `repeats` times.
                auto skip_connection = projection_layer_ ? (*projection_layer_)(output) : output;

                if (branch.sizes() != skip_connection.sizes()) {
                    std::ostringstream message;
                    message << "Residual block skip connection shape mismatch: branch output " << branch.sizes()
                            << " vs. skip connection " << skip_connection.sizes()
                            << ". Consider providing a projection layer or adjusting the block configuration.";
                    throw std::runtime_error(message.str());
                }

                branch = std::move(branch) + std::move(skip_connection);
                branch = ::Manifold::Activation::Details::apply(final_activation_, std::move(branch));
                if (dropout_) {
                    branch = dropout_->forward(branch);
                }

                output = std::move(branch);
            }

            return output;
        }

        // Branch layers in execution order, then the projection.
        [[nodiscard]] std::vector<::Manifold::Hook::SitePtr> sites() const
        {
            std::vector<::Manifold::Hook::SitePtr> sites;
            for (const auto& layers : block_layers_) {
                for (const auto& layer : layers) {
                    sites.push_back(layer.site);
                }
            }
            if (projection_layer_.has_value()) {
                sites.push_back(projection_layer_->site);
            }
            return sites;
        }

    private:
        std::vector<std::vector<::Manifold::Layer::Details::RegisteredLayer>> block_layers_{};
        std::optional<::Manifold::Layer::Details::RegisteredLayer> projection_layer_{};
        ::Manifold::Activation::Type final_activation_{::Manifold::Activation::Type::Identity};
        torch::nn::Dropout dropout_{nullptr};
    };

    TORCH_MODULE(ResidualBlock);

    template <class Owner>
    ::Manifold::Layer::Details::RegisteredLayer build_registered_layer(Owner& owner, const ResidualDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module("residual_block_" + std::to_string(index), ResidualBlock(descriptor, index));
        auto registered_layer = ::Manifold::Layer::Details::make_registered_layer(module, "residual_block", index,
                                                                                  ::Manifold::Hook::Tag::Mixable,
                                                                                  ::Manifold::Activation::Type::Identity);
        for (auto& site : module->sites()) {
            registered_layer.site->add_child(std::move(site));
        }
        return registered_layer;
    }
}
#endif // MANIFOLD_BLOCK_DETAILS_RESIDUAL_HPP
