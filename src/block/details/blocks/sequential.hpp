#ifndef MANIFOLD_BLOCK_DETAILS_SEQUENTIAL_HPP
#define MANIFOLD_BLOCK_DETAILS_SEQUENTIAL_HPP

#include <vector>
#include <torch/torch.h>

#include <stdexcept>
#include <string>
#include <utility>
#include "../../../common/hook.hpp"
#include "../../../layer/layer.hpp"

namespace Manifold::Block::Details {

    struct SequentialDescriptor {
        std::vector<::Manifold::Layer::Descriptor> layers{};
    };

    class SequentialBlockModuleImpl : public torch::nn::Module {
    public:
        explicit SequentialBlockModuleImpl(std::vector<::Manifold::Layer::Descriptor> layers, std::size_t index = 0)
        {
            if (layers.empty()) {
                throw std::invalid_argument("Sequential blocks require at least one layer descriptor.");
            }
            std::size_t module_index{index};
            block_layers_.reserve(layers.size());
            for (auto& descriptor : layers) {
                auto registered_layer = ::Manifold::Layer::Details::build_registered_layer(*this, descriptor, module_index++);
                block_layers_.push_back(std::move(registered_layer));
            }
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto output = std::move(input);
            for (auto& layer : block_layers_) {
                output = layer(std::move(output));
            }
            return output;
        }

        [[nodiscard]] std::vector<::Manifold::Hook::SitePtr> sites() const
        {
            std::vector<::Manifold::Hook::SitePtr> sites;
            sites.reserve(block_layers_.size());
            for (const auto& layer : block_layers_) {
                sites.push_back(layer.site);
            }
            return sites;
        }

    private:
        std::vector<::Manifold::Layer::Details::RegisteredLayer> block_layers_{};
    };

    TORCH_MODULE(SequentialBlockModule);

    template <class Owner>
    ::Manifold::Layer::Details::RegisteredLayer build_registered_layer(Owner& owner, const SequentialDescriptor& descriptor, std::size_t index)
    {
        auto module = owner.register_module("sequential_block_" + std::to_string(index), SequentialBlockModule(descriptor.layers, index));
        auto registered_layer = ::Manifold::Layer::Details::make_registered_layer(module, "sequential_block", index,
                                                                                  ::Manifold::Hook::Tag::NonMixable,
                                                                                  ::Manifold::Activation::Type::Identity);
        for (auto& site : module->sites()) {
            registered_layer.site->add_child(std::move(site));
        }
        return registered_layer;
    }

}

#endif // MANIFOLD_BLOCK_DETAILS_SEQUENTIAL_HPP
