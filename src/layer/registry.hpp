#ifndef MANIFOLD_LAYER_REGISTRY_HPP
#define MANIFOLD_LAYER_REGISTRY_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <type_traits>
#include <utility>
#include <stdexcept>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../common/hook.hpp"


namespace Manifold::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    struct RegisteredLayer {
        struct ForwardBinding {
            using Invoker = torch::Tensor (*)(void*, torch::Tensor);

            Invoker invoke{nullptr};
            void* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            torch::Tensor operator()(torch::Tensor input) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty forward binding.");
                }
                return invoke(context, std::move(input));
            }
        };

        template <class Module>
        void bind_module_forward(Module* module)
        {
            forward = ForwardBinding{&dispatch_module<Module>, module};
        }

        // Layer, then activation, then any observer installed on the site.
        torch::Tensor operator()(torch::Tensor input) const
        {
            auto output = forward(std::move(input));
            output = ::Manifold::Activation::Details::apply(activation, std::move(output));
            if (site) {
                output = site->dispatch(std::move(output));
            }
            return output;
        }

        ForwardBinding forward{};
        ::Manifold::Activation::Type activation{::Manifold::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        ::Manifold::Hook::SitePtr site{};

    private:
        template <class Module>
        static torch::Tensor dispatch_module(void* context, torch::Tensor input)
        {
            auto* module = static_cast<Module*>(context);
            return module->forward(std::move(input));
        }
    };

    template <class Holder>
    [[nodiscard]] RegisteredLayer make_registered_layer(const Holder& module,
                                                        std::string kind,
                                                        std::size_t index,
                                                        ::Manifold::Hook::Tag tag,
                                                        ::Manifold::Activation::Type activation)
    {
        RegisteredLayer registered_layer{};
        registered_layer.activation = activation;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.site = ::Manifold::Hook::Site::make(kind + "_" + std::to_string(index), kind, tag);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }

    // Registers `holder` on `owner` as "<kind>_<index>" and gives it a site of the same name.
    template <class Owner, class Holder>
    [[nodiscard]] RegisteredLayer register_layer(Owner& owner,
                                                 const std::string& kind,
                                                 std::size_t index,
                                                 ::Manifold::Hook::Tag tag,
                                                 ::Manifold::Activation::Type activation,
                                                 Holder holder)
    {
        auto module = owner.register_module(kind + "_" + std::to_string(index), std::move(holder));
        return make_registered_layer(module, kind, index, tag, activation);
    }

    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, std::size_t) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
        return {};
    }


    template <class Owner, class... DescriptorTypes>
    RegisteredLayer build_registered_layer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor, std::size_t index) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(owner, concrete_descriptor, index);
            },
            descriptor);
    }

}

#endif // MANIFOLD_LAYER_REGISTRY_HPP
