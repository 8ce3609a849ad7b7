#ifndef MANIFOLD_MIXUP_HPP
#define MANIFOLD_MIXUP_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <concepts>
#include <memory>
#include <utility>

#include "../common/hook.hpp"
#include "details/interleaved.hpp"
#include "details/manifold.hpp"
#include "details/orchestrator.hpp"

namespace Manifold::Mixup {
    using Options = Details::MixupOptions;
    using State = Details::State;
    using Plan = Details::Plan;
    using MixupLoss = Details::MixupLoss;

    using ManifoldMixup = Details::ManifoldMixup;
    using InterleavedManifoldMixup = Details::InterleavedManifoldMixup;

    template <class Model>
        requires std::derived_from<Model, Hook::Host>
    auto manifold_mixup(Model& model, Options options = {}) -> std::shared_ptr<ManifoldMixup> {
        auto callback = std::make_shared<ManifoldMixup>(model, std::move(options));
        model.add_callback(callback);
        return callback;
    }

    template <class Model>
        requires std::derived_from<Model, Hook::Host>
    auto interleaved_manifold_mixup(Model& model, Options options = {}) -> std::shared_ptr<InterleavedManifoldMixup> {
        auto callback = std::make_shared<InterleavedManifoldMixup>(model, std::move(options));
        model.add_callback(callback);
        return callback;
    }
}

#endif //MANIFOLD_MIXUP_HPP
