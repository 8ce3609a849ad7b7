#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

using Manifold::Test::expect;
using Manifold::Test::expect_throws;

namespace {
    std::vector<std::string> names_of(const std::vector<Manifold::Hook::SitePtr>& sites) {
        std::vector<std::string> names;
        for (const auto& site : sites) {
            names.push_back(site->name());
        }
        return names;
    }

    void build_mixed_graph(Manifold::Model& model) {
        using namespace Manifold;
        model.add(Layer::FC({6, 8, true}, Activation::ReLU));
        model.add(Layer::BatchNorm1d({8}));
        model.add(Layer::Dropout({.probability = 0.1}));
        model.add(Block::Sequential({
            Layer::FC({8, 8, true}, Activation::Tanh),
            Layer::FC({8, 8, true})
        }));
        model.add(Layer::Mixup(Layer::FC({8, 8, true}, Activation::GeLU)));
        model.add(Layer::HardDropout({.probability = 0.1}));
        model.add(Layer::FC({8, 3, true}));
    }
}

int main() {
    namespace Details = Manifold::Mixup::Details;
    torch::manual_seed(7);

    Manifold::Model model("eligibility");
    build_mixed_graph(model);

    const auto sites = model.sites();
    const std::vector<std::string> expected_traversal{
        "eligibility", "fc_0", "batchnorm1d_1", "dropout_2",
        "sequential_block_3", "fc_3", "fc_4",
        "mixup_6", "fc_6",
        "hard_dropout_8", "fc_9"};
    expect(names_of(sites) == expected_traversal, "traversal is pre-order with containers before their children");

    {
        std::ostringstream log;
        const auto candidates = Details::select(sites, /*use_only_mixup_modules=*/false, &log);
        const std::vector<std::string> expected{"fc_0", "fc_3", "fc_4", "mixup_6", "fc_6", "fc_9"};
        expect(names_of(candidates) == expected, "untagged policy drops containers, normalization and dropout");
        expect(log.str().find("6 modules eligible for mixup") != std::string::npos, "candidate count is logged");
    }

    {
        std::ostringstream log;
        const auto candidates = Details::select(sites, /*use_only_mixup_modules=*/true, &log);
        expect(names_of(candidates) == std::vector<std::string>{"mixup_6"}, "tagged policy keeps explicit markers only");
    }

    {
        Manifold::Model recurrent("recurrent");
        recurrent.add(Manifold::Layer::LSTM({.input_size = 4, .hidden_size = 8}));
        recurrent.add(Manifold::Layer::GRU({.input_size = 8, .hidden_size = 8}));
        recurrent.add(Manifold::Layer::RNN({.input_size = 8, .hidden_size = 8}));
        recurrent.add(Manifold::Layer::BatchNorm2d({8}));
        std::ostringstream log;
        expect_throws<std::invalid_argument>(
            [&] { (void)Details::select(recurrent.sites(), false, &log); },
            "graph of recurrent and normalization layers has no candidate");
    }

    {
        Manifold::Model plain("plain");
        plain.add(Manifold::Layer::FC({4, 4, true}));
        std::ostringstream log;
        try {
            (void)Details::select(plain.sites(), true, &log);
            expect(false, "tagged policy on an unmarked graph must throw");
        } catch (const std::invalid_argument& error) {
            const std::string message = error.what();
            expect(message.find("use_only_mixup_modules") != std::string::npos
                   && message.find("Layer::Mixup") != std::string::npos,
                   "error names both remediations");
        }
        expect(log.str().empty(), "nothing is logged when selection fails");
    }

    {
        Manifold::Model residual("residual");
        residual.add(Manifold::Block::Residual(
            {Manifold::Layer::FC({4, 4, true}, Manifold::Activation::ReLU), Manifold::Layer::BatchNorm1d({4})},
            1,
            {.projection = Manifold::Layer::FC({4, 4, false})},
            {.final_activation = Manifold::Activation::ReLU}));
        const auto residual_sites = residual.sites();
        expect(names_of(residual_sites)
                   == std::vector<std::string>{"residual", "residual_block_0", "fc_0", "batchnorm1d_1", "fc_2"},
               "residual block lists branch layers then the projection");
        std::ostringstream log;
        const auto candidates = Details::select(residual_sites, false, &log);
        expect(names_of(candidates) == std::vector<std::string>{"residual_block_0", "fc_0", "fc_2"},
               "residual block output is itself a mixing point");
    }

    {
        std::ostringstream log;
        Manifold::Mixup::Options options{};
        options.stream = &log;
        options.use_only_mixup_modules = true;
        const auto callback = Manifold::Mixup::manifold_mixup(model, options);
        expect(callback->candidates().size() == 1, "binder selects the marker");
        expect(model.callbacks().size() == 1, "binder registers the callback on the model");
        expect(log.str().find("1 modules eligible for mixup") != std::string::npos, "binder logs through the configured stream");
    }

    {
        std::ostringstream log;
        auto options = Manifold::Test::quiet_options(log);
        options.alpha = 0.0;
        expect_throws<std::invalid_argument>([&] { Manifold::Mixup::ManifoldMixup mixup(model, options); }, "alpha of zero is rejected");
        options.alpha = -1.0;
        expect_throws<std::invalid_argument>([&] { Manifold::Mixup::ManifoldMixup mixup(model, options); }, "negative alpha is rejected");
        options.alpha = std::numeric_limits<double>::quiet_NaN();
        expect_throws<std::invalid_argument>([&] { Manifold::Mixup::InterleavedManifoldMixup mixup(model, options); }, "NaN alpha is rejected");
        options.alpha = 0.4;
        options.stream = nullptr;
        expect_throws<std::invalid_argument>([&] { Manifold::Mixup::ManifoldMixup mixup(model, options); }, "missing stream is rejected");
    }

    return Manifold::Test::report("eligibility");
}
