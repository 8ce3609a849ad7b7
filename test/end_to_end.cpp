#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

using Manifold::Test::expect;
using Manifold::Test::expect_throws;

namespace {
    using namespace Manifold;

    // Tagged-only mixup on a small classifier, driven batch by batch.
    void tagged_classifier(bool symmetric)
    {
        std::ostringstream log;
        Model model("tagged");
        Test::build_tagged_classifier(model, 5, 3);
        model.set_loss(Loss::CrossEntropy());

        auto options = Test::quiet_options(log);
        options.use_input_mixup = false;
        options.use_only_mixup_modules = true;
        options.use_symmetric_batch = symmetric;
        auto mixup = Mixup::manifold_mixup(model, options);

        const auto original = model.loss_slot().get();
        mixup->on_train_begin(model.loss_slot());

        const auto expected_rows = symmetric ? 8 : 4;
        for (int batch = 0; batch < 5; ++batch) {
            const auto x = torch::randn({4, 5});
            const auto labels = torch::randint(0, 3, {4}, torch::kLong);
            auto update = mixup->on_batch_begin(x, labels, true);
            expect(mixup->plan()->module_index == 0, "the marker is always the mixing point");

            const auto& target = std::get<Loss::MixedTarget>(update->target);
            expect(target.first.size(0) == expected_rows && target.second.size(0) == expected_rows
                   && target.lam.size(0) == expected_rows, "mixed targets match the loss batch");

            auto output = model.forward(update->input);
            if (auto replaced = mixup->on_loss_begin(output, true)) {
                output = std::move(*replaced);
            }
            expect(output.size(0) == expected_rows, "the loss sees as many rows as targets");
            expect(Test::installed_hooks(model) == 0, "no interceptor outlives the forward pass");

            const auto loss = model.loss_slot().get()->forward(output, update->target);
            expect(loss.dim() == 0 && std::isfinite(loss.item<double>()), "the loss is a finite scalar");
        }

        mixup->on_train_end(model.loss_slot());
        expect(model.loss_slot().get() == original, "the slot holds the original criterion again");
    }

    // alpha near zero keeps lam at one, so mixup degenerates to plain training.
    void degenerate_alpha()
    {
        std::ostringstream log;
        Test::IdentityHost host;
        auto options = Test::quiet_options(log);
        options.alpha = 1e-6;
        options.use_input_mixup = true;
        Mixup::ManifoldMixup mixup(host, options);

        const auto x = torch::randn({8, 3});
        const auto y = torch::randn({8, 3});
        for (int batch = 0; batch < 20; ++batch) {
            auto update = mixup.on_batch_begin(x, y, true);
            const auto lam = mixup.plan()->lam;
            expect(lam.min().item<float>() >= 0.999F, "lam collapses onto one");
            if (mixup.state() == Mixup::State::InputMixupApplied) {
                expect(torch::allclose(update->input, x, 1e-4, 1e-4), "the mixed input is the original input");
                continue;
            }
            const auto output = host.forward(update->input);
            expect(torch::allclose(output, x, 1e-4, 1e-4), "the intercepted output is the plain output");
            (void)mixup.on_loss_begin(output, true);
        }
    }

    void full_training_run()
    {
        std::ostringstream log;
        Model model("trainer");
        model.add(Layer::FC({4, 16, true}, Activation::ReLU, Initialization::KaimingUniform));
        model.add(Block::Residual({Layer::FC({16, 16, true}, Activation::ReLU), Layer::FC({16, 16, true})},
                                  1, {}, {.final_activation = Activation::ReLU}));
        model.add(Layer::Dropout({.probability = 0.1}));
        model.add(Layer::FC({16, 2, true}));
        model.set_loss(Loss::CrossEntropy());
        model.set_optimizer(Optimizer::Adam({.learning_rate = 1e-2}));

        auto options = Test::quiet_options(log);
        auto mixup = Mixup::manifold_mixup(model, options);
        const auto original = model.loss_slot().get();

        const auto inputs = torch::randn({64, 4});
        const auto labels = (inputs.sum(1) > 0).to(torch::kLong);
        const auto validation_inputs = torch::randn({16, 4});
        const auto validation_labels = (validation_inputs.sum(1) > 0).to(torch::kLong);

        const auto before = model.evaluate(validation_inputs, validation_labels);

        TrainOptions train_options{};
        train_options.epoch = 2;
        train_options.batch_size = 8;
        train_options.validation = std::make_pair(validation_inputs, validation_labels);
        train_options.stream = &log;
        model.train(inputs, labels, train_options);

        const auto text = log.str();
        expect(text.find("eligible for mixup") != std::string::npos, "candidate selection is logged");
        expect(Test::count_occurrences(text, "Epoch [") == 2, "each epoch is logged");
        expect(model.loss_slot().get() == original, "training leaves the original criterion in place");
        expect(original->reduction() == Loss::Reduction::Mean, "the original reduction survives training");
        expect(Test::installed_hooks(model) == 0, "no hooks remain after training");
        expect(mixup->state() == Mixup::State::Idle, "the callback ends idle");
        expect(model.is_training(), "the model is left in training mode");

        const auto after = model.evaluate(validation_inputs, validation_labels);
        expect(std::isfinite(before) && std::isfinite(after), "evaluation stays finite");
    }

    void failing_loss_cleans_up()
    {
        std::ostringstream log;
        Model model("failing");
        model.add(Layer::FC({3, 6, true}, Activation::Tanh));
        model.add(Layer::FC({6, 3, true}));
        int calls = 0;
        model.set_loss([&](const torch::Tensor& prediction, const torch::Tensor& target, Loss::Reduction reduction) {
            if (++calls > 3) {
                throw std::runtime_error("loss exploded");
            }
            return Loss::Details::apply_reduction((prediction - target).pow(2), reduction);
        });
        model.set_optimizer(Optimizer::SGD({.learning_rate = 1e-2}));
        const auto original = model.loss_slot().get();

        auto options = Test::quiet_options(log);
        options.use_input_mixup = false;
        (void)Mixup::manifold_mixup(model, options);

        TrainOptions train_options{};
        train_options.epoch = 3;
        train_options.batch_size = 4;
        train_options.stream = &log;
        expect_throws<std::runtime_error>([&] { model.train(torch::randn({16, 3}), torch::randn({16, 3}), train_options); },
                                          "loss failures reach the caller");
        expect(log.str().find("Training aborted: loss exploded") != std::string::npos, "the failure is logged");
        expect(model.loss_slot().get() == original, "the slot is restored after a failure");
        expect(Test::installed_hooks(model) == 0, "no interceptor survives a failed run");
    }

    void training_without_mixup_is_unchanged()
    {
        torch::manual_seed(5);
        Model plain("plain");
        plain.add(Layer::FC({3, 2, true}));
        torch::manual_seed(5);
        Model mixed("mixed");
        mixed.add(Layer::FC({3, 2, true}));

        std::ostringstream log;
        auto options = Test::quiet_options(log);
        options.alpha = 1e-6;
        options.use_input_mixup = false;
        auto mixup = Mixup::manifold_mixup(mixed, options);
        Loss::Slot slot{Loss::make(Loss::MSE())};
        mixup->on_train_begin(slot);

        const auto x = torch::randn({4, 3});
        auto update = mixup->on_batch_begin(x, torch::randn({4, 2}), true);
        const auto mixed_output = mixed.forward(update->input);
        (void)mixup->on_loss_begin(mixed_output, true);
        expect(torch::allclose(mixed_output, plain.forward(x), 1e-4, 1e-4), "lam of one reproduces the plain forward pass");
        mixup->on_train_end(slot);
    }
}

int main() {
    torch::manual_seed(17);
    tagged_classifier(/*symmetric=*/true);
    tagged_classifier(/*symmetric=*/false);
    degenerate_alpha();
    full_training_run();
    failing_loss_cleans_up();
    training_without_mixup_is_unchanged();
    return Manifold::Test::report("end_to_end");
}
