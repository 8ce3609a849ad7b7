#include <optional>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

using Manifold::Test::expect;
using Manifold::Test::expect_throws;

int main() {
    using namespace Manifold;
    torch::manual_seed(11);

    const auto prediction = torch::randn({4, 3});
    const auto target = torch::randn({4, 3});

    {
        auto mse = Loss::make(Loss::MSE());
        expect(mse->reduction() == Loss::Reduction::Mean, "descriptor criteria expose their reduction");
        const auto expected = torch::mse_loss(prediction, target);
        expect(torch::allclose(mse->forward(prediction, target), expected), "plain targets use the configured reduction");

        mse->set_reduction(Loss::Reduction::Sum);
        expect(mse->reduction() == Loss::Reduction::Sum, "the reduction can be changed in place");
        expect(torch::allclose(mse->forward(prediction, target), (prediction - target).pow(2).sum()), "sum reduction adds every element");

        const auto per_element = mse->compute(prediction, target, Loss::Reduction::None);
        expect(per_element.sizes() == prediction.sizes(), "None keeps one loss per element");

        expect_throws<std::invalid_argument>(
            [&] { (void)mse->forward(prediction, Loss::MixedTarget{target, target, torch::ones({4})}); },
            "a plain criterion refuses mixed targets");
    }

    {
        std::vector<Loss::Reduction> seen;
        auto custom = Loss::make([&](const torch::Tensor& p, const torch::Tensor& t, Loss::Reduction reduction) {
            seen.push_back(reduction);
            return Loss::Details::apply_reduction((p - t).abs(), reduction);
        });
        expect(!custom->reduction().has_value(), "callables expose no reduction");
        expect_throws<std::logic_error>([&] { custom->set_reduction(Loss::Reduction::None); }, "callables cannot be reconfigured");

        Mixup::MixupLoss mixed(custom, Loss::Reduction::Mean);
        const auto value = mixed.forward(prediction, Loss::MixedTarget{target, target, torch::full({4}, 0.7F)});
        expect(value.numel() == 1, "mixed loss reduces to a scalar");
        expect(!seen.empty() && seen.back() == Loss::Reduction::None, "callables are asked for per-sample losses");
        expect(torch::allclose(value, (prediction - target).abs().mean()), "identical targets give the unmixed loss");
        expect(mixed.get_old() == custom, "the callable comes back untouched");

        expect_throws<std::invalid_argument>([] { (void)Loss::make(Loss::Callable{}); }, "empty callables are rejected");
    }

    {
        auto cross_entropy = Loss::make(Loss::CrossEntropy());
        Mixup::MixupLoss mixed(cross_entropy, Loss::Reduction::Mean);
        expect(cross_entropy->reduction() == Loss::Reduction::None, "wrapping forces the criterion to per-sample mode");
        expect(mixed.reduction() == Loss::Reduction::Mean, "the adapter keeps its own reduction");

        const auto logits = torch::randn({4, 5});
        const auto first = torch::tensor({0, 1, 2, 3}, torch::kLong);
        const auto second = torch::tensor({4, 3, 2, 1}, torch::kLong);
        const auto lam = torch::tensor({1.0F, 0.5F, 0.8F, 0.6F});

        const auto first_loss = torch::nn::functional::cross_entropy(
            logits, first, torch::nn::functional::CrossEntropyFuncOptions().reduction(torch::kNone));
        const auto second_loss = torch::nn::functional::cross_entropy(
            logits, second, torch::nn::functional::CrossEntropyFuncOptions().reduction(torch::kNone));
        const auto expected = (lam * first_loss + (1 - lam) * second_loss).mean();

        expect(torch::allclose(mixed.forward(logits, Loss::MixedTarget{first, second, lam}), expected),
               "mixed cross entropy weighs each target by its own lam");
        expect(torch::allclose(mixed.forward(logits, first), first_loss.mean()),
               "plain targets still train with the adapter in place");

        mixed.set_reduction(Loss::Reduction::Sum);
        expect(torch::allclose(mixed.forward(logits, Loss::MixedTarget{first, second, lam}),
                               (lam * first_loss + (1 - lam) * second_loss).sum()),
               "the adapter honours a sum reduction");
        mixed.set_reduction(Loss::Reduction::None);
        expect(mixed.forward(logits, Loss::MixedTarget{first, second, lam}).sizes() == lam.sizes(),
               "None returns the weighted per-sample losses");

        expect_throws<c10::Error>(
            [&] { (void)mixed.forward(logits, Loss::MixedTarget{first, second, torch::ones({3})}); },
            "a weight per sample is required");

        const auto restored = mixed.get_old();
        expect(restored == cross_entropy, "get_old hands back the same criterion");
        expect(cross_entropy->reduction() == Loss::Reduction::Mean, "get_old restores the original reduction");
        (void)mixed.get_old();
        expect(cross_entropy->reduction() == Loss::Reduction::Mean, "a second get_old is harmless");
    }

    {
        Loss::Slot slot;
        expect(!slot, "a default slot is empty");
        expect_throws<std::logic_error>([&] { Mixup::MixupLoss adapter(slot.get(), Loss::Reduction::Mean); },
                                        "the adapter needs a criterion");

        auto original = Loss::make(Loss::SmoothL1());
        slot.exchange(original);
        auto wrapper = std::make_shared<Mixup::MixupLoss>(slot.get(), Loss::Reduction::Mean);
        const auto previous = slot.exchange(wrapper);
        expect(previous == original && slot.get() == wrapper, "exchange installs the new criterion and returns the old one");
        slot.exchange(wrapper->get_old());
        expect(slot.get() == original, "the original criterion can be put back");
    }

    {
        Model model("losses");
        model.add(Layer::FC({3, 1, true}));
        model.set_loss(Loss::MAE());
        expect(model.has_loss(), "descriptors can be installed directly on the model");
        expect_throws<std::invalid_argument>([&] { model.set_loss(Loss::FunctionPtr{}); }, "empty criteria are rejected");
        const auto value = model.evaluate(torch::randn({6, 3}), torch::randn({6, 1}));
        expect(value >= 0.0, "evaluation reports a non-negative mean loss");
        expect(model.to_device(false).device().is_cpu(), "the model can be pinned to the CPU");
    }

    {
        Model model("failing_evaluation");
        model.add(Layer::FC({3, 1, true}));
        model.set_loss(Loss::make([](const torch::Tensor&, const torch::Tensor&, Loss::Reduction) -> torch::Tensor {
            throw std::runtime_error("criterion failed");
        }));
        model.train();
        expect_throws<std::runtime_error>([&] { (void)model.evaluate(torch::randn({4, 3}), torch::randn({4, 1})); },
                                          "a failing criterion propagates out of evaluation");
        expect(model.is_training(), "training mode is restored when evaluation throws");
    }

    return Manifold::Test::report("loss");
}
