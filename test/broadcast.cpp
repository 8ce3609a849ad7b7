#include <vector>

#include <torch/torch.h>

#include "common.hpp"

using Manifold::Test::expect;
using Manifold::Test::expect_throws;

int main() {
    namespace Details = Manifold::Mixup::Details;

    const auto lam = torch::tensor({0.5F, 0.75F, 1.0F, 0.6F});

    {
        const auto activation = torch::randn({4, 3, 2});
        const auto adapted = Details::adapt_dim(lam, activation);
        expect(adapted.sizes() == std::vector<std::int64_t>({4, 1, 1}), "weight gains two trailing singleton dimensions");
        expect(torch::equal(adapted.flatten(), lam), "values are preserved by the reshape");
        expect((adapted * activation).sizes() == activation.sizes(), "adapted weight broadcasts onto the activation");
    }

    {
        const auto loss = torch::rand({4});
        expect(Details::adapt_dim(lam, loss).sizes() == lam.sizes(), "same-rank target leaves the weight untouched");
    }

    {
        const auto image = torch::randn({4, 3, 8, 8});
        expect(Details::adapt_dim(lam, image).dim() == 4, "weight follows the rank of an image batch");
    }

    expect_throws<c10::Error>([&] { (void)Details::adapt_dim(lam, torch::tensor(1.0F)); },
                              "rank-0 target is rejected");
    expect_throws<c10::Error>([&] { (void)Details::adapt_dim(torch::ones({4, 2}), torch::ones({4})); },
                              "weight of higher rank than the target is rejected");

    {
        const auto own = torch::full({4, 2}, 2.0F);
        const auto companion = torch::zeros({4, 2});
        const auto mixed = Details::blend(lam, own, companion);
        const auto expected = (lam * 2.0F).unsqueeze(1).expand({4, 2});
        expect(torch::allclose(mixed, expected), "blend weighs the own sample by lam");

        const auto untouched = Details::blend(torch::ones({4}), own, companion);
        expect(torch::equal(untouched, own), "lam of one keeps the own sample");
    }

    {
        const auto own = torch::ones({4, 2}, torch::kFloat64);
        const auto mixed = Details::blend(lam, own, torch::zeros({4, 2}, torch::kFloat64));
        expect(mixed.scalar_type() == torch::kFloat64, "blend keeps the dtype of the mixed tensors");
    }

    expect_throws<c10::Error>([&] { (void)Details::blend(lam, torch::ones({4, 2}), torch::ones({4, 3})); },
                              "blend rejects tensors of different shapes");
    expect_throws<c10::Error>([&] { (void)Details::blend(lam, torch::ones({3, 2}), torch::ones({3, 2})); },
                              "blend rejects a weight that does not cover the batch");

    return Manifold::Test::report("broadcast");
}
