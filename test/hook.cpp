#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

using Manifold::Test::expect;
using Manifold::Test::expect_throws;

int main() {
    using namespace Manifold;
    torch::manual_seed(3);

    {
        auto site = Hook::Site::make("probe_0", "probe", Hook::Tag::Mixable);
        const auto input = torch::ones({2, 2});
        expect(torch::equal(site->dispatch(input), input), "a site without hooks passes its output through");

        auto handle = site->register_forward_hook([](const torch::Tensor& output) { return output * 3; });
        expect(handle.active() && site->hook_count() == 1, "registering a hook makes the handle active");
        expect(torch::equal(site->dispatch(input), input * 3), "a hook substitutes the site output");

        handle.remove();
        expect(!handle.active() && site->hook_count() == 0, "remove detaches the hook");
        handle.remove();
        expect(site->hook_count() == 0, "a second remove is harmless");
        expect(torch::equal(site->dispatch(input), input), "output is untouched once the hook is gone");

        expect_throws<std::invalid_argument>([&] { (void)site->register_forward_hook(Hook::Callback{}); },
                                             "an empty callable is rejected");
    }

    {
        auto site = Hook::Site::make("probe_1", "probe", Hook::Tag::Mixable);
        {
            auto scoped = site->register_forward_hook([](const torch::Tensor& output) { return output + 1; });
            expect(site->hook_count() == 1, "hook is installed inside the scope");
        }
        expect(site->hook_count() == 0, "handle destructor removes the hook");

        auto first = site->register_forward_hook([](const torch::Tensor& output) { return output + 1; });
        Hook::Handle moved = std::move(first);
        expect(!first.active() && moved.active(), "moving transfers ownership of the hook");
        moved = site->register_forward_hook([](const torch::Tensor& output) { return output * 2; });
        expect(site->hook_count() == 1, "move-assigning over an active handle removes its hook");
        expect(torch::equal(site->dispatch(torch::ones({1})), torch::full({1}, 2.0F)), "the surviving hook is the new one");
    }

    {
        Hook::Handle orphan;
        {
            auto site = Hook::Site::make("probe_2", "probe", Hook::Tag::Mixable);
            orphan = site->register_forward_hook([](const torch::Tensor& output) { return output; });
        }
        expect(!orphan.active(), "a handle outliving its site is inert");
        orphan.remove();
    }

    {
        // A hook that re-enters the graph observes the nested dispatch too.
        auto site = Hook::Site::make("probe_3", "probe", Hook::Tag::Mixable);
        int calls = 0;
        auto handle = site->register_forward_hook([&](const torch::Tensor& output) {
            ++calls;
            if (calls == 1) {
                return site->dispatch(output + 10) + output;
            }
            return output;
        });
        const auto result = site->dispatch(torch::zeros({1}));
        expect(calls == 2, "re-entrant dispatch invokes the hook again");
        expect(torch::equal(result, torch::full({1}, 10.0F)), "outer hook combines its output with the nested one");
    }

    {
        Model model("hooked");
        model.add(Layer::FC({3, 4, true}, Activation::ReLU), "encoder");
        model.add(Layer::Mixup(Layer::FC({4, 4, true})), "mixing");
        model.add(Layer::FC({4, 2, true}), "head");

        const auto marker = model.site("mixing");
        expect(marker->tag() == Hook::Tag::MixupMarker && marker->name() == "mixup_1", "name lookup returns the marker site");
        expect(marker->children().size() == 1 && marker->children().front()->name() == "fc_1", "marker owns the wrapped layer site");
        expect_throws<std::invalid_argument>([&] { (void)model.site("missing"); }, "unknown module names are rejected");
        expect_throws<std::invalid_argument>([&] { model.add(Layer::FC({2, 2, true}), "head"); }, "duplicate module names are rejected");

        int marker_calls = 0;
        int inner_calls = 0;
        torch::Tensor inner_output;
        torch::Tensor marker_output;
        auto marker_handle = marker->register_forward_hook([&](const torch::Tensor& output) {
            ++marker_calls;
            marker_output = output;
            return output;
        });
        auto inner_handle = marker->children().front()->register_forward_hook([&](const torch::Tensor& output) {
            ++inner_calls;
            inner_output = output;
            return output;
        });

        const auto output = model.forward(torch::randn({5, 3}));
        expect(output.sizes() == std::vector<std::int64_t>({5, 2}), "model forward produces the head shape");
        expect(marker_calls == 1 && inner_calls == 1, "both the marker and the wrapped layer fire once");
        expect(torch::equal(marker_output, inner_output), "the marker emits exactly what the wrapped layer produced");
        expect(Manifold::Test::installed_hooks(model) == 2, "hooks are visible through the site traversal");
    }

    {
        Model model("rewired");
        model.add(Layer::FC({2, 2, true}), "only");
        auto handle = model.site("only")->register_forward_hook([](const torch::Tensor& output) {
            return torch::zeros_like(output);
        });
        expect(torch::equal(model.forward(torch::randn({3, 2})), torch::zeros({3, 2})), "a hook on a top-level layer replaces the model output");
    }

    return Manifold::Test::report("hook");
}
