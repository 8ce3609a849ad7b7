#ifndef MANIFOLD_TEST_COMMON_HPP
#define MANIFOLD_TEST_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Manifold.h"

namespace Manifold::Test {
    inline int& failures() {
        static int count = 0;
        return count;
    }

    inline void expect(bool condition, const std::string& message) {
        if (!condition) {
            ++failures();
            std::cerr << "FAILED: " << message << '\n';
        }
    }

    template <class Exception, class Fn>
    void expect_throws(Fn&& fn, const std::string& message) {
        try {
            fn();
        } catch (const Exception&) {
            return;
        } catch (const std::exception& error) {
            ++failures();
            std::cerr << "FAILED: " << message << " (unexpected exception: " << error.what() << ")\n";
            return;
        }
        ++failures();
        std::cerr << "FAILED: " << message << " (nothing thrown)\n";
    }

    inline int report(std::string_view suite) {
        if (failures() == 0) {
            std::cout << suite << ": all checks passed\n";
            return 0;
        }
        std::cerr << suite << ": " << failures() << " check(s) failed\n";
        return 1;
    }

    inline std::size_t count_occurrences(const std::string& haystack, std::string_view needle) {
        std::size_t count = 0;
        for (auto position = haystack.find(needle); position != std::string::npos;
             position = haystack.find(needle, position + needle.size())) {
            ++count;
        }
        return count;
    }

    inline std::size_t installed_hooks(const Hook::Host& host) {
        std::size_t total = 0;
        for (const auto& site : host.sites()) {
            total += site->hook_count();
        }
        return total;
    }

    // Emits its input through a single site: the site's output is the raw batch.
    class IdentityHost : public Hook::Host {
    public:
        IdentityHost() : site_(Hook::Site::make("identity_0", "identity", Hook::Tag::Mixable)) {}

        [[nodiscard]] std::vector<Hook::SitePtr> sites() const override { return {site_}; }
        [[nodiscard]] torch::Tensor forward(torch::Tensor input) override { return site_->dispatch(std::move(input)); }

        [[nodiscard]] const Hook::SitePtr& site() const noexcept { return site_; }

    private:
        Hook::SitePtr site_;
    };

    // Runs the same site `uses` times per forward pass, like a layer applied repeatedly.
    class ReusingHost : public Hook::Host {
    public:
        explicit ReusingHost(std::size_t uses = 3)
            : uses_(uses), site_(Hook::Site::make("shared_0", "shared", Hook::Tag::Mixable)) {}

        [[nodiscard]] std::vector<Hook::SitePtr> sites() const override { return {site_}; }
        [[nodiscard]] torch::Tensor forward(torch::Tensor input) override
        {
            auto output = std::move(input);
            for (std::size_t use = 0; use < uses_; ++use) {
                output = site_->dispatch(output * 0.5);
            }
            return output;
        }

        [[nodiscard]] const Hook::SitePtr& site() const noexcept { return site_; }

    private:
        std::size_t uses_;
        Hook::SitePtr site_;
    };

    // Advertises a site its forward pass never reaches.
    class SilentHost : public Hook::Host {
    public:
        SilentHost() : site_(Hook::Site::make("unused_0", "unused", Hook::Tag::Mixable)) {}

        [[nodiscard]] std::vector<Hook::SitePtr> sites() const override { return {site_}; }
        [[nodiscard]] torch::Tensor forward(torch::Tensor input) override { return input * 2; }

        [[nodiscard]] const Hook::SitePtr& site() const noexcept { return site_; }

    private:
        Hook::SitePtr site_;
    };

    // fc -> mixup(fc) -> fc, a classifier with exactly one explicit mixup point.
    inline void build_tagged_classifier(Model& model, std::int64_t in_features, std::int64_t classes) {
        model.add(Layer::FC({in_features, 8, true}, Activation::ReLU, Initialization::KaimingUniform), "input");
        model.add(Layer::Mixup(Layer::FC({8, 8, true}, Activation::ReLU)), "hidden");
        model.add(Layer::FC({8, classes, true}), "head");
    }

    [[nodiscard]] inline Mixup::Options quiet_options(std::ostream& stream) {
        Mixup::Options options{};
        options.stream = &stream;
        return options;
    }
}

#endif // MANIFOLD_TEST_COMMON_HPP
