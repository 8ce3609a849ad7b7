#ifndef MANIFOLD_MIXUP_ELIGIBILITY_HPP
#define MANIFOLD_MIXUP_ELIGIBILITY_HPP

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../common/hook.hpp"
#include "../../utils/terminal.hpp"

namespace Manifold::Mixup::Details {
    [[nodiscard]] inline bool is_eligible(const Hook::Site& site, bool use_only_mixup_modules) noexcept
    {
        if (use_only_mixup_modules) {
            return site.tag() == Hook::Tag::MixupMarker;
        }
        return site.tag() != Hook::Tag::NonMixable;
    }

    // Keeps traversal order. Throws when nothing qualifies.
    [[nodiscard]] inline std::vector<Hook::SitePtr> select(const std::vector<Hook::SitePtr>& sites,
                                                           bool use_only_mixup_modules,
                                                           std::ostream* stream)
    {
        std::vector<Hook::SitePtr> candidates;
        for (const auto& site : sites) {
            if (site && is_eligible(*site, use_only_mixup_modules)) {
                candidates.push_back(site);
            }
        }
        if (candidates.empty()) {
            throw std::invalid_argument(
                "No eligible layer found for mixup. Try use_only_mixup_modules = false "
                "or wrap one of your layers with Layer::Mixup.");
        }
        Utils::Terminal::Info(stream, std::to_string(candidates.size()) + " modules eligible for mixup");
        return candidates;
    }
}

#endif //MANIFOLD_MIXUP_ELIGIBILITY_HPP
