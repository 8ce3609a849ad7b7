#ifndef MANIFOLD_COMMON_HOOK_HPP
#define MANIFOLD_COMMON_HOOK_HPP
/*
 * Interception points of the model graph.
 * ---------------------------------------------------------------------------
 *  - Every registered layer and block owns one `Site`. A site knows its
 *    display name, its kind, its capability tag and its child sites, so the
 *    whole graph can be walked without inspecting runtime types.
 *  - Observers installed on a site read the site's output and may substitute
 *    another tensor. They are removed through a move-only `Handle`.
 *  - `Host` is the contract a model exposes to the mixup orchestrator: an
 *    ordered traversal of its sites plus a re-entrant forward entry point.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Manifold::Hook {
    // Closed capability set, fixed when the graph is built.
    enum class Tag {
        Mixable,
        NonMixable,
        MixupMarker
    };

    using Callback = std::function<torch::Tensor(const torch::Tensor&)>;

    class Site;
    using SitePtr = std::shared_ptr<Site>;

    class Handle {
    public:
        Handle() = default;
        Handle(std::weak_ptr<Site> site, std::uint64_t id) noexcept : site_(std::move(site)), id_(id) {}

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        Handle(Handle&& other) noexcept : site_(std::move(other.site_)), id_(other.id_) { other.id_ = 0; }
        Handle& operator=(Handle&& other) noexcept
        {
            if (this != &other) {
                remove();
                site_ = std::move(other.site_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        ~Handle() { remove(); }

        // Safe to call any number of times, and after the site is gone.
        void remove() noexcept;

        [[nodiscard]] bool active() const noexcept;

    private:
        std::weak_ptr<Site> site_{};
        std::uint64_t id_{0};
    };

    class Site : public std::enable_shared_from_this<Site> {
    public:
        Site(std::string name, std::string kind, Tag tag)
            : name_(std::move(name)), kind_(std::move(kind)), tag_(tag) {}

        [[nodiscard]] static SitePtr make(std::string name, std::string kind, Tag tag)
        {
            return std::make_shared<Site>(std::move(name), std::move(kind), tag);
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] const std::string& kind() const noexcept { return kind_; }
        [[nodiscard]] Tag tag() const noexcept { return tag_; }

        [[nodiscard]] const std::vector<SitePtr>& children() const noexcept { return children_; }
        void add_child(SitePtr child)
        {
            if (!child) {
                throw std::invalid_argument("Cannot attach an empty child site to '" + name_ + "'.");
            }
            children_.push_back(std::move(child));
        }

        [[nodiscard]] Handle register_forward_hook(Callback callback)
        {
            if (!callback) {
                throw std::invalid_argument("Forward hook on '" + name_ + "' requires a callable.");
            }
            const auto id = ++next_id_;
            hooks_.emplace_back(id, std::make_shared<Callback>(std::move(callback)));
            return Handle{weak_from_this(), id};
        }

        [[nodiscard]] std::size_t hook_count() const noexcept { return hooks_.size(); }

        [[nodiscard]] bool contains(std::uint64_t id) const noexcept
        {
            for (const auto& [hook_id, callback] : hooks_) {
                if (hook_id == id) return true;
            }
            return false;
        }

        // Observers may re-enter the owning graph, so iterate over a snapshot.
        [[nodiscard]] torch::Tensor dispatch(torch::Tensor output)
        {
            if (hooks_.empty()) {
                return output;
            }
            std::vector<std::shared_ptr<Callback>> snapshot;
            snapshot.reserve(hooks_.size());
            for (const auto& entry : hooks_) {
                snapshot.push_back(entry.second);
            }
            for (const auto& callback : snapshot) {
                output = (*callback)(output);
            }
            return output;
        }

    private:
        friend class Handle;

        void remove(std::uint64_t id) noexcept
        {
            std::erase_if(hooks_, [id](const auto& entry) { return entry.first == id; });
        }

        std::string name_{};
        std::string kind_{};
        Tag tag_{Tag::Mixable};
        std::vector<SitePtr> children_{};
        std::vector<std::pair<std::uint64_t, std::shared_ptr<Callback>>> hooks_{};
        std::uint64_t next_id_{0};
    };

    inline void Handle::remove() noexcept
    {
        if (id_ == 0) {
            return;
        }
        if (auto site = site_.lock()) {
            site->remove(id_);
        }
        site_.reset();
        id_ = 0;
    }

    inline bool Handle::active() const noexcept
    {
        if (id_ == 0) {
            return false;
        }
        auto site = site_.lock();
        return site && site->contains(id_);
    }

    // Pre-order walk: a site precedes its children, siblings keep insertion order.
    inline void collect(const SitePtr& root, std::vector<SitePtr>& out)
    {
        if (!root) {
            return;
        }
        out.push_back(root);
        for (const auto& child : root->children()) {
            collect(child, out);
        }
    }

    class Host {
    public:
        virtual ~Host() = default;

        [[nodiscard]] virtual std::vector<SitePtr> sites() const = 0;
        [[nodiscard]] virtual torch::Tensor forward(torch::Tensor input) = 0;
    };
}

#endif // MANIFOLD_COMMON_HOOK_HPP
