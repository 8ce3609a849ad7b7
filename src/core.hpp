#ifndef MANIFOLD_CORE_HPP
#define MANIFOLD_CORE_HPP
/*
 * Core orchestrator of the framework.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Own the model graph built from layer and block descriptors. Every
 *    registered module contributes one interception site, so the graph can be
 *    walked and observed without inspecting runtime types.
 *  - Hold the loss slot, the optimizer and the callbacks, and drive training:
 *      on_batch_begin -> zero_grad -> forward -> on_loss_begin -> loss
 *      -> backward -> step
 *    for every batch, with on_train_begin / on_train_end around the run.
 *  - Stay re-entrant: forward() keeps no per-call state, so an observer may
 *    run the whole model again from inside a forward pass.
 */

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "utils/terminal.hpp"
#include "activation/activation.hpp"
#include "initialization/initialization.hpp"
#include "common/hook.hpp"
#include "layer/layer.hpp"
#include "block/block.hpp"
#include "loss/loss.hpp"
#include "optimizer/optimizer.hpp"
#include "callback/callback.hpp"

namespace Manifold {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    namespace Core {
        struct DefaultTrainingConfig {
            static constexpr std::size_t epochs = 10;
            static constexpr std::size_t batch_size = 32;
            static constexpr bool shuffle = true;
        };
    }

    struct TrainOptions {
        std::size_t epoch{Core::DefaultTrainingConfig::epochs};
        std::size_t batch_size{Core::DefaultTrainingConfig::batch_size};
        bool shuffle{Core::DefaultTrainingConfig::shuffle};
        bool monitor{true};
        std::optional<std::pair<torch::Tensor, torch::Tensor>> validation{};
        std::ostream* stream{&std::cout};
    };

    class Model : public torch::nn::Module, public Hook::Host {
    public:
        using ModuleDescriptor = std::variant<Layer::Descriptor, Block::Descriptor>;

        explicit Model(std::string name = "model")
            : name_(std::move(name)),
              root_(Hook::Site::make(name_, "model", Hook::Tag::NonMixable)) {}

        void train(bool on = true) override {
            torch::nn::Module::train(on);
        }

        void eval() {
            torch::nn::Module::train(false);
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

        void add(ModuleDescriptor descriptor, std::string name = {}) {
            if (optimizer_)
                throw std::logic_error("Cannot add modules after the optimizer has been configured.");

            const std::string module_name = std::move(name);
            if (!module_name.empty() && module_name_index_.find(module_name) != module_name_index_.end()) {
                throw std::invalid_argument("Module name '" + module_name + "' is already registered.");
            }

            const auto index = module_index_;
            auto registered_layer = std::visit(
                Overloaded{
                    [&](const Layer::Descriptor& layer_descriptor) {
                        return Layer::Details::build_registered_layer(*this, layer_descriptor, index);
                    },
                    [&](const Block::Descriptor& block_descriptor) {
                        return Layer::Details::build_registered_layer(*this, block_descriptor, index);
                    }
                },
                descriptor);

            // Nested layers borrow indices after their parent, keep site names unique.
            std::vector<Hook::SitePtr> subtree;
            Hook::collect(registered_layer.site, subtree);
            module_index_ += subtree.size();

            root_->add_child(registered_layer.site);
            if (!module_name.empty()) {
                module_name_index_.emplace(module_name, layers_.size());
            }
            layers_.push_back(std::move(registered_layer));
        }

        [[nodiscard]] torch::Tensor forward(torch::Tensor input) override
        {
            auto output = std::move(input);
            for (const auto& layer : layers_) {
                output = layer(std::move(output));
            }
            return output;
        }

        // Pre-order: the model itself, then each module and its nested sites.
        [[nodiscard]] std::vector<Hook::SitePtr> sites() const override
        {
            std::vector<Hook::SitePtr> sites;
            Hook::collect(root_, sites);
            return sites;
        }

        [[nodiscard]] Hook::SitePtr site(const std::string& module_name) const
        {
            const auto it = module_name_index_.find(module_name);
            if (it == module_name_index_.end()) {
                throw std::invalid_argument("No module registered under the name '" + module_name + "'.");
            }
            return layers_[it->second].site;
        }

        Model& to_device(bool use_cuda = true)
        {
            if (use_cuda) {
                if (!torch::cuda::is_available()) {
                    throw std::runtime_error("CUDA device requested but is unavailable.");
                }
                device_ = torch::Device(torch::kCUDA, /*index=*/0);
            } else {
                device_ = torch::Device(torch::kCPU);
            }

            this->to(device_);
            return *this;
        }

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }

        void set_loss(Loss::Descriptor descriptor) {
            loss_slot_.exchange(Loss::make(std::move(descriptor)));
        }

        void set_loss(Loss::Callable callable) {
            loss_slot_.exchange(Loss::make(std::move(callable)));
        }

        void set_loss(Loss::FunctionPtr function) {
            if (!function)
                throw std::invalid_argument("Cannot install an empty loss function.");
            loss_slot_.exchange(std::move(function));
        }

        [[nodiscard]] Loss::Slot& loss_slot() noexcept { return loss_slot_; }
        [[nodiscard]] const Loss::Slot& loss_slot() const noexcept { return loss_slot_; }
        [[nodiscard]] bool has_loss() const noexcept { return static_cast<bool>(loss_slot_); }

        void set_optimizer(Optimizer::Descriptor descriptor) {
            if (layers_.empty()) {
                throw std::logic_error("Cannot create optimizer before any layer has been registered.");
            }
            optimizer_ = Optimizer::Details::build_optimizer(*this, descriptor);
        }

        [[nodiscard]] bool has_optimizer() const noexcept { return static_cast<bool>(optimizer_); }
        [[nodiscard]] torch::optim::Optimizer& optimizer()
        {
            if (!optimizer_)
                throw std::logic_error("No optimizer has been configured.");
            return *optimizer_;
        }

        void add_callback(Callback::Ptr callback) {
            if (!callback)
                throw std::invalid_argument("Cannot register an empty callback.");
            callbacks_.push_back(std::move(callback));
        }

        [[nodiscard]] const std::vector<Callback::Ptr>& callbacks() const noexcept { return callbacks_; }

        void train(torch::Tensor train_inputs, torch::Tensor train_targets, TrainOptions options = {}) {
            if (!has_optimizer()) {
                throw std::logic_error("Cannot train without an optimizer.");
            }
            if (!has_loss()) {
                throw std::logic_error("Cannot train without a loss function.");
            }
            validate_dataset(train_inputs, train_targets, "Training");
            if (options.batch_size == 0) {
                throw std::invalid_argument("Batch size must be greater than zero.");
            }
            if (options.validation.has_value()) {
                validate_dataset(options.validation->first, options.validation->second, "Validation");
            }
            if (options.stream == nullptr) {
                options.monitor = false;
            }
            if (options.epoch == 0) {
                return;
            }

            this->to(device_);

            try {
                for (const auto& callback : callbacks_) {
                    callback->on_train_begin(loss_slot_);
                }
                for (std::size_t epoch = 0; epoch < options.epoch; ++epoch) {
                    run_epoch(train_inputs, train_targets, options, epoch);
                }
            } catch (const std::exception& error) {
                Utils::Terminal::Error(options.stream, std::string("Training aborted: ") + error.what());
                finish_training();
                throw;
            } catch (...) {
                finish_training();
                throw;
            }
            finish_training();
        }

        // Mean loss of the current slot over the dataset, in eval mode, without callbacks.
        [[nodiscard]] double evaluate(torch::Tensor inputs, torch::Tensor targets, std::size_t batch_size = 0)
        {
            if (!has_loss()) {
                throw std::logic_error("Cannot evaluate without a loss function.");
            }
            validate_dataset(inputs, targets, "Evaluation");
            return run_evaluation(inputs, targets, batch_size, /*notify_callbacks=*/false);
        }

    private:
        static void validate_dataset(const torch::Tensor& inputs, const torch::Tensor& targets, const std::string& label)
        {
            if (!inputs.defined() || !targets.defined()) {
                throw std::invalid_argument(label + " tensors must be defined.");
            }
            if (inputs.dim() == 0 || targets.dim() == 0) {
                throw std::invalid_argument(label + " tensors must not be scalars.");
            }
            if (inputs.size(0) != targets.size(0)) {
                throw std::invalid_argument("Mismatched number of samples between " + label + " inputs and targets.");
            }
        }

        void finish_training()
        {
            for (const auto& callback : callbacks_) {
                callback->on_train_end(loss_slot_);
            }
            torch::nn::Module::train(true);
        }

        void run_epoch(const torch::Tensor& inputs, const torch::Tensor& targets, const TrainOptions& options, std::size_t epoch)
        {
            const auto epoch_start = std::chrono::steady_clock::now();
            torch::nn::Module::train(true);

            const auto total_samples = inputs.size(0);
            const auto batch_size = static_cast<std::int64_t>(options.batch_size);
            const auto index_options = torch::TensorOptions().dtype(torch::kLong);
            const auto indices = options.shuffle ? torch::randperm(total_samples, index_options)
                                                 : torch::arange(total_samples, index_options);

            double accumulated = 0.0;
            std::int64_t seen = 0;
            for (std::int64_t offset = 0; offset < total_samples; offset += batch_size) {
                const auto current_batch = std::min<std::int64_t>(batch_size, total_samples - offset);
                const auto batch_indices = indices.narrow(0, offset, current_batch);
                auto batch_inputs = inputs.index_select(0, batch_indices.to(inputs.device())).to(device_);
                auto batch_targets = targets.index_select(0, batch_indices.to(targets.device())).to(device_);

                accumulated += train_step(std::move(batch_inputs), std::move(batch_targets)) * static_cast<double>(current_batch);
                seen += current_batch;
            }

            std::optional<double> validation_loss{};
            if (options.validation.has_value()) {
                validation_loss = run_evaluation(options.validation->first, options.validation->second,
                                                 options.batch_size, /*notify_callbacks=*/true);
            }

            if (options.monitor) {
                const auto duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_start).count();
                log_epoch(*options.stream, epoch + 1, options.epoch,
                          seen > 0 ? accumulated / static_cast<double>(seen) : 0.0,
                          validation_loss, duration_seconds);
            }
        }

        double train_step(torch::Tensor batch_inputs, torch::Tensor batch_targets)
        {
            torch::Tensor input = std::move(batch_inputs);
            Loss::Target target = std::move(batch_targets);
            for (const auto& callback : callbacks_) {
                if (auto update = callback->on_batch_begin(input, target, /*train=*/true)) {
                    input = std::move(update->input);
                    target = std::move(update->target);
                }
            }

            optimizer_->zero_grad();
            auto output = forward(input);

            for (const auto& callback : callbacks_) {
                if (auto replaced = callback->on_loss_begin(output, /*train=*/true)) {
                    output = std::move(*replaced);
                }
            }

            auto loss = loss_slot_.get()->forward(output, target);
            TORCH_CHECK(loss.numel() == 1,
                        "Training loss must reduce to a single value, got shape ", loss.sizes(), ".");
            loss.backward();
            optimizer_->step();
            return loss.detach().item<double>();
        }

        // Switches the model to eval mode and restores the previous mode on every exit path.
        struct EvalModeGuard {
            explicit EvalModeGuard(torch::nn::Module& module)
                : module_(module), was_training_(module.is_training())
            {
                module_.eval();
            }

            EvalModeGuard(const EvalModeGuard&) = delete;
            EvalModeGuard& operator=(const EvalModeGuard&) = delete;
            EvalModeGuard(EvalModeGuard&&) = delete;
            EvalModeGuard& operator=(EvalModeGuard&&) = delete;

            ~EvalModeGuard() { module_.train(was_training_); }

        private:
            torch::nn::Module& module_;
            bool was_training_{true};
        };

        double run_evaluation(const torch::Tensor& inputs, const torch::Tensor& targets, std::size_t batch_size, bool notify_callbacks)
        {
            EvalModeGuard eval_mode(*this);
            torch::NoGradGuard no_grad{};

            const auto total_samples = inputs.size(0);
            const auto step = batch_size == 0 ? total_samples : static_cast<std::int64_t>(batch_size);

            double accumulated = 0.0;
            std::int64_t seen = 0;
            for (std::int64_t offset = 0; offset < total_samples; offset += step) {
                const auto current_batch = std::min<std::int64_t>(step, total_samples - offset);
                torch::Tensor input = inputs.narrow(0, offset, current_batch).to(device_);
                Loss::Target target = targets.narrow(0, offset, current_batch).to(device_);

                if (notify_callbacks) {
                    for (const auto& callback : callbacks_) {
                        if (auto update = callback->on_batch_begin(input, target, /*train=*/false)) {
                            input = std::move(update->input);
                            target = std::move(update->target);
                        }
                    }
                }

                auto output = forward(input);

                if (notify_callbacks) {
                    for (const auto& callback : callbacks_) {
                        if (auto replaced = callback->on_loss_begin(output, /*train=*/false)) {
                            output = std::move(*replaced);
                        }
                    }
                }

                const auto loss = loss_slot_.get()->forward(output, target);
                accumulated += loss.mean().item<double>() * static_cast<double>(current_batch);
                seen += current_batch;
            }

            return seen > 0 ? accumulated / static_cast<double>(seen) : 0.0;
        }

        static void log_epoch(std::ostream& stream,
                              std::size_t epoch_index,
                              std::size_t total_epochs,
                              double train_loss,
                              const std::optional<double>& validation_loss,
                              double duration_seconds)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightYellow;
            using Utils::Terminal::Colors::kCyan;

            std::ostringstream line;
            line << "Epoch [" << epoch_index << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " loss: "
                 << std::fixed << std::setprecision(6) << train_loss << " | ";
            line << ApplyColor("Validation", kCyan) << " loss: ";
            if (validation_loss) {
                line << std::fixed << std::setprecision(6) << *validation_loss;
            } else {
                line << "N/A";
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            Utils::Terminal::Info(&stream, line.str());
        }

        std::string name_;
        Hook::SitePtr root_;
        std::vector<Layer::Details::RegisteredLayer> layers_{};
        std::unordered_map<std::string, std::size_t> module_name_index_{};
        std::size_t module_index_{0};
        Loss::Slot loss_slot_{};
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        std::vector<Callback::Ptr> callbacks_{};
        torch::Device device_{torch::kCPU};
    };
}

#endif // MANIFOLD_CORE_HPP
