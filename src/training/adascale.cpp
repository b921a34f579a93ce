#include "../../include/training/adascale.hpp"
#include "../../include/logger.hpp"
#include "../../include/training/gradient_manager.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
const AutoScalerConfig& validated(const AutoScalerConfig& config) {
    config.validate();
    return config;
}

GainSettings make_gain_settings(const AutoScalerConfig& config, size_t scale) {
    GainSettings settings;
    settings.scale = scale;
    settings.is_adaptive = config.is_adaptive;
    settings.aggressive_schedule = config.adascale.aggressive_schedule;
    settings.scale_one_batch_size = config.gradient_noise_scale.scale_one_batch_size;
    settings.batch_size_upper_limit = config.gradient_noise_scale.batch_size_upper_limit;
    return settings;
}

std::string format_vector(const std::vector<double>& values) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        ss << (i ? ", " : "") << values[i];
    }
    ss << "]";
    return ss.str();
}
} // namespace

AdaScale::AdaScale(Optimizer& optimizer, BackwardEngine& engine, const AutoScalerConfig& config,
                   ProcessGroup* process_group, LossScaler* scaler, SummaryWriter* summary_writer)
    : optimizer_(optimizer), engine_(engine), scaler_(scaler), summary_writer_(summary_writer),
      reducer_(process_group), config_(validated(config)),
      world_size_(config.world_size != 0 ? config.world_size : reducer_.world_size()),
      num_grads_to_accum_(config.gradient_accumulation_supported
                              ? config.num_gradients_to_accumulate
                              : 1),
      num_grad_samples_(world_size_ * num_grads_to_accum_),
      scale_(num_grad_samples_ / config.scale_one_world_size),
      smoothing_(config.smoothing
                     ? static_cast<double>(*config.smoothing)
                     : std::max(1.0 - static_cast<double>(num_grad_samples_) / 1000.0, 0.0)),
      current_batch_size_(config.gradient_noise_scale.scale_one_batch_size * scale_),
      gain_engine_(make_gain_settings(config, scale_)) {
    if (config_.update_interval > 1) {
        throw std::logic_error("Updating the statistics every " +
                               std::to_string(config_.update_interval) +
                               " steps is not implemented");
    }
    if (num_grad_samples_ <= 1) {
        throw std::invalid_argument(
            "AdaScale needs more than one gradient sample per update, enable data "
            "parallelism or gradient accumulation");
    }
    if (scale_ < 1) {
        throw std::invalid_argument("Scale must be an integer of at least 1, got " +
                                    std::to_string(num_grad_samples_) + " samples for a scale-one "
                                    "world size of " +
                                    std::to_string(config_.scale_one_world_size));
    }
    if (current_batch_size_ > config_.gradient_noise_scale.batch_size_upper_limit) {
        throw std::invalid_argument("Batch size " + std::to_string(current_batch_size_) +
                                    " exceeds the upper limit of " +
                                    std::to_string(
                                        config_.gradient_noise_scale.batch_size_upper_limit));
    }

    if (config_.enable_debug) {
        Logger::getInstance().setDebug(true);
    }

    run_state_ = RunState::initial(optimizer_.num_param_groups(), scale_);
    if (optimizer_.num_param_groups() > 0) {
        scale_one_beta1_ = optimizer_.hyperparameters(0).momentum;
        adjusted_beta1_ = scale_one_beta1_;
    }

    hook();

    Logger::getInstance().log("AdaScale rank " + std::to_string(reducer_.rank()) +
                              ": world size " + std::to_string(world_size_) +
                              ", accumulation " + std::to_string(num_grads_to_accum_) +
                              ", scale " + std::to_string(scale_) + ", smoothing " +
                              std::to_string(smoothing_));
}

AdaScale::~AdaScale() {
    unhook();
}

void AdaScale::hook() {
    if (!hook_handles_.empty()) {
        throw std::logic_error("Gradient hooks are already registered, unhook first");
    }
    const auto& groups = optimizer_.param_groups();
    for (size_t group = 0; group < groups.size(); ++group) {
        for (auto* param : groups[group].params) {
            hook_handles_.push_back(engine_.register_hook(
                param,
                [this, group, param](const Matrix& grad) { backward_hook(group, param, grad); }));
        }
    }
}

void AdaScale::unhook() {
    for (auto handle : hook_handles_) {
        engine_.remove_hook(handle);
    }
    hook_handles_.clear();
}

void AdaScale::require_idle(const std::string& action) const {
    if (window_.is_open()) {
        throw std::logic_error("Cannot " + action + " while a backward pass is being accumulated");
    }
}

double AdaScale::norm_squared(size_t group, const Parameter* param, const Matrix& grad) const {
    // Gradients carry the loss scale, the squared norm carries its square
    if (config_.precondition_gradients && real_iterations_ >= VarianceEstimator::MIN_STEPS) {
        Matrix pinv = optimizer_.preconditioner(group, param);
        if (!pinv.empty()) {
            Matrix preconditioned = grad;
            preconditioned.divide_elementwise(pinv);
            return preconditioned.squared_norm() / loss_scale_squared_;
        }
    }
    return grad.squared_norm() / loss_scale_squared_;
}

void AdaScale::backward_hook(size_t group, const Parameter* param, const Matrix& grad) {
    if (!window_.is_open()) {
        const double loss_scale = scaler_ ? static_cast<double>(scaler_->get_scale()) : 1.0;
        loss_scale_squared_ = loss_scale * loss_scale;
    }
    window_.record_gradient(group, norm_squared(group, param, grad),
                            optimizer_.num_param_groups());

    if (final_callback_queued_) {
        return;
    }
    final_callback_queued_ = true;
    // Queue a callback that queues the finalize callback, so that finalize runs
    // behind anything queued during this pass (gradient synchronization included)
    engine_.queue_callback([this]() { engine_.queue_callback([this]() { final_callback(); }); });
}

std::vector<double> AdaScale::total_grad_sqr() const {
    const auto& groups = optimizer_.param_groups();
    std::vector<double> total(groups.size(), 0.0);
    for (size_t group = 0; group < groups.size(); ++group) {
        for (const auto* param : groups[group].params) {
            if (!param->has_grad || param->grad.has_nan()) {
                continue;
            }
            total[group] += norm_squared(group, param, param->grad);
        }
    }
    return total;
}

void AdaScale::final_callback() {
    final_callback_queued_ = false;
    std::optional<std::vector<double>> finalized = window_.try_finalize(num_grads_to_accum_);
    if (!finalized) {
        return;
    }

    std::vector<double> local_grad_sqr = std::move(*finalized);
    std::unique_ptr<Work> work = reducer_.reduce_sum_async(local_grad_sqr);

    std::vector<double> total = total_grad_sqr();
    if (num_grads_to_accum_ > 1 && config_.adjust_gradients_for_accumulation) {
        const double divisor = static_cast<double>(num_grads_to_accum_ * num_grads_to_accum_);
        for (auto& value : total) {
            value /= divisor;
        }
    }
    work->wait();
    last_total_grad_sqr_ = total;

    // Without the divisor in the loss each local gradient is accum times too small
    if (!config_.adjust_gradients_for_accumulation) {
        const double factor = static_cast<double>(num_grads_to_accum_ * num_grads_to_accum_);
        for (auto& value : local_grad_sqr) {
            value *= factor;
        }
    }

    const bool outlier = estimator_.check_outlier(local_grad_sqr, real_iterations_);
    if (outlier) {
        Logger::getInstance().debug("Outlier in local squared norm " +
                                    format_vector(local_grad_sqr) +
                                    ", skipping moving average update");
    }

    last_estimate_ = VarianceEstimator::estimate(local_grad_sqr, total, scale_, num_grad_samples_,
                                                 outlier, run_state_.grad_var_avg(0),
                                                 run_state_.grad_sqr_avg(0));
    gain_invalid_ = !last_estimate_.valid;

    if (last_estimate_.valid) {
        run_state_.averages.update(RunState::GRAD_SQR_AVG, last_estimate_.grad_sqr, smoothing_);
        run_state_.averages.update(RunState::GRAD_VAR_AVG, last_estimate_.grad_var, smoothing_);
    } else {
        Logger::getInstance().log("Gradient inf/nan or outlier, skipping update of moving "
                                  "averages of gradient moments");
        Logger::getInstance().debug("local " + format_vector(local_grad_sqr) + ", total " +
                                    format_vector(total) + ", scale " + std::to_string(scale_) +
                                    ", samples " + std::to_string(num_grad_samples_));
    }
}

bool AdaScale::step() {
    require_idle("step");

    const size_t num_groups = optimizer_.num_param_groups();
    std::vector<float> original_lr(num_groups);
    for (size_t i = 0; i < num_groups; ++i) {
        Hyperparameters hyper = optimizer_.hyperparameters(i);
        original_lr[i] = hyper.learning_rate;
        hyper.learning_rate = static_cast<float>(gain(i)) * hyper.learning_rate;
        optimizer_.set_hyperparameters(i, hyper);

        if (i == 0) {
            effective_lr_ = hyper.learning_rate;
            const double ratio =
                static_cast<double>(original_lr[0]) / static_cast<double>(current_batch_size_);
            if (temperature_ratio_) {
                temperature_ *= ratio / *temperature_ratio_;
            }
            temperature_ratio_ = ratio;
        }
    }

    auto restore_lr = [&]() {
        for (size_t i = 0; i < num_groups; ++i) {
            Hyperparameters hyper = optimizer_.hyperparameters(i);
            hyper.learning_rate = original_lr[i];
            optimizer_.set_hyperparameters(i, hyper);
        }
    };

    bool applied = true;
    clip_norm_ = 0.0f;
    try {
        if (config_.adascale.max_grad_norm > 0.0f) {
            if (scaler_) {
                scaler_->unscale(optimizer_);
            }
            clip_norm_ = GradientManager::clip_grad_norm(all_params(), config_.adascale.max_grad_norm);
        }
        if (scaler_) {
            applied = scaler_->step(optimizer_);
        } else {
            optimizer_.step();
        }
    } catch (const std::exception&) {
        restore_lr();
        throw;
    }
    restore_lr();
    return applied;
}

void AdaScale::zero_grad() {
    require_idle("zero gradients");
    optimizer_.zero_grad();
}

void AdaScale::add_param_group(const ParamGroup& group) {
    require_idle("add a parameter group");
    optimizer_.add_param_group(group);
    unhook();
    hook();
    run_state_.add_group();
    if (optimizer_.num_param_groups() == 1) {
        scale_one_beta1_ = optimizer_.hyperparameters(0).momentum;
        adjusted_beta1_ = scale_one_beta1_;
    }
}

OptimizerStateDict AdaScale::state_dict() const {
    require_idle("checkpoint");
    OptimizerStateDict dict = optimizer_.state_dict();
    dict.namespaces[STATE_NAMESPACE] = run_state_.to_blob();
    Logger::getInstance().debug("Accessing state dict on rank " + std::to_string(reducer_.rank()) +
                                ", scale invariant steps " +
                                std::to_string(run_state_.scale_invariant_steps));
    return dict;
}

void AdaScale::load_state_dict(const OptimizerStateDict& dict) {
    require_idle("load a checkpoint");
    auto it = dict.namespaces.find(STATE_NAMESPACE);
    if (it == dict.namespaces.end()) {
        throw std::invalid_argument("Checkpoint has no AdaScale state");
    }
    RunState restored = RunState::from_blob(it->second);
    if (restored.num_groups() != optimizer_.num_param_groups()) {
        throw std::invalid_argument("Checkpoint has AdaScale statistics for " +
                                    std::to_string(restored.num_groups()) +
                                    " parameter groups, optimizer has " +
                                    std::to_string(optimizer_.num_param_groups()));
    }

    const size_t prev_scale = restored.scale;
    const bool scale_changed = prev_scale != scale_;
    const bool reset = scale_changed && config_.reset_optimizer_state_on_restart;

    if (reset) {
        Logger::getInstance().log("Resetting AdaScale statistics after a scale change from " +
                                  std::to_string(prev_scale) + " to " + std::to_string(scale_));
        const size_t num_groups = restored.num_groups();
        restored.averages.seed(RunState::GRAD_SQR_AVG, std::vector<double>(num_groups, 1.0));
        restored.averages.seed(RunState::GRAD_VAR_AVG, std::vector<double>(num_groups, 0.0));
    }
    if (scale_changed) {
        const double factor = static_cast<double>(prev_scale) / static_cast<double>(scale_);
        restored.averages.rescale(RunState::GRAD_VAR_AVG, factor);
        restored.scale = scale_;
        Logger::getInstance().log("Adjusted variance average for scale change from " +
                                  std::to_string(prev_scale) + " to " + std::to_string(scale_));
    }
    run_state_ = std::move(restored);

    Logger::getInstance().debug(
        "Restored scale invariant steps " + std::to_string(run_state_.scale_invariant_steps) +
        ", sqr " + format_vector(run_state_.averages.value(RunState::GRAD_SQR_AVG)) + ", var " +
        format_vector(run_state_.averages.value(RunState::GRAD_VAR_AVG)));

    if (reset) {
        Logger::getInstance().log("Resetting base optimizer state");
        return;
    }
    optimizer_.load_state_dict(dict);
}

double AdaScale::gain(std::optional<size_t> group, double alpha) {
    last_var_ = run_state_.grad_var_avg(group);
    last_sqr_ = run_state_.grad_sqr_avg(group);
    last_gain_ = gain_engine_.gain(run_state_, gain_invalid_, group, alpha);
    return last_gain_;
}

double AdaScale::gns(std::optional<size_t> group) {
    const bool predicting = real_iterations_ >= VarianceEstimator::MIN_STEPS && !gain_invalid_;
    const double result =
        gain_engine_.gns(run_state_, gain_invalid_, real_iterations_, group, &last_gns_);
    if (!predicting) {
        return result;
    }

    averaged_gns_ = result;
    Logger::getInstance().debug("GNS " + std::to_string(last_gns_) + " (sqr " +
                                std::to_string(run_state_.grad_sqr_avg(group)) + ", var " +
                                std::to_string(run_state_.grad_var_avg(group)) + ")");
    const double predicted_scale = gain_engine_.predicted_scale(averaged_gns_);
    if (config_.adjust_momentum && config_.is_adaptive && predicted_scale > 1.0) {
        adjusted_beta1_ = GainEngine::adjust_momentum(optimizer_, scale_one_beta1_, predicted_scale);
        Logger::getInstance().debug("Adjusted beta1 to " + std::to_string(adjusted_beta1_) +
                                    " for predicted scale " + std::to_string(predicted_scale));
    }
    return result;
}

long AdaScale::get_step_increment() {
    require_idle("advance the step counter");
    if (gain_invalid_) {
        return 1;
    }
    const long increment = gain_engine_.scale_invariant_step_increment(run_state_, gain_invalid_);
    real_iterations_++;
    return increment;
}

void AdaScale::set_scale(double scale) {
    throw std::logic_error("Changing the scale of a running AdaScale (to " +
                           std::to_string(scale) + ") is not implemented");
}

std::vector<Parameter*> AdaScale::all_params() const {
    std::vector<Parameter*> params;
    for (const auto& group : optimizer_.param_groups()) {
        params.insert(params.end(), group.params.begin(), group.params.end());
    }
    return params;
}

void AdaScale::log_summary(size_t real_iteration, int phase) {
    if (!summary_writer_) {
        return;
    }
    const std::string prefix = "Train" + (phase > -1 ? std::to_string(phase) : std::string()) + "/";
    const double x = run_state_.scale_invariant_steps;
    const double var_curr = last_estimate_.grad_var.empty() ? 0.0 : last_estimate_.grad_var[0];
    const double sqr_curr = last_estimate_.grad_sqr.empty() ? 0.0 : last_estimate_.grad_sqr[0];

    SummaryWriter& writer = *summary_writer_;
    writer.add_scalar(prefix + "Real Iterations", static_cast<double>(real_iterations_), x);
    writer.add_scalar(prefix + "gain", last_gain_, x);
    writer.add_scalar(prefix + "var_curr", var_curr, x);
    writer.add_scalar(prefix + "sqr_curr", sqr_curr, x);
    writer.add_scalar(prefix + "temperature", temperature_, x);
    writer.add_scalar(prefix + "scale", static_cast<double>(scale_), x);
    writer.add_scalar(prefix + "accum_steps", static_cast<double>(num_grads_to_accum_), x);
    writer.add_scalar(prefix + "var_si", last_var_, x);
    writer.add_scalar(prefix + "sqr_si", last_sqr_, x);
    writer.add_scalar(prefix + "GNS_si", last_gns_, x);
    writer.add_scalar(prefix + "clipnorm", clip_norm_, x);
    writer.add_scalar(prefix + "adjusted_beta1", adjusted_beta1_, x);
    if (config_.enable_debug) {
        const double it = static_cast<double>(real_iteration);
        writer.add_scalar(prefix + "var", last_var_, it);
        writer.add_scalar(prefix + "sqr", last_sqr_, it);
        writer.add_scalar(prefix + "GNS", last_gns_, it);
    }
    writer.add_scalar(prefix + "Effective LR", effective_lr_, x);
}

void AdaScale::record_cluster_state(const std::string& path) {
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open GNS history file: " + path);
    }

    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
    file << current_batch_size_ << ',' << world_size_ << ','
         << (config_.gradient_accumulation_supported ? "true" : "false") << ','
         << config_.gradient_noise_scale.scale_one_batch_size << ',' << num_grads_to_accum_ << ','
         << static_cast<long long>(averaged_gns_) << ',' << timestamp << '\n';
    if (!file) {
        throw std::runtime_error("Failed to write GNS history file: " + path);
    }
}

void AdaScale::record_cluster_state() {
    record_cluster_state(config_.logs_basedir() + "/GNS/gns_history.txt");
}
