#include "../../include/training/dynamic_loss_scaler.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

void DynamicLossScaler::unscale(Optimizer& optimizer) {
    if (unscaled_) {
        return;
    }
    const float inv_scale = 1.0f / current_scale_;
    for (const auto& group : optimizer.param_groups()) {
        for (auto* param : group.params) {
            if (!param->has_grad) {
                continue;
            }
            param->grad *= inv_scale;
            if (param->grad.has_inf_or_nan()) {
                found_inf_ = true;
            }
        }
    }
    unscaled_ = true;
}

bool DynamicLossScaler::step(Optimizer& optimizer) {
    unscale(optimizer);
    if (found_inf_) {
        Logger::getInstance().debug("Skipping optimizer step with inf/nan gradients");
        return false;
    }
    optimizer.step();
    return true;
}

void DynamicLossScaler::update() {
    update_scale(found_inf_);
    unscaled_ = false;
    found_inf_ = false;
}

bool DynamicLossScaler::update_scale(bool has_inf_or_nan) {
    if (has_inf_or_nan) {
        // Decrease scale on inf/nan
        current_scale_ = std::max(current_scale_ / scale_factor_, min_scale_);
        stable_steps_ = 0;
        Logger::getInstance().log("Loss scale decreased to: " + std::to_string(current_scale_));
        return false;
    }

    stable_steps_++;
    if (stable_steps_ >= scale_window_) {
        // Increase scale after window of stability
        float new_scale = std::min(current_scale_ * scale_factor_, max_scale_);
        if (new_scale != current_scale_) {
            Logger::getInstance().log("Loss scale increased to: " + std::to_string(new_scale));
        }
        current_scale_ = new_scale;
        stable_steps_ = 0;
    }
    return true;
}
