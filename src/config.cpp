#include "../include/config.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <stdexcept>

void to_json(nlohmann::json& j, const AdaScaleSettings& s) {
    j = nlohmann::json{{"aggressive_schedule", s.aggressive_schedule},
                       {"max_grad_norm", s.max_grad_norm}};
}

void from_json(const nlohmann::json& j, AdaScaleSettings& s) {
    s.aggressive_schedule = j.value("aggressive_schedule", s.aggressive_schedule);
    s.max_grad_norm = j.value("max_grad_norm", s.max_grad_norm);
}

void to_json(nlohmann::json& j, const GradientNoiseScaleSettings& s) {
    j = nlohmann::json{{"scale_one_batch_size", s.scale_one_batch_size},
                       {"batch_size_upper_limit", s.batch_size_upper_limit}};
}

void from_json(const nlohmann::json& j, GradientNoiseScaleSettings& s) {
    // Both limits have no sensible default
    s.scale_one_batch_size = j.at("scale_one_batch_size").get<size_t>();
    s.batch_size_upper_limit = j.at("batch_size_upper_limit").get<size_t>();
}

void to_json(nlohmann::json& j, const AutoScalerConfig& c) {
    nlohmann::json autoscaler{
        {"world_size", c.world_size},
        {"num_gradients_to_accumulate", c.num_gradients_to_accumulate},
        {"gradient_accumulation_supported", c.gradient_accumulation_supported},
        {"adjust_gradients_for_accumulation", c.adjust_gradients_for_accumulation},
        {"scale_one_world_size", c.scale_one_world_size},
        {"update_interval", c.update_interval},
        {"precondition_gradients", c.precondition_gradients},
        {"is_adaptive", c.is_adaptive},
        {"adjust_momentum", c.adjust_momentum},
        {"reset_optimizer_state_on_restart", c.reset_optimizer_state_on_restart},
        {"enable_debug", c.enable_debug},
        {"collect_tensorboard", c.collect_tensorboard},
        {"log_dir", c.log_dir},
        {"training_label", c.training_label}};
    if (c.smoothing) {
        autoscaler["smoothing"] = *c.smoothing;
    } else {
        autoscaler["smoothing"] = nullptr;
    }
    j = nlohmann::json{{"autoscaler", autoscaler},
                       {"adascale", c.adascale},
                       {"gradient_noise_scale", c.gradient_noise_scale}};
}

void from_json(const nlohmann::json& j, AutoScalerConfig& c) {
    const auto& autoscaler = j.at("autoscaler");
    c.world_size = autoscaler.value("world_size", c.world_size);
    c.num_gradients_to_accumulate =
        autoscaler.value("num_gradients_to_accumulate", c.num_gradients_to_accumulate);
    c.gradient_accumulation_supported =
        autoscaler.value("gradient_accumulation_supported", c.gradient_accumulation_supported);
    c.adjust_gradients_for_accumulation =
        autoscaler.value("adjust_gradients_for_accumulation", c.adjust_gradients_for_accumulation);
    c.scale_one_world_size = autoscaler.at("scale_one_world_size").get<size_t>();
    c.update_interval = autoscaler.value("update_interval", c.update_interval);
    c.precondition_gradients = autoscaler.value("precondition_gradients", c.precondition_gradients);
    if (autoscaler.contains("smoothing") && !autoscaler["smoothing"].is_null()) {
        c.smoothing = autoscaler["smoothing"].get<float>();
    } else {
        c.smoothing.reset();
    }
    c.is_adaptive = autoscaler.value("is_adaptive", c.is_adaptive);
    c.adjust_momentum = autoscaler.value("adjust_momentum", c.adjust_momentum);
    c.reset_optimizer_state_on_restart =
        autoscaler.value("reset_optimizer_state_on_restart", c.reset_optimizer_state_on_restart);
    c.enable_debug = autoscaler.value("enable_debug", c.enable_debug);
    c.collect_tensorboard = autoscaler.value("collect_tensorboard", c.collect_tensorboard);
    c.log_dir = autoscaler.value("log_dir", c.log_dir);
    c.training_label = autoscaler.value("training_label", c.training_label);

    if (j.contains("adascale")) {
        c.adascale = j["adascale"].get<AdaScaleSettings>();
    }
    c.gradient_noise_scale = j.at("gradient_noise_scale").get<GradientNoiseScaleSettings>();
}

void AutoScalerConfig::load_from_json(const std::string& config_path) {
    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + config_path);
        }

        nlohmann::json j;
        file >> j;
        from_json(j, *this);

        Logger::getInstance().log("Loaded autoscaler configuration from " + config_path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Error loading config from JSON: " + std::string(e.what()));
    }
}

void AutoScalerConfig::validate() const {
    if (num_gradients_to_accumulate < 1) {
        throw std::invalid_argument("num_gradients_to_accumulate must be a positive integer");
    }
    if (scale_one_world_size < 1) {
        throw std::invalid_argument("scale_one_world_size must be at least 1");
    }
    if (gradient_noise_scale.scale_one_batch_size < 1) {
        throw std::invalid_argument("scale_one_batch_size must be at least 1");
    }
    if (gradient_noise_scale.batch_size_upper_limit < 1) {
        throw std::invalid_argument("batch_size_upper_limit must be at least 1");
    }
    if (smoothing && (*smoothing < 0.0f || *smoothing >= 1.0f)) {
        throw std::invalid_argument("smoothing must be in [0, 1)");
    }
    if (adascale.max_grad_norm < 0.0f) {
        throw std::invalid_argument("max_grad_norm must not be negative");
    }
}
