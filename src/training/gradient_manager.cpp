#include "../../include/training/gradient_manager.hpp"
#include <cmath>

double GradientManager::total_norm(const std::vector<Parameter*>& params) {
    double sum = 0.0;
    for (const auto* param : params) {
        if (param->has_grad) {
            sum += param->grad.squared_norm();
        }
    }
    return std::sqrt(sum);
}

float GradientManager::clip_grad_norm(const std::vector<Parameter*>& params, float max_norm) {
    const float norm = static_cast<float>(total_norm(params));
    const float clip_coef = max_norm / (norm + CLIP_EPSILON);
    if (clip_coef < 1.0f) {
        for (auto* param : params) {
            if (param->has_grad) {
                param->grad *= clip_coef;
            }
        }
    }
    return norm;
}
