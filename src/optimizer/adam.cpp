#include "../../include/optimizer/adam.hpp"
#include <cmath>
#include <omp.h>

namespace {
Hyperparameters make_adam_defaults(float lr, float b1, float b2, float eps, float weight_decay) {
    Hyperparameters hyper;
    hyper.learning_rate = lr;
    hyper.momentum = b1;
    hyper.beta2 = b2;
    hyper.epsilon = eps;
    hyper.weight_decay = weight_decay;
    return hyper;
}
} // namespace

Adam::Adam(float lr, float b1, float b2, float eps, float weight_decay)
    : Optimizer(make_adam_defaults(lr, b1, b2, eps, weight_decay)) {}

void Adam::step() {
    for (auto& group : groups_) {
        Hyperparameters& hp = group.hyper;
        hp.step++;
        const float bias_correction1 = 1.0f - std::pow(hp.momentum, static_cast<float>(hp.step));
        const float bias_correction2 = 1.0f - std::pow(hp.beta2, static_cast<float>(hp.step));

        for (auto* param : group.params) {
            if (!param->has_grad) {
                continue;
            }
            ParamState& st = state(param);
            if (st.exp_avg.empty()) {
                st.exp_avg = Matrix(param->value.rows(), param->value.cols(), 0.0f);
                st.exp_avg_sq = Matrix(param->value.rows(), param->value.cols(), 0.0f);
            }

            float* value = param->value.data();
            const float* grad = param->grad.data();
            float* m = st.exp_avg.data();
            float* v = st.exp_avg_sq.data();
            const long n = static_cast<long>(param->value.size());

#pragma omp parallel for
            for (long j = 0; j < n; ++j) {
                m[j] = hp.momentum * m[j] + (1.0f - hp.momentum) * grad[j];
                v[j] = hp.beta2 * v[j] + (1.0f - hp.beta2) * grad[j] * grad[j];
                float m_hat = m[j] / bias_correction1;
                float v_hat = v[j] / bias_correction2;
                value[j] -= hp.learning_rate *
                            (m_hat / (std::sqrt(v_hat) + hp.epsilon) + hp.weight_decay * value[j]);
            }
        }
    }
}

Matrix Adam::preconditioner(size_t group, const Parameter* param) const {
    const ParamState* st = state_for(param);
    const Hyperparameters& hp = hyperparameters(group);
    if (st == nullptr || st->exp_avg_sq.empty() || hp.step == 0) {
        return Matrix();
    }
    const float bias_correction2 = 1.0f - std::pow(hp.beta2, static_cast<float>(hp.step));
    Matrix pinv = st->exp_avg_sq;
    for (size_t j = 0; j < pinv.size(); ++j) {
        pinv.data()[j] = std::sqrt(pinv.data()[j] / bias_correction2) + hp.epsilon;
    }
    return pinv;
}
