#include "../../include/optimizer/sgd.hpp"
#include <omp.h>

void SGD::step() {
    for (auto& group : groups_) {
        const Hyperparameters& hp = group.hyper;
        for (auto* param : group.params) {
            if (!param->has_grad) {
                continue;
            }
            Matrix& value = param->value;
            const Matrix& grad = param->grad;
            const long n = static_cast<long>(value.size());

            if (hp.momentum == 0.0f) {
#pragma omp parallel for
                for (long j = 0; j < n; ++j) {
                    float g = grad.data()[j] + hp.weight_decay * value.data()[j];
                    value.data()[j] -= hp.learning_rate * g;
                }
                continue;
            }

            ParamState& st = state(param);
            bool first = st.exp_avg.empty();
            if (first) {
                st.exp_avg = Matrix(value.rows(), value.cols(), 0.0f);
            }
            float* buf = st.exp_avg.data();
#pragma omp parallel for
            for (long j = 0; j < n; ++j) {
                float g = grad.data()[j] + hp.weight_decay * value.data()[j];
                buf[j] = first ? g : hp.momentum * buf[j] + g;
                value.data()[j] -= hp.learning_rate * buf[j];
            }
        }
        group.hyper.step++;
    }
}
