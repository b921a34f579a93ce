#include "../../include/distributed/data_parallel.hpp"
#include <utility>

DataParallelSync::DataParallelSync(BackwardEngine& engine, ProcessGroup& group,
                                   std::vector<Parameter*> params)
    : engine_(engine), group_(group), params_(std::move(params)) {
    for (auto* param : params_) {
        hooks_.push_back(engine_.register_hook(param, [this](const Matrix&) { on_gradient(); }));
    }
}

DataParallelSync::~DataParallelSync() {
    for (auto handle : hooks_) {
        engine_.remove_hook(handle);
    }
}

void DataParallelSync::on_gradient() {
    if (!require_sync_ || sync_queued_) {
        return;
    }
    sync_queued_ = true;
    engine_.queue_callback([this]() { synchronize(); });
}

void DataParallelSync::synchronize() {
    sync_queued_ = false;
    const float world_size = static_cast<float>(group_.world_size());
    for (auto* param : params_) {
        if (!param->has_grad) {
            param->grad = Matrix(param->value.rows(), param->value.cols(), 0.0f);
            param->has_grad = true;
        }
        group_.all_reduce_sum(param->grad);
        param->grad /= world_size;
    }
    num_syncs_++;
}
