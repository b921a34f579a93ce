#include "../../include/distributed/reducer.hpp"

std::unique_ptr<Work> DistributedReducer::reduce_sum_async(std::vector<double>& buffer) {
    if (group_ == nullptr || group_->world_size() == 1) {
        return std::make_unique<CompletedWork>();
    }
    return group_->all_reduce_sum_async(buffer);
}
