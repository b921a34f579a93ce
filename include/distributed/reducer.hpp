#pragma once
#include "process_group.hpp"
#include <cstddef>
#include <memory>
#include <vector>

/**
 * @brief Sums the local squared-norm vector over all workers.
 *
 * Without a process group, or with a group of one, the reduction completes
 * immediately and leaves the buffer unchanged.
 */
class DistributedReducer {
  public:
    explicit DistributedReducer(ProcessGroup* group = nullptr) : group_(group) {}

    /**
     * @brief Issues the reduction without blocking.
     *
     * The buffer receives the sum once the returned work has been waited on.
     */
    std::unique_ptr<Work> reduce_sum_async(std::vector<double>& buffer);

    size_t world_size() const {
        return group_ ? group_->world_size() : 1;
    }
    size_t rank() const {
        return group_ ? group_->rank() : 0;
    }

  private:
    ProcessGroup* group_;
};
