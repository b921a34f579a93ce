#pragma once
#include "../backward_engine.hpp"
#include "process_group.hpp"
#include <vector>

/**
 * @brief Averages gradients over a process group after each backward pass.
 *
 * The first gradient of a pass queues one synchronization callback on the
 * backward engine; the callback all-reduces the gradient of every tracked
 * parameter and divides it by the world size. Parameters without a gradient
 * take part with zeros so that every rank issues the same collectives.
 *
 * During gradient accumulation the synchronization can be switched off with
 * set_require_sync(false) for all but the last pass of a window.
 */
class DataParallelSync {
  public:
    DataParallelSync(BackwardEngine& engine, ProcessGroup& group, std::vector<Parameter*> params);
    ~DataParallelSync();

    DataParallelSync(const DataParallelSync&) = delete;
    DataParallelSync& operator=(const DataParallelSync&) = delete;

    void set_require_sync(bool require_sync) {
        require_sync_ = require_sync;
    }
    bool require_sync() const {
        return require_sync_;
    }

    size_t num_syncs() const {
        return num_syncs_;
    }

  private:
    BackwardEngine& engine_;
    ProcessGroup& group_;
    std::vector<Parameter*> params_;
    std::vector<BackwardEngine::HookHandle> hooks_;
    bool require_sync_ = true;
    bool sync_queued_ = false;
    size_t num_syncs_ = 0;

    void on_gradient();
    void synchronize();
};
