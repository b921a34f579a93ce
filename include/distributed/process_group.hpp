#pragma once
#include "../matrix.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Handle of an issued collective operation.
 */
class Work {
  public:
    virtual ~Work() = default;

    /**
     * @brief Blocks until the result is in the caller's buffer.
     */
    virtual void wait() = 0;
    virtual bool is_completed() const = 0;
};

/**
 * @brief Work that finished when it was issued.
 */
class CompletedWork : public Work {
  public:
    void wait() override {}
    bool is_completed() const override {
        return true;
    }
};

/**
 * @brief Collective communication between the workers of one training run.
 *
 * Every worker must issue the same collectives in the same order with
 * buffers of the same length. Backends report a collective that can not
 * complete as std::logic_error where they are able to detect it.
 */
class ProcessGroup {
  public:
    virtual ~ProcessGroup() = default;

    virtual size_t world_size() const = 0;
    virtual size_t rank() const = 0;

    /**
     * @brief Starts an element-wise sum over all workers.
     *
     * The buffer must stay alive and untouched until the returned work has
     * been waited on; it then holds the sum.
     */
    virtual std::unique_ptr<Work> all_reduce_sum_async(std::vector<double>& buffer) = 0;

    /**
     * @brief Element-wise sum of a matrix over all workers, blocking.
     */
    virtual void all_reduce_sum(Matrix& buffer) = 0;
};

/**
 * @brief Process group of a single worker.
 */
class LocalProcessGroup : public ProcessGroup {
  public:
    size_t world_size() const override {
        return 1;
    }
    size_t rank() const override {
        return 0;
    }
    std::unique_ptr<Work> all_reduce_sum_async(std::vector<double>& buffer) override;
    void all_reduce_sum(Matrix& buffer) override;
};

/**
 * @brief Meeting point of the threads of an InProcessGroup.
 *
 * The n-th collective of every rank belongs to round n. A round completes
 * once all ranks contributed and is dropped once all ranks collected the
 * result.
 *
 * A failed round aborts the whole rendezvous: every pending and every later
 * collective of every rank throws the same std::logic_error. A round fails
 * when contributions disagree on the operation or the buffer length, or when
 * it needs a rank that already departed.
 */
class InProcessRendezvous {
  public:
    explicit InProcessRendezvous(size_t world_size);

    size_t world_size() const {
        return world_size_;
    }

    /**
     * @brief Adds a rank's buffer to its next round.
     *
     * @return Sequence number of the round
     * @throws std::logic_error if the round disagrees with the contribution
     *         or the rendezvous was aborted
     */
    size_t contribute(size_t rank, const std::string& op, const std::vector<double>& data);

    /**
     * @brief Blocks until a round is complete and copies the sum out.
     * @throws std::logic_error if the rendezvous was aborted
     */
    void collect(size_t sequence, std::vector<double>& out);

    bool is_complete(size_t sequence) const;

    /**
     * @brief Marks a rank as gone; it issues no further collectives.
     *
     * Rounds the rank never contributed to can not complete any more and
     * abort the rendezvous.
     */
    void depart(size_t rank);

    bool is_aborted() const;

  private:
    struct Round {
        std::string op;
        std::vector<double> sum;
        size_t contributions = 0;
        size_t collected = 0;
    };

    size_t world_size_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<size_t, Round> rounds_;
    std::vector<size_t> issued_;
    std::vector<bool> departed_;
    std::string abort_reason_;

    void abort_locked(const std::string& reason);
    void check_departures_locked(size_t sequence);
};

/**
 * @brief One rank of a group of threads in the same process.
 */
class InProcessGroup : public ProcessGroup {
  public:
    InProcessGroup(std::shared_ptr<InProcessRendezvous> rendezvous, size_t rank);

    size_t world_size() const override {
        return rendezvous_->world_size();
    }
    size_t rank() const override {
        return rank_;
    }
    std::unique_ptr<Work> all_reduce_sum_async(std::vector<double>& buffer) override;
    void all_reduce_sum(Matrix& buffer) override;

    /**
     * @brief Runs `work` on `world_size` threads, one rank each, and joins them.
     *
     * A rank departs from the rendezvous when its work returns or throws, so
     * the remaining ranks fail instead of waiting for it.
     *
     * @throws The first exception raised by any rank, after all threads joined
     */
    static void run(size_t world_size, const std::function<void(InProcessGroup& group)>& work);

  private:
    std::shared_ptr<InProcessRendezvous> rendezvous_;
    size_t rank_;
};
