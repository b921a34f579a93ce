#include "../../include/distributed/process_group.hpp"
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {
class InProcessWork : public Work {
  public:
    InProcessWork(std::shared_ptr<InProcessRendezvous> rendezvous, size_t sequence,
                  std::vector<double>& buffer)
        : rendezvous_(std::move(rendezvous)), sequence_(sequence), buffer_(buffer) {}

    void wait() override {
        if (!done_) {
            rendezvous_->collect(sequence_, buffer_);
            done_ = true;
        }
    }

    bool is_completed() const override {
        return done_ || rendezvous_->is_complete(sequence_);
    }

  private:
    std::shared_ptr<InProcessRendezvous> rendezvous_;
    size_t sequence_;
    std::vector<double>& buffer_;
    bool done_ = false;
};
} // namespace

std::unique_ptr<Work> LocalProcessGroup::all_reduce_sum_async(std::vector<double>& buffer) {
    (void)buffer;
    return std::make_unique<CompletedWork>();
}

void LocalProcessGroup::all_reduce_sum(Matrix& buffer) {
    (void)buffer;
}

InProcessRendezvous::InProcessRendezvous(size_t world_size)
    : world_size_(world_size), issued_(world_size, 0), departed_(world_size, false) {
    if (world_size == 0) {
        throw std::invalid_argument("A process group needs at least one rank");
    }
}

void InProcessRendezvous::abort_locked(const std::string& reason) {
    if (abort_reason_.empty()) {
        abort_reason_ = reason;
    }
    rounds_.clear();
    cv_.notify_all();
}

void InProcessRendezvous::check_departures_locked(size_t sequence) {
    for (size_t rank = 0; rank < world_size_; ++rank) {
        if (departed_[rank] && issued_[rank] <= sequence) {
            abort_locked("Collective #" + std::to_string(sequence) + " can not complete, rank " +
                         std::to_string(rank) + " left after " + std::to_string(issued_[rank]) +
                         " collectives");
            return;
        }
    }
}

size_t InProcessRendezvous::contribute(size_t rank, const std::string& op,
                                       const std::vector<double>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!abort_reason_.empty()) {
        throw std::logic_error(abort_reason_);
    }
    if (departed_[rank]) {
        abort_locked("Rank " + std::to_string(rank) + " issued a collective after leaving");
        throw std::logic_error(abort_reason_);
    }

    const size_t sequence = issued_[rank]++;
    auto inserted = rounds_.emplace(sequence, Round{});
    Round& round = inserted.first->second;
    if (inserted.second) {
        round.op = op;
        round.sum.assign(data.size(), 0.0);
    }

    if (round.op != op) {
        abort_locked("Collective #" + std::to_string(sequence) + " mismatch: " + round.op +
                     " vs " + op);
        throw std::logic_error(abort_reason_);
    }
    if (round.sum.size() != data.size()) {
        abort_locked("Collective #" + std::to_string(sequence) + " buffer length mismatch: " +
                     std::to_string(round.sum.size()) + " vs " + std::to_string(data.size()));
        throw std::logic_error(abort_reason_);
    }

    for (size_t i = 0; i < data.size(); ++i) {
        round.sum[i] += data[i];
    }
    round.contributions++;
    if (round.contributions == world_size_) {
        cv_.notify_all();
        return sequence;
    }

    check_departures_locked(sequence);
    if (!abort_reason_.empty()) {
        throw std::logic_error(abort_reason_);
    }
    return sequence;
}

void InProcessRendezvous::collect(size_t sequence, std::vector<double>& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] {
        if (!abort_reason_.empty()) {
            return true;
        }
        auto it = rounds_.find(sequence);
        return it == rounds_.end() || it->second.contributions == world_size_;
    });
    if (!abort_reason_.empty()) {
        throw std::logic_error(abort_reason_);
    }

    auto it = rounds_.find(sequence);
    if (it == rounds_.end()) {
        throw std::logic_error("Collective #" + std::to_string(sequence) + " was never issued");
    }
    Round& round = it->second;
    out = round.sum;
    round.collected++;
    if (round.collected == world_size_) {
        rounds_.erase(it);
    }
}

bool InProcessRendezvous::is_complete(size_t sequence) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(sequence);
    return it != rounds_.end() && it->second.contributions == world_size_;
}

void InProcessRendezvous::depart(size_t rank) {
    std::lock_guard<std::mutex> lock(mutex_);
    departed_[rank] = true;
    for (const auto& entry : rounds_) {
        if (entry.first >= issued_[rank]) {
            check_departures_locked(entry.first);
            return;
        }
    }
}

bool InProcessRendezvous::is_aborted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !abort_reason_.empty();
}

InProcessGroup::InProcessGroup(std::shared_ptr<InProcessRendezvous> rendezvous, size_t rank)
    : rendezvous_(std::move(rendezvous)), rank_(rank) {
    if (!rendezvous_) {
        throw std::invalid_argument("InProcessGroup needs a rendezvous");
    }
    if (rank_ >= rendezvous_->world_size()) {
        throw std::invalid_argument("Rank " + std::to_string(rank_) + " is outside a world of " +
                                    std::to_string(rendezvous_->world_size()));
    }
}

std::unique_ptr<Work> InProcessGroup::all_reduce_sum_async(std::vector<double>& buffer) {
    const size_t sequence = rendezvous_->contribute(rank_, "all_reduce_sum", buffer);
    return std::make_unique<InProcessWork>(rendezvous_, sequence, buffer);
}

void InProcessGroup::all_reduce_sum(Matrix& buffer) {
    std::vector<double> values(buffer.data(), buffer.data() + buffer.size());
    const size_t sequence = rendezvous_->contribute(rank_, "all_reduce_sum_matrix", values);
    rendezvous_->collect(sequence, values);
    for (size_t i = 0; i < values.size(); ++i) {
        buffer.data()[i] = static_cast<float>(values[i]);
    }
}

void InProcessGroup::run(size_t world_size,
                         const std::function<void(InProcessGroup& group)>& work) {
    auto rendezvous = std::make_shared<InProcessRendezvous>(world_size);
    std::vector<std::exception_ptr> errors(world_size);
    std::vector<std::thread> threads;
    threads.reserve(world_size);

    for (size_t rank = 0; rank < world_size; ++rank) {
        threads.emplace_back([&, rank]() {
            try {
                InProcessGroup group(rendezvous, rank);
                work(group);
            } catch (...) {
                errors[rank] = std::current_exception();
            }
            rendezvous->depart(rank);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}
