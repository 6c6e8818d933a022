/**
 * @file chunk_dispatcher.cpp
 * @brief Chunk dispatcher implementation
 */

#include "transfer/chunk_dispatcher.h"

#include <spdlog/spdlog.h>

#include "utils/structured_log.h"

namespace stashd::transfer {

ChunkDispatcher::ChunkDispatcher(size_t max_in_flight) : max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight) {
  spdlog::debug("Creating chunk dispatcher with {} workers", max_in_flight_);

  workers_.reserve(max_in_flight_);
  for (size_t i = 0; i < max_in_flight_; ++i) {
    workers_.emplace_back(&ChunkDispatcher::WorkerThread, this);
  }
}

ChunkDispatcher::~ChunkDispatcher() {
  Shutdown();
}

bool ChunkDispatcher::Submit(uint64_t offset, Task task) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait(lock, [this] { return shutdown_ || cancelled_ || pending_ < max_in_flight_; });
    if (shutdown_ || cancelled_) {
      return false;
    }
    jobs_.push(Job{offset, std::move(task)});
    ++pending_;
  }
  job_cv_.notify_one();
  return true;
}

std::optional<ChunkDispatcher::Completion> ChunkDispatcher::TryNext() {
  std::scoped_lock lock(mutex_);
  if (completed_.empty()) {
    return std::nullopt;
  }
  Completion completion = std::move(completed_.front());
  completed_.pop_front();
  return completion;
}

std::optional<ChunkDispatcher::Completion> ChunkDispatcher::WaitNext() {
  std::unique_lock<std::mutex> lock(mutex_);
  state_cv_.wait(lock, [this] { return !completed_.empty() || pending_ == 0; });
  if (completed_.empty()) {
    return std::nullopt;
  }
  Completion completion = std::move(completed_.front());
  completed_.pop_front();
  return completion;
}

void ChunkDispatcher::Cancel() {
  size_t dropped = 0;
  {
    std::scoped_lock lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    dropped = jobs_.size();
    while (!jobs_.empty()) {
      jobs_.pop();
    }
    pending_ -= dropped;
  }
  state_cv_.notify_all();

  utils::StructuredLog()
      .Event("transfer_warning")
      .Field("operation", "chunk_dispatcher_cancel")
      .Field("dropped_tasks", static_cast<uint64_t>(dropped))
      .Warn();
}

size_t ChunkDispatcher::GetPendingCount() const {
  std::scoped_lock lock(mutex_);
  return pending_;
}

void ChunkDispatcher::Shutdown() {
  {
    std::scoped_lock lock(mutex_);
    if (shutdown_) {
      return;
    }
    shutdown_ = true;
  }
  job_cv_.notify_all();
  state_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  spdlog::debug("Chunk dispatcher shut down");
}

void ChunkDispatcher::WorkerThread() {
  while (true) {
    Job job;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      job_cv_.wait(lock, [this] { return shutdown_ || !jobs_.empty(); });

      // Queued jobs still run on shutdown so pending_ reaches zero
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop();
    }

    Completion completion{job.offset, utils::Expected<Bytes, utils::Error>()};
    try {
      completion.result = job.task();
    } catch (const std::exception& e) {
      utils::StructuredLog()
          .Event("transfer_error")
          .Field("type", "chunk_task_exception")
          .Field("offset", job.offset)
          .Field("error", e.what())
          .Error();
      completion.result = utils::MakeUnexpected(utils::MakeError(
          utils::ErrorCode::kInternalError, std::string("Chunk task threw: ") + e.what(),
          "offset " + std::to_string(job.offset)));
    }

    {
      std::scoped_lock lock(mutex_);
      completed_.push_back(std::move(completion));
      --pending_;
    }
    state_cv_.notify_all();
  }
}

}  // namespace stashd::transfer
