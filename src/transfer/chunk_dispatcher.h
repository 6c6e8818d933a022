/**
 * @file chunk_dispatcher.h
 * @brief Bounded worker pool for chunk calls with a producer-drained completion queue
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::transfer {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Runs chunk tasks on a fixed set of workers
 *
 * Features:
 * - max_in_flight worker threads
 * - Submit() blocks while max_in_flight tasks are queued or running
 * - Results come back through a completion queue drained by the producer
 *   thread only, in completion order
 * - Cancel() drops queued tasks and rejects new ones
 */
class ChunkDispatcher {
 public:
  using Task = std::function<utils::Expected<Bytes, utils::Error>()>;

  struct Completion {
    uint64_t offset = 0;
    utils::Expected<Bytes, utils::Error> result;
  };

  explicit ChunkDispatcher(size_t max_in_flight);

  /**
   * @brief Destructor - waits for running tasks
   */
  ~ChunkDispatcher();

  ChunkDispatcher(const ChunkDispatcher&) = delete;
  ChunkDispatcher& operator=(const ChunkDispatcher&) = delete;
  ChunkDispatcher(ChunkDispatcher&&) = delete;
  ChunkDispatcher& operator=(ChunkDispatcher&&) = delete;

  /**
   * @brief Queue @p task for the chunk at @p offset
   * @return false if the dispatcher was cancelled or shut down
   */
  bool Submit(uint64_t offset, Task task);

  /**
   * @brief Pop a completion if one is ready
   */
  std::optional<Completion> TryNext();

  /**
   * @brief Wait for the next completion
   * @return nullopt once nothing is queued, running or uncollected
   */
  std::optional<Completion> WaitNext();

  /**
   * @brief Drop queued tasks and reject further submissions
   *
   * Running tasks finish; their completions can still be collected.
   */
  void Cancel();

  bool IsCancelled() const { return cancelled_; }

  size_t GetThreadCount() const { return workers_.size(); }

  /**
   * @brief Tasks queued or running
   */
  size_t GetPendingCount() const;

  void Shutdown();

 private:
  struct Job {
    uint64_t offset;
    Task task;
  };

  void WorkerThread();

  std::vector<std::thread> workers_;
  std::queue<Job> jobs_;
  std::deque<Completion> completed_;

  mutable std::mutex mutex_;
  std::condition_variable job_cv_;    ///< Workers wait for jobs
  std::condition_variable state_cv_;  ///< Producer waits for capacity or completions
  size_t pending_ = 0;                ///< Queued + running
  size_t max_in_flight_;
  bool shutdown_ = false;
  std::atomic<bool> cancelled_{false};
};

}  // namespace stashd::transfer
