/**
 * @file stable_storage_transfer.h
 * @brief Chunked backup and restore of a remote stable storage region
 *
 * Backup downloads [0, header + content) in fixed windows, restore uploads a
 * backup file window by window. Windows run concurrently on a ChunkDispatcher
 * (at most max_in_flight at a time); every window carries its absolute
 * offset, so completion order never matters.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <utility>

#include "agent/canister_agent.h"
#include "config/config.h"
#include "storage/header.h"
#include "storage/transient.h"
#include "transfer/chunk_dispatcher.h"
#include "transfer/chunk_sink.h"
#include "transfer/retry_policy.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/gzip.h"

namespace stashd::transfer {

class StableStorageTransfer {
 public:
  StableStorageTransfer(agent::CanisterAgent agent, const config::TransferConfig& config,
                        RetryPolicy::Sleeper sleeper = nullptr);

  StableStorageTransfer(const StableStorageTransfer&) = delete;
  StableStorageTransfer& operator=(const StableStorageTransfer&) = delete;

  /**
   * @brief Remote (Header, Transient)
   */
  utils::Expected<std::pair<storage::Header, storage::Transient>, utils::Error> GetStableStorageInfo() const;

  /**
   * @brief Download the region into @p sink
   *
   * @return Number of bytes received (header + content)
   *
   * Fails with kStableStorageNotInitialized when the remote format is
   * Unknown and with kBackupLengthMismatch when the byte total differs from
   * the size announced by the header.
   */
  utils::Expected<uint64_t, utils::Error> Backup(ChunkSink& sink);

  /**
   * @brief Upload a backup read from @p in
   *
   * @param restore_offset Resume point. Content bytes of @p in before it are
   *        skipped. Defaults to the end of the header.
   *
   * Marks the remote to boot from stable storage once every window landed.
   */
  utils::Expected<void, utils::Error> Restore(std::istream& in, std::optional<uint64_t> restore_offset = std::nullopt);

  /**
   * @brief Restore() with every window gzip-compressed before upload
   */
  utils::Expected<void, utils::Error> RestoreCompressed(std::istream& in, int level = utils::kDefaultGzipLevel);

  /**
   * @brief "<prefix>_<version>_<YYYY-mm-dd_HH-MM-SS>" from the remote stats
   */
  utils::Expected<std::string, utils::Error> GetDefaultBackupFileName(const std::string& prefix) const;

  /**
   * @brief Stop the running transfer; it fails with kTransferCancelled
   */
  void Cancel() { cancelled_ = true; }

 private:
  using CancelCheck = std::function<bool()>;

  /// One window: its offset and the (retrying) call that moves it
  struct Window {
    uint64_t offset = 0;
    std::function<utils::Expected<Bytes, utils::Error>(const CancelCheck&)> run;
  };

  /// Next window, nullopt when done, or a fatal error
  using WindowSource = std::function<utils::Expected<std::optional<Window>, utils::Error>()>;
  using ResultHandler = std::function<utils::Expected<void, utils::Error>(uint64_t, const Bytes&)>;

  /**
   * @brief Dispatch windows and hand completions to @p on_result on this thread
   * @return Completed window count
   */
  utils::Expected<uint64_t, utils::Error> Drive(const char* direction, uint64_t total, const WindowSource& next,
                                                const ResultHandler& on_result);

  utils::Expected<Bytes, utils::Error> FetchWindow(uint64_t offset, uint64_t len, uint64_t total) const;

  utils::Expected<void, utils::Error> RestoreImpl(std::istream& in, std::optional<uint64_t> restore_offset,
                                                  std::optional<int> compression_level);

  agent::CanisterAgent agent_;
  config::TransferConfig config_;
  mutable RetryPolicy retry_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace stashd::transfer
