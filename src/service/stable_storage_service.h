/**
 * @file stable_storage_service.h
 * @brief Host-side stable storage: snapshot save/restore and the remote operations
 *
 * The service owns the current (Header, Transient) pair for a StableMemory
 * region. The host process calls Save()/Restore() around its own lifecycle;
 * operators reach the region remotely through the query/update methods,
 * which the backup/restore tooling drives chunk by chunk.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "service/call_codec.h"
#include "service/service_types.h"
#include "storage/data_format.h"
#include "storage/header.h"
#include "storage/layout.h"
#include "storage/stable_memory.h"
#include "storage/transient.h"
#include "system/system_interface.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/structured_log.h"

namespace stashd::service {

class StableStorageService {
 public:
  StableStorageService(storage::StableMemory& memory, const system::SystemInterface& system, std::string version);

  // Remote operations ---------------------------------------------------------

  std::pair<storage::Header, storage::Transient> StableStorageInfo() const;

  /**
   * @brief Read [offset, offset + limit); bytes beyond the region read as zero
   *
   * kOutOfRange when @p limit exceeds kMaxChunkBytes or @p offset lies past
   * the largest possible region.
   */
  utils::Expected<Bytes, utils::Error> BackupStableStorage(uint64_t offset, uint64_t limit) const;

  /**
   * @brief Grow to len / page_size + 1 pages if currently smaller
   */
  utils::Expected<void, utils::Error> InitStableStorage(uint64_t total_len);

  utils::Expected<void, utils::Error> RestoreStableStorage(uint64_t offset, const Bytes& bytes);

  /**
   * @brief Gunzip each element and write them back to back starting at @p offset
   *
   * An element may expand to at most kMaxChunkBytes, and never past the
   * largest possible region.
   */
  utils::Expected<void, utils::Error> RestoreStableStorageCompressed(uint64_t offset,
                                                                     const std::vector<Bytes>& compressed);

  void SetRestoreFromStableStorage(bool flag);

  ServiceStats Stats() const;

  /**
   * @brief Host property as text: "version", "page_count" or "page_size"
   */
  utils::Expected<Bytes, utils::Error> ReadState(const std::string& prop) const;

  // Method dispatch over encoded arguments ------------------------------------

  utils::Expected<Bytes, utils::Error> HandleQuery(const std::string& method, const Bytes& args) const;
  utils::Expected<Bytes, utils::Error> HandleUpdate(const std::string& method, const Bytes& args);

  static bool IsQueryMethod(const std::string& method);
  static bool IsUpdateMethod(const std::string& method);

  // Host-facing snapshot operations -------------------------------------------

  /**
   * @brief Save @p value into the region with the V2 layout
   *
   * Honours skip_next_save: after a remote restore the region already holds
   * the snapshot to boot from and must not be overwritten.
   */
  template <typename T>
  utils::Expected<storage::Header, utils::Error> Save(const T& value, storage::DataFormatType format,
                                                      uint64_t schema_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage::Header header = header_;
    header.content_format = format;
    header.content_schema_version = schema_version;

    storage::StableMemoryStream stream(memory_);
    auto saved = storage::layout_v2::Save(system_, stream, value, header, transient_);
    if (!saved) {
      return saved;
    }
    if (!transient_.skip_next_save) {
      header_ = *saved;
    }
    return saved;
  }

  /**
   * @brief Save with the legacy layout (no header)
   */
  template <typename T>
  utils::Expected<void, utils::Error> SaveV1(const T& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage::StableMemoryStream stream(memory_);
    return storage::layout_v1::Save(system_, stream, value);
  }

  template <typename T>
  utils::Expected<T, utils::Error> Restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    storage::StableMemoryStream stream(memory_);
    return Adopt(storage::layout_v2::Restore<T>(system_, stream));
  }

  template <typename T>
  utils::Expected<T, utils::Error> RestoreV1V2() {
    std::lock_guard<std::mutex> lock(mutex_);
    storage::StableMemoryStream stream(memory_);
    return Adopt(storage::RestoreV1V2<T>(system_, stream));
  }

  /**
   * @brief Adopt the header already present at the start of the region
   *
   * Used at daemon start, where the content type is not known but backups
   * still need the header to size the transfer.
   */
  utils::Expected<storage::Header, utils::Error> LoadHeaderFromRegion();

  storage::StableMemory& Memory() { return memory_; }

 private:
  template <typename T>
  utils::Expected<T, utils::Error> Adopt(utils::Expected<storage::Restored<T>, utils::Error> restored) {
    if (!restored) {
      return utils::MakeUnexpected(restored.error());
    }
    header_ = restored->header;
    transient_ = restored->transient;
    last_upgraded_ = system_.Now();
    utils::LogStorageInfo("restore", std::string("Restored using layout ") +
                                         storage::LayoutVersionToString(restored->layout));
    return std::move(restored->value);
  }

  storage::StableMemory& memory_;
  const system::SystemInterface& system_;
  std::string version_;

  mutable std::mutex mutex_;
  storage::Header header_;
  storage::Transient transient_;
  uint64_t last_upgraded_ = 0;
};

}  // namespace stashd::service
