/**
 * @file service_types.h
 * @brief Values returned by the stable storage service
 */

#pragma once

#include <cstdint>
#include <string>

#include "config/config.h"

namespace stashd::service {

/// Upper bound on the bytes one backup or restore call may move
inline constexpr uint64_t kMaxChunkBytes = config::defaults::kMaxChunkSize;

/// Remote method names
namespace methods {
inline constexpr const char* kStableStorageInfo = "stable_storage_info";
inline constexpr const char* kBackupStableStorage = "backup_stable_storage";
inline constexpr const char* kStats = "stats";
inline constexpr const char* kInitStableStorage = "init_stable_storage";
inline constexpr const char* kRestoreStableStorage = "restore_stable_storage";
inline constexpr const char* kRestoreStableStorageCompressed = "restore_stable_storage_compressed";
inline constexpr const char* kSetRestoreFromStableStorage = "set_restore_from_stable_storage";
}  // namespace methods

/**
 * @brief Service statistics (the "stats" query)
 */
struct ServiceStats {
  uint64_t now = 0;                          ///< Wall clock, ns since epoch
  uint64_t memory_usage = 0;                 ///< Process RSS in bytes
  uint64_t stable_storage_usage_bytes = 0;   ///< Region size in bytes
  uint64_t last_upgraded = 0;                ///< Last restore (or service start), ns since epoch
  std::string version;
};

template <typename Archive>
void Serialize(Archive& ar, ServiceStats& stats) {
  ar("now", stats.now);
  ar("memory_usage", stats.memory_usage);
  ar("stable_storage_usage_bytes", stats.stable_storage_usage_bytes);
  ar("last_upgraded", stats.last_upgraded);
  ar("version", stats.version);
}

}  // namespace stashd::service
