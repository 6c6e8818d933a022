/**
 * @file stable_storage_service.cpp
 * @brief Remote stable storage operations and their dispatch
 */

#include "service/stable_storage_service.h"

#include <algorithm>
#include <tuple>

#include "utils/gzip.h"

namespace stashd::service {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Encode a unit result
 */
utils::Expected<Bytes, utils::Error> Unit(const utils::Expected<void, utils::Error>& result) {
  if (!result) {
    return MakeUnexpected(result.error());
  }
  return Bytes{};
}

}  // namespace

StableStorageService::StableStorageService(storage::StableMemory& memory, const system::SystemInterface& system,
                                           std::string version)
    : memory_(memory), system_(system), version_(std::move(version)), last_upgraded_(system.Now()) {}

std::pair<storage::Header, storage::Transient> StableStorageService::StableStorageInfo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {header_, transient_};
}

utils::Expected<Bytes, utils::Error> StableStorageService::BackupStableStorage(uint64_t offset,
                                                                              uint64_t limit) const {
  if (limit > kMaxChunkBytes) {
    return MakeUnexpected(MakeError(ErrorCode::kOutOfRange, "Backup limit " + std::to_string(limit) +
                                                                " exceeds " + std::to_string(kMaxChunkBytes) +
                                                                " bytes"));
  }
  if (offset > memory_.MaxBytes()) {
    return MakeUnexpected(MakeError(ErrorCode::kOutOfRange, "Backup offset " + std::to_string(offset) +
                                                                " is beyond the region limit of " +
                                                                std::to_string(memory_.MaxBytes()) + " bytes"));
  }
  return memory_.ReadZeroFilled(offset, limit);
}

utils::Expected<void, utils::Error> StableStorageService::InitStableStorage(uint64_t total_len) {
  uint64_t page_count = total_len / memory_.PageSize() + 1;
  uint64_t current = memory_.Size();
  if (page_count > current) {
    utils::LogStorageInfo("init_stable_storage", "Growing stable storage from " + std::to_string(current) + " to " +
                                                     std::to_string(page_count) + " pages");
    auto grown = memory_.Grow(page_count - current);
    if (!grown) {
      return MakeUnexpected(grown.error());
    }
  }
  return {};
}

utils::Expected<void, utils::Error> StableStorageService::RestoreStableStorage(uint64_t offset, const Bytes& bytes) {
  auto capacity = memory_.EnsureCapacity(offset + bytes.size());
  if (!capacity) {
    return capacity;
  }
  return memory_.Write(offset, bytes);
}

utils::Expected<void, utils::Error> StableStorageService::RestoreStableStorageCompressed(
    uint64_t offset, const std::vector<Bytes>& compressed) {
  for (const auto& element : compressed) {
    if (offset > memory_.MaxBytes()) {
      return MakeUnexpected(MakeError(ErrorCode::kOutOfRange, "Restore offset " + std::to_string(offset) +
                                                                  " is beyond the region limit of " +
                                                                  std::to_string(memory_.MaxBytes()) + " bytes"));
    }
    uint64_t room = std::min<uint64_t>(kMaxChunkBytes, memory_.MaxBytes() - offset);
    auto decoded = utils::GzipDecompress(element, static_cast<size_t>(room));
    if (!decoded) {
      return MakeUnexpected(utils::WithContext(decoded.error(), "offset " + std::to_string(offset)));
    }
    auto written = RestoreStableStorage(offset, *decoded);
    if (!written) {
      return written;
    }
    offset += decoded->size();
  }
  return {};
}

void StableStorageService::SetRestoreFromStableStorage(bool flag) {
  std::lock_guard<std::mutex> lock(mutex_);
  transient_.skip_next_save = flag;
  utils::LogStorageInfo("set_restore_from_stable_storage", flag ? "true" : "false");
}

ServiceStats StableStorageService::Stats() const {
  ServiceStats stats;
  stats.now = system_.Now();
  stats.memory_usage = system_.MemoryUsage();
  stats.stable_storage_usage_bytes = memory_.SizeBytes();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats.last_upgraded = last_upgraded_;
  }
  stats.version = version_;
  return stats;
}

utils::Expected<Bytes, utils::Error> StableStorageService::ReadState(const std::string& prop) const {
  std::string value;
  if (prop == "version") {
    value = version_;
  } else if (prop == "page_count") {
    value = std::to_string(memory_.Size());
  } else if (prop == "page_size") {
    value = std::to_string(memory_.PageSize());
  } else {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Unknown state property " + prop));
  }
  return Bytes(value.begin(), value.end());
}

utils::Expected<storage::Header, utils::Error> StableStorageService::LoadHeaderFromRegion() {
  std::lock_guard<std::mutex> lock(mutex_);
  storage::StableMemoryStream stream(memory_);
  auto header = storage::Header::FromReader(stream);
  if (!header) {
    return header;
  }
  header_ = *header;
  return header;
}

bool StableStorageService::IsQueryMethod(const std::string& method) {
  return method == methods::kStableStorageInfo || method == methods::kBackupStableStorage ||
         method == methods::kStats;
}

bool StableStorageService::IsUpdateMethod(const std::string& method) {
  return method == methods::kInitStableStorage || method == methods::kRestoreStableStorage ||
         method == methods::kRestoreStableStorageCompressed || method == methods::kSetRestoreFromStableStorage;
}

utils::Expected<Bytes, utils::Error> StableStorageService::HandleQuery(const std::string& method,
                                                                       const Bytes& args) const {
  if (method == methods::kStableStorageInfo) {
    auto decoded = DecodeArgs<>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    auto [header, transient] = StableStorageInfo();
    return EncodeArgs(header, transient);
  }

  if (method == methods::kBackupStableStorage) {
    auto decoded = DecodeArgs<uint64_t, uint64_t>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    auto [offset, limit] = *decoded;
    auto bytes = BackupStableStorage(offset, limit);
    if (!bytes) {
      return MakeUnexpected(bytes.error());
    }
    return EncodeArgs(*bytes);
  }

  if (method == methods::kStats) {
    auto decoded = DecodeArgs<>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    return EncodeArgs(Stats());
  }

  return MakeUnexpected(MakeError(ErrorCode::kRemoteMethodNotFound, "No query method named " + method));
}

utils::Expected<Bytes, utils::Error> StableStorageService::HandleUpdate(const std::string& method, const Bytes& args) {
  if (method == methods::kInitStableStorage) {
    auto decoded = DecodeArgs<uint64_t>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    return Unit(InitStableStorage(std::get<0>(*decoded)));
  }

  if (method == methods::kRestoreStableStorage) {
    auto decoded = DecodeArgs<uint64_t, Bytes>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    return Unit(RestoreStableStorage(std::get<0>(*decoded), std::get<1>(*decoded)));
  }

  if (method == methods::kRestoreStableStorageCompressed) {
    auto decoded = DecodeArgs<uint64_t, std::vector<Bytes>>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    return Unit(RestoreStableStorageCompressed(std::get<0>(*decoded), std::get<1>(*decoded)));
  }

  if (method == methods::kSetRestoreFromStableStorage) {
    auto decoded = DecodeArgs<bool>(args);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    SetRestoreFromStableStorage(std::get<0>(*decoded));
    return Bytes{};
  }

  return MakeUnexpected(MakeError(ErrorCode::kRemoteMethodNotFound, "No update method named " + method));
}

}  // namespace stashd::service
